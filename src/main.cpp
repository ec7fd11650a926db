#include <QApplication>
#include "MainApplication.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Critical: Don't quit when last window closes (we're a tray app)
    app.setQuitOnLastWindowClosed(false);

    app.setApplicationName(SIDECAPTURE_APP_NAME);
    app.setOrganizationName("SideCapture");
    app.setApplicationVersion(SIDECAPTURE_VERSION);

    MainApplication mainApp;
    mainApp.initialize();

    return app.exec();
}
