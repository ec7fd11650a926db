#include "capture/QtCaptureEngine.h"

#include <QGuiApplication>
#include <QScreen>
#include <QPixmap>
#include <QDebug>

QtCaptureEngine::QtCaptureEngine(QObject *parent)
    : ICaptureEngine(parent)
{
}

QtCaptureEngine::~QtCaptureEngine() = default;

QList<MonitorInfo> QtCaptureEngine::monitors() const
{
    QList<MonitorInfo> result;
    const QList<QScreen *> screens = QGuiApplication::screens();
    QScreen *primary = QGuiApplication::primaryScreen();

    int number = 1;
    for (QScreen *screen : screens) {
        MonitorInfo info;
        info.number = number++;
        info.geometry = screen->geometry();
        info.devicePixelRatio = screen->devicePixelRatio();
        info.name = screen->name();
        info.primary = (screen == primary);
        result.append(info);
    }
    return result;
}

QScreen *QtCaptureEngine::screenForMonitor(const MonitorInfo &info) const
{
    const QList<QScreen *> screens = QGuiApplication::screens();
    const int index = info.number - 1;
    if (index < 0 || index >= screens.size()) {
        return nullptr;
    }
    return screens.at(index);
}

QImage QtCaptureEngine::captureRegion(const QRect &region)
{
    if (region.width() <= 0 || region.height() <= 0) {
        emit error(QString("Invalid capture region %1x%2").arg(region.width()).arg(region.height()));
        return QImage();
    }

    QScreen *screen = QGuiApplication::screenAt(region.center());
    if (!screen) {
        emit error("No screen contains the capture region");
        return QImage();
    }

    // grabWindow takes logical coordinates relative to the screen
    const QRect screenGeom = screen->geometry();
    const QRect local = region.intersected(screenGeom).translated(-screenGeom.topLeft());
    if (local != region.translated(-screenGeom.topLeft())) {
        qWarning() << "QtCaptureEngine: Region" << region << "clipped to screen" << screen->name();
    }

    QPixmap pixmap = screen->grabWindow(0, local.x(), local.y(), local.width(), local.height());
    if (pixmap.isNull()) {
        emit error("Failed to capture region");
        return QImage();
    }

    qDebug() << "QtCaptureEngine: Captured region" << region
             << "pixels:" << pixmap.size()
             << "devicePixelRatio:" << pixmap.devicePixelRatio();
    return pixmap.toImage();
}

QImage QtCaptureEngine::captureMonitor(int number)
{
    const auto info = resolveMonitor(number);
    if (!info) {
        return QImage();
    }

    QScreen *screen = screenForMonitor(*info);
    if (!screen) {
        emit error(QString("Monitor %1 disappeared").arg(info->number));
        return QImage();
    }

    QPixmap pixmap = screen->grabWindow(0);
    if (pixmap.isNull()) {
        emit error(QString("Failed to capture monitor %1").arg(info->number));
        return QImage();
    }

    qDebug() << "QtCaptureEngine: Captured monitor" << info->number << screen->name()
             << "pixels:" << pixmap.size();
    return pixmap.toImage();
}
