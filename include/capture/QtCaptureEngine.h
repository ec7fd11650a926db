#ifndef QTCAPTUREENGINE_H
#define QTCAPTUREENGINE_H

#include "ICaptureEngine.h"

class QScreen;

/**
 * @brief Cross-platform capture engine using Qt's screen grabbing
 *
 * Uses QScreen::grabWindow() for screen capture. Returned images carry
 * physical pixels; their devicePixelRatio matches the source screen.
 */
class QtCaptureEngine : public ICaptureEngine
{
    Q_OBJECT

public:
    explicit QtCaptureEngine(QObject *parent = nullptr);
    ~QtCaptureEngine() override;

    QList<MonitorInfo> monitors() const override;
    QImage captureRegion(const QRect &region) override;
    QImage captureMonitor(int number) override;
    QString engineName() const override { return QStringLiteral("Qt Screen Grab"); }

private:
    QScreen *screenForMonitor(const MonitorInfo &info) const;
};

#endif // QTCAPTUREENGINE_H
