#include "capture/ICaptureEngine.h"
#include "capture/QtCaptureEngine.h"

#include <QDebug>

ICaptureEngine *ICaptureEngine::createBestEngine(QObject *parent)
{
    qDebug() << "ICaptureEngine: Using Qt capture engine";
    return new QtCaptureEngine(parent);
}

bool ICaptureEngine::validateRegion(const QRect &region) const
{
    if (region.width() <= 0 || region.height() <= 0) {
        return false;
    }

    const QList<MonitorInfo> all = monitors();
    for (const MonitorInfo &info : all) {
        if (info.geometry.contains(region)) {
            return true;
        }
    }
    return false;
}

std::optional<MonitorInfo> ICaptureEngine::monitor(int number) const
{
    const QList<MonitorInfo> all = monitors();
    for (const MonitorInfo &info : all) {
        if (info.number == number) {
            return info;
        }
    }
    return std::nullopt;
}

std::optional<MonitorInfo> ICaptureEngine::primaryMonitor() const
{
    const QList<MonitorInfo> all = monitors();
    for (const MonitorInfo &info : all) {
        if (info.primary) {
            return info;
        }
    }
    if (!all.isEmpty()) {
        return all.first();
    }
    return std::nullopt;
}

std::optional<MonitorInfo> ICaptureEngine::resolveMonitor(int number)
{
    if (auto info = monitor(number)) {
        return info;
    }

    auto primary = primaryMonitor();
    if (!primary) {
        emit error(QStringLiteral("No monitors available"));
        return std::nullopt;
    }

    const QString message = QString("Monitor %1 not found, using primary monitor %2")
                                .arg(number)
                                .arg(primary->number);
    qWarning() << "ICaptureEngine:" << message;
    emit warning(message);
    return primary;
}
