#include "MockCaptureEngine.h"

#include <utility>

MockCaptureEngine::MockCaptureEngine(QObject *parent)
    : ICaptureEngine(parent)
{
    MonitorInfo primary;
    primary.number = 1;
    primary.geometry = QRect(0, 0, 1920, 1080);
    primary.name = QStringLiteral("Mock-1");
    primary.primary = true;
    m_monitors.append(primary);

    // Default test frame (red, full primary size)
    m_nextFrame = QImage(1920, 1080, QImage::Format_ARGB32);
    m_nextFrame.fill(Qt::red);
}

void MockCaptureEngine::setMonitors(const QList<MonitorInfo> &monitors)
{
    m_monitors = monitors;
}

void MockCaptureEngine::setNextFrame(const QImage &frame)
{
    m_nextFrame = frame;
}

void MockCaptureEngine::setCaptureSucceeds(bool succeeds)
{
    m_captureSucceeds = succeeds;
}

void MockCaptureEngine::setRegionCaptureHook(std::function<void(const QRect &)> hook)
{
    m_regionHook = std::move(hook);
}

QImage MockCaptureEngine::captureRegion(const QRect &region)
{
    m_regionCalls++;
    m_lastRegion = region;
    if (m_regionHook) {
        m_regionHook(region);
    }

    if (!m_captureSucceeds) {
        emit error(QStringLiteral("Mock capture failure"));
        return QImage();
    }
    return m_nextFrame.copy(region);
}

QImage MockCaptureEngine::captureMonitor(int number)
{
    m_monitorCalls++;

    const auto info = resolveMonitor(number);
    if (!info) {
        return QImage();
    }
    m_lastMonitor = info->number;

    if (!m_captureSucceeds) {
        emit error(QStringLiteral("Mock capture failure"));
        return QImage();
    }
    return m_nextFrame.copy(QRect(QPoint(0, 0), info->geometry.size()));
}

void MockCaptureEngine::resetCounters()
{
    m_regionCalls = 0;
    m_monitorCalls = 0;
    m_lastRegion = QRect();
    m_lastMonitor = 0;
}
