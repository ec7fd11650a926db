#ifndef ICAPTUREENGINE_H
#define ICAPTUREENGINE_H

#include <QObject>
#include <QRect>
#include <QImage>
#include <QList>
#include <QString>
#include <optional>

/**
 * @brief One attached display as seen by a capture engine
 */
struct MonitorInfo
{
    int number = 0;          // 1-based, in QGuiApplication::screens() order
    QRect geometry;          // Global logical coordinates
    qreal devicePixelRatio = 1.0;
    QString name;
    bool primary = false;
};

/**
 * @brief Abstract interface for screen capture engines
 *
 * Provides a platform-agnostic interface for grabbing still images of
 * screen regions and whole monitors. The Qt engine is the only
 * implementation shipped; tests substitute a mock.
 */
class ICaptureEngine : public QObject
{
    Q_OBJECT

public:
    explicit ICaptureEngine(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~ICaptureEngine() = default;

    /**
     * @brief Enumerate the attached monitors
     */
    virtual QList<MonitorInfo> monitors() const = 0;

    /**
     * @brief Capture a screen region
     * @param region Region to capture (global logical coordinates)
     * @return Captured image, or null QImage on failure
     */
    virtual QImage captureRegion(const QRect &region) = 0;

    /**
     * @brief Capture one whole monitor
     * @param number 1-based monitor number; unknown numbers fall back to
     *        the primary monitor with a warning
     * @return Captured image, or null QImage on failure
     */
    virtual QImage captureMonitor(int number) = 0;

    /**
     * @brief Get the name of this capture engine
     */
    virtual QString engineName() const = 0;

    /**
     * @brief Check that a region has a positive size and lies fully
     *        inside a single monitor
     */
    bool validateRegion(const QRect &region) const;

    std::optional<MonitorInfo> monitor(int number) const;
    std::optional<MonitorInfo> primaryMonitor() const;

    /**
     * @brief Create the best available capture engine for the current platform
     * @param parent Parent QObject for ownership
     * @return New capture engine instance (caller takes ownership)
     */
    static ICaptureEngine *createBestEngine(QObject *parent = nullptr);

signals:
    /**
     * @brief Emitted when a capture error occurs
     * @param message Error description
     */
    void error(const QString &message);

    /**
     * @brief Emitted when a non-fatal warning occurs
     * @param message Warning description
     */
    void warning(const QString &message);

protected:
    // Monitor for a requested number, falling back to the primary one
    std::optional<MonitorInfo> resolveMonitor(int number);
};

#endif // ICAPTUREENGINE_H
