#ifndef SCREENSHOTMANAGER_H
#define SCREENSHOTMANAGER_H

#include <QDateTime>
#include <QImage>
#include <QList>
#include <QObject>
#include <QRect>
#include <QString>
#include <optional>

#include "capture/ICaptureEngine.h"
#include "utils/FileUtils.h"
#include "utils/ImageSaveUtils.h"

/**
 * @brief Capture, save and clipboard operations for screenshots.
 *
 * Wraps a capture engine, the screenshot settings and the file helpers.
 * Empty arguments to saveScreenshot() fall back to the stored settings.
 */
class ScreenshotManager : public QObject
{
    Q_OBJECT

public:
    // engine: null creates the best engine for the platform (owned)
    explicit ScreenshotManager(ICaptureEngine* engine = nullptr, QObject* parent = nullptr);
    ~ScreenshotManager() override;

    ICaptureEngine* engine() const { return m_engine; }

    QImage captureFullScreen(int monitorNumber = 1);
    QImage captureRegion(int x, int y, int width, int height);
    QImage captureRegion(const QRect& region);

    /**
     * @brief Write an image to disk without overwriting anything
     * @param directory Target folder; empty uses the configured screenshot directory
     * @param filename Desired name; empty generates {prefix}_{timestamp}.{ext}
     * @param format png, jpg or bmp; empty uses the configured format
     * @param quality 1-100 for jpg; -1 uses the configured quality
     * @return Path of the written file, empty on failure
     */
    QString saveScreenshot(const QImage& image,
                           const QString& directory = QString(),
                           const QString& filename = QString(),
                           const QString& format = QString(),
                           int quality = -1,
                           ImageSaveUtils::Error* error = nullptr);

    QString generateFilename(const QString& extension = QStringLiteral("png")) const;
    QString generateFilename(const QString& extension, const QDateTime& timestamp) const;

    bool copyToClipboard(const QImage& image);

    std::optional<FileMetadata> screenshotMetadata(const QString& filePath, QString* error = nullptr) const;

    QList<MonitorInfo> monitors() const;
    bool validateRegion(int x, int y, int width, int height) const;
    bool validateRegion(const QRect& region) const;

signals:
    void screenshotSaved(const QString& filePath);

private:
    ICaptureEngine* m_engine;
};

#endif // SCREENSHOTMANAGER_H
