#include "ScreenshotManager.h"
#include "settings/ScreenshotSettingsManager.h"

#include <QClipboard>
#include <QDebug>
#include <QGuiApplication>

ScreenshotManager::ScreenshotManager(ICaptureEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{
    if (!m_engine) {
        m_engine = ICaptureEngine::createBestEngine(this);
    }
    qDebug() << "ScreenshotManager: Using engine" << m_engine->engineName();
}

ScreenshotManager::~ScreenshotManager() = default;

QImage ScreenshotManager::captureFullScreen(int monitorNumber)
{
    QImage image = m_engine->captureMonitor(monitorNumber);
    if (image.isNull()) {
        qWarning() << "ScreenshotManager: Full screen capture failed for monitor" << monitorNumber;
    }
    return image;
}

QImage ScreenshotManager::captureRegion(int x, int y, int width, int height)
{
    return captureRegion(QRect(x, y, width, height));
}

QImage ScreenshotManager::captureRegion(const QRect& region)
{
    if (region.width() <= 0 || region.height() <= 0) {
        qWarning() << "ScreenshotManager: Rejected region with non-positive size" << region;
        return QImage();
    }

    QImage image = m_engine->captureRegion(region);
    if (image.isNull()) {
        qWarning() << "ScreenshotManager: Region capture failed" << region;
    }
    return image;
}

QString ScreenshotManager::generateFilename(const QString& extension) const
{
    return generateFilename(extension, QDateTime::currentDateTime());
}

QString ScreenshotManager::generateFilename(const QString& extension, const QDateTime& timestamp) const
{
    QString ext = extension.trimmed();
    if (ext.startsWith('.')) {
        ext.remove(0, 1);
    }

    const QString prefix = ScreenshotSettingsManager::instance().loadPrefix();
    const QString stamp = timestamp.toString(QStringLiteral("yyyyMMdd_HHmmss"));
    return QStringLiteral("%1_%2.%3").arg(prefix, stamp, ext);
}

QString ScreenshotManager::saveScreenshot(const QImage& image,
                                          const QString& directory,
                                          const QString& filename,
                                          const QString& format,
                                          int quality,
                                          ImageSaveUtils::Error* error)
{
    auto fail = [error](const QString& stage, const QString& message) {
        qWarning() << "ScreenshotManager: Save failed at" << stage << "-" << message;
        if (error) {
            error->stage = stage;
            error->message = message;
        }
        return QString();
    };

    if (image.isNull()) {
        return fail(QStringLiteral("input"), QStringLiteral("Image is null"));
    }

    const auto& settings = ScreenshotSettingsManager::instance();

    QString fmt = format.isEmpty() ? settings.loadFormat() : format.trimmed().toLower();
    if (fmt.startsWith('.')) {
        fmt.remove(0, 1);
    }
    if (fmt == QLatin1String("jpeg")) {
        fmt = QStringLiteral("jpg");
    }
    if (!ScreenshotSettingsManager::supportedFormats().contains(fmt)) {
        return fail(QStringLiteral("format"), QStringLiteral("Unsupported format: %1").arg(format));
    }

    const int q = quality < 0 ? settings.loadQuality()
                              : ScreenshotSettingsManager::clampQuality(quality);

    const QString dir = directory.isEmpty() ? settings.screenshotDirectory() : directory;
    QString dirError;
    if (!FileUtils::ensureDirectoryExists(dir, &dirError)) {
        return fail(QStringLiteral("directory"), dirError);
    }

    const QString name = FileUtils::sanitizeFilename(filename.isEmpty() ? generateFilename(fmt) : filename);

    QString pathError;
    const QString path = FileUtils::uniqueFilePath(dir, name, 9999, &pathError);
    if (path.isEmpty()) {
        return fail(QStringLiteral("path"), pathError);
    }

    ImageSaveUtils::Error saveError;
    if (!ImageSaveUtils::saveImageAtomically(image, path, fmt.toLatin1(), q, &saveError)) {
        return fail(saveError.stage, saveError.message);
    }

    qDebug() << "ScreenshotManager: Screenshot saved:" << path;
    emit screenshotSaved(path);
    return path;
}

bool ScreenshotManager::copyToClipboard(const QImage& image)
{
    if (image.isNull()) {
        qWarning() << "ScreenshotManager: Nothing to copy, image is null";
        return false;
    }

    QClipboard* clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        qWarning() << "ScreenshotManager: Clipboard unavailable";
        return false;
    }

    clipboard->setImage(image);
    qDebug() << "ScreenshotManager: Screenshot copied to clipboard";
    return true;
}

std::optional<FileMetadata> ScreenshotManager::screenshotMetadata(const QString& filePath,
                                                                  QString* error) const
{
    QString metadataError;
    auto metadata = FileUtils::extractFileMetadata(filePath, &metadataError);
    if (!metadata) {
        qWarning() << "ScreenshotManager: Metadata extraction failed:" << metadataError;
        if (error) {
            *error = metadataError;
        }
    }
    return metadata;
}

QList<MonitorInfo> ScreenshotManager::monitors() const
{
    return m_engine->monitors();
}

bool ScreenshotManager::validateRegion(int x, int y, int width, int height) const
{
    return validateRegion(QRect(x, y, width, height));
}

bool ScreenshotManager::validateRegion(const QRect& region) const
{
    return m_engine->validateRegion(region);
}
