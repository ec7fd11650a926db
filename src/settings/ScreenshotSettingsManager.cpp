#include "settings/ScreenshotSettingsManager.h"
#include "settings/Settings.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

namespace {

QString canonicalFormat(const QString& format)
{
    QString fmt = format.trimmed().toLower();
    if (fmt.startsWith('.')) {
        fmt.remove(0, 1);
    }
    if (fmt == QLatin1String("jpeg")) {
        fmt = QStringLiteral("jpg");
    }
    return fmt;
}

} // namespace

ScreenshotSettingsManager& ScreenshotSettingsManager::instance()
{
    static ScreenshotSettingsManager instance;
    return instance;
}

QString ScreenshotSettingsManager::defaultBasePath()
{
    QString path = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    if (path.isEmpty()) {
        path = QDir::homePath();
    }
    return path;
}

QStringList ScreenshotSettingsManager::supportedFormats()
{
    return { QStringLiteral("png"), QStringLiteral("jpg"), QStringLiteral("bmp") };
}

QString ScreenshotSettingsManager::normalizeFormat(const QString& format)
{
    const QString fmt = canonicalFormat(format);
    return supportedFormats().contains(fmt) ? fmt : defaultFormat();
}

int ScreenshotSettingsManager::clampQuality(int quality)
{
    return qBound(kMinQuality, quality, kMaxQuality);
}

QString ScreenshotSettingsManager::loadBasePath() const
{
    auto settings = SideCapture::getSettings();
    QString path = settings.value(kSettingsKeyBasePath, defaultBasePath()).toString();
    return path.isEmpty() ? defaultBasePath() : path;
}

void ScreenshotSettingsManager::saveBasePath(const QString& path)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyBasePath, path);
}

QString ScreenshotSettingsManager::loadFolderName() const
{
    auto settings = SideCapture::getSettings();
    QString name = settings.value(kSettingsKeyFolderName, defaultFolderName()).toString().trimmed();
    return name.isEmpty() ? defaultFolderName() : name;
}

void ScreenshotSettingsManager::saveFolderName(const QString& name)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyFolderName, name.trimmed());
}

QString ScreenshotSettingsManager::loadPrefix() const
{
    auto settings = SideCapture::getSettings();
    return settings.value(kSettingsKeyPrefix, defaultPrefix()).toString();
}

void ScreenshotSettingsManager::savePrefix(const QString& prefix)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyPrefix, prefix);
}

QString ScreenshotSettingsManager::loadFormat() const
{
    auto settings = SideCapture::getSettings();
    const QString stored = settings.value(kSettingsKeyFormat, defaultFormat()).toString();
    const QString format = normalizeFormat(stored);
    if (format != canonicalFormat(stored)) {
        qWarning() << "ScreenshotSettingsManager: Unsupported format" << stored << "- using" << format;
    }
    return format;
}

void ScreenshotSettingsManager::saveFormat(const QString& format)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyFormat, normalizeFormat(format));
}

int ScreenshotSettingsManager::loadQuality() const
{
    auto settings = SideCapture::getSettings();
    bool ok = false;
    const int quality = settings.value(kSettingsKeyQuality, kDefaultQuality).toInt(&ok);
    if (!ok) {
        return kDefaultQuality;
    }
    return clampQuality(quality);
}

void ScreenshotSettingsManager::saveQuality(int quality)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyQuality, clampQuality(quality));
}

bool ScreenshotSettingsManager::loadAutoCopy() const
{
    auto settings = SideCapture::getSettings();
    return settings.value(kSettingsKeyAutoCopy, kDefaultAutoCopy).toBool();
}

void ScreenshotSettingsManager::saveAutoCopy(bool enabled)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyAutoCopy, enabled);
}

bool ScreenshotSettingsManager::loadEnableAnnotations() const
{
    auto settings = SideCapture::getSettings();
    return settings.value(kSettingsKeyEnableAnnotations, kDefaultEnableAnnotations).toBool();
}

void ScreenshotSettingsManager::saveEnableAnnotations(bool enabled)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyEnableAnnotations, enabled);
}

bool ScreenshotSettingsManager::loadShowNotification() const
{
    auto settings = SideCapture::getSettings();
    return settings.value(kSettingsKeyShowNotification, kDefaultShowNotification).toBool();
}

void ScreenshotSettingsManager::saveShowNotification(bool enabled)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyShowNotification, enabled);
}

QString ScreenshotSettingsManager::loadHotkey() const
{
    auto settings = SideCapture::getSettings();
    return settings.value(kSettingsKeyHotkey, defaultHotkey()).toString();
}

void ScreenshotSettingsManager::saveHotkey(const QString& hotkey)
{
    auto settings = SideCapture::getSettings();
    settings.setValue(kSettingsKeyHotkey, hotkey);
}

QString ScreenshotSettingsManager::screenshotDirectory() const
{
    return QDir(loadBasePath()).filePath(loadFolderName());
}
