#ifndef SCREENSHOTSETTINGSMANAGER_H
#define SCREENSHOTSETTINGSMANAGER_H

#include <QString>
#include <QStringList>

/**
 * @brief Singleton class for managing screenshot settings.
 *
 * Provides centralized access to where screenshots are written, how
 * their files are named and encoded, and what happens after a capture.
 */
class ScreenshotSettingsManager
{
public:
    static ScreenshotSettingsManager& instance();

    // Base directory (folder name is appended)
    QString loadBasePath() const;
    void saveBasePath(const QString& path);

    QString loadFolderName() const;
    void saveFolderName(const QString& name);

    // Filename prefix
    QString loadPrefix() const;
    void savePrefix(const QString& prefix);

    // Image format: png, jpg or bmp
    QString loadFormat() const;
    void saveFormat(const QString& format);

    // JPEG quality, 1-100
    int loadQuality() const;
    void saveQuality(int quality);

    // Copy to clipboard after capture
    bool loadAutoCopy() const;
    void saveAutoCopy(bool enabled);

    // Open the annotation editor before saving
    bool loadEnableAnnotations() const;
    void saveEnableAnnotations(bool enabled);

    // Tray notification after a capture is saved
    bool loadShowNotification() const;
    void saveShowNotification(bool enabled);

    // Capture shortcut, QKeySequence portable text
    QString loadHotkey() const;
    void saveHotkey(const QString& hotkey);

    // basePath/folderName
    QString screenshotDirectory() const;

    static QStringList supportedFormats();
    static QString normalizeFormat(const QString& format);
    static int clampQuality(int quality);

    // Default values
    static QString defaultBasePath();
    static QString defaultFolderName() { return QStringLiteral("Screenshots"); }
    static QString defaultPrefix() { return QStringLiteral("screenshot"); }
    static QString defaultFormat() { return QStringLiteral("png"); }
    static constexpr int kDefaultQuality = 95;
    static constexpr int kMinQuality = 1;
    static constexpr int kMaxQuality = 100;
    static constexpr bool kDefaultAutoCopy = true;
    static constexpr bool kDefaultEnableAnnotations = true;
    static constexpr bool kDefaultShowNotification = true;
    static QString defaultHotkey() { return QStringLiteral("Ctrl+Shift+S"); }

private:
    ScreenshotSettingsManager() = default;
    ScreenshotSettingsManager(const ScreenshotSettingsManager&) = delete;
    ScreenshotSettingsManager& operator=(const ScreenshotSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyBasePath = "screenshot/basePath";
    static constexpr const char* kSettingsKeyFolderName = "screenshot/folderName";
    static constexpr const char* kSettingsKeyPrefix = "screenshot/prefix";
    static constexpr const char* kSettingsKeyFormat = "screenshot/format";
    static constexpr const char* kSettingsKeyQuality = "screenshot/quality";
    static constexpr const char* kSettingsKeyAutoCopy = "screenshot/autoCopy";
    static constexpr const char* kSettingsKeyEnableAnnotations = "screenshot/enableAnnotations";
    static constexpr const char* kSettingsKeyShowNotification = "screenshot/showNotification";
    static constexpr const char* kSettingsKeyHotkey = "screenshot/hotkey";
};

#endif // SCREENSHOTSETTINGSMANAGER_H
