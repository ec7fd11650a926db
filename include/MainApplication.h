#ifndef MAINAPPLICATION_H
#define MAINAPPLICATION_H

#include <QObject>

class QSystemTrayIcon;
class QMenu;
class QAction;
class QHotkey;
class QIcon;
class CaptureManager;
class ScreenshotManager;

/**
 * @brief Tray-resident entry point.
 *
 * Owns the screenshot facade and the capture session, exposes them through
 * the tray menu and one global shortcut, and reports outcomes as tray
 * notifications.
 */
class MainApplication : public QObject
{
    Q_OBJECT

public:
    explicit MainApplication(QObject *parent = nullptr);
    ~MainApplication() override;

    void initialize();

private slots:
    void onCaptureRegion();
    void onCaptureFullScreen();
    void onOpenCaptureFolder();
    void onCaptureSaved(const QString &filePath);
    void onCaptureFailed(const QString &message);

private:
    void buildTrayMenu();
    void registerCaptureHotkey();
    void refreshCaptureActionText(const QString &hotkey);
    static QIcon renderTrayIcon();

    QSystemTrayIcon *m_trayIcon = nullptr;
    QMenu *m_trayMenu = nullptr;
    QAction *m_captureAction = nullptr;
    QHotkey *m_captureHotkey = nullptr;
    ScreenshotManager *m_screenshots = nullptr;
    CaptureManager *m_session = nullptr;
};

#endif // MAINAPPLICATION_H
