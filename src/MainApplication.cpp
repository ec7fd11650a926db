#include "MainApplication.h"
#include "CaptureManager.h"
#include "ScreenshotManager.h"
#include "settings/ScreenshotSettingsManager.h"
#include "utils/FileUtils.h"

#include <QAction>
#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QDesktopServices>
#include <QHotkey>
#include <QIcon>
#include <QMenu>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QPixmap>
#include <QSystemTrayIcon>
#include <QUrl>

MainApplication::MainApplication(QObject* parent)
    : QObject(parent)
{
}

MainApplication::~MainApplication()
{
    delete m_trayMenu;
}

QIcon MainApplication::renderTrayIcon()
{
    const int size = 32;
    QPixmap pixmap(size, size);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);

    // Rounded background
    QPainterPath bgPath;
    bgPath.addRoundedRect(0, 0, size, size, 6, 6);
    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(0, 122, 204));
    painter.drawPath(bgPath);

    // Selection frame with corner handles
    painter.setPen(QPen(Qt::white, 2));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(8, 8, 16, 16);
    painter.setPen(Qt::NoPen);
    painter.setBrush(Qt::white);
    for (const QPoint& corner : { QPoint(8, 8), QPoint(24, 8), QPoint(8, 24), QPoint(24, 24) }) {
        painter.drawRect(QRect(corner - QPoint(2, 2), QSize(4, 4)));
    }

    return QIcon(pixmap);
}

void MainApplication::initialize()
{
    m_screenshots = new ScreenshotManager(nullptr, this);
    m_session = new CaptureManager(m_screenshots, this);

    connect(m_session, &CaptureManager::captureCompleted,
            this, [this](const QString& path, const QImage&) { onCaptureSaved(path); });
    connect(m_session, &CaptureManager::captureFailed,
            this, &MainApplication::onCaptureFailed);

    m_trayIcon = new QSystemTrayIcon(renderTrayIcon(), this);
    buildTrayMenu();
    m_trayIcon->setToolTip("SideCapture - Screenshot Utility");
    m_trayIcon->show();

    registerCaptureHotkey();

    qDebug() << "SideCapture initialized and running in system tray";
}

void MainApplication::buildTrayMenu()
{
    m_trayMenu = new QMenu();

    m_captureAction = m_trayMenu->addAction("Capture Region");
    connect(m_captureAction, &QAction::triggered, this, &MainApplication::onCaptureRegion);

    QAction* fullScreenAction = m_trayMenu->addAction("Capture Full Screen");
    connect(fullScreenAction, &QAction::triggered, this, &MainApplication::onCaptureFullScreen);

    m_trayMenu->addSeparator();

    QAction* folderAction = m_trayMenu->addAction("Open Screenshot Folder");
    connect(folderAction, &QAction::triggered, this, &MainApplication::onOpenCaptureFolder);

    m_trayMenu->addSeparator();

    QAction* quitAction = m_trayMenu->addAction("Quit");
    connect(quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon->setContextMenu(m_trayMenu);
}

void MainApplication::onCaptureRegion()
{
    // Close any open popup menus to prevent focus conflicts
    if (QWidget* popup = QApplication::activePopupWidget()) {
        popup->close();
    }
    m_session->startRegionCapture();
}

void MainApplication::onCaptureFullScreen()
{
    if (m_session->isActive()) {
        qDebug() << "MainApplication: Full screen capture blocked, region capture is active";
        return;
    }

    const QImage image = m_screenshots->captureFullScreen(1);
    if (image.isNull()) {
        onCaptureFailed("Full screen capture failed");
        return;
    }

    if (ScreenshotSettingsManager::instance().loadAutoCopy()) {
        m_screenshots->copyToClipboard(image);
    }

    ImageSaveUtils::Error error;
    const QString path = m_screenshots->saveScreenshot(image, QString(), QString(), QString(), -1, &error);
    if (path.isEmpty()) {
        onCaptureFailed(error.message);
        return;
    }
    onCaptureSaved(path);
}

void MainApplication::onOpenCaptureFolder()
{
    const QString dir = ScreenshotSettingsManager::instance().screenshotDirectory();
    QString error;
    if (!FileUtils::ensureDirectoryExists(dir, &error)) {
        onCaptureFailed(error);
        return;
    }
    QDesktopServices::openUrl(QUrl::fromLocalFile(dir));
}

void MainApplication::onCaptureSaved(const QString& filePath)
{
    qDebug() << "MainApplication: Capture saved:" << filePath;
    if (!ScreenshotSettingsManager::instance().loadShowNotification()) {
        return;
    }

    QString sizeText;
    if (const auto metadata = m_screenshots->screenshotMetadata(filePath)) {
        sizeText = QString(" (%1)").arg(FileUtils::formatFileSize(metadata->fileSize));
    }
    m_trayIcon->showMessage("Screenshot Saved",
        QString("Saved to: %1%2").arg(filePath, sizeText),
        QSystemTrayIcon::Information, 3000);
}

void MainApplication::onCaptureFailed(const QString& message)
{
    qWarning() << "MainApplication: Capture failed:" << message;
    m_trayIcon->showMessage("Screenshot Error", message, QSystemTrayIcon::Warning, 5000);
}

void MainApplication::registerCaptureHotkey()
{
    const QString keySequence = ScreenshotSettingsManager::instance().loadHotkey();
    m_captureHotkey = new QHotkey(QKeySequence(keySequence), true, this);

    if (m_captureHotkey->isRegistered()) {
        qDebug() << "MainApplication: Capture hotkey registered:" << keySequence;
    }
    else {
        qWarning() << "MainApplication: Failed to register capture hotkey:" << keySequence;
        m_trayIcon->showMessage("Hotkey Registration Failed",
            QString("Capture Region (%1) hotkey failed to register. "
                    "It may be in use by another application.").arg(keySequence),
            QSystemTrayIcon::Warning, 5000);
    }

    connect(m_captureHotkey, &QHotkey::activated, this, &MainApplication::onCaptureRegion);

    refreshCaptureActionText(keySequence);
}

void MainApplication::refreshCaptureActionText(const QString& hotkey)
{
    if (m_captureAction) {
        m_captureAction->setText(QString("Capture Region (%1)").arg(hotkey));
    }
}
