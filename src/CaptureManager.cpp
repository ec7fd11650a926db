#include "CaptureManager.h"
#include "AnnotationEditor.h"
#include "RegionSelector.h"
#include "ScreenshotManager.h"
#include "settings/ScreenshotSettingsManager.h"
#include "utils/CoordinateHelper.h"

#include <QApplication>
#include <QCursor>
#include <QDebug>
#include <QGuiApplication>
#include <QScreen>

CaptureManager::CaptureManager(ScreenshotManager *screenshots, QObject *parent)
    : QObject(parent)
    , m_screenshots(screenshots)
{
}

CaptureManager::~CaptureManager()
{
    if (m_regionSelector) {
        m_regionSelector->disconnect(this);
        m_regionSelector->close();
    }
    if (m_annotationEditor) {
        m_annotationEditor->disconnect(this);
        m_annotationEditor->close();
    }
}

bool CaptureManager::isActive() const
{
    return m_active;
}

void CaptureManager::startRegionCapture()
{
    if (m_active) {
        qDebug() << "CaptureManager: Already in capture mode, ignoring";
        return;
    }

    // Screen under the cursor
    QScreen *targetScreen = QGuiApplication::screenAt(QCursor::pos());
    if (!targetScreen) {
        targetScreen = QGuiApplication::primaryScreen();
    }
    if (!targetScreen) {
        qWarning() << "CaptureManager: No screen available";
        emit captureFailed(tr("No screen available"));
        return;
    }

    qDebug() << "CaptureManager: Target screen:" << targetScreen->name()
             << "geometry:" << targetScreen->geometry()
             << "cursor pos:" << QCursor::pos();

    // Capture FIRST while any popup is still visible
    QWidget *popup = QApplication::activePopupWidget();
    QPixmap preCapture = targetScreen->grabWindow(0);
    qDebug() << "CaptureManager: Screenshot captured, size:" << preCapture.size();

    // Close popup AFTER screenshot to avoid event loop conflict with RegionSelector
    if (popup) {
        popup->close();
    }

    startRegionCaptureOnScreen(targetScreen, preCapture);
}

void CaptureManager::startRegionCaptureOnScreen(QScreen *screen, const QPixmap &preCapture)
{
    if (m_active) {
        qDebug() << "CaptureManager: Already in capture mode, ignoring";
        return;
    }
    if (!screen) {
        emit captureFailed(tr("No screen available"));
        return;
    }

    m_active = true;
    m_preCapture = preCapture;
    m_screenGeometry = screen->geometry();
    m_devicePixelRatio = preCapture.isNull() ? CoordinateHelper::getDevicePixelRatio(screen)
                                             : preCapture.devicePixelRatio();
    emit captureStarted();

    m_regionSelector = new RegionSelector();
    m_regionSelector->initializeForScreen(screen, preCapture);

    connect(m_regionSelector, &RegionSelector::regionSelected,
            this, &CaptureManager::onRegionSelected);
    connect(m_regionSelector, &RegionSelector::selectionCancelled,
            this, &CaptureManager::onSelectionCancelled);

    m_regionSelector->show();
    m_regionSelector->activateWindow();
    m_regionSelector->raise();
}

QImage CaptureManager::cropPreCapture(const QRect &logicalRect) const
{
    if (m_preCapture.isNull()) {
        return QImage();
    }

    const QRect physical = CoordinateHelper::toPhysicalCoveringRect(logicalRect, m_devicePixelRatio)
                               .intersected(m_preCapture.rect());
    if (physical.isEmpty()) {
        return QImage();
    }

    QImage cropped = m_preCapture.copy(physical).toImage();
    cropped.setDevicePixelRatio(m_devicePixelRatio);
    return cropped;
}

void CaptureManager::onRegionSelected(const QRect &rect)
{
    const QRect globalRect = rect.translated(m_screenGeometry.topLeft());
    qDebug() << "CaptureManager: Region selected" << rect << "global" << globalRect;

    QImage image = cropPreCapture(rect);
    if (image.isNull()) {
        // No usable pre-capture; grab the live screen instead
        image = m_screenshots->captureRegion(globalRect);
    }
    if (image.isNull()) {
        endSession();
        emit captureFailed(tr("Failed to capture the selected region"));
        return;
    }

    if (!ScreenshotSettingsManager::instance().loadEnableAnnotations()) {
        finishCapture(image);
        return;
    }

    m_annotationEditor = new AnnotationEditor(image);
    connect(m_annotationEditor, &AnnotationEditor::annotationAccepted,
            this, &CaptureManager::onAnnotationAccepted);
    connect(m_annotationEditor, &AnnotationEditor::annotationCancelled,
            this, &CaptureManager::onAnnotationCancelled);
    m_annotationEditor->move(globalRect.topLeft());
    m_annotationEditor->show();
    m_annotationEditor->activateWindow();
    m_annotationEditor->raise();
}

void CaptureManager::onSelectionCancelled()
{
    qDebug() << "CaptureManager: Selection cancelled";
    endSession();
    emit captureCancelled();
}

void CaptureManager::onAnnotationAccepted(const QImage &image)
{
    finishCapture(image);
}

void CaptureManager::onAnnotationCancelled()
{
    qDebug() << "CaptureManager: Annotation cancelled";
    endSession();
    emit captureCancelled();
}

void CaptureManager::finishCapture(const QImage &image)
{
    const auto &settings = ScreenshotSettingsManager::instance();
    if (settings.loadAutoCopy()) {
        m_screenshots->copyToClipboard(image);
    }

    ImageSaveUtils::Error error;
    const QString path = m_screenshots->saveScreenshot(image, QString(), QString(), QString(), -1, &error);

    endSession();
    if (path.isEmpty()) {
        emit captureFailed(error.message);
        return;
    }
    emit captureCompleted(path, image);
}

void CaptureManager::endSession()
{
    m_active = false;
    m_preCapture = QPixmap();
}
