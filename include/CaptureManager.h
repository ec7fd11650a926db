#ifndef CAPTUREMANAGER_H
#define CAPTUREMANAGER_H

#include <QImage>
#include <QObject>
#include <QPixmap>
#include <QPointer>
#include <QRect>

class RegionSelector;
class AnnotationEditor;
class ScreenshotManager;
class QScreen;

/**
 * @brief Runs one capture session: select, crop, annotate, save.
 *
 * Only one session is active at a time. Every session ends with exactly
 * one of captureCompleted(), captureFailed() or captureCancelled().
 */
class CaptureManager : public QObject
{
    Q_OBJECT

public:
    explicit CaptureManager(ScreenshotManager *screenshots, QObject *parent = nullptr);
    ~CaptureManager();

    bool isActive() const;

    RegionSelector *regionSelector() const { return m_regionSelector; }
    AnnotationEditor *annotationEditor() const { return m_annotationEditor; }

public slots:
    void startRegionCapture();

    // Starts on a given screen with an already captured frame of it
    void startRegionCaptureOnScreen(QScreen *screen, const QPixmap &preCapture);

signals:
    void captureStarted();
    void captureCompleted(const QString &filePath, const QImage &image);
    void captureFailed(const QString &message);
    void captureCancelled();

private slots:
    void onRegionSelected(const QRect &rect);
    void onSelectionCancelled();
    void onAnnotationAccepted(const QImage &image);
    void onAnnotationCancelled();

private:
    QImage cropPreCapture(const QRect &logicalRect) const;
    void finishCapture(const QImage &image);
    void endSession();

    ScreenshotManager *m_screenshots;
    QPointer<RegionSelector> m_regionSelector;
    QPointer<AnnotationEditor> m_annotationEditor;

    QPixmap m_preCapture;
    QRect m_screenGeometry;
    qreal m_devicePixelRatio = 1.0;
    bool m_active = false;
};

#endif // CAPTUREMANAGER_H
