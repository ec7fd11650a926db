#ifndef ANNOTATIONEDITOR_H
#define ANNOTATIONEDITOR_H

#include <QColor>
#include <QImage>
#include <QWidget>
#include <functional>

#include "annotations/AnnotationTool.h"

class AnnotationManager;
class QCloseEvent;

/**
 * @brief Window for drawing annotations on top of a captured image.
 *
 * The image is shown at 1:1 logical size. Each left drag runs one gesture
 * on a fresh tool; finished gestures are committed to the manager.
 *
 * Keys:
 *   1-7          select tool (arrow, rectangle, circle, line, text, highlighter, freedraw)
 *   Ctrl+Z       undo last annotation
 *   Delete       clear all annotations
 *   F            toggle fill for rectangle and circle
 *   +/-          stroke width
 *   Enter/Ctrl+S accept
 *   Escape       cancel
 */
class AnnotationEditor : public QWidget
{
    Q_OBJECT

public:
    // Returns the text to place, or an empty string to skip the annotation
    using TextProvider = std::function<QString(QWidget* parent)>;

    explicit AnnotationEditor(const QImage& image, QWidget* parent = nullptr);
    ~AnnotationEditor() override;

    AnnotationManager* annotationManager() const { return m_manager; }
    QImage sourceImage() const { return m_image; }
    QImage resultImage() const;

    AnnotationToolType toolType() const { return m_toolType; }
    void setToolType(AnnotationToolType type);

    QColor color() const { return m_color; }
    void setColor(const QColor& color);

    int thickness() const { return m_thickness; }
    void setThickness(int thickness);

    bool isFilled() const { return m_filled; }
    void setFilled(bool filled);

    void setTextProvider(TextProvider provider);

    QSize sizeHint() const override;

public slots:
    void accept();
    void cancel();

signals:
    void annotationAccepted(const QImage& image);
    void annotationCancelled();
    void toolChanged(AnnotationToolType type);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private:
    DrawStyle currentStyle() const;
    void placeText(const QPoint& pos);
    void updateTitle();

    AnnotationManager* m_manager;
    QImage m_image;
    TextProvider m_textProvider;

    AnnotationToolType m_toolType;
    QColor m_color;
    int m_thickness;
    bool m_filled;

    bool m_outcomeReported = false;
};

#endif // ANNOTATIONEDITOR_H
