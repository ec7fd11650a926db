#ifndef ANNOTATIONMANAGER_H
#define ANNOTATIONMANAGER_H

#include <QImage>
#include <QObject>
#include <QPainter>
#include <memory>
#include <vector>

#include "annotations/AnnotationTool.h"

/**
 * @brief Owns the committed annotations of one capture and renders them
 *
 * Insertion order is z-order: later annotations paint on top. The current
 * (in-progress) tool is kept apart from the committed list and, while it
 * is drawing, is always rendered after every committed annotation.
 */
class AnnotationManager : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationManager(QObject *parent = nullptr);
    ~AnnotationManager();

    void addAnnotation(std::unique_ptr<AnnotationTool> tool);
    bool undo();
    void clearAll();

    void setCurrentTool(std::unique_ptr<AnnotationTool> tool);
    AnnotationTool *currentTool() const { return m_currentTool.get(); }
    std::unique_ptr<AnnotationTool> takeCurrentTool();

    // Moves a finished current tool into the committed list.
    // Returns false when there is no current tool or it is still drawing.
    bool commitCurrentTool();

    void renderAll(QPainter &painter) const;

    // For compositing annotations onto the captured bitmap
    void renderOnto(QImage &image) const;
    QImage renderedCopy(const QImage &base) const;

    int annotationCount() const { return static_cast<int>(m_annotations.size()); }
    bool hasAnnotations() const { return !m_annotations.empty(); }
    const AnnotationTool *annotationAt(int index) const;

signals:
    void changed();

private:
    std::vector<std::unique_ptr<AnnotationTool>> m_annotations;
    std::unique_ptr<AnnotationTool> m_currentTool;
};

#endif // ANNOTATIONMANAGER_H
