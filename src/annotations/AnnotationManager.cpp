#include "annotations/AnnotationManager.h"
#include <QDebug>

AnnotationManager::AnnotationManager(QObject *parent)
    : QObject(parent)
{
}

AnnotationManager::~AnnotationManager() = default;

void AnnotationManager::addAnnotation(std::unique_ptr<AnnotationTool> tool)
{
    if (!tool) return;

    qDebug() << "AnnotationManager: Annotation added:" << toolTypeName(tool->type());
    m_annotations.push_back(std::move(tool));
    emit changed();
}

bool AnnotationManager::undo()
{
    if (m_annotations.empty()) {
        return false;
    }

    qDebug() << "AnnotationManager: Annotation undone:"
             << toolTypeName(m_annotations.back()->type());
    m_annotations.pop_back();
    emit changed();
    return true;
}

void AnnotationManager::clearAll()
{
    const size_t count = m_annotations.size();
    m_annotations.clear();
    qDebug() << "AnnotationManager: All annotations cleared:" << count << "removed";
    emit changed();
}

void AnnotationManager::setCurrentTool(std::unique_ptr<AnnotationTool> tool)
{
    m_currentTool = std::move(tool);
    emit changed();
}

std::unique_ptr<AnnotationTool> AnnotationManager::takeCurrentTool()
{
    std::unique_ptr<AnnotationTool> tool = std::move(m_currentTool);
    if (tool) {
        emit changed();
    }
    return tool;
}

bool AnnotationManager::commitCurrentTool()
{
    if (!m_currentTool || !m_currentTool->isCommitted()) {
        return false;
    }
    addAnnotation(std::move(m_currentTool));
    return true;
}

void AnnotationManager::renderAll(QPainter &painter) const
{
    for (const auto &annotation : m_annotations) {
        annotation->render(painter);
    }

    // In-progress gesture stays on top of everything committed
    if (m_currentTool && m_currentTool->isDrawing()) {
        m_currentTool->render(painter);
    }
}

void AnnotationManager::renderOnto(QImage &image) const
{
    if (image.isNull()) return;

    QPainter painter(&image);
    renderAll(painter);
}

QImage AnnotationManager::renderedCopy(const QImage &base) const
{
    QImage result = base.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    renderOnto(result);
    return result;
}

const AnnotationTool *AnnotationManager::annotationAt(int index) const
{
    if (index < 0 || index >= annotationCount()) {
        return nullptr;
    }
    return m_annotations[static_cast<size_t>(index)].get();
}
