#include "annotations/AnnotationTool.h"

#include <QDebug>
#include <QPen>

namespace {

struct ToolTypeEntry {
    AnnotationToolType type;
    const char *name;
};

constexpr ToolTypeEntry kToolTypeNames[] = {
    { AnnotationToolType::Arrow, "arrow" },
    { AnnotationToolType::Rectangle, "rectangle" },
    { AnnotationToolType::Circle, "circle" },
    { AnnotationToolType::Line, "line" },
    { AnnotationToolType::Text, "text" },
    { AnnotationToolType::Highlighter, "highlighter" },
    { AnnotationToolType::FreeDraw, "freedraw" },
};

} // namespace

AnnotationTool::AnnotationTool(const DrawStyle &style)
    : m_style(style)
{
    m_style.thickness = qMax(1, m_style.thickness);
}

void AnnotationTool::startDrawing(const QPoint &point)
{
    if (m_state == DrawState::Committed) {
        qDebug() << "AnnotationTool: Ignoring start on committed" << toolTypeName(type());
        return;
    }
    onStart(point);
    m_state = DrawState::InProgress;
}

void AnnotationTool::updateDrawing(const QPoint &point)
{
    if (m_state != DrawState::InProgress) {
        return;
    }
    onUpdate(point);
}

void AnnotationTool::finishDrawing(const QPoint &point)
{
    if (m_state != DrawState::InProgress) {
        qDebug() << "AnnotationTool: Ignoring finish on" << toolTypeName(type())
                 << "in state" << static_cast<int>(m_state);
        return;
    }
    onUpdate(point);
    m_state = DrawState::Committed;
}

void AnnotationTool::setColor(const QColor &color)
{
    m_style.color = color;
}

void AnnotationTool::setThickness(int thickness)
{
    m_style.thickness = qMax(1, thickness);
}

QPen AnnotationTool::strokePen(Qt::PenCapStyle cap, Qt::PenJoinStyle join) const
{
    return QPen(m_style.color, m_style.thickness, Qt::SolidLine, cap, join);
}

QColor AnnotationTool::fillColor() const
{
    QColor fill = m_style.color;
    fill.setAlpha(qBound(0, m_style.fillAlpha, 255));
    return fill;
}

QString toolTypeName(AnnotationToolType type)
{
    for (const auto &entry : kToolTypeNames) {
        if (entry.type == type) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QString();
}

bool toolTypeFromName(const QString &name, AnnotationToolType *type)
{
    const QString key = name.trimmed().toLower();
    for (const auto &entry : kToolTypeNames) {
        if (key == QLatin1String(entry.name)) {
            if (type) {
                *type = entry.type;
            }
            return true;
        }
    }
    return false;
}
