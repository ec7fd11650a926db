#include "annotations/ShapeTool.h"
#include <QPainter>

ShapeTool::ShapeTool(ShapeType shape, const DrawStyle &style)
    : TwoPointTool(style)
    , m_shape(shape)
{
}

void ShapeTool::render(QPainter &painter) const
{
    if (!hasAnchor()) return;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    const QRect rect = box();

    if (m_shape == ShapeType::Rectangle) {
        painter.setPen(strokePen(Qt::SquareCap, Qt::MiterJoin));
    } else {
        painter.setPen(strokePen(Qt::RoundCap, Qt::RoundJoin));
    }

    if (m_style.filled) {
        painter.setBrush(fillColor());
    } else {
        painter.setBrush(Qt::NoBrush);
    }

    if (m_shape == ShapeType::Rectangle) {
        painter.drawRect(rect);
    } else {
        painter.drawEllipse(rect);
    }

    painter.restore();
}
