#include "annotations/LineTool.h"
#include <QPainter>

LineTool::LineTool(const DrawStyle &style)
    : TwoPointTool(style)
{
}

void LineTool::render(QPainter &painter) const
{
    if (!hasAnchor()) return;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setPen(strokePen(Qt::RoundCap));
    painter.drawLine(start(), end());
    painter.restore();
}
