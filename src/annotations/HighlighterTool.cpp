#include "annotations/HighlighterTool.h"
#include <QPainter>

DrawStyle HighlighterTool::defaultStyle()
{
    DrawStyle style;
    style.color = defaultColor();
    style.filled = true;
    return style;
}

HighlighterTool::HighlighterTool(const DrawStyle &style)
    : TwoPointTool(style)
{
}

void HighlighterTool::render(QPainter &painter) const
{
    if (!hasAnchor()) return;

    painter.save();
    painter.setPen(Qt::NoPen);
    painter.setBrush(m_style.color);
    painter.drawRect(box());
    painter.restore();
}
