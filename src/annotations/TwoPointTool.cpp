#include "annotations/TwoPointTool.h"
#include "utils/CoordinateHelper.h"

void TwoPointTool::onStart(const QPoint &point)
{
    m_start = point;
    m_end = point;
}

void TwoPointTool::onUpdate(const QPoint &point)
{
    m_end = point;
}

QRect TwoPointTool::box() const
{
    if (!hasAnchor()) {
        return QRect();
    }
    return CoordinateHelper::rectFromCorners(*m_start, *m_end);
}

QRect TwoPointTool::boundingRect() const
{
    if (!hasAnchor()) {
        return QRect();
    }
    int margin = m_style.thickness / 2 + 1;
    return box().adjusted(-margin, -margin, margin, margin);
}
