#include "annotations/FreeDrawTool.h"
#include <QPainter>

FreeDrawTool::FreeDrawTool(const DrawStyle &style)
    : AnnotationTool(style)
{
}

void FreeDrawTool::onStart(const QPoint &point)
{
    m_points.clear();
    m_points.append(point);
    m_boundingRectDirty = true;
}

void FreeDrawTool::onUpdate(const QPoint &point)
{
    if (m_minPointDistance > 0 && !m_points.isEmpty()) {
        const QPoint delta = point - m_points.last();
        const int distSq = delta.x() * delta.x() + delta.y() * delta.y();
        if (distSq < m_minPointDistance * m_minPointDistance) {
            return;
        }
    }
    m_points.append(point);
    m_boundingRectDirty = true;
}

void FreeDrawTool::render(QPainter &painter) const
{
    if (m_points.size() < 2) return;

    painter.save();
    painter.setPen(strokePen(Qt::RoundCap, Qt::RoundJoin));
    painter.setBrush(Qt::NoBrush);
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (int i = 0; i + 1 < m_points.size(); ++i) {
        painter.drawLine(m_points[i], m_points[i + 1]);
    }

    painter.restore();
}

QRect FreeDrawTool::boundingRect() const
{
    if (m_points.isEmpty()) return QRect();

    if (m_boundingRectDirty) {
        int minX = m_points[0].x();
        int maxX = m_points[0].x();
        int minY = m_points[0].y();
        int maxY = m_points[0].y();

        for (const QPoint &p : m_points) {
            minX = qMin(minX, p.x());
            maxX = qMax(maxX, p.x());
            minY = qMin(minY, p.y());
            maxY = qMax(maxY, p.y());
        }

        int margin = m_style.thickness / 2 + 1;
        m_boundingRectCache = QRect(minX - margin, minY - margin,
                                    maxX - minX + 2 * margin, maxY - minY + 2 * margin);
        m_boundingRectDirty = false;
    }
    return m_boundingRectCache;
}
