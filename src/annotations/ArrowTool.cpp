#include "annotations/ArrowTool.h"
#include <QPainter>
#include <QtMath>

ArrowTool::ArrowTool(const DrawStyle &style)
    : TwoPointTool(style)
{
}

QPolygonF ArrowTool::arrowHead() const
{
    // No direction to point at
    if (isDegenerate()) {
        return QPolygonF();
    }

    const QPointF tip = end();
    double angle = qAtan2(end().y() - start().y(), end().x() - start().x());
    double arrowAngle = M_PI / 6.0;  // 30 degrees

    QPointF arrowP1(
        tip.x() - m_headSize * qCos(angle - arrowAngle),
        tip.y() - m_headSize * qSin(angle - arrowAngle)
    );
    QPointF arrowP2(
        tip.x() - m_headSize * qCos(angle + arrowAngle),
        tip.y() - m_headSize * qSin(angle + arrowAngle)
    );

    QPolygonF head;
    head << tip << arrowP1 << arrowP2;
    return head;
}

void ArrowTool::render(QPainter &painter) const
{
    const QPolygonF head = arrowHead();
    if (head.isEmpty()) {
        return;
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    painter.setPen(strokePen(Qt::RoundCap));
    painter.setBrush(Qt::NoBrush);
    painter.drawLine(start(), end());

    painter.setBrush(m_style.color);
    painter.drawPolygon(head);

    painter.restore();
}

QRect ArrowTool::boundingRect() const
{
    if (!hasAnchor()) {
        return QRect();
    }
    int margin = m_headSize + m_style.thickness;
    return box().adjusted(-margin, -margin, margin, margin);
}
