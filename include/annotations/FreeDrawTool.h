#ifndef FREEDRAWTOOL_H
#define FREEDRAWTOOL_H

#include "AnnotationTool.h"
#include <QVector>

/**
 * @brief Freehand stroke recorded as a polyline
 */
class FreeDrawTool : public AnnotationTool
{
public:
    explicit FreeDrawTool(const DrawStyle &style = DrawStyle());

    AnnotationToolType type() const override { return AnnotationToolType::FreeDraw; }
    void render(QPainter &painter) const override;
    QRect boundingRect() const override;
    bool hasAnchor() const override { return !m_points.isEmpty(); }

    const QVector<QPoint> &points() const { return m_points; }
    int segmentCount() const { return qMax(0, static_cast<int>(m_points.size()) - 1); }

    // Points closer than this to the last recorded point are dropped.
    // 0 keeps every pointer sample.
    void setMinPointDistance(int distance) { m_minPointDistance = qMax(0, distance); }
    int minPointDistance() const { return m_minPointDistance; }

protected:
    void onStart(const QPoint &point) override;
    void onUpdate(const QPoint &point) override;

private:
    QVector<QPoint> m_points;
    int m_minPointDistance = 0;

    // Performance optimization: cached bounding rect
    mutable QRect m_boundingRectCache;
    mutable bool m_boundingRectDirty = true;
};

#endif // FREEDRAWTOOL_H
