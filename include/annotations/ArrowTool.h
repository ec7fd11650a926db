#ifndef ARROWTOOL_H
#define ARROWTOOL_H

#include "TwoPointTool.h"
#include <QPolygonF>

/**
 * @brief Arrow annotation (line with a filled triangular head at the end)
 */
class ArrowTool : public TwoPointTool
{
public:
    static constexpr int kDefaultHeadSize = 10;

    explicit ArrowTool(const DrawStyle &style = DrawStyle());

    AnnotationToolType type() const override { return AnnotationToolType::Arrow; }
    void render(QPainter &painter) const override;
    QRect boundingRect() const override;

    void setHeadSize(int size) { m_headSize = qMax(1, size); }
    int headSize() const { return m_headSize; }

    // Tip followed by the two back corners; empty when start == end
    QPolygonF arrowHead() const;

private:
    int m_headSize = kDefaultHeadSize;
};

#endif // ARROWTOOL_H
