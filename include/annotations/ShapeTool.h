#ifndef SHAPETOOL_H
#define SHAPETOOL_H

#include "TwoPointTool.h"

// Shape types for ShapeTool
enum class ShapeType {
    Rectangle = 0,
    Ellipse = 1
};

/**
 * @brief Shape annotation (rectangle or ellipse) spanned by the drag
 *
 * In filled mode the interior is painted with the stroke color at the
 * style's fill alpha, under a full-opacity border.
 */
class ShapeTool : public TwoPointTool
{
public:
    ShapeTool(ShapeType shape, const DrawStyle &style);

    void render(QPainter &painter) const override;
    ShapeType shapeType() const { return m_shape; }
    bool isFilled() const { return m_style.filled; }

private:
    ShapeType m_shape;
};

class RectangleTool : public ShapeTool
{
public:
    explicit RectangleTool(const DrawStyle &style = DrawStyle())
        : ShapeTool(ShapeType::Rectangle, style) {}

    AnnotationToolType type() const override { return AnnotationToolType::Rectangle; }
};

class CircleTool : public ShapeTool
{
public:
    explicit CircleTool(const DrawStyle &style = DrawStyle())
        : ShapeTool(ShapeType::Ellipse, style) {}

    AnnotationToolType type() const override { return AnnotationToolType::Circle; }
};

#endif // SHAPETOOL_H
