#ifndef LINETOOL_H
#define LINETOOL_H

#include "TwoPointTool.h"

/**
 * @brief Straight line annotation with round caps
 */
class LineTool : public TwoPointTool
{
public:
    explicit LineTool(const DrawStyle &style = DrawStyle());

    AnnotationToolType type() const override { return AnnotationToolType::Line; }
    void render(QPainter &painter) const override;
};

#endif // LINETOOL_H
