#ifndef HIGHLIGHTERTOOL_H
#define HIGHLIGHTERTOOL_H

#include "TwoPointTool.h"

/**
 * @brief Semi-transparent highlighter box, filled with no border
 */
class HighlighterTool : public TwoPointTool
{
public:
    static QColor defaultColor() { return QColor(255, 255, 0, 80); }
    static DrawStyle defaultStyle();

    explicit HighlighterTool(const DrawStyle &style = defaultStyle());

    AnnotationToolType type() const override { return AnnotationToolType::Highlighter; }
    void render(QPainter &painter) const override;
    QRect boundingRect() const override { return box(); }
};

#endif // HIGHLIGHTERTOOL_H
