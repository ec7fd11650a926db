#include "annotations/AnnotationToolFactory.h"
#include "annotations/AllAnnotationTools.h"

std::unique_ptr<AnnotationTool> AnnotationToolFactory::create(AnnotationToolType type,
                                                              const DrawStyle &style)
{
    switch (type) {
    case AnnotationToolType::Arrow:
        return std::make_unique<ArrowTool>(style);
    case AnnotationToolType::Rectangle:
        return std::make_unique<RectangleTool>(style);
    case AnnotationToolType::Circle:
        return std::make_unique<CircleTool>(style);
    case AnnotationToolType::Line:
        return std::make_unique<LineTool>(style);
    case AnnotationToolType::Text:
        return std::make_unique<TextTool>(style);
    case AnnotationToolType::Highlighter:
        return std::make_unique<HighlighterTool>(style);
    case AnnotationToolType::FreeDraw:
        return std::make_unique<FreeDrawTool>(style);
    }
    return nullptr;
}

DrawStyle AnnotationToolFactory::defaultStyle(AnnotationToolType type)
{
    if (type == AnnotationToolType::Highlighter) {
        return HighlighterTool::defaultStyle();
    }
    return DrawStyle();
}

QVector<AnnotationToolType> AnnotationToolFactory::allTypes()
{
    return {
        AnnotationToolType::Arrow,
        AnnotationToolType::Rectangle,
        AnnotationToolType::Circle,
        AnnotationToolType::Line,
        AnnotationToolType::Text,
        AnnotationToolType::Highlighter,
        AnnotationToolType::FreeDraw
    };
}
