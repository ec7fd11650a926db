#ifndef ALLANNOTATIONTOOLS_H
#define ALLANNOTATIONTOOLS_H

/**
 * @brief Convenience header including every annotation tool
 *
 * Usage:
 *   #include "annotations/AllAnnotationTools.h"
 *
 * or include only the tools you need:
 *   #include "annotations/ArrowTool.h"
 *   #include "annotations/TextTool.h"
 */

#include "annotations/AnnotationTool.h"
#include "annotations/TwoPointTool.h"
#include "annotations/ArrowTool.h"
#include "annotations/LineTool.h"
#include "annotations/ShapeTool.h"
#include "annotations/HighlighterTool.h"
#include "annotations/TextTool.h"
#include "annotations/FreeDrawTool.h"

#endif // ALLANNOTATIONTOOLS_H
