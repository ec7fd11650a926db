#ifndef ANNOTATIONTOOLFACTORY_H
#define ANNOTATIONTOOLFACTORY_H

#include "annotations/AnnotationTool.h"

#include <QVector>
#include <memory>

/**
 * @brief Creates fresh tool instances for a gesture
 *
 * The editor asks for a new tool on every press; the finished tool is
 * handed to AnnotationManager and never reused.
 */
class AnnotationToolFactory
{
public:
    AnnotationToolFactory() = delete;

    static std::unique_ptr<AnnotationTool> create(AnnotationToolType type,
                                                  const DrawStyle &style);

    // Style a tool kind uses when the caller has no preference
    static DrawStyle defaultStyle(AnnotationToolType type);

    // All kinds in toolbar order
    static QVector<AnnotationToolType> allTypes();
};

#endif // ANNOTATIONTOOLFACTORY_H
