#ifndef TWOPOINTTOOL_H
#define TWOPOINTTOOL_H

#include "AnnotationTool.h"
#include <optional>

/**
 * @brief Base for tools defined by an anchor and a moving end point
 *
 * Arrow, line, rectangle, circle and highlighter all share this gesture:
 * press sets start and end, every drag overwrites end.
 */
class TwoPointTool : public AnnotationTool
{
public:
    using AnnotationTool::AnnotationTool;

    bool hasAnchor() const override { return m_start.has_value() && m_end.has_value(); }
    QRect boundingRect() const override;

    QPoint start() const { return m_start.value_or(QPoint()); }
    QPoint end() const { return m_end.value_or(QPoint()); }
    bool isDegenerate() const { return !hasAnchor() || *m_start == *m_end; }

protected:
    void onStart(const QPoint &point) override;
    void onUpdate(const QPoint &point) override;

    // Normalized box spanned by start and end
    QRect box() const;

private:
    std::optional<QPoint> m_start;
    std::optional<QPoint> m_end;
};

#endif // TWOPOINTTOOL_H
