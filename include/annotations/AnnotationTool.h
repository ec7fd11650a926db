#ifndef ANNOTATIONTOOL_H
#define ANNOTATIONTOOL_H

#include <QColor>
#include <QPainter>
#include <QPen>
#include <QPoint>
#include <QRect>
#include <QString>

// Kinds of annotation tools. The set is closed: AnnotationToolFactory
// switches over every value.
enum class AnnotationToolType {
    Arrow = 0,
    Rectangle,
    Circle,
    Line,
    Text,
    Highlighter,
    FreeDraw
};

// Gesture lifecycle of a single tool instance
enum class DrawState {
    NotStarted,
    InProgress,
    Committed
};

struct DrawStyle {
    QColor color = QColor(255, 0, 0);
    int thickness = 2;
    bool filled = false;
    int fillAlpha = 100;
};

/**
 * @brief Abstract base class for all annotation tools
 *
 * A tool records one gesture (press, drags, release) and renders it.
 * Once finished it is committed and no longer accepts input; it then
 * lives in AnnotationManager as a committed annotation.
 */
class AnnotationTool
{
public:
    explicit AnnotationTool(const DrawStyle &style);
    virtual ~AnnotationTool() = default;

    AnnotationTool(const AnnotationTool &) = delete;
    AnnotationTool &operator=(const AnnotationTool &) = delete;

    virtual AnnotationToolType type() const = 0;

    void startDrawing(const QPoint &point);
    void updateDrawing(const QPoint &point);
    void finishDrawing(const QPoint &point);

    // Paints the current state. Must not change the tool.
    virtual void render(QPainter &painter) const = 0;
    virtual QRect boundingRect() const = 0;

    DrawState state() const { return m_state; }
    bool isDrawing() const { return m_state == DrawState::InProgress; }
    bool isCommitted() const { return m_state == DrawState::Committed; }
    virtual bool hasAnchor() const = 0;

    const DrawStyle &style() const { return m_style; }
    void setColor(const QColor &color);
    void setThickness(int thickness);
    void setFilled(bool filled) { m_style.filled = filled; }

protected:
    virtual void onStart(const QPoint &point) = 0;
    virtual void onUpdate(const QPoint &point) = 0;

    QPen strokePen(Qt::PenCapStyle cap = Qt::RoundCap,
                   Qt::PenJoinStyle join = Qt::RoundJoin) const;
    QColor fillColor() const;

    DrawStyle m_style;

private:
    DrawState m_state = DrawState::NotStarted;
};

QString toolTypeName(AnnotationToolType type);
bool toolTypeFromName(const QString &name, AnnotationToolType *type);

#endif // ANNOTATIONTOOL_H
