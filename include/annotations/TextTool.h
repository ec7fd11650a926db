#ifndef TEXTTOOL_H
#define TEXTTOOL_H

#include "AnnotationTool.h"
#include <QFont>
#include <optional>

/**
 * @brief Text annotation anchored at the press position
 *
 * Dragging does not move the text. The string is usually supplied after
 * the press by an input prompt.
 */
class TextTool : public AnnotationTool
{
public:
    static constexpr int kDefaultFontSize = 16;

    explicit TextTool(const DrawStyle &style = DrawStyle(), const QString &text = QString());

    AnnotationToolType type() const override { return AnnotationToolType::Text; }
    void render(QPainter &painter) const override;
    QRect boundingRect() const override;
    bool hasAnchor() const override { return m_position.has_value(); }

    void setText(const QString &text) { m_text = text; }
    QString text() const { return m_text; }
    void setFontSize(int size) { m_fontSize = qMax(1, size); }
    int fontSize() const { return m_fontSize; }
    QPoint position() const { return m_position.value_or(QPoint()); }

    QFont font() const;

protected:
    void onStart(const QPoint &point) override;
    void onUpdate(const QPoint &point) override;

private:
    std::optional<QPoint> m_position;
    QString m_text;
    int m_fontSize = kDefaultFontSize;
};

#endif // TEXTTOOL_H
