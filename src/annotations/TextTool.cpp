#include "annotations/TextTool.h"
#include <QFontMetrics>
#include <QPainter>

TextTool::TextTool(const DrawStyle &style, const QString &text)
    : AnnotationTool(style)
    , m_text(text)
{
}

void TextTool::onStart(const QPoint &point)
{
    m_position = point;
}

void TextTool::onUpdate(const QPoint &point)
{
    // Text stays where it was placed
    Q_UNUSED(point);
}

QFont TextTool::font() const
{
    return QFont(QStringLiteral("Arial"), m_fontSize, QFont::Bold);
}

void TextTool::render(QPainter &painter) const
{
    if (!m_position || m_text.isEmpty()) return;

    painter.save();
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setFont(font());
    painter.setPen(m_style.color);
    painter.drawText(*m_position, m_text);
    painter.restore();
}

QRect TextTool::boundingRect() const
{
    if (!m_position || m_text.isEmpty()) {
        return QRect();
    }

    // drawText(QPoint) places the baseline at the anchor
    QFontMetrics fm(font());
    return fm.boundingRect(m_text).translated(*m_position).adjusted(-2, -2, 2, 2);
}
