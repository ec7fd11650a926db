#include "region/RegionPainter.h"
#include "region/SelectionStateManager.h"

#include <QFontMetrics>
#include <QPainter>
#include <QPen>

RegionPainter::RegionPainter(QObject* parent)
    : QObject(parent)
{
}

void RegionPainter::setSelectionManager(SelectionStateManager* manager)
{
    m_selectionManager = manager;
}

void RegionPainter::paint(QPainter& painter, const QRect& surface, const QPixmap& background)
{
    painter.save();

    if (!background.isNull()) {
        painter.drawPixmap(surface, background);
    }

    // Feedback starts as soon as both corners exist, before the area is positive
    const bool hasCorners = m_selectionManager && !m_selectionManager->isCancelled()
        && m_selectionManager->startPoint() && m_selectionManager->endPoint();

    if (!hasCorners) {
        painter.fillRect(surface, m_style.scrimColor);
    } else {
        const QRect sel = m_selectionManager->selectionRect();
        drawDimmingOverlay(painter, surface, sel);
        drawSelection(painter, sel);
        drawHandles(painter, sel);
        drawDimensionInfo(painter, sel, surface);
    }

    painter.restore();
}

void RegionPainter::drawDimmingOverlay(QPainter& painter, const QRect& surface, const QRect& clearRect)
{
    const QRect hole = clearRect.intersected(surface);
    if (hole.isEmpty()) {
        painter.fillRect(surface, m_style.scrimColor);
        return;
    }

    const QColor dimColor = m_style.scrimColor;
    const int x = surface.left();
    const int w = surface.width();
    painter.fillRect(QRect(x, surface.top(), w, hole.top() - surface.top()), dimColor);                  // Top
    painter.fillRect(QRect(x, hole.bottom() + 1, w, surface.bottom() - hole.bottom()), dimColor);        // Bottom
    painter.fillRect(QRect(x, hole.top(), hole.left() - x, hole.height()), dimColor);                    // Left
    painter.fillRect(QRect(hole.right() + 1, hole.top(), surface.right() - hole.right(), hole.height()), dimColor);  // Right
}

void RegionPainter::drawSelection(QPainter& painter, const QRect& sel)
{
    QPen pen(m_style.borderColor, m_style.borderWidth);
    pen.setJoinStyle(Qt::MiterJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(sel);
}

void RegionPainter::drawHandles(QPainter& painter, const QRect& sel)
{
    const int size = m_style.handleSize;
    const int half = size / 2;

    auto drawHandle = [&](int x, int y) {
        painter.fillRect(QRect(x - half, y - half, size, size), m_style.borderColor);
    };

    drawHandle(sel.left(), sel.top());
    drawHandle(sel.right(), sel.top());
    drawHandle(sel.left(), sel.bottom());
    drawHandle(sel.right(), sel.bottom());
}

QFont RegionPainter::labelFont() const
{
    QFont font(m_style.labelFontFamily, m_style.labelFontPointSize, QFont::Bold);
    return font;
}

QString RegionPainter::dimensionText(const QRect& selection)
{
    return QString("%1 x %2").arg(selection.width()).arg(selection.height());
}

QRect RegionPainter::dimensionLabelRect(const QRect& selection, const QRect& surface,
                                        const QFontMetrics& fm) const
{
    const QString label = dimensionText(selection);
    const int pad = m_style.labelPadding;
    const int width = fm.horizontalAdvance(label) + pad * 2;
    const int height = fm.height() + pad;

    int x = selection.left() + (selection.width() - width) / 2;
    int y = selection.top() - m_style.labelGap - height;

    // Off the top edge: place below the selection instead
    if (y < surface.top()) {
        y = selection.top() + selection.height() + m_style.labelGap;
    }
    // Still off-surface (selection spans the full height): inside the top edge
    if (y + height > surface.top() + surface.height()) {
        y = selection.top() + m_style.labelGap;
    }

    x = qBound(surface.left(), x, surface.left() + surface.width() - width);

    return QRect(x, y, width, height);
}

void RegionPainter::drawDimensionInfo(QPainter& painter, const QRect& sel, const QRect& surface)
{
    const QFont font = labelFont();
    painter.setFont(font);
    const QFontMetrics fm(font);

    const QRect textRect = dimensionLabelRect(sel, surface, fm);
    painter.fillRect(textRect, m_style.labelBackground);

    painter.setPen(m_style.labelTextColor);
    painter.drawText(textRect, Qt::AlignCenter, dimensionText(sel));
}
