#ifndef REGIONPAINTER_H
#define REGIONPAINTER_H

#include <QObject>
#include <QRect>
#include <QColor>
#include <QPixmap>
#include <QString>
#include <QFont>

class QPainter;
class QFontMetrics;
class SelectionStateManager;

/**
 * @brief Colors and metrics of the selection overlay.
 */
struct OverlayStyle
{
    QColor scrimColor = QColor(0, 0, 0, 100);
    QColor borderColor = QColor(0, 122, 204);
    int borderWidth = 2;
    int handleSize = 8;
    QColor labelBackground = QColor(0, 0, 0, 180);
    QColor labelTextColor = QColor(255, 255, 255);
    QString labelFontFamily = QStringLiteral("Segoe UI");
    int labelFontPointSize = 12;
    int labelPadding = 4;
    int labelGap = 5;
};

/**
 * @brief Handles all painting operations for RegionSelector.
 *
 * Draws one overlay frame: the dimmed surface with the selection punched
 * out, the selection border, corner handles and the size label. Works on
 * any QPainter, so frames can be rendered into a QImage for inspection.
 */
class RegionPainter : public QObject
{
    Q_OBJECT

public:
    explicit RegionPainter(QObject* parent = nullptr);
    ~RegionPainter() override = default;

    // Dependency injection
    void setSelectionManager(SelectionStateManager* manager);

    void setStyle(const OverlayStyle& style) { m_style = style; }
    const OverlayStyle& style() const { return m_style; }

    /**
     * @brief Main paint method called from RegionSelector::paintEvent.
     *
     * @param painter The painter to draw with
     * @param surface Full overlay area in widget coordinates
     * @param background Pre-captured screen, drawn under the scrim if not null
     */
    void paint(QPainter& painter, const QRect& surface, const QPixmap& background = QPixmap());

    /**
     * @brief Where the "W x H" plate goes for a selection.
     *
     * Centered horizontally above the selection; flipped below the bottom
     * edge when it would leave the top of the surface, and kept inside the
     * surface horizontally.
     */
    QRect dimensionLabelRect(const QRect& selection, const QRect& surface,
                             const QFontMetrics& fm) const;

    QFont labelFont() const;
    static QString dimensionText(const QRect& selection);

private:
    void drawDimmingOverlay(QPainter& painter, const QRect& surface, const QRect& clearRect);
    void drawSelection(QPainter& painter, const QRect& sel);
    void drawHandles(QPainter& painter, const QRect& sel);
    void drawDimensionInfo(QPainter& painter, const QRect& sel, const QRect& surface);

    SelectionStateManager* m_selectionManager = nullptr;
    OverlayStyle m_style;
};

#endif // REGIONPAINTER_H
