#ifndef REGIONSELECTOR_H
#define REGIONSELECTOR_H

#include <QWidget>
#include <QPixmap>
#include <QPointer>
#include <QRect>

class QScreen;
class QCloseEvent;
class SelectionStateManager;
class RegionPainter;

/**
 * @brief Fullscreen overlay that lets the user drag out a capture rectangle.
 *
 * Left drag selects, right click or Escape cancels. Each instance reports
 * exactly one outcome: regionSelected()/regionSelectedGlobal() or
 * selectionCancelled(), then closes itself.
 */
class RegionSelector : public QWidget
{
    Q_OBJECT

public:
    explicit RegionSelector(QWidget* parent = nullptr);
    ~RegionSelector();

    // Covers the screen and shows the pre-captured frame under the scrim.
    // A null preCapture leaves the desktop visible through the scrim.
    void initializeForScreen(QScreen* screen, const QPixmap& preCapture = QPixmap());
    void setBackgroundPixmap(const QPixmap& pixmap);

    QScreen* targetScreen() const { return m_currentScreen; }
    SelectionStateManager* selectionManager() const { return m_selectionManager; }
    RegionPainter* regionPainter() const { return m_painter; }

signals:
    void regionSelected(const QRect& rect);
    void regionSelectedGlobal(const QRect& globalRect);
    void selectionCancelled();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void showEvent(QShowEvent* event) override;
    void hideEvent(QHideEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onSelectionCompleted(const QRect& rect);
    void onSelectionCancelled();

private:
    void releaseInput();

    SelectionStateManager* m_selectionManager;
    RegionPainter* m_painter;
    QPointer<QScreen> m_currentScreen;
    QPixmap m_backgroundPixmap;
    bool m_outcomeReported = false;
    bool m_isClosing = false;
};

#endif // REGIONSELECTOR_H
