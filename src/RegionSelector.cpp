#include "RegionSelector.h"
#include "region/SelectionStateManager.h"
#include "region/RegionPainter.h"

#include <QCloseEvent>
#include <QDebug>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QScreen>

RegionSelector::RegionSelector(QWidget* parent)
    : QWidget(parent)
    , m_selectionManager(new SelectionStateManager(this))
    , m_painter(new RegionPainter(this))
{
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool);
    setAttribute(Qt::WA_DeleteOnClose);
    setAttribute(Qt::WA_TranslucentBackground);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setCursor(Qt::CrossCursor);

    m_painter->setSelectionManager(m_selectionManager);

    connect(m_selectionManager, &SelectionStateManager::selectionCompleted,
            this, &RegionSelector::onSelectionCompleted);
    connect(m_selectionManager, &SelectionStateManager::selectionCancelled,
            this, &RegionSelector::onSelectionCancelled);
}

RegionSelector::~RegionSelector()
{
    qDebug() << "RegionSelector: Destroyed";
}

void RegionSelector::initializeForScreen(QScreen* screen, const QPixmap& preCapture)
{
    if (!screen) {
        qWarning() << "RegionSelector: No target screen";
        return;
    }

    m_currentScreen = screen;
    const QRect screenGeom = screen->geometry();
    setGeometry(screenGeom);
    setFixedSize(screenGeom.size());
    setBackgroundPixmap(preCapture);

    m_selectionManager->reset();

    qDebug() << "RegionSelector: Initialized for screen" << screen->name()
             << "logical size:" << screenGeom.size()
             << "pixmap size:" << m_backgroundPixmap.size()
             << "devicePixelRatio:" << screen->devicePixelRatio();
}

void RegionSelector::setBackgroundPixmap(const QPixmap& pixmap)
{
    m_backgroundPixmap = pixmap;
    update();
}

void RegionSelector::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    m_painter->paint(painter, rect(), m_backgroundPixmap);
}

void RegionSelector::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::RightButton) {
        qDebug() << "RegionSelector: Cancelled via right click";
        m_selectionManager->cancel();
        return;
    }

    if (event->button() == Qt::LeftButton && m_selectionManager->isIdle()) {
        m_selectionManager->startSelection(event->position().toPoint());
        update();
    }
}

void RegionSelector::mouseMoveEvent(QMouseEvent* event)
{
    if (m_selectionManager->isSelecting()) {
        m_selectionManager->updateSelection(event->position().toPoint());
        update();
    }
}

void RegionSelector::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_selectionManager->isSelecting()) {
        return;
    }

    if (!m_selectionManager->finishSelection(event->position().toPoint())) {
        // Click without a drag; wait for another attempt
        update();
    }
}

void RegionSelector::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Escape) {
        qDebug() << "RegionSelector: Cancelled via Escape";
        m_selectionManager->cancel();
        return;
    }
    QWidget::keyPressEvent(event);
}

void RegionSelector::onSelectionCompleted(const QRect& rect)
{
    if (m_outcomeReported) return;
    m_outcomeReported = true;

    const QRect globalRect(mapToGlobal(rect.topLeft()), rect.size());
    qDebug() << "RegionSelector: Region selected" << rect << "global" << globalRect;

    // Receivers may grab the live screen; the overlay must not be in it
    hide();

    emit regionSelected(rect);
    emit regionSelectedGlobal(globalRect);
    close();
}

void RegionSelector::onSelectionCancelled()
{
    if (m_outcomeReported) return;
    m_outcomeReported = true;

    emit selectionCancelled();
    if (!m_isClosing) {
        close();
    }
}

void RegionSelector::showEvent(QShowEvent* event)
{
    QWidget::showEvent(event);
    activateWindow();
    raise();
    setFocus();
    grabMouse();
    grabKeyboard();
}

void RegionSelector::hideEvent(QHideEvent* event)
{
    releaseInput();
    QWidget::hideEvent(event);
}

void RegionSelector::closeEvent(QCloseEvent* event)
{
    m_isClosing = true;
    releaseInput();

    // Closed from outside (window manager, owner shutdown) counts as a cancel
    if (!m_outcomeReported) {
        m_selectionManager->cancel();
    }
    QWidget::closeEvent(event);
}

void RegionSelector::releaseInput()
{
    if (QWidget::mouseGrabber() == this) {
        releaseMouse();
    }
    if (QWidget::keyboardGrabber() == this) {
        releaseKeyboard();
    }
}
