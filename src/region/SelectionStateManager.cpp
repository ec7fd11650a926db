#include "region/SelectionStateManager.h"
#include "utils/CoordinateHelper.h"

#include <QDebug>

SelectionStateManager::SelectionStateManager(QObject* parent)
    : QObject(parent)
{
}

void SelectionStateManager::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(m_state);
    }
}

QRect SelectionStateManager::normalizedRect(const QPoint& a, const QPoint& b)
{
    return CoordinateHelper::rectFromCorners(a, b);
}

QRect SelectionStateManager::selectionRect() const
{
    if (!m_startPoint || !m_endPoint) {
        return QRect();
    }
    return normalizedRect(*m_startPoint, *m_endPoint);
}

bool SelectionStateManager::hasSelection() const
{
    const QRect rect = selectionRect();
    return rect.width() > 0 && rect.height() > 0;
}

// ============================================================================
// Selection Operations
// ============================================================================

void SelectionStateManager::startSelection(const QPoint& pos)
{
    if (m_state != State::Idle) {
        qDebug() << "SelectionStateManager: startSelection ignored in state" << m_state;
        return;
    }

    m_startPoint = pos;
    m_endPoint = pos;
    setState(State::Selecting);
    emit selectionChanged(selectionRect());
}

void SelectionStateManager::updateSelection(const QPoint& pos)
{
    if (m_state != State::Selecting) return;

    m_endPoint = pos;
    emit selectionChanged(selectionRect());
}

bool SelectionStateManager::finishSelection(const QPoint& pos)
{
    if (m_state != State::Selecting) return false;

    m_endPoint = pos;

    // Zero-area drags never become a selection
    if (!hasSelection()) {
        qDebug() << "SelectionStateManager: Degenerate selection discarded";
        reset();
        return false;
    }

    const QRect rect = selectionRect();
    setState(State::Completed);
    emit selectionCompleted(rect);
    return true;
}

void SelectionStateManager::cancel()
{
    if (isTerminal()) return;

    setState(State::Cancelled);
    emit selectionCancelled();
}

void SelectionStateManager::reset()
{
    m_startPoint.reset();
    m_endPoint.reset();
    setState(State::Idle);
    emit selectionChanged(QRect());
}
