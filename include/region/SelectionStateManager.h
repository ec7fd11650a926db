#ifndef SELECTIONSTATEMANAGER_H
#define SELECTIONSTATEMANAGER_H

#include <QObject>
#include <QRect>
#include <QPoint>
#include <optional>

/**
 * @brief Selection state machine for the region overlay
 *
 * Responsible for:
 * - Tracking the drag start and end points
 * - Deciding whether a finished drag is a usable selection
 * - Terminal cancel handling
 *
 * Has no widget dependency so it can be driven directly from tests.
 */
class SelectionStateManager : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,       // Nothing selected yet
        Selecting,  // Dragging to create selection
        Completed,  // Selection accepted
        Cancelled   // User backed out
    };
    Q_ENUM(State)

    explicit SelectionStateManager(QObject* parent = nullptr);

    // State queries
    State state() const { return m_state; }
    bool isIdle() const { return m_state == State::Idle; }
    bool isSelecting() const { return m_state == State::Selecting; }
    bool isCompleted() const { return m_state == State::Completed; }
    bool isCancelled() const { return m_state == State::Cancelled; }
    bool isTerminal() const { return isCompleted() || isCancelled(); }

    // Selection operations
    void startSelection(const QPoint& pos);
    void updateSelection(const QPoint& pos);
    bool finishSelection(const QPoint& pos);
    void cancel();
    void reset();

    std::optional<QPoint> startPoint() const { return m_startPoint; }
    std::optional<QPoint> endPoint() const { return m_endPoint; }

    // Empty until both points exist
    QRect selectionRect() const;
    bool hasSelection() const;

    // Exclusive-corner rectangle spanned by two points, any drag direction
    static QRect normalizedRect(const QPoint& a, const QPoint& b);

signals:
    void stateChanged(State newState);
    void selectionChanged(const QRect& rect);
    void selectionCompleted(const QRect& rect);
    void selectionCancelled();

private:
    void setState(State state);

    State m_state = State::Idle;
    std::optional<QPoint> m_startPoint;
    std::optional<QPoint> m_endPoint;
};

#endif // SELECTIONSTATEMANAGER_H
