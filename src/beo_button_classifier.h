#pragma once

#include <array>

#include <QHash>
#include <QList>
#include <QObject>
#include <QString>

#include "beo_types.h"

class QTimer;

namespace phicore::beo {

struct PressTimings {
    int longPressMs = 1500;
    // Extra hold time after the long press before a very long press fires.
    int veryLongPressMs = 2000;
};

// Turns pressed/released notifications into ButtonPhase events, one state
// machine per control id. Escalation to long and very long press is driven
// by a single-shot timer owned by each control.
class ButtonClassifier : public QObject
{
    Q_OBJECT

public:
    explicit ButtonClassifier(QObject *parent = nullptr);
    ~ButtonClassifier() override;

    void setTimings(ControlClass controlClass, const PressTimings &timings);
    PressTimings timings(ControlClass controlClass) const;

    // Returns the events produced synchronously by this notification; the
    // same events are also emitted through buttonEvent(). Escalations found
    // later by the timer are only emitted.
    QList<ButtonEvent> classify(const QString &controlId, bool pressed, qint64 nowMs);

    // Drops all per-control state and cancels pending escalations.
    void reset();

    bool isHeld(const QString &controlId) const;
    int trackedControlCount() const { return m_controls.size(); }

signals:
    void buttonEvent(const phicore::beo::ButtonEvent &event);

private:
    enum class Phase {
        Idle,
        Pressed,
        LongHeld,
        VeryLongHeld
    };

    struct ControlState {
        Phase phase = Phase::Idle;
        qint64 pressedAtMs = 0;
        qint64 lastTransitionMs = 0;
        QTimer *timer = nullptr;
    };

    ControlState &ensureControl(const QString &controlId);
    void armEscalation(ControlState &state, int delayMs);
    void onEscalationTimeout(const QString &controlId);
    QList<ButtonPhase> advance(const QString &controlId, ControlState &state, qint64 nowMs);
    ButtonEvent publish(const QString &controlId, ButtonPhase phase);

    std::array<PressTimings, 4> m_timings;
    QHash<QString, ControlState> m_controls;
};

} // namespace phicore::beo
