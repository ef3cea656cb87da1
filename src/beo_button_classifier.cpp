#include "beo_button_classifier.h"

#include <algorithm>
#include <utility>

#include <QTimer>

#include "beo_log.h"

namespace phicore::beo {

namespace {

std::size_t timingIndex(ControlClass controlClass)
{
    return static_cast<std::size_t>(controlClass);
}

} // namespace

ButtonClassifier::ButtonClassifier(QObject *parent)
    : QObject(parent)
{
}

ButtonClassifier::~ButtonClassifier()
{
    reset();
}

void ButtonClassifier::setTimings(ControlClass controlClass, const PressTimings &timings)
{
    PressTimings sane;
    sane.longPressMs = std::max(1, timings.longPressMs);
    sane.veryLongPressMs = std::max(1, timings.veryLongPressMs);
    m_timings[timingIndex(controlClass)] = sane;
}

PressTimings ButtonClassifier::timings(ControlClass controlClass) const
{
    return m_timings[timingIndex(controlClass)];
}

QList<ButtonEvent> ButtonClassifier::classify(const QString &controlId, bool pressed, qint64 nowMs)
{
    QList<ButtonEvent> out;
    if (controlId.isEmpty())
        return out;

    ControlState &state = ensureControl(controlId);

    if (pressed) {
        if (state.phase != Phase::Idle) {
            qCDebug(beoEventLog) << "Ignoring duplicate press for" << controlId;
            return out;
        }
        state.phase = Phase::Pressed;
        state.pressedAtMs = nowMs;
        state.lastTransitionMs = nowMs;
        armEscalation(state, timings(controlClassForId(controlId)).longPressMs);
        return out;
    }

    if (state.phase == Phase::Idle) {
        qCDebug(beoEventLog) << "Ignoring release without press for" << controlId;
        return out;
    }

    state.timer->stop();
    // Catch up on escalations whose timer has not been delivered yet.
    QList<ButtonPhase> phases = advance(controlId, state, nowMs);

    switch (state.phase) {
    case Phase::Pressed:
        phases << ButtonPhase::ShortPress << ButtonPhase::ReleaseOfShortPress;
        break;
    case Phase::LongHeld:
        phases << ButtonPhase::ReleaseOfLongPress;
        break;
    case Phase::VeryLongHeld:
        phases << ButtonPhase::ReleaseOfVeryLongPress;
        break;
    case Phase::Idle:
        break;
    }

    state.phase = Phase::Idle;
    state.lastTransitionMs = nowMs;

    for (ButtonPhase phase : std::as_const(phases))
        out.append(publish(controlId, phase));
    return out;
}

void ButtonClassifier::reset()
{
    for (auto it = m_controls.begin(); it != m_controls.end(); ++it) {
        if (it->timer) {
            it->timer->stop();
            it->timer->deleteLater();
        }
    }
    m_controls.clear();
}

bool ButtonClassifier::isHeld(const QString &controlId) const
{
    const auto it = m_controls.constFind(controlId);
    return it != m_controls.constEnd() && it->phase != Phase::Idle;
}

ButtonClassifier::ControlState &ButtonClassifier::ensureControl(const QString &controlId)
{
    auto it = m_controls.find(controlId);
    if (it == m_controls.end()) {
        ControlState state;
        state.timer = new QTimer(this);
        state.timer->setSingleShot(true);
        connect(state.timer, &QTimer::timeout, this, [this, controlId]() {
            onEscalationTimeout(controlId);
        });
        it = m_controls.insert(controlId, state);
    }
    return it.value();
}

void ButtonClassifier::armEscalation(ControlState &state, int delayMs)
{
    state.timer->stop();
    state.timer->start(std::max(0, delayMs));
}

void ButtonClassifier::onEscalationTimeout(const QString &controlId)
{
    auto it = m_controls.find(controlId);
    if (it == m_controls.end())
        return;

    ControlState &state = it.value();
    const PressTimings t = timings(controlClassForId(controlId));
    const qint64 now = monotonicMs();

    // One step per timeout, so the order never depends on clock drift.
    if (state.phase == Phase::Pressed) {
        state.phase = Phase::LongHeld;
        state.lastTransitionMs = now;
        armEscalation(state, t.veryLongPressMs);
        publish(controlId, ButtonPhase::LongPress);
    } else if (state.phase == Phase::LongHeld) {
        state.phase = Phase::VeryLongHeld;
        state.lastTransitionMs = now;
        publish(controlId, ButtonPhase::VeryLongPress);
    }
}

QList<ButtonPhase> ButtonClassifier::advance(const QString &controlId, ControlState &state, qint64 nowMs)
{
    QList<ButtonPhase> phases;
    const PressTimings t = timings(controlClassForId(controlId));
    const qint64 held = nowMs - state.pressedAtMs;

    if (state.phase == Phase::Pressed && held >= t.longPressMs) {
        state.phase = Phase::LongHeld;
        phases << ButtonPhase::LongPress;
    }
    if (state.phase == Phase::LongHeld && held >= qint64(t.longPressMs) + t.veryLongPressMs) {
        state.phase = Phase::VeryLongHeld;
        phases << ButtonPhase::VeryLongPress;
    }
    return phases;
}

ButtonEvent ButtonClassifier::publish(const QString &controlId, ButtonPhase phase)
{
    ButtonEvent event;
    event.controlId = controlId;
    event.phase = phase;
    qCDebug(beoEventLog) << "Button" << controlId << buttonPhaseName(phase);
    emit buttonEvent(event);
    return event;
}

} // namespace phicore::beo
