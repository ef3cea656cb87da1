#include "beo_wheel_debouncer.h"

#include <algorithm>
#include <cstdlib>

#include <QTimer>

#include "beo_log.h"

namespace phicore::beo {

WheelDebouncer::WheelDebouncer(QObject *parent)
    : QObject(parent)
{
}

WheelDebouncer::~WheelDebouncer()
{
    reset();
}

void WheelDebouncer::setQuietPeriodMs(int quietPeriodMs)
{
    m_quietPeriodMs = std::max(1, quietPeriodMs);
}

std::optional<RotationEvent> WheelDebouncer::accumulate(const QString &controlId, int detentDelta, qint64 nowMs)
{
    if (controlId.isEmpty() || detentDelta == 0)
        return std::nullopt;

    std::optional<RotationEvent> settled;
    Accumulator &acc = ensureAccumulator(controlId);
    if (acc.count != 0 && nowMs - acc.lastActivityMs >= m_quietPeriodMs) {
        acc.timer->stop();
        settled = settle(controlId);
    }

    Accumulator &current = ensureAccumulator(controlId);
    current.count += detentDelta;
    current.lastActivityMs = nowMs;
    current.timer->start(m_quietPeriodMs);
    return settled;
}

int WheelDebouncer::pendingCount(const QString &controlId) const
{
    const auto it = m_accumulators.constFind(controlId);
    return it == m_accumulators.constEnd() ? 0 : it->count;
}

void WheelDebouncer::reset()
{
    for (auto it = m_accumulators.begin(); it != m_accumulators.end(); ++it) {
        if (it->timer) {
            it->timer->stop();
            it->timer->deleteLater();
        }
    }
    m_accumulators.clear();
}

WheelDebouncer::Accumulator &WheelDebouncer::ensureAccumulator(const QString &controlId)
{
    auto it = m_accumulators.find(controlId);
    if (it == m_accumulators.end()) {
        Accumulator acc;
        acc.timer = new QTimer(this);
        acc.timer->setSingleShot(true);
        connect(acc.timer, &QTimer::timeout, this, [this, controlId]() {
            settle(controlId);
        });
        it = m_accumulators.insert(controlId, acc);
    }
    return it.value();
}

std::optional<RotationEvent> WheelDebouncer::settle(const QString &controlId)
{
    auto it = m_accumulators.find(controlId);
    if (it == m_accumulators.end())
        return std::nullopt;

    const int count = it->count;
    it->count = 0;
    if (count == 0) {
        qCDebug(beoEventLog) << "Wheel" << controlId << "settled with no net movement";
        return std::nullopt;
    }

    RotationEvent event;
    event.controlId = controlId;
    event.direction = count > 0 ? RotationDirection::Clockwise : RotationDirection::CounterClockwise;
    event.magnitude = std::abs(count);
    qCDebug(beoEventLog) << "Wheel" << controlId << "rotated" << event.signedMagnitude();
    emit rotation(event);
    return event;
}

} // namespace phicore::beo
