#pragma once

#include <optional>

#include <QHash>
#include <QObject>
#include <QString>

#include "beo_types.h"

class QTimer;

namespace phicore::beo {

// Folds bursts of wheel detents into one RotationEvent per gesture. Each
// detent re-arms the control's quiet-period timer; when it expires the net
// count is emitted and cleared.
class WheelDebouncer : public QObject
{
    Q_OBJECT

public:
    explicit WheelDebouncer(QObject *parent = nullptr);
    ~WheelDebouncer() override;

    void setQuietPeriodMs(int quietPeriodMs);
    int quietPeriodMs() const { return m_quietPeriodMs; }

    // If the previous burst on this control has already been quiet for the
    // full period (its timer not yet delivered), that burst is settled first
    // and returned.
    std::optional<RotationEvent> accumulate(const QString &controlId, int detentDelta, qint64 nowMs);

    int pendingCount(const QString &controlId) const;
    void reset();

signals:
    void rotation(const phicore::beo::RotationEvent &event);

private:
    struct Accumulator {
        int count = 0;
        qint64 lastActivityMs = 0;
        QTimer *timer = nullptr;
    };

    Accumulator &ensureAccumulator(const QString &controlId);
    std::optional<RotationEvent> settle(const QString &controlId);

    int m_quietPeriodMs = 250;
    QHash<QString, Accumulator> m_accumulators;
};

} // namespace phicore::beo
