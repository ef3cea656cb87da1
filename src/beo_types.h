#pragma once

#include <optional>

#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QStringList>

namespace phicore::beo {

enum class ButtonPhase {
    ShortPress = 1,
    ReleaseOfShortPress,
    LongPress,
    ReleaseOfLongPress,
    VeryLongPress,
    ReleaseOfVeryLongPress
};

// Timing profile a control follows. Volume and Bluetooth keys are held for
// longer on most products, so they get their own thresholds.
enum class ControlClass {
    Standard,
    Volume,
    Bluetooth,
    Microphone
};

enum class RotationDirection {
    Clockwise,
    CounterClockwise
};

struct ButtonEvent {
    QString controlId;
    ButtonPhase phase = ButtonPhase::ShortPress;
};

struct RotationEvent {
    QString controlId;
    RotationDirection direction = RotationDirection::Clockwise;
    int magnitude = 0;

    // Signed detent count, clockwise positive.
    int signedMagnitude() const
    {
        return direction == RotationDirection::Clockwise ? magnitude : -magnitude;
    }
};

enum class BeoError {
    None,
    ConnectionLost,
    MalformedNotification,
    InvalidGroupingTarget,
    NotALeader,
    InvalidParameter,
    RemoteCommandFailed,
    InvalidState
};

struct CommandResult {
    BeoError error = BeoError::None;
    QString detail;
    QJsonObject payload;

    bool ok() const { return error == BeoError::None; }

    static CommandResult success(const QJsonObject &payload = {});
    static CommandResult failure(BeoError error, const QString &detail);
};

// Snapshot of one Beolink session as the local device sees it.
struct BeolinkSession {
    QString leaderJid;
    QStringList listeners;
    std::optional<QString> sourceId;
};

// Milliseconds on the monotonic clock. Press and detent timestamps use it
// so that wall-clock steps never stretch or shrink a hold.
qint64 monotonicMs();

const char *buttonPhaseName(ButtonPhase phase);
const char *beoErrorName(BeoError error);
ControlClass controlClassForId(const QString &controlId);
std::optional<ControlClass> controlClassFromString(const QString &value);

} // namespace phicore::beo

Q_DECLARE_METATYPE(phicore::beo::ButtonEvent)
Q_DECLARE_METATYPE(phicore::beo::RotationEvent)
Q_DECLARE_METATYPE(phicore::beo::BeolinkSession)
