#include "beo_types.h"

#include <QDeadlineTimer>

namespace phicore::beo {

CommandResult CommandResult::success(const QJsonObject &payload)
{
    CommandResult result;
    result.payload = payload;
    return result;
}

CommandResult CommandResult::failure(BeoError error, const QString &detail)
{
    CommandResult result;
    result.error = error;
    result.detail = detail;
    return result;
}

qint64 monotonicMs()
{
    return QDeadlineTimer::current().deadline();
}

const char *buttonPhaseName(ButtonPhase phase)
{
    switch (phase) {
    case ButtonPhase::ShortPress:
        return "shortPress";
    case ButtonPhase::ReleaseOfShortPress:
        return "shortPressRelease";
    case ButtonPhase::LongPress:
        return "longPress";
    case ButtonPhase::ReleaseOfLongPress:
        return "longPressRelease";
    case ButtonPhase::VeryLongPress:
        return "veryLongPress";
    case ButtonPhase::ReleaseOfVeryLongPress:
        return "veryLongPressRelease";
    }
    return "unknown";
}

const char *beoErrorName(BeoError error)
{
    switch (error) {
    case BeoError::None:
        return "none";
    case BeoError::ConnectionLost:
        return "connectionLost";
    case BeoError::MalformedNotification:
        return "malformedNotification";
    case BeoError::InvalidGroupingTarget:
        return "invalidGroupingTarget";
    case BeoError::NotALeader:
        return "notALeader";
    case BeoError::InvalidParameter:
        return "invalidParameter";
    case BeoError::RemoteCommandFailed:
        return "remoteCommandFailed";
    case BeoError::InvalidState:
        return "invalidState";
    }
    return "unknown";
}

ControlClass controlClassForId(const QString &controlId)
{
    const QString id = controlId.trimmed().toLower();
    if (id == QLatin1String("volume"))
        return ControlClass::Volume;
    if (id == QLatin1String("bluetooth"))
        return ControlClass::Bluetooth;
    if (id == QLatin1String("microphone"))
        return ControlClass::Microphone;
    return ControlClass::Standard;
}

std::optional<ControlClass> controlClassFromString(const QString &value)
{
    const QString key = value.trimmed().toLower();
    if (key == QLatin1String("standard"))
        return ControlClass::Standard;
    if (key == QLatin1String("volume"))
        return ControlClass::Volume;
    if (key == QLatin1String("bluetooth"))
        return ControlClass::Bluetooth;
    if (key == QLatin1String("microphone"))
        return ControlClass::Microphone;
    return std::nullopt;
}

} // namespace phicore::beo
