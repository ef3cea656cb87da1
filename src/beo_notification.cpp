#include "beo_notification.h"

#include <cmath>
#include <cstdlib>

#include <QHash>
#include <QJsonDocument>
#include <QJsonParseError>

namespace phicore::beo {

namespace {

void setError(QString *error, const QString &message)
{
    if (error)
        *error = message;
}

// "WebSocketEventPlaybackState" -> "playback_state"
QString normalizeType(const QString &raw)
{
    QString type = raw.trimmed();
    const QLatin1String prefix("WebSocketEvent");
    if (type.startsWith(prefix))
        type = type.mid(prefix.size());

    QString out;
    out.reserve(type.size() + 4);
    for (int i = 0; i < type.size(); ++i) {
        const QChar c = type.at(i);
        if (c.isUpper()) {
            if (i > 0 && !out.endsWith(QLatin1Char('_')))
                out.append(QLatin1Char('_'));
            out.append(c.toLower());
        } else if (c == QLatin1Char('-')) {
            out.append(QLatin1Char('_'));
        } else {
            out.append(c);
        }
    }
    return out;
}

// States of devices that classify presses on their own. Matched case
// insensitively, e.g. "shortPress (Release)".
std::optional<QList<ButtonPhase>> classifiedPhases(const QString &state)
{
    static const QHash<QString, QList<ButtonPhase>> kStates = {
        {QStringLiteral("shortpress (release)"), {ButtonPhase::ShortPress, ButtonPhase::ReleaseOfShortPress}},
        {QStringLiteral("longpress (timer)"), {ButtonPhase::LongPress}},
        {QStringLiteral("longpress (release)"), {ButtonPhase::ReleaseOfLongPress}},
        {QStringLiteral("verylongpress (timer)"), {ButtonPhase::VeryLongPress}},
        {QStringLiteral("verylongpress (release)"), {ButtonPhase::ReleaseOfVeryLongPress}},
    };
    const auto it = kStates.constFind(state);
    if (it == kStates.constEnd())
        return std::nullopt;
    return it.value();
}

std::optional<ButtonNotification> parseButton(const QJsonObject &data, QString *error)
{
    ButtonNotification out;
    out.controlId = data.value(QStringLiteral("button")).toString().trimmed();
    if (out.controlId.isEmpty())
        out.controlId = data.value(QStringLiteral("id")).toString().trimmed();
    if (out.controlId.isEmpty()) {
        setError(error, QStringLiteral("button event without control id"));
        return std::nullopt;
    }

    const QString state = data.value(QStringLiteral("state")).toString().simplified().toLower();
    if (state == QLatin1String("pressed") || state == QLatin1String("press")) {
        out.pressed = true;
    } else if (state == QLatin1String("released") || state == QLatin1String("release")) {
        out.pressed = false;
    } else if (const auto phases = classifiedPhases(state)) {
        out.phases = *phases;
    } else {
        setError(error, QStringLiteral("button %1 has unknown state '%2'").arg(out.controlId, state));
        return std::nullopt;
    }
    return out;
}

// Beoremote One keys, e.g. {"key": "Control/Play", "type": "KeyPress"}.
// They share the classifier with device buttons as "remote_Control_Play".
std::optional<ButtonNotification> parseRemoteButton(const QJsonObject &data, QString *error)
{
    QString key = data.value(QStringLiteral("key")).toString().trimmed();
    if (key.isEmpty()) {
        setError(error, QStringLiteral("remote button event without key"));
        return std::nullopt;
    }
    key.replace(QLatin1Char('/'), QLatin1Char('_'));

    ButtonNotification out;
    out.controlId = QStringLiteral("remote_") + key;

    const QString type = data.value(QStringLiteral("type")).toString().trimmed();
    if (type.compare(QLatin1String("KeyPress"), Qt::CaseInsensitive) == 0) {
        out.pressed = true;
    } else if (type.compare(QLatin1String("KeyRelease"), Qt::CaseInsensitive) == 0) {
        out.pressed = false;
    } else {
        setError(error, QStringLiteral("remote key %1 has unknown type '%2'").arg(out.controlId, type));
        return std::nullopt;
    }
    return out;
}

std::optional<WheelNotification> parseWheel(const QJsonObject &data, QString *error)
{
    WheelNotification out;
    out.controlId = data.value(QStringLiteral("id")).toString().trimmed();
    if (out.controlId.isEmpty())
        out.controlId = QStringLiteral("wheel");

    const QJsonValue counts = data.value(QStringLiteral("counts"));
    if (counts.isDouble()) {
        out.delta = static_cast<int>(std::lround(counts.toDouble()));
        return out;
    }

    const QString direction = data.value(QStringLiteral("direction")).toString().trimmed().toLower();
    const QJsonValue counter = data.value(QStringLiteral("counter"));
    const int magnitude = counter.isDouble() ? std::abs(counter.toInt()) : 1;
    if (direction == QLatin1String("clockwise")) {
        out.delta = magnitude;
    } else if (direction == QLatin1String("counterclockwise")) {
        out.delta = -magnitude;
    } else {
        setError(error, QStringLiteral("wheel event without counts or direction"));
        return std::nullopt;
    }
    return out;
}

std::optional<DeviceNotification> parseDeviceNotification(const QJsonObject &data, QString *error)
{
    DeviceNotification out;
    out.value = data.value(QStringLiteral("value")).toString().trimmed();
    if (out.value.isEmpty()) {
        setError(error, QStringLiteral("notification without value"));
        return std::nullopt;
    }
    return out;
}

template <typename T>
std::optional<RawNotification> wrap(const std::optional<T> &value)
{
    if (!value)
        return std::nullopt;
    return RawNotification(*value);
}

} // namespace

std::optional<NotificationKind> notificationKindFromType(const QString &type)
{
    static const QHash<QString, NotificationKind> kKinds = {
        {QStringLiteral("button"), NotificationKind::Button},
        {QStringLiteral("beo_remote_button"), NotificationKind::Button},
        {QStringLiteral("wheel"), NotificationKind::Wheel},
        {QStringLiteral("source_change"), NotificationKind::SourceChange},
        {QStringLiteral("playback_source"), NotificationKind::SourceChange},
        {QStringLiteral("volume"), NotificationKind::Volume},
        {QStringLiteral("playback_state"), NotificationKind::PlaybackState},
        {QStringLiteral("playback_progress"), NotificationKind::PlaybackProgress},
        {QStringLiteral("playback_metadata"), NotificationKind::PlaybackMetadata},
        {QStringLiteral("playback_error"), NotificationKind::PlaybackError},
        {QStringLiteral("beolink"), NotificationKind::Beolink},
        {QStringLiteral("beolink_change"), NotificationKind::Beolink},
        {QStringLiteral("software_update_state"), NotificationKind::SoftwareUpdateState},
        {QStringLiteral("battery"), NotificationKind::Battery},
        {QStringLiteral("battery_state"), NotificationKind::Battery},
        {QStringLiteral("notification"), NotificationKind::Notification},
        {QStringLiteral("active_listening_mode"), NotificationKind::Ignored},
        {QStringLiteral("active_speaker_group"), NotificationKind::Ignored},
        {QStringLiteral("power_state"), NotificationKind::Ignored},
    };

    const auto it = kKinds.constFind(normalizeType(type));
    if (it == kKinds.constEnd())
        return std::nullopt;
    return it.value();
}

std::optional<RawNotification> parseNotification(const QString &type, const QJsonObject &data, QString *error)
{
    const auto kind = notificationKindFromType(type);
    if (!kind) {
        setError(error, QStringLiteral("unknown notification type '%1'").arg(type));
        return std::nullopt;
    }

    const QString normalized = normalizeType(type);
    switch (*kind) {
    case NotificationKind::Button:
        if (normalized == QLatin1String("beo_remote_button"))
            return wrap(parseRemoteButton(data, error));
        return wrap(parseButton(data, error));
    case NotificationKind::Wheel:
        return wrap(parseWheel(data, error));
    case NotificationKind::SourceChange:
        return wrap(parseSourceChange(data, error));
    case NotificationKind::Volume:
        return wrap(parseVolumeState(data, error));
    case NotificationKind::PlaybackState:
        return wrap(parsePlaybackState(data, error));
    case NotificationKind::PlaybackProgress:
        return wrap(parsePlaybackProgress(data, error));
    case NotificationKind::PlaybackMetadata:
        return wrap(parsePlaybackMetadata(data, error));
    case NotificationKind::PlaybackError:
        return wrap(parsePlaybackError(data, error));
    case NotificationKind::Beolink:
        return wrap(parseBeolinkChange(data, error));
    case NotificationKind::SoftwareUpdateState:
        return wrap(parseSoftwareUpdateState(data, error));
    case NotificationKind::Battery:
        return wrap(parseBatteryState(data, error));
    case NotificationKind::Notification:
        return wrap(parseDeviceNotification(data, error));
    case NotificationKind::Ignored:
        return RawNotification(IgnoredNotification{normalized});
    }
    return std::nullopt;
}

std::optional<RawNotification> parseNotification(const QByteArray &frame, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(frame, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("invalid JSON: %1").arg(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        setError(error, QStringLiteral("frame is not a JSON object"));
        return std::nullopt;
    }

    const QJsonObject root = doc.object();
    QString type = root.value(QStringLiteral("type")).toString();
    QJsonValue data = root.value(QStringLiteral("data"));
    if (type.isEmpty()) {
        type = root.value(QStringLiteral("eventType")).toString();
        data = root.value(QStringLiteral("eventData"));
    }
    if (type.trimmed().isEmpty()) {
        setError(error, QStringLiteral("frame has no type discriminator"));
        return std::nullopt;
    }
    if (!data.isObject()) {
        setError(error, QStringLiteral("%1 frame has no data object").arg(type));
        return std::nullopt;
    }

    return parseNotification(type, data.toObject(), error);
}

NotificationKind notificationKind(const RawNotification &notification)
{
    return static_cast<NotificationKind>(notification.index());
}

const char *notificationKindName(NotificationKind kind)
{
    switch (kind) {
    case NotificationKind::Button:
        return "button";
    case NotificationKind::Wheel:
        return "wheel";
    case NotificationKind::SourceChange:
        return "source_change";
    case NotificationKind::Volume:
        return "volume";
    case NotificationKind::PlaybackState:
        return "playback_state";
    case NotificationKind::PlaybackProgress:
        return "playback_progress";
    case NotificationKind::PlaybackMetadata:
        return "playback_metadata";
    case NotificationKind::PlaybackError:
        return "playback_error";
    case NotificationKind::Beolink:
        return "beolink";
    case NotificationKind::SoftwareUpdateState:
        return "software_update_state";
    case NotificationKind::Battery:
        return "battery";
    case NotificationKind::Notification:
        return "notification";
    case NotificationKind::Ignored:
        return "ignored";
    }
    return "unknown";
}

} // namespace phicore::beo
