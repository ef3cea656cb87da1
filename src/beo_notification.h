#pragma once

#include <optional>
#include <variant>

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "beo_payload.h"
#include "beo_types.h"

namespace phicore::beo {

// Either a raw press/release edge for the classifier, or phases the device
// already classified itself ("longPress (Timer)" and friends).
struct ButtonNotification {
    QString controlId;
    bool pressed = false;
    QList<ButtonPhase> phases;

    bool isClassified() const { return !phases.isEmpty(); }
};

// Signed detent delta, clockwise positive.
struct WheelNotification {
    QString controlId;
    int delta = 0;
};

// Generic "something changed" tag, e.g. {"value": "beolinkListeners"}.
struct DeviceNotification {
    QString value;
};

// A known notification the adapter has no use for.
struct IgnoredNotification {
    QString type;
};

using VolumeChange = VolumeState;

using RawNotification = std::variant<ButtonNotification,
                                     WheelNotification,
                                     SourceChange,
                                     VolumeChange,
                                     PlaybackState,
                                     PlaybackProgress,
                                     PlaybackMetadata,
                                     PlaybackError,
                                     BeolinkChange,
                                     SoftwareUpdateState,
                                     BatteryState,
                                     DeviceNotification,
                                     IgnoredNotification>;

// Order matches the alternatives of RawNotification.
enum class NotificationKind {
    Button,
    Wheel,
    SourceChange,
    Volume,
    PlaybackState,
    PlaybackProgress,
    PlaybackMetadata,
    PlaybackError,
    Beolink,
    SoftwareUpdateState,
    Battery,
    Notification,
    Ignored
};

std::optional<RawNotification> parseNotification(const QByteArray &frame, QString *error = nullptr);
std::optional<RawNotification> parseNotification(const QString &type,
                                                 const QJsonObject &data,
                                                 QString *error = nullptr);

NotificationKind notificationKind(const RawNotification &notification);
const char *notificationKindName(NotificationKind kind);
std::optional<NotificationKind> notificationKindFromType(const QString &type);

} // namespace phicore::beo
