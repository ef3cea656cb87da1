#pragma once

#include <cstdint>
#include <optional>

#include <QList>
#include <QString>
#include <QStringList>

#include "beo_config.h"
#include "beo_group.h"
#include "beo_payload.h"
#include "beo_types.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::beo {

inline constexpr const char kVolumeChannel[] = "volume";
inline constexpr const char kMuteChannel[] = "mute";
inline constexpr const char kSourceChannel[] = "source";
inline constexpr const char kPlaybackStateChannel[] = "playback_state";
inline constexpr const char kPlaybackProgressChannel[] = "playback_progress";
inline constexpr const char kBatteryChannel[] = "battery";
inline constexpr const char kChargingChannel[] = "charging";
inline constexpr const char kSoftwareUpdateChannel[] = "software_update";
inline constexpr const char kConnectivityChannel[] = "connectivity";
inline constexpr const char kBeolinkLeaderChannel[] = "beolink_leader";
inline constexpr const char kBeolinkListenersChannel[] = "beolink_listeners";
inline constexpr const char kWheelChannel[] = "wheel";

struct DeviceEntry {
    phicore::adapter::v1::Device device;
    phicore::adapter::v1::ChannelList channels;
};

// Controls a Mozart product is known to report; anything else is added on
// first sight.
QStringList defaultButtonControls();

QString buttonChannelId(const QString &controlId);

DeviceEntry buildDeviceEntry(const DeviceConfig &config, const QList<SourceInfo> &sources);

phicore::adapter::v1::Channel makeButtonChannel(const QString &controlId);
phicore::adapter::v1::Channel makeSourceChannel(const QList<SourceInfo> &sources);

// Returns false when a channel with the same id already exists.
bool addChannel(phicore::adapter::v1::ChannelList *channels, phicore::adapter::v1::Channel channel);
bool hasChannel(const phicore::adapter::v1::ChannelList &channels, const QString &channelId);

std::int64_t connectivityValue(bool available);

phicore::adapter::v1::CmdStatus cmdStatusForError(BeoError error);

// Translates a write to a device channel into the local command behind it.
// The volume channel is 0..100, commands take 0.0..1.0.
std::optional<GroupCommand> commandForChannel(const QString &channelId,
                                              const phicore::adapter::v1::ScalarValue &value,
                                              phicore::adapter::v1::CmdStatus *status,
                                              QString *error);

} // namespace phicore::beo
