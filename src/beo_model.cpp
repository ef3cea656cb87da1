#include "beo_model.h"

#include <algorithm>
#include <string>
#include <utility>

#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::beo {

namespace {

namespace v1 = phicore::adapter::v1;

std::optional<double> scalarAsDouble(const v1::ScalarValue &value)
{
    if (const auto *d = std::get_if<double>(&value))
        return *d;
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return static_cast<double>(*i);
    if (const auto *b = std::get_if<bool>(&value))
        return *b ? 1.0 : 0.0;
    return std::nullopt;
}

std::optional<bool> scalarAsBool(const v1::ScalarValue &value)
{
    if (const auto *b = std::get_if<bool>(&value))
        return *b;
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return *i != 0;
    if (const auto *d = std::get_if<double>(&value))
        return *d != 0.0;
    if (const auto *s = std::get_if<std::string>(&value)) {
        const QString text = QString::fromStdString(*s).trimmed().toLower();
        if (text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("on"))
            return true;
        if (text == QLatin1String("0") || text == QLatin1String("false") || text == QLatin1String("off"))
            return false;
    }
    return std::nullopt;
}

std::optional<GroupCommand> rejectWrite(v1::CmdStatus *status, QString *error, v1::CmdStatus code, const QString &message)
{
    if (status)
        *status = code;
    if (error)
        *error = message;
    return std::nullopt;
}

v1::Channel makeVolumeChannel()
{
    v1::Channel channel;
    channel.externalId = kVolumeChannel;
    channel.name = "Volume";
    channel.kind = v1::ChannelKind::Volume;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.minValue = 0.0;
    channel.maxValue = 100.0;
    channel.stepValue = 1.0;
    channel.unit = "%";
    return channel;
}

v1::Channel makeMuteChannel()
{
    v1::Channel channel;
    channel.externalId = kMuteChannel;
    channel.name = "Mute";
    channel.kind = v1::ChannelKind::Mute;
    channel.dataType = v1::ChannelDataType::Bool;
    channel.flags = v1::kChannelFlagDefaultWrite;
    return channel;
}

v1::Channel makeStringReadChannel(const char *externalId, const char *name)
{
    v1::Channel channel;
    channel.externalId = externalId;
    channel.name = name;
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::String;
    channel.flags = v1::kChannelFlagDefaultRead;
    return channel;
}

v1::Channel makeProgressChannel()
{
    v1::Channel channel;
    channel.externalId = kPlaybackProgressChannel;
    channel.name = "Playback progress";
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.unit = "s";
    return channel;
}

v1::Channel makeBatteryChannel()
{
    v1::Channel channel;
    channel.externalId = kBatteryChannel;
    channel.name = "Battery";
    channel.kind = v1::ChannelKind::Battery;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.minValue = 0.0;
    channel.maxValue = 100.0;
    channel.stepValue = 1.0;
    channel.unit = "%";
    return channel;
}

v1::Channel makeChargingChannel()
{
    v1::Channel channel;
    channel.externalId = kChargingChannel;
    channel.name = "Charging";
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::Bool;
    channel.flags = v1::kChannelFlagDefaultRead;
    return channel;
}

v1::Channel makeSoftwareUpdateChannel()
{
    v1::Channel channel;
    channel.externalId = kSoftwareUpdateChannel;
    channel.name = "Software update";
    channel.kind = v1::ChannelKind::DeviceSoftwareUpdate;
    channel.dataType = v1::ChannelDataType::String;
    channel.flags = v1::kChannelFlagDefaultRead;
    return channel;
}

v1::Channel makeConnectivityChannel()
{
    v1::Channel channel;
    channel.externalId = kConnectivityChannel;
    channel.name = "Connectivity";
    channel.kind = v1::ChannelKind::ConnectivityStatus;
    channel.dataType = v1::ChannelDataType::Enum;
    channel.flags = v1::kChannelFlagDefaultRead;

    auto addChoice = [&channel](v1::ConnectivityStatus status, const char *label) {
        v1::AdapterConfigOption option;
        option.value = std::to_string(static_cast<int>(status));
        option.label = label;
        channel.choices.push_back(std::move(option));
    };
    addChoice(v1::ConnectivityStatus::Unknown, "Unknown");
    addChoice(v1::ConnectivityStatus::Connected, "Connected");
    addChoice(v1::ConnectivityStatus::Disconnected, "Disconnected");

    channel.hasValue = true;
    channel.lastValue = static_cast<std::int64_t>(v1::ConnectivityStatus::Unknown);
    return channel;
}

v1::Channel makeWheelChannel()
{
    v1::Channel channel;
    channel.externalId = kWheelChannel;
    channel.name = "Wheel rotation";
    channel.kind = v1::ChannelKind::RelativeRotation;
    channel.dataType = v1::ChannelDataType::Int;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.hasValue = true;
    channel.lastValue = static_cast<std::int64_t>(0);
    return channel;
}

} // namespace

QStringList defaultButtonControls()
{
    return {
        QStringLiteral("Preset1"),
        QStringLiteral("Preset2"),
        QStringLiteral("Preset3"),
        QStringLiteral("Preset4"),
        QStringLiteral("PlayPause"),
        QStringLiteral("Next"),
        QStringLiteral("Previous"),
        QStringLiteral("Microphone"),
        QStringLiteral("Bluetooth"),
        QStringLiteral("Volume"),
    };
}

QString buttonChannelId(const QString &controlId)
{
    return QStringLiteral("button_") + controlId;
}

v1::Channel makeButtonChannel(const QString &controlId)
{
    v1::Channel channel;
    channel.externalId = buttonChannelId(controlId).toStdString();
    channel.name = QStringLiteral("Button %1").arg(controlId).toStdString();
    channel.kind = v1::ChannelKind::ButtonEvent;
    channel.dataType = v1::ChannelDataType::Enum;
    channel.flags = v1::kChannelFlagDefaultRead;

    QJsonObject meta;
    meta.insert(QStringLiteral("enumName"), QStringLiteral("ButtonPhase"));
    meta.insert(QStringLiteral("control"), controlId);
    channel.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();

    auto addChoice = [&channel](ButtonPhase phase) {
        v1::AdapterConfigOption option;
        option.value = std::to_string(static_cast<int>(phase));
        option.label = buttonPhaseName(phase);
        channel.choices.push_back(std::move(option));
    };
    addChoice(ButtonPhase::ShortPress);
    addChoice(ButtonPhase::ReleaseOfShortPress);
    addChoice(ButtonPhase::LongPress);
    addChoice(ButtonPhase::ReleaseOfLongPress);
    addChoice(ButtonPhase::VeryLongPress);
    addChoice(ButtonPhase::ReleaseOfVeryLongPress);
    return channel;
}

v1::Channel makeSourceChannel(const QList<SourceInfo> &sources)
{
    v1::Channel channel;
    channel.externalId = kSourceChannel;
    channel.name = "Source";
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::String;
    channel.flags = v1::kChannelFlagDefaultWrite;
    for (const SourceInfo &source : sources) {
        if (!source.enabled)
            continue;
        v1::AdapterConfigOption option;
        option.value = source.id.toStdString();
        option.label = (source.name.isEmpty() ? source.id : source.name).toStdString();
        channel.choices.push_back(std::move(option));
    }
    return channel;
}

DeviceEntry buildDeviceEntry(const DeviceConfig &config, const QList<SourceInfo> &sources)
{
    DeviceEntry entry;
    entry.device.externalId = config.externalId().toStdString();
    entry.device.name = config.displayName().toStdString();
    entry.device.deviceClass = v1::DeviceClass::MediaPlayer;
    entry.device.manufacturer = "Bang & Olufsen";
    entry.device.model = config.model.toStdString();

    QJsonObject meta;
    if (!config.jid.isEmpty())
        meta.insert(QStringLiteral("jid"), config.jid);
    if (!config.serial.isEmpty())
        meta.insert(QStringLiteral("serial"), config.serial);
    meta.insert(QStringLiteral("host"), HttpClient::effectiveHost(config.rest));
    entry.device.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();

    entry.channels.push_back(makeVolumeChannel());
    entry.channels.push_back(makeMuteChannel());
    entry.channels.push_back(makeSourceChannel(sources));
    entry.channels.push_back(makeStringReadChannel(kPlaybackStateChannel, "Playback state"));
    entry.channels.push_back(makeProgressChannel());
    entry.channels.push_back(makeBatteryChannel());
    entry.channels.push_back(makeChargingChannel());
    entry.channels.push_back(makeSoftwareUpdateChannel());
    entry.channels.push_back(makeConnectivityChannel());
    entry.channels.push_back(makeStringReadChannel(kBeolinkLeaderChannel, "Beolink leader"));
    entry.channels.push_back(makeStringReadChannel(kBeolinkListenersChannel, "Beolink listeners"));
    entry.channels.push_back(makeWheelChannel());

    const QStringList controls = defaultButtonControls();
    for (const QString &control : controls)
        entry.channels.push_back(makeButtonChannel(control));

    return entry;
}

bool hasChannel(const v1::ChannelList &channels, const QString &channelId)
{
    const std::string id = channelId.toStdString();
    for (const v1::Channel &channel : channels) {
        if (channel.externalId == id)
            return true;
    }
    return false;
}

bool addChannel(v1::ChannelList *channels, v1::Channel channel)
{
    if (!channels || hasChannel(*channels, QString::fromStdString(channel.externalId)))
        return false;
    channels->push_back(std::move(channel));
    return true;
}

std::int64_t connectivityValue(bool available)
{
    return static_cast<std::int64_t>(available ? v1::ConnectivityStatus::Connected
                                               : v1::ConnectivityStatus::Disconnected);
}

v1::CmdStatus cmdStatusForError(BeoError error)
{
    switch (error) {
    case BeoError::None:
        return v1::CmdStatus::Success;
    case BeoError::ConnectionLost:
        return v1::CmdStatus::TemporarilyOffline;
    case BeoError::MalformedNotification:
    case BeoError::InvalidGroupingTarget:
    case BeoError::NotALeader:
    case BeoError::InvalidParameter:
        return v1::CmdStatus::InvalidArgument;
    case BeoError::RemoteCommandFailed:
    case BeoError::InvalidState:
        return v1::CmdStatus::Failure;
    }
    return v1::CmdStatus::Failure;
}

std::optional<GroupCommand> commandForChannel(const QString &channelId,
                                              const v1::ScalarValue &value,
                                              v1::CmdStatus *status,
                                              QString *error)
{
    GroupCommand command;
    if (channelId == QLatin1String(kVolumeChannel)) {
        const auto level = scalarAsDouble(value);
        if (!level.has_value())
            return rejectWrite(status, error, v1::CmdStatus::InvalidArgument, QStringLiteral("Volume must be numeric"));
        command.kind = GroupCommandKind::SetVolume;
        command.parameter = std::clamp(*level, 0.0, 100.0) / 100.0;
    } else if (channelId == QLatin1String(kMuteChannel)) {
        const auto muted = scalarAsBool(value);
        if (!muted.has_value())
            return rejectWrite(status, error, v1::CmdStatus::InvalidArgument, QStringLiteral("Mute must be boolean"));
        command.kind = GroupCommandKind::Mute;
        command.parameter = *muted;
    } else if (channelId == QLatin1String(kSourceChannel)) {
        const auto *source = std::get_if<std::string>(&value);
        if (!source || source->empty())
            return rejectWrite(status, error, v1::CmdStatus::InvalidArgument, QStringLiteral("Source id missing"));
        command.kind = GroupCommandKind::SelectSource;
        command.parameter = QString::fromStdString(*source);
    } else {
        return rejectWrite(status, error, v1::CmdStatus::NotImplemented,
                           QStringLiteral("Channel %1 is not writable").arg(channelId));
    }
    return command;
}

} // namespace phicore::beo
