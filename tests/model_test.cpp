#include "beo_model.h"
#include "tests/test_support.h"

#include <string>

using namespace phicore::beo;
namespace v1 = phicore::adapter::v1;

namespace {

const v1::Channel *findChannel(const v1::ChannelList &channels, const std::string &id)
{
    for (const v1::Channel &channel : channels) {
        if (channel.externalId == id)
            return &channel;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Errors map onto command status codes", "[model]") {
    REQUIRE(cmdStatusForError(BeoError::None) == v1::CmdStatus::Success);
    REQUIRE(cmdStatusForError(BeoError::ConnectionLost) == v1::CmdStatus::TemporarilyOffline);
    REQUIRE(cmdStatusForError(BeoError::MalformedNotification) == v1::CmdStatus::InvalidArgument);
    REQUIRE(cmdStatusForError(BeoError::InvalidParameter) == v1::CmdStatus::InvalidArgument);
    REQUIRE(cmdStatusForError(BeoError::InvalidGroupingTarget) == v1::CmdStatus::InvalidArgument);
    REQUIRE(cmdStatusForError(BeoError::NotALeader) == v1::CmdStatus::InvalidArgument);
    REQUIRE(cmdStatusForError(BeoError::RemoteCommandFailed) == v1::CmdStatus::Failure);
    REQUIRE(cmdStatusForError(BeoError::InvalidState) == v1::CmdStatus::Failure);
}

TEST_CASE("Volume channel writes are scaled to the command range", "[model]") {
    v1::CmdStatus status = v1::CmdStatus::Success;
    QString error;

    SECTION("integer percent") {
        const auto command = commandForChannel(QStringLiteral("volume"), v1::ScalarValue(std::int64_t(40)), &status, &error);
        REQUIRE(command.has_value());
        REQUIRE(command->kind == GroupCommandKind::SetVolume);
        REQUIRE(command->parameter.toDouble() == 0.4);
    }

    SECTION("out of range values are clamped") {
        const auto loud = commandForChannel(QStringLiteral("volume"), v1::ScalarValue(250.0), &status, &error);
        REQUIRE(loud.has_value());
        REQUIRE(loud->parameter.toDouble() == 1.0);

        const auto quiet = commandForChannel(QStringLiteral("volume"), v1::ScalarValue(-5.0), &status, &error);
        REQUIRE(quiet.has_value());
        REQUIRE(quiet->parameter.toDouble() == 0.0);
    }

    SECTION("text is rejected") {
        REQUIRE_FALSE(commandForChannel(QStringLiteral("volume"), v1::ScalarValue(std::string("loud")), &status, &error)
                          .has_value());
        REQUIRE(status == v1::CmdStatus::InvalidArgument);
        REQUIRE(error == QStringLiteral("Volume must be numeric"));
    }
}

TEST_CASE("Mute and source writes become local commands", "[model]") {
    v1::CmdStatus status = v1::CmdStatus::Success;
    QString error;

    const auto mute = commandForChannel(QStringLiteral("mute"), v1::ScalarValue(std::string("on")), &status, &error);
    REQUIRE(mute.has_value());
    REQUIRE(mute->kind == GroupCommandKind::Mute);
    REQUIRE(mute->parameter.toBool());

    const auto source = commandForChannel(QStringLiteral("source"), v1::ScalarValue(std::string("spotify")), &status, &error);
    REQUIRE(source.has_value());
    REQUIRE(source->kind == GroupCommandKind::SelectSource);
    REQUIRE(source->parameter.toString() == QStringLiteral("spotify"));

    REQUIRE_FALSE(commandForChannel(QStringLiteral("source"), v1::ScalarValue(std::string()), &status, &error).has_value());
    REQUIRE(status == v1::CmdStatus::InvalidArgument);

    REQUIRE_FALSE(commandForChannel(QStringLiteral("battery"), v1::ScalarValue(std::int64_t(1)), &status, &error).has_value());
    REQUIRE(status == v1::CmdStatus::NotImplemented);
    REQUIRE(error.contains(QStringLiteral("battery")));
}

TEST_CASE("Controls seen at runtime get their own button channel once", "[model]") {
    DeviceConfig config;
    config.serial = QStringLiteral("28961001");
    config.rest.host = QStringLiteral("kitchen.local");
    DeviceEntry entry = buildDeviceEntry(config, fallbackSources());

    REQUIRE(entry.device.externalId == "28961001");
    REQUIRE(findChannel(entry.channels, "button_Preset1") != nullptr);
    REQUIRE(findChannel(entry.channels, "wheel") != nullptr);
    REQUIRE_FALSE(addChannel(&entry.channels, makeButtonChannel(QStringLiteral("Preset1"))));

    const std::size_t before = entry.channels.size();
    REQUIRE(addChannel(&entry.channels, makeButtonChannel(QStringLiteral("remote_Control_Play"))));
    REQUIRE(entry.channels.size() == before + 1);
    REQUIRE_FALSE(addChannel(&entry.channels, makeButtonChannel(QStringLiteral("remote_Control_Play"))));

    const v1::Channel *remote = findChannel(entry.channels, "button_remote_Control_Play");
    REQUIRE(remote != nullptr);
    REQUIRE(remote->kind == v1::ChannelKind::ButtonEvent);
    REQUIRE(remote->choices.size() == 6);
    REQUIRE(remote->choices.front().value == std::to_string(static_cast<int>(ButtonPhase::ShortPress)));
}

TEST_CASE("Connectivity values follow availability", "[model]") {
    REQUIRE(connectivityValue(true) == static_cast<std::int64_t>(v1::ConnectivityStatus::Connected));
    REQUIRE(connectivityValue(false) == static_cast<std::int64_t>(v1::ConnectivityStatus::Disconnected));
}
