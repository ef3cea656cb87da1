#include "beo_device.h"
#include "tests/test_support.h"

#include <QElapsedTimer>
#include <QHostAddress>
#include <QPointer>
#include <QTcpServer>
#include <QWebSocket>
#include <QWebSocketServer>

using namespace phicore::beo;
using beo_test::spinEventLoop;
using beo_test::waitUntil;

namespace {

// A port nothing listens on, so REST calls fail fast with "connection refused".
quint16 closedPort()
{
    QTcpServer listener;
    if (!listener.listen(QHostAddress::LocalHost, 0))
        return 1;
    const quint16 port = listener.serverPort();
    listener.close();
    return port;
}

QString buttonFrame(const QString &control, const char *state)
{
    return QStringLiteral("{\"type\":\"button\",\"data\":{\"button\":\"%1\",\"state\":\"%2\"}}")
        .arg(control, QString::fromLatin1(state));
}

struct DeviceHarness {
    QWebSocketServer server{QStringLiteral("beo-device"), QWebSocketServer::NonSecureMode};
    QList<QPointer<QWebSocket>> clients;
    DeviceDirectory directory;
    AdapterConfig adapterConfig;
    DeviceConfig config;

    QList<bool> availability;
    QList<ButtonEvent> buttons;
    QList<int> wheel;

    DeviceHarness()
    {
        QObject::connect(&server, &QWebSocketServer::newConnection, [this]() {
            while (QWebSocket *client = server.nextPendingConnection())
                clients.append(client);
        });
        server.listen(QHostAddress::LocalHost, 0);

        adapterConfig.pressTimings.fill(PressTimings{100, 150});
        adapterConfig.requestTimeoutMs = 500;
        adapterConfig.retry.fastRetryDelayMs = 20;
        adapterConfig.retry.pingIntervalMs = 0;

        config.name = QStringLiteral("Living room");
        config.rest.host = QStringLiteral("127.0.0.1");
        config.rest.port = closedPort();
        config.notificationPort = server.serverPort();
    }

    void watch(BeoDevice &device)
    {
        QObject::connect(&device, &BeoDevice::availabilityChanged, [this](bool available) {
            availability.append(available);
        });
        QObject::connect(&device, &BeoDevice::buttonEvent, [this](const ButtonEvent &event) {
            buttons.append(event);
        });
        QObject::connect(&device, &BeoDevice::wheelValueChanged, [this](int value) {
            wheel.append(value);
        });
    }

    QWebSocket *latest() const { return clients.isEmpty() ? nullptr : clients.last().data(); }
};

} // namespace

TEST_CASE("device classifies buttons arriving on the notification channel", "[device]") {
    DeviceHarness harness;
    REQUIRE(harness.server.isListening());

    BeoDevice device(harness.config, harness.adapterConfig, harness.directory);
    harness.watch(device);
    device.start();
    REQUIRE(waitUntil([&]() { return device.isAvailable() && harness.latest(); }));

    harness.latest()->sendTextMessage(buttonFrame(QStringLiteral("Preset1"), "pressed"));
    harness.latest()->sendTextMessage(buttonFrame(QStringLiteral("Preset1"), "released"));
    REQUIRE(waitUntil([&]() { return harness.buttons.size() == 2; }));

    REQUIRE(harness.buttons.at(0).controlId == QStringLiteral("Preset1"));
    REQUIRE(harness.buttons.at(0).phase == ButtonPhase::ShortPress);
    REQUIRE(harness.buttons.at(1).phase == ButtonPhase::ReleaseOfShortPress);

    device.stop();
}

TEST_CASE("device forwards presses the device classified itself", "[device]") {
    DeviceHarness harness;
    REQUIRE(harness.server.isListening());

    BeoDevice device(harness.config, harness.adapterConfig, harness.directory);
    harness.watch(device);
    device.start();
    REQUIRE(waitUntil([&]() { return device.isAvailable() && harness.latest(); }));

    harness.latest()->sendTextMessage(buttonFrame(QStringLiteral("PlayPause"), "shortPress (Release)"));
    harness.latest()->sendTextMessage(buttonFrame(QStringLiteral("Preset2"), "longPress (Timer)"));
    harness.latest()->sendTextMessage(buttonFrame(QStringLiteral("Preset2"), "longPress (Release)"));
    REQUIRE(waitUntil([&]() { return harness.buttons.size() == 4; }));

    REQUIRE(harness.buttons.at(0).controlId == QStringLiteral("PlayPause"));
    REQUIRE(harness.buttons.at(0).phase == ButtonPhase::ShortPress);
    REQUIRE(harness.buttons.at(1).phase == ButtonPhase::ReleaseOfShortPress);
    REQUIRE(harness.buttons.at(2).controlId == QStringLiteral("Preset2"));
    REQUIRE(harness.buttons.at(2).phase == ButtonPhase::LongPress);
    REQUIRE(harness.buttons.at(3).phase == ButtonPhase::ReleaseOfLongPress);
    REQUIRE_FALSE(device.classifier().isHeld(QStringLiteral("Preset2")));

    device.stop();
}

TEST_CASE("wheel value shows the settled rotation and falls back to zero", "[device]") {
    DeviceHarness harness;
    REQUIRE(harness.server.isListening());

    harness.adapterConfig.wheelQuietMs = 50;
    BeoDevice device(harness.config, harness.adapterConfig, harness.directory);
    harness.watch(device);
    device.start();
    REQUIRE(waitUntil([&]() { return device.isAvailable() && harness.latest(); }));

    harness.latest()->sendTextMessage(QStringLiteral(R"({"type":"wheel","data":{"counts":2}})"));
    harness.latest()->sendTextMessage(QStringLiteral(R"({"type":"wheel","data":{"counts":1}})"));
    REQUIRE(waitUntil([&]() { return harness.wheel.size() == 1; }));
    REQUIRE(harness.wheel.first() == 3);

    QElapsedTimer sinceRotation;
    sinceRotation.start();
    REQUIRE(waitUntil([&]() { return harness.wheel.size() == 2; }));
    REQUIRE(sinceRotation.elapsed() >= kWheelResetMs - 50);
    REQUIRE(harness.wheel == QList<int>{3, 0});

    device.stop();
}

TEST_CASE("a dropped channel cancels held presses and reconnects once", "[device]") {
    DeviceHarness harness;
    REQUIRE(harness.server.isListening());

    harness.adapterConfig.pressTimings.fill(PressTimings{300, 300});
    BeoDevice device(harness.config, harness.adapterConfig, harness.directory);
    harness.watch(device);
    device.start();
    REQUIRE(waitUntil([&]() { return device.isAvailable() && harness.latest(); }));

    harness.latest()->sendTextMessage(buttonFrame(QStringLiteral("Volume"), "pressed"));
    REQUIRE(waitUntil([&]() { return device.classifier().isHeld(QStringLiteral("Volume")); }));

    harness.latest()->close();
    REQUIRE(waitUntil([&]() { return harness.availability.size() == 3; }));
    REQUIRE(harness.availability == QList<bool>{true, false, true});
    REQUIRE_FALSE(device.classifier().isHeld(QStringLiteral("Volume")));

    // Well past the long and very long thresholds of the held press.
    spinEventLoop(800);
    REQUIRE(harness.buttons.isEmpty());
    REQUIRE(harness.availability.size() == 3);

    device.stop();
}

TEST_CASE("stopping a device closes the channel for good", "[device]") {
    DeviceHarness harness;
    REQUIRE(harness.server.isListening());

    BeoDevice device(harness.config, harness.adapterConfig, harness.directory);
    harness.watch(device);
    device.start();
    REQUIRE(waitUntil([&]() { return device.isAvailable(); }));

    device.stop();
    REQUIRE_FALSE(device.isAvailable());
    REQUIRE(device.supervisor().state() == ConnectionState::Stopped);

    spinEventLoop(150);
    REQUIRE(harness.availability == QList<bool>{true, false});
    REQUIRE(harness.clients.size() == 1);
}
