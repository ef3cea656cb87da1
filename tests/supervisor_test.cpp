#include "beo_supervisor.h"
#include "tests/test_support.h"

#include <QHostAddress>
#include <QPointer>
#include <QWebSocket>
#include <QWebSocketServer>

using namespace phicore::beo;
using beo_test::spinEventLoop;
using beo_test::waitUntil;

namespace {

// In-process notification endpoint standing in for the device.
struct FakeDevice {
    QWebSocketServer server{QStringLiteral("beo-test"), QWebSocketServer::NonSecureMode};
    QList<QPointer<QWebSocket>> clients;

    FakeDevice()
    {
        QObject::connect(&server, &QWebSocketServer::newConnection, [this]() {
            while (QWebSocket *client = server.nextPendingConnection())
                clients.append(client);
        });
    }

    bool listen(quint16 port = 0) { return server.listen(QHostAddress::LocalHost, port); }

    QUrl url() const { return QUrl(QStringLiteral("ws://127.0.0.1:%1/").arg(server.serverPort())); }

    QWebSocket *latest() const { return clients.isEmpty() ? nullptr : clients.last().data(); }
};

RetryPolicy fastPolicy()
{
    RetryPolicy policy;
    policy.fastRetryDelayMs = 20;
    policy.fastRetryCount = 3;
    policy.retryIntervalMs = 50;
    policy.connectTimeoutMs = 1000;
    policy.pingIntervalMs = 0;
    return policy;
}

struct SupervisorLog {
    QList<bool> availability;
    QList<QByteArray> frames;
    int lost = 0;
    int stopped = 0;

    explicit SupervisorLog(ConnectionSupervisor &supervisor)
    {
        QObject::connect(&supervisor, &ConnectionSupervisor::availabilityChanged, [this](bool available) {
            availability.append(available);
        });
        QObject::connect(&supervisor, &ConnectionSupervisor::frameReceived, [this](const QByteArray &frame) {
            frames.append(frame);
        });
        QObject::connect(&supervisor, &ConnectionSupervisor::connectionLost, [this]() { ++lost; });
        QObject::connect(&supervisor, &ConnectionSupervisor::stopped, [this]() { ++stopped; });
    }
};

} // namespace

TEST_CASE("supervisor connects and forwards frames", "[supervisor]") {
    FakeDevice device;
    REQUIRE(device.listen());

    ConnectionSupervisor supervisor;
    SupervisorLog log(supervisor);
    supervisor.setDeviceName(QStringLiteral("Kitchen"));
    supervisor.setRetryPolicy(fastPolicy());
    supervisor.setUrl(device.url());
    supervisor.start();

    REQUIRE(waitUntil([&]() { return supervisor.isAvailable() && device.latest(); }));
    REQUIRE(log.availability == QList<bool>{true});

    device.latest()->sendTextMessage(QStringLiteral("{\"eventType\":\"WebSocketEventVolume\"}"));
    REQUIRE(waitUntil([&]() { return log.frames.size() == 1; }));
    REQUIRE(log.frames.first().contains("WebSocketEventVolume"));

    supervisor.stop();
}

TEST_CASE("supervisor reconnects after the device drops the channel", "[supervisor]") {
    FakeDevice device;
    REQUIRE(device.listen());

    ConnectionSupervisor supervisor;
    SupervisorLog log(supervisor);
    supervisor.setRetryPolicy(fastPolicy());
    supervisor.setUrl(device.url());
    supervisor.start();
    REQUIRE(waitUntil([&]() { return supervisor.isAvailable() && device.latest(); }));

    device.latest()->close();
    REQUIRE(waitUntil([&]() { return log.lost == 1; }));
    REQUIRE(waitUntil([&]() { return log.availability.size() == 3; }));

    REQUIRE(log.availability == QList<bool>{true, false, true});
    REQUIRE(supervisor.isAvailable());
    REQUIRE(supervisor.reconnectAttempts() == 0);
    REQUIRE(waitUntil([&]() { return device.clients.size() == 2; }));

    supervisor.stop();
}

TEST_CASE("supervisor keeps retrying while the device is unreachable", "[supervisor]") {
    FakeDevice device;
    REQUIRE(device.listen());
    const quint16 port = device.server.serverPort();
    const QUrl url = device.url();
    device.server.close();

    ConnectionSupervisor supervisor;
    SupervisorLog log(supervisor);
    supervisor.setRetryPolicy(fastPolicy());
    supervisor.setUrl(url);
    supervisor.start();

    REQUIRE(waitUntil([&]() { return supervisor.reconnectAttempts() > fastPolicy().fastRetryCount; }));
    REQUIRE(log.availability.isEmpty());
    REQUIRE(log.lost == 0);

    REQUIRE(device.listen(port));
    REQUIRE(waitUntil([&]() { return supervisor.isAvailable(); }, 3000));
    REQUIRE(log.availability == QList<bool>{true});

    supervisor.stop();
}

TEST_CASE("stop is terminal", "[supervisor]") {
    FakeDevice device;
    REQUIRE(device.listen());

    ConnectionSupervisor supervisor;
    SupervisorLog log(supervisor);
    supervisor.setRetryPolicy(fastPolicy());
    supervisor.setUrl(device.url());
    supervisor.start();
    REQUIRE(waitUntil([&]() { return supervisor.isAvailable(); }));

    supervisor.stop();
    REQUIRE(supervisor.state() == ConnectionState::Stopped);
    REQUIRE(log.stopped == 1);
    REQUIRE(log.lost == 0);
    REQUIRE(log.availability == QList<bool>{true, false});

    supervisor.start();
    supervisor.stop();
    spinEventLoop(150);

    REQUIRE(supervisor.state() == ConnectionState::Stopped);
    REQUIRE(log.stopped == 1);
    REQUIRE(device.clients.size() == 1);
}

TEST_CASE("stop during the reconnect delay cancels the retry", "[supervisor]") {
    FakeDevice device;
    REQUIRE(device.listen());

    ConnectionSupervisor supervisor;
    SupervisorLog log(supervisor);
    RetryPolicy policy = fastPolicy();
    policy.fastRetryDelayMs = 200;
    supervisor.setRetryPolicy(policy);
    supervisor.setUrl(device.url());
    supervisor.start();
    REQUIRE(waitUntil([&]() { return supervisor.isAvailable() && device.latest(); }));

    device.latest()->close();
    REQUIRE(waitUntil([&]() { return log.lost == 1; }));
    supervisor.stop();
    spinEventLoop(400);

    REQUIRE(device.clients.size() == 1);
    REQUIRE(log.availability == QList<bool>{true, false});
    REQUIRE(log.stopped == 1);
}
