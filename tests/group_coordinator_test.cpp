#include "beo_group.h"
#include "tests/test_support.h"

#include <QJsonDocument>

using namespace phicore::beo;
using beo_test::FakeHttpClient;
using beo_test::RecordedRequest;

namespace {

const QString kJidA = QStringLiteral("1200.1200298.28961001@products.bang-olufsen.com");
const QString kJidB = QStringLiteral("1200.1200298.28961002@products.bang-olufsen.com");
const QString kJidC = QStringLiteral("1200.1200298.28961003@products.bang-olufsen.com");
const QString kHostA = QStringLiteral("a.local");
const QString kHostB = QStringLiteral("b.local");
const QString kHostC = QStringLiteral("c.local");

ConnectionSettings address(const QString &host)
{
    ConnectionSettings settings;
    settings.host = host;
    settings.port = 80;
    return settings;
}

QString hostOf(const QString &jid)
{
    if (jid == kJidA)
        return kHostA;
    if (jid == kJidB)
        return kHostB;
    return kHostC;
}

DeviceDirectory makeDirectory(bool includeC)
{
    DeviceDirectory directory;
    directory.add(kJidA, address(kHostA));
    directory.add(kJidB, address(kHostB));
    if (includeC)
        directory.add(kJidC, address(kHostC));
    return directory;
}

// One coordinator for `self`, with every request going through the fake.
struct Group {
    FakeHttpClient http;
    MozartApi api;
    DeviceDirectory directory;
    GroupCoordinator coordinator;
    QList<BeolinkSession> sessions;

    explicit Group(const QString &self = kJidA, bool includeC = true)
        : api(http)
        , directory(makeDirectory(includeC))
        , coordinator(self, address(hostOf(self)), directory, api)
    {
        QObject::connect(&coordinator, &GroupCoordinator::topologyChanged, [this](const BeolinkSession &session) {
            sessions.append(session);
        });
    }

    void listenTo(const QString &leader)
    {
        BeolinkChange change;
        change.leaderJid = leader;
        coordinator.applyBeolinkChange(change);
    }

    void lead(const QStringList &listeners)
    {
        BeolinkChange change;
        change.leaderJid = coordinator.selfJid();
        change.listeners = listeners;
        coordinator.applyBeolinkChange(change);
    }
};

QString expandPath(const QString &jid)
{
    return QStringLiteral("/api/v1/beolink/expand/%1").arg(jid);
}

QString unexpandPath(const QString &jid)
{
    return QStringLiteral("/api/v1/beolink/unexpand/%1").arg(jid);
}

QStringList listenersOf(const GroupCoordinator &coordinator)
{
    return coordinator.session().listeners;
}

} // namespace

TEST_CASE("expand then unexpand tracks the listener set", "[group]") {
    Group group;

    const CommandResult expanded = group.coordinator.expand({kJidB, kJidC});
    REQUIRE(expanded.ok());
    REQUIRE(group.coordinator.isLeader());
    REQUIRE(listenersOf(group.coordinator) == QStringList{kJidB, kJidC});
    REQUIRE(group.http.sent(kHostA, "POST", expandPath(kJidB)));
    REQUIRE(group.http.sent(kHostA, "POST", expandPath(kJidC)));

    REQUIRE(group.coordinator.unexpand({kJidB}).ok());
    REQUIRE(group.http.sent(kHostA, "POST", unexpandPath(kJidB)));
    REQUIRE(listenersOf(group.coordinator) == QStringList{kJidC});
    REQUIRE(group.coordinator.session().leaderJid == kJidA);

    REQUIRE(group.coordinator.unexpand({kJidC}).ok());
    REQUIRE(group.coordinator.isStandalone());
    REQUIRE(group.coordinator.session().leaderJid.isEmpty());

    REQUIRE(group.sessions.size() == 3);
    REQUIRE(group.coordinator.membershipPhase() == MembershipPhase::Idle);
}

TEST_CASE("expanding to an existing listener does not call the device again", "[group]") {
    Group group;
    group.lead({kJidB});
    group.http.clearRequests();

    const CommandResult result = group.coordinator.expand({kJidB});
    REQUIRE(result.ok());
    REQUIRE(group.http.requests().isEmpty());
    REQUIRE(result.payload.value(QStringLiteral("targets")).toObject().value(kJidB).toObject().value(QStringLiteral("ok")).toBool());
}

TEST_CASE("a listener cannot expand or unexpand", "[group]") {
    Group group(kJidB);
    group.listenTo(kJidA);
    REQUIRE(group.coordinator.isListener());

    REQUIRE(group.coordinator.expand({kJidC}).error == BeoError::NotALeader);
    REQUIRE(group.coordinator.unexpand({kJidC}).error == BeoError::NotALeader);
    REQUIRE(group.http.requests().isEmpty());
}

TEST_CASE("expanding to itself is an invalid grouping target", "[group]") {
    Group group;

    const CommandResult result = group.coordinator.expand({kJidA});
    REQUIRE(result.error == BeoError::InvalidGroupingTarget);
    REQUIRE(group.coordinator.isStandalone());
    REQUIRE(group.http.requests().isEmpty());
}

TEST_CASE("expanding requires active playback on a shareable source", "[group]") {
    Group group;

    SECTION("paused") {
        group.coordinator.setPlaybackState(PlaybackState{QStringLiteral("paused")});
        REQUIRE(group.coordinator.expand({kJidB}).error == BeoError::InvalidState);
    }

    SECTION("source without multiroom") {
        group.coordinator.setPlaybackState(PlaybackState{QStringLiteral("started")});
        SourceChange source;
        source.id = QStringLiteral("lineIn");
        source.multiroomAvailable = false;
        group.coordinator.setCurrentSource(source);
        REQUIRE(group.coordinator.expand({kJidB}).error == BeoError::InvalidState);
    }

    REQUIRE(group.http.requests().isEmpty());
    REQUIRE(group.coordinator.isStandalone());
}

TEST_CASE("a failed expand leaves the cached topology untouched", "[group]") {
    Group group;
    group.http.fail(kHostA, "POST", expandPath(kJidB), 500,
                    beo_test::json(QJsonObject{{QStringLiteral("message"), QStringLiteral("device busy")}}));

    const CommandResult result = group.coordinator.expand({kJidB});
    REQUIRE(result.error == BeoError::RemoteCommandFailed);
    REQUIRE(result.detail.contains(QStringLiteral("device busy")));
    REQUIRE(group.coordinator.isStandalone());
    REQUIRE(group.sessions.isEmpty());
}

TEST_CASE("a notification during an expand wins over the optimistic update", "[group]") {
    Group group;
    bool injected = false;
    group.http.onSend([&group, &injected](const RecordedRequest &request) {
        if (injected || request.path != expandPath(kJidB))
            return;
        injected = true;
        BeolinkChange change;
        change.leaderJid = kJidA;
        change.listeners = {kJidC};
        group.coordinator.applyBeolinkChange(change);
    });

    REQUIRE(group.coordinator.expand({kJidB}).ok());
    REQUIRE(injected);
    REQUIRE(listenersOf(group.coordinator) == QStringList{kJidC});
}

TEST_CASE("membership changes are rejected while one is in flight", "[group]") {
    Group group;
    CommandResult nested;
    group.http.onSend([&group, &nested](const RecordedRequest &request) {
        if (request.path == expandPath(kJidB))
            nested = group.coordinator.unexpand({kJidC});
    });

    REQUIRE(group.coordinator.expand({kJidB}).ok());
    REQUIRE(nested.error == BeoError::InvalidState);
    REQUIRE(group.coordinator.membershipPhase() == MembershipPhase::Idle);
}

TEST_CASE("device notifications are authoritative", "[group]") {
    Group group(kJidB);

    SECTION("leader notification") {
        group.listenTo(kJidA);
        REQUIRE(group.coordinator.isListener());
        REQUIRE(group.coordinator.session().leaderJid == kJidA);
    }

    SECTION("own JID is dropped from the listener list") {
        group.lead({kJidB, kJidC});
        REQUIRE(listenersOf(group.coordinator) == QStringList{kJidC});
    }

    SECTION("metadata names a remote leader and later none") {
        PlaybackMetadata metadata;
        metadata.remoteLeader = BeolinkPeer{kJidA, QStringLiteral("Kitchen")};
        group.coordinator.applyPlaybackMetadata(metadata);
        REQUIRE(group.coordinator.isListener());

        group.coordinator.applyPlaybackMetadata(PlaybackMetadata{});
        REQUIRE(group.coordinator.isStandalone());
    }

    SECTION("source id is kept with the session") {
        BeolinkChange change;
        change.leaderJid = kJidA;
        change.sourceId = QStringLiteral("spotify");
        group.coordinator.applyBeolinkChange(change);
        REQUIRE(group.coordinator.session().sourceId == QStringLiteral("spotify"));
    }
}

TEST_CASE("join checks the target before calling the device", "[group]") {
    Group group(kJidB);

    SECTION("itself") {
        REQUIRE(group.coordinator.join(kJidB).error == BeoError::InvalidGroupingTarget);
        REQUIRE(group.http.requests().isEmpty());
    }

    SECTION("unknown peer") {
        const QString stranger = QStringLiteral("1200.1200298.99999999@products.bang-olufsen.com");
        REQUIRE(group.coordinator.join(stranger).error == BeoError::InvalidGroupingTarget);
        REQUIRE(group.http.sent(kHostB, "GET", QStringLiteral("/api/v1/beolink/peers")));
        REQUIRE(group.http.requests().size() == 1);
    }

    SECTION("peer discovered by the device") {
        const QString remote = QStringLiteral("1200.1200298.77777777@products.bang-olufsen.com");
        group.http.respond(kHostB, "GET", QStringLiteral("/api/v1/beolink/peers"),
                           beo_test::json(QJsonArray{QJsonObject{{QStringLiteral("jid"), remote},
                                                                 {QStringLiteral("friendlyName"), QStringLiteral("Den")}}}));
        REQUIRE(group.coordinator.join(remote).ok());
        REQUIRE(group.coordinator.peers().size() == 1);
        REQUIRE(group.coordinator.session().leaderJid == remote);
    }

    SECTION("configured peer with a source") {
        REQUIRE(group.coordinator.join(kJidA, QStringLiteral("spotify")).ok());
        REQUIRE(group.http.sent(kHostB, "POST", QStringLiteral("/api/v1/beolink/join/%1?source=SPOTIFY").arg(kJidA)));
        REQUIRE(group.coordinator.isListener());
    }

    SECTION("latest experience") {
        REQUIRE(group.coordinator.join().ok());
        REQUIRE(group.http.sent(kHostB, "POST", QStringLiteral("/api/v1/beolink/join")));
        REQUIRE(group.coordinator.isStandalone());
    }
}

TEST_CASE("leave only calls the device when listening", "[group]") {
    Group group(kJidB);

    const CommandResult idle = group.coordinator.leave();
    REQUIRE(idle.ok());
    REQUIRE_FALSE(idle.payload.value(QStringLiteral("changed")).toBool());
    REQUIRE(group.http.requests().isEmpty());

    group.listenTo(kJidA);
    const CommandResult left = group.coordinator.leave();
    REQUIRE(left.ok());
    REQUIRE(left.payload.value(QStringLiteral("changed")).toBool());
    REQUIRE(group.http.sent(kHostB, "POST", QStringLiteral("/api/v1/beolink/leave")));
    REQUIRE(group.coordinator.isStandalone());
}

TEST_CASE("leader commands from a listener go to the leader", "[group]") {
    Group group(kJidB);
    group.listenTo(kJidA);

    const CommandResult result = group.coordinator.leaderCommand(QStringLiteral("set_volume_level"), 0.4);
    REQUIRE(result.ok());
    REQUIRE(result.payload.value(QStringLiteral("target")).toString() == kJidA);
    REQUIRE(group.http.requestsTo(kHostB).isEmpty());

    const QList<RecordedRequest> sent = group.http.requestsTo(kHostA);
    REQUIRE(sent.size() == 2);
    REQUIRE(sent.at(0).method == "GET");
    REQUIRE(sent.at(0).path == QStringLiteral("/api/v1/playback/volume"));
    REQUIRE(sent.at(1).method == "POST");
    REQUIRE(sent.at(1).path == QStringLiteral("/api/v1/playback/volume/level"));
    REQUIRE(QJsonDocument::fromJson(sent.at(1).payload).object().value(QStringLiteral("level")).toInt() == 40);
}

TEST_CASE("leader commands without a session run locally", "[group]") {
    Group group;

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("media_next_track")).ok());
    REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/playback/command?command=skip")));
}

TEST_CASE("leader command to a leader without an address fails", "[group]") {
    Group group(kJidB, false);
    group.listenTo(kJidC);

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("media_play")).error == BeoError::InvalidGroupingTarget);
    REQUIRE(group.http.requests().isEmpty());
}

TEST_CASE("leader command parameters are validated first", "[group]") {
    Group group(kJidB);
    group.listenTo(kJidA);

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("select_source")).error == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("select_source"), QStringLiteral("cassette")).error
            == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("mute_volume"), QStringLiteral("yes")).error
            == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("set_volume_level"), 1.5).error == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("set_relative_volume_level"), -2.0).error
            == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("media_seek"), -1.0).error == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("media_play"), true).error == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("rewind")).error == BeoError::InvalidParameter);
    REQUIRE(group.http.requests().isEmpty());
}

TEST_CASE("leader commands map onto the playback API", "[group]") {
    Group group;

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("media_seek"), QStringLiteral("12.5")).ok());
    REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/playback/command/seek?positionMs=12500")));

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("select_source"), QStringLiteral("spotify")).ok());
    REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/playback/sources/active/spotify")));

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("mute_volume"), true).ok());
    REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/playback/volume/mute")));

    group.coordinator.setPlaybackState(PlaybackState{QStringLiteral("started")});
    group.http.clearRequests();
    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("media_play_pause")).ok());
    REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/playback/command?command=pause")));

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("toggle")).ok());
    REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/power/standby")));
}

TEST_CASE("volume is capped at the device maximum", "[group]") {
    Group group;
    group.http.respond(kHostA, "GET", QStringLiteral("/api/v1/playback/volume"),
                       beo_test::json(QJsonObject{
                           {QStringLiteral("level"), QJsonObject{{QStringLiteral("level"), 30}}},
                           {QStringLiteral("maximum"), QJsonObject{{QStringLiteral("level"), 60}}},
                       }));

    SECTION("absolute") {
        REQUIRE(group.coordinator.leaderCommand(QStringLiteral("set_volume_level"), 0.9).ok());
    }

    SECTION("relative") {
        REQUIRE(group.coordinator.leaderCommand(QStringLiteral("set_relative_volume_level"), 0.5).ok());
    }

    const QList<RecordedRequest> sent = group.http.requestsTo(kHostA);
    REQUIRE(sent.size() == 2);
    REQUIRE(QJsonDocument::fromJson(sent.last().payload).object().value(QStringLiteral("level")).toInt() == 60);
}

TEST_CASE("volume up steps from the current level", "[group]") {
    Group group;
    group.http.respond(kHostA, "GET", QStringLiteral("/api/v1/playback/volume"),
                       beo_test::json(QJsonObject{{QStringLiteral("level"), QJsonObject{{QStringLiteral("level"), 25}}}}));

    REQUIRE(group.coordinator.leaderCommand(QStringLiteral("volume_up")).ok());
    const RecordedRequest last = group.http.requests().last();
    REQUIRE(last.path == QStringLiteral("/api/v1/playback/volume/level"));
    REQUIRE(QJsonDocument::fromJson(last.payload).object().value(QStringLiteral("level")).toInt() == 35);
}

TEST_CASE("all standby asks the device to put its whole session into standby", "[group]") {
    SECTION("leader with a listener outside the directory") {
        Group group(kJidA, false);
        group.lead({kJidB, kJidC});

        REQUIRE(group.coordinator.allStandby().ok());
        REQUIRE(group.http.requests().size() == 1);
        REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/beolink/allstandby")));
    }

    SECTION("listener of a leader outside the directory") {
        Group group(kJidB, false);
        group.listenTo(kJidC);

        REQUIRE(group.coordinator.allStandby().ok());
        REQUIRE(group.http.requests().size() == 1);
        REQUIRE(group.http.sent(kHostB, "POST", QStringLiteral("/api/v1/beolink/allstandby")));
    }

    SECTION("device error") {
        Group group;
        group.http.fail(kHostA, "POST", QStringLiteral("/api/v1/beolink/allstandby"), 500,
                        beo_test::json(QJsonObject{{QStringLiteral("message"), QStringLiteral("busy")}}));

        const CommandResult result = group.coordinator.allStandby();
        REQUIRE(result.error == BeoError::RemoteCommandFailed);
        REQUIRE(result.detail.contains(QStringLiteral("busy")));
    }
}

TEST_CASE("session volume fails when a member has no known address", "[group]") {
    SECTION("listener outside the directory") {
        Group group(kJidA, false);
        group.lead({kJidB, kJidC});

        const CommandResult result = group.coordinator.setVolume(0.5);
        REQUIRE(result.error == BeoError::RemoteCommandFailed);
        REQUIRE(result.detail.contains(kJidC));
        REQUIRE(result.payload.value(QStringLiteral("unresolved")).toArray() == QJsonArray{kJidC});
        REQUIRE(group.http.sent(kHostB, "POST", QStringLiteral("/api/v1/playback/volume/level")));
    }

    SECTION("leader outside the directory") {
        Group group(kJidB, false);
        group.listenTo(kJidC);

        const CommandResult result = group.coordinator.setRelativeVolume(0.1);
        REQUIRE(result.error == BeoError::RemoteCommandFailed);
        REQUIRE(result.payload.value(QStringLiteral("unresolved")).toArray() == QJsonArray{kJidC});
    }

    SECTION("leader's listeners cannot be read") {
        Group group(kJidB);
        group.listenTo(kJidA);
        group.http.fail(kHostA, "GET", QStringLiteral("/api/v1/beolink/listeners"), 503);

        const CommandResult result = group.coordinator.setVolume(0.5);
        REQUIRE(result.error == BeoError::RemoteCommandFailed);
        REQUIRE(group.http.requests().size() == 1);
    }
}

TEST_CASE("session volume from a listener includes the leader's listeners", "[group]") {
    Group group(kJidB);
    group.listenTo(kJidA);
    group.http.respond(kHostA, "GET", QStringLiteral("/api/v1/beolink/listeners"),
                       beo_test::json(QJsonArray{QJsonObject{{QStringLiteral("jid"), kJidB}},
                                                 QJsonObject{{QStringLiteral("jid"), kJidC}}}));

    REQUIRE(group.coordinator.setVolume(0.5).ok());
    REQUIRE(group.http.sent(kHostA, "POST", QStringLiteral("/api/v1/playback/volume/level")));
    REQUIRE(group.http.sent(kHostB, "POST", QStringLiteral("/api/v1/playback/volume/level")));
    REQUIRE(group.http.sent(kHostC, "POST", QStringLiteral("/api/v1/playback/volume/level")));
}

TEST_CASE("session fan-out reports the first member failure", "[group]") {
    Group group;
    group.lead({kJidB});
    group.http.fail(kHostB, "POST", QStringLiteral("/api/v1/playback/volume/level"), 503);

    const CommandResult result = group.coordinator.setVolume(0.3);
    REQUIRE(result.error == BeoError::RemoteCommandFailed);
    REQUIRE(result.detail.startsWith(kJidB));
    const QJsonObject targets = result.payload.value(QStringLiteral("targets")).toObject();
    REQUIRE(targets.value(kJidA).toObject().value(QStringLiteral("ok")).toBool());
    REQUIRE_FALSE(targets.value(kJidB).toObject().value(QStringLiteral("ok")).toBool());
}

TEST_CASE("session volume rejects levels out of range", "[group]") {
    Group group;
    REQUIRE(group.coordinator.setVolume(1.2).error == BeoError::InvalidParameter);
    REQUIRE(group.coordinator.setRelativeVolume(-1.5).error == BeoError::InvalidParameter);
    REQUIRE(group.http.requests().isEmpty());
}

TEST_CASE("topology refresh reads listeners and metadata", "[group]") {
    Group group;

    SECTION("leader") {
        group.http.respond(kHostA, "GET", QStringLiteral("/api/v1/beolink/listeners"),
                           beo_test::json(QJsonArray{QJsonObject{{QStringLiteral("jid"), kJidB}}}));
        REQUIRE(group.coordinator.refreshTopology());
        REQUIRE(listenersOf(group.coordinator) == QStringList{kJidB});
    }

    SECTION("listener") {
        group.http.respond(kHostA, "GET", QStringLiteral("/api/v1/playback/metadata"),
                           beo_test::json(QJsonObject{{QStringLiteral("remoteLeader"),
                                                       QJsonObject{{QStringLiteral("jid"), kJidC},
                                                                   {QStringLiteral("friendlyName"), QStringLiteral("Hall")}}}}));
        REQUIRE(group.coordinator.refreshTopology());
        REQUIRE(group.coordinator.session().leaderJid == kJidC);
    }

    SECTION("read failure") {
        group.lead({kJidB});
        group.http.fail(kHostA, "GET", QStringLiteral("/api/v1/beolink/listeners"), 500);
        QString error;
        REQUIRE_FALSE(group.coordinator.refreshTopology(&error));
        REQUIRE_FALSE(error.isEmpty());
        REQUIRE(listenersOf(group.coordinator) == QStringList{kJidB});
    }

    SECTION("notification during the read") {
        group.http.onSend([&group](const RecordedRequest &request) {
            if (request.path == QStringLiteral("/api/v1/playback/metadata")) {
                BeolinkChange change;
                change.leaderJid = kJidB;
                group.coordinator.applyBeolinkChange(change);
            }
        });
        REQUIRE(group.coordinator.refreshTopology());
        REQUIRE(group.coordinator.session().leaderJid == kJidB);
    }
}

TEST_CASE("listener notifications schedule a deferred refresh", "[group]") {
    Group group;
    group.http.respond(kHostA, "GET", QStringLiteral("/api/v1/beolink/listeners"),
                       beo_test::json(QJsonArray{QJsonObject{{QStringLiteral("jid"), kJidC}}}));

    group.coordinator.handleDeviceNotification(DeviceNotification{QStringLiteral("beolinkListeners")});
    REQUIRE(group.http.requests().isEmpty());

    REQUIRE(beo_test::waitUntil([&group]() { return group.coordinator.isLeader(); }));
    REQUIRE(listenersOf(group.coordinator) == QStringList{kJidC});

    group.http.clearRequests();
    group.coordinator.handleDeviceNotification(DeviceNotification{QStringLiteral("volume")});
    beo_test::spinEventLoop(20);
    REQUIRE(group.http.requests().isEmpty());
}
