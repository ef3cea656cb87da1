#pragma once

#include <functional>
#include <optional>
#include <variant>

#include <QHash>
#include <QJsonValue>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include "beo_api.h"
#include "beo_notification.h"
#include "beo_types.h"

namespace phicore::beo {

struct Standalone {
    bool operator==(const Standalone &) const { return true; }
};

struct Leading {
    QStringList listeners;
    bool operator==(const Leading &other) const { return listeners == other.listeners; }
};

struct Listening {
    QString leaderJid;
    bool operator==(const Listening &other) const { return leaderJid == other.leaderJid; }
};

// A device leads, listens or stands alone; never both leader and listener.
using Topology = std::variant<Standalone, Leading, Listening>;

enum class GroupCommandKind {
    NextTrack,
    Pause,
    Play,
    Stop,
    PreviousTrack,
    Seek,
    Mute,
    SelectSource,
    Toggle,
    SetVolume,
    SetRelativeVolume,
    VolumeUp,
    VolumeDown,
    PlayPause
};

struct GroupCommand {
    GroupCommandKind kind = GroupCommandKind::Play;
    // Undefined or null when absent.
    QJsonValue parameter;
};

std::optional<GroupCommandKind> groupCommandKindFromName(const QString &name);
const char *groupCommandKindName(GroupCommandKind kind);

enum class MembershipPhase {
    Idle,
    Joining,
    Expanding,
    Unexpanding,
    Leaving
};

// JID to REST address of every configured device. Built once from the
// adapter configuration and never changed afterwards.
class DeviceDirectory
{
public:
    void add(const QString &jid, const ConnectionSettings &address);
    std::optional<ConnectionSettings> resolve(const QString &jid) const;
    bool contains(const QString &jid) const { return m_byJid.contains(jid); }
    QStringList jids() const { return m_byJid.keys(); }

private:
    QHash<QString, ConnectionSettings> m_byJid;
};

// Owns the local device's view of its Beolink session and runs the group
// operations against the REST API. Notifications from the device are
// authoritative and overwrite the cached topology; a local call only
// updates the cache if no notification arrived while it was in flight.
class GroupCoordinator : public QObject
{
    Q_OBJECT

public:
    GroupCoordinator(const QString &selfJid,
                     const ConnectionSettings &selfAddress,
                     const DeviceDirectory &directory,
                     const MozartApi &api,
                     QObject *parent = nullptr);

    const QString &selfJid() const { return m_selfJid; }
    void setSelfJid(const QString &jid) { m_selfJid = jid.trimmed(); }
    Topology topology() const { return m_topology; }
    BeolinkSession session() const;
    MembershipPhase membershipPhase() const { return m_phase; }
    quint64 revision() const { return m_revision; }

    bool isStandalone() const { return std::holds_alternative<Standalone>(m_topology); }
    bool isLeader() const { return std::holds_alternative<Leading>(m_topology); }
    bool isListener() const { return std::holds_alternative<Listening>(m_topology); }

    CommandResult join(const std::optional<QString> &targetJid = std::nullopt, const QString &sourceId = {});
    CommandResult expand(const QStringList &jids, bool allDiscovered = false);
    CommandResult unexpand(const QStringList &jids);
    CommandResult leave();
    CommandResult allStandby();
    CommandResult setVolume(double level);
    CommandResult setRelativeVolume(double delta);

    CommandResult leaderCommand(const GroupCommand &command);
    CommandResult leaderCommand(const QString &kindName, const QJsonValue &parameter = QJsonValue());
    // Same commands, always executed on this device.
    CommandResult localCommand(const GroupCommand &command);

    void applyBeolinkChange(const BeolinkChange &change);
    void applyPlaybackMetadata(const PlaybackMetadata &metadata);
    void setPlaybackState(const PlaybackState &state);
    void setCurrentSource(const SourceChange &source);
    void setKnownSources(const QList<SourceInfo> &sources);
    void handleDeviceNotification(const DeviceNotification &notification);

    bool refreshTopology(QString *error = nullptr);
    bool refreshSources(QString *error = nullptr);
    bool refreshPeers(QString *error = nullptr);

    QList<BeolinkPeer> peers() const { return m_peers; }
    QList<SourceInfo> knownSources() const;
    std::optional<PlaybackState> playbackState() const { return m_playbackState; }

    CommandResult validate(const GroupCommand &command) const;

signals:
    void topologyChanged(const phicore::beo::BeolinkSession &session);

private:
    using TargetCall = std::function<CommandResult(const ConnectionSettings &)>;

    class PhaseGuard;

    void applyAuthoritative(const Topology &topology, const std::optional<QString> &sourceId);
    void applyOptimistic(const Topology &topology, quint64 startRevision);
    void setTopology(const Topology &topology);

    bool isKnownPeer(const QString &jid) const;
    std::optional<ConnectionSettings> addressOf(const QString &jid) const;
    std::optional<QStringList> sessionMembers(QString *error);
    CommandResult fanOut(const char *operation, const TargetCall &call);
    CommandResult execute(const ConnectionSettings &target, const GroupCommand &command);
    CommandResult applyVolume(const ConnectionSettings &target, double level);
    CommandResult applyRelativeVolume(const ConnectionSettings &target, double delta);
    CommandResult fromHttp(const HttpResult &result, const QString &what) const;
    CommandResult checkMembershipIdle() const;

    QString m_selfJid;
    ConnectionSettings m_selfAddress;
    const DeviceDirectory &m_directory;
    const MozartApi &m_api;

    Topology m_topology;
    std::optional<QString> m_sourceId;
    quint64 m_revision = 0;
    MembershipPhase m_phase = MembershipPhase::Idle;

    QList<BeolinkPeer> m_peers;
    QList<SourceInfo> m_sources;
    std::optional<SourceChange> m_currentSource;
    std::optional<PlaybackState> m_playbackState;
};

} // namespace phicore::beo
