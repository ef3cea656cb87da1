#include "beo_group.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <QJsonArray>
#include <QTimer>

#include "beo_log.h"

namespace phicore::beo {

namespace {

constexpr double kVolumeStep = 0.1;

bool isAbsent(const QJsonValue &value)
{
    return value.isUndefined() || value.isNull();
}

std::optional<double> numberParameter(const QJsonValue &value)
{
    if (value.isDouble())
        return value.toDouble();
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

QStringList normalizedJids(const QStringList &jids)
{
    QStringList out;
    for (const QString &jid : jids) {
        const QString trimmed = jid.trimmed();
        if (!trimmed.isEmpty() && !out.contains(trimmed))
            out.append(trimmed);
    }
    return out;
}

QJsonObject outcome(bool ok, const QString &detail = {})
{
    QJsonObject entry;
    entry.insert(QStringLiteral("ok"), ok);
    if (!detail.isEmpty())
        entry.insert(ok ? QStringLiteral("note") : QStringLiteral("error"), detail);
    return entry;
}

CommandResult failureWithPayload(BeoError error, const QString &detail, const QJsonObject &payload)
{
    CommandResult result = CommandResult::failure(error, detail);
    result.payload = payload;
    return result;
}

struct CommandName {
    const char *name;
    GroupCommandKind kind;
};

constexpr CommandName kCommandNames[] = {
    {"media_next_track", GroupCommandKind::NextTrack},
    {"media_pause", GroupCommandKind::Pause},
    {"media_play", GroupCommandKind::Play},
    {"media_stop", GroupCommandKind::Stop},
    {"media_previous_track", GroupCommandKind::PreviousTrack},
    {"media_seek", GroupCommandKind::Seek},
    {"mute_volume", GroupCommandKind::Mute},
    {"select_source", GroupCommandKind::SelectSource},
    {"toggle", GroupCommandKind::Toggle},
    {"set_volume_level", GroupCommandKind::SetVolume},
    {"set_relative_volume_level", GroupCommandKind::SetRelativeVolume},
    {"volume_up", GroupCommandKind::VolumeUp},
    {"volume_down", GroupCommandKind::VolumeDown},
    {"media_play_pause", GroupCommandKind::PlayPause},
};

} // namespace

std::optional<GroupCommandKind> groupCommandKindFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    for (const CommandName &entry : kCommandNames) {
        if (key == QLatin1String(entry.name))
            return entry.kind;
    }
    return std::nullopt;
}

const char *groupCommandKindName(GroupCommandKind kind)
{
    for (const CommandName &entry : kCommandNames) {
        if (entry.kind == kind)
            return entry.name;
    }
    return "unknown";
}

void DeviceDirectory::add(const QString &jid, const ConnectionSettings &address)
{
    const QString key = jid.trimmed();
    if (!key.isEmpty())
        m_byJid.insert(key, address);
}

std::optional<ConnectionSettings> DeviceDirectory::resolve(const QString &jid) const
{
    const auto it = m_byJid.constFind(jid.trimmed());
    if (it == m_byJid.constEnd())
        return std::nullopt;
    return it.value();
}

class GroupCoordinator::PhaseGuard
{
public:
    PhaseGuard(GroupCoordinator *owner, MembershipPhase phase)
        : m_owner(owner)
    {
        m_owner->m_phase = phase;
    }
    ~PhaseGuard() { m_owner->m_phase = MembershipPhase::Idle; }

    PhaseGuard(const PhaseGuard &) = delete;
    PhaseGuard &operator=(const PhaseGuard &) = delete;

private:
    GroupCoordinator *m_owner;
};

GroupCoordinator::GroupCoordinator(const QString &selfJid,
                                   const ConnectionSettings &selfAddress,
                                   const DeviceDirectory &directory,
                                   const MozartApi &api,
                                   QObject *parent)
    : QObject(parent)
    , m_selfJid(selfJid.trimmed())
    , m_selfAddress(selfAddress)
    , m_directory(directory)
    , m_api(api)
{
}

BeolinkSession GroupCoordinator::session() const
{
    BeolinkSession out;
    if (const auto *leading = std::get_if<Leading>(&m_topology)) {
        out.leaderJid = m_selfJid;
        out.listeners = leading->listeners;
    } else if (const auto *listening = std::get_if<Listening>(&m_topology)) {
        out.leaderJid = listening->leaderJid;
    }
    out.sourceId = m_sourceId;
    return out;
}

CommandResult GroupCoordinator::join(const std::optional<QString> &targetJid, const QString &sourceId)
{
    const CommandResult busy = checkMembershipIdle();
    if (!busy.ok())
        return busy;

    const QString target = targetJid ? targetJid->trimmed() : QString();
    if (target.isEmpty()) {
        PhaseGuard guard(this, MembershipPhase::Joining);
        qCInfo(beoLinkLog).noquote() << m_selfJid << "joining the latest Beolink experience";
        const HttpResult result = m_api.joinLatestExperience(m_selfAddress);
        if (!result.ok)
            return fromHttp(result, QStringLiteral("Beolink join"));
        return CommandResult::success(MozartApi::objectPayload(result));
    }

    if (target == m_selfJid)
        return CommandResult::failure(BeoError::InvalidGroupingTarget,
                                      QStringLiteral("A device cannot join itself"));

    if (!isKnownPeer(target)) {
        QString peersError;
        if (!refreshPeers(&peersError))
            qCWarning(beoLinkLog).noquote() << "Peer lookup failed:" << peersError;
        if (!isKnownPeer(target))
            return CommandResult::failure(BeoError::InvalidGroupingTarget,
                                          QStringLiteral("%1 is not a known Beolink device").arg(target));
    }

    PhaseGuard guard(this, MembershipPhase::Joining);
    const quint64 startRevision = m_revision;
    qCInfo(beoLinkLog).noquote() << m_selfJid << "joining" << target;
    const HttpResult result = m_api.joinPeer(m_selfAddress, target, sourceId);
    if (!result.ok)
        return fromHttp(result, QStringLiteral("Beolink join"));

    applyOptimistic(Listening{target}, startRevision);
    return CommandResult::success(MozartApi::objectPayload(result));
}

CommandResult GroupCoordinator::expand(const QStringList &jids, bool allDiscovered)
{
    if (const auto *listening = std::get_if<Listening>(&m_topology))
        return CommandResult::failure(BeoError::NotALeader,
                                      QStringLiteral("%1 is listening to %2 and cannot expand")
                                          .arg(m_selfJid, listening->leaderJid));

    const CommandResult busy = checkMembershipIdle();
    if (!busy.ok())
        return busy;

    if (m_playbackState && !m_playbackState->isPlaying())
        return CommandResult::failure(BeoError::InvalidState,
                                      QStringLiteral("Nothing is playing (state %1)").arg(m_playbackState->value));
    if (m_currentSource && m_currentSource->multiroomAvailable && !*m_currentSource->multiroomAvailable)
        return CommandResult::failure(BeoError::InvalidState,
                                      QStringLiteral("Source %1 cannot be shared").arg(m_currentSource->id));

    QStringList requested = normalizedJids(jids);
    if (allDiscovered) {
        QString peersError;
        if (!refreshPeers(&peersError))
            return CommandResult::failure(BeoError::RemoteCommandFailed,
                                          QStringLiteral("Peer discovery failed: %1").arg(peersError));
        for (const BeolinkPeer &peer : std::as_const(m_peers)) {
            if (peer.jid != m_selfJid && !requested.contains(peer.jid))
                requested.append(peer.jid);
        }
    }
    if (requested.isEmpty())
        return CommandResult::failure(BeoError::InvalidParameter, QStringLiteral("No devices to expand to"));

    PhaseGuard guard(this, MembershipPhase::Expanding);
    const quint64 startRevision = m_revision;

    QStringList listeners;
    if (const auto *leading = std::get_if<Leading>(&m_topology))
        listeners = leading->listeners;

    QJsonObject targets;
    QStringList added;
    QString firstError;
    int rejected = 0;
    for (const QString &jid : std::as_const(requested)) {
        if (jid == m_selfJid) {
            ++rejected;
            targets.insert(jid, outcome(false, QStringLiteral("cannot expand to itself")));
            continue;
        }
        if (listeners.contains(jid)) {
            targets.insert(jid, outcome(true, QStringLiteral("already a listener")));
            continue;
        }

        const HttpResult result = m_api.expand(m_selfAddress, jid);
        if (result.ok) {
            added.append(jid);
            targets.insert(jid, outcome(true));
        } else {
            const QString detail = MozartApi::errorDetail(result, QStringLiteral("expand failed"));
            qCWarning(beoLinkLog).noquote() << "Expanding to" << jid << "failed:" << detail;
            targets.insert(jid, outcome(false, detail));
            if (firstError.isEmpty())
                firstError = QStringLiteral("%1: %2").arg(jid, detail);
        }
    }

    QJsonObject payload;
    payload.insert(QStringLiteral("targets"), targets);

    if (rejected == requested.size())
        return failureWithPayload(BeoError::InvalidGroupingTarget,
                                  QStringLiteral("A device cannot expand to itself"),
                                  payload);
    if (!firstError.isEmpty())
        return failureWithPayload(BeoError::RemoteCommandFailed, firstError, payload);

    if (!added.isEmpty()) {
        listeners.append(added);
        applyOptimistic(Leading{listeners}, startRevision);
    }
    return CommandResult::success(payload);
}

CommandResult GroupCoordinator::unexpand(const QStringList &jids)
{
    if (const auto *listening = std::get_if<Listening>(&m_topology))
        return CommandResult::failure(BeoError::NotALeader,
                                      QStringLiteral("%1 is listening to %2 and has no listeners")
                                          .arg(m_selfJid, listening->leaderJid));

    const CommandResult busy = checkMembershipIdle();
    if (!busy.ok())
        return busy;

    const QStringList requested = normalizedJids(jids);
    if (requested.isEmpty())
        return CommandResult::failure(BeoError::InvalidParameter, QStringLiteral("No listeners to remove"));
    if (requested.contains(m_selfJid))
        return CommandResult::failure(BeoError::InvalidGroupingTarget,
                                      QStringLiteral("A device cannot remove itself; use leave"));

    PhaseGuard guard(this, MembershipPhase::Unexpanding);
    const quint64 startRevision = m_revision;

    QJsonObject targets;
    QStringList removed;
    QString firstError;
    for (const QString &jid : requested) {
        const HttpResult result = m_api.unexpand(m_selfAddress, jid);
        if (result.ok) {
            removed.append(jid);
            targets.insert(jid, outcome(true));
        } else {
            const QString detail = MozartApi::errorDetail(result, QStringLiteral("unexpand failed"));
            qCWarning(beoLinkLog).noquote() << "Removing listener" << jid << "failed:" << detail;
            targets.insert(jid, outcome(false, detail));
            if (firstError.isEmpty())
                firstError = QStringLiteral("%1: %2").arg(jid, detail);
        }
    }

    QJsonObject payload;
    payload.insert(QStringLiteral("targets"), targets);
    if (!firstError.isEmpty())
        return failureWithPayload(BeoError::RemoteCommandFailed, firstError, payload);

    QStringList listeners;
    if (const auto *leading = std::get_if<Leading>(&m_topology))
        listeners = leading->listeners;
    for (const QString &jid : std::as_const(removed))
        listeners.removeAll(jid);

    if (listeners.isEmpty())
        applyOptimistic(Standalone{}, startRevision);
    else
        applyOptimistic(Leading{listeners}, startRevision);
    return CommandResult::success(payload);
}

CommandResult GroupCoordinator::leave()
{
    const CommandResult busy = checkMembershipIdle();
    if (!busy.ok())
        return busy;

    if (!isListener()) {
        QJsonObject payload;
        payload.insert(QStringLiteral("changed"), false);
        return CommandResult::success(payload);
    }

    PhaseGuard guard(this, MembershipPhase::Leaving);
    const quint64 startRevision = m_revision;
    const HttpResult result = m_api.leave(m_selfAddress);
    if (!result.ok)
        return fromHttp(result, QStringLiteral("Beolink leave"));

    applyOptimistic(Standalone{}, startRevision);
    QJsonObject payload;
    payload.insert(QStringLiteral("changed"), true);
    return CommandResult::success(payload);
}

CommandResult GroupCoordinator::allStandby()
{
    // Listeners of a remote leader are not addressable from here, so the
    // device itself fans the standby out across its session.
    const CommandResult result = fromHttp(m_api.allStandby(m_selfAddress), QStringLiteral("Beolink all standby"));
    if (result.ok())
        qCInfo(beoLinkLog).noquote() << m_selfJid << "put its Beolink session into standby";
    return result;
}

CommandResult GroupCoordinator::setVolume(double level)
{
    if (!std::isfinite(level) || level < 0.0 || level > 1.0)
        return CommandResult::failure(BeoError::InvalidParameter,
                                      QStringLiteral("Volume must be within 0.0..1.0"));

    return fanOut("volume", [this, level](const ConnectionSettings &target) {
        return applyVolume(target, level);
    });
}

CommandResult GroupCoordinator::setRelativeVolume(double delta)
{
    if (!std::isfinite(delta) || delta < -1.0 || delta > 1.0)
        return CommandResult::failure(BeoError::InvalidParameter,
                                      QStringLiteral("Relative volume must be within -1.0..1.0"));

    return fanOut("relative volume", [this, delta](const ConnectionSettings &target) {
        return applyRelativeVolume(target, delta);
    });
}

CommandResult GroupCoordinator::leaderCommand(const QString &kindName, const QJsonValue &parameter)
{
    const auto kind = groupCommandKindFromName(kindName);
    if (!kind)
        return CommandResult::failure(BeoError::InvalidParameter,
                                      QStringLiteral("Unknown command '%1'").arg(kindName));

    GroupCommand command;
    command.kind = *kind;
    command.parameter = parameter;
    return leaderCommand(command);
}

CommandResult GroupCoordinator::leaderCommand(const GroupCommand &command)
{
    const CommandResult check = validate(command);
    if (!check.ok())
        return check;

    ConnectionSettings target = m_selfAddress;
    QString targetJid = m_selfJid;
    if (const auto *listening = std::get_if<Listening>(&m_topology)) {
        const auto leaderAddress = addressOf(listening->leaderJid);
        if (!leaderAddress)
            return CommandResult::failure(BeoError::InvalidGroupingTarget,
                                          QStringLiteral("Leader %1 has no known address").arg(listening->leaderJid));
        target = *leaderAddress;
        targetJid = listening->leaderJid;
    }

    qCInfo(beoLinkLog).noquote() << "Sending" << groupCommandKindName(command.kind) << "to leader" << targetJid;
    CommandResult result = execute(target, command);
    result.payload.insert(QStringLiteral("target"), targetJid);
    return result;
}

CommandResult GroupCoordinator::localCommand(const GroupCommand &command)
{
    const CommandResult check = validate(command);
    if (!check.ok())
        return check;
    return execute(m_selfAddress, command);
}

CommandResult GroupCoordinator::validate(const GroupCommand &command) const
{
    const QJsonValue &parameter = command.parameter;
    const QString name = QString::fromLatin1(groupCommandKindName(command.kind));

    switch (command.kind) {
    case GroupCommandKind::NextTrack:
    case GroupCommandKind::Pause:
    case GroupCommandKind::Play:
    case GroupCommandKind::Stop:
    case GroupCommandKind::PreviousTrack:
    case GroupCommandKind::Toggle:
    case GroupCommandKind::VolumeUp:
    case GroupCommandKind::VolumeDown:
    case GroupCommandKind::PlayPause:
        if (!isAbsent(parameter))
            return CommandResult::failure(BeoError::InvalidParameter,
                                          QStringLiteral("%1 takes no parameter").arg(name));
        break;
    case GroupCommandKind::Seek: {
        const auto seconds = numberParameter(parameter);
        if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0)
            return CommandResult::failure(BeoError::InvalidParameter,
                                          QStringLiteral("%1 requires a position in seconds").arg(name));
        break;
    }
    case GroupCommandKind::Mute:
        if (!parameter.isBool())
            return CommandResult::failure(BeoError::InvalidParameter,
                                          QStringLiteral("%1 requires a boolean").arg(name));
        break;
    case GroupCommandKind::SelectSource: {
        if (!parameter.isString() || parameter.toString().trimmed().isEmpty())
            return CommandResult::failure(BeoError::InvalidParameter,
                                          QStringLiteral("%1 requires a source id").arg(name));
        const QString sourceId = parameter.toString().trimmed();
        const QList<SourceInfo> sources = knownSources();
        const bool known = std::any_of(sources.cbegin(), sources.cend(), [&sourceId](const SourceInfo &source) {
            return source.enabled && source.id == sourceId;
        });
        if (!known)
            return CommandResult::failure(BeoError::InvalidParameter,
                                          QStringLiteral("Unknown source '%1'").arg(sourceId));
        break;
    }
    case GroupCommandKind::SetVolume: {
        const auto level = numberParameter(parameter);
        if (!level || !std::isfinite(*level) || *level < 0.0 || *level > 1.0)
            return CommandResult::failure(BeoError::InvalidParameter,
                                          QStringLiteral("%1 requires a number within 0.0..1.0").arg(name));
        break;
    }
    case GroupCommandKind::SetRelativeVolume: {
        const auto delta = numberParameter(parameter);
        if (!delta || !std::isfinite(*delta) || *delta < -1.0 || *delta > 1.0)
            return CommandResult::failure(BeoError::InvalidParameter,
                                          QStringLiteral("%1 requires a number within -1.0..1.0").arg(name));
        break;
    }
    }

    return CommandResult::success();
}

void GroupCoordinator::applyBeolinkChange(const BeolinkChange &change)
{
    Topology next = Standalone{};
    if (change.leaderJid && *change.leaderJid != m_selfJid) {
        next = Listening{*change.leaderJid};
    } else {
        QStringList listeners = change.listeners;
        listeners.removeAll(m_selfJid);
        if (!listeners.isEmpty())
            next = Leading{listeners};
    }
    applyAuthoritative(next, change.sourceId);
}

void GroupCoordinator::applyPlaybackMetadata(const PlaybackMetadata &metadata)
{
    if (metadata.remoteLeader && metadata.remoteLeader->jid != m_selfJid) {
        applyAuthoritative(Listening{metadata.remoteLeader->jid}, std::nullopt);
    } else if (!metadata.remoteLeader && isListener()) {
        applyAuthoritative(Standalone{}, std::nullopt);
    }
}

void GroupCoordinator::setPlaybackState(const PlaybackState &state)
{
    m_playbackState = state;
}

void GroupCoordinator::setCurrentSource(const SourceChange &source)
{
    m_currentSource = source;
}

void GroupCoordinator::setKnownSources(const QList<SourceInfo> &sources)
{
    m_sources = sources;
}

void GroupCoordinator::handleDeviceNotification(const DeviceNotification &notification)
{
    const QString value = notification.value;
    if (value != QLatin1String("beolinkPeers")
        && value != QLatin1String("beolinkListeners")
        && value != QLatin1String("beolinkAvailableListeners")) {
        return;
    }

    // Deferred so the REST reads run outside the notification handler.
    QTimer::singleShot(0, this, [this, value]() {
        QString error;
        if (value == QLatin1String("beolinkPeers") && !refreshPeers(&error))
            qCWarning(beoLinkLog).noquote() << "Peer refresh failed:" << error;
        if (!refreshTopology(&error))
            qCWarning(beoLinkLog).noquote() << "Topology refresh failed:" << error;
    });
}

bool GroupCoordinator::refreshTopology(QString *error)
{
    const quint64 startRevision = m_revision;

    const HttpResult listenersResult = m_api.beolinkListeners(m_selfAddress);
    if (!listenersResult.ok) {
        if (error)
            *error = MozartApi::errorDetail(listenersResult, QStringLiteral("listener read failed"));
        return false;
    }
    const HttpResult metadataResult = m_api.playbackMetadata(m_selfAddress);
    if (!metadataResult.ok) {
        if (error)
            *error = MozartApi::errorDetail(metadataResult, QStringLiteral("metadata read failed"));
        return false;
    }

    if (m_revision != startRevision) {
        qCDebug(beoLinkLog) << "Topology changed while refreshing; keeping the newer notification";
        return true;
    }

    const auto metadata = parsePlaybackMetadata(MozartApi::objectPayload(metadataResult));
    Topology next = Standalone{};
    if (metadata && metadata->remoteLeader && metadata->remoteLeader->jid != m_selfJid) {
        next = Listening{metadata->remoteLeader->jid};
    } else {
        QStringList listeners = parseListenerJids(MozartApi::arrayPayload(listenersResult));
        listeners.removeAll(m_selfJid);
        if (!listeners.isEmpty())
            next = Leading{listeners};
    }
    applyAuthoritative(next, std::nullopt);
    return true;
}

bool GroupCoordinator::refreshSources(QString *error)
{
    const HttpResult result = m_api.sources(m_selfAddress);
    if (!result.ok) {
        m_sources.clear();
        if (error)
            *error = MozartApi::errorDetail(result, QStringLiteral("source read failed"));
        return false;
    }
    m_sources = parseSources(MozartApi::objectPayload(result));
    return true;
}

bool GroupCoordinator::refreshPeers(QString *error)
{
    const HttpResult result = m_api.beolinkPeers(m_selfAddress);
    if (!result.ok) {
        if (error)
            *error = MozartApi::errorDetail(result, QStringLiteral("peer read failed"));
        return false;
    }
    m_peers = parseBeolinkPeers(MozartApi::arrayPayload(result));
    return true;
}

QList<SourceInfo> GroupCoordinator::knownSources() const
{
    return m_sources.isEmpty() ? fallbackSources() : m_sources;
}

void GroupCoordinator::applyAuthoritative(const Topology &topology, const std::optional<QString> &sourceId)
{
    ++m_revision;
    if (sourceId)
        m_sourceId = sourceId;
    setTopology(topology);
}

void GroupCoordinator::applyOptimistic(const Topology &topology, quint64 startRevision)
{
    if (m_revision != startRevision) {
        qCInfo(beoLinkLog) << "Topology notification arrived during the request; keeping it";
        return;
    }
    setTopology(topology);
}

void GroupCoordinator::setTopology(const Topology &topology)
{
    if (topology == m_topology)
        return;
    m_topology = topology;

    const BeolinkSession snapshot = session();
    qCInfo(beoLinkLog).noquote() << m_selfJid << "topology: leader" << snapshot.leaderJid
                                 << "listeners" << snapshot.listeners.join(QLatin1Char(','));
    emit topologyChanged(snapshot);
}

bool GroupCoordinator::isKnownPeer(const QString &jid) const
{
    if (m_directory.contains(jid))
        return true;
    return std::any_of(m_peers.cbegin(), m_peers.cend(), [&jid](const BeolinkPeer &peer) {
        return peer.jid == jid;
    });
}

std::optional<ConnectionSettings> GroupCoordinator::addressOf(const QString &jid) const
{
    if (jid == m_selfJid)
        return m_selfAddress;
    return m_directory.resolve(jid);
}

std::optional<QStringList> GroupCoordinator::sessionMembers(QString *error)
{
    QStringList members;
    if (const auto *leading = std::get_if<Leading>(&m_topology)) {
        members.append(m_selfJid);
        members.append(leading->listeners);
    } else if (const auto *listening = std::get_if<Listening>(&m_topology)) {
        members.append(listening->leaderJid);
        if (const auto leaderAddress = addressOf(listening->leaderJid)) {
            const HttpResult result = m_api.beolinkListeners(*leaderAddress);
            if (!result.ok) {
                if (error)
                    *error = QStringLiteral("Reading listeners of %1 failed: %2")
                                 .arg(listening->leaderJid, MozartApi::errorDetail(result));
                return std::nullopt;
            }
            members.append(parseListenerJids(MozartApi::arrayPayload(result)));
        }
        members.append(m_selfJid);
    } else {
        members.append(m_selfJid);
    }
    members.removeDuplicates();
    return members;
}

// Runs `call` on every session member. Members without a known address are
// skipped and fail the whole operation, as do member errors.
CommandResult GroupCoordinator::fanOut(const char *operation, const TargetCall &call)
{
    QString error;
    const auto members = sessionMembers(&error);
    if (!members) {
        qCWarning(beoLinkLog).noquote() << "Session" << operation << "aborted:" << error;
        return CommandResult::failure(BeoError::RemoteCommandFailed, error);
    }

    QJsonObject targets;
    QJsonArray unresolved;
    QString firstError;

    for (const QString &jid : *members) {
        const auto address = addressOf(jid);
        if (!address) {
            qCWarning(beoLinkLog).noquote() << "Skipping" << operation << "for" << jid << "(no known address)";
            unresolved.append(jid);
            continue;
        }

        const CommandResult result = call(*address);
        targets.insert(jid, outcome(result.ok(), result.detail));
        if (!result.ok() && firstError.isEmpty())
            firstError = QStringLiteral("%1: %2").arg(jid, result.detail);
    }

    QJsonObject payload;
    payload.insert(QStringLiteral("targets"), targets);
    if (!unresolved.isEmpty())
        payload.insert(QStringLiteral("unresolved"), unresolved);

    if (!firstError.isEmpty())
        return failureWithPayload(BeoError::RemoteCommandFailed, firstError, payload);
    if (!unresolved.isEmpty()) {
        QStringList missing;
        for (const QJsonValue &jid : std::as_const(unresolved))
            missing.append(jid.toString());
        return failureWithPayload(BeoError::RemoteCommandFailed,
                                  QStringLiteral("No known address for %1").arg(missing.join(QStringLiteral(", "))),
                                  payload);
    }
    return CommandResult::success(payload);
}

CommandResult GroupCoordinator::execute(const ConnectionSettings &target, const GroupCommand &command)
{
    const QJsonValue &parameter = command.parameter;

    switch (command.kind) {
    case GroupCommandKind::NextTrack:
        return fromHttp(m_api.playbackCommand(target, QStringLiteral("skip")), QStringLiteral("Next track"));
    case GroupCommandKind::PreviousTrack:
        return fromHttp(m_api.playbackCommand(target, QStringLiteral("prev")), QStringLiteral("Previous track"));
    case GroupCommandKind::Play:
        return fromHttp(m_api.playbackCommand(target, QStringLiteral("play")), QStringLiteral("Play"));
    case GroupCommandKind::Pause:
        return fromHttp(m_api.playbackCommand(target, QStringLiteral("pause")), QStringLiteral("Pause"));
    case GroupCommandKind::Stop:
        return fromHttp(m_api.playbackCommand(target, QStringLiteral("stop")), QStringLiteral("Stop"));
    case GroupCommandKind::PlayPause: {
        const bool playing = m_playbackState && m_playbackState->isPlaying();
        const QString next = playing ? QStringLiteral("pause") : QStringLiteral("play");
        return fromHttp(m_api.playbackCommand(target, next), QStringLiteral("Play/pause"));
    }
    case GroupCommandKind::Toggle:
        if (m_playbackState && m_playbackState->isPlaying())
            return fromHttp(m_api.standby(target), QStringLiteral("Standby"));
        return fromHttp(m_api.playbackCommand(target, QStringLiteral("play")), QStringLiteral("Play"));
    case GroupCommandKind::Seek: {
        const double seconds = numberParameter(parameter).value_or(0.0);
        return fromHttp(m_api.seek(target, static_cast<qint64>(std::llround(seconds * 1000.0))),
                        QStringLiteral("Seek"));
    }
    case GroupCommandKind::Mute:
        return fromHttp(m_api.setMuted(target, parameter.toBool()), QStringLiteral("Mute"));
    case GroupCommandKind::SelectSource:
        return fromHttp(m_api.setActiveSource(target, parameter.toString().trimmed()),
                        QStringLiteral("Source selection"));
    case GroupCommandKind::SetVolume:
        return applyVolume(target, numberParameter(parameter).value_or(0.0));
    case GroupCommandKind::SetRelativeVolume:
        return applyRelativeVolume(target, numberParameter(parameter).value_or(0.0));
    case GroupCommandKind::VolumeUp:
        return applyRelativeVolume(target, kVolumeStep);
    case GroupCommandKind::VolumeDown:
        return applyRelativeVolume(target, -kVolumeStep);
    }

    return CommandResult::failure(BeoError::InvalidParameter, QStringLiteral("Unsupported command"));
}

CommandResult GroupCoordinator::applyVolume(const ConnectionSettings &target, double level)
{
    int maximum = 100;
    const HttpResult current = m_api.volume(target);
    if (current.ok) {
        if (const auto state = parseVolumeState(MozartApi::objectPayload(current)))
            maximum = state->maximum;
    }

    const int value = std::min(static_cast<int>(std::lround(level * 100.0)), maximum);
    return fromHttp(m_api.setVolumeLevel(target, value), QStringLiteral("Volume change"));
}

CommandResult GroupCoordinator::applyRelativeVolume(const ConnectionSettings &target, double delta)
{
    const HttpResult current = m_api.volume(target);
    if (!current.ok)
        return fromHttp(current, QStringLiteral("Volume read"));

    const auto state = parseVolumeState(MozartApi::objectPayload(current));
    if (!state)
        return CommandResult::failure(BeoError::RemoteCommandFailed, QStringLiteral("Volume read returned no level"));

    const double next = std::clamp(state->level / 100.0 + delta, 0.0, 1.0);
    const int value = std::min(static_cast<int>(std::lround(next * 100.0)), state->maximum);
    return fromHttp(m_api.setVolumeLevel(target, value), QStringLiteral("Volume change"));
}

CommandResult GroupCoordinator::fromHttp(const HttpResult &result, const QString &what) const
{
    if (result.ok)
        return CommandResult::success(MozartApi::objectPayload(result));

    const QString detail = MozartApi::errorDetail(result, QStringLiteral("request failed"));
    qCWarning(beoLinkLog).noquote() << what << "failed:" << detail;
    return CommandResult::failure(BeoError::RemoteCommandFailed, QStringLiteral("%1 failed: %2").arg(what, detail));
}

CommandResult GroupCoordinator::checkMembershipIdle() const
{
    if (m_phase == MembershipPhase::Idle)
        return CommandResult::success();
    return CommandResult::failure(BeoError::InvalidState, QStringLiteral("A membership change is already in progress"));
}

} // namespace phicore::beo
