#include "beo_payload.h"

#include <algorithm>
#include <cmath>

namespace phicore::beo {

namespace {

void setError(QString *error, const QString &message)
{
    if (error)
        *error = message;
}

std::optional<int> readOptionalInt(const QJsonObject &obj, const QString &key)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble())
        return static_cast<int>(std::lround(value.toDouble()));
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().toInt(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

// Mozart nests some scalars one level deep ({"level": {"level": 40}}).
std::optional<int> readNestedInt(const QJsonObject &obj, const QString &key)
{
    const QJsonValue value = obj.value(key);
    if (value.isObject())
        return readOptionalInt(value.toObject(), key);
    return readOptionalInt(obj, key);
}

} // namespace

bool PlaybackState::isPlaying() const
{
    const QString state = value.trimmed().toLower();
    return state == QLatin1String("started")
        || state == QLatin1String("playing")
        || state == QLatin1String("buffering");
}

std::optional<VolumeState> parseVolumeState(const QJsonObject &obj, QString *error)
{
    VolumeState state;
    bool any = false;

    if (const auto level = readNestedInt(obj, QStringLiteral("level"))) {
        state.level = *level;
        any = true;
    }

    const QJsonValue maximum = obj.value(QStringLiteral("maximum"));
    if (maximum.isObject()) {
        if (const auto maxLevel = readOptionalInt(maximum.toObject(), QStringLiteral("level")))
            state.maximum = *maxLevel;
    } else if (maximum.isDouble()) {
        state.maximum = maximum.toInt(state.maximum);
    }

    const QJsonValue muted = obj.value(QStringLiteral("muted"));
    if (muted.isObject()) {
        state.muted = muted.toObject().value(QStringLiteral("muted")).toBool(false);
        any = true;
    } else if (muted.isBool()) {
        state.muted = muted.toBool();
        any = true;
    }

    if (!any) {
        setError(error, QStringLiteral("volume payload carries neither level nor muted"));
        return std::nullopt;
    }
    state.level = qBound(0, state.level, 100);
    state.maximum = qBound(0, state.maximum, 100);
    return state;
}

std::optional<SourceChange> parseSourceChange(const QJsonObject &obj, QString *error)
{
    SourceChange change;
    change.id = obj.value(QStringLiteral("id")).toString().trimmed();
    change.friendlyName = obj.value(QStringLiteral("friendlyName")).toString().trimmed();
    if (change.friendlyName.isEmpty())
        change.friendlyName = obj.value(QStringLiteral("name")).toString().trimmed();
    if (change.id.isEmpty()) {
        setError(error, QStringLiteral("source change without id"));
        return std::nullopt;
    }
    if (change.friendlyName.isEmpty())
        change.friendlyName = change.id;
    const QJsonValue multiroom = obj.value(QStringLiteral("isMultiroomAvailable"));
    if (multiroom.isBool())
        change.multiroomAvailable = multiroom.toBool();
    return change;
}

std::optional<PlaybackState> parsePlaybackState(const QJsonObject &obj, QString *error)
{
    PlaybackState state;
    state.value = obj.value(QStringLiteral("value")).toString().trimmed();
    if (state.value.isEmpty()) {
        setError(error, QStringLiteral("playback state without value"));
        return std::nullopt;
    }
    return state;
}

std::optional<PlaybackProgress> parsePlaybackProgress(const QJsonObject &obj, QString *error)
{
    const auto progress = readOptionalInt(obj, QStringLiteral("progress"));
    if (!progress) {
        setError(error, QStringLiteral("playback progress without progress"));
        return std::nullopt;
    }
    PlaybackProgress out;
    out.progressSeconds = std::max(0, *progress);
    out.totalDurationSeconds = readOptionalInt(obj, QStringLiteral("totalDuration"));
    return out;
}

std::optional<PlaybackMetadata> parsePlaybackMetadata(const QJsonObject &obj, QString *)
{
    PlaybackMetadata out;
    out.title = obj.value(QStringLiteral("title")).toString();
    const QJsonValue leader = obj.value(QStringLiteral("remoteLeader"));
    if (leader.isObject())
        out.remoteLeader = parseBeolinkPeer(leader.toObject());
    return out;
}

std::optional<PlaybackError> parsePlaybackError(const QJsonObject &obj, QString *error)
{
    PlaybackError out;
    out.error = obj.value(QStringLiteral("error")).toString().trimmed();
    if (out.error.isEmpty()) {
        setError(error, QStringLiteral("playback error without error text"));
        return std::nullopt;
    }
    return out;
}

std::optional<BeolinkChange> parseBeolinkChange(const QJsonObject &obj, QString *error)
{
    if (!obj.contains(QStringLiteral("leader")) && !obj.contains(QStringLiteral("listeners"))) {
        setError(error, QStringLiteral("beolink change carries neither leader nor listeners"));
        return std::nullopt;
    }

    BeolinkChange change;
    const QJsonValue leader = obj.value(QStringLiteral("leader"));
    if (leader.isObject()) {
        const auto peer = parseBeolinkPeer(leader.toObject());
        if (peer)
            change.leaderJid = peer->jid;
    } else if (leader.isString() && !leader.toString().trimmed().isEmpty()) {
        change.leaderJid = leader.toString().trimmed();
    } else if (!leader.isNull() && !leader.isUndefined()) {
        setError(error, QStringLiteral("beolink leader has unexpected shape"));
        return std::nullopt;
    }

    const QJsonValue listeners = obj.value(QStringLiteral("listeners"));
    if (!listeners.isUndefined() && !listeners.isNull() && !listeners.isArray()) {
        setError(error, QStringLiteral("beolink listeners is not an array"));
        return std::nullopt;
    }
    change.listeners = parseListenerJids(listeners.toArray());
    if (change.leaderJid)
        change.listeners.removeAll(*change.leaderJid);

    const QString source = obj.value(QStringLiteral("source")).toString().trimmed();
    if (!source.isEmpty())
        change.sourceId = source;
    return change;
}

std::optional<SoftwareUpdateState> parseSoftwareUpdateState(const QJsonObject &obj, QString *error)
{
    SoftwareUpdateState out;
    out.state = obj.value(QStringLiteral("state")).toString().trimmed();
    if (out.state.isEmpty()) {
        setError(error, QStringLiteral("software update state without state"));
        return std::nullopt;
    }
    out.progress = readOptionalInt(obj, QStringLiteral("progress"));
    return out;
}

std::optional<BatteryState> parseBatteryState(const QJsonObject &obj, QString *error)
{
    const auto level = readOptionalInt(obj, QStringLiteral("batteryLevel"));
    if (!level) {
        setError(error, QStringLiteral("battery state without batteryLevel"));
        return std::nullopt;
    }
    BatteryState out;
    out.level = qBound(0, *level, 100);
    out.charging = obj.value(QStringLiteral("isCharging")).toBool(false);
    out.remainingChargingMinutes = readOptionalInt(obj, QStringLiteral("remainingChargingTimeMinutes"));
    out.remainingPlayingMinutes = readOptionalInt(obj, QStringLiteral("remainingPlayingTimeMinutes"));
    return out;
}

std::optional<BeolinkPeer> parseBeolinkPeer(const QJsonObject &obj)
{
    BeolinkPeer peer;
    peer.jid = obj.value(QStringLiteral("jid")).toString().trimmed();
    peer.friendlyName = obj.value(QStringLiteral("friendlyName")).toString().trimmed();
    if (peer.jid.isEmpty())
        return std::nullopt;
    return peer;
}

QList<BeolinkPeer> parseBeolinkPeers(const QJsonArray &array)
{
    QList<BeolinkPeer> out;
    for (const QJsonValue &entry : array) {
        if (!entry.isObject())
            continue;
        if (const auto peer = parseBeolinkPeer(entry.toObject()))
            out.append(*peer);
    }
    return out;
}

QStringList parseListenerJids(const QJsonArray &array)
{
    QStringList out;
    for (const QJsonValue &entry : array) {
        QString jid;
        if (entry.isObject())
            jid = entry.toObject().value(QStringLiteral("jid")).toString().trimmed();
        else if (entry.isString())
            jid = entry.toString().trimmed();
        if (!jid.isEmpty() && !out.contains(jid))
            out.append(jid);
    }
    return out;
}

QList<SourceInfo> parseSources(const QJsonObject &obj)
{
    QList<SourceInfo> out;
    const QJsonArray items = obj.value(QStringLiteral("items")).toArray();
    for (const QJsonValue &entry : items) {
        const QJsonObject sourceObj = entry.toObject();
        SourceInfo source;
        source.id = sourceObj.value(QStringLiteral("id")).toString().trimmed();
        if (source.id.isEmpty())
            continue;
        source.name = sourceObj.value(QStringLiteral("name")).toString(source.id);
        source.enabled = sourceObj.value(QStringLiteral("isEnabled")).toBool(true);
        source.multiroomAvailable = sourceObj.value(QStringLiteral("isMultiroomAvailable")).toBool(true);
        out.append(source);
    }
    return out;
}

QList<SourceInfo> fallbackSources()
{
    static const struct {
        const char *id;
        const char *name;
    } kSources[] = {
        {"uriStreamer", "Audio Streamer"},
        {"bluetooth", "Bluetooth"},
        {"spotify", "Spotify Connect"},
        {"lineIn", "Line-In"},
        {"spdif", "Optical"},
        {"netRadio", "B&O Radio"},
        {"deezer", "Deezer"},
        {"tidalConnect", "Tidal Connect"},
    };

    QList<SourceInfo> out;
    for (const auto &entry : kSources) {
        SourceInfo source;
        source.id = QString::fromLatin1(entry.id);
        source.name = QString::fromLatin1(entry.name);
        out.append(source);
    }
    return out;
}

} // namespace phicore::beo
