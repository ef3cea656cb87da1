#pragma once

#include <optional>

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace phicore::beo {

// Mozart payload models shared by the notification stream and REST reads.

struct VolumeState {
    int level = 0;
    int maximum = 100;
    bool muted = false;
};

struct SourceInfo {
    QString id;
    QString name;
    bool enabled = true;
    bool multiroomAvailable = true;
};

struct BeolinkPeer {
    QString jid;
    QString friendlyName;
};

struct SourceChange {
    QString id;
    QString friendlyName;
    std::optional<bool> multiroomAvailable;
};

struct PlaybackState {
    QString value;

    bool isPlaying() const;
};

struct PlaybackProgress {
    int progressSeconds = 0;
    std::optional<int> totalDurationSeconds;
};

struct PlaybackMetadata {
    QString title;
    std::optional<BeolinkPeer> remoteLeader;
};

struct PlaybackError {
    QString error;
};

struct BeolinkChange {
    std::optional<QString> leaderJid;
    QStringList listeners;
    std::optional<QString> sourceId;
};

struct SoftwareUpdateState {
    QString state;
    std::optional<int> progress;
};

struct BatteryState {
    int level = 0;
    bool charging = false;
    std::optional<int> remainingChargingMinutes;
    std::optional<int> remainingPlayingMinutes;
};

std::optional<VolumeState> parseVolumeState(const QJsonObject &obj, QString *error = nullptr);
std::optional<SourceChange> parseSourceChange(const QJsonObject &obj, QString *error = nullptr);
std::optional<PlaybackState> parsePlaybackState(const QJsonObject &obj, QString *error = nullptr);
std::optional<PlaybackProgress> parsePlaybackProgress(const QJsonObject &obj, QString *error = nullptr);
std::optional<PlaybackMetadata> parsePlaybackMetadata(const QJsonObject &obj, QString *error = nullptr);
std::optional<PlaybackError> parsePlaybackError(const QJsonObject &obj, QString *error = nullptr);
std::optional<BeolinkChange> parseBeolinkChange(const QJsonObject &obj, QString *error = nullptr);
std::optional<SoftwareUpdateState> parseSoftwareUpdateState(const QJsonObject &obj, QString *error = nullptr);
std::optional<BatteryState> parseBatteryState(const QJsonObject &obj, QString *error = nullptr);

std::optional<BeolinkPeer> parseBeolinkPeer(const QJsonObject &obj);
QList<BeolinkPeer> parseBeolinkPeers(const QJsonArray &array);
QStringList parseListenerJids(const QJsonArray &array);
QList<SourceInfo> parseSources(const QJsonObject &obj);

QList<SourceInfo> fallbackSources();

} // namespace phicore::beo
