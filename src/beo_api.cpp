#include "beo_api.h"

#include <algorithm>

#include <QJsonDocument>
#include <QSet>
#include <QUrl>

namespace phicore::beo {

namespace {

QString encodeSegment(const QString &segment)
{
    return QString::fromUtf8(QUrl::toPercentEncoding(segment, QByteArrayLiteral("@.")));
}

QByteArray compact(const QJsonObject &obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

// Join sources the device only accepts in upper case.
QString normalizeJoinSource(const QString &sourceId)
{
    static const QSet<QString> kUpperCase = {
        QStringLiteral("deezer"), QStringLiteral("spotify"), QStringLiteral("tidal"),
        QStringLiteral("radio"), QStringLiteral("tp1"), QStringLiteral("tp2"),
        QStringLiteral("cd"), QStringLiteral("aux_a"), QStringLiteral("ph"),
    };
    const QString trimmed = sourceId.trimmed();
    if (kUpperCase.contains(trimmed.toLower()))
        return trimmed.toUpper();
    return trimmed;
}

} // namespace

MozartApi::MozartApi(const HttpClient &http, int timeoutMs)
    : m_http(http)
{
    setTimeoutMs(timeoutMs);
}

void MozartApi::setTimeoutMs(int timeoutMs)
{
    m_timeoutMs = std::max(100, timeoutMs);
}

HttpResult MozartApi::beolinkSelf(const ConnectionSettings &target) const
{
    return m_http.get(target, QStringLiteral("/api/v1/beolink/self"), m_timeoutMs);
}

HttpResult MozartApi::beolinkPeers(const ConnectionSettings &target) const
{
    return m_http.get(target, QStringLiteral("/api/v1/beolink/peers"), m_timeoutMs);
}

HttpResult MozartApi::beolinkListeners(const ConnectionSettings &target) const
{
    return m_http.get(target, QStringLiteral("/api/v1/beolink/listeners"), m_timeoutMs);
}

HttpResult MozartApi::joinLatestExperience(const ConnectionSettings &target) const
{
    return m_http.postJson(target, QStringLiteral("/api/v1/beolink/join"), {}, m_timeoutMs);
}

HttpResult MozartApi::joinPeer(const ConnectionSettings &target, const QString &jid, const QString &sourceId) const
{
    QString path = QStringLiteral("/api/v1/beolink/join/%1").arg(encodeSegment(jid));
    const QString source = normalizeJoinSource(sourceId);
    if (!source.isEmpty())
        path += QStringLiteral("?source=%1").arg(encodeSegment(source));
    return m_http.postJson(target, path, {}, m_timeoutMs);
}

HttpResult MozartApi::expand(const ConnectionSettings &target, const QString &jid) const
{
    return m_http.postJson(target,
                           QStringLiteral("/api/v1/beolink/expand/%1").arg(encodeSegment(jid)),
                           {},
                           m_timeoutMs);
}

HttpResult MozartApi::unexpand(const ConnectionSettings &target, const QString &jid) const
{
    return m_http.postJson(target,
                           QStringLiteral("/api/v1/beolink/unexpand/%1").arg(encodeSegment(jid)),
                           {},
                           m_timeoutMs);
}

HttpResult MozartApi::leave(const ConnectionSettings &target) const
{
    return m_http.postJson(target, QStringLiteral("/api/v1/beolink/leave"), {}, m_timeoutMs);
}

HttpResult MozartApi::allStandby(const ConnectionSettings &target) const
{
    return m_http.postJson(target, QStringLiteral("/api/v1/beolink/allstandby"), {}, m_timeoutMs);
}

HttpResult MozartApi::standby(const ConnectionSettings &target) const
{
    return m_http.postJson(target, QStringLiteral("/api/v1/power/standby"), {}, m_timeoutMs);
}

HttpResult MozartApi::playbackCommand(const ConnectionSettings &target, const QString &command) const
{
    return m_http.postJson(target,
                           QStringLiteral("/api/v1/playback/command?command=%1").arg(encodeSegment(command)),
                           {},
                           m_timeoutMs);
}

HttpResult MozartApi::seek(const ConnectionSettings &target, qint64 positionMs) const
{
    return m_http.postJson(target,
                           QStringLiteral("/api/v1/playback/command/seek?positionMs=%1").arg(positionMs),
                           {},
                           m_timeoutMs);
}

HttpResult MozartApi::volume(const ConnectionSettings &target) const
{
    return m_http.get(target, QStringLiteral("/api/v1/playback/volume"), m_timeoutMs);
}

HttpResult MozartApi::setVolumeLevel(const ConnectionSettings &target, int level) const
{
    QJsonObject body;
    body.insert(QStringLiteral("level"), std::clamp(level, 0, 100));
    return m_http.postJson(target, QStringLiteral("/api/v1/playback/volume/level"), compact(body), m_timeoutMs);
}

HttpResult MozartApi::setMuted(const ConnectionSettings &target, bool muted) const
{
    QJsonObject body;
    body.insert(QStringLiteral("muted"), muted);
    return m_http.postJson(target, QStringLiteral("/api/v1/playback/volume/mute"), compact(body), m_timeoutMs);
}

HttpResult MozartApi::sources(const ConnectionSettings &target) const
{
    return m_http.get(target, QStringLiteral("/api/v1/playback/sources"), m_timeoutMs);
}

HttpResult MozartApi::setActiveSource(const ConnectionSettings &target, const QString &sourceId) const
{
    return m_http.postJson(target,
                           QStringLiteral("/api/v1/playback/sources/active/%1").arg(encodeSegment(sourceId)),
                           {},
                           m_timeoutMs);
}

HttpResult MozartApi::playbackMetadata(const ConnectionSettings &target) const
{
    return m_http.get(target, QStringLiteral("/api/v1/playback/metadata"), m_timeoutMs);
}

QString MozartApi::errorDetail(const HttpResult &result, const QString &fallback)
{
    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (doc.isObject()) {
        const QJsonObject obj = doc.object();
        for (const QString &key : {QStringLiteral("message"), QStringLiteral("error"), QStringLiteral("errorCode")}) {
            const QString text = obj.value(key).toVariant().toString().trimmed();
            if (!text.isEmpty())
                return text;
        }
    }
    if (!result.error.isEmpty())
        return result.error;
    return fallback;
}

QJsonObject MozartApi::objectPayload(const HttpResult &result)
{
    return QJsonDocument::fromJson(result.payload).object();
}

QJsonArray MozartApi::arrayPayload(const HttpResult &result)
{
    return QJsonDocument::fromJson(result.payload).array();
}

} // namespace phicore::beo
