#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "beo_http.h"

namespace phicore::beo {

// Typed access to the Mozart REST endpoints the adapter uses. Every call is
// addressed explicitly so commands can be sent to a peer device.
class MozartApi
{
public:
    explicit MozartApi(const HttpClient &http, int timeoutMs = 10000);

    void setTimeoutMs(int timeoutMs);
    int timeoutMs() const { return m_timeoutMs; }

    HttpResult beolinkSelf(const ConnectionSettings &target) const;
    HttpResult beolinkPeers(const ConnectionSettings &target) const;
    HttpResult beolinkListeners(const ConnectionSettings &target) const;
    HttpResult joinLatestExperience(const ConnectionSettings &target) const;
    HttpResult joinPeer(const ConnectionSettings &target, const QString &jid, const QString &sourceId = {}) const;
    HttpResult expand(const ConnectionSettings &target, const QString &jid) const;
    HttpResult unexpand(const ConnectionSettings &target, const QString &jid) const;
    HttpResult leave(const ConnectionSettings &target) const;
    // The device puts its whole Beolink session into standby.
    HttpResult allStandby(const ConnectionSettings &target) const;

    HttpResult standby(const ConnectionSettings &target) const;
    HttpResult playbackCommand(const ConnectionSettings &target, const QString &command) const;
    HttpResult seek(const ConnectionSettings &target, qint64 positionMs) const;
    HttpResult volume(const ConnectionSettings &target) const;
    HttpResult setVolumeLevel(const ConnectionSettings &target, int level) const;
    HttpResult setMuted(const ConnectionSettings &target, bool muted) const;
    HttpResult sources(const ConnectionSettings &target) const;
    HttpResult setActiveSource(const ConnectionSettings &target, const QString &sourceId) const;
    HttpResult playbackMetadata(const ConnectionSettings &target) const;

    // Remote-provided detail of a failed call, falling back to the
    // transport error.
    static QString errorDetail(const HttpResult &result, const QString &fallback = {});
    static QJsonObject objectPayload(const HttpResult &result);
    static QJsonArray arrayPayload(const HttpResult &result);

private:
    const HttpClient &m_http;
    int m_timeoutMs = 10000;
};

} // namespace phicore::beo
