#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;

namespace phicore::beo {

struct ConnectionSettings {
    QString host;
    QString ip;
    int port = 0;
    bool useTls = false;
};

// Outcome of one REST call. A non-2xx answer keeps its body in payload.
struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);
    virtual ~HttpClient() = default;

    HttpResult get(const ConnectionSettings &settings,
                   const QString &path,
                   int timeoutMs = 10000) const;

    HttpResult postJson(const ConnectionSettings &settings,
                        const QString &path,
                        const QByteArray &payload = {},
                        int timeoutMs = 10000) const;

    // Aborts every reply still owned by the manager. Blocked callers
    // return with an "Operation canceled" error.
    void abortPending() const;

    static QString effectiveHost(const ConnectionSettings &settings);

protected:
    virtual HttpResult send(const ConnectionSettings &settings,
                            const QByteArray &method,
                            const QString &path,
                            const QByteArray &payload,
                            int timeoutMs) const;

    static QUrl requestUrl(const ConnectionSettings &settings, const QString &path, QString *error = nullptr);

private:
    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace phicore::beo
