#include "beo_http.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

#include "beo_log.h"

namespace phicore::beo {

namespace {

constexpr int kDefaultTimeoutMs = 10000;

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QString HttpClient::effectiveHost(const ConnectionSettings &settings)
{
    const QString host = settings.host.trimmed();
    if (!host.isEmpty())
        return host;
    return settings.ip.trimmed();
}

QUrl HttpClient::requestUrl(const ConnectionSettings &settings, const QString &path, QString *error)
{
    const QString host = effectiveHost(settings);
    if (host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Device host is empty");
        return {};
    }

    // Paths carry their query inline, e.g. "/api/v1/playback/command?command=play".
    const int queryIndex = path.indexOf(QLatin1Char('?'));
    const QString pathPart = queryIndex >= 0 ? path.left(queryIndex) : path;

    QUrl url;
    url.setScheme(settings.useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(host);
    url.setPort(settings.port > 0 ? settings.port : (settings.useTls ? 443 : 80));
    if (pathPart.startsWith(QLatin1Char('/')))
        url.setPath(pathPart);
    else
        url.setPath(QStringLiteral("/") + pathPart);
    if (queryIndex >= 0)
        url.setQuery(QUrlQuery(path.mid(queryIndex + 1)));
    return url;
}

HttpResult HttpClient::get(const ConnectionSettings &settings,
                           const QString &path,
                           int timeoutMs) const
{
    return send(settings, QByteArrayLiteral("GET"), path, {}, timeoutMs);
}

HttpResult HttpClient::postJson(const ConnectionSettings &settings,
                                const QString &path,
                                const QByteArray &payload,
                                int timeoutMs) const
{
    return send(settings, QByteArrayLiteral("POST"), path, payload, timeoutMs);
}

void HttpClient::abortPending() const
{
    if (!m_manager)
        return;
    const QList<QNetworkReply *> replies = m_manager->findChildren<QNetworkReply *>();
    for (QNetworkReply *reply : replies) {
        if (reply->isRunning())
            reply->abort();
    }
}

HttpResult HttpClient::send(const ConnectionSettings &settings,
                            const QByteArray &method,
                            const QString &path,
                            const QByteArray &payload,
                            int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    const QUrl url = requestUrl(settings, path, &result.error);
    if (!url.isValid() || url.host().isEmpty()) {
        if (result.error.isEmpty())
            result.error = QStringLiteral("Invalid request URL for %1").arg(path);
        return result;
    }

    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");
    request.setRawHeader("User-Agent", "phi-adapter-beo-ipc/1.0");
    if (method == QByteArrayLiteral("POST"))
        request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
#if QT_CONFIG(ssl)
    if (settings.useTls) {
        // Mozart devices present self-signed certificates.
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        request.setSslConfiguration(ssl);
    }
#endif

    QElapsedTimer elapsed;
    elapsed.start();

    QNetworkReply *reply = method == QByteArrayLiteral("POST")
        ? m_manager->post(request, payload)
        : m_manager->get(request);
    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QPointer<QNetworkReply> guard(reply);
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs);
    loop.exec();

    if (!guard) {
        result.error = QStringLiteral("Request canceled");
        return result;
    }

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out after %1 ms").arg(elapsed.elapsed());
        qCDebug(beoLog).noquote() << method << url.toString() << "timed out";
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();
    qCDebug(beoLog).noquote() << method << url.toString() << "->" << result.statusCode
                              << "in" << elapsed.elapsed() << "ms";

    if (result.statusCode >= 200 && result.statusCode < 300 && reply->error() == QNetworkReply::NoError) {
        result.ok = true;
    } else if (result.statusCode > 0) {
        // The device explains rejected commands in the JSON body; keep it for the caller.
        const QString reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        result.error = reason.isEmpty() ? QStringLiteral("HTTP %1").arg(result.statusCode)
                                        : QStringLiteral("HTTP %1 %2").arg(result.statusCode).arg(reason);
    } else {
        result.error = reply->errorString();
    }

    reply->deleteLater();
    return result;
}

} // namespace phicore::beo
