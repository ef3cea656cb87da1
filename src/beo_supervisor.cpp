#include "beo_supervisor.h"

#include <algorithm>

#include <QWebSocket>

#include "beo_log.h"

namespace phicore::beo {

const char *connectionStateName(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Stopped:
        return "stopped";
    }
    return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(QObject *parent)
    : QObject(parent)
{
    m_reconnectTimer.setSingleShot(true);
    m_connectTimer.setSingleShot(true);
    m_pongTimer.setSingleShot(true);

    connect(&m_reconnectTimer, &QTimer::timeout, this, &ConnectionSupervisor::openSocket);
    connect(&m_connectTimer, &QTimer::timeout, this, [this]() {
        handleDrop(QStringLiteral("connect timed out"));
    });
    connect(&m_pingTimer, &QTimer::timeout, this, &ConnectionSupervisor::sendPing);
    connect(&m_pongTimer, &QTimer::timeout, this, [this]() {
        handleDrop(QStringLiteral("no pong within %1 ms").arg(m_policy.pongTimeoutMs));
    });
}

ConnectionSupervisor::~ConnectionSupervisor()
{
    stopTimers();
    m_reconnectTimer.stop();
    releaseSocket(false);
}

void ConnectionSupervisor::setRetryPolicy(const RetryPolicy &policy)
{
    m_policy = policy;
    m_policy.fastRetryDelayMs = std::max(1, policy.fastRetryDelayMs);
    m_policy.fastRetryCount = std::max(0, policy.fastRetryCount);
    m_policy.retryIntervalMs = std::max(1, policy.retryIntervalMs);
    m_policy.connectTimeoutMs = std::max(1, policy.connectTimeoutMs);
    m_policy.pingIntervalMs = std::max(0, policy.pingIntervalMs);
    m_policy.pongTimeoutMs = std::max(1, policy.pongTimeoutMs);
}

void ConnectionSupervisor::start()
{
    if (m_state == ConnectionState::Stopped) {
        qCWarning(beoSocketLog).noquote() << "Supervisor for" << m_deviceName << "is stopped; not starting";
        return;
    }
    if (m_state != ConnectionState::Disconnected || m_reconnectTimer.isActive())
        return;

    m_reconnectAttempts = 0;
    openSocket();
}

void ConnectionSupervisor::stop()
{
    if (m_state == ConnectionState::Stopped)
        return;

    stopTimers();
    m_reconnectTimer.stop();
    releaseSocket(true);
    setState(ConnectionState::Stopped);
    qCInfo(beoSocketLog).noquote() << "Closed the" << m_deviceName << "notification channel";
    emit stopped();
}

void ConnectionSupervisor::openSocket()
{
    if (m_state == ConnectionState::Stopped)
        return;

    releaseSocket(false);

    m_socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
    connect(m_socket, &QWebSocket::connected, this, &ConnectionSupervisor::onSocketConnected);
    connect(m_socket, &QWebSocket::stateChanged, this, &ConnectionSupervisor::onSocketStateChanged);
    connect(m_socket, &QWebSocket::errorOccurred, this, &ConnectionSupervisor::onSocketError);
    connect(m_socket, &QWebSocket::textMessageReceived, this, [this](const QString &message) {
        m_pongTimer.stop();
        emit frameReceived(message.toUtf8());
    });
    connect(m_socket, &QWebSocket::binaryMessageReceived, this, [this](const QByteArray &message) {
        m_pongTimer.stop();
        emit frameReceived(message);
    });
    connect(m_socket, &QWebSocket::pong, this, [this](quint64, const QByteArray &) {
        m_pongTimer.stop();
    });

    setState(ConnectionState::Connecting);
    m_connectTimer.start(m_policy.connectTimeoutMs);
    qCDebug(beoSocketLog).noquote() << "Connecting to" << m_url.toString();
    m_socket->open(m_url);
}

void ConnectionSupervisor::releaseSocket(bool graceful)
{
    if (!m_socket)
        return;

    QWebSocket *socket = m_socket;
    m_socket = nullptr;
    socket->disconnect(this);
    if (graceful && socket->state() == QAbstractSocket::ConnectedState)
        socket->close();
    else
        socket->abort();
    socket->deleteLater();
}

void ConnectionSupervisor::onSocketConnected()
{
    m_connectTimer.stop();
    m_reconnectAttempts = 0;
    setState(ConnectionState::Connected);
    qCInfo(beoSocketLog).noquote() << "Connected to the" << m_deviceName << "notification channel";
    if (m_policy.pingIntervalMs > 0)
        m_pingTimer.start(m_policy.pingIntervalMs);
}

void ConnectionSupervisor::onSocketStateChanged(QAbstractSocket::SocketState socketState)
{
    if (socketState == QAbstractSocket::UnconnectedState)
        handleDrop(QStringLiteral("socket closed"));
}

void ConnectionSupervisor::onSocketError(QAbstractSocket::SocketError error)
{
    Q_UNUSED(error);
    if (m_socket)
        qCDebug(beoSocketLog).noquote() << m_deviceName << "socket error:" << m_socket->errorString();
}

void ConnectionSupervisor::sendPing()
{
    if (!m_socket || m_state != ConnectionState::Connected)
        return;
    m_socket->ping();
    if (!m_pongTimer.isActive())
        m_pongTimer.start(m_policy.pongTimeoutMs);
}

void ConnectionSupervisor::handleDrop(const QString &reason)
{
    if (m_state == ConnectionState::Stopped || m_state == ConnectionState::Disconnected)
        return;

    const bool wasConnected = m_state == ConnectionState::Connected;
    stopTimers();
    releaseSocket(false);
    setState(ConnectionState::Disconnected);

    if (wasConnected) {
        qCWarning(beoSocketLog).noquote() << "Lost connection to the" << m_deviceName << "(" << reason << ")";
        emit connectionLost();
    } else {
        qCDebug(beoSocketLog).noquote() << "Connecting to" << m_deviceName << "failed:" << reason;
    }

    scheduleReconnect();
}

void ConnectionSupervisor::scheduleReconnect()
{
    if (m_state == ConnectionState::Stopped || m_reconnectTimer.isActive())
        return;

    int delayMs = m_policy.retryIntervalMs;
    if (m_reconnectAttempts < m_policy.fastRetryCount) {
        delayMs = m_policy.fastRetryDelayMs;
        qCInfo(beoSocketLog).noquote() << "Reconnecting to" << m_deviceName << "(attempt"
                                       << (m_reconnectAttempts + 1) << "of" << m_policy.fastRetryCount << ")";
    } else {
        qCWarning(beoSocketLog).noquote() << m_deviceName << "still unreachable after" << m_reconnectAttempts
                                          << "attempts; retrying in" << delayMs << "ms";
    }
    ++m_reconnectAttempts;
    m_reconnectTimer.start(delayMs);
}

void ConnectionSupervisor::stopTimers()
{
    m_connectTimer.stop();
    m_pingTimer.stop();
    m_pongTimer.stop();
}

void ConnectionSupervisor::setState(ConnectionState state)
{
    if (m_state == state)
        return;

    const bool wasAvailable = isAvailable();
    qCDebug(beoSocketLog).noquote() << m_deviceName << connectionStateName(m_state) << "->" << connectionStateName(state);
    m_state = state;
    emit stateChanged(m_state);
    if (wasAvailable != isAvailable())
        emit availabilityChanged(isAvailable());
}

} // namespace phicore::beo
