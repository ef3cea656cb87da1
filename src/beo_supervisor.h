#pragma once

#include <QAbstractSocket>
#include <QByteArray>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUrl>

class QWebSocket;

namespace phicore::beo {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Stopped
};

struct RetryPolicy {
    int fastRetryDelayMs = 2000;
    int fastRetryCount = 5;
    int retryIntervalMs = 10000;
    int connectTimeoutMs = 5000;
    int pingIntervalMs = 10000;
    int pongTimeoutMs = 5000;
};

const char *connectionStateName(ConnectionState state);

// Owns the notification WebSocket of one device: connects, keeps it alive
// with ping/pong, and reconnects after every drop that was not asked for.
// Availability is emitted once per change.
class ConnectionSupervisor : public QObject
{
    Q_OBJECT

public:
    explicit ConnectionSupervisor(QObject *parent = nullptr);
    ~ConnectionSupervisor() override;

    void setUrl(const QUrl &url) { m_url = url; }
    QUrl url() const { return m_url; }
    void setDeviceName(const QString &name) { m_deviceName = name; }
    void setRetryPolicy(const RetryPolicy &policy);
    RetryPolicy retryPolicy() const { return m_policy; }

    void start();
    // Terminal: cancels the reconnect and liveness timers and closes the socket.
    void stop();

    ConnectionState state() const { return m_state; }
    bool isAvailable() const { return m_state == ConnectionState::Connected; }
    int reconnectAttempts() const { return m_reconnectAttempts; }

signals:
    void stateChanged(phicore::beo::ConnectionState state);
    void availabilityChanged(bool available);
    void frameReceived(const QByteArray &frame);
    void connectionLost();
    void stopped();

private:
    void openSocket();
    void releaseSocket(bool graceful);
    void onSocketConnected();
    void onSocketStateChanged(QAbstractSocket::SocketState socketState);
    void onSocketError(QAbstractSocket::SocketError error);
    void sendPing();
    void handleDrop(const QString &reason);
    void scheduleReconnect();
    void stopTimers();
    void setState(ConnectionState state);

    QUrl m_url;
    QString m_deviceName;
    RetryPolicy m_policy;
    ConnectionState m_state = ConnectionState::Disconnected;
    int m_reconnectAttempts = 0;

    QWebSocket *m_socket = nullptr;
    QTimer m_reconnectTimer;
    QTimer m_connectTimer;
    QTimer m_pingTimer;
    QTimer m_pongTimer;
};

} // namespace phicore::beo
