#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>

#include "beo_notification.h"

namespace phicore::beo {

// Demultiplexes the frames of one device's notification channel. Every
// notification kind has exactly one outgoing signal; frames are handled in
// arrival order and a frame that fails to parse is dropped on its own.
class NotificationDispatcher : public QObject
{
    Q_OBJECT

public:
    struct Stats {
        quint64 received = 0;
        quint64 dispatched = 0;
        quint64 dropped = 0;
        // Well-formed kinds the adapter consumes without acting on them.
        quint64 ignored = 0;
    };

    explicit NotificationDispatcher(QObject *parent = nullptr);

    void setDeviceName(const QString &name) { m_deviceName = name; }

    // Returns false when the frame was dropped.
    bool handleFrame(const QByteArray &frame);
    void dispatch(const RawNotification &notification);

    // End of the stream: a requested shutdown finishes it, anything else
    // is reported as a lost connection.
    void handleTransportClosed(bool requested);

    Stats stats() const { return m_stats; }

signals:
    void buttonNotification(const phicore::beo::ButtonNotification &notification);
    void wheelNotification(const phicore::beo::WheelNotification &notification);
    void sourceChanged(const phicore::beo::SourceChange &change);
    void volumeChanged(const phicore::beo::VolumeState &volume);
    void playbackStateChanged(const phicore::beo::PlaybackState &state);
    void playbackProgressChanged(const phicore::beo::PlaybackProgress &progress);
    void playbackMetadataChanged(const phicore::beo::PlaybackMetadata &metadata);
    void playbackErrorReceived(const phicore::beo::PlaybackError &error);
    void beolinkChanged(const phicore::beo::BeolinkChange &change);
    void softwareUpdateStateChanged(const phicore::beo::SoftwareUpdateState &state);
    void batteryChanged(const phicore::beo::BatteryState &battery);
    void deviceNotification(const phicore::beo::DeviceNotification &notification);

    void streamFinished();
    void connectionLost();

private:
    QString m_deviceName;
    Stats m_stats;
};

} // namespace phicore::beo
