#include "beo_dispatcher.h"

#include "beo_log.h"

namespace phicore::beo {

NotificationDispatcher::NotificationDispatcher(QObject *parent)
    : QObject(parent)
{
}

bool NotificationDispatcher::handleFrame(const QByteArray &frame)
{
    ++m_stats.received;

    QString error;
    const auto notification = parseNotification(frame, &error);
    if (!notification) {
        ++m_stats.dropped;
        qCWarning(beoSocketLog).noquote()
            << "Dropping notification from" << m_deviceName << ":" << error;
        return false;
    }

    qCDebug(beoSocketLog).noquote() << m_deviceName << "notification"
                                    << notificationKindName(notificationKind(*notification))
                                    << QString::fromUtf8(frame);
    dispatch(*notification);
    return true;
}

void NotificationDispatcher::dispatch(const RawNotification &notification)
{
    if (const auto *ignored = std::get_if<IgnoredNotification>(&notification)) {
        ++m_stats.ignored;
        qCDebug(beoSocketLog).noquote() << m_deviceName << "ignoring" << ignored->type;
        return;
    }
    ++m_stats.dispatched;

    switch (notificationKind(notification)) {
    case NotificationKind::Button:
        emit buttonNotification(std::get<ButtonNotification>(notification));
        break;
    case NotificationKind::Wheel:
        emit wheelNotification(std::get<WheelNotification>(notification));
        break;
    case NotificationKind::SourceChange:
        emit sourceChanged(std::get<SourceChange>(notification));
        break;
    case NotificationKind::Volume:
        emit volumeChanged(std::get<VolumeChange>(notification));
        break;
    case NotificationKind::PlaybackState:
        emit playbackStateChanged(std::get<PlaybackState>(notification));
        break;
    case NotificationKind::PlaybackProgress:
        emit playbackProgressChanged(std::get<PlaybackProgress>(notification));
        break;
    case NotificationKind::PlaybackMetadata:
        emit playbackMetadataChanged(std::get<PlaybackMetadata>(notification));
        break;
    case NotificationKind::PlaybackError:
        qCWarning(beoLog).noquote() << m_deviceName << "playback error:"
                                    << std::get<PlaybackError>(notification).error;
        emit playbackErrorReceived(std::get<PlaybackError>(notification));
        break;
    case NotificationKind::Beolink:
        emit beolinkChanged(std::get<BeolinkChange>(notification));
        break;
    case NotificationKind::SoftwareUpdateState:
        emit softwareUpdateStateChanged(std::get<SoftwareUpdateState>(notification));
        break;
    case NotificationKind::Battery:
        emit batteryChanged(std::get<BatteryState>(notification));
        break;
    case NotificationKind::Notification:
        emit deviceNotification(std::get<DeviceNotification>(notification));
        break;
    case NotificationKind::Ignored:
        break;
    }
}

void NotificationDispatcher::handleTransportClosed(bool requested)
{
    if (requested) {
        emit streamFinished();
        return;
    }
    emit connectionLost();
}

} // namespace phicore::beo
