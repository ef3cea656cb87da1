#include "beo_device.h"

#include <QTimer>
#include <QUrl>

#include "beo_log.h"

namespace phicore::beo {

BeoDevice::BeoDevice(const DeviceConfig &config,
                     const AdapterConfig &adapterConfig,
                     const DeviceDirectory &directory,
                     QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_http(&m_network)
    , m_api(m_http, adapterConfig.requestTimeoutMs)
    , m_coordinator(config.jid, config.rest, directory, m_api)
{
    for (std::size_t i = 0; i < adapterConfig.pressTimings.size(); ++i)
        m_classifier.setTimings(static_cast<ControlClass>(i), adapterConfig.pressTimings[i]);
    m_debouncer.setQuietPeriodMs(adapterConfig.wheelQuietMs);

    QUrl url;
    url.setScheme(QStringLiteral("ws"));
    url.setHost(HttpClient::effectiveHost(config.rest));
    url.setPort(config.notificationPort);
    url.setPath(QStringLiteral("/"));
    m_supervisor.setUrl(url);
    m_supervisor.setRetryPolicy(adapterConfig.retry);
    m_supervisor.setDeviceName(config.displayName());
    m_dispatcher.setDeviceName(config.displayName());

    m_wheelReset.setSingleShot(true);
    m_wheelReset.setInterval(kWheelResetMs);
    connect(&m_wheelReset, &QTimer::timeout, this, [this]() {
        emit wheelValueChanged(0);
    });

    wireSignals();
}

BeoDevice::~BeoDevice()
{
    stop();
}

void BeoDevice::start()
{
    m_supervisor.start();
}

void BeoDevice::stop()
{
    if (m_supervisor.state() == ConnectionState::Stopped)
        return;
    m_supervisor.stop();
    m_http.abortPending();
}

void BeoDevice::wireSignals()
{
    connect(&m_supervisor, &ConnectionSupervisor::frameReceived, &m_dispatcher, &NotificationDispatcher::handleFrame);
    connect(&m_supervisor, &ConnectionSupervisor::connectionLost, this, [this]() {
        m_dispatcher.handleTransportClosed(false);
    });
    connect(&m_supervisor, &ConnectionSupervisor::stopped, this, [this]() {
        m_dispatcher.handleTransportClosed(true);
    });
    connect(&m_supervisor, &ConnectionSupervisor::availabilityChanged, this, [this](bool available) {
        emit availabilityChanged(available);
        if (available)
            QTimer::singleShot(0, this, &BeoDevice::syncAfterConnect);
    });

    connect(&m_dispatcher, &NotificationDispatcher::connectionLost, this, &BeoDevice::resetEventState);
    connect(&m_dispatcher, &NotificationDispatcher::streamFinished, this, &BeoDevice::resetEventState);

    connect(&m_dispatcher, &NotificationDispatcher::buttonNotification, this,
            [this](const ButtonNotification &notification) {
        if (notification.isClassified()) {
            for (ButtonPhase phase : notification.phases)
                emit buttonEvent(ButtonEvent{notification.controlId, phase});
            return;
        }
        m_classifier.classify(notification.controlId, notification.pressed, monotonicMs());
    });
    connect(&m_dispatcher, &NotificationDispatcher::wheelNotification, this,
            [this](const WheelNotification &notification) {
        m_debouncer.accumulate(notification.controlId, notification.delta, monotonicMs());
    });
    connect(&m_dispatcher, &NotificationDispatcher::beolinkChanged,
            &m_coordinator, &GroupCoordinator::applyBeolinkChange);
    connect(&m_dispatcher, &NotificationDispatcher::playbackMetadataChanged,
            &m_coordinator, &GroupCoordinator::applyPlaybackMetadata);
    connect(&m_dispatcher, &NotificationDispatcher::deviceNotification,
            &m_coordinator, &GroupCoordinator::handleDeviceNotification);
    connect(&m_dispatcher, &NotificationDispatcher::playbackStateChanged, this, [this](const PlaybackState &state) {
        m_coordinator.setPlaybackState(state);
        emit playbackStateChanged(state);
    });
    connect(&m_dispatcher, &NotificationDispatcher::sourceChanged, this, [this](const SourceChange &source) {
        m_coordinator.setCurrentSource(source);
        emit sourceChanged(source);
    });

    connect(&m_dispatcher, &NotificationDispatcher::volumeChanged, this, &BeoDevice::volumeChanged);
    connect(&m_dispatcher, &NotificationDispatcher::playbackProgressChanged, this, &BeoDevice::playbackProgressChanged);
    connect(&m_dispatcher, &NotificationDispatcher::playbackErrorReceived, this, &BeoDevice::playbackErrorReceived);
    connect(&m_dispatcher, &NotificationDispatcher::softwareUpdateStateChanged,
            this, &BeoDevice::softwareUpdateStateChanged);
    connect(&m_dispatcher, &NotificationDispatcher::batteryChanged, this, &BeoDevice::batteryChanged);

    connect(&m_classifier, &ButtonClassifier::buttonEvent, this, &BeoDevice::buttonEvent);
    connect(&m_debouncer, &WheelDebouncer::rotation, this, &BeoDevice::onRotation);
    connect(&m_coordinator, &GroupCoordinator::topologyChanged, this, &BeoDevice::topologyChanged);
}

void BeoDevice::resetEventState()
{
    m_classifier.reset();
    m_debouncer.reset();
    if (m_wheelReset.isActive()) {
        m_wheelReset.stop();
        emit wheelValueChanged(0);
    }
}

void BeoDevice::onRotation(const RotationEvent &event)
{
    emit wheelValueChanged(event.signedMagnitude());
    m_wheelReset.start();
}

void BeoDevice::syncAfterConnect()
{
    if (!isAvailable())
        return;

    if (m_coordinator.selfJid().isEmpty()) {
        const HttpResult self = m_api.beolinkSelf(m_config.rest);
        if (const auto peer = parseBeolinkPeer(MozartApi::objectPayload(self))) {
            m_config.jid = peer->jid;
            m_coordinator.setSelfJid(peer->jid);
        } else {
            qCWarning(beoLinkLog).noquote() << "Could not read the Beolink JID of" << m_config.displayName();
        }
    }

    QString error;
    if (!m_coordinator.refreshSources(&error))
        qCWarning(beoLog).noquote() << "Reading sources of" << m_config.displayName()
                                    << "failed, using defaults:" << error;
    emit sourcesRefreshed(m_coordinator.knownSources());
    if (!m_coordinator.refreshTopology(&error))
        qCWarning(beoLinkLog).noquote() << "Reading Beolink topology of" << m_config.displayName()
                                        << "failed:" << error;

    const HttpResult volume = m_api.volume(m_config.rest);
    if (volume.ok) {
        if (const auto state = parseVolumeState(MozartApi::objectPayload(volume)))
            emit volumeChanged(*state);
    }
}

} // namespace phicore::beo
