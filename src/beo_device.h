#pragma once

#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QTimer>

#include "beo_api.h"
#include "beo_button_classifier.h"
#include "beo_config.h"
#include "beo_dispatcher.h"
#include "beo_group.h"
#include "beo_http.h"
#include "beo_supervisor.h"
#include "beo_wheel_debouncer.h"

namespace phicore::beo {

// How long the wheel value shows a rotation before it falls back to 0.
inline constexpr int kWheelResetMs = 200;

// One Mozart device session: its notification channel, the event
// classification behind it and its Beolink coordinator. Instances are
// independent of each other apart from the shared, read-only directory.
class BeoDevice : public QObject
{
    Q_OBJECT

public:
    BeoDevice(const DeviceConfig &config,
              const AdapterConfig &adapterConfig,
              const DeviceDirectory &directory,
              QObject *parent = nullptr);
    ~BeoDevice() override;

    const DeviceConfig &config() const { return m_config; }
    QString externalId() const { return m_config.externalId(); }

    void start();
    void stop();
    bool isAvailable() const { return m_supervisor.isAvailable(); }

    GroupCoordinator &coordinator() { return m_coordinator; }
    ButtonClassifier &classifier() { return m_classifier; }
    ConnectionSupervisor &supervisor() { return m_supervisor; }

signals:
    void availabilityChanged(bool available);
    void buttonEvent(const phicore::beo::ButtonEvent &event);
    // Signed magnitude of the last rotation, then 0 once it has settled.
    void wheelValueChanged(int value);
    void topologyChanged(const phicore::beo::BeolinkSession &session);
    void volumeChanged(const phicore::beo::VolumeState &volume);
    void sourceChanged(const phicore::beo::SourceChange &source);
    void playbackStateChanged(const phicore::beo::PlaybackState &state);
    void playbackProgressChanged(const phicore::beo::PlaybackProgress &progress);
    void playbackErrorReceived(const phicore::beo::PlaybackError &error);
    void softwareUpdateStateChanged(const phicore::beo::SoftwareUpdateState &state);
    void batteryChanged(const phicore::beo::BatteryState &battery);
    void sourcesRefreshed(const QList<phicore::beo::SourceInfo> &sources);

private:
    void wireSignals();
    void resetEventState();
    void onRotation(const RotationEvent &event);
    void syncAfterConnect();

    DeviceConfig m_config;
    QNetworkAccessManager m_network;
    HttpClient m_http;
    MozartApi m_api;

    ButtonClassifier m_classifier;
    WheelDebouncer m_debouncer;
    NotificationDispatcher m_dispatcher;
    ConnectionSupervisor m_supervisor;
    GroupCoordinator m_coordinator;
    QTimer m_wheelReset;
};

} // namespace phicore::beo
