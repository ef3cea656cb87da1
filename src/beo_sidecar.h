#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QString>

#include "beo_api.h"
#include "beo_config.h"
#include "beo_device.h"
#include "beo_group.h"
#include "beo_http.h"
#include "beo_model.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::beo {

class BeoSidecar final : public phicore::adapter::sdk::AdapterSidecar
{
public:
    BeoSidecar();
    ~BeoSidecar() override;

    void tick();
    // Stops every device session; the host connection stays untouched.
    void shutdown();

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;
    phicore::adapter::v1::CmdResponse onDeviceNameUpdate(
        const phicore::adapter::sdk::DeviceNameUpdateRequest &request) override;
    phicore::adapter::v1::CmdResponse onSceneInvoke(
        const phicore::adapter::sdk::SceneInvokeRequest &request) override;

    phicore::adapter::v1::Utf8String displayName() const override;
    phicore::adapter::v1::Utf8String description() const override;
    phicore::adapter::v1::Utf8String iconSvg() const override;
    phicore::adapter::v1::Utf8String apiVersion() const override;
    int timeoutMs() const override;
    phicore::adapter::v1::AdapterCapabilities capabilities() const override;
    phicore::adapter::v1::JsonText configSchemaJson() const override;

private:
    using CmdResponse = phicore::adapter::v1::CmdResponse;
    using ActionResponse = phicore::adapter::v1::ActionResponse;
    using CmdStatus = phicore::adapter::v1::CmdStatus;

    struct DeviceSlot {
        std::unique_ptr<BeoDevice> session;
        DeviceEntry entry;
    };

    static std::int64_t nowMs();

    void applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter);
    void rebuildDevices();
    void teardownDevices();
    void resolveIdentity(DeviceConfig *config);
    void connectDevice(const QString &deviceId, BeoDevice *device);

    void publish(const QString &deviceId, const std::string &channelId, const phicore::adapter::v1::ScalarValue &value);
    void publishButton(const QString &deviceId, const ButtonEvent &event);
    void publishDevice(const DeviceSlot &slot);
    void updateConnectionState();
    void setConnectionState(bool connected);

    DeviceSlot *findSlot(const QString &deviceId);
    DeviceSlot *slotForAction(const QJsonObject &params, QString *error);

    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeBeolink(const QString &actionId,
                                 const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;
    ActionResponse actionResponse(std::uint64_t cmdId, const CommandResult &result) const;

    QNetworkAccessManager m_network;
    HttpClient m_http;
    MozartApi m_api;

    phicore::adapter::v1::Adapter m_adapterInfo;
    ConnectionSettings m_settings;
    QJsonObject m_meta;
    AdapterConfig m_config;

    bool m_connected = false;
    bool m_hasBootstrap = false;
    bool m_devicesDirty = false;

    DeviceDirectory m_directory;
    std::map<QString, DeviceSlot> m_devices;
};

} // namespace phicore::beo
