#include "beo_sidecar.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <optional>
#include <utility>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

#include "beo_log.h"
#include "beo_probe.h"
#include "beo_schema.h"

namespace phicore::beo {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

QJsonObject parseParams(const std::string &paramsJson)
{
    if (paramsJson.empty())
        return {};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(paramsJson));
    return doc.isObject() ? doc.object() : QJsonObject{};
}

QStringList readJidList(const QJsonObject &params)
{
    QStringList out;
    const QJsonValue value = params.value(QStringLiteral("jids"));
    if (value.isString()) {
        const QStringList parts = value.toString().split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString &part : parts)
            out.append(part.trimmed());
        return out;
    }
    const QJsonArray array = value.toArray();
    for (const QJsonValue &entry : array) {
        const QString jid = entry.toString().trimmed();
        if (!jid.isEmpty())
            out.append(jid);
    }
    return out;
}

} // namespace

BeoSidecar::BeoSidecar()
    : m_http(&m_network)
    , m_api(m_http)
{
}

BeoSidecar::~BeoSidecar()
{
    teardownDevices();
}

void BeoSidecar::tick()
{
    if (!m_hasBootstrap || !m_devicesDirty)
        return;
    rebuildDevices();
}

void BeoSidecar::shutdown()
{
    m_devicesDirty = false;
    m_hasBootstrap = false;
    teardownDevices();
    m_directory = DeviceDirectory();
}

void BeoSidecar::onConnected()
{
    std::cerr << "beo-ipc connected" << '\n';
}

void BeoSidecar::onDisconnected()
{
    setConnectionState(false);
    std::cerr << "beo-ipc disconnected" << '\n';
}

void BeoSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);
    applyBootstrapAdapter(request.adapter);

    AdapterConfig config;
    QString error;
    if (!parseAdapterConfig(m_meta, m_settings, &config, &error)) {
        qCWarning(beoLog).noquote() << "Invalid adapter configuration:" << error;
        sendError(error.toStdString());
        teardownDevices();
        m_hasBootstrap = false;
        return;
    }

    m_config = config;
    m_api.setTimeoutMs(m_config.requestTimeoutMs);
    m_hasBootstrap = true;
    m_devicesDirty = true;

    std::cerr << "beo-ipc bootstrap adapterId=" << request.adapterId
              << " externalId=" << request.adapter.externalId
              << " devices=" << m_config.devices.size()
              << '\n';
}

v1::CmdResponse BeoSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_hasBootstrap)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    const QString deviceId = QString::fromStdString(request.deviceExternalId);
    const QString channelId = QString::fromStdString(request.channelExternalId);

    DeviceSlot *slot = findSlot(deviceId);
    if (!slot)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unknown device"));
    if (!request.hasScalarValue)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Value missing"));

    CmdStatus status = CmdStatus::InvalidArgument;
    QString error;
    const auto command = commandForChannel(channelId, request.value, &status, &error);
    if (!command)
        return failureResponse(request.cmdId, status, error);

    const CommandResult result = slot->session->coordinator().localCommand(*command);
    if (!result.ok())
        return failureResponse(request.cmdId, cmdStatusForError(result.error), result.detail);

    CmdResponse resp = successResponse(request.cmdId);
    resp.finalValue = request.value;
    return resp;
}

v1::ActionResponse BeoSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("probe"))
        return invokeProbe(request);
    if (actionId.startsWith(QLatin1String("beolink")))
        return invokeBeolink(actionId, request);

    ActionResponse resp;
    resp.id = request.cmdId;
    resp.status = CmdStatus::NotImplemented;
    resp.error = "Unsupported adapter action";
    resp.tsMs = nowMs();
    return resp;
}

v1::CmdResponse BeoSidecar::onDeviceNameUpdate(const sdk::DeviceNameUpdateRequest &request)
{
    return failureResponse(request.cmdId, CmdStatus::NotImplemented,
                           QStringLiteral("Mozart products are renamed in the B&O app"));
}

v1::CmdResponse BeoSidecar::onSceneInvoke(const sdk::SceneInvokeRequest &request)
{
    return failureResponse(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Scenes are not supported"));
}

v1::Utf8String BeoSidecar::displayName() const
{
    return phicore::beo::displayName();
}

v1::Utf8String BeoSidecar::description() const
{
    return phicore::beo::description();
}

v1::Utf8String BeoSidecar::iconSvg() const
{
    return phicore::beo::iconSvg();
}

v1::Utf8String BeoSidecar::apiVersion() const
{
    return "1.0.0";
}

int BeoSidecar::timeoutMs() const
{
    return 10000;
}

v1::AdapterCapabilities BeoSidecar::capabilities() const
{
    return phicore::beo::capabilities();
}

v1::JsonText BeoSidecar::configSchemaJson() const
{
    return phicore::beo::configSchemaJson();
}

std::int64_t BeoSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

void BeoSidecar::applyBootstrapAdapter(const v1::Adapter &adapter)
{
    m_adapterInfo = adapter;

    m_meta = QJsonObject{};
    const QByteArray metaBytes = QByteArray::fromStdString(adapter.metaJson);
    if (!metaBytes.trimmed().isEmpty()) {
        const QJsonDocument metaDoc = QJsonDocument::fromJson(metaBytes);
        if (metaDoc.isObject())
            m_meta = metaDoc.object();
    }

    m_settings.host = QString::fromStdString(adapter.host).trimmed();
    m_settings.ip = QString::fromStdString(adapter.ip).trimmed();
    m_settings.port = static_cast<int>(adapter.port);

    if (m_meta.contains(QStringLiteral("host")))
        m_settings.host = m_meta.value(QStringLiteral("host")).toString().trimmed();
    if (m_meta.contains(QStringLiteral("ip")))
        m_settings.ip = m_meta.value(QStringLiteral("ip")).toString().trimmed();
    if (m_meta.contains(QStringLiteral("port")))
        m_settings.port = m_meta.value(QStringLiteral("port")).toInt(m_settings.port);
    if (m_settings.port <= 0)
        m_settings.port = kDefaultRestPort;
}

void BeoSidecar::resolveIdentity(DeviceConfig *config)
{
    if (!config->jid.isEmpty() && !config->serial.isEmpty())
        return;

    if (!config->jid.isEmpty()) {
        config->serial = serialFromJid(config->jid);
        return;
    }

    const ProbeResult probe = runProbe(m_api, config->rest);
    if (!probe.ok) {
        qCWarning(beoLog).noquote() << "Could not identify" << HttpClient::effectiveHost(config->rest)
                                    << ":" << probe.error;
        return;
    }
    config->jid = probe.jid;
    if (config->serial.isEmpty())
        config->serial = probe.serial;
    if (config->name.isEmpty())
        config->name = probe.friendlyName;
}

void BeoSidecar::rebuildDevices()
{
    m_devicesDirty = false;

    const QSet<QString> previousIds = [this]() {
        QSet<QString> ids;
        for (const auto &entry : m_devices)
            ids.insert(entry.first);
        return ids;
    }();
    teardownDevices();
    m_directory = DeviceDirectory();

    QList<DeviceConfig> configs = m_config.devices;
    for (DeviceConfig &config : configs) {
        resolveIdentity(&config);
        if (!config.jid.isEmpty())
            m_directory.add(config.jid, config.rest);
    }

    v1::Utf8String ipcError;
    for (const DeviceConfig &config : std::as_const(configs)) {
        const QString deviceId = config.externalId();
        if (m_devices.count(deviceId) > 0) {
            qCWarning(beoLog).noquote() << "Skipping duplicate device" << deviceId;
            continue;
        }

        DeviceSlot slot;
        slot.session = std::make_unique<BeoDevice>(config, m_config, m_directory);
        slot.entry = buildDeviceEntry(config, fallbackSources());
        BeoDevice *device = slot.session.get();
        const auto inserted = m_devices.emplace(deviceId, std::move(slot));

        publishDevice(inserted.first->second);
        connectDevice(deviceId, device);
        device->start();
    }

    for (const QString &oldId : previousIds) {
        if (m_devices.count(oldId) > 0)
            continue;
        if (!sendDeviceRemoved(oldId.toStdString(), &ipcError))
            std::cerr << "beo-ipc failed to send deviceRemoved: " << ipcError << '\n';
    }

    if (!sendFullSyncCompleted(&ipcError))
        std::cerr << "beo-ipc failed to send fullSyncCompleted: " << ipcError << '\n';
    updateConnectionState();
}

void BeoSidecar::teardownDevices()
{
    for (auto &entry : m_devices) {
        entry.second.session->disconnect();
        entry.second.session->stop();
    }
    m_devices.clear();
}

void BeoSidecar::connectDevice(const QString &deviceId, BeoDevice *device)
{
    QObject::connect(device, &BeoDevice::availabilityChanged, device, [this, deviceId](bool available) {
        publish(deviceId, kConnectivityChannel, connectivityValue(available));
        updateConnectionState();
    });
    QObject::connect(device, &BeoDevice::buttonEvent, device, [this, deviceId](const ButtonEvent &event) {
        publishButton(deviceId, event);
    });
    QObject::connect(device, &BeoDevice::wheelValueChanged, device, [this, deviceId](int value) {
        publish(deviceId, kWheelChannel, static_cast<std::int64_t>(value));
    });
    QObject::connect(device, &BeoDevice::topologyChanged, device, [this, deviceId](const BeolinkSession &session) {
        publish(deviceId, kBeolinkLeaderChannel, session.leaderJid.toStdString());
        publish(deviceId, kBeolinkListenersChannel, session.listeners.join(QLatin1Char(',')).toStdString());
    });
    QObject::connect(device, &BeoDevice::volumeChanged, device, [this, deviceId](const VolumeState &volume) {
        publish(deviceId, kVolumeChannel, static_cast<std::int64_t>(volume.level));
        publish(deviceId, kMuteChannel, volume.muted);
    });
    QObject::connect(device, &BeoDevice::sourceChanged, device, [this, deviceId](const SourceChange &source) {
        publish(deviceId, kSourceChannel, source.id.toStdString());
    });
    QObject::connect(device, &BeoDevice::sourcesRefreshed, device,
                     [this, deviceId](const QList<SourceInfo> &sources) {
        DeviceSlot *slot = findSlot(deviceId);
        if (!slot)
            return;
        for (v1::Channel &channel : slot->entry.channels) {
            if (channel.externalId == kSourceChannel)
                channel = makeSourceChannel(sources);
        }
        v1::Utf8String ipcError;
        if (!sendDeviceUpdated(slot->entry.device, slot->entry.channels, &ipcError))
            std::cerr << "beo-ipc failed to send deviceUpdated: " << ipcError << '\n';
    });
    QObject::connect(device, &BeoDevice::playbackStateChanged, device, [this, deviceId](const PlaybackState &state) {
        publish(deviceId, kPlaybackStateChannel, state.value.toStdString());
    });
    QObject::connect(device, &BeoDevice::playbackProgressChanged, device,
                     [this, deviceId](const PlaybackProgress &progress) {
        publish(deviceId, kPlaybackProgressChannel, static_cast<std::int64_t>(progress.progressSeconds));
    });
    QObject::connect(device, &BeoDevice::playbackErrorReceived, device, [this, device](const PlaybackError &error) {
        const QString message = QStringLiteral("%1: %2").arg(device->config().displayName(), error.error);
        sendError(message.toStdString());
    });
    QObject::connect(device, &BeoDevice::softwareUpdateStateChanged, device,
                     [this, deviceId](const SoftwareUpdateState &state) {
        publish(deviceId, kSoftwareUpdateChannel, state.state.toStdString());
    });
    QObject::connect(device, &BeoDevice::batteryChanged, device, [this, deviceId](const BatteryState &battery) {
        publish(deviceId, kBatteryChannel, static_cast<std::int64_t>(battery.level));
        publish(deviceId, kChargingChannel, battery.charging);
    });
}

void BeoSidecar::publish(const QString &deviceId, const std::string &channelId, const v1::ScalarValue &value)
{
    v1::Utf8String ipcError;
    if (!sendChannelStateUpdated(deviceId.toStdString(), channelId, value, nowMs(), &ipcError))
        std::cerr << "beo-ipc failed to send channelStateUpdated(" << channelId << "): " << ipcError << '\n';
}

void BeoSidecar::publishButton(const QString &deviceId, const ButtonEvent &event)
{
    DeviceSlot *slot = findSlot(deviceId);
    if (!slot)
        return;

    if (addChannel(&slot->entry.channels, makeButtonChannel(event.controlId))) {
        qCInfo(beoEventLog).noquote() << "New control" << event.controlId << "on" << deviceId;
        v1::Utf8String ipcError;
        if (!sendDeviceUpdated(slot->entry.device, slot->entry.channels, &ipcError))
            std::cerr << "beo-ipc failed to send deviceUpdated: " << ipcError << '\n';
    }

    publish(deviceId, buttonChannelId(event.controlId).toStdString(), static_cast<std::int64_t>(event.phase));
}

void BeoSidecar::publishDevice(const DeviceSlot &slot)
{
    v1::Utf8String ipcError;
    if (!sendDeviceUpdated(slot.entry.device, slot.entry.channels, &ipcError)) {
        std::cerr << "beo-ipc failed to send deviceUpdated: " << ipcError << '\n';
        return;
    }

    const std::int64_t ts = nowMs();
    for (const v1::Channel &channel : slot.entry.channels) {
        if (!channel.hasValue)
            continue;
        if (!sendChannelStateUpdated(slot.entry.device.externalId, channel.externalId, channel.lastValue, ts, &ipcError))
            std::cerr << "beo-ipc failed to send channelStateUpdated: " << ipcError << '\n';
    }
}

void BeoSidecar::updateConnectionState()
{
    const bool anyConnected = std::any_of(m_devices.cbegin(), m_devices.cend(), [](const auto &entry) {
        return entry.second.session->isAvailable();
    });
    setConnectionState(anyConnected);
}

void BeoSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error)) {
        std::cerr << "beo-ipc failed to send connectionStateChanged: " << error << '\n';
    }
}

BeoSidecar::DeviceSlot *BeoSidecar::findSlot(const QString &deviceId)
{
    const auto it = m_devices.find(deviceId);
    return it == m_devices.end() ? nullptr : &it->second;
}

BeoSidecar::DeviceSlot *BeoSidecar::slotForAction(const QJsonObject &params, QString *error)
{
    QList<DeviceConfig> configs;
    for (const auto &entry : m_devices)
        configs.append(entry.second.session->config());

    const int index = selectDevice(configs, params.value(QStringLiteral("device")).toString(), error);
    if (index < 0)
        return nullptr;
    return &std::next(m_devices.begin(), index)->second;
}

v1::ActionResponse BeoSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    ConnectionSettings settings = m_settings;
    const QJsonObject params = parseParams(request.paramsJson);
    if (params.contains(QStringLiteral("host")))
        settings.host = params.value(QStringLiteral("host")).toString().trimmed();
    if (params.contains(QStringLiteral("ip")))
        settings.ip = params.value(QStringLiteral("ip")).toString().trimmed();
    if (params.contains(QStringLiteral("port")))
        settings.port = params.value(QStringLiteral("port")).toInt(settings.port);

    const ProbeResult probe = runProbe(m_api, settings);
    if (!probe.ok) {
        response.status = CmdStatus::Failure;
        response.error = probe.error.toStdString();
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    if (!probe.metaPatch.isEmpty()) {
        v1::Utf8String ipcError;
        const QByteArray patch = QJsonDocument(probe.metaPatch).toJson(QJsonDocument::Compact);
        if (!sendAdapterMetaUpdated(patch.toStdString(), &ipcError)) {
            std::cerr << "beo-ipc failed to send adapterMetaUpdated(probe): " << ipcError << '\n';
        }
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = probe.jid.toStdString();
    return response;
}

v1::ActionResponse BeoSidecar::invokeBeolink(const QString &actionId, const sdk::AdapterActionInvokeRequest &request)
{
    const QJsonObject params = parseParams(request.paramsJson);

    QString error;
    DeviceSlot *slot = slotForAction(params, &error);
    if (!slot) {
        ActionResponse response;
        response.id = request.cmdId;
        response.tsMs = nowMs();
        response.status = CmdStatus::InvalidArgument;
        response.error = error.toStdString();
        return response;
    }

    BeoDevice *device = slot->session.get();

    GroupCoordinator &coordinator = device->coordinator();
    CommandResult result;
    if (actionId == QLatin1String("beolinkJoin")) {
        const QString jid = params.value(QStringLiteral("jid")).toString().trimmed();
        const QString source = params.value(QStringLiteral("source")).toString().trimmed();
        result = coordinator.join(jid.isEmpty() ? std::nullopt : std::optional<QString>(jid), source);
    } else if (actionId == QLatin1String("beolinkExpand")) {
        result = coordinator.expand(readJidList(params), params.value(QStringLiteral("all")).toBool(false));
    } else if (actionId == QLatin1String("beolinkUnexpand")) {
        result = coordinator.unexpand(readJidList(params));
    } else if (actionId == QLatin1String("beolinkLeave")) {
        result = coordinator.leave();
    } else if (actionId == QLatin1String("beolinkAllStandby")) {
        result = coordinator.allStandby();
    } else if (actionId == QLatin1String("beolinkSetVolume")) {
        const QJsonValue level = params.value(QStringLiteral("level"));
        result = level.isDouble()
            ? coordinator.setVolume(level.toDouble())
            : CommandResult::failure(BeoError::InvalidParameter, QStringLiteral("Parameter 'level' must be a number"));
    } else if (actionId == QLatin1String("beolinkSetRelativeVolume")) {
        const QJsonValue delta = params.value(QStringLiteral("delta"));
        result = delta.isDouble()
            ? coordinator.setRelativeVolume(delta.toDouble())
            : CommandResult::failure(BeoError::InvalidParameter, QStringLiteral("Parameter 'delta' must be a number"));
    } else if (actionId == QLatin1String("beolinkLeaderCommand")) {
        result = coordinator.leaderCommand(params.value(QStringLiteral("command")).toString().trimmed(),
                                           params.value(QStringLiteral("parameter")));
    } else {
        ActionResponse response;
        response.id = request.cmdId;
        response.tsMs = nowMs();
        response.status = CmdStatus::NotImplemented;
        response.error = "Unsupported adapter action";
        return response;
    }

    if (!result.ok())
        qCWarning(beoLinkLog).noquote() << actionId << "on" << device->config().displayName() << "failed:"
                                        << beoErrorName(result.error) << result.detail;
    return actionResponse(request.cmdId, result);
}

v1::CmdResponse BeoSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

v1::CmdResponse BeoSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

v1::ActionResponse BeoSidecar::actionResponse(std::uint64_t cmdId, const CommandResult &result) const
{
    ActionResponse response;
    response.id = cmdId;
    response.tsMs = nowMs();
    response.status = cmdStatusForError(result.error);
    if (!result.ok()) {
        response.error = result.detail.toStdString();
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    if (result.payload.isEmpty()) {
        response.resultType = v1::ActionResultType::None;
    } else {
        response.resultType = v1::ActionResultType::String;
        response.resultValue = QJsonDocument(result.payload).toJson(QJsonDocument::Compact).toStdString();
    }
    return response;
}

} // namespace phicore::beo
