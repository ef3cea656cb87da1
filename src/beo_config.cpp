#include "beo_config.h"

#include <algorithm>
#include <utility>

#include <QJsonArray>
#include <QStringList>

namespace phicore::beo {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

int readClamped(const QJsonObject &obj, const QString &key, int fallback, int minValue, int maxValue)
{
    return std::clamp(readInt(obj, key, fallback), minValue, maxValue);
}

PressTimings readTimings(const QJsonObject &obj, const PressTimings &base)
{
    PressTimings out;
    out.longPressMs = readClamped(obj, QStringLiteral("longPressMs"), base.longPressMs, 50, 60000);
    out.veryLongPressMs = readClamped(obj, QStringLiteral("veryLongPressMs"), base.veryLongPressMs, 50, 60000);
    return out;
}

bool readDevice(const QJsonObject &obj, DeviceConfig *device, QString *error)
{
    device->rest.host = obj.value(QStringLiteral("host")).toString().trimmed();
    device->rest.ip = obj.value(QStringLiteral("ip")).toString().trimmed();
    device->rest.port = readClamped(obj, QStringLiteral("restPort"), kDefaultRestPort, 1, 65535);
    device->rest.useTls = obj.value(QStringLiteral("useTls")).toBool(false);
    device->notificationPort = readClamped(obj,
                                           QStringLiteral("notificationPort"),
                                           kDefaultNotificationPort,
                                           1,
                                           65535);
    device->jid = obj.value(QStringLiteral("jid")).toString().trimmed();
    device->serial = obj.value(QStringLiteral("serial")).toString().trimmed();
    device->name = obj.value(QStringLiteral("name")).toString().trimmed();
    device->model = obj.value(QStringLiteral("model")).toString().trimmed();

    if (HttpClient::effectiveHost(device->rest).isEmpty()) {
        if (error)
            *error = QStringLiteral("Device entry without host");
        return false;
    }
    if (device->serial.isEmpty() && !device->jid.isEmpty())
        device->serial = serialFromJid(device->jid);
    return true;
}

} // namespace

QString DeviceConfig::externalId() const
{
    if (!serial.isEmpty())
        return serial;
    if (!jid.isEmpty())
        return jid;
    return HttpClient::effectiveHost(rest);
}

QString DeviceConfig::displayName() const
{
    if (!name.isEmpty())
        return name;
    if (!model.isEmpty() && !serial.isEmpty())
        return QStringLiteral("%1 (%2)").arg(model, serial);
    return externalId();
}

QString serialFromJid(const QString &jid)
{
    const QString local = jid.section(QLatin1Char('@'), 0, 0);
    const QStringList parts = local.split(QLatin1Char('.'));
    if (parts.size() < 3)
        return {};
    return parts.last();
}

bool parseAdapterConfig(const QJsonObject &meta,
                        const ConnectionSettings &fallback,
                        AdapterConfig *out,
                        QString *error)
{
    if (!out)
        return false;

    AdapterConfig config;

    config.retry.retryIntervalMs = readClamped(meta, QStringLiteral("retryIntervalMs"), 10000, 1000, 600000);
    config.retry.fastRetryDelayMs = readClamped(meta, QStringLiteral("fastRetryDelayMs"), 2000, 100, 600000);
    config.retry.fastRetryCount = readClamped(meta, QStringLiteral("fastRetryCount"), 5, 0, 100);
    config.retry.connectTimeoutMs = readClamped(meta, QStringLiteral("connectTimeoutMs"), 5000, 500, 120000);
    config.retry.pingIntervalMs = readClamped(meta, QStringLiteral("pingIntervalMs"), 10000, 0, 600000);
    config.retry.pongTimeoutMs = readClamped(meta, QStringLiteral("pongTimeoutMs"), 5000, 500, 120000);
    config.requestTimeoutMs = readClamped(meta, QStringLiteral("requestTimeoutMs"), 10000, 500, 120000);
    config.wheelQuietMs = readClamped(meta, QStringLiteral("wheelQuietMs"), 250, 20, 5000);

    const PressTimings base = readTimings(meta, PressTimings{});
    config.pressTimings.fill(base);

    const QJsonObject perClass = meta.value(QStringLiteral("controlTimings")).toObject();
    for (auto it = perClass.constBegin(); it != perClass.constEnd(); ++it) {
        const auto controlClass = controlClassFromString(it.key());
        if (!controlClass || !it.value().isObject())
            continue;
        config.pressTimings[static_cast<std::size_t>(*controlClass)] = readTimings(it.value().toObject(), base);
    }

    const QJsonValue devicesValue = meta.value(QStringLiteral("devices"));
    if (devicesValue.isArray()) {
        const QJsonArray devices = devicesValue.toArray();
        for (const QJsonValue &entry : devices) {
            if (!entry.isObject()) {
                if (error)
                    *error = QStringLiteral("Device entry is not an object");
                return false;
            }
            DeviceConfig device;
            if (!readDevice(entry.toObject(), &device, error))
                return false;
            config.devices.append(device);
        }
    } else {
        QJsonObject single = meta;
        if (!single.contains(QStringLiteral("host")))
            single.insert(QStringLiteral("host"), fallback.host);
        if (!single.contains(QStringLiteral("ip")))
            single.insert(QStringLiteral("ip"), fallback.ip);
        if (!single.contains(QStringLiteral("restPort")) && fallback.port > 0)
            single.insert(QStringLiteral("restPort"), fallback.port);
        DeviceConfig device;
        if (!readDevice(single, &device, error))
            return false;
        config.devices.append(device);
    }

    QStringList seen;
    for (const DeviceConfig &device : std::as_const(config.devices)) {
        const QString id = device.externalId();
        if (seen.contains(id)) {
            if (error)
                *error = QStringLiteral("Device %1 is configured twice").arg(id);
            return false;
        }
        seen.append(id);
    }

    *out = config;
    if (error)
        error->clear();
    return true;
}

int selectDevice(const QList<DeviceConfig> &devices, const QString &selector, QString *error)
{
    const QString wanted = selector.trimmed();
    if (wanted.isEmpty()) {
        if (devices.size() == 1)
            return 0;
        if (error)
            *error = devices.isEmpty() ? QStringLiteral("No device configured")
                                       : QStringLiteral("Parameter 'device' is required with several devices");
        return -1;
    }

    for (int i = 0; i < devices.size(); ++i) {
        const DeviceConfig &device = devices.at(i);
        if (device.externalId() == wanted || device.jid == wanted || device.serial == wanted)
            return i;
    }
    if (error)
        *error = QStringLiteral("Unknown device %1").arg(wanted);
    return -1;
}

} // namespace phicore::beo
