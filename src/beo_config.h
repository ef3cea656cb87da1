#pragma once

#include <array>

#include <QJsonObject>
#include <QList>
#include <QString>

#include "beo_button_classifier.h"
#include "beo_http.h"
#include "beo_supervisor.h"

namespace phicore::beo {

inline constexpr int kDefaultRestPort = 80;
inline constexpr int kDefaultNotificationPort = 9339;

struct DeviceConfig {
    QString serial;
    QString jid;
    QString name;
    QString model;
    ConnectionSettings rest;
    int notificationPort = kDefaultNotificationPort;

    // Serial, else JID, else host.
    QString externalId() const;
    QString displayName() const;
};

struct AdapterConfig {
    QList<DeviceConfig> devices;
    RetryPolicy retry;
    int requestTimeoutMs = 10000;
    std::array<PressTimings, 4> pressTimings;
    int wheelQuietMs = 250;
};

// Reads the adapter meta JSON. The adapter's own host/ip/port are used as a
// single device when the meta carries no "devices" array.
bool parseAdapterConfig(const QJsonObject &meta,
                        const ConnectionSettings &fallback,
                        AdapterConfig *out,
                        QString *error = nullptr);

// Picks the device an action addresses by external id, JID or serial. An
// empty selector is only accepted when exactly one device exists. Returns the
// index into `devices`, or -1 with `error` set.
int selectDevice(const QList<DeviceConfig> &devices, const QString &selector, QString *error = nullptr);

// "type.item.serial@products.bang-olufsen.com" -> "serial"
QString serialFromJid(const QString &jid);

} // namespace phicore::beo
