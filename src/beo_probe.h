#pragma once

#include <QJsonObject>
#include <QString>

#include "beo_api.h"

namespace phicore::beo {

struct ProbeResult {
    bool ok = false;
    QString error;
    QString message;
    QString jid;
    QString serial;
    QString friendlyName;
    QJsonObject metaPatch;
};

// Reads the device's own Beolink identity. Doubles as the reachability check.
ProbeResult runProbe(const MozartApi &api, const ConnectionSettings &settings);

} // namespace phicore::beo
