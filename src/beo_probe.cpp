#include "beo_probe.h"

#include "beo_config.h"
#include "beo_payload.h"

namespace phicore::beo {

ProbeResult runProbe(const MozartApi &api, const ConnectionSettings &settings)
{
    ProbeResult out;

    if (HttpClient::effectiveHost(settings).isEmpty()) {
        out.error = QStringLiteral("Host must not be empty");
        return out;
    }

    ConnectionSettings probeSettings = settings;
    if (probeSettings.port <= 0)
        probeSettings.port = kDefaultRestPort;

    const HttpResult self = api.beolinkSelf(probeSettings);
    if (!self.ok) {
        out.error = MozartApi::errorDetail(self, QStringLiteral("Mozart product not reachable"));
        return out;
    }

    const auto peer = parseBeolinkPeer(MozartApi::objectPayload(self));
    if (!peer) {
        out.error = QStringLiteral("Mozart product returned no Beolink JID");
        return out;
    }

    out.ok = true;
    out.jid = peer->jid;
    out.friendlyName = peer->friendlyName;
    out.serial = serialFromJid(peer->jid);
    out.message = out.friendlyName.isEmpty()
        ? QStringLiteral("Mozart product reachable")
        : QStringLiteral("Found %1").arg(out.friendlyName);

    out.metaPatch.insert(QStringLiteral("jid"), out.jid);
    if (!out.serial.isEmpty())
        out.metaPatch.insert(QStringLiteral("serial"), out.serial);
    if (!out.friendlyName.isEmpty())
        out.metaPatch.insert(QStringLiteral("name"), out.friendlyName);
    return out;
}

} // namespace phicore::beo
