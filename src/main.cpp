#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QLoggingCategory>

#include "beo_schema.h"
#include "beo_sidecar.h"
#include "phi/adapter/sdk/sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;

constexpr auto kDefaultSocketPath = "/tmp/phi-adapter-beo-ipc.sock";

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

class BeoFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override
    {
        return phicore::beo::kPluginType;
    }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<phicore::beo::BeoSidecar>();
    }
};

// Argument, then PHI_ADAPTER_SOCKET_PATH, then the default.
v1::Utf8String resolveSocketPath(const QCommandLineParser &parser)
{
    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty())
        return positional.first().toStdString();
    if (const char *env = std::getenv("PHI_ADAPTER_SOCKET_PATH"))
        return env;
    return kDefaultSocketPath;
}

phicore::beo::BeoSidecar *currentSidecar(sdk::SidecarHost &host)
{
    return dynamic_cast<phicore::beo::BeoSidecar *>(host.adapter());
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("phi_adapter_beo_ipc"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("phi-core adapter for Bang & Olufsen Mozart devices"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("socket"), QStringLiteral("IPC socket path of the phi-core host."));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Log notification and Beolink details."));
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("phi-core.adapters.beo*.debug=true"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const v1::Utf8String socketPath = resolveSocketPath(parser);
    std::cerr << "starting phi_adapter_beo_ipc for pluginType=" << phicore::beo::kPluginType
              << " socket=" << socketPath << '\n';

    BeoFactory factory;
    sdk::SidecarHost host(socketPath, factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        std::cerr << "failed to start sidecar host: " << error << '\n';
        return 1;
    }

    while (g_running.load()) {
        if (!host.pollOnce(std::chrono::milliseconds(250), &error)) {
            std::cerr << "poll failed: " << error << '\n';
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        // Device sessions are built and torn down here, outside the IPC callbacks.
        if (auto *sidecar = currentSidecar(host))
            sidecar->tick();

        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }

    if (auto *sidecar = currentSidecar(host))
        sidecar->shutdown();
    host.stop();
    std::cerr << "stopping phi_adapter_beo_ipc" << '\n';
    return 0;
}
