#include <signal.h>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <memory>
#include "core/YamlConfig.hpp"
#include "core/services/IpcServer.hpp"
#include "core/tv/CommandChannel.hpp"
#include "core/tv/ConnectionManager.hpp"
#include "core/tv/DeviceDiscoveryService.hpp"
#include "core/tv/SavedConnectionStore.hpp"
#include "core/tv/SmartQueryEngine.hpp"
#include "core/tv/TvSettings.hpp"
#include "core/tv/VideoSearchClient.hpp"
#include "core/tv/WakeOnLanSender.hpp"

namespace {

boost::log::trivial::severity_level severityFromName(const QString& name)
{
    const QString n = name.toLower();
    if (n == "trace") return boost::log::trivial::trace;
    if (n == "debug") return boost::log::trivial::debug;
    if (n == "warning" || n == "warn") return boost::log::trivial::warning;
    if (n == "error") return boost::log::trivial::error;
    return boost::log::trivial::info;
}

void configureLogging(const QString& level)
{
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= severityFromName(level));
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("SmartView Remote");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("SmartViewRemote");

    // Built-in defaults, with ~/.smartview-remote/config.yaml merged on top
    QString yamlPath = QDir::homePath() + "/.smartview-remote/config.yaml";
    auto yamlConfig = std::make_shared<svr::YamlConfig>();
    if (QFile::exists(yamlPath)) {
        try {
            yamlConfig->load(yamlPath);
        } catch (const YAML::Exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[main] Ignoring unreadable " << yamlPath.toStdString()
                                     << ": " << e.what();
            yamlConfig = std::make_shared<svr::YamlConfig>();
        }
    }

    configureLogging(yamlConfig->logLevel());

    const svr::TvSettings settings = svr::TvSettings::fromConfig(*yamlConfig);

    // --- TV services ---
    svr::SavedConnectionStore store(settings.connection.tokenFile);
    auto connection = new svr::ConnectionManager(&store, settings.connection, &app);
    auto commands = new svr::CommandChannel(connection, settings.commands, &app);
    auto videoSearch = new svr::VideoSearchClient(settings.videoSearch, &app);
    auto smartQuery = new svr::SmartQueryEngine(connection, commands, videoSearch,
                                                settings.smartSearch, &app);
    auto discovery = new svr::DeviceDiscoveryService(settings.discovery, &app);
    auto wake = new svr::WakeOnLanSender(&store, settings.wake, &app);

    // --- Request layer ---
    auto ipcServer = new svr::IpcServer(&app);
    ipcServer->setConfig(yamlConfig.get(), yamlPath);
    ipcServer->setConnectionManager(connection);
    ipcServer->setCommandChannel(commands);
    ipcServer->setSmartQueryEngine(smartQuery);
    ipcServer->setVideoSearchClient(videoSearch);
    ipcServer->setDiscoveryService(discovery);
    ipcServer->setWakeOnLanSender(wake);
    if (!ipcServer->start(yamlConfig->ipcSocketPath()))
        return 1;

    if (yamlConfig->autoReconnect()) {
        connection->autoReconnect([](bool ok) {
            if (ok)
                BOOST_LOG_TRIVIAL(info) << "[main] Auto-reconnected to saved TV";
            else
                BOOST_LOG_TRIVIAL(info) << "[main] Auto-reconnect skipped or failed";
        });
    }

    // SIGINT/SIGTERM -> leave the event loop so the TV channel is closed cleanly
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });

    int ret = app.exec();

    // The channel must close before the store it saves into goes away.
    connection->disconnectDevice();
    ipcServer->stop();

    return ret;
}
