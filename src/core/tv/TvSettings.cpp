#include "TvSettings.hpp"
#include "core/YamlConfig.hpp"

namespace svr {

TvSettings TvSettings::fromConfig(const YamlConfig& config)
{
    TvSettings s;

    s.connection.session.appName = config.appName();
    s.connection.session.handshakeTimeout = config.handshakeTimeoutMs();
    s.connection.session.profiles = {
        osv::ConnectionProfile{config.securePort(), true},
        osv::ConnectionProfile{config.plainPort(), false},
    };
    s.connection.tokenFile = config.tokenFile();

    s.commands.restPort = config.restPort();
    s.commands.restTimeoutMs = config.restTimeoutMs();

    s.discovery.timeoutMs = config.discoveryTimeoutMs();
    s.discovery.probeTimeoutMs = config.probeTimeoutMs();
    s.discovery.probePorts = config.probePorts();
    s.discovery.subnetPrefix = config.subnetPrefix();

    s.smartSearch.openSearchDelayMs = config.openSearchDelayMs();
    s.smartSearch.textInputDelayMs = config.textInputDelayMs();
    s.smartSearch.resultsDelayMs = config.resultsDelayMs();
    s.smartSearch.navigateDelayMs = config.navigateDelayMs();

    s.videoSearch.url = config.videoSearchUrl();
    if (!config.videoSearchUserAgent().isEmpty())
        s.videoSearch.userAgent = config.videoSearchUserAgent();
    s.videoSearch.maxResults = config.videoSearchMaxResults();
    s.videoSearch.timeoutMs = config.videoSearchTimeoutMs();

    s.wake.packetCount = config.wakePacketCount();
    s.wake.intervalMs = config.wakeIntervalMs();
    s.wake.port = config.wakePort();
    s.wake.broadcastAddress = config.wakeBroadcastAddress();

    return s;
}

} // namespace svr
