#pragma once

#include <QList>
#include <QString>
#include <cstdint>

#include <osv/Session/SessionConfig.hpp>
#include <osv/Version.hpp>

namespace svr {

class YamlConfig;

struct ConnectionSettings {
    osv::SessionConfig session;  // app name, handshake timeout, profile order
    QString tokenFile;
};

struct CommandSettings {
    uint16_t restPort = osv::REST_PORT;
    int restTimeoutMs = 5000;
};

struct DiscoverySettings {
    int timeoutMs = 2000;       // passive (SSDP) pass
    int probeTimeoutMs = 2000;  // per HTTP probe
    QList<uint16_t> probePorts = {osv::PLAIN_PORT, osv::SECURE_PORT};
    QString subnetPrefix;       // "192.168.1" ; empty = derive from local address
};

struct SmartSearchSettings {
    int openSearchDelayMs = 3000;
    int textInputDelayMs = 1000;
    int resultsDelayMs = 3000;
    int navigateDelayMs = 500;
};

struct VideoSearchSettings {
    QString url = "https://www.youtube.com/results";
    QString userAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                        "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";
    int maxResults = 5;
    int timeoutMs = 10000;
};

struct WakeSettings {
    int packetCount = 30;
    int intervalMs = 100;
    uint16_t port = 9;
    QString broadcastAddress = "255.255.255.255";
};

/// Every service's settings, read from the loaded configuration.
struct TvSettings {
    ConnectionSettings connection;
    CommandSettings commands;
    DiscoverySettings discovery;
    SmartSearchSettings smartSearch;
    VideoSearchSettings videoSearch;
    WakeSettings wake;

    static TvSettings fromConfig(const YamlConfig& config);
};

} // namespace svr
