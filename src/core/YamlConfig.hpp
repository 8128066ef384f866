#pragma once

#include <QList>
#include <QString>
#include <QVariant>
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace svr {

/// Application configuration: built-in defaults with the user's YAML file
/// deep-merged on top. Read once at startup.
class YamlConfig {
public:
    YamlConfig();

    /// Throws YAML::Exception when the file exists but cannot be parsed.
    void load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Device
    QString appName() const;
    uint16_t securePort() const;
    uint16_t plainPort() const;
    uint16_t restPort() const;
    int handshakeTimeoutMs() const;
    int restTimeoutMs() const;

    // Storage; a leading "~" is expanded to the home directory
    QString tokenFile() const;

    // Discovery
    int discoveryTimeoutMs() const;
    int probeTimeoutMs() const;
    QList<uint16_t> probePorts() const;
    QString subnetPrefix() const;

    // Smart search automation
    int openSearchDelayMs() const;
    int textInputDelayMs() const;
    int resultsDelayMs() const;
    int navigateDelayMs() const;

    // Video search
    QString videoSearchUrl() const;
    QString videoSearchUserAgent() const;
    int videoSearchMaxResults() const;
    int videoSearchTimeoutMs() const;

    // Wake-on-LAN
    int wakePacketCount() const;
    int wakeIntervalMs() const;
    uint16_t wakePort() const;
    QString wakeBroadcastAddress() const;

    QString ipcSocketPath() const;
    bool autoReconnect() const;
    QString logLevel() const;

    // Dotted-key access (e.g. "device.rest_port"). Only scalar leaves that
    // exist in the defaults can be set, and only with a value of the same type.
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

    static QString expandHome(const QString& path);

private:
    YAML::Node root_;

    void initDefaults();
    static const YAML::Node& defaultsRoot();
};

} // namespace svr
