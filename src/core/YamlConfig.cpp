#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QDir>
#include <QFileInfo>
#include <QStringList>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace svr {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["device"]["app_name"] = "SmartViewRemote";
    root_["device"]["secure_port"] = 8002;
    root_["device"]["plain_port"] = 8001;
    root_["device"]["rest_port"] = 8001;
    root_["device"]["handshake_timeout_ms"] = 15000;
    root_["device"]["rest_timeout_ms"] = 5000;

    root_["storage"]["token_file"] = "~/.smartview-remote/tv-token.json";

    root_["discovery"]["timeout_ms"] = 2000;
    root_["discovery"]["probe_timeout_ms"] = 2000;
    root_["discovery"]["probe_ports"] = YAML::Node(YAML::NodeType::Sequence);
    root_["discovery"]["probe_ports"].push_back(8001);
    root_["discovery"]["probe_ports"].push_back(8002);
    root_["discovery"]["subnet_prefix"] = "";

    root_["smart_search"]["open_search_delay_ms"] = 3000;
    root_["smart_search"]["text_input_delay_ms"] = 1000;
    root_["smart_search"]["results_delay_ms"] = 3000;
    root_["smart_search"]["navigate_delay_ms"] = 500;

    root_["video_search"]["url"] = "https://www.youtube.com/results";
    root_["video_search"]["user_agent"] =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";
    root_["video_search"]["max_results"] = 5;
    root_["video_search"]["timeout_ms"] = 10000;

    root_["wake"]["packet_count"] = 30;
    root_["wake"]["interval_ms"] = 100;
    root_["wake"]["port"] = 9;
    root_["wake"]["broadcast_address"] = "255.255.255.255";

    root_["ipc"]["socket_path"] = "/tmp/smartview-remote.sock";
    root_["startup"]["auto_reconnect"] = true;
    root_["logging"]["level"] = "info";
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node defaults;
    initDefaults();
    defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    MergeReport report;
    root_ = mergeOverDefaults(defaults, loaded, &report);

    for (const auto& key : report.shapeMismatches)
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] " << filePath.toStdString() << ": " << key
                                   << " has the wrong type, keeping the default";
    for (const auto& key : report.unknownKeys)
        BOOST_LOG_TRIVIAL(debug) << "[YamlConfig] " << filePath.toStdString()
                                 << ": unknown key " << key;
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    std::ofstream fout(filePath.toStdString());
    if (!fout)
        return false;
    fout << root_;
    return bool(fout);
}

// --- Device ---

QString YamlConfig::appName() const
{
    return QString::fromStdString(root_["device"]["app_name"].as<std::string>("SmartViewRemote"));
}

uint16_t YamlConfig::securePort() const
{
    return root_["device"]["secure_port"].as<uint16_t>(8002);
}

uint16_t YamlConfig::plainPort() const
{
    return root_["device"]["plain_port"].as<uint16_t>(8001);
}

uint16_t YamlConfig::restPort() const
{
    return root_["device"]["rest_port"].as<uint16_t>(8001);
}

int YamlConfig::handshakeTimeoutMs() const
{
    return root_["device"]["handshake_timeout_ms"].as<int>(15000);
}

int YamlConfig::restTimeoutMs() const
{
    return root_["device"]["rest_timeout_ms"].as<int>(5000);
}

// --- Storage ---

QString YamlConfig::tokenFile() const
{
    return expandHome(QString::fromStdString(
        root_["storage"]["token_file"].as<std::string>("~/.smartview-remote/tv-token.json")));
}

// --- Discovery ---

int YamlConfig::discoveryTimeoutMs() const
{
    return root_["discovery"]["timeout_ms"].as<int>(2000);
}

int YamlConfig::probeTimeoutMs() const
{
    return root_["discovery"]["probe_timeout_ms"].as<int>(2000);
}

QList<uint16_t> YamlConfig::probePorts() const
{
    QList<uint16_t> result;
    if (root_["discovery"]["probe_ports"].IsSequence()) {
        for (const auto& node : root_["discovery"]["probe_ports"])
            result.append(node.as<uint16_t>());
    }
    return result;
}

QString YamlConfig::subnetPrefix() const
{
    return QString::fromStdString(root_["discovery"]["subnet_prefix"].as<std::string>(""));
}

// --- Smart search ---

int YamlConfig::openSearchDelayMs() const
{
    return root_["smart_search"]["open_search_delay_ms"].as<int>(3000);
}

int YamlConfig::textInputDelayMs() const
{
    return root_["smart_search"]["text_input_delay_ms"].as<int>(1000);
}

int YamlConfig::resultsDelayMs() const
{
    return root_["smart_search"]["results_delay_ms"].as<int>(3000);
}

int YamlConfig::navigateDelayMs() const
{
    return root_["smart_search"]["navigate_delay_ms"].as<int>(500);
}

// --- Video search ---

QString YamlConfig::videoSearchUrl() const
{
    return QString::fromStdString(
        root_["video_search"]["url"].as<std::string>("https://www.youtube.com/results"));
}

QString YamlConfig::videoSearchUserAgent() const
{
    return QString::fromStdString(root_["video_search"]["user_agent"].as<std::string>(""));
}

int YamlConfig::videoSearchMaxResults() const
{
    return root_["video_search"]["max_results"].as<int>(5);
}

int YamlConfig::videoSearchTimeoutMs() const
{
    return root_["video_search"]["timeout_ms"].as<int>(10000);
}

// --- Wake-on-LAN ---

int YamlConfig::wakePacketCount() const
{
    return root_["wake"]["packet_count"].as<int>(30);
}

int YamlConfig::wakeIntervalMs() const
{
    return root_["wake"]["interval_ms"].as<int>(100);
}

uint16_t YamlConfig::wakePort() const
{
    return root_["wake"]["port"].as<uint16_t>(9);
}

QString YamlConfig::wakeBroadcastAddress() const
{
    return QString::fromStdString(root_["wake"]["broadcast_address"].as<std::string>("255.255.255.255"));
}

// --- Process ---

QString YamlConfig::ipcSocketPath() const
{
    return QString::fromStdString(root_["ipc"]["socket_path"].as<std::string>("/tmp/smartview-remote.sock"));
}

bool YamlConfig::autoReconnect() const
{
    return root_["startup"]["auto_reconnect"].as<bool>(true);
}

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

QString YamlConfig::expandHome(const QString& path)
{
    if (path == QLatin1String("~"))
        return QDir::homePath();
    if (path.startsWith(QLatin1String("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}

// --- Dotted keys ("device.rest_port") ---

namespace {

// Read-only walk; a missing segment yields an undefined node.
YAML::Node nodeAt(const YAML::Node& root, const QStringList& parts)
{
    YAML::Node node = YAML::Clone(root);
    for (const QString& part : parts) {
        if (!node.IsMap())
            return YAML::Node(YAML::NodeType::Undefined);
        YAML::Node child = node[part.toStdString()];
        if (!child.IsDefined() || child.IsNull())
            return YAML::Node(YAML::NodeType::Undefined);
        node.reset(child);
    }
    return node;
}

enum class ScalarKind { Bool, Int, Text };

ScalarKind kindOf(const YAML::Node& scalar)
{
    bool b;
    if (YAML::convert<bool>::decode(scalar, b))
        return ScalarKind::Bool;
    int i;
    if (YAML::convert<int>::decode(scalar, i))
        return ScalarKind::Int;
    return ScalarKind::Text;
}

QVariant toVariant(const YAML::Node& scalar)
{
    switch (kindOf(scalar)) {
    case ScalarKind::Bool: return scalar.as<bool>();
    case ScalarKind::Int: return scalar.as<int>();
    case ScalarKind::Text: break;
    }
    return QString::fromStdString(scalar.Scalar());
}

} // namespace

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty())
        return QVariant();

    const YAML::Node node = nodeAt(root_, dottedKey.split('.'));
    if (node.IsScalar())
        return toVariant(node);
    if (node.IsSequence()) {
        QVariantList items;
        for (const auto& item : node)
            items.append(item.IsScalar() ? toVariant(item) : QVariant());
        return items;
    }
    return QVariant();
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty() || !value.isValid())
        return false;

    // Writable keys are exactly the scalar leaves of the defaults, and the
    // new value must have the default's type.
    const QStringList parts = dottedKey.split('.');
    const YAML::Node reference = nodeAt(defaultsRoot(), parts);
    if (!reference.IsScalar())
        return false;

    YAML::Node leaf;
    switch (kindOf(reference)) {
    case ScalarKind::Bool:
        if (value.typeId() != QMetaType::Bool)
            return false;
        leaf = value.toBool();
        break;
    case ScalarKind::Int: {
        bool ok = false;
        const double number = value.toDouble(&ok);
        if (!ok || value.typeId() == QMetaType::Bool || number != double(int(number)))
            return false;
        leaf = int(number);
        break;
    }
    case ScalarKind::Text:
        leaf = value.toString().toStdString();
        break;
    }

    YAML::Node parent = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        parent.reset(parent[parts.at(i).toStdString()]);
    parent[parts.last().toStdString()] = leaf;
    return true;
}

const YAML::Node& YamlConfig::defaultsRoot()
{
    static const YAML::Node defaults = YamlConfig().root_;
    return defaults;
}

} // namespace svr
