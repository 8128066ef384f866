#pragma once

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QSet>
#include <functional>

namespace svr {

class YamlConfig;
class ConnectionManager;
class CommandChannel;
class SmartQueryEngine;
class IVideoSearchClient;
class DeviceDiscoveryService;
class WakeOnLanSender;

/// Unix domain socket request layer.
///
/// Each line a client writes is one JSON request,
/// {"command": "...", "data": {...}}, answered by exactly one JSON line,
/// {"success": true, ...} or {"success": false, "error": "..."}.
/// Long-running commands (connect, discover, smart, ...) answer when they
/// complete; other requests on the same socket are served meanwhile, so
/// answers can arrive out of order.
class IpcServer : public QObject {
    Q_OBJECT

public:
    using Responder = std::function<void(const QJsonObject&)>;

    /// Unterminated input beyond this is dropped, up to its newline, with
    /// an error reply.
    static constexpr int MAX_REQUEST_BYTES = 64 * 1024;

    explicit IpcServer(QObject* parent = nullptr);
    ~IpcServer() override;

    /// Start listening. Returns false if the socket cannot be created.
    bool start(const QString& socketPath = QStringLiteral("/tmp/smartview-remote.sock"));
    void stop();

    // Inject dependencies
    void setConfig(YamlConfig* config, const QString& configPath);
    void setConnectionManager(ConnectionManager* connection);
    void setCommandChannel(CommandChannel* commands);
    void setSmartQueryEngine(SmartQueryEngine* smartQuery);
    void setVideoSearchClient(IVideoSearchClient* videoSearch);
    void setDiscoveryService(DeviceDiscoveryService* discovery);
    void setWakeOnLanSender(WakeOnLanSender* wake);

    /// Dispatches one decoded request. Exposed for tests.
    void handleRequest(const QByteArray& request, Responder respond);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    void handleDiscover(const QJsonObject& data, Responder respond);
    void handleConnect(const QJsonObject& data, Responder respond);
    void handleStatus(Responder respond);
    void handleKey(const QJsonObject& data, Responder respond);
    void handleText(const QJsonObject& data, Responder respond);
    void handleLaunch(const QJsonObject& data, Responder respond);
    void handleSmart(const QJsonObject& data, Responder respond);
    void handleCast(const QJsonObject& data, Responder respond);
    void handleVideoSearch(const QJsonObject& data, Responder respond);
    void handleParse(const QJsonObject& data, Responder respond);
    void handleWake(Responder respond);
    void handleDisconnect(Responder respond);
    void handleKeys(Responder respond);
    void handleGetConfig(const QJsonObject& data, Responder respond);
    void handleSetConfig(const QJsonObject& data, Responder respond);

    static QJsonObject errorResponse(const QString& message);
    static QJsonObject unavailable(const char* what);

    QLocalServer* server_ = nullptr;
    QHash<QLocalSocket*, QByteArray> buffers_;
    QSet<QLocalSocket*> discarding_;
    YamlConfig* config_ = nullptr;
    QString configPath_;
    ConnectionManager* connection_ = nullptr;
    CommandChannel* commands_ = nullptr;
    SmartQueryEngine* smartQuery_ = nullptr;
    IVideoSearchClient* videoSearch_ = nullptr;
    DeviceDiscoveryService* discovery_ = nullptr;
    WakeOnLanSender* wake_ = nullptr;
};

} // namespace svr
