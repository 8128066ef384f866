#include "IpcServer.hpp"
#include "../YamlConfig.hpp"
#include "../tv/CommandChannel.hpp"
#include "../tv/ConnectionManager.hpp"
#include "../tv/DeviceDiscoveryService.hpp"
#include "../tv/IVideoSearchClient.hpp"
#include "../tv/SmartQueryEngine.hpp"
#include "../tv/SmartQueryParser.hpp"
#include "../tv/WakeOnLanSender.hpp"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QPointer>
#include <boost/log/trivial.hpp>

namespace svr {

IpcServer::IpcServer(QObject* parent)
    : QObject(parent)
{
}

IpcServer::~IpcServer()
{
    stop();
}

bool IpcServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        BOOST_LOG_TRIVIAL(error) << "[IpcServer] Failed to listen on " << socketPath.toStdString()
                                 << ": " << server_->errorString().toStdString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[IpcServer] Listening on " << socketPath.toStdString();
    return true;
}

void IpcServer::stop()
{
    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

void IpcServer::setConfig(YamlConfig* config, const QString& configPath)
{
    config_ = config;
    configPath_ = configPath;
}

void IpcServer::setConnectionManager(ConnectionManager* connection)
{
    connection_ = connection;
}

void IpcServer::setCommandChannel(CommandChannel* commands)
{
    commands_ = commands;
}

void IpcServer::setSmartQueryEngine(SmartQueryEngine* smartQuery)
{
    smartQuery_ = smartQuery;
}

void IpcServer::setVideoSearchClient(IVideoSearchClient* videoSearch)
{
    videoSearch_ = videoSearch;
}

void IpcServer::setDiscoveryService(DeviceDiscoveryService* discovery)
{
    discovery_ = discovery;
}

void IpcServer::setWakeOnLanSender(WakeOnLanSender* wake)
{
    wake_ = wake;
}

void IpcServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        connect(socket, &QLocalSocket::readyRead, this, &IpcServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &IpcServer::onDisconnected);
    }
}

void IpcServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    QByteArray& buffer = buffers_[socket];
    buffer.append(socket->readAll());

    if (discarding_.contains(socket)) {
        const int end = buffer.indexOf('\n');
        if (end < 0) {
            buffer.clear();
            return;
        }
        buffer.remove(0, end + 1);
        discarding_.remove(socket);
    }

    QPointer<QLocalSocket> target(socket);
    Responder reply = [target](const QJsonObject& response) {
        if (!target || target->state() != QLocalSocket::ConnectedState)
            return;
        target->write(QJsonDocument(response).toJson(QJsonDocument::Compact) + "\n");
        target->flush();
    };

    int newline;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        const QByteArray line = buffer.left(newline).trimmed();
        buffer.remove(0, newline + 1);
        if (line.isEmpty())
            continue;
        handleRequest(line, reply);
    }

    if (buffer.size() > MAX_REQUEST_BYTES) {
        BOOST_LOG_TRIVIAL(warning) << "[IpcServer] Dropping " << buffer.size()
                                   << " bytes of unterminated input";
        buffer.clear();
        discarding_.insert(socket);
        reply(errorResponse("Request too large"));
    }
}

void IpcServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (socket) {
        buffers_.remove(socket);
        discarding_.remove(socket);
        socket->deleteLater();
    }
}

void IpcServer::handleRequest(const QByteArray& request, Responder respond)
{
    QJsonDocument doc = QJsonDocument::fromJson(request);
    if (!doc.isObject()) {
        respond(errorResponse("Invalid JSON"));
        return;
    }

    QJsonObject obj = doc.object();
    QString command = obj.value("command").toString();
    QJsonObject data = obj.value("data").toObject();

    BOOST_LOG_TRIVIAL(debug) << "[IpcServer] " << command.toStdString();

    if (command == QLatin1String("discover"))
        return handleDiscover(data, respond);
    if (command == QLatin1String("connect"))
        return handleConnect(data, respond);
    if (command == QLatin1String("status"))
        return handleStatus(respond);
    if (command == QLatin1String("key"))
        return handleKey(data, respond);
    if (command == QLatin1String("text"))
        return handleText(data, respond);
    if (command == QLatin1String("launch"))
        return handleLaunch(data, respond);
    if (command == QLatin1String("smart"))
        return handleSmart(data, respond);
    if (command == QLatin1String("cast"))
        return handleCast(data, respond);
    if (command == QLatin1String("video_search"))
        return handleVideoSearch(data, respond);
    if (command == QLatin1String("parse"))
        return handleParse(data, respond);
    if (command == QLatin1String("wake"))
        return handleWake(respond);
    if (command == QLatin1String("disconnect"))
        return handleDisconnect(respond);
    if (command == QLatin1String("keys"))
        return handleKeys(respond);
    if (command == QLatin1String("get_config"))
        return handleGetConfig(data, respond);
    if (command == QLatin1String("set_config"))
        return handleSetConfig(data, respond);

    respond(errorResponse("Unknown command"));
}

void IpcServer::handleDiscover(const QJsonObject& data, Responder respond)
{
    if (!discovery_) return respond(unavailable("Discovery"));

    discovery_->discover(data.value("timeout").toInt(0), [respond](const QList<Device>& devices) {
        QJsonArray arr;
        for (const Device& device : devices)
            arr.append(device.toJson());
        QJsonObject obj;
        obj["success"] = true;
        obj["devices"] = arr;
        respond(obj);
    });
}

void IpcServer::handleConnect(const QJsonObject& data, Responder respond)
{
    if (!connection_) return respond(unavailable("Connection manager"));

    ConnectRequest request;
    request.ip = data.value("ip").toString();
    request.mac = data.value("mac").toString();
    request.friendlyName = data.value("friendlyName").toString();
    const int port = data.value("port").toInt(0);
    if (request.ip.isEmpty())
        return respond(errorResponse("ip is required"));
    if (port < 0 || port > 65535)
        return respond(errorResponse("port is out of range"));
    request.port = uint16_t(port);

    connection_->connectToDevice(request, [respond](const OperationResult& result) {
        respond(result.toJson());
    });
}

void IpcServer::handleStatus(Responder respond)
{
    if (!connection_) return respond(unavailable("Connection manager"));

    QJsonObject obj = connection_->status().toJson();
    obj["success"] = true;
    respond(obj);
}

void IpcServer::handleKey(const QJsonObject& data, Responder respond)
{
    if (!commands_) return respond(unavailable("Command channel"));

    const QString key = data.value("key").toString();
    if (key.isEmpty())
        return respond(errorResponse("key is required"));
    respond(commands_->sendKey(key).toJson());
}

void IpcServer::handleText(const QJsonObject& data, Responder respond)
{
    if (!commands_) return respond(unavailable("Command channel"));

    const QString text = data.value("text").toString();
    if (text.isEmpty())
        return respond(errorResponse("text is required"));
    respond(commands_->sendText(text).toJson());
}

void IpcServer::handleLaunch(const QJsonObject& data, Responder respond)
{
    if (!commands_) return respond(unavailable("Command channel"));

    const QString app = data.value("app").toString();
    if (app.isEmpty())
        return respond(errorResponse("app is required"));
    commands_->launchApp(app, [respond](const OperationResult& result) {
        respond(result.toJson());
    });
}

void IpcServer::handleSmart(const QJsonObject& data, Responder respond)
{
    if (!smartQuery_) return respond(unavailable("Smart search"));

    const QString query = data.value("query").toString();
    if (query.trimmed().isEmpty())
        return respond(errorResponse("query is required"));
    smartQuery_->smartSearch(query, [respond](const SmartSearchResult& result) {
        respond(result.toJson());
    });
}

void IpcServer::handleCast(const QJsonObject& data, Responder respond)
{
    if (!commands_) return respond(unavailable("Command channel"));

    const QString app = data.value("app").toString();
    const QString contentId = data.value("contentId").toString();
    const QString metaTag = data.value("metaTag").toString();
    if (app.isEmpty())
        return respond(errorResponse("app is required"));
    if (contentId.isEmpty() && metaTag.isEmpty())
        return respond(errorResponse("contentId or metaTag is required"));

    commands_->castToTV(app, contentId, metaTag, [respond](const OperationResult& result) {
        respond(result.toJson());
    });
}

void IpcServer::handleVideoSearch(const QJsonObject& data, Responder respond)
{
    if (!videoSearch_) return respond(unavailable("Video search"));

    const QString q = data.value("q").toString();
    if (q.trimmed().isEmpty())
        return respond(errorResponse("q is required"));

    videoSearch_->search(q, [respond](const QList<VideoResult>& results) {
        QJsonArray arr;
        for (const VideoResult& video : results)
            arr.append(video.toJson());
        QJsonObject obj;
        obj["success"] = true;
        obj["results"] = arr;
        respond(obj);
    });
}

void IpcServer::handleParse(const QJsonObject& data, Responder respond)
{
    const QString q = data.value("q").toString();
    if (q.isEmpty())
        return respond(errorResponse("q is required"));

    const SmartQuery parsed = parseSmartQuery(q);
    QJsonObject obj;
    obj["success"] = true;
    obj["app"] = parsed.app;
    obj["search"] = parsed.search;
    respond(obj);
}

void IpcServer::handleWake(Responder respond)
{
    if (!wake_) return respond(unavailable("Wake-on-LAN"));

    wake_->wake([respond](const OperationResult& result) {
        respond(result.toJson());
    });
}

void IpcServer::handleDisconnect(Responder respond)
{
    if (!connection_) return respond(unavailable("Connection manager"));

    connection_->disconnectDevice();
    respond(OperationResult::ok().toJson());
}

void IpcServer::handleKeys(Responder respond)
{
    QJsonObject obj;
    obj["success"] = true;
    obj["keys"] = QJsonArray::fromStringList(CommandChannel::availableKeys());
    respond(obj);
}

void IpcServer::handleGetConfig(const QJsonObject& data, Responder respond)
{
    if (!config_) return respond(unavailable("Config"));

    const QString key = data.value("key").toString();
    if (key.isEmpty())
        return respond(errorResponse("key is required"));

    QVariant value = config_->valueByPath(key);
    if (!value.isValid())
        return respond(errorResponse(QStringLiteral("Unknown config key: %1").arg(key)));

    QJsonObject obj;
    obj["success"] = true;
    obj["key"] = key;
    obj["value"] = QJsonValue::fromVariant(value);
    respond(obj);
}

// Changes are written to disk and take effect on the next start.
void IpcServer::handleSetConfig(const QJsonObject& data, Responder respond)
{
    if (!config_) return respond(unavailable("Config"));

    const QString key = data.value("key").toString();
    if (key.isEmpty() || !data.contains("value"))
        return respond(errorResponse("key and value are required"));

    if (!config_->setValueByPath(key, data.value("value").toVariant()))
        return respond(errorResponse(QStringLiteral("Unknown config key: %1").arg(key)));
    if (!config_->save(configPath_))
        return respond(errorResponse("Failed to write config file"));

    BOOST_LOG_TRIVIAL(info) << "[IpcServer] Config " << key.toStdString() << " updated";
    respond(OperationResult::ok().toJson());
}

QJsonObject IpcServer::errorResponse(const QString& message)
{
    QJsonObject obj;
    obj["success"] = false;
    obj["error"] = message;
    return obj;
}

QJsonObject IpcServer::unavailable(const char* what)
{
    return errorResponse(QStringLiteral("%1 not available").arg(QLatin1String(what)));
}

} // namespace svr
