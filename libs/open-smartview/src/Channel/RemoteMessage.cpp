#include <osv/Channel/RemoteMessage.hpp>
#include <QJsonDocument>
#include <QJsonParseError>

namespace osv {
namespace RemoteMessage {

namespace {

QString compact(const QJsonObject& obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QJsonObject remoteControl(const QJsonObject& params)
{
    QJsonObject msg;
    msg["method"] = "ms.remote.control";
    msg["params"] = params;
    return msg;
}

} // namespace

QString keyClick(const QString& keyCode)
{
    QJsonObject params;
    params["Cmd"] = "Click";
    params["DataOfCmd"] = keyCode;
    params["Option"] = false;
    params["TypeOfRemote"] = "SendRemoteKey";
    return compact(remoteControl(params));
}

QString inputString(const QString& text)
{
    QJsonObject params;
    params["Cmd"] = QString::fromLatin1(text.toUtf8().toBase64());
    params["DataOfCmd"] = "base64";
    params["TypeOfRemote"] = "SendInputString";
    return compact(remoteControl(params));
}

QString deepLink(const QString& appId, const QString& metaTag)
{
    QJsonObject data;
    data["appId"] = appId;
    data["action_type"] = "DEEP_LINK";
    data["metaTag"] = metaTag;

    QJsonObject params;
    params["event"] = "ed.apps.launch";
    params["to"] = "host";
    params["data"] = data;

    QJsonObject msg;
    msg["method"] = "ms.channel.emit";
    msg["params"] = params;
    return compact(msg);
}

QByteArray restDeepLinkBody(const QString& appId, const QString& metaTag)
{
    QJsonObject body;
    body["appId"] = appId;
    body["action_type"] = "DEEP_LINK";
    body["metaTag"] = metaTag;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

ChannelEvent parseEvent(const QString& message)
{
    ChannelEvent ev;
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return ev;

    ev.raw = doc.object();
    ev.event = ev.raw.value("event").toString();
    ev.data = ev.raw.value("data").toObject();
    ev.valid = true;
    return ev;
}

} // namespace RemoteMessage
} // namespace osv
