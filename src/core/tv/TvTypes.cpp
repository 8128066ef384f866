#include "TvTypes.hpp"

namespace svr {

QJsonObject Device::toJson() const
{
    QJsonObject obj;
    obj["ip"] = ip;
    obj["mac"] = mac;
    obj["friendlyName"] = friendlyName;
    return obj;
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return QStringLiteral("None");
    case ErrorCode::NotConnected: return QStringLiteral("NotConnected");
    case ErrorCode::UnknownApp: return QStringLiteral("UnknownApp");
    case ErrorCode::HandshakeTimeout: return QStringLiteral("HandshakeTimeout");
    case ErrorCode::HandshakeRejected: return QStringLiteral("HandshakeRejected");
    case ErrorCode::TransportClosed: return QStringLiteral("TransportClosed");
    case ErrorCode::NetworkError: return QStringLiteral("NetworkError");
    case ErrorCode::NotFound: return QStringLiteral("NotFound");
    case ErrorCode::Busy: return QStringLiteral("Busy");
    case ErrorCode::InvalidArgument: return QStringLiteral("InvalidArgument");
    }
    return QStringLiteral("Unknown");
}

QJsonObject OperationResult::toJson() const
{
    QJsonObject obj;
    obj["success"] = success;
    if (!success) {
        obj["error"] = message;
        obj["code"] = errorCodeName(error);
    }
    return obj;
}

QJsonObject DeviceStatus::toJson() const
{
    QJsonObject obj;
    obj["connected"] = connected;
    obj["device"] = hasDevice ? QJsonValue(device.toJson()) : QJsonValue(QJsonValue::Null);
    return obj;
}

QJsonObject SmartSearchResult::toJson() const
{
    QJsonObject obj;
    obj["success"] = success;
    if (success) {
        obj["app"] = app;
        obj["search"] = search;
        obj["usedFallback"] = usedFallback;
        if (!message.isEmpty())
            obj["message"] = message;
    } else {
        obj["error"] = message;
        obj["code"] = errorCodeName(error);
    }
    return obj;
}

QJsonObject VideoResult::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["channel"] = channel;
    return obj;
}

} // namespace svr
