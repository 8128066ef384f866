#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace osv {

/// JSON frames exchanged on the samsung.remote.control channel.
namespace RemoteMessage {

constexpr const char* EVENT_CHANNEL_CONNECT = "ms.channel.connect";
constexpr const char* EVENT_CHANNEL_UNAUTHORIZED = "ms.channel.unauthorized";
constexpr const char* EVENT_CHANNEL_TIMEOUT = "ms.channel.timeOut";

struct ChannelEvent {
    bool valid = false;
    QString event;
    QJsonObject data;
    QJsonObject raw;
};

/// Single key press (SendRemoteKey / Click).
QString keyClick(const QString& keyCode);

/// On-screen keyboard text; the payload is base64 of the UTF-8 bytes.
QString inputString(const QString& text);

/// Deep-link launch of an installed app, addressed to the TV host.
QString deepLink(const QString& appId, const QString& metaTag);

/// Body for the REST deep-link fallback (POST /api/v2/applications/<appId>).
QByteArray restDeepLinkBody(const QString& appId, const QString& metaTag);

/// Parse an inbound frame. Non-JSON or non-object frames yield valid == false.
ChannelEvent parseEvent(const QString& message);

} // namespace RemoteMessage
} // namespace osv
