#include "CommandChannel.hpp"
#include "AppCatalog.hpp"
#include "ConnectionManager.hpp"

#include <osv/Channel/RemoteKeys.hpp>
#include <osv/Channel/RemoteMessage.hpp>
#include <osv/Version.hpp>

#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <boost/log/trivial.hpp>

namespace svr {

CommandChannel::CommandChannel(ConnectionManager* connection, const CommandSettings& settings,
                               QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , settings_(settings)
    , nam_(new QNetworkAccessManager(this))
{
}

OperationResult CommandChannel::sendKey(const QString& key)
{
    if (!connection_->isChannelOpen())
        return OperationResult::failure(ErrorCode::NotConnected, kNotConnectedMessage);

    QString code = osv::RemoteKeys::resolve(key);
    if (code.isEmpty()) {
        BOOST_LOG_TRIVIAL(debug) << "[CommandChannel] Unlisted key, sending raw: " << key.toStdString();
        code = key;
    }

    if (!connection_->send(osv::RemoteMessage::keyClick(code)))
        return OperationResult::failure(ErrorCode::TransportClosed,
                                        QStringLiteral("Failed to send key %1").arg(code));
    return OperationResult::ok();
}

OperationResult CommandChannel::sendText(const QString& text)
{
    if (!connection_->isChannelOpen())
        return OperationResult::failure(ErrorCode::NotConnected, kNotConnectedMessage);

    if (!connection_->send(osv::RemoteMessage::inputString(text)))
        return OperationResult::failure(ErrorCode::TransportClosed,
                                        QStringLiteral("Failed to send text"));
    return OperationResult::ok();
}

void CommandChannel::launchApp(const QString& appName, ResultCallback done)
{
    std::optional<Device> device = connection_->currentDevice();
    if (!device) {
        done(OperationResult::failure(ErrorCode::NotConnected, kNotConnectedMessage));
        return;
    }

    const QString appId = AppCatalog::resolveLenient(appName);
    if (appId.isEmpty()) {
        done(OperationResult::failure(
            ErrorCode::UnknownApp,
            QStringLiteral("Unknown app: %1. Use a known app name or a numeric app ID.").arg(appName)));
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "[CommandChannel] Launching " << appName.toStdString()
                            << " (" << appId.toStdString() << ")";

    QNetworkReply* reply = postToApplication(device->ip, appId, QByteArray());
    connect(reply, &QNetworkReply::finished, this, [reply, appName, done]() {
        reply->deleteLater();
        if (reply->error() == QNetworkReply::NoError) {
            done(OperationResult::ok());
            return;
        }

        QString message = errorMessageFrom(reply->readAll());
        if (message.isEmpty())
            message = QStringLiteral("Failed to launch %1").arg(appName);
        BOOST_LOG_TRIVIAL(warning) << "[CommandChannel] Launch failed: " << message.toStdString()
                                   << " (" << reply->errorString().toStdString() << ")";
        done(OperationResult::failure(ErrorCode::NetworkError, message));
    });
}

void CommandChannel::castToTV(const QString& appName, const QString& contentId,
                              const QString& metaTag, ResultCallback done)
{
    const QString appId = AppCatalog::appId(appName);
    if (appId.isEmpty()) {
        done(OperationResult::failure(ErrorCode::UnknownApp,
                                      QStringLiteral("Unknown app: %1").arg(appName)));
        return;
    }

    std::optional<Device> device = connection_->currentDevice();
    if (!connection_->isChannelOpen() || !device) {
        done(OperationResult::failure(ErrorCode::NotConnected, kNotConnectedMessage));
        return;
    }

    const QString tag = metaTag.isEmpty() ? contentId : metaTag;

    if (connection_->send(osv::RemoteMessage::deepLink(appId, tag))) {
        BOOST_LOG_TRIVIAL(info) << "[CommandChannel] Cast to " << appName.toStdString()
                                << ": " << tag.toStdString();
        done(OperationResult::ok());
        return;
    }

    BOOST_LOG_TRIVIAL(warning) << "[CommandChannel] Channel deep link failed, trying REST for "
                               << appName.toStdString();

    QNetworkReply* reply = postToApplication(device->ip, appId,
                                             osv::RemoteMessage::restDeepLinkBody(appId, tag));
    connect(reply, &QNetworkReply::finished, this, [reply, appName, done]() {
        reply->deleteLater();
        if (reply->error() == QNetworkReply::NoError) {
            done(OperationResult::ok());
            return;
        }

        QString message = errorMessageFrom(reply->readAll());
        if (message.isEmpty())
            message = reply->errorString();
        BOOST_LOG_TRIVIAL(warning) << "[CommandChannel] REST deep link failed: " << message.toStdString();
        done(OperationResult::failure(ErrorCode::NetworkError, message));
    });
}

QStringList CommandChannel::availableKeys()
{
    return osv::RemoteKeys::names();
}

QNetworkReply* CommandChannel::postToApplication(const QString& ip, const QString& appId,
                                                 const QByteArray& body)
{
    QUrl url;
    url.setScheme("http");
    url.setHost(ip);
    url.setPort(settings_.restPort);
    url.setPath(QString::fromLatin1(osv::API_PATH) + "applications/" + appId);

    QNetworkRequest request(url);
    request.setTransferTimeout(settings_.restTimeoutMs);
    if (!body.isEmpty())
        request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    return nam_->post(request, body);
}

QString CommandChannel::errorMessageFrom(const QByteArray& body)
{
    QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isObject())
        return QString();
    return doc.object().value("message").toString();
}

} // namespace svr
