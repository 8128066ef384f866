#pragma once

#include <QObject>
#include <QStringList>

#include "TvSettings.hpp"
#include "TvTypes.hpp"

class QNetworkAccessManager;
class QNetworkReply;

namespace svr {

class ConnectionManager;

/// Encodes remote-control commands and dispatches them over the live channel
/// held by ConnectionManager, or over the TV's REST API on port 8001.
///
/// Key and text commands are fire-and-forget: success means the frame was
/// handed to the transport, not that the TV acted on it.
class CommandChannel : public QObject {
    Q_OBJECT
public:
    CommandChannel(ConnectionManager* connection, const CommandSettings& settings,
                   QObject* parent = nullptr);

    /// Unknown key names are sent verbatim as raw key codes.
    OperationResult sendKey(const QString& key);
    OperationResult sendText(const QString& text);

    /// Needs an associated device only, not an open channel. A purely
    /// numeric name is accepted as a raw app id.
    void launchApp(const QString& appName, ResultCallback done);

    /// Deep-links content into a known app. Tries the channel first, then
    /// the REST endpoint. No raw-id fallback for the app name.
    void castToTV(const QString& appName, const QString& contentId, const QString& metaTag,
                  ResultCallback done);

    static QStringList availableKeys();

private:
    QNetworkReply* postToApplication(const QString& ip, const QString& appId,
                                     const QByteArray& body);
    static QString errorMessageFrom(const QByteArray& body);

    ConnectionManager* connection_;
    CommandSettings settings_;
    QNetworkAccessManager* nam_;
};

} // namespace svr
