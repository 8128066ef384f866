#include <osv/Session/PairingSession.hpp>
#include <osv/Channel/RemoteMessage.hpp>
#include <QRegularExpression>
#include <QUrlQuery>
#include <QDebug>

namespace osv {

PairingSession::PairingSession(ITransport* transport, const SessionConfig& config,
                               QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , config_(config)
{
    handshakeTimer_.setSingleShot(true);
    connect(&handshakeTimer_, &QTimer::timeout, this, &PairingSession::onHandshakeTimeout);

    connect(transport_, &ITransport::textReceived,
            this, &PairingSession::onTextReceived);
    connect(transport_, &ITransport::disconnected,
            this, &PairingSession::onTransportDisconnected);
    connect(transport_, &ITransport::error,
            this, &PairingSession::onTransportError);
}

PairingSession::~PairingSession()
{
    handshakeTimer_.stop();
}

void PairingSession::start(const QString& host, const ConnectionProfile& profile,
                           const QString& token)
{
    if (state_ != SessionState::Idle)
        return;

    token_ = token;
    const QUrl url = buildUrl(host, profile, config_.appName, token);
    qInfo() << "[PairingSession] Connecting to" << maskedUrl(url);

    setState(SessionState::Connecting);
    handshakeTimer_.start(config_.handshakeTimeout);
    transport_->open(url);
}

void PairingSession::abort()
{
    handshakeTimer_.stop();
    transport_->disconnect(this);
    if (state_ == SessionState::Connecting || state_ == SessionState::Paired) {
        transport_->close();
        setState(SessionState::Closed);
    }
}

QUrl PairingSession::buildUrl(const QString& host, const ConnectionProfile& profile,
                              const QString& appName, const QString& token)
{
    QUrl url;
    url.setScheme(profile.secure ? "wss" : "ws");
    url.setHost(host);
    url.setPort(profile.port);
    url.setPath(QLatin1String(API_PATH) + QLatin1String("channels/") + QLatin1String(REMOTE_CHANNEL));

    QUrlQuery query;
    query.addQueryItem("name", QString::fromLatin1(appName.toUtf8().toBase64()));
    if (!token.isEmpty())
        query.addQueryItem("token", token);
    url.setQuery(query);
    return url;
}

QString PairingSession::maskedUrl(const QUrl& url)
{
    QString text = url.toString();
    static const QRegularExpression tokenRe("token=[^&]*");
    text.replace(tokenRe, "token=***");
    return text;
}

bool PairingSession::isRejection(int closeCode, const QString& reason)
{
    if (closeCode == CLOSE_CODE_REJECTED)
        return true;
    // QWebSocket downgrades an invalid close status to a protocol error but
    // keeps the offending code in the reason text.
    return reason.contains(QString::number(CLOSE_CODE_REJECTED));
}

QString PairingSession::rejectionMessage()
{
    return QStringLiteral("TV rejected the connection. Allow this device on the TV "
                          "(Settings > General > External Device Manager) and try again.");
}

void PairingSession::setState(SessionState newState)
{
    if (state_ == newState) return;
    state_ = newState;
    qDebug() << "[PairingSession] State:" << static_cast<int>(newState);
    emit stateChanged(newState);
}

void PairingSession::fail(PairingError error, const QString& message)
{
    handshakeTimer_.stop();
    transport_->disconnect(this);
    transport_->close();
    setState(SessionState::Failed);
    qWarning() << "[PairingSession] Handshake failed:" << message;
    emit failed(error, message);
}

void PairingSession::onTextReceived(const QString& message)
{
    const RemoteMessage::ChannelEvent ev = RemoteMessage::parseEvent(message);
    if (!ev.valid)
        return;

    if (state_ == SessionState::Connecting) {
        if (ev.event == QLatin1String(RemoteMessage::EVENT_CHANNEL_CONNECT)) {
            handshakeTimer_.stop();
            // A freshly issued token replaces whatever was presented.
            const QString issued = ev.data.value("token").toString();
            if (!issued.isEmpty())
                token_ = issued;
            setState(SessionState::Paired);
            emit paired(token_);
        } else if (ev.event == QLatin1String(RemoteMessage::EVENT_CHANNEL_UNAUTHORIZED)) {
            fail(PairingError::Rejected, rejectionMessage());
        } else if (ev.event == QLatin1String(RemoteMessage::EVENT_CHANNEL_TIMEOUT)) {
            fail(PairingError::Timeout,
                 QStringLiteral("Pairing prompt on the TV timed out"));
        }
        return;
    }

    if (state_ == SessionState::Paired
        && ev.event != QLatin1String(RemoteMessage::EVENT_CHANNEL_CONNECT)) {
        emit eventReceived(ev.raw);
    }
}

void PairingSession::onTransportDisconnected(int closeCode, const QString& reason)
{
    if (state_ == SessionState::Connecting) {
        if (isRejection(closeCode, reason))
            fail(PairingError::Rejected, rejectionMessage());
        else
            fail(PairingError::TransportClosed, QStringLiteral("TV closed the connection"));
        return;
    }

    if (state_ == SessionState::Paired) {
        transport_->disconnect(this);
        setState(SessionState::Closed);
        emit closed(closeCode, reason);
    }
}

void PairingSession::onTransportError(const QString& message)
{
    if (state_ != SessionState::Connecting) {
        qWarning() << "[PairingSession] Transport error:" << message;
        return;
    }
    if (isRejection(0, message))
        fail(PairingError::Rejected, rejectionMessage());
    else
        fail(PairingError::TransportError, message);
}

void PairingSession::onHandshakeTimeout()
{
    if (state_ != SessionState::Connecting) return;
    fail(PairingError::Timeout, QStringLiteral("Connection timed out - no response from TV"));
}

} // namespace osv
