#include <osv/Transport/WebSocketTransport.hpp>
#include <QNetworkRequest>
#include <QSslError>
#include <QDebug>

namespace osv {

WebSocketTransport::WebSocketTransport(QObject* parent)
    : ITransport(parent)
{
    connectSocketSignals();
}

WebSocketTransport::~WebSocketTransport()
{
    socket_.disconnect(this);
    socket_.abort();
}

void WebSocketTransport::open(const QUrl& url)
{
    closing_ = false;
    socket_.open(QNetworkRequest(url));
}

void WebSocketTransport::close()
{
    if (socket_.state() == QAbstractSocket::UnconnectedState)
        return;
    closing_ = true;
    socket_.close();
}

bool WebSocketTransport::sendText(const QString& message)
{
    if (!isConnected()) {
        qWarning() << "[WebSocketTransport] send DROPPED:" << message.size()
                   << "chars (socket state:" << static_cast<int>(socket_.state()) << ")";
        return false;
    }
    return socket_.sendTextMessage(message) > 0;
}

bool WebSocketTransport::isConnected() const
{
    return socket_.state() == QAbstractSocket::ConnectedState;
}

void WebSocketTransport::connectSocketSignals()
{
    connect(&socket_, &QWebSocket::connected, this, &WebSocketTransport::connected);
    connect(&socket_, &QWebSocket::textMessageReceived, this, &WebSocketTransport::textReceived);
    connect(&socket_, &QWebSocket::disconnected, this, [this]() {
        const int code = static_cast<int>(socket_.closeCode());
        qDebug() << "[WebSocketTransport] closed, code" << code << socket_.closeReason()
                 << (closing_ ? "(local)" : "(remote)");
        emit disconnected(code, socket_.closeReason());
    });
    connect(&socket_, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        emit error(socket_.errorString());
    });
    connect(&socket_, &QWebSocket::sslErrors, this, [this](const QList<QSslError>& errors) {
        qDebug() << "[WebSocketTransport] ignoring" << errors.size() << "TLS errors";
        socket_.ignoreSslErrors();
    });
}

} // namespace osv
