#pragma once

#include <QJsonObject>
#include <QObject>
#include <QTimer>
#include <QUrl>

#include <osv/Transport/ITransport.hpp>
#include <osv/Session/SessionConfig.hpp>
#include <osv/Session/SessionState.hpp>

namespace osv {

/// Drives one pairing handshake on the remote-control channel and, once
/// paired, relays the channel's events until it closes.
///
/// The session does not own the transport. A session is single-use: after
/// Failed or Closed a new session must be created for the next attempt.
class PairingSession : public QObject {
    Q_OBJECT
public:
    PairingSession(ITransport* transport, const SessionConfig& config,
                   QObject* parent = nullptr);
    ~PairingSession() override;

    /// Opens the transport and waits for ms.channel.connect.
    /// An empty token pairs without one (the TV will prompt the user).
    void start(const QString& host, const ConnectionProfile& profile,
               const QString& token = QString());

    /// Abandon the handshake or close a paired channel without emitting
    /// failed() or closed().
    void abort();

    SessionState state() const { return state_; }
    QString token() const { return token_; }
    ITransport* transport() const { return transport_; }

    static QUrl buildUrl(const QString& host, const ConnectionProfile& profile,
                         const QString& appName, const QString& token = QString());

    /// URL safe for logs (token value replaced by ***).
    static QString maskedUrl(const QUrl& url);

    /// True for the close signature the TV uses when the user has not
    /// allowed this client.
    static bool isRejection(int closeCode, const QString& reason);

    static QString rejectionMessage();

signals:
    void stateChanged(osv::SessionState newState);
    void paired(const QString& token);
    void failed(osv::PairingError error, const QString& message);
    void eventReceived(const QJsonObject& event);
    void closed(int closeCode, const QString& reason);

private:
    void setState(SessionState newState);
    void fail(PairingError error, const QString& message);

    void onTextReceived(const QString& message);
    void onTransportDisconnected(int closeCode, const QString& reason);
    void onTransportError(const QString& message);
    void onHandshakeTimeout();

    ITransport* transport_;
    SessionConfig config_;
    SessionState state_ = SessionState::Idle;
    QString token_;
    QTimer handshakeTimer_;
};

} // namespace osv
