#include "ConnectionManager.hpp"
#include "SavedConnectionStore.hpp"

#include <osv/Transport/WebSocketTransport.hpp>
#include <QJsonDocument>
#include <boost/log/trivial.hpp>

namespace svr {

ConnectionManager::ConnectionManager(SavedConnectionStore* store,
                                     const ConnectionSettings& settings,
                                     QObject* parent)
    : QObject(parent)
    , store_(store)
    , settings_(settings)
    , transportFactory_([](QObject* owner) -> osv::ITransport* {
          return new osv::WebSocketTransport(owner);
      })
{
}

ConnectionManager::~ConnectionManager()
{
    disconnectDevice();
}

void ConnectionManager::setTransportFactory(TransportFactory factory)
{
    transportFactory_ = std::move(factory);
}

void ConnectionManager::connectToDevice(const ConnectRequest& request, ResultCallback done)
{
    if (pending_) {
        done(OperationResult::failure(ErrorCode::Busy,
                                      QStringLiteral("A connection attempt is already in progress")));
        return;
    }

    disconnectDevice();

    PendingAttempt attempt;
    attempt.device = Device{request.ip, request.mac, request.friendlyName};
    attempt.done = std::move(done);

    // The saved token only belongs to the saved device.
    std::optional<SavedConnection> saved = store_->load();
    if (saved && saved->ip == request.ip && !saved->token.isEmpty())
        attempt.token = saved->token;

    if (request.port != 0)
        attempt.profiles = {osv::ConnectionProfile::forPort(request.port)};
    else
        attempt.profiles = settings_.session.profiles;

    if (attempt.profiles.isEmpty()) {
        attempt.done(OperationResult::failure(ErrorCode::NetworkError,
                                              QStringLiteral("No connection profiles configured")));
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Connecting to " << request.ip.toStdString()
                            << (attempt.token.isEmpty() ? " (no saved token)" : " (saved token)");

    pending_ = std::move(attempt);
    tryNextProfile();
}

void ConnectionManager::autoReconnect(std::function<void(bool)> done)
{
    std::optional<SavedConnection> saved = store_->load();
    if (!saved) {
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] No saved TV, skipping auto-reconnect";
        done(false);
        return;
    }

    ConnectRequest request;
    request.ip = saved->ip;
    request.mac = saved->mac;
    request.friendlyName = saved->friendlyName;
    connectToDevice(request, [done](const OperationResult& result) {
        done(result.success);
    });
}

void ConnectionManager::disconnectDevice()
{
    if (!state_)
        return;

    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Disconnecting from "
                            << state_->device.ip.toStdString();
    clearState();
    emit statusChanged();
}

DeviceStatus ConnectionManager::status() const
{
    DeviceStatus s;
    s.connected = isChannelOpen();
    if (state_) {
        s.hasDevice = true;
        s.device = state_->device;
    }
    return s;
}

bool ConnectionManager::isChannelOpen() const
{
    return state_ && state_->transport && state_->transport->isConnected();
}

std::optional<Device> ConnectionManager::currentDevice() const
{
    if (!state_)
        return std::nullopt;
    return state_->device;
}

bool ConnectionManager::send(const QString& message)
{
    if (!isChannelOpen())
        return false;

    if (!state_->transport->sendText(message)) {
        BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Send failed, dropping connection to "
                                   << state_->device.ip.toStdString();
        clearState();
        emit statusChanged();
        return false;
    }
    return true;
}

void ConnectionManager::tryNextProfile()
{
    releaseAttemptObjects();

    const osv::ConnectionProfile profile = pending_->profiles.at(pending_->index);
    osv::ITransport* transport = transportFactory_(this);
    auto* session = new osv::PairingSession(transport, settings_.session, this);
    pending_->transport = transport;
    pending_->session = session;

    connect(session, &osv::PairingSession::paired, this, &ConnectionManager::onPaired);
    connect(session, &osv::PairingSession::failed, this, &ConnectionManager::onAttemptFailed);

    BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] Handshake on port " << profile.port
                             << (profile.secure ? " (wss)" : " (ws)");
    session->start(pending_->device.ip, profile, pending_->token);
}

void ConnectionManager::onPaired(const QString& token)
{
    if (!pending_)
        return;

    PendingAttempt attempt = std::move(*pending_);
    pending_.reset();

    ConnectionState st;
    st.device = attempt.device;
    st.transport = attempt.transport;
    st.session = attempt.session;
    st.token = token;
    state_ = st;

    connect(st.session, &osv::PairingSession::eventReceived, this, [](const QJsonObject& event) {
        BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] TV msg: "
                                 << QJsonDocument(event).toJson(QJsonDocument::Compact).toStdString();
    });
    connect(st.session, &osv::PairingSession::closed, this, &ConnectionManager::onChannelClosed);

    SavedConnection saved{st.device.ip, st.device.mac, st.device.friendlyName, token};
    if (!store_->save(saved)) {
        BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Connected, but the pairing could not be saved to "
                                   << store_->filePath().toStdString();
    }

    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Connected to "
                            << (st.device.friendlyName.isEmpty() ? st.device.ip : st.device.friendlyName).toStdString();
    emit statusChanged();
    attempt.done(OperationResult::ok());
}

void ConnectionManager::onAttemptFailed(osv::PairingError error, const QString& message)
{
    if (!pending_)
        return;

    BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Port "
                               << pending_->profiles.at(pending_->index).port
                               << " failed: " << message.toStdString();

    pending_->index++;
    if (pending_->index < pending_->profiles.size()) {
        tryNextProfile();
        return;
    }

    ResultCallback done = std::move(pending_->done);
    releaseAttemptObjects();
    pending_.reset();
    done(OperationResult::failure(errorFor(error), message));
}

void ConnectionManager::onChannelClosed(int closeCode, const QString& reason)
{
    if (!state_)
        return;

    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] TV disconnected (code " << closeCode
                            << (reason.isEmpty() ? std::string() : ", " + reason.toStdString()) << ")";
    clearState();
    emit statusChanged();
}

void ConnectionManager::clearState()
{
    if (!state_)
        return;

    if (state_->session) {
        state_->session->abort();
        state_->session->deleteLater();
    }
    if (state_->transport)
        state_->transport->deleteLater();
    state_.reset();
}

void ConnectionManager::releaseAttemptObjects()
{
    if (!pending_)
        return;
    if (pending_->session)
        pending_->session->deleteLater();
    if (pending_->transport)
        pending_->transport->deleteLater();
    pending_->session = nullptr;
    pending_->transport = nullptr;
}

ErrorCode ConnectionManager::errorFor(osv::PairingError error)
{
    switch (error) {
    case osv::PairingError::Timeout: return ErrorCode::HandshakeTimeout;
    case osv::PairingError::Rejected: return ErrorCode::HandshakeRejected;
    case osv::PairingError::TransportClosed: return ErrorCode::TransportClosed;
    case osv::PairingError::TransportError: return ErrorCode::NetworkError;
    case osv::PairingError::None: break;
    }
    return ErrorCode::NetworkError;
}

} // namespace svr
