#pragma once

#include <QObject>
#include <QPointer>
#include <functional>
#include <optional>

#include <osv/Session/PairingSession.hpp>
#include <osv/Transport/ITransport.hpp>

#include "TvSettings.hpp"
#include "TvTypes.hpp"

namespace svr {

class SavedConnectionStore;

struct ConnectRequest {
    QString ip;
    QString mac;
    QString friendlyName;
    uint16_t port = 0;  // 0 = try every configured profile in order
};

/// Owns the single live connection to a TV: pairing, token reuse,
/// persistence of the remembered device, and teardown.
///
/// At most one connection exists at a time. connectToDevice() tears down the
/// current one first; a second connect while a handshake is still running
/// fails with Busy. Everything runs on the owning thread.
class ConnectionManager : public QObject {
    Q_OBJECT
public:
    using TransportFactory = std::function<osv::ITransport*(QObject* parent)>;

    ConnectionManager(SavedConnectionStore* store, const ConnectionSettings& settings,
                      QObject* parent = nullptr);
    ~ConnectionManager() override;

    /// Replaces the WebSocket transport (tests inject osv::ReplayTransport).
    void setTransportFactory(TransportFactory factory);

    void connectToDevice(const ConnectRequest& request, ResultCallback done);

    /// Reconnects to the saved device. Reports false without touching the
    /// network when nothing is saved.
    void autoReconnect(std::function<void(bool)> done);

    /// Idempotent.
    void disconnectDevice();

    DeviceStatus status() const;
    bool isChannelOpen() const;
    bool isConnecting() const { return pending_.has_value(); }

    /// The associated device, if any (may outlive an open channel only
    /// momentarily; both are cleared together).
    std::optional<Device> currentDevice() const;

    /// Sends one frame on the live channel. A failed send tears the
    /// connection down.
    bool send(const QString& message);

signals:
    void statusChanged();

private:
    struct ConnectionState {
        Device device;
        QPointer<osv::ITransport> transport;
        QPointer<osv::PairingSession> session;
        QString token;
    };

    struct PendingAttempt {
        Device device;
        QString token;
        QList<osv::ConnectionProfile> profiles;
        int index = 0;
        ResultCallback done;
        QPointer<osv::ITransport> transport;
        QPointer<osv::PairingSession> session;
    };

    void tryNextProfile();
    void onPaired(const QString& token);
    void onAttemptFailed(osv::PairingError error, const QString& message);
    void onChannelClosed(int closeCode, const QString& reason);
    void clearState();
    void releaseAttemptObjects();

    static ErrorCode errorFor(osv::PairingError error);

    SavedConnectionStore* store_;
    ConnectionSettings settings_;
    TransportFactory transportFactory_;
    std::optional<ConnectionState> state_;
    std::optional<PendingAttempt> pending_;
};

} // namespace svr
