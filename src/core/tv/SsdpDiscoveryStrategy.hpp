#pragma once

#include <QList>
#include <QObject>
#include <QTimer>

#include "IDiscoveryStrategy.hpp"
#include "TvSettings.hpp"

class QUdpSocket;

namespace svr {

class DeviceInfoProbe;

/// Passive pass: SSDP M-SEARCH for Samsung remote-control receivers,
/// listening for timeoutMs. Each responder is then asked for its name and
/// MAC over HTTP; if that fails it is still reported, as "Samsung TV".
/// Callers arriving during a pass share its result.
class SsdpDiscoveryStrategy : public QObject, public IDiscoveryStrategy {
    Q_OBJECT
public:
    static constexpr const char* SEARCH_TARGET = "urn:samsung.com:device:RemoteControlReceiver:1";

    struct SsdpResponse {
        bool valid = false;
        QString location;
        QString searchTarget;
        QString usn;
    };

    explicit SsdpDiscoveryStrategy(const DiscoverySettings& settings, QObject* parent = nullptr);

    QString name() const override { return QStringLiteral("ssdp"); }
    void discover(int timeoutMs, DevicesCallback done) override;

    static QByteArray searchMessage();
    static SsdpResponse parseSsdpResponse(const QByteArray& datagram);

private:
    void onReadyRead();
    void onListenFinished();
    void finish(const QList<Device>& devices);

    DiscoverySettings settings_;
    QUdpSocket* socket_ = nullptr;
    DeviceInfoProbe* probe_;
    QTimer listenTimer_;
    QList<QString> responders_;
    QList<DevicesCallback> waiting_;
};

} // namespace svr
