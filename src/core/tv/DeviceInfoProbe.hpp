#pragma once

#include <QList>
#include <QObject>
#include <functional>
#include <optional>

#include "TvTypes.hpp"

class QNetworkAccessManager;

namespace svr {

/// Asks one address for its device description (GET /api/v2/), trying the
/// given ports in order until one answers.
class DeviceInfoProbe : public QObject {
    Q_OBJECT
public:
    using ProbeCallback = std::function<void(const std::optional<Device>&)>;

    DeviceInfoProbe(const QList<uint16_t>& ports, int timeoutMs, QObject* parent = nullptr);

    void probe(const QString& ip, ProbeCallback done);

    /// Device from an /api/v2/ body. nullopt when the body is not a JSON
    /// object with a "device" object.
    static std::optional<Device> parseDeviceInfo(const QByteArray& body, const QString& probedIp);

private:
    void probePort(const QString& ip, int portIndex, ProbeCallback done);

    QList<uint16_t> ports_;
    int timeoutMs_;
    QNetworkAccessManager* nam_;
};

} // namespace svr
