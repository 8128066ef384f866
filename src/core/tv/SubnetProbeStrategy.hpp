#pragma once

#include <QObject>

#include "IDiscoveryStrategy.hpp"
#include "TvSettings.hpp"

namespace svr {

class DeviceInfoProbe;

/// Active pass: probes every host .1 to .254 of the local /24 at once and
/// keeps whatever answers. Results come back in arrival order.
class SubnetProbeStrategy : public QObject, public IDiscoveryStrategy {
    Q_OBJECT
public:
    explicit SubnetProbeStrategy(const DiscoverySettings& settings, QObject* parent = nullptr);

    QString name() const override { return QStringLiteral("subnet-probe"); }
    void discover(int timeoutMs, DevicesCallback done) override;

    /// "192.168.1" for the first non-loopback IPv4 interface that is up,
    /// empty when there is none.
    static QString localSubnetPrefix();

private:
    DiscoverySettings settings_;
    DeviceInfoProbe* probe_;
};

} // namespace svr
