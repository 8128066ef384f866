#include "SubnetProbeStrategy.hpp"
#include "DeviceInfoProbe.hpp"

#include <QNetworkInterface>
#include <boost/log/trivial.hpp>
#include <memory>

namespace svr {

SubnetProbeStrategy::SubnetProbeStrategy(const DiscoverySettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , probe_(new DeviceInfoProbe(settings.probePorts, settings.probeTimeoutMs, this))
{
}

void SubnetProbeStrategy::discover(int, DevicesCallback done)
{
    const QString prefix = settings_.subnetPrefix.isEmpty() ? localSubnetPrefix()
                                                             : settings_.subnetPrefix;
    if (prefix.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[SubnetProbe] No usable IPv4 address, skipping subnet scan";
        done({});
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "[SubnetProbe] Probing " << prefix.toStdString() << ".1-254";

    auto devices = std::make_shared<QList<Device>>();
    auto remaining = std::make_shared<int>(254);
    for (int host = 1; host <= 254; ++host) {
        const QString ip = prefix + "." + QString::number(host);
        probe_->probe(ip, [devices, remaining, done](const std::optional<Device>& device) {
            if (device)
                devices->append(*device);
            if (--(*remaining) == 0) {
                BOOST_LOG_TRIVIAL(info) << "[SubnetProbe] " << devices->size() << " device(s) answered";
                done(*devices);
            }
        });
    }
}

QString SubnetProbeStrategy::localSubnetPrefix()
{
    for (const auto& iface : QNetworkInterface::allInterfaces()) {
        if (iface.flags().testFlag(QNetworkInterface::IsLoopBack)) continue;
        if (!iface.flags().testFlag(QNetworkInterface::IsUp)) continue;
        for (const auto& entry : iface.addressEntries()) {
            if (entry.ip().protocol() != QAbstractSocket::IPv4Protocol)
                continue;
            const QString address = entry.ip().toString();
            return address.left(address.lastIndexOf('.'));
        }
    }
    return QString();
}

} // namespace svr
