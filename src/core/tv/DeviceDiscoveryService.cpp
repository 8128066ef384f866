#include "DeviceDiscoveryService.hpp"
#include "SsdpDiscoveryStrategy.hpp"
#include "SubnetProbeStrategy.hpp"

#include <QPointer>
#include <QSet>
#include <boost/log/trivial.hpp>

namespace svr {

DeviceDiscoveryService::DeviceDiscoveryService(const DiscoverySettings& settings, QObject* parent)
    : QObject(parent)
{
    strategies_.push_back(std::make_unique<SsdpDiscoveryStrategy>(settings));
    strategies_.push_back(std::make_unique<SubnetProbeStrategy>(settings));
}

DeviceDiscoveryService::~DeviceDiscoveryService() = default;

void DeviceDiscoveryService::setStrategies(std::vector<std::unique_ptr<IDiscoveryStrategy>> strategies)
{
    strategies_ = std::move(strategies);
}

void DeviceDiscoveryService::discover(int timeoutMs, DevicesCallback done)
{
    waiting_.append(std::move(done));
    if (waiting_.size() > 1) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceDiscovery] Discovery already running, " << waiting_.size()
                                 << " callers waiting";
        return;
    }

    runStrategy(0, timeoutMs, [this](const QList<Device>& devices) {
        const QList<DevicesCallback> callers = std::move(waiting_);
        waiting_.clear();
        for (const DevicesCallback& caller : callers)
            caller(devices);
    });
}

void DeviceDiscoveryService::runStrategy(size_t index, int timeoutMs, DevicesCallback done)
{
    if (index >= strategies_.size()) {
        BOOST_LOG_TRIVIAL(info) << "[DeviceDiscovery] No TVs found";
        done({});
        return;
    }

    IDiscoveryStrategy* strategy = strategies_[index].get();
    QPointer<DeviceDiscoveryService> self(this);
    strategy->discover(timeoutMs, [self, index, timeoutMs, done, name = strategy->name()](const QList<Device>& found) {
        if (!self)
            return;
        const QList<Device> devices = deduplicate(found);
        if (devices.isEmpty()) {
            BOOST_LOG_TRIVIAL(debug) << "[DeviceDiscovery] " << name.toStdString() << " found nothing";
            self->runStrategy(index + 1, timeoutMs, done);
            return;
        }
        BOOST_LOG_TRIVIAL(info) << "[DeviceDiscovery] " << name.toStdString() << " found "
                                << devices.size() << " TV(s)";
        done(devices);
    });
}

QList<Device> DeviceDiscoveryService::deduplicate(const QList<Device>& devices)
{
    QList<Device> unique;
    QSet<QString> seen;
    for (const Device& device : devices) {
        if (seen.contains(device.ip))
            continue;
        seen.insert(device.ip);
        unique.append(device);
    }
    return unique;
}

} // namespace svr
