#pragma once

#include <QObject>
#include <memory>
#include <vector>

#include "IDiscoveryStrategy.hpp"
#include "TvSettings.hpp"

namespace svr {

/// Runs discovery strategies in order; the first one that finds anything
/// wins and later ones are not run. The default chain is SSDP, then a
/// subnet probe.
class DeviceDiscoveryService : public QObject {
    Q_OBJECT
public:
    explicit DeviceDiscoveryService(const DiscoverySettings& settings, QObject* parent = nullptr);
    ~DeviceDiscoveryService() override;

    /// Replaces the chain (tests).
    void setStrategies(std::vector<std::unique_ptr<IDiscoveryStrategy>> strategies);

    /// timeoutMs > 0 overrides the passive listen time for this call. A call
    /// made while a run is in progress waits for that run's result.
    void discover(int timeoutMs, DevicesCallback done);

    /// Merges entries with the same ip, keeping the first seen.
    static QList<Device> deduplicate(const QList<Device>& devices);

private:
    void runStrategy(size_t index, int timeoutMs, DevicesCallback done);

    std::vector<std::unique_ptr<IDiscoveryStrategy>> strategies_;
    QList<DevicesCallback> waiting_;
};

} // namespace svr
