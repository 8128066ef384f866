#pragma once

#include "TvTypes.hpp"

namespace svr {

/// One way of finding TVs. Strategies never fail: errors mean no devices.
class IDiscoveryStrategy {
public:
    virtual ~IDiscoveryStrategy() = default;

    virtual QString name() const = 0;

    /// timeoutMs is the listen budget for passive strategies; <= 0 means
    /// the configured default.
    virtual void discover(int timeoutMs, DevicesCallback done) = 0;
};

} // namespace svr
