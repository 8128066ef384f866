#pragma once

#include "TvTypes.hpp"

namespace svr {

/// Splits a free-text request ("play stranger things on netflix") into the
/// target app and the search term. Pure; every input yields a result.
/// Apps are matched in priority order Netflix, Disney+, Hulu, HBO Max,
/// Prime Video, YouTube; with no match the app is YouTube.
SmartQuery parseSmartQuery(const QString& query);

} // namespace svr
