#pragma once

#include "TvTypes.hpp"

namespace svr {

class IVideoSearchClient {
public:
    virtual ~IVideoSearchClient() = default;

    /// Candidate videos for a search term, in the engine's result order.
    /// Never fails: any network or parse problem yields an empty list.
    virtual void search(const QString& term, VideoResultsCallback done) = 0;
};

} // namespace svr
