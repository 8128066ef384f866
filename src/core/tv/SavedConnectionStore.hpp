#pragma once

#include <QString>
#include <optional>
#include "TvTypes.hpp"

namespace svr {

/// Reads and writes the single remembered pairing as a JSON file.
/// Every save overwrites the previous record wholesale.
class SavedConnectionStore {
public:
    explicit SavedConnectionStore(const QString& filePath);

    /// Missing, unreadable or malformed files all read as "nothing saved".
    std::optional<SavedConnection> load() const;

    /// Creates the parent directory when needed.
    bool save(const SavedConnection& connection) const;

    QString filePath() const { return filePath_; }

private:
    QString filePath_;
};

} // namespace svr
