#pragma once

#include <QString>

namespace svr {

/// Fixed name -> Tizen app id table for the streaming apps the remote knows.
class AppCatalog {
public:
    /// Id for a known display name ("Disney+"), or empty.
    static QString appId(const QString& appName);

    /// appId(), or the name itself when it is a purely numeric raw id.
    static QString resolveLenient(const QString& appName);
};

} // namespace svr
