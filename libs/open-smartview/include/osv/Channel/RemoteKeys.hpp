#pragma once

#include <QString>
#include <QStringList>

namespace osv {

/// Symbolic remote-control keys understood by the TV. The device accepts more
/// codes than are listed here; unlisted codes are sent verbatim.
class RemoteKeys {
public:
    static const QStringList& names();

    /// Code for a known key name. Accepts the exact name, the name in any case,
    /// or the name without its KEY_ prefix ("volup" -> KEY_VOLUP).
    /// Returns an empty string when the key is not in the table.
    static QString resolve(const QString& name);

    static bool isKnown(const QString& name) { return !resolve(name).isEmpty(); }
};

} // namespace osv
