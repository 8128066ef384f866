#pragma once

#include <QList>
#include <QString>
#include <cstdint>

#include <osv/Version.hpp>

namespace osv {

/// One transport variant of the remote channel. Older sets only speak plain
/// ws:// on 8001, newer ones only wss:// on 8002.
struct ConnectionProfile {
    uint16_t port = SECURE_PORT;
    bool secure = true;

    static ConnectionProfile forPort(uint16_t port)
    {
        return ConnectionProfile{port, port != PLAIN_PORT};
    }
};

struct SessionConfig {
    QString appName = "SmartViewRemote";
    int handshakeTimeout = HANDSHAKE_TIMEOUT_MS;

    // Tried in order until one pairs.
    QList<ConnectionProfile> profiles = {
        ConnectionProfile{SECURE_PORT, true},
        ConnectionProfile{PLAIN_PORT, false},
    };
};

} // namespace osv
