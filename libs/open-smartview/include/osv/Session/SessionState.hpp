#pragma once

namespace osv {

enum class SessionState {
    Idle,
    Connecting,
    Paired,
    Failed,
    Closed
};

enum class PairingError {
    None,
    Timeout,
    Rejected,
    TransportClosed,
    TransportError
};

} // namespace osv
