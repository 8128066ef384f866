#pragma once
#include <cstdint>

namespace osv {

constexpr uint16_t PLAIN_PORT = 8001;   // ws://
constexpr uint16_t SECURE_PORT = 8002;  // wss://, self-signed certificate
constexpr uint16_t REST_PORT = 8001;

constexpr const char* API_PATH = "/api/v2/";
constexpr const char* REMOTE_CHANNEL = "samsung.remote.control";

// Close code the TV sends (without a valid status) when the user has not
// approved the pairing request on screen.
constexpr int CLOSE_CODE_REJECTED = 1005;

constexpr int HANDSHAKE_TIMEOUT_MS = 15000;

} // namespace osv
