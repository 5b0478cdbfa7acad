//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// protocol/handshake.hpp
//
// Connection-setup acknowledgment
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace sqlbridge {

struct ServerVersion {
    uint8_t major = 0;
    uint8_t minor = 0;
    uint8_t maintenance = 0;
    std::string stage;
    int64_t build_timestamp = 0;  // seconds since the epoch, UTC
    std::string build_hash;

    // e.g. "1.0.0-release (a1b2c3d)"
    std::string ToString() const;
};

struct HandshakeResult {
    bool accepted = true;
    ServerVersion version;
};

// Version of this build, from version.hpp
ServerVersion CurrentServerVersion();

HandshakeResult MakeHandshake();

} // namespace sqlbridge
