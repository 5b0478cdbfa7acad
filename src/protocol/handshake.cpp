//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// protocol/handshake.cpp
//===----------------------------------------------------------------------===//

#include "protocol/handshake.hpp"
#include "version.hpp"

namespace sqlbridge {

std::string ServerVersion::ToString() const {
    std::string text = std::to_string(major) + "." + std::to_string(minor) + "." +
                       std::to_string(maintenance);
    if (!stage.empty()) {
        text += "-" + stage;
    }
    if (!build_hash.empty()) {
        text += " (" + build_hash + ")";
    }
    return text;
}

ServerVersion CurrentServerVersion() {
    ServerVersion version;
    version.major = SQLBRIDGE_VERSION_MAJOR;
    version.minor = SQLBRIDGE_VERSION_MINOR;
    version.maintenance = SQLBRIDGE_VERSION_MAINTENANCE;
    version.stage = SQLBRIDGE_VERSION_STAGE;
    version.build_timestamp = SQLBRIDGE_BUILD_TIMESTAMP;
    version.build_hash = SQLBRIDGE_GIT_COMMIT;
    return version;
}

HandshakeResult MakeHandshake() {
    HandshakeResult result;
    result.accepted = true;
    result.version = CurrentServerVersion();
    return result;
}

} // namespace sqlbridge
