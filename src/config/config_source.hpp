//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// config/config_source.hpp
//
// Flat view of a configuration file. INI [section] keys and nested YAML maps
// both end up as dotted keys ("handler.max_open_cursors"), so the server
// settings are read the same way whatever the file format.
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace sqlbridge {

class ConfigSource {
public:
    bool LoadIni(const std::string& path);
    bool LoadYaml(const std::string& path);

    bool Has(const std::string& key) const;

    // The Read* calls leave value untouched when key is absent. A present
    // value that does not parse sets the error and returns false.
    bool ReadString(const std::string& key, std::string& value);
    bool ReadBool(const std::string& key, bool& value);
    bool ReadInt64(const std::string& key, int64_t& value);
    bool ReadInt32(const std::string& key, int32_t& value);

    const std::string& GetError() const { return error_; }

private:
    bool InvalidValue(const std::string& key, const std::string& raw);

private:
    std::unordered_map<std::string, std::string> values_;
    std::string error_;
};

} // namespace sqlbridge
