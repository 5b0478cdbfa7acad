//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// config/config_source.cpp
//===----------------------------------------------------------------------===//

#include "config/config_source.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace sqlbridge {

namespace {

void Trim(std::string& text, const char* blanks) {
    text.erase(0, text.find_first_not_of(blanks));
    text.erase(text.find_last_not_of(blanks) + 1);
}

std::string Unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Nested maps become dotted keys; null entries are skipped
bool Flatten(const YAML::Node& node, const std::string& prefix,
             std::unordered_map<std::string, std::string>& out, std::string& error) {
    switch (node.Type()) {
    case YAML::NodeType::Map:
        for (const auto& entry : node) {
            std::string key = entry.first.as<std::string>();
            if (!Flatten(entry.second, prefix.empty() ? key : prefix + "." + key, out, error)) {
                return false;
            }
        }
        return true;
    case YAML::NodeType::Scalar:
        out[prefix] = node.Scalar();
        return true;
    case YAML::NodeType::Sequence:
        error = "Unsupported list value for key: " + prefix;
        return false;
    default:
        return true;
    }
}

} // anonymous namespace

bool ConfigSource::LoadIni(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        error_ = "Cannot open config file: " + path;
        return false;
    }

    std::string line;
    std::string section;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        Trim(line, " \t\r");
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                error_ = "Invalid section header at line " + std::to_string(line_num);
                return false;
            }
            section = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            error_ = "Invalid syntax at line " + std::to_string(line_num);
            return false;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        Trim(key, " \t");
        Trim(value, " \t");

        values_[section.empty() ? key : section + "." + key] = Unquote(value);
    }
    return true;
}

bool ConfigSource::LoadYaml(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        error_ = "Cannot open config file: " + path;
        return false;
    } catch (const YAML::Exception& e) {
        error_ = "YAML parse error: " + std::string(e.what());
        return false;
    }

    if (!root.IsMap() && !root.IsNull()) {
        error_ = "YAML config must be a map: " + path;
        return false;
    }
    return Flatten(root, std::string(), values_, error_);
}

bool ConfigSource::Has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

bool ConfigSource::InvalidValue(const std::string& key, const std::string& raw) {
    error_ = "Invalid value for " + key + ": " + raw;
    return false;
}

bool ConfigSource::ReadString(const std::string& key, std::string& value) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        value = it->second;
    }
    return true;
}

bool ConfigSource::ReadBool(const std::string& key, bool& value) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return true;
    }

    std::string text = it->second;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "yes" || text == "on" || text == "1") {
        value = true;
        return true;
    }
    if (text == "false" || text == "no" || text == "off" || text == "0") {
        value = false;
        return true;
    }
    return InvalidValue(key, it->second);
}

bool ConfigSource::ReadInt64(const std::string& key, int64_t& value) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return true;
    }

    const std::string& text = it->second;
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || errno == ERANGE || end != text.c_str() + text.size()) {
        return InvalidValue(key, text);
    }
    value = static_cast<int64_t>(parsed);
    return true;
}

bool ConfigSource::ReadInt32(const std::string& key, int32_t& value) {
    int64_t wide = value;
    if (!ReadInt64(key, wide)) {
        return false;
    }
    if (wide < std::numeric_limits<int32_t>::min() || wide > std::numeric_limits<int32_t>::max()) {
        return InvalidValue(key, values_[key]);
    }
    value = static_cast<int32_t>(wide);
    return true;
}

} // namespace sqlbridge
