//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/sql_pattern.cpp
//===----------------------------------------------------------------------===//

#include "handler/sql_pattern.hpp"

namespace sqlbridge {

SqlPattern::SqlPattern(const std::string& pattern)
    : match_all_(pattern.empty()) {
    if (!match_all_) {
        regex_ = std::regex(ToRegex(pattern), std::regex::ECMAScript);
    }
}

bool SqlPattern::Matches(const std::string& name) const {
    return match_all_ || std::regex_match(name, regex_);
}

std::string SqlPattern::ToRegex(const std::string& pattern) {
    static const std::string special = "\\^$.|?*+()[]{}";

    std::string regex;
    regex.reserve(pattern.size() * 2);
    for (char c : pattern) {
        if (c == '%') {
            regex += ".*";
        } else if (c == '_') {
            regex += '.';
        } else {
            if (special.find(c) != std::string::npos) {
                regex += '\\';
            }
            regex += c;
        }
    }
    return regex;
}

} // namespace sqlbridge
