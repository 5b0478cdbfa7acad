//===----------------------------------------------------------------------===//
//                         SqlBridge Server
//
// handler/sql_pattern.hpp
//
// SQL LIKE-style name patterns: '%' matches any sequence, '_' any single
// character, everything else literally. An empty pattern matches all names.
//===----------------------------------------------------------------------===//

#pragma once

#include <regex>
#include <string>

namespace sqlbridge {

class SqlPattern {
public:
    explicit SqlPattern(const std::string& pattern);

    // Full-string match
    bool Matches(const std::string& name) const;

    static std::string ToRegex(const std::string& pattern);

private:
    bool match_all_;
    std::regex regex_;
};

} // namespace sqlbridge
