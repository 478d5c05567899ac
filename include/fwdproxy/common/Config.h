#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fwdproxy {
namespace common {

// Process-wide INI store.
//   [section]
//   key = value        ; or # comments on their own line
//   key = "value"      ; quotes keep surrounding spaces
// Keys before the first section header belong to [global]. A later
// duplicate key wins. Unparsable lines are skipped with a warning.
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Replaces all settings with the parsed text.
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);
    bool HasKey(const std::string& section, const std::string& key) const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "");
    // The whole value must be a number; anything else yields the default.
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0);
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0);
    // Comma separated, items trimmed, empty items dropped.
    std::vector<std::string> GetList(const std::string& section, const std::string& key);

private:
    using SectionMap = std::map<std::string, std::map<std::string, std::string>>;

    Config() = default;
    static std::string Trim(const std::string& s);
    static SectionMap Parse(std::istream& in, const std::string& origin);
    std::optional<std::string> Lookup(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    SectionMap settings_;
};

} // namespace common
} // namespace fwdproxy
