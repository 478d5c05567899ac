#include "fwdproxy/common/Config.h"
#include "fwdproxy/common/Logger.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fwdproxy {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    static const char* kSpace = " \t\r\n\f\v";
    const size_t b = s.find_first_not_of(kSpace);
    if (b == std::string::npos) return std::string();
    const size_t e = s.find_last_not_of(kSpace);
    return s.substr(b, e - b + 1);
}

Config::SectionMap Config::Parse(std::istream& in, const std::string& origin) {
    SectionMap parsed;
    std::string section = "global";
    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                LOG_WARN << origin << ":" << lineNo << ": bad section header, ignored";
                continue;
            }
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        const size_t eq = line.find('=');
        const std::string key = eq == std::string::npos ? std::string() : Trim(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN << origin << ":" << lineNo << ": expected key = value, ignored";
            continue;
        }
        std::string value = Trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        parsed[section][key] = value;
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }
    SectionMap parsed = Parse(file, filename);
    size_t keys = 0;
    for (const auto& s : parsed) keys += s.second.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.swap(parsed);
    }
    LOG_INFO << "Loaded config file: " << filename << " (" << keys << " keys)";
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    SectionMap parsed = Parse(in, "<string>");
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.swap(parsed);
    return true;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

std::optional<std::string> Config::Lookup(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto s = settings_.find(section);
    if (s == settings_.end()) return std::nullopt;
    const auto k = s->second.find(key);
    if (k == s->second.end()) return std::nullopt;
    return k->second;
}

bool Config::HasKey(const std::string& section, const std::string& key) const {
    return Lookup(section, key).has_value();
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) {
    return Lookup(section, key).value_or(defaultVal);
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) {
    const std::optional<std::string> v = Lookup(section, key);
    if (!v || v->empty()) return defaultVal;
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(v->c_str(), &end, 10);
    // "12abc" is a typo, not 12.
    if (errno != 0 || *end != '\0' || n < INT_MIN || n > INT_MAX) {
        LOG_WARN << "config " << section << "." << key << " = \"" << *v << "\" is not an integer";
        return defaultVal;
    }
    return static_cast<int>(n);
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) {
    const std::optional<std::string> v = Lookup(section, key);
    if (!v || v->empty()) return defaultVal;
    errno = 0;
    char* end = nullptr;
    const double d = std::strtod(v->c_str(), &end);
    if (errno != 0 || *end != '\0') {
        LOG_WARN << "config " << section << "." << key << " = \"" << *v << "\" is not a number";
        return defaultVal;
    }
    return d;
}

std::vector<std::string> Config::GetList(const std::string& section, const std::string& key) {
    std::vector<std::string> items;
    const std::string raw = GetString(section, key);
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        if (comma == std::string::npos) comma = raw.size();
        std::string item = Trim(raw.substr(start, comma - start));
        if (!item.empty()) items.push_back(std::move(item));
        start = comma + 1;
    }
    return items;
}

} // namespace common
} // namespace fwdproxy
