#include "fwdproxy/monitor/AccessPolicy.h"
#include "fwdproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace fwdproxy {
namespace monitor {

const char* AccessDecisionName(AccessDecision::Kind k) {
    switch (k) {
        case AccessDecision::Kind::kAllowed: return "Allowed";
        case AccessDecision::Kind::kBlocked: return "Blocked";
        case AccessDecision::Kind::kRateLimited: return "RateLimited";
    }
    return "Unknown";
}

namespace {

std::string TrimCopy(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string NormalizeHost(const std::string& raw) {
    std::string h;
    h.reserve(raw.size());
    for (unsigned char c : raw) h.push_back(static_cast<char>(std::tolower(c)));
    while (!h.empty() && h.back() == '.') h.pop_back();
    return h;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::optional<AccessPolicy::Rule> AccessPolicy::NormalizePattern(const std::string& raw) {
    std::string p = NormalizeHost(TrimCopy(raw));
    if (p.empty()) return std::nullopt;

    Rule rule;
    std::string domain = p;
    if (p.size() >= 2 && p[0] == '*' && p[1] == '.') {
        rule.wildcard = true;
        domain = p.substr(2);
    }
    if (domain.empty() || domain[0] == '.') return std::nullopt;
    for (unsigned char c : domain) {
        if (std::isspace(c) || c == '*' || c == '/' || c == ':' || c < 0x21) return std::nullopt;
    }
    rule.domain = domain;
    rule.pattern = rule.wildcard ? "*." + domain : domain;
    return rule;
}

AccessPolicy::AccessPolicy(const std::vector<std::string>& patterns) {
    rules_.reserve(patterns.size());
    for (const auto& raw : patterns) {
        auto rule = NormalizePattern(raw);
        if (!rule) {
            LOG_WARN << "AccessPolicy skipping invalid pattern '" << raw << "'";
            continue;
        }
        auto dup = std::find_if(rules_.begin(), rules_.end(), [&](const Rule& r) {
            return r.pattern == rule->pattern;
        });
        if (dup != rules_.end()) continue;
        rules_.push_back(std::move(*rule));
    }
}

AccessDecision AccessPolicy::Evaluate(const std::string& host) const {
    if (rules_.empty()) return AccessDecision::Allowed();
    const std::string h = NormalizeHost(host);
    if (h.empty()) return AccessDecision::Allowed();

    for (const auto& r : rules_) {
        if (h == r.domain) return AccessDecision::Blocked(r.pattern);
        if (r.wildcard && h.size() > r.domain.size() &&
            EndsWith(h, r.domain) && h[h.size() - r.domain.size() - 1] == '.') {
            return AccessDecision::Blocked(r.pattern);
        }
    }
    return AccessDecision::Allowed();
}

bool AccessPolicy::LoadPatternFile(const std::string& path, std::vector<std::string>* out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_ERROR << "AccessPolicy cannot open pattern file " << path;
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = TrimCopy(line);
        if (!line.empty()) out->push_back(line);
    }
    return true;
}

} // namespace monitor
} // namespace fwdproxy
