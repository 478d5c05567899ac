#pragma once

#include <string>

namespace fwdproxy {
namespace monitor {

// Outcome of a policy or rate check. Built once per request.
struct AccessDecision {
    enum class Kind { kAllowed, kBlocked, kRateLimited };

    Kind kind{Kind::kAllowed};
    // Matched pattern for kBlocked, "N requests per Ws" for kRateLimited.
    std::string reason;

    bool allowed() const { return kind == Kind::kAllowed; }

    static AccessDecision Allowed() { return AccessDecision{}; }
    static AccessDecision Blocked(const std::string& pattern) { return AccessDecision{Kind::kBlocked, pattern}; }
    static AccessDecision RateLimited(const std::string& why) { return AccessDecision{Kind::kRateLimited, why}; }
};

const char* AccessDecisionName(AccessDecision::Kind k);

} // namespace monitor
} // namespace fwdproxy
