#pragma once

#include "fwdproxy/monitor/AccessDecision.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fwdproxy {
namespace monitor {

// Domain blocklist. Immutable once built, so any number of sessions may
// call Evaluate concurrently without locking. Updates build a new policy
// and swap the shared_ptr.
//
//   "*.example.com"  blocks example.com and every subdomain of it
//   "example.com"    blocks exactly example.com
class AccessPolicy {
public:
    struct Rule {
        std::string pattern; // normalised text, reported as the block reason
        std::string domain;  // pattern without the "*." prefix
        bool wildcard{false};
    };

    AccessPolicy() = default;
    explicit AccessPolicy(const std::vector<std::string>& patterns);

    // First matching rule wins.
    AccessDecision Evaluate(const std::string& host) const;

    size_t size() const { return rules_.size(); }
    const std::vector<Rule>& rules() const { return rules_; }

    // Lower-cases and strips a trailing dot. nullopt for unusable patterns.
    static std::optional<Rule> NormalizePattern(const std::string& raw);

    // One pattern per line; blank lines and '#' comments skipped.
    static bool LoadPatternFile(const std::string& path, std::vector<std::string>* out);

private:
    std::vector<Rule> rules_;
};

using AccessPolicyPtr = std::shared_ptr<const AccessPolicy>;

} // namespace monitor
} // namespace fwdproxy
