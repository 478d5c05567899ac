#include "fwdproxy/monitor/AccessPolicy.h"
#include "fwdproxy/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using fwdproxy::monitor::AccessDecision;
using fwdproxy::monitor::AccessPolicy;

int main() {
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    // Default list.
    {
        AccessPolicy policy({"*.youtube.com", "*.ytimg.com", "*.googlevideo.com"});
        assert(policy.size() == 3);

        AccessDecision d = policy.Evaluate("www.youtube.com");
        assert(d.kind == AccessDecision::Kind::kBlocked);
        assert(d.reason == "*.youtube.com");
        assert(policy.Evaluate("youtube.com").kind == AccessDecision::Kind::kBlocked);
        assert(policy.Evaluate("YOUTUBE.COM.").kind == AccessDecision::Kind::kBlocked);
        assert(policy.Evaluate("r3---sn-abc.googlevideo.com").reason == "*.googlevideo.com");
        assert(policy.Evaluate("i.ytimg.com").reason == "*.ytimg.com");

        assert(policy.Evaluate("notyoutube.com").allowed());
        assert(policy.Evaluate("youtube.com.evil.test").allowed());
        assert(policy.Evaluate("example.com").allowed());
        assert(policy.Evaluate("").allowed());
    }

    // Exact patterns only match the host itself.
    {
        AccessPolicy policy({"Example.ORG", "", "bad pattern", "*.", "example.org"});
        assert(policy.size() == 1);
        assert(policy.Evaluate("example.org").reason == "example.org");
        assert(policy.Evaluate("www.example.org").allowed());
    }

    // First match wins.
    {
        AccessPolicy policy({"*.a.test", "b.a.test"});
        assert(policy.Evaluate("b.a.test").reason == "*.a.test");
    }

    // Empty policy allows everything.
    {
        AccessPolicy policy;
        assert(policy.Evaluate("www.youtube.com").allowed());
    }

    {
        auto rule = AccessPolicy::NormalizePattern("  *.Example.Com.  ");
        assert(rule);
        assert(rule->wildcard);
        assert(rule->domain == "example.com");
        assert(rule->pattern == "*.example.com");
        assert(!AccessPolicy::NormalizePattern("*"));
        assert(!AccessPolicy::NormalizePattern("a*.b.com"));
        assert(!AccessPolicy::NormalizePattern("host:80"));
    }

    // Pattern file.
    {
        const char* path = "access_policy_test.txt";
        std::FILE* fp = std::fopen(path, "w");
        assert(fp);
        std::fputs("# comment\n\n*.tracker.test\nads.test  # inline\n", fp);
        std::fclose(fp);

        std::vector<std::string> patterns;
        assert(AccessPolicy::LoadPatternFile(path, &patterns));
        assert(patterns.size() == 2);
        assert(patterns[0] == "*.tracker.test");
        assert(patterns[1] == "ads.test");
        std::remove(path);

        std::vector<std::string> none;
        assert(!AccessPolicy::LoadPatternFile("/nonexistent/fwdproxy/patterns.txt", &none));
        assert(none.empty());
    }

    assert(std::string(fwdproxy::monitor::AccessDecisionName(AccessDecision::Kind::kRateLimited)) == "RateLimited");
    return 0;
}
