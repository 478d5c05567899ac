#include "fwdproxy/ProxyOptions.h"
#include "fwdproxy/common/Config.h"
#include "fwdproxy/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <string>

using fwdproxy::ProxyOptions;
using fwdproxy::common::Config;

int main() {
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);
    auto& conf = Config::Instance();

    // Level names from log_level.
    {
        auto& logger = fwdproxy::common::Logger::Instance();
        assert(logger.ParseLevel("debug") == fwdproxy::common::LogLevel::DEBUG);
        assert(logger.ParseLevel("Warning") == fwdproxy::common::LogLevel::WARN);
        assert(logger.ParseLevel("bogus") == fwdproxy::common::LogLevel::INFO);
        assert(logger.GetLevel() == fwdproxy::common::LogLevel::ERROR);
    }

    // Defaults.
    {
        assert(conf.LoadFromString(""));
        ProxyOptions o = ProxyOptions::FromConfig(conf);
        assert(o.listenPort == 8080);
        assert(o.threads == 4);
        assert(o.blockPatterns.size() == 3);
        assert(o.blockPatterns[0] == "*.youtube.com");
        assert(o.rateLimit.maxRequests == 100);
        assert(o.rateLimit.windowSec == 10.0);
        assert(o.connectTimeoutSec == 5.0);
        assert(o.headerReadTimeoutSec == 10.0);
        assert(o.tunnelIdleSec == 60.0);
        assert(o.responseIdleSec == 30.0);
        assert(o.maxHeaderBytes == 16384);
        assert(o.metricsLog);
        assert(o.metricsJsonlPath.empty());
        assert(!o.tlsEnable);
    }

    // Parsing, comments, lists.
    {
        assert(conf.LoadFromString(
            "# comment\n"
            "[global]\n"
            "listen_port = 3128\n"
            "threads = 2\n"
            "; another comment\n"
            "[blocklist]\n"
            "patterns = *.ads.test , tracker.test,,\n"
            "[rate_limit]\n"
            "max_requests = 20\n"
            "window_sec = 2.5\n"
            "[timeouts]\n"
            "connect_sec = 1.5\n"
            "[metrics]\n"
            "log = 0\n"
            "jsonl_path = /tmp/events.jsonl\n"));
        assert(conf.GetString("global", "listen_port") == "3128");
        assert(conf.HasKey("rate_limit", "window_sec"));
        assert(!conf.HasKey("rate_limit", "nope"));

        ProxyOptions o = ProxyOptions::FromConfig(conf);
        assert(o.listenPort == 3128);
        assert(o.threads == 2);
        assert(o.blockPatterns.size() == 2);
        assert(o.blockPatterns[0] == "*.ads.test");
        assert(o.blockPatterns[1] == "tracker.test");
        assert(o.rateLimit.maxRequests == 20);
        assert(o.rateLimit.windowSec == 2.5);
        assert(o.connectTimeoutSec == 1.5);
        assert(!o.metricsLog);
        assert(o.metricsJsonlPath == "/tmp/events.jsonl");
    }

    // Quoted values, junk lines and duplicate keys.
    {
        assert(conf.LoadFromString(
            "no equals sign here\n"
            "[metrics]\n"
            "jsonl_path = \" spaced.jsonl \"\n"
            "[global\n"
            "log = 1\n"
            "log = 0\n"
            "= orphan\n"));
        assert(conf.GetString("metrics", "jsonl_path") == " spaced.jsonl ");
        assert(conf.GetInt("metrics", "log", 7) == 0);
        assert(!conf.HasKey("metrics", ""));
        assert(conf.GetInt("metrics", "jsonl_path", 7) == 7);
    }

    // Empty patterns value disables the list.
    {
        assert(conf.LoadFromString("[blocklist]\npatterns =\n"));
        assert(ProxyOptions::FromConfig(conf).blockPatterns.empty());
    }

    // Invalid numbers keep defaults; out-of-range values are clamped.
    {
        assert(conf.LoadFromString(
            "[global]\n"
            "listen_port = 99999\n"
            "threads = abc\n"
            "[rate_limit]\n"
            "max_requests = 0\n"
            "window_sec = -3\n"
            "[timeouts]\n"
            "header_read_sec = 0\n"
            "[limits]\n"
            "max_header_bytes = 12\n"));
        ProxyOptions o = ProxyOptions::FromConfig(conf);
        assert(o.listenPort == 65535);
        assert(o.threads == 4);
        assert(o.rateLimit.maxRequests == 1);
        assert(o.rateLimit.windowSec == 10.0);
        assert(o.headerReadTimeoutSec == 10.0);
        assert(o.maxHeaderBytes == 256);
    }

    // Patterns from a file are appended.
    {
        const char* path = "config_options_blocklist.txt";
        std::FILE* fp = std::fopen(path, "w");
        assert(fp);
        std::fputs("# extra\nextra.test\n", fp);
        std::fclose(fp);

        conf.SetString("blocklist", "patterns", "*.youtube.com");
        conf.SetString("blocklist", "file", path);
        ProxyOptions o = ProxyOptions::FromConfig(conf);
        assert(o.blockPatterns.size() == 2);
        assert(o.blockPatterns[1] == "extra.test");
        std::remove(path);
    }

    return 0;
}
