#include "fwdproxy/ProxyServer.h"
#include "fwdproxy/ProxyOptions.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/Timer.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/common/Config.h"
#include "fwdproxy/monitor/AccessPolicy.h"
#include "fwdproxy/monitor/MetricsSink.h"
#include "fwdproxy/monitor/Stats.h"

#include <unistd.h>
#include <getopt.h>
#include <csignal>
#include <cstdio>
#include <functional>
#include <memory>

int main(int argc, char* argv[]) {
    using namespace fwdproxy;

    std::string configFile = "../config/fwdproxy.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    ::signal(SIGPIPE, SIG_IGN);

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }
    common::Logger::Instance().SetLevel(
        common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    const ProxyOptions opts = ProxyOptions::FromConfig(conf);

    if (checkOnly) {
        size_t valid = 0;
        for (const auto& p : opts.blockPatterns) {
            if (monitor::AccessPolicy::NormalizePattern(p)) ++valid;
        }
        printf("OK listen_port=%u block_patterns=%zu/%zu\n",
               static_cast<unsigned>(opts.listenPort), valid, opts.blockPatterns.size());
        return valid == opts.blockPatterns.size() ? 0 : 1;
    }

    auto sinks = std::make_shared<monitor::FanoutMetricsSink>();
    if (opts.metricsLog) {
        sinks->Add(std::make_shared<monitor::LogMetricsSink>());
    }
    if (!opts.metricsJsonlPath.empty()) {
        auto jsonl = std::make_shared<monitor::JsonLinesMetricsSink>(opts.metricsJsonlPath);
        if (jsonl->ok()) {
            sinks->Add(jsonl);
            LOG_INFO << "Metrics events appended to " << opts.metricsJsonlPath;
        } else {
            LOG_ERROR << "Cannot open metrics file " << opts.metricsJsonlPath << ", continuing without it";
        }
    }

    LOG_INFO << "Starting forward proxy on port " << opts.listenPort << "...";

    network::EventLoop loop;
    ProxyServer server(&loop, opts);
    server.SetMetricsSink(sinks);
    if (!server.Start()) {
        LOG_FATAL << "Cannot start listener on port " << opts.listenPort;
        return 1;
    }

    network::Timer statsTimer(&loop);
    std::function<void()> logStats;
    if (opts.statsLogIntervalSec > 0.0) {
        logStats = [&]() {
            LOG_INFO << "stats open=" << server.OpenConnections() << " "
                     << monitor::Stats::Instance().ToJson();
            statsTimer.Start(opts.statsLogIntervalSec, logStats);
        };
        statsTimer.Start(opts.statsLogIntervalSec, logStats);
    }

    loop.Loop();
    return 0;
}
