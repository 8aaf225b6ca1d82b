#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include "ddmstatus/config/AgentConfig.hpp"
#include "ddmstatus/probe/SystemProbe.hpp"
#include "ddmstatus/runtime/Agent.hpp"
#include "ddmstatus/runtime/Context.hpp"
#include "ddmstatus/server/HttpServer.hpp"
#include "ddmstatus/status/StatusRender.hpp"

static std::atomic<bool> g_running{true};
static void on_signal(int){ g_running.store(false); }

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [config.ini] [--once]\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--once") == 0) {
            once = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            usage(argv[0]);
            return 2;
        } else {
            config_path = argv[i];
        }
    }

    ddmstatus::ConfigLoader loader;
    loader.load(config_path);

    ddmstatus::Context ctx;
    ctx.config = ddmstatus::AgentConfig::fromLoader(loader);

    if (once) {
        auto snap = ddmstatus::collectSnapshot(ctx.config.paths, ddmstatus::probe::localNow());
        std::cout << ddmstatus::toSummary(snap);
        return 0;
    }

    loader.dump();

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    ddmstatus::HttpServer server(ctx.config.http_address, ctx.config.http_port, ctx);
    if (!server.open()) return 1;

    std::thread http_thread([&server] { server.run(); });

    ddmstatus::Agent agent(ctx);
    std::thread agent_thread([&agent] { agent.run(); });

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[AGENT] shutting down\n";
    ctx.running.store(false);
    agent_thread.join();
    http_thread.join();
    return 0;
}
