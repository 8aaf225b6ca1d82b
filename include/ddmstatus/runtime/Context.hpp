#pragma once

#include <atomic>

#include "ddmstatus/config/AgentConfig.hpp"
#include "ddmstatus/status/StatusBoard.hpp"

namespace ddmstatus {

// Single owner of the agent's shared state. Constructed once in main();
// the refresh loop and the HTTP server both receive a Context&.
struct Context {
    std::atomic<bool> running{true};

    // Set by POST /refresh, consumed by the refresh loop.
    std::atomic<bool> refresh_requested{false};

    AgentConfig config;
    StatusBoard board;
};

}
