#pragma once
#include <chrono>
#include <functional>

#include "ddmstatus/runtime/Context.hpp"

namespace ddmstatus {

// Periodic refresh loop. Collects a snapshot at start, then every
// refresh_interval_sec or as soon as a refresh is requested.
class Agent {
public:
    using Collector = std::function<StatusSnapshot(const SourcePaths&)>;

    explicit Agent(Context& ctx);
    Agent(Context& ctx, Collector collector);

    // Collect one snapshot and publish it wholesale.
    void refreshOnce();

    // One scheduling step: refreshes if due or requested. Returns true if
    // it refreshed.
    bool poll(std::chrono::steady_clock::time_point now);

    void run();   // until ctx_.running goes false

private:
    Context& ctx_;
    Collector collector_;
    std::chrono::steady_clock::time_point next_due_{};
    bool started_{false};
};

}
