#include "ddmstatus/runtime/Agent.hpp"
#include "ddmstatus/probe/SystemProbe.hpp"
#include <iostream>
#include <thread>

using namespace ddmstatus;

static StatusSnapshot collectNow(const SourcePaths& paths) {
    return collectSnapshot(paths, probe::localNow());
}

Agent::Agent(Context& ctx) : Agent(ctx, collectNow) {}

Agent::Agent(Context& ctx, Collector collector)
    : ctx_(ctx), collector_(std::move(collector)) {}

void Agent::refreshOnce() {
    StatusSnapshot snap = collector_(ctx_.config.paths);

    std::cout << "[REFRESH] #" << (ctx_.board.refresh_count() + 1)
              << " installed=" << snap.installed_version
              << " up_to_date=" << (snap.enforcement.is_up_to_date ? "true" : "false");
    if (snap.enforcement.days_remaining) {
        std::cout << " days_remaining=" << *snap.enforcement.days_remaining;
    }
    std::cout << " urgency=" << urgencyName(snap.urgency())
              << " disk_ok=" << (snap.diskSpaceOK() ? "true" : "false")
              << " uptime_ok=" << (snap.uptimeOK() ? "true" : "false")
              << "\n";

    ctx_.board.publish(std::move(snap));
}

bool Agent::poll(std::chrono::steady_clock::time_point now) {
    const bool requested = ctx_.refresh_requested.exchange(false);
    if (started_ && !requested && now < next_due_) return false;

    if (requested) std::cout << "[AGENT] refresh requested\n";
    refreshOnce();
    started_ = true;
    next_due_ = now + std::chrono::seconds(ctx_.config.refresh_interval_sec);
    return true;
}

void Agent::run() {
    std::cout << "[AGENT] refresh every " << ctx_.config.refresh_interval_sec << "s\n";

    while (ctx_.running.load()) {
        poll(std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[AGENT] stopped after " << ctx_.board.refresh_count() << " refreshes\n";
}
