#include "ddmstatus/status/StatusBoard.hpp"

using namespace ddmstatus;

void StatusBoard::publish(StatusSnapshot snap) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        snapshot_ = std::move(snap);
    }
    refreshes_.fetch_add(1);
}

std::optional<StatusSnapshot> StatusBoard::current() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return snapshot_;
}

uint64_t StatusBoard::refresh_count() const {
    return refreshes_.load();
}
