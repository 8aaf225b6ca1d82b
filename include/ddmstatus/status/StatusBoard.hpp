#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

#include "ddmstatus/status/StatusSnapshot.hpp"

namespace ddmstatus {

// Holds the latest snapshot. The refresh loop publishes, the HTTP thread
// reads. A publish replaces the whole snapshot; nothing is merged.
class StatusBoard {
public:
    void publish(StatusSnapshot snap);

    // Copy of the current snapshot, nullopt before the first publish.
    std::optional<StatusSnapshot> current() const;

    uint64_t refresh_count() const;

private:
    mutable std::mutex mtx_;
    std::optional<StatusSnapshot> snapshot_;
    std::atomic<uint64_t> refreshes_{0};
};

}
