#pragma once

#include "chunkwire/storage/bitfield.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <vector>

namespace chunkwire::transfer {

// Receiver-side pipelining. Turns missing ranges into at most window_size in-flight
// requests, never overlapping, always issued in ascending order.
class RequestScheduler {
public:
    using Clock = std::chrono::steady_clock;

    struct StallReport {
        std::vector<storage::Range> reissued;
        // Ranges that stalled more than the retry cap in a row. Still reissued.
        std::vector<storage::Range> degraded;
    };

    RequestScheduler(std::uint32_t window_size, std::uint32_t max_range_size,
                     std::chrono::milliseconds stall_timeout, std::uint32_t stall_retry_cap);

    // Plans missing ranges not already in flight until the window is full.
    // The returned ranges are in flight from now on.
    std::vector<storage::Range> fill_window(const storage::Bitfield& held, Clock::time_point now = Clock::now());

    // Call once per newly held chunk. Returns true when this completed its range.
    bool on_chunk(std::uint32_t index, Clock::time_point now = Clock::now());

    // Evicts ranges with no chunk for stall_timeout and reissues their still-missing part.
    StallReport collect_stalled(const storage::Bitfield& held, Clock::time_point now = Clock::now());

    // Drops all in-flight bookkeeping (transport lost).
    void clear();

    bool is_in_flight(std::uint32_t index) const;
    std::vector<storage::Range> in_flight() const;
    std::size_t in_flight_count() const { return in_flight_.size(); }
    bool window_full() const { return in_flight_.size() >= window_size_; }

    std::uint32_t window_size() const { return window_size_; }
    std::uint32_t max_range_size() const { return max_range_size_; }

private:
    struct InFlight {
        storage::Range range;
        std::uint32_t remaining;
        Clock::time_point last_activity;
        std::uint32_t stalls;
    };

    std::uint32_t window_size_;
    std::uint32_t max_range_size_;
    std::chrono::milliseconds stall_timeout_;
    std::uint32_t stall_retry_cap_;

    // keyed by range start
    std::map<std::uint32_t, InFlight> in_flight_;

    std::map<std::uint32_t, InFlight>::iterator find_containing(std::uint32_t index);
    void add(const storage::Range& range, std::uint32_t remaining, Clock::time_point now, std::uint32_t stalls);
};

}
