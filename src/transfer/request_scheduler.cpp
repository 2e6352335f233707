#include "chunkwire/transfer/request_scheduler.hpp"
#include "chunkwire/core/logger.hpp"
#include <algorithm>

namespace chunkwire::transfer {

RequestScheduler::RequestScheduler(std::uint32_t window_size, std::uint32_t max_range_size,
                                   std::chrono::milliseconds stall_timeout, std::uint32_t stall_retry_cap)
    : window_size_(std::max<std::uint32_t>(1, window_size))
    , max_range_size_(std::max<std::uint32_t>(1, max_range_size))
    , stall_timeout_(stall_timeout)
    , stall_retry_cap_(stall_retry_cap) {
}

std::vector<storage::Range> RequestScheduler::fill_window(const storage::Bitfield& held, Clock::time_point now) {
    std::vector<storage::Range> issued;
    if (window_full()) {
        return issued;
    }

    for (const auto& missing : held.missing_ranges(max_range_size_)) {
        // Carve out whatever part of this run is already requested.
        std::uint32_t cursor = missing.start;
        bool exhausted = false;

        auto it = in_flight_.upper_bound(missing.start);
        if (it != in_flight_.begin()) {
            --it;
        }

        for (; it != in_flight_.end() && it->second.range.start <= missing.end; ++it) {
            const auto& busy = it->second.range;
            if (busy.end < cursor) {
                continue;
            }
            if (busy.start > cursor) {
                storage::Range piece{cursor, busy.start - 1};
                issued.push_back(piece);
                if (in_flight_.size() + issued.size() >= window_size_) {
                    exhausted = true;
                    break;
                }
            }
            cursor = busy.end + 1;
            if (cursor > missing.end) {
                break;
            }
        }

        if (!exhausted && cursor <= missing.end && cursor >= missing.start) {
            issued.push_back({cursor, missing.end});
        }

        if (in_flight_.size() + issued.size() >= window_size_) {
            break;
        }
    }

    for (const auto& range : issued) {
        add(range, range.length(), now, 0);
    }

    if (!issued.empty()) {
        LOG_TRACE("Scheduled {} ranges, {} in flight", issued.size(), in_flight_.size());
    }
    return issued;
}

bool RequestScheduler::on_chunk(std::uint32_t index, Clock::time_point now) {
    auto it = find_containing(index);
    if (it == in_flight_.end()) {
        // late chunk from an evicted or pre-pause request
        return false;
    }

    auto& entry = it->second;
    entry.last_activity = now;
    entry.stalls = 0;
    if (entry.remaining > 0) {
        --entry.remaining;
    }

    if (entry.remaining == 0) {
        in_flight_.erase(it);
        return true;
    }
    return false;
}

RequestScheduler::StallReport RequestScheduler::collect_stalled(const storage::Bitfield& held, Clock::time_point now) {
    StallReport report;
    std::vector<InFlight> stalled;

    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (now - it->second.last_activity >= stall_timeout_) {
            stalled.push_back(it->second);
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& entry : stalled) {
        auto stalls = entry.stalls + 1;
        LOG_DEBUG("Range {}-{} stalled ({} in a row)", entry.range.start, entry.range.end, stalls);
        if (stalls > stall_retry_cap_) {
            report.degraded.push_back(entry.range);
        }

        // Reissue only the part still missing, as long as the window allows.
        std::uint32_t index = entry.range.start;
        while (index <= entry.range.end && !window_full()) {
            if (held.has(index)) {
                ++index;
                continue;
            }
            std::uint32_t end = index;
            while (end < entry.range.end && !held.has(end + 1)) {
                ++end;
            }

            storage::Range piece{index, end};
            add(piece, piece.length(), now, stalls);
            report.reissued.push_back(piece);

            if (end == entry.range.end) {
                break;
            }
            index = end + 1;
        }
    }

    std::sort(report.reissued.begin(), report.reissued.end(),
              [](const storage::Range& a, const storage::Range& b) { return a.start < b.start; });
    return report;
}

void RequestScheduler::clear() {
    in_flight_.clear();
}

bool RequestScheduler::is_in_flight(std::uint32_t index) const {
    auto it = in_flight_.upper_bound(index);
    if (it == in_flight_.begin()) {
        return false;
    }
    --it;
    return it->second.range.contains(index);
}

std::vector<storage::Range> RequestScheduler::in_flight() const {
    std::vector<storage::Range> ranges;
    ranges.reserve(in_flight_.size());
    for (const auto& [start, entry] : in_flight_) {
        ranges.push_back(entry.range);
    }
    return ranges;
}

std::map<std::uint32_t, RequestScheduler::InFlight>::iterator RequestScheduler::find_containing(std::uint32_t index) {
    auto it = in_flight_.upper_bound(index);
    if (it == in_flight_.begin()) {
        return in_flight_.end();
    }
    --it;
    return it->second.range.contains(index) ? it : in_flight_.end();
}

void RequestScheduler::add(const storage::Range& range, std::uint32_t remaining,
                           Clock::time_point now, std::uint32_t stalls) {
    in_flight_[range.start] = InFlight{range, remaining, now, stalls};
}

}
