#include "chunkwire/transfer/session_config.hpp"
#include "chunkwire/core/logger.hpp"
#include <algorithm>

namespace chunkwire::transfer {

const char* to_string(SessionRole role) {
    switch (role) {
        case SessionRole::SENDER: return "sender";
        case SessionRole::RECEIVER: return "receiver";
        default: return "unknown";
    }
}

SessionConfig SessionConfig::from_config(const core::Config& config, SessionRole role) {
    SessionConfig result;
    result.role = role;

    result.window_size = static_cast<std::uint32_t>(std::max(1, config.get_int("transfer.window_size", 10)));
    result.max_range_size = static_cast<std::uint32_t>(std::max(1, config.get_int("transfer.max_range_size", 64)));
    result.stall_timeout = std::chrono::milliseconds(
        std::max(1, config.get_int("transfer.stall_timeout_ms", 10000)));
    result.stall_retry_cap = static_cast<std::uint32_t>(std::max(0, config.get_int("transfer.stall_retry_cap", 3)));

    result.high_water_mark = static_cast<std::size_t>(std::max(1, config.get_int("transfer.high_water_mark", 262144)));
    result.low_water_mark = static_cast<std::size_t>(std::max(0, config.get_int("transfer.low_water_mark", 65536)));
    if (result.low_water_mark > result.high_water_mark) {
        LOG_WARN("transfer.low_water_mark {} exceeds high water mark {}, clamping",
                 result.low_water_mark, result.high_water_mark);
        result.low_water_mark = result.high_water_mark;
    }

    result.store_retry.attempts = std::max(1, config.get_int("transfer.store_retry_attempts", 3));
    result.store_retry.backoff = std::chrono::milliseconds(
        std::max(0, config.get_int("transfer.store_retry_backoff_ms", 50)));

    result.eta.window = std::chrono::milliseconds(std::max(1, config.get_int("eta.window_ms", 4000)));
    result.eta.update_interval = std::chrono::milliseconds(std::max(1, config.get_int("eta.update_interval_ms", 1000)));
    result.eta.stall = std::chrono::milliseconds(std::max(1, config.get_int("eta.stall_ms", 2000)));
    result.eta.alpha = std::clamp(config.get_double("eta.alpha", 0.5), 0.0, 1.0);
    result.eta.beta = std::clamp(config.get_double("eta.beta", 0.3), 0.0, 1.0);

    result.auto_accept = config.get_bool("transfer.auto_accept", false);

    return result;
}

}
