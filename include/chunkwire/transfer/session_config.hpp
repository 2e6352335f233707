#pragma once

#include "chunkwire/core/config.hpp"
#include "chunkwire/storage/persistent_store.hpp"
#include "chunkwire/transfer/throughput_predictor.hpp"
#include <chrono>
#include <cstdint>

namespace chunkwire::transfer {

enum class SessionRole {
    SENDER,
    RECEIVER
};

const char* to_string(SessionRole role);

struct SessionConfig {
    SessionRole role = SessionRole::RECEIVER;

    // Receiver: at most window_size ranges in flight, each at most max_range_size chunks.
    std::uint32_t window_size = 10;
    std::uint32_t max_range_size = 64;
    std::chrono::milliseconds stall_timeout{10000};
    std::uint32_t stall_retry_cap = 3;

    // Sender backpressure, in buffered bytes on the channel.
    std::size_t high_water_mark = 256 * 1024;
    std::size_t low_water_mark = 64 * 1024;

    storage::StoreRetryPolicy store_retry;
    PredictorConfig eta;

    // Receiver accepts an offered file without waiting for accept().
    bool auto_accept = false;

    static SessionConfig from_config(const core::Config& config, SessionRole role = SessionRole::RECEIVER);
};

}
