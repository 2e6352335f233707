#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <limits>
#include <mutex>

namespace chunkwire::transfer {

struct HoltConfig {
    double alpha = 0.5;   // level smoothing
    double beta = 0.3;    // trend smoothing
};

struct ForecastBounds {
    double low;
    double high;
};

// Holt's linear trend (double exponential) smoothing over throughput observations.
class HoltSmoother {
public:
    explicit HoltSmoother(HoltConfig config = {});

    void update(double value);

    // Level plus steps * trend, never negative. 0 before the first update.
    double forecast(int steps = 1) const;

    // ~95% interval from the residual standard deviation, widening with the horizon.
    // With fewer than 3 residuals the interval is +/-20% of the forecast.
    ForecastBounds forecast_bounds(int steps = 1) const;

    bool is_stable() const { return update_count_ >= 3; }
    bool initialized() const { return initialized_; }

    void reset();

    double level() const { return level_; }
    double trend() const { return trend_; }
    std::size_t update_count() const { return update_count_; }
    std::size_t residual_count() const { return residuals_.size(); }
    double residual_stddev() const;

private:
    HoltConfig config_;
    double level_;
    double trend_;
    bool initialized_;
    std::size_t update_count_;
    std::deque<double> residuals_;

    static constexpr std::size_t MAX_RESIDUALS = 60;
};

struct PredictorConfig {
    std::chrono::milliseconds window{4000};
    std::chrono::milliseconds update_interval{1000};
    std::chrono::milliseconds stall{2000};
    double min_bps = 1.0;
    double max_bps = 100.0 * 1024 * 1024;
    double alpha = 0.5;
    double beta = 0.3;
};

// Seconds. eta is infinite while the model is not stable yet.
struct EtaEstimate {
    double eta = std::numeric_limits<double>::infinity();
    double eta_low = std::numeric_limits<double>::infinity();
    double eta_high = std::numeric_limits<double>::infinity();
    bool stable = false;
    bool stalled = false;
    double current_bps = 0.0;
    double forecast_bps = 0.0;
};

// Per-peer ETA prediction. on_bytes() records arrivals; update() is polled once per
// update_interval and feeds the windowed throughput into the Holt model.
class ThroughputPredictor {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputPredictor(std::uint64_t total_bytes, PredictorConfig config = {});

    void on_bytes(std::uint64_t bytes, Clock::time_point now = Clock::now());

    // No bytes for config.stall after data started: the previous estimate is returned
    // with stalled set and the model is left untouched.
    EtaEstimate update(Clock::time_point now = Clock::now());

    EtaEstimate last_estimate() const;

    // Bytes already held when a transfer resumes. Not counted as throughput.
    void set_received_bytes(std::uint64_t bytes);
    void set_total_bytes(std::uint64_t bytes);

    std::uint64_t received_bytes() const;
    std::uint64_t total_bytes() const;

    void reset();

private:
    struct Sample {
        Clock::time_point timestamp;
        std::uint64_t bytes;
    };

    PredictorConfig config_;
    mutable std::mutex mutex_;
    HoltSmoother holt_;
    std::deque<Sample> samples_;
    std::uint64_t total_bytes_;
    std::uint64_t received_bytes_;
    bool started_;
    Clock::time_point last_byte_time_;
    EtaEstimate last_estimate_;

    void prune(Clock::time_point now);
    double current_throughput(Clock::time_point now) const;
    double clamp_bps(double bps) const;
};

}
