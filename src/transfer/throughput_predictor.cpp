#include "chunkwire/transfer/throughput_predictor.hpp"
#include <algorithm>
#include <cmath>

namespace chunkwire::transfer {

HoltSmoother::HoltSmoother(HoltConfig config)
    : config_(config)
    , level_(0.0)
    , trend_(0.0)
    , initialized_(false)
    , update_count_(0) {
}

void HoltSmoother::update(double value) {
    if (!initialized_) {
        level_ = value;
        trend_ = 0.0;
        initialized_ = true;
    } else {
        // residual against the one-step forecast made before this observation
        double residual = value - (level_ + trend_);
        residuals_.push_back(residual);
        if (residuals_.size() > MAX_RESIDUALS) {
            residuals_.pop_front();
        }

        double previous_level = level_;
        level_ = config_.alpha * value + (1.0 - config_.alpha) * (level_ + trend_);
        trend_ = config_.beta * (level_ - previous_level) + (1.0 - config_.beta) * trend_;
    }

    ++update_count_;
}

double HoltSmoother::forecast(int steps) const {
    if (!initialized_) {
        return 0.0;
    }
    return std::max(0.0, level_ + steps * trend_);
}

ForecastBounds HoltSmoother::forecast_bounds(int steps) const {
    double value = forecast(steps);

    if (residuals_.size() < 3) {
        return {value * 0.8, value * 1.2};
    }

    double margin = 1.96 * residual_stddev() * std::sqrt(1.0 + steps * 0.1);
    return {std::max(0.0, value - margin), value + margin};
}

void HoltSmoother::reset() {
    level_ = 0.0;
    trend_ = 0.0;
    initialized_ = false;
    update_count_ = 0;
    residuals_.clear();
}

double HoltSmoother::residual_stddev() const {
    if (residuals_.size() < 2) {
        return 0.0;
    }

    double mean = 0.0;
    for (double r : residuals_) {
        mean += r;
    }
    mean /= residuals_.size();

    double variance = 0.0;
    for (double r : residuals_) {
        variance += (r - mean) * (r - mean);
    }
    variance /= (residuals_.size() - 1);

    return std::sqrt(variance);
}

ThroughputPredictor::ThroughputPredictor(std::uint64_t total_bytes, PredictorConfig config)
    : config_(config)
    , holt_(HoltConfig{config.alpha, config.beta})
    , total_bytes_(total_bytes)
    , received_bytes_(0)
    , started_(false) {
}

void ThroughputPredictor::on_bytes(std::uint64_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    received_bytes_ += bytes;
    last_byte_time_ = now;
    started_ = true;

    samples_.push_back({now, bytes});
    prune(now);
}

EtaEstimate ThroughputPredictor::update(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (started_ && now - last_byte_time_ > config_.stall) {
        last_estimate_.stalled = true;
        last_estimate_.current_bps = 0.0;
        return last_estimate_;
    }

    prune(now);
    double current_bps = current_throughput(now);
    if (current_bps > 0.0) {
        holt_.update(current_bps);
    }

    EtaEstimate estimate;
    estimate.current_bps = current_bps;
    estimate.forecast_bps = holt_.forecast(1);
    estimate.stable = holt_.is_stable() && received_bytes_ > 0;

    std::uint64_t remaining = total_bytes_ > received_bytes_ ? total_bytes_ - received_bytes_ : 0;

    if (remaining == 0) {
        estimate.eta = 0.0;
        estimate.eta_low = 0.0;
        estimate.eta_high = 0.0;
    } else if (estimate.stable) {
        estimate.eta = remaining / clamp_bps(estimate.forecast_bps);

        // faster bound gives the earlier finish
        auto bounds = holt_.forecast_bounds(1);
        estimate.eta_low = remaining / clamp_bps(bounds.high);
        estimate.eta_high = remaining / clamp_bps(bounds.low);
    }

    last_estimate_ = estimate;
    return estimate;
}

EtaEstimate ThroughputPredictor::last_estimate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_estimate_;
}

void ThroughputPredictor::set_received_bytes(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    received_bytes_ = bytes;
}

void ThroughputPredictor::set_total_bytes(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ = bytes;
}

std::uint64_t ThroughputPredictor::received_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_bytes_;
}

std::uint64_t ThroughputPredictor::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

void ThroughputPredictor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    holt_.reset();
    samples_.clear();
    received_bytes_ = 0;
    started_ = false;
    last_estimate_ = EtaEstimate{};
}

void ThroughputPredictor::prune(Clock::time_point now) {
    auto window_start = now - config_.window;
    while (!samples_.empty() && samples_.front().timestamp < window_start) {
        samples_.pop_front();
    }
}

double ThroughputPredictor::current_throughput(Clock::time_point now) const {
    if (samples_.empty()) {
        return 0.0;
    }

    std::uint64_t bytes = 0;
    for (const auto& sample : samples_) {
        bytes += sample.bytes;
    }

    auto span_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - samples_.front().timestamp).count();
    span_ms = std::max<std::int64_t>(1, span_ms);

    return static_cast<double>(bytes) / static_cast<double>(span_ms) * 1000.0;
}

double ThroughputPredictor::clamp_bps(double bps) const {
    return std::clamp(bps, config_.min_bps, config_.max_bps);
}

}
