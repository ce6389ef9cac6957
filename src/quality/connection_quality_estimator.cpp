#include "quality/connection_quality_estimator.hpp"
#include "core/notification_dispatcher.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace fastnet {
namespace quality {

namespace {

constexpr double kUninitialized = -1.0;
constexpr double kBitsPerByte = 8.0;

int toKbps(double bandwidth) {
    const double limit = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::lround(std::min(bandwidth, limit)));
}

// One level per accepted sample, so a single outlier cannot jump bands.
ConnectionQuality stepToward(ConnectionQuality current, ConnectionQuality target) {
    if (current == ConnectionQuality::UNKNOWN || current == target) {
        return target;
    }
    const int step = static_cast<int>(target) > static_cast<int>(current) ? 1 : -1;
    return static_cast<ConnectionQuality>(static_cast<int>(current) + step);
}

} // namespace

ConnectionQualityEstimator::ConnectionQualityEstimator(core::NotificationDispatcher& notifier,
                                                       const EstimatorConfig& config)
    : notifier_(notifier)
    , config_(config)
    , smoothedBandwidth_(kUninitialized)
    , currentQuality_(ConnectionQuality::UNKNOWN)
    , sampleCount_(0)
    , listenerSlot_(std::make_shared<ListenerSlot>())
    , rejectedSamples_(0)
    , qualityChanges_(0) {
}

ConnectionQualityEstimator::~ConnectionQualityEstimator() {
    // Pending notifications hold the slot, not the estimator.
    std::lock_guard<std::mutex> lock(listenerSlot_->mutex);
    listenerSlot_->listener = nullptr;
    listenerSlot_->generation++;
}

bool ConnectionQualityEstimator::addSample(uint64_t bytes, int64_t elapsedMillis) {
    if (elapsedMillis <= 0 || elapsedMillis < config_.minSampleMillis ||
        bytes == 0 || bytes < config_.minSampleBytes) {
        rejectedSamples_++;
        return false;
    }

    // bytes per millisecond * 8 == kilobits per second
    const double instantaneous = static_cast<double>(bytes) * kBitsPerByte /
                                 static_cast<double>(elapsedMillis);

    ConnectionQuality newQuality;
    int bandwidthKbps;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);

        if (smoothedBandwidth_ < 0.0) {
            smoothedBandwidth_ = instantaneous;
        } else {
            smoothedBandwidth_ = config_.smoothingFactor * instantaneous +
                                 (1.0 - config_.smoothingFactor) * smoothedBandwidth_;
        }
        sampleCount_++;

        newQuality = stepToward(currentQuality_, classify(smoothedBandwidth_));
        bandwidthKbps = toKbps(smoothedBandwidth_);

        if (newQuality != currentQuality_) {
            utils::Logger::debug("Connection quality " + toString(currentQuality_) + " -> " +
                                 toString(newQuality) + " at " + std::to_string(bandwidthKbps) + " kbps");
            currentQuality_ = newQuality;
            qualityChanges_++;

            // Posted under the state lock so notifications keep the order of changes.
            notifyQualityChange(newQuality, bandwidthKbps);
        }
    }

    return true;
}

ConnectionQuality ConnectionQualityEstimator::getCurrentQuality() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return currentQuality_;
}

int ConnectionQualityEstimator::getCurrentBandwidth() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (smoothedBandwidth_ < 0.0) {
        return 0;
    }
    return toKbps(smoothedBandwidth_);
}

double ConnectionQualityEstimator::getSmoothedBandwidth() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return smoothedBandwidth_;
}

uint64_t ConnectionQualityEstimator::getSampleCount() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return sampleCount_;
}

void ConnectionQualityEstimator::setListener(QualityChangeListener listener) {
    std::lock_guard<std::mutex> lock(listenerSlot_->mutex);
    listenerSlot_->listener = std::move(listener);
}

void ConnectionQualityEstimator::removeListener() {
    std::lock_guard<std::mutex> lock(listenerSlot_->mutex);
    listenerSlot_->listener = nullptr;
}

bool ConnectionQualityEstimator::hasListener() const {
    std::lock_guard<std::mutex> lock(listenerSlot_->mutex);
    return static_cast<bool>(listenerSlot_->listener);
}

void ConnectionQualityEstimator::reset() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        smoothedBandwidth_ = kUninitialized;
        currentQuality_ = ConnectionQuality::UNKNOWN;
        sampleCount_ = 0;
    }

    // Notifications posted before the reset are stale.
    std::lock_guard<std::mutex> lock(listenerSlot_->mutex);
    listenerSlot_->generation++;
}

void ConnectionQualityEstimator::shutdown() {
    removeListener();
    reset();
    utils::Logger::debug("Connection quality estimator shut down");
}

ConnectionQuality ConnectionQualityEstimator::classify(double bandwidthKbps) const {
    if (bandwidthKbps < 0.0) {
        return ConnectionQuality::UNKNOWN;
    }
    if (bandwidthKbps < config_.poorBandwidthKbps) {
        return ConnectionQuality::POOR;
    }
    if (bandwidthKbps < config_.moderateBandwidthKbps) {
        return ConnectionQuality::MODERATE;
    }
    if (bandwidthKbps < config_.goodBandwidthKbps) {
        return ConnectionQuality::GOOD;
    }
    return ConnectionQuality::EXCELLENT;
}

std::map<std::string, double> ConnectionQualityEstimator::getStats() const {
    std::map<std::string, double> stats;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stats["accepted_samples"] = static_cast<double>(sampleCount_);
        stats["smoothed_bandwidth_kbps"] = smoothedBandwidth_ < 0.0 ? 0.0 : smoothedBandwidth_;
        stats["current_quality"] = static_cast<double>(currentQuality_);
    }
    stats["rejected_samples"] = static_cast<double>(rejectedSamples_.load());
    stats["quality_changes"] = static_cast<double>(qualityChanges_.load());
    return stats;
}

void ConnectionQualityEstimator::notifyQualityChange(ConnectionQuality quality, int bandwidthKbps) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(listenerSlot_->mutex);
        if (!listenerSlot_->listener) {
            return;
        }
        generation = listenerSlot_->generation;
    }

    auto slot = listenerSlot_;
    notifier_.post([slot, generation, quality, bandwidthKbps]() {
        deliver(slot, generation, quality, bandwidthKbps);
    }, "quality-change");
}

void ConnectionQualityEstimator::deliver(const std::shared_ptr<ListenerSlot>& slot, uint64_t generation,
                                         ConnectionQuality quality, int bandwidthKbps) {
    QualityChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->generation != generation || !slot->listener) {
            return;
        }
        listener = slot->listener;
    }
    listener(quality, bandwidthKbps);
}

std::string toString(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::UNKNOWN: return "UNKNOWN";
        case ConnectionQuality::POOR: return "POOR";
        case ConnectionQuality::MODERATE: return "MODERATE";
        case ConnectionQuality::GOOD: return "GOOD";
        case ConnectionQuality::EXCELLENT: return "EXCELLENT";
    }
    return "UNKNOWN";
}

} // namespace quality
} // namespace fastnet
