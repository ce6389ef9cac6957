#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fastnet {
namespace core {
class NotificationDispatcher;
}

namespace quality {

/**
 * Connection quality classification, ordered from worst to best.
 * UNKNOWN until the first accepted sample.
 */
enum class ConnectionQuality {
    UNKNOWN,
    POOR,       // < poorBandwidthKbps
    MODERATE,   // < moderateBandwidthKbps
    GOOD,       // < goodBandwidthKbps
    EXCELLENT   // everything above
};

/**
 * Estimator tuning. Bandwidths are kilobits per second.
 */
struct EstimatorConfig {
    double smoothingFactor = 0.15;       // EMA weight of the newest sample, (0, 1]
    int64_t minSampleMillis = 10;        // shorter transfers are treated as noise
    uint64_t minSampleBytes = 1;
    double poorBandwidthKbps = 150.0;
    double moderateBandwidthKbps = 550.0;
    double goodBandwidthKbps = 2000.0;
};

/**
 * Called with the new level and the smoothed bandwidth (kbps) whenever the
 * level changes. Runs on the notification thread.
 */
using QualityChangeListener = std::function<void(ConnectionQuality quality, int bandwidthKbps)>;

/**
 * Turns per-transfer throughput samples into a smoothed bandwidth estimate
 * and a discrete quality level.
 *
 * The first accepted sample sets the level directly. After that the level
 * moves at most one step per accepted sample toward the band of the smoothed
 * bandwidth, so it can lag classify(getSmoothedBandwidth()).
 */
class ConnectionQualityEstimator {
public:
    explicit ConnectionQualityEstimator(core::NotificationDispatcher& notifier,
                                        const EstimatorConfig& config = EstimatorConfig());
    ~ConnectionQualityEstimator();

    ConnectionQualityEstimator(const ConnectionQualityEstimator&) = delete;
    ConnectionQualityEstimator& operator=(const ConnectionQualityEstimator&) = delete;

    /**
     * Record one completed transfer.
     * @param bytes Bytes moved by the transfer
     * @param elapsedMillis Wall time of the transfer
     * @return true if the sample was accepted
     */
    bool addSample(uint64_t bytes, int64_t elapsedMillis);

    ConnectionQuality getCurrentQuality() const;

    /**
     * Smoothed bandwidth in kbps, rounded and capped at INT_MAX; 0 before the first sample.
     */
    int getCurrentBandwidth() const;

    /**
     * Smoothed bandwidth in kbps; negative before the first sample.
     */
    double getSmoothedBandwidth() const;

    uint64_t getSampleCount() const;

    /**
     * Register the single listener, replacing any previous one.
     */
    void setListener(QualityChangeListener listener);
    void removeListener();
    bool hasListener() const;

    /**
     * Forget all samples and return to UNKNOWN. The listener is kept.
     */
    void reset();

    /**
     * Clear the listener and reset state. Later samples start a fresh average.
     */
    void shutdown();

    ConnectionQuality classify(double bandwidthKbps) const;

    const EstimatorConfig& getConfig() const { return config_; }

    std::map<std::string, double> getStats() const;

private:
    struct ListenerSlot {
        std::mutex mutex;
        QualityChangeListener listener;
        uint64_t generation = 0;
    };

    void notifyQualityChange(ConnectionQuality quality, int bandwidthKbps);
    static void deliver(const std::shared_ptr<ListenerSlot>& slot, uint64_t generation,
                        ConnectionQuality quality, int bandwidthKbps);

    core::NotificationDispatcher& notifier_;
    const EstimatorConfig config_;

    mutable std::mutex stateMutex_;
    double smoothedBandwidth_;
    ConnectionQuality currentQuality_;
    uint64_t sampleCount_;

    std::shared_ptr<ListenerSlot> listenerSlot_;

    std::atomic<uint64_t> rejectedSamples_;
    std::atomic<uint64_t> qualityChanges_;
};

std::string toString(ConnectionQuality quality);

} // namespace quality
} // namespace fastnet
