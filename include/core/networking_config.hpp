#pragma once

#include "core/request.hpp"
#include "core/request_queue.hpp"
#include "quality/connection_quality_estimator.hpp"

#include <string>
#include <vector>

namespace fastnet {
namespace core {

/**
 * In-memory image cache settings
 */
struct CacheConfig {
    size_t capacityBytes;

    CacheConfig() : capacityBytes(8 * 1024 * 1024) {}
};

/**
 * Image loader settings
 */
struct ImageLoaderConfig {
    Priority priority;

    ImageLoaderConfig() : priority(Priority::MEDIUM) {}
};

/**
 * Console logging settings
 */
struct LoggingConfig {
    bool enabled;
    std::string level;   // DEBUG, INFO, WARN or ERROR
    std::string tag;

    LoggingConfig() : enabled(true), level("INFO") {}
};

/**
 * Settings for a Networking context, loaded from a JSON file:
 *
 * {
 *   "dispatcher": { "workerThreads": 4, "immediateThreads": 2 },
 *   "quality":    { "smoothingFactor": 0.15, "minSampleMillis": 10, "minSampleBytes": 1,
 *                   "poorBandwidthKbps": 150, "moderateBandwidthKbps": 550,
 *                   "goodBandwidthKbps": 2000 },
 *   "cache":      { "capacityBytes": 8388608 },
 *   "images":     { "priority": "MEDIUM" },
 *   "logging":    { "enabled": true, "level": "INFO", "tag": "" },
 *   "userAgent":  "fastnet/1.0"
 * }
 *
 * Missing keys keep their defaults.
 */
struct NetworkingConfig {
    DispatcherConfig dispatcher;
    quality::EstimatorConfig quality;
    CacheConfig cache;
    ImageLoaderConfig images;
    LoggingConfig logging;
    std::string userAgent;

    /**
     * Load from a file. A missing file yields the defaults.
     * @throws utils::ConfigException if the file cannot be read or parsed
     */
    static NetworkingConfig load(const std::string& path);

    /**
     * @throws utils::ConfigException on malformed JSON or mistyped values
     */
    static NetworkingConfig loadFromJson(const std::string& json);

    std::string toJson() const;

    bool saveToFile(const std::string& path) const;

    /**
     * Problems found in the settings; empty when usable.
     */
    std::vector<std::string> validate() const;
    bool isValid() const { return validate().empty(); }
};

/**
 * Parses LOW, MEDIUM, HIGH or IMMEDIATE (case-insensitive).
 * @throws utils::ConfigException for anything else
 */
Priority parsePriority(const std::string& name);

} // namespace core
} // namespace fastnet
