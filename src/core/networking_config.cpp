#include "core/networking_config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fastnet {
namespace core {

namespace {

const utils::JsonValue& section(const utils::JsonValue& root, const std::string& name) {
    static const utils::JsonValue empty = utils::JsonValue::object();
    if (!root.hasProperty(name)) {
        return empty;
    }
    const utils::JsonValue& value = root.getProperty(name);
    if (!value.isObject()) {
        throw utils::ConfigException("Section '" + name + "' must be an object");
    }
    return value;
}

utils::JsonValue number(double value) {
    return utils::JsonValue(value);
}

} // namespace

NetworkingConfig NetworkingConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        utils::Logger::info("Configuration file not found, using defaults: " + path);
        return NetworkingConfig();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw utils::ConfigException("Failed to open configuration file", path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    NetworkingConfig config = loadFromJson(buffer.str());
    utils::Logger::info("Loaded networking configuration from: " + path);
    return config;
}

NetworkingConfig NetworkingConfig::loadFromJson(const std::string& json) {
    NetworkingConfig config;

    try {
        utils::JsonValue root = utils::JsonParser::parse(json);
        if (!root.isObject()) {
            throw utils::ConfigException("Invalid JSON configuration: root must be an object");
        }

        const utils::JsonValue& dispatcher = section(root, "dispatcher");
        config.dispatcher.workerThreads = static_cast<size_t>(
            dispatcher.getNumber("workerThreads", static_cast<double>(config.dispatcher.workerThreads)));
        config.dispatcher.immediateThreads = static_cast<size_t>(
            dispatcher.getNumber("immediateThreads", static_cast<double>(config.dispatcher.immediateThreads)));

        const utils::JsonValue& quality = section(root, "quality");
        config.quality.smoothingFactor = quality.getNumber("smoothingFactor", config.quality.smoothingFactor);
        config.quality.minSampleMillis = static_cast<int64_t>(
            quality.getNumber("minSampleMillis", static_cast<double>(config.quality.minSampleMillis)));
        config.quality.minSampleBytes = static_cast<uint64_t>(
            quality.getNumber("minSampleBytes", static_cast<double>(config.quality.minSampleBytes)));
        config.quality.poorBandwidthKbps = quality.getNumber("poorBandwidthKbps", config.quality.poorBandwidthKbps);
        config.quality.moderateBandwidthKbps =
            quality.getNumber("moderateBandwidthKbps", config.quality.moderateBandwidthKbps);
        config.quality.goodBandwidthKbps = quality.getNumber("goodBandwidthKbps", config.quality.goodBandwidthKbps);

        const utils::JsonValue& cache = section(root, "cache");
        config.cache.capacityBytes = static_cast<size_t>(
            cache.getNumber("capacityBytes", static_cast<double>(config.cache.capacityBytes)));

        const utils::JsonValue& images = section(root, "images");
        if (images.hasProperty("priority")) {
            config.images.priority = parsePriority(images.getString("priority", "MEDIUM"));
        }

        const utils::JsonValue& logging = section(root, "logging");
        config.logging.enabled = logging.getBool("enabled", config.logging.enabled);
        config.logging.level = logging.getString("level", config.logging.level);
        config.logging.tag = logging.getString("tag", config.logging.tag);

        config.userAgent = root.getString("userAgent", config.userAgent);

    } catch (const utils::ConfigException&) {
        throw;
    } catch (const std::exception& e) {
        throw utils::ConfigException("Failed to parse networking configuration", e.what());
    }

    return config;
}

std::string NetworkingConfig::toJson() const {
    utils::JsonValue root = utils::JsonValue::object();

    utils::JsonValue dispatcherObj = utils::JsonValue::object();
    dispatcherObj.set("workerThreads", number(static_cast<double>(dispatcher.workerThreads)));
    dispatcherObj.set("immediateThreads", number(static_cast<double>(dispatcher.immediateThreads)));
    root.set("dispatcher", dispatcherObj);

    utils::JsonValue qualityObj = utils::JsonValue::object();
    qualityObj.set("smoothingFactor", number(quality.smoothingFactor));
    qualityObj.set("minSampleMillis", number(static_cast<double>(quality.minSampleMillis)));
    qualityObj.set("minSampleBytes", number(static_cast<double>(quality.minSampleBytes)));
    qualityObj.set("poorBandwidthKbps", number(quality.poorBandwidthKbps));
    qualityObj.set("moderateBandwidthKbps", number(quality.moderateBandwidthKbps));
    qualityObj.set("goodBandwidthKbps", number(quality.goodBandwidthKbps));
    root.set("quality", qualityObj);

    utils::JsonValue cacheObj = utils::JsonValue::object();
    cacheObj.set("capacityBytes", number(static_cast<double>(cache.capacityBytes)));
    root.set("cache", cacheObj);

    utils::JsonValue imagesObj = utils::JsonValue::object();
    imagesObj.set("priority", utils::JsonValue(toString(images.priority)));
    root.set("images", imagesObj);

    utils::JsonValue loggingObj = utils::JsonValue::object();
    loggingObj.set("enabled", utils::JsonValue(logging.enabled));
    loggingObj.set("level", utils::JsonValue(logging.level));
    loggingObj.set("tag", utils::JsonValue(logging.tag));
    root.set("logging", loggingObj);

    root.set("userAgent", utils::JsonValue(userAgent));

    return utils::JsonParser::stringify(root, true);
}

bool NetworkingConfig::saveToFile(const std::string& path) const {
    try {
        std::filesystem::path filePath(path);
        if (filePath.has_parent_path()) {
            std::filesystem::create_directories(filePath.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            utils::Logger::error("Failed to create configuration file: " + path);
            return false;
        }
        file << toJson();

        utils::Logger::info("Saved networking configuration to: " + path);
        return true;

    } catch (const std::exception& e) {
        utils::Logger::error("Failed to save configuration file: " + std::string(e.what()));
        return false;
    }
}

std::vector<std::string> NetworkingConfig::validate() const {
    std::vector<std::string> errors;

    // workerThreads == 0 means "size from hardware"
    if (dispatcher.workerThreads > 1024) {
        errors.push_back("Dispatcher workerThreads must be at most 1024");
    }
    if (dispatcher.immediateThreads > 64) {
        errors.push_back("Dispatcher immediateThreads must be at most 64");
    }

    if (!(quality.smoothingFactor > 0.0 && quality.smoothingFactor <= 1.0)) {
        errors.push_back("Quality smoothingFactor must be in (0, 1]");
    }
    if (quality.minSampleMillis < 0) {
        errors.push_back("Quality minSampleMillis must be non-negative");
    }
    if (quality.poorBandwidthKbps <= 0.0) {
        errors.push_back("Quality poorBandwidthKbps must be positive");
    }
    if (quality.moderateBandwidthKbps <= quality.poorBandwidthKbps) {
        errors.push_back("Quality moderateBandwidthKbps must be greater than poorBandwidthKbps");
    }
    if (quality.goodBandwidthKbps <= quality.moderateBandwidthKbps) {
        errors.push_back("Quality goodBandwidthKbps must be greater than moderateBandwidthKbps");
    }

    if (cache.capacityBytes == 0) {
        errors.push_back("Cache capacityBytes must be greater than 0");
    }

    static const std::vector<std::string> levels = {"DEBUG", "INFO", "WARN", "ERROR"};
    std::string level = logging.level;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (std::find(levels.begin(), levels.end(), level) == levels.end()) {
        errors.push_back("Logging level must be one of DEBUG, INFO, WARN, ERROR");
    }

    return errors;
}

Priority parsePriority(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "LOW") return Priority::LOW;
    if (upper == "MEDIUM") return Priority::MEDIUM;
    if (upper == "HIGH") return Priority::HIGH;
    if (upper == "IMMEDIATE") return Priority::IMMEDIATE;

    throw utils::ConfigException("Unknown priority: " + name);
}

} // namespace core
} // namespace fastnet
