#include "core/networking.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace fastnet {
namespace core {

namespace {

const NetworkingConfig& checked(const NetworkingConfig& config) {
    std::vector<std::string> errors = config.validate();
    if (!errors.empty()) {
        std::string details;
        for (const auto& error : errors) {
            if (!details.empty()) {
                details += "; ";
            }
            details += error;
        }
        throw utils::ConfigException("Invalid networking configuration", details);
    }
    return config;
}

} // namespace

Networking::Networking(std::shared_ptr<Transport> transport,
                       const NetworkingConfig& config,
                       cache::ImageDecoder decoder)
    : config_(checked(config))
    , transport_(std::move(transport))
    , shutdown_(false) {

    if (!transport_) {
        throw utils::ConfigException("Networking requires a transport");
    }

    applyLogging(config_.logging);

    notifier_ = std::make_unique<NotificationDispatcher>();
    estimator_ = std::make_unique<quality::ConnectionQualityEstimator>(*notifier_, config_.quality);
    cache_ = std::make_unique<cache::ImageCache>(config_.cache.capacityBytes);
    queue_ = std::make_unique<RequestQueue>(*transport_, *notifier_, estimator_.get(), config_.dispatcher);
    images_ = std::make_unique<cache::ImageLoader>(*queue_, *notifier_, *cache_, std::move(decoder),
                                                   config_.images.priority);

    if (!config_.userAgent.empty()) {
        queue_->setUserAgent(config_.userAgent);
    }

    utils::Logger::info("Networking initialized with " + std::to_string(queue_->getNumThreads()) +
                        " workers, image cache " + std::to_string(config_.cache.capacityBytes) + " bytes");
}

Networking::~Networking() {
    // Workers must be gone before the notifier drains callbacks that
    // reference the image loader.
    queue_.reset();
    notifier_->stop();
}

RequestHandle Networking::submit(RequestSpec spec, CompletionCallback onComplete, ProgressListener onProgress) {
    return queue_->submit(std::move(spec), std::move(onComplete), std::move(onProgress));
}

RequestHandle Networking::submit(const RequestBuilder& builder, CompletionCallback onComplete,
                                 ProgressListener onProgress) {
    return submit(builder.build(), std::move(onComplete), std::move(onProgress));
}

void Networking::cancel(const std::string& tag) {
    queue_->cancel(tag, false);
}

void Networking::forceCancel(const std::string& tag) {
    queue_->cancel(tag, true);
}

void Networking::cancelAll() {
    queue_->cancelAll(false);
}

void Networking::forceCancelAll() {
    queue_->cancelAll(true);
}

bool Networking::cancel(const RequestHandle& handle, bool force) {
    if (!handle.valid()) {
        return false;
    }
    return queue_->cancel(handle.id(), force);
}

bool Networking::isRequestRunning(const std::string& tag) const {
    return queue_->isRequestRunning(tag);
}

void Networking::setQualityChangeListener(quality::QualityChangeListener listener) {
    estimator_->setListener(std::move(listener));
}

void Networking::removeQualityChangeListener() {
    estimator_->removeListener();
}

int Networking::getCurrentBandwidth() const {
    return estimator_->getCurrentBandwidth();
}

quality::ConnectionQuality Networking::getCurrentQuality() const {
    return estimator_->getCurrentQuality();
}

void Networking::evict(const std::string& key) {
    images_->evictBitmap(key);
}

void Networking::evictAll() {
    images_->evictAllBitmaps();
}

void Networking::setUserAgent(const std::string& userAgent) {
    queue_->setUserAgent(userAgent);
}

void Networking::enableLogging(const std::string& tag) {
    utils::Logger::enable();
    if (!tag.empty()) {
        utils::Logger::setTag(tag);
    }
}

void Networking::enableLogging(utils::LogLevel level, const std::string& tag) {
    utils::Logger::setLevel(level);
    enableLogging(tag);
}

void Networking::disableLogging() {
    utils::Logger::disable();
}

void Networking::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    queue_->shutdown();
    images_->shutdown();
    estimator_->shutdown();
    utils::Logger::info("Networking shut down");
}

void Networking::applyLogging(const LoggingConfig& logging) {
    utils::Logger::setLevel(utils::Logger::parseLevel(logging.level));
    utils::Logger::setTag(logging.tag);
    if (logging.enabled) {
        utils::Logger::enable();
    } else {
        utils::Logger::disable();
    }
}

} // namespace core
} // namespace fastnet
