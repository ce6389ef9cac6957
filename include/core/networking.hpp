#pragma once

#include "cache/image_loader.hpp"
#include "core/networking_config.hpp"
#include "core/notification_dispatcher.hpp"
#include "core/request.hpp"
#include "core/request_builder.hpp"
#include "core/request_queue.hpp"
#include "core/transport.hpp"
#include "quality/connection_quality_estimator.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace fastnet {
namespace core {

/**
 * Entry point of the library: owns the dispatcher, the quality estimator,
 * the image cache and the notification thread, wired to one transport.
 *
 * Create one per process and pass it by reference. All methods are
 * thread-safe.
 */
class Networking {
public:
    /**
     * @throws utils::ConfigException if config.validate() reports problems
     */
    explicit Networking(std::shared_ptr<Transport> transport,
                        const NetworkingConfig& config = NetworkingConfig(),
                        cache::ImageDecoder decoder = nullptr);
    ~Networking();

    Networking(const Networking&) = delete;
    Networking& operator=(const Networking&) = delete;

    // Request construction
    RequestBuilder get(const std::string& url) const { return RequestBuilder(Method::GET, url); }
    RequestBuilder head(const std::string& url) const { return RequestBuilder(Method::HEAD, url); }
    RequestBuilder post(const std::string& url) const { return RequestBuilder(Method::POST, url); }
    RequestBuilder put(const std::string& url) const { return RequestBuilder(Method::PUT, url); }
    RequestBuilder del(const std::string& url) const { return RequestBuilder(Method::DELETE, url); }
    RequestBuilder patch(const std::string& url) const { return RequestBuilder(Method::PATCH, url); }
    RequestBuilder download(const std::string& url, const std::string& dir, const std::string& fileName) const {
        return RequestBuilder::download(url, dir, fileName);
    }
    RequestBuilder upload(const std::string& url) const { return RequestBuilder::upload(url); }

    /**
     * @throws utils::ShutdownException after shutdown()
     */
    RequestHandle submit(RequestSpec spec,
                         CompletionCallback onComplete = nullptr,
                         ProgressListener onProgress = nullptr);

    /**
     * Build and submit in one step.
     * @throws utils::InvalidRequestException from build()
     * @throws utils::ShutdownException after shutdown()
     */
    RequestHandle submit(const RequestBuilder& builder,
                         CompletionCallback onComplete = nullptr,
                         ProgressListener onProgress = nullptr);

    // Cancellation
    void cancel(const std::string& tag);
    void forceCancel(const std::string& tag);
    void cancelAll();
    void forceCancelAll();
    bool cancel(const RequestHandle& handle, bool force = false);
    bool isRequestRunning(const std::string& tag) const;

    // Connection quality
    void setQualityChangeListener(quality::QualityChangeListener listener);
    void removeQualityChangeListener();
    int getCurrentBandwidth() const;
    quality::ConnectionQuality getCurrentQuality() const;

    // Image cache
    void evict(const std::string& key);
    void evictAll();
    cache::ImageLoader& images() { return *images_; }

    void setUserAgent(const std::string& userAgent);

    /**
     * Turn console logging on, optionally with a tag prefix.
     */
    void enableLogging(const std::string& tag = "");
    void enableLogging(utils::LogLevel level, const std::string& tag = "");
    void disableLogging();

    /**
     * Stop accepting requests, clear the image cache and reset the
     * estimator. Already queued requests still complete. Idempotent.
     */
    void shutdown();
    bool isShutdown() const { return shutdown_; }

    const NetworkingConfig& getConfig() const { return config_; }
    RequestQueue& queue() { return *queue_; }
    quality::ConnectionQualityEstimator& estimator() { return *estimator_; }
    cache::ImageCache& imageCache() { return *cache_; }
    NotificationDispatcher& notifier() { return *notifier_; }

private:
    static void applyLogging(const LoggingConfig& logging);

    const NetworkingConfig config_;
    std::shared_ptr<Transport> transport_;

    // Destroyed in reverse order; ~Networking tears the queue down first.
    std::unique_ptr<NotificationDispatcher> notifier_;
    std::unique_ptr<quality::ConnectionQualityEstimator> estimator_;
    std::unique_ptr<cache::ImageCache> cache_;
    std::unique_ptr<RequestQueue> queue_;
    std::unique_ptr<cache::ImageLoader> images_;

    std::atomic<bool> shutdown_;
};

} // namespace core
} // namespace fastnet
