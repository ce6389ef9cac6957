#include "cache/image_loader.hpp"
#include "core/notification_dispatcher.hpp"
#include "core/request_builder.hpp"
#include "core/request_queue.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace fastnet {
namespace cache {

ImageDecoder rawImageDecoder() {
    return [](const std::string& data, int, int) -> std::shared_ptr<const Image> {
        if (data.empty()) {
            return nullptr;
        }
        auto image = std::make_shared<Image>();
        image->pixels = data;
        return image;
    };
}

ImageLoader::ImageLoader(core::RequestQueue& queue,
                         core::NotificationDispatcher& notifier,
                         ImageCache& cache,
                         ImageDecoder decoder,
                         core::Priority priority)
    : queue_(queue)
    , notifier_(notifier)
    , cache_(cache)
    , decoder_(decoder ? std::move(decoder) : rawImageDecoder())
    , priority_(priority)
    , shutdown_(false) {
}

ImageLoader::~ImageLoader() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!inFlight_.empty()) {
        utils::Logger::debug("ImageLoader destroyed with " + std::to_string(inFlight_.size()) +
                             " loads in flight");
    }
}

std::string ImageLoader::cacheKey(const std::string& url, int maxWidth, int maxHeight) {
    return "#W" + std::to_string(maxWidth) + "#H" + std::to_string(maxHeight) + url;
}

void ImageLoader::load(const std::string& url, int maxWidth, int maxHeight, ImageCallback callback) {
    const std::string key = cacheKey(url, maxWidth, maxHeight);

    if (auto cached = cache_.get(key)) {
        ImageResult result;
        result.image = *cached;
        result.fromCache = true;
        if (callback) {
            notifier_.post([callback, result]() { callback(result); }, "image");
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inFlight_.find(key);
        if (it != inFlight_.end()) {
            it->second.push_back(std::move(callback));
            return;
        }
        inFlight_[key].push_back(std::move(callback));
    }

    try {
        core::RequestSpec spec = core::RequestBuilder(core::Method::GET, url)
                                     .setTag(key)
                                     .setPriority(priority_)
                                     .build();

        queue_.submit(std::move(spec), [this, key, maxWidth, maxHeight](const core::RequestOutcome& outcome) {
            onFetched(key, maxWidth, maxHeight, outcome);
        });
    } catch (const utils::FastNetException& e) {
        utils::Logger::warn("Image load for " + url + " not started: " + e.what());
        ImageResult result;
        result.error = e.what();
        finish(key, result);
    }
}

void ImageLoader::cancel(const std::string& url, int maxWidth, int maxHeight) {
    queue_.cancel(cacheKey(url, maxWidth, maxHeight), false);
}

bool ImageLoader::isLoading(const std::string& url, int maxWidth, int maxHeight) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.find(cacheKey(url, maxWidth, maxHeight)) != inFlight_.end();
}

size_t ImageLoader::inFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.size();
}

void ImageLoader::evictBitmap(const std::string& key) {
    cache_.evict(key);
}

void ImageLoader::evictAllBitmaps() {
    cache_.evictAll();
}

void ImageLoader::shutdown() {
    // Same lock as the put in onFetched, so nothing lands after the clear.
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    cache_.evictAll();
}

bool ImageLoader::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

void ImageLoader::onFetched(const std::string& key, int maxWidth, int maxHeight,
                            const core::RequestOutcome& outcome) {
    ImageResult result;

    if (outcome.status == core::OutcomeStatus::CANCELLED) {
        result.error = "cancelled";
    } else if (!outcome.ok()) {
        result.error = outcome.error.empty() ? "image request failed" : outcome.error;
    } else {
        try {
            result.image = decoder_(outcome.response.body, maxWidth, maxHeight);
            if (!result.image) {
                result.error = "image could not be decoded";
            }
        } catch (const std::exception& e) {
            result.error = std::string("image decode failed: ") + e.what();
            FASTNET_REPORT_ERROR(utils::ErrorCategory::CACHE, utils::ErrorSeverity::WARNING,
                                 "Image decode failed", key + ": " + e.what());
        }
    }

    if (result.image) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            utils::Logger::debug("Image " + key + " arrived after shutdown, delivered uncached");
        } else if (!cache_.put(key, result.image, result.image->byteSize())) {
            utils::Logger::debug("Image " + key + " too large for the cache, delivered uncached");
        }
    }

    finish(key, result);
}

void ImageLoader::finish(const std::string& key, const ImageResult& result) {
    std::vector<ImageCallback> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inFlight_.find(key);
        if (it == inFlight_.end()) {
            return;
        }
        waiters = std::move(it->second);
        inFlight_.erase(it);
    }

    // One post per waiter so a throwing callback cannot starve the others.
    for (auto& waiter : waiters) {
        if (waiter) {
            notifier_.post([waiter, result]() { waiter(result); }, "image");
        }
    }
}

} // namespace cache
} // namespace fastnet
