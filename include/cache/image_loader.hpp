#pragma once

#include "cache/lru_cache.hpp"
#include "core/request.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastnet {
namespace core {
class NotificationDispatcher;
class RequestQueue;
}

namespace cache {

/**
 * Decoded image. Pixel layout is up to the decoder.
 */
struct Image {
    int width = 0;
    int height = 0;
    std::string pixels;

    size_t byteSize() const { return pixels.size(); }
};

/**
 * Turns a response body into an image no larger than maxWidth x maxHeight
 * (0 = unbounded). Returns nullptr or throws on undecodable data.
 */
using ImageDecoder = std::function<std::shared_ptr<const Image>(const std::string& data,
                                                                int maxWidth, int maxHeight)>;

using ImageCache = LruCache<std::shared_ptr<const Image>>;

struct ImageResult {
    std::shared_ptr<const Image> image;
    std::string error;
    bool fromCache = false;

    bool ok() const { return static_cast<bool>(image); }
};

using ImageCallback = std::function<void(const ImageResult&)>;

/**
 * Decoder that keeps the raw body as the pixel buffer.
 */
ImageDecoder rawImageDecoder();

/**
 * Cache-first image fetching.
 *
 * Concurrent loads of the same key share one network request; every caller
 * gets the result. Callbacks run on the notification thread.
 */
class ImageLoader {
public:
    ImageLoader(core::RequestQueue& queue,
                core::NotificationDispatcher& notifier,
                ImageCache& cache,
                ImageDecoder decoder = rawImageDecoder(),
                core::Priority priority = core::Priority::MEDIUM);
    ~ImageLoader();

    ImageLoader(const ImageLoader&) = delete;
    ImageLoader& operator=(const ImageLoader&) = delete;

    void load(const std::string& url, int maxWidth, int maxHeight, ImageCallback callback);
    void load(const std::string& url, ImageCallback callback) { load(url, 0, 0, std::move(callback)); }

    /**
     * Cancel the in-flight fetch for this url and size. Waiting callbacks
     * receive a "cancelled" error.
     */
    void cancel(const std::string& url, int maxWidth = 0, int maxHeight = 0);

    bool isLoading(const std::string& url, int maxWidth = 0, int maxHeight = 0) const;
    size_t inFlightCount() const;

    void evictBitmap(const std::string& key);
    void evictAllBitmaps();

    /**
     * Clear the cache and stop caching. Fetches still in flight are
     * delivered to their callbacks but no longer stored.
     */
    void shutdown();
    bool isShutdown() const;

    ImageCache& cache() { return cache_; }

    static std::string cacheKey(const std::string& url, int maxWidth, int maxHeight);

private:
    void onFetched(const std::string& key, int maxWidth, int maxHeight, const core::RequestOutcome& outcome);
    void finish(const std::string& key, const ImageResult& result);

    core::RequestQueue& queue_;
    core::NotificationDispatcher& notifier_;
    ImageCache& cache_;
    ImageDecoder decoder_;
    const core::Priority priority_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<ImageCallback>> inFlight_;
    bool shutdown_;
};

} // namespace cache
} // namespace fastnet
