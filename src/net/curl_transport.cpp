#include "net/curl_transport.hpp"
#include "utils/logging.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fastnet {
namespace net {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) curl_easy_cleanup(handle);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept {
        if (list) curl_slist_free_all(list);
    }
};

struct CurlMimeDeleter {
    void operator()(curl_mime* mime) const noexcept {
        if (mime) curl_mime_free(mime);
    }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using CurlMimePtr = std::unique_ptr<curl_mime, CurlMimeDeleter>;

struct TransferContext {
    core::CancellationToken* token = nullptr;
    const core::ProgressCallback* progress = nullptr;
    std::string* body = nullptr;
    std::ofstream* file = nullptr;
    std::map<std::string, std::string>* headers = nullptr;
    std::shared_ptr<std::atomic<bool>> interrupted;
    curl_off_t lastReported = -1;
};

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<TransferContext*>(userp);
    const size_t length = size * nmemb;

    // Cooperative checkpoint; a short count aborts with CURLE_WRITE_ERROR
    if (ctx->token->isCancelled()) {
        return 0;
    }

    if (ctx->file) {
        ctx->file->write(data, static_cast<std::streamsize>(length));
        if (!*ctx->file) {
            return 0;
        }
    } else {
        ctx->body->append(data, length);
    }
    return length;
}

size_t headerCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<TransferContext*>(userp);
    const size_t length = size * nmemb;

    std::string line(data, length);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        (*ctx->headers)[key] = value;
    }
    return length;
}

int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    if (ctx->interrupted->load() || ctx->token->isCancelled()) {
        return 1;
    }

    const bool uploading = ultotal > 0 && ulnow < ultotal;
    const curl_off_t done = uploading ? ulnow : dlnow;
    const curl_off_t total = uploading ? ultotal : dltotal;
    if (*ctx->progress && done != ctx->lastReported) {
        ctx->lastReported = done;
        (*ctx->progress)(static_cast<uint64_t>(done), static_cast<uint64_t>(total));
    }
    return 0;
}

} // namespace

CurlTransport::CurlTransport(const CurlTransportOptions& options)
    : options_(options) {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

core::TransportResult CurlTransport::execute(const core::RequestSpec& spec,
                                             core::CancellationToken& token,
                                             const core::ProgressCallback& progress) {
    core::TransportResult result;
    const auto start = std::chrono::steady_clock::now();

    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        result.error = "Failed to init CURL";
        return result;
    }

    TransferContext ctx;
    ctx.token = &token;
    ctx.progress = &progress;
    ctx.body = &result.body;
    ctx.headers = &result.headers;
    ctx.interrupted = std::make_shared<std::atomic<bool>>(false);

    std::ofstream file;
    if (spec.kind == core::RequestKind::DOWNLOAD) {
        std::filesystem::path path(spec.downloadPath());
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        file.open(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            result.error = "Cannot open download target " + path.string();
            return result;
        }
        ctx.file = &file;
    }

    // Forced cancel: picked up by the progress callback at its next tick.
    // The handler may still run after execute() returns, so it owns the flag.
    std::shared_ptr<std::atomic<bool>> interrupted = ctx.interrupted;
    token.onInterrupt([interrupted]() { interrupted->store(true); });

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, spec.url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, options_.followRedirects ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, options_.verifyPeer ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_VERBOSE, options_.verbose ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &ctx);
    if (!spec.userAgent.empty()) {
        curl_easy_setopt(handle, CURLOPT_USERAGENT, spec.userAgent.c_str());
    }

    CurlSlistPtr headerList;
    for (const auto& header : spec.headers) {
        std::string line = header.first + ": " + header.second;
        headerList.reset(curl_slist_append(headerList.release(), line.c_str()));
    }
    if (!spec.contentType.empty() && spec.kind != core::RequestKind::MULTIPART) {
        std::string line = "Content-Type: " + spec.contentType;
        headerList.reset(curl_slist_append(headerList.release(), line.c_str()));
    }
    if (headerList) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.get());
    }

    CurlMimePtr mime;
    if (spec.kind == core::RequestKind::MULTIPART) {
        mime.reset(curl_mime_init(handle));
        for (const auto& part : spec.parts) {
            curl_mimepart* field = curl_mime_addpart(mime.get());
            curl_mime_name(field, part.name.c_str());
            if (part.isFile()) {
                curl_mime_filedata(field, part.filePath.c_str());
            } else {
                curl_mime_data(field, part.value.data(), part.value.size());
            }
            if (!part.contentType.empty()) {
                curl_mime_type(field, part.contentType.c_str());
            }
        }
        curl_easy_setopt(handle, CURLOPT_MIMEPOST, mime.get());
    }

    switch (spec.method) {
        case core::Method::GET:
            break;
        case core::Method::HEAD:
            curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
            break;
        case core::Method::POST:
            if (!mime) {
                curl_easy_setopt(handle, CURLOPT_POST, 1L);
            }
            break;
        default:
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, core::toString(spec.method).c_str());
            break;
    }
    if (!mime && spec.method != core::Method::GET && spec.method != core::Method::HEAD) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, spec.body.data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(spec.body.size()));
    }

    CURLcode res = curl_easy_perform(handle);
    token.clearInterruptHandlers();

    long httpCode = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_off_t downloaded = 0;
    curl_off_t uploaded = 0;
    curl_easy_getinfo(handle, CURLINFO_SIZE_DOWNLOAD_T, &downloaded);
    curl_easy_getinfo(handle, CURLINFO_SIZE_UPLOAD_T, &uploaded);

    result.statusCode = static_cast<int>(httpCode);
    result.bytesTransferred = static_cast<uint64_t>(downloaded + uploaded);
    result.elapsedMillis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (res != CURLE_OK) {
        result.error = token.isCancelled() ? "cancelled" : curl_easy_strerror(res);
        return result;
    }
    if (httpCode >= 400) {
        result.error = "HTTP Error " + std::to_string(httpCode);
        return result;
    }

    result.success = true;
    utils::Logger::debug(core::toString(spec.method) + " " + spec.url + " -> " + std::to_string(httpCode) +
                         " (" + std::to_string(result.bytesTransferred) + " bytes, " +
                         std::to_string(result.elapsedMillis) + " ms)");
    return result;
}

} // namespace net
} // namespace fastnet
