#include "core/request_builder.hpp"
#include "utils/error_handler.hpp"

#include <cctype>

namespace fastnet {
namespace core {

RequestBuilder::RequestBuilder(Method method, const std::string& url) {
    spec_.method = method;
    spec_.url = url;
}

RequestBuilder RequestBuilder::download(const std::string& url, const std::string& dir,
                                        const std::string& fileName) {
    RequestBuilder builder(Method::GET, url);
    builder.spec_.kind = RequestKind::DOWNLOAD;
    builder.spec_.downloadDir = dir;
    builder.spec_.fileName = fileName;
    return builder;
}

RequestBuilder RequestBuilder::upload(const std::string& url) {
    RequestBuilder builder(Method::POST, url);
    builder.spec_.kind = RequestKind::MULTIPART;
    return builder;
}

RequestBuilder& RequestBuilder::setTag(const std::string& tag) {
    spec_.tag = tag;
    return *this;
}

RequestBuilder& RequestBuilder::setPriority(Priority priority) {
    spec_.priority = priority;
    return *this;
}

RequestBuilder& RequestBuilder::addHeader(const std::string& name, const std::string& value) {
    spec_.headers.emplace_back(name, value);
    return *this;
}

RequestBuilder& RequestBuilder::addQueryParameter(const std::string& name, const std::string& value) {
    queryParameters_.emplace_back(name, value);
    return *this;
}

RequestBuilder& RequestBuilder::setBody(const std::string& body, const std::string& contentType) {
    spec_.body = body;
    spec_.contentType = contentType;
    return *this;
}

RequestBuilder& RequestBuilder::addMultipartParameter(const std::string& name, const std::string& value,
                                                      const std::string& contentType) {
    MultipartPart part;
    part.name = name;
    part.value = value;
    part.contentType = contentType;
    spec_.parts.push_back(part);
    return *this;
}

RequestBuilder& RequestBuilder::addMultipartFile(const std::string& name, const std::string& filePath,
                                                 const std::string& contentType) {
    MultipartPart part;
    part.name = name;
    part.filePath = filePath;
    part.contentType = contentType;
    spec_.parts.push_back(part);
    return *this;
}

RequestBuilder& RequestBuilder::setUserAgent(const std::string& userAgent) {
    spec_.userAgent = userAgent;
    return *this;
}

RequestBuilder& RequestBuilder::setPercentageThresholdForCancelling(int percent) {
    spec_.cancelThresholdPercent = percent;
    return *this;
}

RequestSpec RequestBuilder::build() const {
    const std::string& url = spec_.url;

    if (url.empty()) {
        throw utils::InvalidRequestException("Request url is empty");
    }
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        throw utils::InvalidRequestException("Request url must start with http:// or https://", url);
    }
    if (!spec_.body.empty() && (spec_.method == Method::GET || spec_.method == Method::HEAD)) {
        throw utils::InvalidRequestException(toString(spec_.method) + " request cannot carry a body", url);
    }
    if (spec_.kind == RequestKind::MULTIPART && spec_.parts.empty()) {
        throw utils::InvalidRequestException("Multipart request has no parts", url);
    }
    if (spec_.kind != RequestKind::MULTIPART && !spec_.parts.empty()) {
        throw utils::InvalidRequestException("Multipart parts on a non-multipart request", url);
    }
    if (spec_.kind == RequestKind::DOWNLOAD && (spec_.downloadDir.empty() || spec_.fileName.empty())) {
        throw utils::InvalidRequestException("Download needs a directory and a file name", url);
    }
    if (spec_.cancelThresholdPercent < 0 || spec_.cancelThresholdPercent > 100) {
        throw utils::InvalidRequestException("Cancel threshold must be within [0, 100], got " +
                                             std::to_string(spec_.cancelThresholdPercent), url);
    }
    for (const auto& header : spec_.headers) {
        if (header.first.empty()) {
            throw utils::InvalidRequestException("Header name is empty", url);
        }
    }

    RequestSpec spec = spec_;
    if (!queryParameters_.empty()) {
        // Fragment stays at the end
        std::string fragment;
        size_t hash = spec.url.find('#');
        if (hash != std::string::npos) {
            fragment = spec.url.substr(hash);
            spec.url.erase(hash);
        }

        char separator = spec.url.find('?') == std::string::npos ? '?' : '&';
        for (const auto& param : queryParameters_) {
            spec.url += separator;
            spec.url += percentEncode(param.first) + "=" + percentEncode(param.second);
            separator = '&';
        }
        spec.url += fragment;
    }

    return spec;
}

std::string percentEncode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}

} // namespace core
} // namespace fastnet
