#pragma once

#include "core/request.hpp"

#include <string>
#include <utility>
#include <vector>

namespace fastnet {
namespace core {

/**
 * Fluent construction of a RequestSpec. Nothing is checked until build().
 *
 *   RequestSpec spec = RequestBuilder(Method::GET, "https://example.com/users")
 *                          .addQueryParameter("page", "2")
 *                          .setTag("users")
 *                          .setPriority(Priority::HIGH)
 *                          .build();
 */
class RequestBuilder {
public:
    RequestBuilder(Method method, const std::string& url);

    static RequestBuilder download(const std::string& url, const std::string& dir, const std::string& fileName);
    static RequestBuilder upload(const std::string& url);

    RequestBuilder& setTag(const std::string& tag);
    RequestBuilder& setPriority(Priority priority);
    RequestBuilder& addHeader(const std::string& name, const std::string& value);
    RequestBuilder& addQueryParameter(const std::string& name, const std::string& value);
    RequestBuilder& setBody(const std::string& body, const std::string& contentType = "application/octet-stream");
    RequestBuilder& addMultipartParameter(const std::string& name, const std::string& value,
                                          const std::string& contentType = "");
    RequestBuilder& addMultipartFile(const std::string& name, const std::string& filePath,
                                     const std::string& contentType = "");
    RequestBuilder& setUserAgent(const std::string& userAgent);

    /**
     * A cooperative cancel is ignored once this much of the transfer is done.
     * 0 disables the rule.
     */
    RequestBuilder& setPercentageThresholdForCancelling(int percent);

    /**
     * Validate and produce the spec. Query parameters are percent-encoded
     * into the url here.
     * @throws utils::InvalidRequestException describing the first problem found
     */
    RequestSpec build() const;

private:
    RequestSpec spec_;
    std::vector<std::pair<std::string, std::string>> queryParameters_;
};

/**
 * RFC 3986 percent-encoding; unreserved characters pass through.
 */
std::string percentEncode(const std::string& value);

} // namespace core
} // namespace fastnet
