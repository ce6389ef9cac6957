#pragma once

#include "core/cancellation_token.hpp"
#include "core/request.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace fastnet {
namespace core {

/**
 * Result of one transport call. bytesTransferred and elapsedMillis feed the
 * connection quality estimator, so they are reported for failures too.
 */
struct TransportResult {
    bool success = false;
    int statusCode = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    uint64_t bytesTransferred = 0;
    int64_t elapsedMillis = 0;
    std::string error;
};

using ProgressCallback = std::function<void(uint64_t bytesDone, uint64_t bytesTotal)>;

/**
 * HTTP execution primitive the dispatcher runs on its workers.
 *
 * Implementations must poll token.isCancelled() at their I/O checkpoints and
 * register an interrupt handler with token.onInterrupt() so a forced cancel
 * can abort a blocking call. Failures are returned, not thrown; an exception
 * escaping execute() is treated as a failed transfer.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportResult execute(const RequestSpec& spec,
                                    CancellationToken& token,
                                    const ProgressCallback& progress) = 0;
};

} // namespace core
} // namespace fastnet
