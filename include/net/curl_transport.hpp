#pragma once

#include "core/transport.hpp"

namespace fastnet {
namespace net {

struct CurlTransportOptions {
    long connectTimeoutSeconds = 30;
    bool followRedirects = true;
    bool verifyPeer = true;
    bool verbose = false;
};

/**
 * Transport backed by one libcurl easy handle per call.
 *
 * Both cancellation severities end the transfer from libcurl's progress
 * callback: a cooperative cancel at the next body chunk, a forced one at the
 * next progress tick even while connecting. HTTP status >= 400 is reported
 * as a failure with the status code and body kept.
 */
class CurlTransport : public core::Transport {
public:
    explicit CurlTransport(const CurlTransportOptions& options = CurlTransportOptions());
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    core::TransportResult execute(const core::RequestSpec& spec,
                                  core::CancellationToken& token,
                                  const core::ProgressCallback& progress) override;

private:
    CurlTransportOptions options_;
};

} // namespace net
} // namespace fastnet
