#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "core/networking.hpp"
#include "net/curl_transport.hpp"
#include "utils/logging.hpp"

using namespace fastnet;

int main(int argc, char* argv[]) {
    try {
        // Initialize logging
        utils::Logger::initialize();

        std::string configPath = "config/networking.json";
        std::string outputDir;
        std::string tag = "fetch";
        core::Priority priority = core::Priority::MEDIUM;
        bool verbose = false;
        std::vector<std::string> urls;

        // Parse command line arguments
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                outputDir = argv[++i];
            } else if (arg == "--tag" && i + 1 < argc) {
                tag = argv[++i];
            } else if (arg == "--priority" && i + 1 < argc) {
                priority = core::parsePriority(argv[++i]);
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options] <url>...\n"
                          << "Options:\n"
                          << "  --config <path>     Networking configuration (default: config/networking.json)\n"
                          << "  --output <dir>      Save each response body into <dir>\n"
                          << "  --tag <tag>         Tag attached to every request (default: fetch)\n"
                          << "  --priority <level>  LOW, MEDIUM, HIGH or IMMEDIATE\n"
                          << "  --verbose, -v       Debug logging\n"
                          << "  --help, -h          Show this help message\n";
                return 0;
            } else {
                urls.push_back(arg);
            }
        }

        if (urls.empty()) {
            std::cerr << "No url given, see --help" << std::endl;
            return 1;
        }

        core::NetworkingConfig config = core::NetworkingConfig::load(configPath);
        if (verbose) {
            config.logging.level = "DEBUG";
        }

        core::Networking networking(std::make_shared<net::CurlTransport>(), config);

        networking.setQualityChangeListener([](quality::ConnectionQuality q, int kbps) {
            std::cout << "Connection quality: " << quality::toString(q) << " (" << kbps << " kbps)" << std::endl;
        });

        std::atomic<int> failures{0};
        std::vector<core::RequestHandle> handles;
        for (size_t i = 0; i < urls.size(); ++i) {
            const std::string& url = urls[i];

            core::RequestBuilder builder = outputDir.empty()
                ? networking.get(url)
                : networking.download(url, outputDir, "response_" + std::to_string(i));
            builder.setTag(tag).setPriority(priority);

            handles.push_back(networking.submit(builder, [url, &failures](const core::RequestOutcome& outcome) {
                if (outcome.ok()) {
                    std::cout << url << ": " << outcome.response.statusCode << ", "
                              << outcome.response.bytesTransferred << " bytes in "
                              << outcome.response.elapsedMillis << " ms" << std::endl;
                } else {
                    failures++;
                    std::cerr << url << ": " << core::toString(outcome.status) << " " << outcome.error << std::endl;
                }
            }));
        }

        for (const auto& handle : handles) {
            while (!handle.wait()) {
                utils::Logger::debug("Still waiting for request " + std::to_string(handle.id()));
            }
        }
        networking.notifier().waitIdle();

        std::cout << "Estimated bandwidth: " << networking.getCurrentBandwidth() << " kbps ("
                  << quality::toString(networking.getCurrentQuality()) << ")" << std::endl;

        networking.shutdown();
        return failures == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
