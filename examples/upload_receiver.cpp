/**
 * @file upload_receiver.cpp
 * @brief Local endpoint speaking the resumable upload protocol
 *
 * Keeps uploaded objects in memory. Point relay_cli at it with an http
 * destination on the same port.
 *
 * Usage:
 *   relay_receiver [port] [--token TOKEN]
 *
 * Test with:
 *   curl -i -X POST 'http://localhost:8080/upload/drive/v3/files?uploadType=resumable' \
 *        -H 'X-Upload-Content-Length: 5' -d '{"name": "hello.txt"}'
 *   curl -i -X PUT '<Location from above>' -H 'Content-Range: bytes 0-4/5' --data-binary hello
 */

#include "relay/network/upload_receiver.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <string>

using relay::network::ResumableUploadReceiver;

// Global io_context for signal handling
boost::asio::io_context* g_io_context = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_io_context) {
            g_io_context->stop();
        }
    }
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    uint16_t port = 8080;
    ResumableUploadReceiver::Options options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--token" && i + 1 < argc) {
            options.access_token = argv[++i];
        } else if (!arg.empty() && arg.find_first_not_of("0123456789") == std::string::npos) {
            const unsigned long value = std::stoul(arg);
            if (value > 65535) {
                spdlog::error("Port out of range: {}", arg);
                return 2;
            }
            port = static_cast<uint16_t>(value);
        } else {
            spdlog::error("Usage: {} [port] [--token TOKEN]", argv[0]);
            return 2;
        }
    }

    boost::asio::io_context io_context;
    g_io_context = &io_context;

    try {
        ResumableUploadReceiver receiver(io_context, port, options, "0.0.0.0");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        spdlog::info("Resumable upload receiver ready on port {}{}", receiver.port(),
                     options.access_token.empty() ? "" : " (token required)");
        io_context.run();

        spdlog::info("Shutting down; {} object(s) received", receiver.object_ids().size());
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start receiver on port {}: {}", port, e.what());
        return 1;
    }

    g_io_context = nullptr;
    return 0;
}
