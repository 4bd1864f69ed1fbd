/**
 * @file mock_server.cpp
 * @brief chunkup-mock-server: local upload API for trying chunkup-upload
 *
 * Run with:
 *   ./build/chunkup-mock-server --port 8080 --drop-after 2 --drop 1
 *
 * Test with:
 *   ./build/chunkup-upload --api http://127.0.0.1:8080 --chunk-size 4096 some.bin
 */

#include "chunkup/server/mock_upload_server.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

using chunkup::server::MockUploadServer;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --port PORT           Port to listen on (default: 8080, 0 picks a free port)\n";
    std::cout << "  --token TOKEN         Require this access token on ticket and completion calls\n";
    std::cout << "  --free-space BYTES    Quota reported in tickets\n";
    std::cout << "  --drop-after N        Accept N chunks before dropping starts\n";
    std::cout << "  --drop N              Silently lose N chunks\n";
    std::cout << "  --resume N            Answer 308 to N chunks\n";
    std::cout << "  --truncate BYTES      Cut stored data to BYTES before the next probe\n";
    std::cout << "  --malformed-range N   Send N unparseable Range headers\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  --help                Show this help message\n";
}

std::optional<std::uint64_t> parse_unsigned(const char* text) {
    const std::string value(text);
    std::uint64_t number = 0;
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), last, number);
    if (ec != std::errc() || ptr != last || value.empty()) {
        return std::nullopt;
    }
    return number;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    MockUploadServer::Options options;
    options.port = 8080;
    MockUploadServer::Faults faults;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
            continue;
        }
        if (i + 1 >= argc) {
            spdlog::error("Unknown option or missing value: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
        if (arg == "--token") {
            options.access_token = argv[++i];
            continue;
        }

        const auto value = parse_unsigned(argv[++i]);
        if (!value) {
            spdlog::error("Invalid value for {}: {}", arg, argv[i]);
            return 1;
        }

        if (arg == "--port" && *value <= 65535) {
            options.port = static_cast<uint16_t>(*value);
        } else if (arg == "--free-space") {
            options.free_space = *value;
        } else if (arg == "--drop-after") {
            faults.drop_after_chunks = static_cast<std::size_t>(*value);
        } else if (arg == "--drop") {
            faults.drop_chunks = static_cast<std::size_t>(*value);
        } else if (arg == "--resume") {
            faults.resume_on_chunks = static_cast<std::size_t>(*value);
        } else if (arg == "--truncate") {
            faults.truncate_to = *value;
        } else if (arg == "--malformed-range") {
            faults.malformed_range_replies = static_cast<std::size_t>(*value);
        } else {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        MockUploadServer server(options);
        server.inject(faults);

        server.stop_on_signals();
        server.run();
    } catch (const std::exception& e) {
        spdlog::error("Mock server failed: {}", e.what());
        return 1;
    }

    spdlog::info("Mock server stopped");
    return 0;
}
