/**
 * @file upload_cli.cpp
 * @brief chunkup-upload: push one file through the resumable upload API
 *
 * Settings come from an optional JSON config, then $CHUNKUP_ACCESS_TOKEN,
 * then the command line.
 *
 * Run with:
 *   ./build/chunkup-upload --api http://127.0.0.1:8080 --chunk-size 65536 movie.mp4
 *
 * Exit codes: 0 uploaded, 1 usage or config error, 2 upload failed.
 */

#include "chunkup/config/client_config.hpp"
#include "chunkup/events/components.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/network/asio_http_transport.hpp"
#include "chunkup/upload/client.hpp"
#include "chunkup/upload/content_source.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

using namespace chunkup;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitUploadFailed = 2;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] FILE\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH         JSON config file\n";
    std::cout << "  --api URL             API base URL\n";
    std::cout << "  --token TOKEN         Access token (overrides $" << config::kAccessTokenEnv << ")\n";
    std::cout << "  --chunk-size BYTES    Bytes per chunk (default: " << upload::kDefaultChunkSize << ")\n";
    std::cout << "  --replace VIDEO_ID    Replace the file of an existing video\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  --help                Show this help message\n";
}

std::optional<std::uint64_t> parse_unsigned(const std::string& text) {
    std::uint64_t value = 0;
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

struct Arguments {
    std::optional<std::string> config_path;
    std::optional<std::string> api_base_url;
    std::optional<std::string> access_token;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint64_t> replace_video_id;
    bool verbose = false;
    bool help = false;
    std::string file;
};

std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", option);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help") {
            args.help = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--config" || arg == "--api" || arg == "--token") {
            auto value = next_value(arg.c_str());
            if (!value) {
                return std::nullopt;
            }
            if (arg == "--config") {
                args.config_path = *value;
            } else if (arg == "--api") {
                args.api_base_url = *value;
            } else {
                args.access_token = *value;
            }
        } else if (arg == "--chunk-size" || arg == "--replace") {
            auto value = next_value(arg.c_str());
            if (!value) {
                return std::nullopt;
            }
            auto number = parse_unsigned(*value);
            if (!number) {
                spdlog::error("Invalid value for {}: {}", arg, *value);
                return std::nullopt;
            }
            if (arg == "--chunk-size") {
                args.chunk_size = *number;
            } else {
                args.replace_video_id = *number;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        } else if (args.file.empty()) {
            args.file = arg;
        } else {
            spdlog::error("Only one file can be uploaded at a time");
            return std::nullopt;
        }
    }

    if (!args.help && args.file.empty()) {
        spdlog::error("No file given");
        return std::nullopt;
    }
    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (args->help) {
        print_usage(argv[0]);
        return 0;
    }

    config::ClientConfig settings;
    if (args->config_path) {
        auto loaded = config::load_config(*args->config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return kExitUsage;
        }
        settings = loaded.value();
    } else {
        config::apply_environment(settings);
    }

    if (args->api_base_url) {
        settings.api_base_url = *args->api_base_url;
    }
    if (args->access_token) {
        settings.access_token = *args->access_token;
    }
    if (args->chunk_size) {
        settings.chunk_size = static_cast<std::size_t>(*args->chunk_size);
    }
    spdlog::set_level(args->verbose ? spdlog::level::debug : settings.log_level);

    const auto problems = config::validate(settings);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            spdlog::error("Invalid setting {}", problem);
        }
        return kExitUsage;
    }

    auto source = upload::FileContentSource::open(args->file);
    if (source.is_error()) {
        spdlog::error("{}", source.error());
        return kExitUsage;
    }

    network::AsioHttpTransport transport({settings.access_token, settings.user_agent, settings.request_timeout});

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    upload::UploadClient client(transport, {settings.api_base_url, settings.max_uninformative_verifications}, &bus);

    spdlog::info("Uploading {} ({} bytes) in chunks of {} bytes",
                 args->file, source.value()->length(), settings.chunk_size);

    auto session = client.upload_entire_file(*source.value(), settings.chunk_size, args->replace_video_id);
    metrics.print_stats();

    if (session.is_error()) {
        spdlog::error("Upload failed: {}", session.error().describe());
        return kExitUploadFailed;
    }

    std::cout << session.value().clip_uri() << std::endl;
    return 0;
}
