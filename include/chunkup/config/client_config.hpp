#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkup::config {

/// Environment variable that overrides the configured access token
inline constexpr const char* kAccessTokenEnv = "CHUNKUP_ACCESS_TOKEN";

/**
 * @brief Settings for the upload client and its HTTP transport
 *
 * JSON layout (every key optional):
 * {
 *   "api_base_url": "http://127.0.0.1:8080",
 *   "access_token": "...",
 *   "chunk_size": 1048576,
 *   "request_timeout_ms": 60000,
 *   "max_uninformative_verifications": 3,
 *   "user_agent": "chunkup/1.0",
 *   "log_level": "info"
 * }
 */
struct ClientConfig {
    std::string api_base_url;
    std::string access_token;
    std::size_t chunk_size = upload::kDefaultChunkSize;
    std::chrono::milliseconds request_timeout{60000};
    std::uint32_t max_uninformative_verifications = 3;
    std::string user_agent = "chunkup/1.0";
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/**
 * @brief Parse a JSON document into a config, starting from the defaults
 *
 * Every invalid field is reported, one per line of the error.
 */
Result<ClientConfig> parse_config(const std::string& json_text);

/// Read and parse a config file, then apply the environment override
Result<ClientConfig> load_config(const std::filesystem::path& path);

/// Replace the access token with $CHUNKUP_ACCESS_TOKEN when it is set and non-empty
void apply_environment(ClientConfig& config);

/// Problems that make the config unusable for an upload; empty when valid
std::vector<std::string> validate(const ClientConfig& config);

/// "trace", "debug", "info", "warn", "error", "critical" or "off"
Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace chunkup::config
