#include "chunkup/config/client_config.hpp"

#include "chunkup/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace chunkup::config {

using json = nlohmann::json;

namespace {

std::string join_lines(const std::vector<std::string>& problems) {
    std::string joined;
    for (const auto& problem : problems) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += problem;
    }
    return joined;
}

void read_string(const json& document, const char* key, std::string& out, std::vector<std::string>& problems) {
    const auto it = document.find(key);
    if (it == document.end()) {
        return;
    }
    if (!it->is_string()) {
        problems.push_back(std::string(key) + ": expected a string");
        return;
    }
    out = it->get<std::string>();
}

// Accepts a non-negative integer; negative numbers and non-integers are reported
template<typename T>
void read_unsigned(const json& document, const char* key, T& out, std::vector<std::string>& problems) {
    const auto it = document.find(key);
    if (it == document.end()) {
        return;
    }
    if (it->is_number_unsigned()) {
        out = static_cast<T>(it->get<std::uint64_t>());
        return;
    }
    if (it->is_number_integer()) {
        problems.push_back(std::string(key) + ": must not be negative");
        return;
    }
    problems.push_back(std::string(key) + ": expected a non-negative integer");
}

} // namespace

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    static const std::array<std::pair<const char*, spdlog::level::level_enum>, 8> levels {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};

    for (const auto& [level_name, level] : levels) {
        if (name == level_name) {
            return Ok(level);
        }
    }
    return Err("Unknown log level: " + name);
}

Result<ClientConfig> parse_config(const std::string& json_text) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return Err("Config is not valid JSON");
    }
    if (!document.is_object()) {
        return Err("Config must be a JSON object");
    }

    ClientConfig config;
    std::vector<std::string> problems;

    read_string(document, "api_base_url", config.api_base_url, problems);
    read_string(document, "access_token", config.access_token, problems);
    read_string(document, "user_agent", config.user_agent, problems);
    read_unsigned(document, "chunk_size", config.chunk_size, problems);
    read_unsigned(document, "max_uninformative_verifications", config.max_uninformative_verifications, problems);

    std::uint64_t timeout_ms = static_cast<std::uint64_t>(config.request_timeout.count());
    read_unsigned(document, "request_timeout_ms", timeout_ms, problems);
    config.request_timeout = std::chrono::milliseconds(timeout_ms);

    std::string level_name;
    read_string(document, "log_level", level_name, problems);
    if (!level_name.empty()) {
        auto level = parse_log_level(level_name);
        if (level.is_error()) {
            problems.push_back("log_level: " + level.error());
        } else {
            config.log_level = level.value();
        }
    }

    if (!problems.empty()) {
        return Err(join_lines(problems));
    }
    return Ok(std::move(config));
}

Result<ClientConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err("Failed to open config file: " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();

    auto config = parse_config(contents.str());
    if (config.is_error()) {
        return Err("Invalid config " + path.string() + ":\n" + config.error());
    }
    apply_environment(config.value());

    spdlog::debug("Loaded config from {}", path.string());
    return config;
}

void apply_environment(ClientConfig& config) {
    const char* token = std::getenv(kAccessTokenEnv);
    if (token != nullptr && *token != '\0') {
        config.access_token = token;
    }
}

std::vector<std::string> validate(const ClientConfig& config) {
    std::vector<std::string> problems;

    if (config.api_base_url.empty()) {
        problems.push_back("api_base_url: required");
    } else if (auto url = network::parse_url(config.api_base_url); url.is_error()) {
        problems.push_back("api_base_url: " + url.error());
    }
    if (config.access_token.empty()) {
        problems.push_back("access_token: required");
    }
    if (config.chunk_size == 0) {
        problems.push_back("chunk_size: must be greater than zero");
    }
    if (config.request_timeout.count() <= 0) {
        problems.push_back("request_timeout_ms: must be greater than zero");
    }
    if (config.max_uninformative_verifications == 0) {
        problems.push_back("max_uninformative_verifications: must be greater than zero");
    }
    return problems;
}

} // namespace chunkup::config
