#include "relay/core/config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace relay {

using json = nlohmann::json;

namespace {

Result<std::uint64_t> read_unsigned(const json& object, const char* key, std::uint64_t fallback) {
    if (!object.contains(key)) {
        return Ok(fallback);
    }
    const auto& value = object.at(key);
    if (!value.is_number_unsigned()) {
        return Err(std::string("'") + key + "' must be a non-negative integer");
    }
    return Ok(value.get<std::uint64_t>());
}

Result<std::int64_t> read_signed(const json& object, const char* key, std::int64_t fallback) {
    if (!object.contains(key)) {
        return Ok(fallback);
    }
    const auto& value = object.at(key);
    if (!value.is_number_integer()) {
        return Err(std::string("'") + key + "' must be an integer");
    }
    return Ok(value.get<std::int64_t>());
}

Result<std::string> read_string(const json& object, const char* key, const std::string& fallback) {
    if (!object.contains(key)) {
        return Ok(fallback);
    }
    const auto& value = object.at(key);
    if (!value.is_string()) {
        return Err(std::string("'") + key + "' must be a string");
    }
    return Ok(value.get<std::string>());
}

Result<bool> read_bool(const json& object, const char* key, bool fallback) {
    if (!object.contains(key)) {
        return Ok(fallback);
    }
    const auto& value = object.at(key);
    if (!value.is_boolean()) {
        return Err(std::string("'") + key + "' must be true or false");
    }
    return Ok(value.get<bool>());
}

// Assigns on success, records the first error otherwise.
template<typename T, typename U>
void assign(Result<T> result, U& target, std::string& error) {
    if (!error.empty()) {
        return;
    }
    if (result.is_error()) {
        error = result.error();
        return;
    }
    target = static_cast<U>(result.value());
}

Result<RetryConfig> parse_retry(const json& object) {
    if (!object.is_object()) {
        return Err(std::string("'retry' must be an object"));
    }

    RetryConfig retry;
    std::string error;
    std::int64_t max_attempts = retry.max_attempts;
    assign(read_signed(object, "max_attempts", retry.max_attempts), max_attempts, error);
    assign(read_signed(object, "initial_backoff_ms", retry.initial_backoff_ms), retry.initial_backoff_ms, error);
    assign(read_signed(object, "max_backoff_ms", retry.max_backoff_ms), retry.max_backoff_ms, error);
    assign(read_bool(object, "jitter", retry.jitter), retry.jitter, error);

    if (error.empty() && object.contains("backoff_multiplier")) {
        if (!object.at("backoff_multiplier").is_number()) {
            error = "'backoff_multiplier' must be a number";
        } else {
            retry.backoff_multiplier = object.at("backoff_multiplier").get<double>();
        }
    }
    if (error.empty() && (max_attempts < 1 || max_attempts > std::numeric_limits<int>::max())) {
        error = "retry.max_attempts must be at least 1";
    }
    if (!error.empty()) {
        return Err(error);
    }
    retry.max_attempts = static_cast<int>(max_attempts);
    return Ok(retry);
}

Result<DestinationConfig> parse_destination(const json& object) {
    if (!object.is_object()) {
        return Err(std::string("'destination' must be an object"));
    }

    DestinationConfig destination;
    std::string error;
    std::string kind = "memory";
    std::uint64_t port = destination.port;

    assign(read_string(object, "kind", kind), kind, error);
    assign(read_string(object, "host", destination.host), destination.host, error);
    assign(read_unsigned(object, "port", destination.port), port, error);
    assign(read_string(object, "upload_path", destination.upload_path), destination.upload_path, error);
    assign(read_string(object, "api_path", destination.api_path), destination.api_path, error);
    assign(read_string(object, "access_token", destination.access_token), destination.access_token, error);
    assign(read_string(object, "folder_id", destination.folder_id), destination.folder_id, error);
    assign(read_bool(object, "make_public", destination.make_public), destination.make_public, error);
    if (!error.empty()) {
        return Err(error);
    }

    auto parsed_kind = parse_destination_kind(kind);
    if (parsed_kind.is_error()) {
        return Err(parsed_kind.error());
    }
    destination.kind = parsed_kind.value();

    if (port == 0 || port > 65535) {
        return Err("destination.port out of range: " + std::to_string(port));
    }
    destination.port = static_cast<std::uint16_t>(port);
    return Ok(destination);
}

std::filesystem::path default_staging_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "relay-staging";
}

} // namespace

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") return Ok(spdlog::level::trace);
    if (name == "debug") return Ok(spdlog::level::debug);
    if (name == "info") return Ok(spdlog::level::info);
    if (name == "warn" || name == "warning") return Ok(spdlog::level::warn);
    if (name == "error") return Ok(spdlog::level::err);
    if (name == "critical") return Ok(spdlog::level::critical);
    if (name == "off") return Ok(spdlog::level::off);
    return Err("Unknown log level: " + name);
}

Result<DestinationKind> parse_destination_kind(const std::string& name) {
    if (name == "memory") return Ok(DestinationKind::Memory);
    if (name == "http") return Ok(DestinationKind::Http);
    return Err("Unknown destination kind: " + name);
}

Result<RelayConfig> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err(std::string("Configuration must be a JSON object"));
    }

    RelayConfig config;
    config.staging_dir = default_staging_dir();

    std::string error;
    std::string staging_dir = config.staging_dir.string();
    assign(read_string(document, "staging_dir", staging_dir), staging_dir, error);
    assign(read_unsigned(document, "chunk_size", config.chunk_size), config.chunk_size, error);
    assign(read_unsigned(document, "drain_block_size", config.drain_block_size), config.drain_block_size, error);
    assign(read_unsigned(document, "progress_interval", config.progress_interval), config.progress_interval, error);
    assign(read_signed(document, "push_timeout_ms", config.push_timeout_ms), config.push_timeout_ms, error);
    assign(read_unsigned(document, "large_object_threshold", config.large_object_threshold),
           config.large_object_threshold, error);
    assign(read_string(document, "log_level", config.log_level), config.log_level, error);
    if (!error.empty()) {
        return Err(error);
    }
    config.staging_dir = staging_dir;

    if (document.contains("retry")) {
        auto retry = parse_retry(document.at("retry"));
        if (retry.is_error()) {
            return Err(retry.error());
        }
        config.retry = retry.value();
    }

    if (document.contains("destination")) {
        auto destination = parse_destination(document.at("destination"));
        if (destination.is_error()) {
            return Err(destination.error());
        }
        config.destination = destination.value();
    }

    return Ok(config);
}

Result<RelayConfig> parse_config(const std::string& text) {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err(std::string("Configuration is not valid JSON"));
    }
    return config_from_json(document);
}

Result<RelayConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err("Failed to open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    auto config = parse_config(buffer.str());
    if (config.is_error()) {
        return Err(path.string() + ": " + config.error());
    }

    apply_environment(config.value());
    auto valid = validate(config.value());
    if (valid.is_error()) {
        return Err(path.string() + ": " + valid.error());
    }
    return config;
}

Result<RelayConfig> default_config() {
    auto config = config_from_json(json::object());
    if (config.is_error()) {
        return config;
    }
    apply_environment(config.value());
    auto valid = validate(config.value());
    if (valid.is_error()) {
        return Err(valid.error());
    }
    return config;
}

void apply_environment(RelayConfig& config) {
    if (const char* token = std::getenv("RELAY_ACCESS_TOKEN"); token != nullptr && *token != '\0') {
        config.destination.access_token = token;
    }
    if (const char* staging = std::getenv("RELAY_STAGING_DIR"); staging != nullptr && *staging != '\0') {
        config.staging_dir = staging;
    }
}

Result<void> validate(const RelayConfig& config) {
    if (config.staging_dir.empty()) {
        return Err(std::string("staging_dir must not be empty"));
    }
    if (config.chunk_size == 0) {
        return Err(std::string("chunk_size must be positive"));
    }
    if (config.drain_block_size == 0) {
        return Err(std::string("drain_block_size must be positive"));
    }
    if (config.progress_interval == 0) {
        return Err(std::string("progress_interval must be positive"));
    }
    if (config.push_timeout_ms <= 0) {
        return Err(std::string("push_timeout_ms must be positive"));
    }
    if (config.retry.max_attempts < 1) {
        return Err(std::string("retry.max_attempts must be at least 1"));
    }
    if (config.retry.initial_backoff_ms < 0 || config.retry.max_backoff_ms < 0) {
        return Err(std::string("retry backoff values must not be negative"));
    }
    if (config.retry.max_backoff_ms < config.retry.initial_backoff_ms) {
        return Err(std::string("retry.max_backoff_ms must not be below retry.initial_backoff_ms"));
    }
    if (config.retry.backoff_multiplier < 1.0) {
        return Err(std::string("retry.backoff_multiplier must be at least 1.0"));
    }

    auto level = parse_log_level(config.log_level);
    if (level.is_error()) {
        return Err(level.error());
    }

    if (config.destination.kind == DestinationKind::Http) {
        if (config.chunk_size % kHttpChunkGranularity != 0) {
            return Err("chunk_size " + std::to_string(config.chunk_size) +
                       " is not a multiple of 256 KiB, required by resumable HTTP uploads");
        }
        if (config.destination.host.empty()) {
            return Err(std::string("destination.host must not be empty"));
        }
        if (config.destination.upload_path.empty() || config.destination.upload_path.front() != '/') {
            return Err(std::string("destination.upload_path must start with '/'"));
        }
    }
    return Ok();
}

transfer::OrchestratorOptions make_orchestrator_options(const RelayConfig& config) {
    transfer::OrchestratorOptions options;
    options.drain.block_size = static_cast<std::size_t>(config.drain_block_size);
    options.drain.progress_interval = config.progress_interval;
    options.upload.chunk_size = config.chunk_size;
    options.upload.call_timeout = std::chrono::milliseconds(config.push_timeout_ms);
    options.retry.max_attempts = config.retry.max_attempts;
    options.retry.initial_backoff = std::chrono::milliseconds(config.retry.initial_backoff_ms);
    options.retry.backoff_multiplier = config.retry.backoff_multiplier;
    options.retry.max_backoff = std::chrono::milliseconds(config.retry.max_backoff_ms);
    options.retry.jitter = config.retry.jitter;
    options.make_public = config.destination.make_public;
    options.large_object_threshold = config.large_object_threshold;
    return options;
}

transfer::HttpDestinationOptions make_http_destination_options(const RelayConfig& config) {
    transfer::HttpDestinationOptions options;
    options.host = config.destination.host;
    options.port = config.destination.port;
    options.upload_path = config.destination.upload_path;
    options.api_path = config.destination.api_path;
    options.access_token = config.destination.access_token;
    return options;
}

} // namespace relay
