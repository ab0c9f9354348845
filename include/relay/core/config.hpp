/**
 * @file config.hpp
 * @brief JSON configuration for relay tools
 *
 * EXAMPLE (every key optional):
 * {
 *   "staging_dir": "/var/tmp/relay",
 *   "chunk_size": 8388608,
 *   "log_level": "info",
 *   "retry": { "max_attempts": 3, "initial_backoff_ms": 1000, "jitter": true },
 *   "destination": { "kind": "http", "host": "127.0.0.1", "port": 8080, "make_public": true }
 * }
 *
 * RELAY_ACCESS_TOKEN and RELAY_STAGING_DIR in the environment override the
 * file.
 */

#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/http_destination.hpp"
#include "relay/transfer/orchestrator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace relay {

enum class DestinationKind {
    Memory,
    Http
};

struct RetryConfig {
    int max_attempts = 3;
    std::int64_t initial_backoff_ms = 1000;
    double backoff_multiplier = 2.0;
    std::int64_t max_backoff_ms = 32000;
    bool jitter = false;
};

struct DestinationConfig {
    DestinationKind kind = DestinationKind::Memory;
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string upload_path = "/upload/drive/v3/files";
    std::string api_path = "/drive/v3";
    std::string access_token;
    std::string folder_id;
    bool make_public = false;
};

struct RelayConfig {
    std::filesystem::path staging_dir;   ///< Defaults to <tmp>/relay-staging
    std::uint64_t chunk_size = 8 * 1024 * 1024;
    std::uint64_t drain_block_size = 1024 * 1024;
    std::uint64_t progress_interval = 1024 * 1024;
    std::int64_t push_timeout_ms = 60000;
    std::uint64_t large_object_threshold = 50 * 1024 * 1024;
    std::string log_level = "info";
    RetryConfig retry;
    DestinationConfig destination;
};

/// HTTP resumable uploads require chunk sizes in multiples of this.
inline constexpr std::uint64_t kHttpChunkGranularity = 256 * 1024;

Result<RelayConfig> config_from_json(const nlohmann::json& document);
Result<RelayConfig> parse_config(const std::string& text);

/**
 * @brief Read, apply environment overrides, and validate a config file
 */
Result<RelayConfig> load_config(const std::filesystem::path& path);

/// Defaults plus environment overrides, validated.
Result<RelayConfig> default_config();

void apply_environment(RelayConfig& config);
Result<void> validate(const RelayConfig& config);

Result<spdlog::level::level_enum> parse_log_level(const std::string& name);
Result<DestinationKind> parse_destination_kind(const std::string& name);

transfer::OrchestratorOptions make_orchestrator_options(const RelayConfig& config);
transfer::HttpDestinationOptions make_http_destination_options(const RelayConfig& config);

} // namespace relay
