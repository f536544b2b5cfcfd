#pragma once

#include "ingest/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ingest::config {

/**
 * @brief Server environment the client talks to
 *
 * Local requires INGEST_API_LOC (or an explicit api_url) since there is no
 * well-known address for it.
 */
enum class Environment {
    Local,
    NonProduction,
    Production
};

/// Accepts "local", "dev", "development", "non-prod", "nonprod",
/// "nonproduction", "prod" and "production" (case-insensitive, trimmed).
Result<Environment> parse_environment(const std::string& text);

const char* to_string(Environment env);

struct Config {
    static constexpr std::uint64_t kDefaultChunkSize = 5'242'880; // S3 minimum part size
    static constexpr std::size_t kDefaultMaxRetries = 20;

    Environment environment = Environment::Production;
    std::string api_url;  ///< Overrides the environment's address when set
    std::chrono::milliseconds request_timeout{30'000};
    std::size_t max_retries = kDefaultMaxRetries;
    std::chrono::milliseconds retry_base_delay{500};
    std::size_t parallelism = 10;
    std::uint64_t default_chunk_size = kDefaultChunkSize;

    [[nodiscard]] Result<std::string> resolved_api_url() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads from the process environment.
std::optional<std::string> process_env(const std::string& name);

/**
 * @brief Overlay a JSON configuration file onto @p base
 *
 * Recognised keys: environment, api_url, timeout_ms, max_retries,
 * retry_base_delay_ms, parallelism, chunk_size. Unknown keys are ignored.
 */
Result<Config> load_config_file(const std::filesystem::path& path, Config base = {});

/// Overlay INGEST_ENV, INGEST_API_LOC and INGEST_PARALLELISM onto @p base.
Result<Config> apply_environment(Config base, const EnvLookup& lookup = process_env);

/// Defaults, then the optional file, then the environment.
Result<Config> load_config(const std::optional<std::filesystem::path>& file,
                           const EnvLookup& lookup = process_env);

} // namespace ingest::config
