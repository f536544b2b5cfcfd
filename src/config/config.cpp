#include "ingest/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace ingest::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string normalise(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    std::string out;
    if (begin < end) {
        out.assign(begin, end);
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Result<std::size_t> parse_count(const std::string& name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stoull(text, &consumed);
        if (consumed != text.size() || value == 0) {
            return Err<std::size_t>(Error::invalid_argument(name + " must be a positive integer: " + text));
        }
        return Ok(static_cast<std::size_t>(value));
    } catch (const std::exception&) {
        return Err<std::size_t>(Error::invalid_argument(name + " must be a positive integer: " + text));
    }
}

} // namespace

Result<Environment> parse_environment(const std::string& text) {
    const auto value = normalise(text);
    if (value == "dev" || value == "development" || value == "non-prod" ||
        value == "nonprod" || value == "nonproduction") {
        return Ok(Environment::NonProduction);
    }
    if (value == "local") {
        return Ok(Environment::Local);
    }
    if (value == "prod" || value == "production") {
        return Ok(Environment::Production);
    }
    return Err<Environment>(Error::invalid_argument("invalid environment string: " + text));
}

const char* to_string(Environment env) {
    switch (env) {
        case Environment::Local: return "local";
        case Environment::NonProduction: return "nonproduction";
        case Environment::Production: return "production";
    }
    return "unknown";
}

Result<std::string> Config::resolved_api_url() const {
    if (!api_url.empty()) {
        return Ok(api_url);
    }
    switch (environment) {
        case Environment::NonProduction:
            return Ok(std::string("https://api.pennsieve.net"));
        case Environment::Production:
            return Ok(std::string("https://api.pennsieve.io"));
        case Environment::Local:
            break;
    }
    return Err<std::string>(Error::invalid_argument("INGEST_API_LOC must be defined for the local environment"));
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<Config> load_config_file(const fs::path& path, Config base) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(Error::io_failure("Failed to open config file: " + path.string()));
    }

    auto doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<Config>(Error::parse_failure("Config file is not a JSON object: " + path.string()));
    }

    try {
        if (doc.contains("environment")) {
            auto env = parse_environment(doc.at("environment").get<std::string>());
            if (env.is_error()) {
                return Err<Config>(env.error());
            }
            base.environment = env.value();
        }
        if (doc.contains("api_url")) {
            base.api_url = doc.at("api_url").get<std::string>();
        }
        if (doc.contains("timeout_ms")) {
            base.request_timeout = std::chrono::milliseconds(doc.at("timeout_ms").get<std::int64_t>());
        }
        if (doc.contains("max_retries")) {
            base.max_retries = doc.at("max_retries").get<std::size_t>();
        }
        if (doc.contains("retry_base_delay_ms")) {
            base.retry_base_delay = std::chrono::milliseconds(doc.at("retry_base_delay_ms").get<std::int64_t>());
        }
        if (doc.contains("parallelism")) {
            base.parallelism = doc.at("parallelism").get<std::size_t>();
        }
        if (doc.contains("chunk_size")) {
            base.default_chunk_size = doc.at("chunk_size").get<std::uint64_t>();
        }
    } catch (const json::exception& e) {
        return Err<Config>(Error::parse_failure(std::string("Invalid config value: ") + e.what()));
    }

    if (base.parallelism == 0 || base.default_chunk_size == 0) {
        return Err<Config>(Error::invalid_argument("parallelism and chunk_size must be > 0"));
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return Ok(std::move(base));
}

Result<Config> apply_environment(Config base, const EnvLookup& lookup) {
    if (auto env = lookup("INGEST_ENV")) {
        auto parsed = parse_environment(*env);
        if (parsed.is_error()) {
            return Err<Config>(parsed.error());
        }
        base.environment = parsed.value();
    }
    if (auto url = lookup("INGEST_API_LOC")) {
        base.api_url = *url;
    }
    if (auto parallelism = lookup("INGEST_PARALLELISM")) {
        auto parsed = parse_count("INGEST_PARALLELISM", *parallelism);
        if (parsed.is_error()) {
            return Err<Config>(parsed.error());
        }
        base.parallelism = parsed.value();
    }
    return Ok(std::move(base));
}

Result<Config> load_config(const std::optional<fs::path>& file, const EnvLookup& lookup) {
    Config config;
    if (file) {
        auto loaded = load_config_file(*file, config);
        if (loaded.is_error()) {
            return loaded;
        }
        config = std::move(loaded.value());
    }
    return apply_environment(std::move(config), lookup);
}

} // namespace ingest::config
