/**
 * @file json.hpp
 * @brief nlohmann::json bindings for the upload types
 *
 * EXAMPLE:
 * auto report = decode_optional<FilesMissingParts>(response.body);
 * if (report.is_error()) { ... }  // ParseFailure
 */

#pragma once

#include "ingest/core/result.hpp"
#include "ingest/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ingest::upload {

using json = nlohmann::json;

// Unknown job types read as Upload
NLOHMANN_JSON_SERIALIZE_ENUM(ManifestJobType, {
    {ManifestJobType::Upload, "upload"},
    {ManifestJobType::Append, "append"},
    {ManifestJobType::Workflow, "workflow"},
})

// camelCase wire codecs, picked up by nlohmann through ADL
void to_json(json& j, const ChunkedUploadProperties& p);
void from_json(const json& j, ChunkedUploadProperties& p);

void to_json(json& j, const RemoteFile& f);
void from_json(const json& j, RemoteFile& f);

void from_json(const json& j, PackagePreview& p);
void from_json(const json& j, UploadPreview& p);
void from_json(const json& j, FileMissingParts& p);
void from_json(const json& j, FilesMissingParts& p);
void from_json(const json& j, ManifestEntry& m);
void from_json(const json& j, UploadResponse& r);
void from_json(const json& j, FileHash& h);

/// Body of the preview request: {"files": [...]}.
json make_preview_request(const std::vector<RemoteFile>& files);

/**
 * @brief Parse a response body, mapping any json error to ParseFailure
 *
 * An empty body is read as JSON null.
 */
Result<json> parse_body(const std::string& body);

template<typename T>
Result<T> decode(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_error()) {
        return Err<T>(parsed.error());
    }
    try {
        return Ok(parsed.value().get<T>());
    } catch (const json::exception& e) {
        return Err<T>(Error::parse_failure(std::string("Unexpected response shape: ") + e.what()));
    }
}

/// Like decode, but a JSON null yields an empty optional.
template<typename T>
Result<std::optional<T>> decode_optional(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_error()) {
        return Err<std::optional<T>>(parsed.error());
    }
    if (parsed.value().is_null()) {
        return Ok(std::optional<T>{});
    }
    try {
        return Ok(std::optional<T>{parsed.value().get<T>()});
    } catch (const json::exception& e) {
        return Err<std::optional<T>>(Error::parse_failure(std::string("Unexpected response shape: ") + e.what()));
    }
}

} // namespace ingest::upload
