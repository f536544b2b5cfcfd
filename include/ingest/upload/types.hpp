/**
 * @file types.hpp
 * @brief Value types exchanged with the upload service
 *
 * Identifiers, previewed files with their chunking parameters, missing-part
 * reports and completion manifests. Wire encoding lives in json.hpp.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ingest::upload {

using ImportId = std::string;            ///< Server-issued id grouping files into one import
using UploadId = std::uint64_t;          ///< Caller-chosen id correlating preview entries
using MultipartUploadId = std::string;   ///< Storage multipart session for one file
using Checksum = std::string;            ///< Lowercase hex SHA-256

/**
 * @brief Chunking directive the server attaches to a previewed file
 */
struct ChunkedUploadProperties {
    std::uint64_t chunk_size = 0;
    std::uint64_t total_chunks = 0;

    bool operator==(const ChunkedUploadProperties& other) const {
        return chunk_size == other.chunk_size && total_chunks == other.total_chunks;
    }
};

/**
 * @brief A file as the ingestion service sees it
 *
 * Built locally from a FileUpload, sent with the preview request and
 * returned with chunking and multipart parameters filled in. Treated as
 * immutable once a transfer starts; the with_* helpers return copies.
 */
struct RemoteFile {
    std::string file_name;
    std::optional<UploadId> upload_id;
    std::uint64_t size = 0;
    std::optional<ChunkedUploadProperties> chunked_upload;
    std::optional<MultipartUploadId> multipart_upload_id;
    std::optional<std::vector<std::string>> file_path;  ///< Destination folders, root when absent

    RemoteFile() = default;
    RemoteFile(std::string name, std::uint64_t file_size,
               std::optional<std::vector<std::string>> destination = std::nullopt,
               std::optional<UploadId> id = std::nullopt);

    /// total_chunks is floor(size / chunk_size) + 1, matching the service.
    [[nodiscard]] RemoteFile with_chunk_size(std::optional<std::uint64_t> chunk_size) const;
    [[nodiscard]] RemoteFile with_multipart_upload_id(std::optional<MultipartUploadId> id) const;

    /// Server chunk size when present, @p fallback otherwise.
    [[nodiscard]] std::uint64_t effective_chunk_size(std::uint64_t fallback) const;

    bool operator==(const RemoteFile& other) const;
};

/**
 * @brief One contiguous byte range of a local file
 *
 * `index` is 0-based; the range starts at index * chunk_size.
 */
struct FileChunk {
    std::uint64_t index = 0;
    std::vector<std::uint8_t> bytes;
    Checksum checksum;
};

struct PackagePreview {
    std::string package_name;
    std::optional<std::string> package_type;
    std::optional<std::string> file_type;
    ImportId import_id;
    std::vector<RemoteFile> files;
    std::int64_t group_size = 0;
    std::optional<std::vector<std::string>> preview_path;

    /// Destination folders joined with '/', empty when absent.
    [[nodiscard]] std::string preview_path_string() const;
};

struct UploadPreview {
    std::vector<PackagePreview> packages;
};

/**
 * @brief Server's view of what it still needs for one file
 *
 * Indices are 0-based and may arrive in any order.
 */
struct FileMissingParts {
    std::string file_name;
    std::vector<std::uint64_t> missing_parts;
    std::uint64_t expected_total_parts = 0;
};

struct FilesMissingParts {
    std::vector<FileMissingParts> files;

    [[nodiscard]] const FileMissingParts* find(const std::string& file_name) const;
};

enum class ManifestJobType {
    Upload,
    Append,
    Workflow
};

struct ManifestEntry {
    ManifestJobType type = ManifestJobType::Upload;
    ImportId import_id;
    std::vector<std::string> files;  ///< Keys relative to the storage bucket
};

using Manifests = std::vector<ManifestEntry>;

struct UploadResponse {
    bool success = false;
    std::optional<std::string> error;
};

struct FileHash {
    std::string hash;
};

} // namespace ingest::upload
