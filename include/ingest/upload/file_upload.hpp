/**
 * @file file_upload.hpp
 * @brief Local files selected for upload and their pairing with previewed remote files
 */

#pragma once

#include "ingest/core/result.hpp"
#include "ingest/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ingest::upload {

/**
 * @brief One local file selected for upload
 *
 * Flat uploads land at the root of the destination. Recursive uploads
 * carry a base directory and a path relative to that directory's parent,
 * so "run1/raw/a.bin" under base "/data/run1" is stored in folders
 * ["run1", "raw"].
 *
 * Both factories check that the file exists and is a regular file, and
 * recursive() rejects relative paths that escape the base directory.
 */
class FileUpload {
public:
    enum class Kind {
        Flat,
        Recursive
    };

    /// A relative @p path is canonicalised against the working directory.
    static Result<FileUpload> flat(UploadId id, const std::filesystem::path& path);

    static Result<FileUpload> recursive(UploadId id,
                                        const std::filesystem::path& base_directory,
                                        const std::filesystem::path& relative_path);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] UploadId id() const noexcept { return id_; }

    [[nodiscard]] std::filesystem::path absolute_path() const;
    [[nodiscard]] std::string file_name() const;
    Result<std::uint64_t> file_size() const;

    /// Folders between the base and the file; empty optional for the root.
    [[nodiscard]] std::optional<std::vector<std::string>> destination_path() const;

    Result<RemoteFile> to_remote_file() const;

private:
    FileUpload(Kind kind, UploadId id, std::filesystem::path base, std::filesystem::path relative);

    Kind kind_;
    UploadId id_;
    std::filesystem::path base_;      // Flat: unused
    std::filesystem::path relative_;  // Flat: the absolute file path
};

/**
 * @brief Build upload descriptors for a preview request
 *
 * With @p is_directory_upload every path is taken relative to the parent
 * of @p base (which is then required). Otherwise paths are joined onto
 * @p base when one is given, or used as they are.
 */
Result<std::vector<FileUpload>> collect_uploads(
    const std::optional<std::filesystem::path>& base,
    const std::vector<std::pair<UploadId, std::filesystem::path>>& files,
    bool is_directory_upload);

/**
 * @brief A previewed remote file paired with where its bytes live locally
 */
struct TransferFile {
    RemoteFile remote;
    std::filesystem::path local_path;
};

/**
 * @brief Match the files of a preview package back to local uploads
 *
 * Entries are matched on upload id, falling back to the file name when the
 * service omitted it. Unmatched entries are an InvalidArgument.
 */
Result<std::vector<TransferFile>> attach_local_paths(const std::vector<RemoteFile>& previewed,
                                                     const std::vector<FileUpload>& uploads);

} // namespace ingest::upload
