#include "ingest/upload/file_upload.hpp"

#include <algorithm>
#include <system_error>

namespace ingest::upload {
namespace fs = std::filesystem;

namespace {

bool is_within(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (candidate_it == candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

} // namespace

FileUpload::FileUpload(Kind kind, UploadId id, fs::path base, fs::path relative)
    : kind_(kind),
      id_(id),
      base_(std::move(base)),
      relative_(std::move(relative)) {}

Result<FileUpload> FileUpload::flat(UploadId id, const fs::path& path) {
    fs::path absolute = path;
    if (!path.is_absolute()) {
        std::error_code ec;
        absolute = fs::canonical(path, ec);
        if (ec) {
            return Err<FileUpload>(Error::invalid_argument("Path does not exist: " + path.string()));
        }
    }

    std::error_code ec;
    if (!fs::exists(absolute, ec)) {
        return Err<FileUpload>(Error::invalid_argument("Path does not exist: " + absolute.string()));
    }
    if (!fs::is_regular_file(absolute, ec)) {
        return Err<FileUpload>(Error::invalid_argument("Path is not a file: " + absolute.string()));
    }

    return Ok(FileUpload(Kind::Flat, id, {}, absolute));
}

Result<FileUpload> FileUpload::recursive(UploadId id,
                                         const fs::path& base_directory,
                                         const fs::path& relative_path) {
    std::error_code ec;
    const fs::path base = fs::canonical(base_directory, ec);
    if (ec) {
        return Err<FileUpload>(Error::invalid_argument("Path does not exist: " + base_directory.string()));
    }
    if (!fs::is_directory(base, ec)) {
        return Err<FileUpload>(Error::invalid_argument("Path is not a directory: " + base.string()));
    }

    // Files are stored under a collection named after the base directory,
    // so paths are taken relative to its parent.
    const fs::path base_parent = base.parent_path();
    if (base_parent.empty() || base_parent == base) {
        return Err<FileUpload>(Error::invalid_argument("Base directory has no parent: " + base.string()));
    }

    if (relative_path.is_absolute()) {
        return Err<FileUpload>(Error::invalid_argument("Expected a relative path: " + relative_path.string()));
    }

    const fs::path full = (base_parent / relative_path).lexically_normal();
    if (!is_within(base, full) || full == base) {
        return Err<FileUpload>(Error::invalid_argument(
            "Path escapes the base directory: " + relative_path.string()));
    }
    if (!fs::is_regular_file(full, ec)) {
        return Err<FileUpload>(Error::invalid_argument("Path is not a file: " + full.string()));
    }

    return Ok(FileUpload(Kind::Recursive, id, base_parent, full.lexically_relative(base_parent)));
}

fs::path FileUpload::absolute_path() const {
    return kind_ == Kind::Recursive ? base_ / relative_ : relative_;
}

std::string FileUpload::file_name() const {
    return absolute_path().filename().string();
}

Result<std::uint64_t> FileUpload::file_size() const {
    std::error_code ec;
    const auto size = fs::file_size(absolute_path(), ec);
    if (ec) {
        return Err<std::uint64_t>(Error::io_failure("Cannot stat " + absolute_path().string() + ": " + ec.message()));
    }
    return Ok(static_cast<std::uint64_t>(size));
}

std::optional<std::vector<std::string>> FileUpload::destination_path() const {
    if (kind_ != Kind::Recursive) {
        return std::nullopt;
    }

    std::vector<std::string> folders;
    for (const auto& segment : relative_.parent_path()) {
        if (!segment.empty()) {
            folders.push_back(segment.string());
        }
    }
    if (folders.empty()) {
        return std::nullopt;
    }
    return folders;
}

Result<RemoteFile> FileUpload::to_remote_file() const {
    auto size = file_size();
    if (size.is_error()) {
        return Err<RemoteFile>(size.error());
    }
    return Ok(RemoteFile(file_name(), size.value(), destination_path(), id_));
}

Result<std::vector<FileUpload>> collect_uploads(
    const std::optional<fs::path>& base,
    const std::vector<std::pair<UploadId, fs::path>>& files,
    bool is_directory_upload) {
    if (is_directory_upload && !base) {
        return Err<std::vector<FileUpload>>(
            Error::invalid_argument("A base path is required for a directory upload"));
    }

    std::vector<FileUpload> uploads;
    uploads.reserve(files.size());
    for (const auto& [id, path] : files) {
        auto upload = is_directory_upload ? FileUpload::recursive(id, *base, path)
                      : base              ? FileUpload::flat(id, *base / path)
                                          : FileUpload::flat(id, path);
        if (upload.is_error()) {
            return Err<std::vector<FileUpload>>(upload.error());
        }
        uploads.push_back(std::move(upload.value()));
    }
    return Ok(std::move(uploads));
}

Result<std::vector<TransferFile>> attach_local_paths(const std::vector<RemoteFile>& previewed,
                                                     const std::vector<FileUpload>& uploads) {
    std::vector<TransferFile> matched;
    matched.reserve(previewed.size());

    for (const auto& remote : previewed) {
        auto it = uploads.end();
        if (remote.upload_id) {
            it = std::find_if(uploads.begin(), uploads.end(),
                              [&](const FileUpload& u) { return u.id() == *remote.upload_id; });
        }
        if (it == uploads.end()) {
            it = std::find_if(uploads.begin(), uploads.end(),
                              [&](const FileUpload& u) { return u.file_name() == remote.file_name; });
        }
        if (it == uploads.end()) {
            return Err<std::vector<TransferFile>>(Error::invalid_argument(
                "Previewed file has no local counterpart: " + remote.file_name));
        }
        matched.push_back(TransferFile{remote, it->absolute_path()});
    }
    return Ok(std::move(matched));
}

} // namespace ingest::upload
