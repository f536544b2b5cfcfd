#include "ingest/upload/types.hpp"

#include <algorithm>

namespace ingest::upload {

RemoteFile::RemoteFile(std::string name, std::uint64_t file_size,
                       std::optional<std::vector<std::string>> destination,
                       std::optional<UploadId> id)
    : file_name(std::move(name)),
      upload_id(id),
      size(file_size),
      file_path(std::move(destination)) {}

RemoteFile RemoteFile::with_chunk_size(std::optional<std::uint64_t> chunk_size) const {
    RemoteFile copy = *this;
    if (chunk_size && *chunk_size > 0) {
        copy.chunked_upload = ChunkedUploadProperties{*chunk_size, size / *chunk_size + 1};
    } else {
        copy.chunked_upload.reset();
    }
    return copy;
}

RemoteFile RemoteFile::with_multipart_upload_id(std::optional<MultipartUploadId> id) const {
    RemoteFile copy = *this;
    copy.multipart_upload_id = std::move(id);
    return copy;
}

std::uint64_t RemoteFile::effective_chunk_size(std::uint64_t fallback) const {
    if (chunked_upload && chunked_upload->chunk_size > 0) {
        return chunked_upload->chunk_size;
    }
    return fallback;
}

bool RemoteFile::operator==(const RemoteFile& other) const {
    return file_name == other.file_name &&
           upload_id == other.upload_id &&
           size == other.size &&
           chunked_upload == other.chunked_upload &&
           multipart_upload_id == other.multipart_upload_id &&
           file_path == other.file_path;
}

std::string PackagePreview::preview_path_string() const {
    std::string joined;
    if (!preview_path) {
        return joined;
    }
    for (const auto& segment : *preview_path) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += segment;
    }
    return joined;
}

const FileMissingParts* FilesMissingParts::find(const std::string& file_name) const {
    auto it = std::find_if(files.begin(), files.end(),
                           [&](const FileMissingParts& f) { return f.file_name == file_name; });
    return it == files.end() ? nullptr : &*it;
}

} // namespace ingest::upload
