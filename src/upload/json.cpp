#include "ingest/upload/json.hpp"

namespace ingest::upload {

namespace {

template<typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

} // namespace

void to_json(json& j, const ChunkedUploadProperties& p) {
    j = json{{"chunkSize", p.chunk_size}, {"totalChunks", p.total_chunks}};
}

void from_json(const json& j, ChunkedUploadProperties& p) {
    j.at("chunkSize").get_to(p.chunk_size);
    j.at("totalChunks").get_to(p.total_chunks);
}

void to_json(json& j, const RemoteFile& f) {
    j = json::object();
    j["fileName"] = f.file_name;
    put_optional(j, "uploadId", f.upload_id);
    j["size"] = f.size;
    put_optional(j, "chunkedUpload", f.chunked_upload);
    put_optional(j, "multipartUploadId", f.multipart_upload_id);
    put_optional(j, "filePath", f.file_path);
}

void from_json(const json& j, RemoteFile& f) {
    j.at("fileName").get_to(f.file_name);
    j.at("size").get_to(f.size);
    f.upload_id = optional_field<UploadId>(j, "uploadId");
    f.chunked_upload = optional_field<ChunkedUploadProperties>(j, "chunkedUpload");
    f.multipart_upload_id = optional_field<MultipartUploadId>(j, "multipartUploadId");
    f.file_path = optional_field<std::vector<std::string>>(j, "filePath");
}

void from_json(const json& j, PackagePreview& p) {
    j.at("packageName").get_to(p.package_name);
    p.package_type = optional_field<std::string>(j, "packageType");
    p.file_type = optional_field<std::string>(j, "fileType");
    j.at("importId").get_to(p.import_id);
    j.at("files").get_to(p.files);
    j.at("groupSize").get_to(p.group_size);
    p.preview_path = optional_field<std::vector<std::string>>(j, "previewPath");
}

void from_json(const json& j, UploadPreview& p) {
    j.at("packages").get_to(p.packages);
}

void from_json(const json& j, FileMissingParts& p) {
    j.at("fileName").get_to(p.file_name);
    j.at("missingParts").get_to(p.missing_parts);
    j.at("expectedTotalParts").get_to(p.expected_total_parts);
}

void from_json(const json& j, FilesMissingParts& p) {
    j.at("files").get_to(p.files);
}

void from_json(const json& j, ManifestEntry& m) {
    const auto& manifest = j.at("manifest");
    manifest.at("type").get_to(m.type);
    manifest.at("importId").get_to(m.import_id);
    manifest.at("content").at("files").get_to(m.files);
}

void from_json(const json& j, UploadResponse& r) {
    j.at("success").get_to(r.success);
    r.error = optional_field<std::string>(j, "error");
}

void from_json(const json& j, FileHash& h) {
    j.at("hash").get_to(h.hash);
}

json make_preview_request(const std::vector<RemoteFile>& files) {
    return json{{"files", files}};
}

Result<json> parse_body(const std::string& body) {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Ok(json(nullptr));
    }
    try {
        return Ok(json::parse(body));
    } catch (const json::parse_error& e) {
        return Err<json>(Error::parse_failure(std::string("Malformed JSON response: ") + e.what()));
    }
}

} // namespace ingest::upload
