/**
 * @file part_sender.hpp
 * @brief Uploads a single chunk and records it against its file's progress
 */

#pragma once

#include "ingest/api/api_client.hpp"
#include "ingest/core/result.hpp"
#include "ingest/upload/progress.hpp"
#include "ingest/upload/types.hpp"

#include <optional>
#include <string>

namespace ingest::upload {

/**
 * @brief Where one file's parts go
 */
struct PartDestination {
    ImportId import_id;
    std::string file_name;
    std::optional<MultipartUploadId> multipart_upload_id;
};

/**
 * @brief Sends single chunks and reports each accepted one
 *
 * Stateless apart from its collaborators; safe to share between dispatcher
 * workers as long as the ApiClient's transport is.
 */
class PartSender {
public:
    PartSender(api::ApiClient& client, api::RequestContext context, ProgressCallback& progress);

    /**
     * @brief Send @p chunk once
     *
     * On acceptance the part is recorded in @p tracker and exactly one
     * progress update is emitted. A rejection is UploadRejected with the
     * service's reason; transport and API errors are returned untouched.
     */
    Result<void> send(const FileChunk& chunk, const PartDestination& destination, FileProgress& tracker);

private:
    api::ApiClient& client_;
    api::RequestContext context_;
    ProgressCallback& progress_;
};

} // namespace ingest::upload
