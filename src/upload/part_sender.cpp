#include "ingest/upload/part_sender.hpp"

#include <spdlog/spdlog.h>

namespace ingest::upload {

PartSender::PartSender(api::ApiClient& client, api::RequestContext context, ProgressCallback& progress)
    : client_(client),
      context_(std::move(context)),
      progress_(progress) {}

Result<void> PartSender::send(const FileChunk& chunk, const PartDestination& destination, FileProgress& tracker) {
    if (!destination.multipart_upload_id) {
        return Err<void>(Error::upload_rejected("no multipartId was provided for file: " + destination.file_name));
    }

    auto response = client_.upload_chunk(context_, destination.import_id, destination.file_name,
                                         *destination.multipart_upload_id, chunk);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!response.value().success) {
        return Err<void>(Error::upload_rejected(
            response.value().error.value_or("no error message supplied")));
    }

    spdlog::debug("{}: chunk {} accepted ({} bytes)", destination.file_name, chunk.index, chunk.bytes.size());
    progress_.on_update(tracker.record_part(chunk.bytes.size()));
    return Ok();
}

} // namespace ingest::upload
