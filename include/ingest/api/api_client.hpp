/**
 * @file api_client.hpp
 * @brief Typed calls to the upload service endpoints
 *
 * Every call goes through the same retry loop; responses are decoded
 * with the bindings in upload/json.hpp.
 */

#pragma once

#include "ingest/api/retry_policy.hpp"
#include "ingest/core/result.hpp"
#include "ingest/network/http_transport.hpp"
#include "ingest/upload/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ingest::api {

/**
 * @brief Per-call identity; there is no shared mutable session handle
 */
struct RequestContext {
    std::string session_token;
    std::string organization_id;
};

/**
 * @brief Typed client for the ingestion service's upload routes
 *
 * Every call except upload_chunk goes through the per-request retry loop
 * (RetryPolicy::is_retryable). Chunk sends are attempted once; their
 * failures are handled by the transfer coordinator, which re-reads the
 * server's missing-parts state before resending anything.
 *
 * Non-2xx responses become ApiError carrying the status code.
 */
class ApiClient {
public:
    ApiClient(network::HttpTransport& transport, RetryPolicy policy = {});

    Result<upload::UploadPreview> preview_upload(const RequestContext& ctx,
                                                 const std::string& dataset_id,
                                                 const std::vector<upload::RemoteFile>& files,
                                                 bool append);

    Result<upload::UploadResponse> upload_chunk(const RequestContext& ctx,
                                                const upload::ImportId& import_id,
                                                const std::string& file_name,
                                                const upload::MultipartUploadId& multipart_id,
                                                const upload::FileChunk& chunk);

    /// Empty optional when the service has no record of the import yet.
    Result<std::optional<upload::FilesMissingParts>> get_upload_status(const RequestContext& ctx,
                                                                       const upload::ImportId& import_id);

    Result<upload::Manifests> complete_upload(const RequestContext& ctx,
                                              const upload::ImportId& import_id,
                                              const std::string& dataset_id,
                                              const std::optional<std::string>& destination_id,
                                              bool append);

    Result<upload::FileHash> get_upload_hash(const RequestContext& ctx,
                                             const upload::ImportId& import_id,
                                             const std::string& file_name);

    const RetryPolicy& retry_policy() const noexcept { return policy_; }

private:
    Result<network::HttpResponse> execute(const RequestContext& ctx,
                                          network::HttpRequest request,
                                          bool allow_retry);

    Result<network::HttpResponse> exchange_once(const network::HttpRequest& request);

    network::HttpTransport& transport_;
    RetryPolicy policy_;
};

} // namespace ingest::api
