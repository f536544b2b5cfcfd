#include "ingest/api/api_client.hpp"
#include "ingest/upload/json.hpp"

#include <spdlog/spdlog.h>

namespace ingest::api {

using network::HttpMethod;
using network::HttpMethodUtils;
using network::HttpRequest;
using network::HttpResponse;
using network::make_target;

namespace {

constexpr std::size_t kMaxErrorBodyInMessage = 512;

const char* bool_param(bool value) {
    return value ? "true" : "false";
}

std::string describe_failure(const HttpResponse& response) {
    std::string message = response.reason_phrase;
    std::string body = response.body_as_string();
    if (!body.empty()) {
        if (body.size() > kMaxErrorBodyInMessage) {
            body.resize(kMaxErrorBodyInMessage);
            body += "...";
        }
        message += message.empty() ? body : ": " + body;
    }
    return message;
}

} // namespace

ApiClient::ApiClient(network::HttpTransport& transport, RetryPolicy policy)
    : transport_(transport),
      policy_(std::move(policy)) {}

Result<upload::UploadPreview> ApiClient::preview_upload(const RequestContext& ctx,
                                                        const std::string& dataset_id,
                                                        const std::vector<upload::RemoteFile>& files,
                                                        bool append) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.target = make_target("/upload/preview/organizations/" + ctx.organization_id,
                                 {{"append", bool_param(append)}, {"dataset_id", dataset_id}});
    request.set_header("Content-Type", "application/json");
    request.set_body(upload::make_preview_request(files).dump());

    auto response = execute(ctx, std::move(request), true);
    if (response.is_error()) {
        return Err<upload::UploadPreview>(response.error());
    }
    return upload::decode<upload::UploadPreview>(response.value().body_as_string());
}

Result<upload::UploadResponse> ApiClient::upload_chunk(const RequestContext& ctx,
                                                       const upload::ImportId& import_id,
                                                       const std::string& file_name,
                                                       const upload::MultipartUploadId& multipart_id,
                                                       const upload::FileChunk& chunk) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.target = make_target(
        "/upload/chunk/organizations/" + ctx.organization_id + "/id/" + import_id,
        {{"filename", file_name},
         {"multipartId", multipart_id},
         {"chunkChecksum", chunk.checksum},
         {"chunkNumber", std::to_string(chunk.index)}});
    request.set_header("Content-Type", "application/octet-stream");
    request.body = chunk.bytes;

    auto response = execute(ctx, std::move(request), false);
    if (response.is_error()) {
        return Err<upload::UploadResponse>(response.error());
    }
    return upload::decode<upload::UploadResponse>(response.value().body_as_string());
}

Result<std::optional<upload::FilesMissingParts>> ApiClient::get_upload_status(
    const RequestContext& ctx, const upload::ImportId& import_id) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.target = "/upload/status/organizations/" + ctx.organization_id + "/id/" + import_id;

    auto response = execute(ctx, std::move(request), true);
    if (response.is_error()) {
        return Err<std::optional<upload::FilesMissingParts>>(response.error());
    }
    return upload::decode_optional<upload::FilesMissingParts>(response.value().body_as_string());
}

Result<upload::Manifests> ApiClient::complete_upload(const RequestContext& ctx,
                                                     const upload::ImportId& import_id,
                                                     const std::string& dataset_id,
                                                     const std::optional<std::string>& destination_id,
                                                     bool append) {
    network::QueryParams params{{"datasetId", dataset_id}, {"append", bool_param(append)}};
    if (destination_id) {
        params.emplace_back("destinationId", *destination_id);
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.target = make_target(
        "/upload/complete/organizations/" + ctx.organization_id + "/id/" + import_id, params);

    auto response = execute(ctx, std::move(request), true);
    if (response.is_error()) {
        return Err<upload::Manifests>(response.error());
    }
    return upload::decode<upload::Manifests>(response.value().body_as_string());
}

Result<upload::FileHash> ApiClient::get_upload_hash(const RequestContext& ctx,
                                                    const upload::ImportId& import_id,
                                                    const std::string& file_name) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.target = make_target("/upload/hash/id/" + import_id, {{"fileName", file_name}});

    auto response = execute(ctx, std::move(request), true);
    if (response.is_error()) {
        return Err<upload::FileHash>(response.error());
    }
    return upload::decode<upload::FileHash>(response.value().body_as_string());
}

Result<HttpResponse> ApiClient::execute(const RequestContext& ctx,
                                        HttpRequest request,
                                        bool allow_retry) {
    if (!ctx.session_token.empty()) {
        request.set_header("X-SESSION-ID", ctx.session_token);
        request.set_header("Authorization", "Bearer " + ctx.session_token);
    }
    request.set_header("Accept", "application/json");

    std::size_t attempt = 0;
    while (true) {
        auto result = exchange_once(request);
        if (result.is_ok()) {
            return result;
        }

        const Error& error = result.error();
        if (!allow_retry || !RetryPolicy::is_retryable(error, request.method)) {
            return result;
        }
        if (attempt >= policy_.max_retries) {
            spdlog::debug("{} {} giving up after {} retries: {}",
                          HttpMethodUtils::to_string(request.method), request.target,
                          attempt, error.describe());
            return result;
        }

        ++attempt;
        spdlog::debug("{} {} failed ({}), retrying",
                      HttpMethodUtils::to_string(request.method), request.target, error.describe());
        policy_.wait(attempt);
    }
}

Result<HttpResponse> ApiClient::exchange_once(const HttpRequest& request) {
    auto response = transport_.send(request);
    if (response.is_error()) {
        return response;
    }
    if (response.value().is_error()) {
        return Err<HttpResponse>(Error::api_error(response.value().status_code,
                                                  describe_failure(response.value())));
    }
    return response;
}

} // namespace ingest::api
