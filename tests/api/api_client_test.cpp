#include "ingest/api/api_client.hpp"
#include "../support/fake_ingest_server.hpp"

#include <gtest/gtest.h>

#include <chrono>

using ingest::ErrorKind;
using ingest::api::ApiClient;
using ingest::api::RequestContext;
using ingest::api::RetryPolicy;
using ingest::testing::Fault;
using ingest::testing::FakeIngestServer;
using ingest::testing::RecordingSleeper;
using ingest::testing::Route;
using ingest::upload::FileChunk;
using ingest::upload::RemoteFile;
using namespace std::chrono_literals;

namespace {

class ApiClientTest : public ::testing::Test {
protected:
    ApiClientTest() : client_(server_, make_policy()) {}

    RetryPolicy make_policy() {
        RetryPolicy policy;
        policy.max_retries = 5;
        policy.base_delay = 100ms;
        policy.sleeper = sleeper_.sleeper();
        return policy;
    }

    FakeIngestServer server_;
    RecordingSleeper sleeper_;
    ApiClient client_;
    RequestContext ctx_{"session-token", "N:organization:1"};
};

} // namespace

TEST_F(ApiClientTest, SendsSessionHeaders) {
    ASSERT_TRUE(client_.get_upload_status(ctx_, "import-1").is_ok());

    const auto requests = server_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].get_header("X-SESSION-ID"), "session-token");
    EXPECT_EQ(requests[0].get_header("Authorization"), "Bearer session-token");
    EXPECT_EQ(requests[0].target, "/upload/status/organizations/N:organization:1/id/import-1");
}

TEST_F(ApiClientTest, NullStatusMeansNoReport) {
    auto status = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(status.is_ok());
    EXPECT_FALSE(status.value().has_value());

    server_.set_status_body("");
    auto empty = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_FALSE(empty.value().has_value());
}

TEST_F(ApiClientTest, ParsesMissingPartsReport) {
    server_.set_status_body(R"({"files":[{"fileName":"a.bin","missingParts":[7,3],"expectedTotalParts":8}]})");

    auto status = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(status.is_ok());
    ASSERT_TRUE(status.value().has_value());
    const auto* entry = status.value()->find("a.bin");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->missing_parts, (std::vector<std::uint64_t>{7, 3}));
    EXPECT_EQ(entry->expected_total_parts, 8u);
}

TEST_F(ApiClientTest, RetriesRateLimitWithIncreasingDelays) {
    server_.inject(Route::Status, Fault{429}, 3);

    auto status = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(server_.request_count(Route::Status), 4u);
    EXPECT_EQ(sleeper_.delays(), (std::vector<std::chrono::milliseconds>{100ms, 200ms, 300ms}));
}

TEST_F(ApiClientTest, ForbiddenIsNotRetried) {
    server_.inject(Route::Status, Fault{403, false, "forbidden"});

    auto status = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::ApiError);
    EXPECT_EQ(status.error().status_code, 403);
    EXPECT_EQ(server_.request_count(Route::Status), 1u);
    EXPECT_TRUE(sleeper_.delays().empty());
}

TEST_F(ApiClientTest, GatewayErrorRetriedForGetButNotPost) {
    server_.inject(Route::Status, Fault{502});
    EXPECT_TRUE(client_.get_upload_status(ctx_, "import-1").is_ok());
    EXPECT_EQ(server_.request_count(Route::Status), 2u);

    server_.inject(Route::Complete, Fault{502});
    auto completed = client_.complete_upload(ctx_, "import-1", "N:dataset:1", std::nullopt, false);
    ASSERT_TRUE(completed.is_error());
    EXPECT_EQ(completed.error().status_code, 502);
    EXPECT_EQ(server_.request_count(Route::Complete), 1u);
}

TEST_F(ApiClientTest, NetworkFailureRetriedForIdempotentOnly) {
    server_.inject(Route::Hash, Fault{0, true});
    auto hash = client_.get_upload_hash(ctx_, "import-1", "a.bin");
    ASSERT_TRUE(hash.is_ok());
    EXPECT_EQ(hash.value().hash, "fake-hash-a.bin");

    server_.inject(Route::Complete, Fault{0, true});
    auto completed = client_.complete_upload(ctx_, "import-1", "N:dataset:1", std::nullopt, false);
    ASSERT_TRUE(completed.is_error());
    EXPECT_EQ(completed.error().kind, ErrorKind::NetworkFailure);
}

TEST_F(ApiClientTest, CeilingSurfacesLastError) {
    server_.inject(Route::Status, Fault{503}, 10);

    auto status = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::ApiError);
    EXPECT_EQ(status.error().status_code, 503);
    EXPECT_EQ(server_.request_count(Route::Status), 6u);
    EXPECT_EQ(sleeper_.delays().size(), 5u);
}

TEST_F(ApiClientTest, ChunkUploadIsNeverRetried) {
    server_.inject(Route::Chunk, Fault{429});

    FileChunk chunk;
    chunk.index = 2;
    chunk.bytes = {1, 2, 3};
    chunk.checksum = "abc123";

    auto response = client_.upload_chunk(ctx_, "import-1", "a b.bin", "mp-1", chunk);
    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().status_code, 429);
    EXPECT_EQ(server_.request_count(Route::Chunk), 1u);

    auto accepted = client_.upload_chunk(ctx_, "import-1", "a b.bin", "mp-1", chunk);
    ASSERT_TRUE(accepted.is_ok());
    EXPECT_TRUE(accepted.value().success);

    const auto chunks = server_.chunks();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].file_name, "a b.bin");
    EXPECT_EQ(chunks[0].multipart_id, "mp-1");
    EXPECT_EQ(chunks[0].chunk_number, 2u);
    EXPECT_EQ(chunks[0].checksum, "abc123");
    EXPECT_EQ(chunks[0].bytes, (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST_F(ApiClientTest, PreviewSendsFilesAndParsesPackages) {
    server_.set_preview_chunk_size(1024);
    std::vector<RemoteFile> files{RemoteFile("a.bin", 3000, std::vector<std::string>{"run1"}, 7)};

    auto preview = client_.preview_upload(ctx_, "N:dataset:1", files, true);
    ASSERT_TRUE(preview.is_ok());
    ASSERT_EQ(preview.value().packages.size(), 1u);

    const auto& package = preview.value().packages[0];
    EXPECT_EQ(package.package_name, "a.bin");
    EXPECT_EQ(package.import_id, "import-0");
    ASSERT_EQ(package.files.size(), 1u);
    EXPECT_EQ(package.files[0].upload_id, std::optional<std::uint64_t>(7));
    ASSERT_TRUE(package.files[0].chunked_upload.has_value());
    EXPECT_EQ(package.files[0].chunked_upload->chunk_size, 1024u);
    EXPECT_EQ(package.files[0].multipart_upload_id, std::optional<std::string>("multipart-0"));
    EXPECT_EQ(package.preview_path_string(), "run1");

    const auto requests = server_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_NE(requests[0].target.find("append=true"), std::string::npos);
    EXPECT_NE(requests[0].target.find("dataset_id=N%3Adataset%3A1"), std::string::npos);
}

TEST_F(ApiClientTest, CompleteParsesManifest) {
    server_.set_complete_body(R"([{"manifest":{"type":"upload","importId":"import-1",
                                  "content":{"files":["org/a.bin"]}}}])");

    auto manifests = client_.complete_upload(ctx_, "import-1", "N:dataset:1", std::string("N:collection:9"), false);
    ASSERT_TRUE(manifests.is_ok());
    ASSERT_EQ(manifests.value().size(), 1u);
    EXPECT_EQ(manifests.value()[0].import_id, "import-1");
    EXPECT_EQ(manifests.value()[0].files, (std::vector<std::string>{"org/a.bin"}));

    const auto requests = server_.requests();
    EXPECT_NE(requests.back().target.find("destinationId=N%3Acollection%3A9"), std::string::npos);
}

TEST_F(ApiClientTest, MalformedBodyIsParseFailure) {
    server_.set_status_body("{\"files\": 12}");
    auto status = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().kind, ErrorKind::ParseFailure);

    server_.set_status_body("<html>");
    auto garbage = client_.get_upload_status(ctx_, "import-1");
    ASSERT_TRUE(garbage.is_error());
    EXPECT_EQ(garbage.error().kind, ErrorKind::ParseFailure);
}
