#include "ingest/upload/chunk_source.hpp"
#include "../support/temp_dir.hpp"

#include <gtest/gtest.h>

using ingest::ErrorKind;
using ingest::upload::ChunkSource;
using ingest::upload::FileChunk;
using ingest::upload::kEmptySha256;
using ingest::upload::sha256_hex;
using ingest::testing::TempDir;
using ingest::testing::make_bytes;

namespace {

std::vector<FileChunk> drain(ChunkSource& source) {
    std::vector<FileChunk> chunks;
    while (true) {
        auto chunk = source.next();
        EXPECT_TRUE(chunk.is_ok());
        if (chunk.is_error() || !chunk.value()) {
            break;
        }
        chunks.push_back(std::move(*chunk.value()));
    }
    return chunks;
}

} // namespace

TEST(ChunkSourceTest, KnownDigests) {
    const std::string abc = "abc";
    auto digest = sha256_hex(reinterpret_cast<const std::uint8_t*>(abc.data()), abc.size());
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = sha256_hex(nullptr, 0);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value(), kEmptySha256);
}

TEST(ChunkSourceTest, CountChunks) {
    EXPECT_EQ(ChunkSource::count_chunks(0, 4), 1u);
    EXPECT_EQ(ChunkSource::count_chunks(1, 4), 1u);
    EXPECT_EQ(ChunkSource::count_chunks(4, 4), 1u);
    EXPECT_EQ(ChunkSource::count_chunks(5, 4), 2u);
    EXPECT_EQ(ChunkSource::count_chunks(10, 4), 3u);
}

TEST(ChunkSourceTest, ConcatenatedChunksReproduceFile) {
    TempDir dir;
    const auto content = make_bytes(1000);
    const auto path = dir.write("data.bin", content);

    auto source = ChunkSource::open(path, 64);
    ASSERT_TRUE(source.is_ok());
    EXPECT_EQ(source.value().remaining(), 16u);

    const auto chunks = drain(source.value());
    ASSERT_EQ(chunks.size(), 16u);

    std::vector<std::uint8_t> joined;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_LE(chunks[i].bytes.size(), 64u);
        auto digest = sha256_hex(chunks[i].bytes.data(), chunks[i].bytes.size());
        EXPECT_EQ(chunks[i].checksum, digest.value());
        joined.insert(joined.end(), chunks[i].bytes.begin(), chunks[i].bytes.end());
    }
    EXPECT_EQ(chunks.back().bytes.size(), 1000u - 15 * 64);
    EXPECT_EQ(joined, content);
    EXPECT_EQ(source.value().remaining(), 0u);
}

TEST(ChunkSourceTest, EmptyFileYieldsOneEmptyChunk) {
    TempDir dir;
    const auto path = dir.write("empty.bin", std::string());

    auto source = ChunkSource::open(path, 64);
    ASSERT_TRUE(source.is_ok());

    const auto chunks = drain(source.value());
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_TRUE(chunks[0].bytes.empty());
    EXPECT_EQ(chunks[0].checksum, kEmptySha256);
}

TEST(ChunkSourceTest, SelectedIndicesOnly) {
    TempDir dir;
    const auto content = make_bytes(40);
    const auto path = dir.write("data.bin", content);

    auto source = ChunkSource::open(path, 4, std::nullopt, std::vector<std::uint64_t>{3, 4, 5, 7});
    ASSERT_TRUE(source.is_ok());

    const auto chunks = drain(source.value());
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].index, 3u);
    EXPECT_EQ(chunks[3].index, 7u);
    EXPECT_EQ(chunks[3].bytes, std::vector<std::uint8_t>(content.begin() + 28, content.begin() + 32));
}

TEST(ChunkSourceTest, StopsWhenReadReturnsNothing) {
    // The service reports floor(size / chunk) + 1 parts, one past the end
    // for an exact multiple.
    TempDir dir;
    const auto path = dir.write("data.bin", make_bytes(8));

    auto source = ChunkSource::open(path, 4, std::nullopt, std::vector<std::uint64_t>{0, 1, 2});
    ASSERT_TRUE(source.is_ok());
    EXPECT_EQ(drain(source.value()).size(), 2u);
}

TEST(ChunkSourceTest, ReadChunk) {
    TempDir dir;
    const auto content = make_bytes(10);
    const auto path = dir.write("data.bin", content);

    auto chunk = ChunkSource::read_chunk(path, 2, 4);
    ASSERT_TRUE(chunk.is_ok());
    EXPECT_EQ(chunk.value().index, 2u);
    EXPECT_EQ(chunk.value().bytes, std::vector<std::uint8_t>(content.begin() + 8, content.end()));

    auto beyond = ChunkSource::read_chunk(path, 5, 4);
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(beyond.error().kind, ErrorKind::IoFailure);
}

TEST(ChunkSourceTest, MissingFileIsIoFailure) {
    TempDir dir;
    auto source = ChunkSource::open(dir.path() / "absent.bin", 4);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().kind, ErrorKind::IoFailure);
}

TEST(ChunkSourceTest, ZeroChunkSizeIsRejected) {
    TempDir dir;
    const auto path = dir.write("data.bin", make_bytes(4));
    auto source = ChunkSource::open(path, 0);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().kind, ErrorKind::InvalidArgument);
}
