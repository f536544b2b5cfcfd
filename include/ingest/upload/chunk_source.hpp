/**
 * @file chunk_source.hpp
 * @brief Reads the parts of one local file that still need sending
 */

#pragma once

#include "ingest/core/result.hpp"
#include "ingest/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

namespace ingest::upload {

/// SHA-256 of zero bytes, the checksum of an empty file's single chunk.
inline constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

/// Lowercase hex SHA-256 of @p size bytes at @p data.
Result<Checksum> sha256_hex(const std::uint8_t* data, std::size_t size);

/**
 * @brief Lazily reads a file as a sequence of checksummed chunks
 *
 * Every pull seeks to index * chunk_size and reads at most chunk_size
 * bytes, so any subset of indices can be produced in any order. With no
 * selection the whole file is produced in order.
 *
 * The sequence ends when every selected index was produced or a read of a
 * non-empty file returns nothing. An empty file yields exactly one empty
 * chunk. After an IoFailure the source stays failed; open a new one.
 *
 * Usage:
 * ```cpp
 * auto source = ChunkSource::open(path, 5 * 1024 * 1024);
 * while (true) {
 *     auto chunk = source.value().next();
 *     if (chunk.is_error() || !chunk.value()) break;
 *     send(*chunk.value());
 * }
 * ```
 */
class ChunkSource {
public:
    static Result<ChunkSource> open(const std::filesystem::path& path,
                                    std::uint64_t chunk_size,
                                    std::optional<std::uint64_t> file_size = std::nullopt,
                                    std::optional<std::vector<std::uint64_t>> indices = std::nullopt);

    ChunkSource(ChunkSource&&) = default;
    ChunkSource& operator=(ChunkSource&&) = default;

    /// Next chunk, or an empty optional once the sequence is exhausted.
    Result<std::optional<FileChunk>> next();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t file_size() const noexcept { return file_size_; }

    /// Chunks still to be produced, assuming every read succeeds.
    [[nodiscard]] std::size_t remaining() const noexcept;

    /// max(1, ceil(file_size / chunk_size)).
    static std::uint64_t count_chunks(std::uint64_t file_size, std::uint64_t chunk_size);

    /// Random-access read of a single chunk.
    static Result<FileChunk> read_chunk(const std::filesystem::path& path,
                                        std::uint64_t index,
                                        std::uint64_t chunk_size,
                                        std::optional<std::uint64_t> file_size = std::nullopt);

private:
    ChunkSource(std::filesystem::path path, std::ifstream stream,
                std::uint64_t chunk_size, std::uint64_t file_size,
                std::vector<std::uint64_t> indices);

    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t chunk_size_;
    std::uint64_t file_size_;
    std::vector<std::uint64_t> indices_;
    std::size_t position_ = 0;
    bool exhausted_ = false;
    bool failed_ = false;
    std::vector<std::uint8_t> buffer_;
};

} // namespace ingest::upload
