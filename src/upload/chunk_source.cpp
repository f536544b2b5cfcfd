#include "ingest/upload/chunk_source.hpp"

#include <openssl/evp.h>

#include <memory>
#include <numeric>
#include <system_error>

namespace ingest::upload {
namespace fs = std::filesystem;

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string to_hex(const unsigned char* bytes, unsigned int length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(kDigits[bytes[i] >> 4]);
        hex.push_back(kDigits[bytes[i] & 0x0f]);
    }
    return hex;
}

} // namespace

Result<Checksum> sha256_hex(const std::uint8_t* data, std::size_t size) {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Err<Checksum>(Error::io_failure("Failed to allocate digest context"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        return Err<Checksum>(Error::io_failure("SHA-256 digest failed"));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        return Err<Checksum>(Error::io_failure("SHA-256 digest failed"));
    }
    return Ok(to_hex(digest, length));
}

ChunkSource::ChunkSource(fs::path path, std::ifstream stream,
                         std::uint64_t chunk_size, std::uint64_t file_size,
                         std::vector<std::uint64_t> indices)
    : path_(std::move(path)),
      stream_(std::move(stream)),
      chunk_size_(chunk_size),
      file_size_(file_size),
      indices_(std::move(indices)) {}

Result<ChunkSource> ChunkSource::open(const fs::path& path,
                                      std::uint64_t chunk_size,
                                      std::optional<std::uint64_t> file_size,
                                      std::optional<std::vector<std::uint64_t>> indices) {
    if (chunk_size == 0) {
        return Err<ChunkSource>(Error::invalid_argument("chunk_size must be > 0"));
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return Err<ChunkSource>(Error::io_failure("Failed to open source file: " + path.string()));
    }

    std::uint64_t size = 0;
    if (file_size) {
        size = *file_size;
    } else {
        std::error_code ec;
        size = fs::file_size(path, ec);
        if (ec) {
            return Err<ChunkSource>(Error::io_failure("Cannot stat " + path.string() + ": " + ec.message()));
        }
    }

    std::vector<std::uint64_t> selected;
    if (indices) {
        selected = std::move(*indices);
    } else {
        selected.resize(count_chunks(size, chunk_size));
        std::iota(selected.begin(), selected.end(), std::uint64_t{0});
    }

    return Ok(ChunkSource(path, std::move(stream), chunk_size, size, std::move(selected)));
}

Result<std::optional<FileChunk>> ChunkSource::next() {
    if (failed_) {
        return Err<std::optional<FileChunk>>(Error::io_failure("Chunk source already failed: " + path_.string()));
    }
    if (exhausted_ || position_ >= indices_.size()) {
        exhausted_ = true;
        return Ok(std::optional<FileChunk>{});
    }

    const std::uint64_t index = indices_[position_];

    if (file_size_ == 0) {
        // An empty file is a single empty part
        ++position_;
        exhausted_ = true;
        if (index != 0) {
            return Ok(std::optional<FileChunk>{});
        }
        FileChunk chunk;
        chunk.index = 0;
        chunk.checksum = kEmptySha256;
        return Ok(std::optional<FileChunk>{std::move(chunk)});
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(index * chunk_size_), std::ios::beg);
    if (!stream_) {
        failed_ = true;
        return Err<std::optional<FileChunk>>(Error::io_failure(
            "Failed to seek to chunk " + std::to_string(index) + " of " + path_.string()));
    }

    buffer_.resize(static_cast<std::size_t>(chunk_size_));
    stream_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(chunk_size_));
    if (stream_.bad()) {
        failed_ = true;
        return Err<std::optional<FileChunk>>(Error::io_failure(
            "Failed to read chunk " + std::to_string(index) + " of " + path_.string()));
    }

    const auto bytes_read = static_cast<std::size_t>(stream_.gcount());
    if (bytes_read == 0) {
        exhausted_ = true;
        return Ok(std::optional<FileChunk>{});
    }

    auto checksum = sha256_hex(buffer_.data(), bytes_read);
    if (checksum.is_error()) {
        failed_ = true;
        return Err<std::optional<FileChunk>>(checksum.error());
    }

    ++position_;
    FileChunk chunk;
    chunk.index = index;
    chunk.bytes.assign(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(bytes_read));
    chunk.checksum = std::move(checksum.value());
    return Ok(std::optional<FileChunk>{std::move(chunk)});
}

std::size_t ChunkSource::remaining() const noexcept {
    if (exhausted_ || failed_) {
        return 0;
    }
    return indices_.size() - position_;
}

std::uint64_t ChunkSource::count_chunks(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0 || file_size == 0) {
        return 1;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

Result<FileChunk> ChunkSource::read_chunk(const fs::path& path,
                                          std::uint64_t index,
                                          std::uint64_t chunk_size,
                                          std::optional<std::uint64_t> file_size) {
    auto source = open(path, chunk_size, file_size, std::vector<std::uint64_t>{index});
    if (source.is_error()) {
        return Err<FileChunk>(source.error());
    }

    auto chunk = source.value().next();
    if (chunk.is_error()) {
        return Err<FileChunk>(chunk.error());
    }
    if (!chunk.value()) {
        return Err<FileChunk>(Error::io_failure(
            "Chunk " + std::to_string(index) + " lies beyond the end of " + path.string()));
    }
    return Ok(std::move(*chunk.value()));
}

} // namespace ingest::upload
