#include "ingest/upload/missing_parts.hpp"
#include "ingest/upload/chunk_source.hpp"

#include <algorithm>
#include <numeric>
#include <string>

namespace ingest::upload {

Result<ResumePlan> reconcile(const std::optional<FileMissingParts>& missing,
                             std::uint64_t chunk_size,
                             std::uint64_t file_size) {
    if (chunk_size == 0) {
        return Err<ResumePlan>(Error::invalid_argument("chunk_size must be > 0"));
    }

    ResumePlan plan;

    if (!missing) {
        plan.expected_total_parts = ChunkSource::count_chunks(file_size, chunk_size);
        plan.parts_to_send.resize(plan.expected_total_parts);
        std::iota(plan.parts_to_send.begin(), plan.parts_to_send.end(), std::uint64_t{0});
        return Ok(std::move(plan));
    }

    const std::uint64_t total = missing->expected_total_parts;
    plan.expected_total_parts = total;
    plan.parts_to_send = missing->missing_parts;
    std::sort(plan.parts_to_send.begin(), plan.parts_to_send.end());
    plan.parts_to_send.erase(std::unique(plan.parts_to_send.begin(), plan.parts_to_send.end()),
                             plan.parts_to_send.end());

    if (!plan.parts_to_send.empty() && plan.parts_to_send.back() >= total) {
        return Err<ResumePlan>(Error::invalid_argument(
            "Missing part " + std::to_string(plan.parts_to_send.back()) + " of " +
            missing->file_name + " is outside the expected " + std::to_string(total) + " parts"));
    }

    // The service counts floor(size / chunk) + 1 parts, one more than exist
    // when the size is an exact multiple. That trailing index never holds data.
    const std::uint64_t real_total = std::min(total, ChunkSource::count_chunks(file_size, chunk_size));
    plan.expected_total_parts = real_total;
    plan.parts_to_send.erase(std::lower_bound(plan.parts_to_send.begin(), plan.parts_to_send.end(), real_total),
                             plan.parts_to_send.end());

    plan.parts_already_sent = real_total - plan.parts_to_send.size();

    if (plan.parts_to_send.empty()) {
        plan.bytes_already_sent = file_size;
        return Ok(std::move(plan));
    }

    const bool final_part_missing = plan.parts_to_send.back() == real_total - 1;
    if (final_part_missing) {
        plan.bytes_already_sent = plan.parts_already_sent * chunk_size;
    } else {
        // The short final part is among those already sent
        const std::uint64_t full_parts_bytes = (real_total - 1) * chunk_size;
        const std::uint64_t final_length = file_size > full_parts_bytes ? file_size - full_parts_bytes : 0;
        plan.bytes_already_sent = (plan.parts_already_sent - 1) * chunk_size + final_length;
    }
    plan.bytes_already_sent = std::min(plan.bytes_already_sent, file_size);

    return Ok(std::move(plan));
}

} // namespace ingest::upload
