/**
 * @file missing_parts.hpp
 * @brief Turns a missing-parts report into a resume plan for one file
 *
 * EXAMPLE:
 * auto plan = reconcile(FileMissingParts{"a.bin", {1, 2}, 3}, 4, 8);
 * // plan.value().parts_to_send == {1}: index 2 lies past the end of an 8-byte file
 */

#pragma once

#include "ingest/core/result.hpp"
#include "ingest/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace ingest::upload {

/**
 * @brief What still has to be sent for one file, and what already was
 */
struct ResumePlan {
    std::vector<std::uint64_t> parts_to_send;  ///< Ascending, unique
    std::uint64_t parts_already_sent = 0;
    std::uint64_t bytes_already_sent = 0;
    std::uint64_t expected_total_parts = 0;

    [[nodiscard]] bool nothing_to_send() const noexcept { return parts_to_send.empty(); }
};

/**
 * @brief Turn the server's missing-parts report into a resume plan
 *
 * Without a report every chunk is pending. With one, only the listed
 * indices are pending and the counters start from what the server already
 * holds. The final part is the only short one, so the byte count depends
 * on whether it is among the missing parts.
 *
 * The report is trusted apart from index range: an index at or beyond
 * expected_total_parts is an InvalidArgument. The plan's total is capped
 * at the number of chunks the file really has, and indices past it are
 * dropped, so the final real part is the one that completes the file.
 */
Result<ResumePlan> reconcile(const std::optional<FileMissingParts>& missing,
                             std::uint64_t chunk_size,
                             std::uint64_t file_size);

} // namespace ingest::upload
