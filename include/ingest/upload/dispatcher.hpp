/**
 * @file dispatcher.hpp
 * @brief Bounded-concurrency runner for part uploads
 *
 * EXAMPLE:
 * Dispatcher dispatcher(10);
 * auto result = dispatcher.run(next_job);  // First failure stops new jobs
 */

#pragma once

#include "ingest/core/result.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace ingest::upload {

/**
 * @brief Runs jobs on a fixed pool with at most `parallelism` in flight
 *
 * Jobs are pulled one at a time from a source shared by all workers, so
 * the source runs serialised and may be stateful (it reads the next chunk
 * of a file). Jobs run unsynchronised and may finish out of order.
 *
 * The first failure, from the source or from a job, stops further pulls.
 * Jobs already running are left to finish; the first error observed is
 * the outcome. Nothing already completed is undone.
 */
class Dispatcher {
public:
    using Job = std::function<Result<void>()>;

    /// Next job, an empty optional once there are no more, or an error.
    using JobSource = std::function<Result<std::optional<Job>>()>;

    explicit Dispatcher(std::size_t parallelism) : parallelism_(parallelism) {}

    Result<void> run(const JobSource& next_job) const;

    std::size_t parallelism() const noexcept { return parallelism_; }

private:
    std::size_t parallelism_;
};

} // namespace ingest::upload
