#include "ingest/upload/dispatcher.hpp"

#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace ingest::upload {

namespace {

struct SharedState {
    std::mutex mutex;
    bool stopped = false;
    std::optional<Error> first_error;

    void fail(Error error) {
        std::lock_guard lock(mutex);
        stopped = true;
        if (!first_error) {
            first_error = std::move(error);
        }
    }
};

void worker_loop(const Dispatcher::JobSource& next_job, SharedState& state) {
    while (true) {
        Dispatcher::Job job;
        {
            std::lock_guard lock(state.mutex);
            if (state.stopped) {
                return;
            }
            auto pulled = next_job();
            if (pulled.is_error()) {
                state.stopped = true;
                if (!state.first_error) {
                    state.first_error = pulled.error();
                }
                return;
            }
            if (!pulled.value()) {
                state.stopped = true;
                return;
            }
            job = std::move(*pulled.value());
        }

        auto result = job();
        if (result.is_error()) {
            state.fail(result.error());
            return;
        }
    }
}

} // namespace

Result<void> Dispatcher::run(const JobSource& next_job) const {
    if (parallelism_ == 0) {
        return Err<void>(Error::invalid_argument("parallelism must be > 0"));
    }

    SharedState state;
    std::vector<std::thread> workers;
    workers.reserve(parallelism_);
    for (std::size_t i = 0; i < parallelism_; ++i) {
        workers.emplace_back(worker_loop, std::cref(next_job), std::ref(state));
    }
    for (auto& worker : workers) {
        worker.join();
    }

    if (state.first_error) {
        return Err<void>(*state.first_error);
    }
    return Ok();
}

} // namespace ingest::upload
