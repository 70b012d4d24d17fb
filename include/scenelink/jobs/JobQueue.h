#pragma once

#include <scenelink/host/host_interfaces.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace scenelink::jobs {

using ProgressCallback = std::function<void(int percent)>;
using JobValue =
    std::variant<std::monostate, bool, std::int64_t, double, std::string, ProgressCallback>;
using JobArgs = std::map<std::string, JobValue>;
using JobAction = std::function<void(JobArgs&)>;

// Reserved argument under which drain() injects the progress callback.
inline constexpr const char* kProgressCallbackKey = "progress_callback";

// Invokes the injected progress callback, if any.
void reportProgress(JobArgs& args, int percent);

struct Job {
    std::string name;
    JobAction action;
    JobArgs args;
};

struct DrainStats {
    std::size_t executed{0};
    std::size_t failed{0};
    std::vector<Error> errors; // one ErrorCode::JobFailed entry per failed job
};

/**
 * @brief Synchronous FIFO of named jobs with host progress reporting.
 *
 * @deprecated Kept for existing engine consumers. Every enqueue() and drain() logs a
 * deprecation warning.
 *
 * drain() runs jobs one at a time on the calling thread until the queue is empty. A job
 * that throws is logged and skipped; the host progress bar is always ended for it. There
 * is no timeout or cancellation.
 */
class JobQueue {
public:
    JobQueue() = default;

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    void enqueue(std::string name, JobAction action, JobArgs args = {});
    DrainStats drain(host::IProgressSink& progress);

    std::size_t size() const noexcept { return queue_.size(); }
    bool empty() const noexcept { return queue_.empty(); }

private:
    void onProgress(int percent);

    std::deque<Job> queue_;
    host::IProgressSink* activeSink_{nullptr};
    int currentProgress_{0};
};

} // namespace scenelink::jobs
