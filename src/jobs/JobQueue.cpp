#include <scenelink/jobs/JobQueue.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace scenelink::jobs {

namespace {
constexpr const char* kDeprecationWarning =
    "[JobQueue] The engine job queue is deprecated and will be removed in a future release";
}

void reportProgress(JobArgs& args, int percent) {
    auto it = args.find(kProgressCallbackKey);
    if (it == args.end()) {
        return;
    }
    if (auto* cb = std::get_if<ProgressCallback>(&it->second); cb && *cb) {
        (*cb)(percent);
    }
}

void JobQueue::enqueue(std::string name, JobAction action, JobArgs args) {
    spdlog::warn(kDeprecationWarning);
    queue_.push_back(Job{std::move(name), std::move(action), std::move(args)});
}

void JobQueue::onProgress(int percent) {
    if (!activeSink_) {
        spdlog::debug("[JobQueue] Progress report outside of drain ignored");
        return;
    }
    // the host progress bar takes deltas
    const int delta = percent - currentProgress_;
    activeSink_->step(delta);
    currentProgress_ = percent;
}

DrainStats JobQueue::drain(host::IProgressSink& progress) {
    spdlog::warn(kDeprecationWarning);

    DrainStats stats;

    // RAII guard so a drain() nested inside a job hands progress back to the outer job.
    struct ActiveSinkGuard {
        host::IProgressSink*& sink;
        int& percent;
        host::IProgressSink* previousSink;
        int previousPercent;
        ~ActiveSinkGuard() {
            sink = previousSink;
            percent = previousPercent;
        }
    } sinkGuard{activeSink_, currentProgress_, activeSink_, currentProgress_};
    activeSink_ = &progress;

    // execute one after the other synchronously
    while (!queue_.empty()) {
        Job job = std::move(queue_.front());
        queue_.pop_front();

        currentProgress_ = 0;
        try {
            progress.beginProgress(job.name);
            job.args[kProgressCallbackKey] =
                ProgressCallback([this](int percent) { onProgress(percent); });
            if (!job.action) {
                throw std::invalid_argument("job has no action");
            }
            job.action(job.args);
        } catch (const std::exception& e) {
            ++stats.failed;
            stats.errors.emplace_back(ErrorCode::JobFailed, job.name + ": " + e.what());
            spdlog::error("[JobQueue] Error while processing job '{}': {}", job.name, e.what());
        } catch (...) {
            ++stats.failed;
            stats.errors.emplace_back(ErrorCode::JobFailed, job.name + ": unknown exception");
            spdlog::error("[JobQueue] Error while processing job '{}': unknown exception",
                          job.name);
        }
        ++stats.executed;

        try {
            progress.endProgress();
        } catch (const std::exception& e) {
            spdlog::warn("[JobQueue] endProgress failed after job '{}': {}", job.name, e.what());
        } catch (...) {
            spdlog::warn("[JobQueue] endProgress failed after job '{}': unknown exception",
                         job.name);
        }
    }

    spdlog::debug("[JobQueue] Drained {} jobs ({} failed)", stats.executed, stats.failed);
    return stats;
}

} // namespace scenelink::jobs
