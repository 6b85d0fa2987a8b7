#include "scoreflow/core/recompute_scheduler.h"
#include "scoreflow/utils/logging.hpp"
#include <system_error>

namespace scoreflow {
namespace core {

const char* toString(RecomputeScheduler::KeyState state) {
    switch (state) {
        case RecomputeScheduler::KeyState::Idle: return "idle";
        case RecomputeScheduler::KeyState::Pending: return "pending";
        case RecomputeScheduler::KeyState::Running: return "running";
    }
    return "unknown";
}

RecomputeScheduler::RecomputeScheduler(std::shared_ptr<AggregationEngine> engine, const EngineConfig& config)
    : engine_(std::move(engine))
    , workerCount_(config.workerThreads > 0 ? config.workerThreads : 1)
    , coalescingDelay_(config.coalescingDelay) {}

RecomputeScheduler::~RecomputeScheduler() {
    stop();
}

Result<void> RecomputeScheduler::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return Error{ErrorCode::InvalidConfiguration, "Scheduler is already running"};
        }
        running_ = true;
    }

    try {
        for (std::size_t i = 0; i < workerCount_; ++i) {
            workers_.emplace_back(&RecomputeScheduler::workerLoop, this);
        }
    } catch (const std::system_error& e) {
        stop();
        return Error{ErrorCode::InvalidConfiguration,
                     std::string("Failed to start scheduler workers: ") + e.what()};
    }

    SFLOG_INFO("Recompute scheduler started with " << workerCount_ << " workers, coalescing delay "
               << coalescingDelay_.count() << "ms");
    return Result<void>();
}

void RecomputeScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && workers_.empty()) {
            return;
        }
        running_ = false;
    }
    workCv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    SFLOG_INFO("Recompute scheduler stopped");
}

void RecomputeScheduler::onSubmission(const Submission& submission) {
    engine_->noteSubmission(submission);

    auto keys = engine_->keysAffectedBy(submission);
    if (keys.has_error()) {
        SFLOG_ERROR("Cannot find metrics affected by submission of " << submission.learnerId
                    << " on '" << submission.itemId << "': " << keys.error().describe());
        return;
    }
    for (const auto& key : keys.value()) {
        schedule(key);
    }
}

void RecomputeScheduler::onScoreUpdated(const ScoreKey& key) {
    auto keys = engine_->keysDependingOn(key);
    if (keys.has_error()) {
        SFLOG_ERROR("Cannot find metrics depending on " << key.toString() << ": "
                    << keys.error().describe());
        return;
    }
    for (const auto& dependent : keys.value()) {
        schedule(dependent);
    }
}

Result<Score> RecomputeScheduler::requestRecompute(const ScoreKey& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.runsStarted;
    }

    auto result = engine_->recompute(key);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.has_value()) {
            ++stats_.runsSucceeded;
        } else {
            ++stats_.runsFailed;
        }
    }
    if (result.has_value()) {
        onScoreUpdated(result.value().key);
    }
    return result;
}

void RecomputeScheduler::schedule(const ScoreKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.eventsReceived;

    auto& entry = entries_[key];
    switch (entry.state) {
        case KeyState::Idle:
            entry.state = KeyState::Pending;
            entry.readyAt = std::chrono::steady_clock::now() + coalescingDelay_;
            queue_.push_back(key);
            workCv_.notify_one();
            break;
        case KeyState::Pending:
            ++stats_.eventsCoalesced;
            break;
        case KeyState::Running:
            if (entry.rerun) {
                ++stats_.eventsCoalesced;
            }
            entry.rerun = true;
            break;
    }
}

RecomputeScheduler::KeyState RecomputeScheduler::stateOf(const ScoreKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() ? it->second.state : KeyState::Idle;
}

RecomputeScheduler::Stats RecomputeScheduler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

bool RecomputeScheduler::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this]() { return entries_.empty(); });
}

void RecomputeScheduler::workerLoop() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        workCv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
        if (!running_) {
            return;
        }

        // Keys are queued in readyAt order since the delay is constant
        const auto readyAt = entries_[queue_.front()].readyAt;
        if (std::chrono::steady_clock::now() < readyAt) {
            workCv_.wait_until(lock, readyAt);
            continue;
        }

        const ScoreKey key = queue_.front();
        queue_.pop_front();
        entries_[key].state = KeyState::Running;
        ++stats_.runsStarted;
        lock.unlock();

        auto result = engine_->recompute(key);
        // Dependents are scheduled while this key still counts as Running,
        // so waitUntilIdle() cannot observe a gap between the two.
        if (result.has_value()) {
            onScoreUpdated(result.value().key);
        }
        finishRun(key, result.has_value());
    }
}

void RecomputeScheduler::finishRun(const ScoreKey& key, bool succeeded) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (succeeded) {
        ++stats_.runsSucceeded;
    } else {
        ++stats_.runsFailed;
    }

    auto& entry = entries_[key];
    if (entry.rerun) {
        entry.rerun = false;
        entry.state = KeyState::Pending;
        entry.readyAt = std::chrono::steady_clock::now() + coalescingDelay_;
        queue_.push_back(key);
        workCv_.notify_one();
    } else {
        entries_.erase(key);
    }
    idleCv_.notify_all();
}

} // namespace core
} // namespace scoreflow
