#pragma once

#include "scoreflow/core/aggregation_engine.h"
#include "scoreflow/core/metric_types.h"
#include "scoreflow/utils/result.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief Decides when scores are recomputed and runs them on a worker pool.
 *
 * Every key moves through Idle -> Pending -> Running -> Idle. Events for a
 * Pending key are absorbed; events for a Running key set a rerun flag, so any
 * number of events during one run produce exactly one more run. A Pending key
 * waits EngineConfig::coalescingDelay before a worker picks it up.
 */
class RecomputeScheduler {
public:
    enum class KeyState {
        Idle,
        Pending,
        Running
    };

    struct Stats {
        std::uint64_t eventsReceived{0};   ///< Keys marked, including absorbed ones
        std::uint64_t eventsCoalesced{0};  ///< Marks absorbed by a Pending key or an already set rerun flag
        std::uint64_t runsStarted{0};
        std::uint64_t runsSucceeded{0};
        std::uint64_t runsFailed{0};
    };

    RecomputeScheduler(std::shared_ptr<AggregationEngine> engine, const EngineConfig& config);
    ~RecomputeScheduler();

    // Prevent copying
    RecomputeScheduler(const RecomputeScheduler&) = delete;
    RecomputeScheduler& operator=(const RecomputeScheduler&) = delete;

    /**
     * @brief Starts the worker threads.
     */
    Result<void> start();

    /**
     * @brief Stops the workers after their current run. Pending keys stay pending.
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Reacts to a new submission.
     *
     * Marks the learner's scores stale and schedules every auto-computing
     * metric whose inputs include the submission's item.
     */
    void onSubmission(const Submission& submission);

    /**
     * @brief Schedules the auto-computing parents of a freshly stored score.
     *
     * Called after every successful run.
     */
    void onScoreUpdated(const ScoreKey& key);

    /**
     * @brief Explicit recomputation, run on the caller's thread.
     *
     * Bypasses the Pending state and the coalescing delay.
     */
    Result<Score> requestRecompute(const ScoreKey& key);

    /**
     * @brief Marks a key Pending, or sets its rerun flag while it is running.
     */
    void schedule(const ScoreKey& key);

    KeyState stateOf(const ScoreKey& key) const;
    Stats stats() const;

    /**
     * @brief Blocks until no key is Pending or Running.
     *
     * @return false if the timeout expired first
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

private:
    struct Entry {
        KeyState state{KeyState::Idle};
        bool rerun{false};
        std::chrono::steady_clock::time_point readyAt;
    };

    std::shared_ptr<AggregationEngine> engine_;
    std::size_t workerCount_;
    std::chrono::milliseconds coalescingDelay_;

    mutable std::mutex mutex_;
    std::condition_variable workCv_;
    std::condition_variable idleCv_;
    std::unordered_map<ScoreKey, Entry, ScoreKeyHash> entries_;
    std::deque<ScoreKey> queue_;
    Stats stats_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;

    void workerLoop();
    void finishRun(const ScoreKey& key, bool succeeded);
};

const char* toString(RecomputeScheduler::KeyState state);

} // namespace core
} // namespace scoreflow
