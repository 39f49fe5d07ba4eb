#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>


///////////////////////////
///        TYPES        ///
///////////////////////////
enum class JobStatus { QUEUED, RUNNING, COMPLETED, FAILED, CANCELLED };

/**
 * @brief Pipeline stages in execution order; each owns a [start%, end%] band.
 */
enum class PipelineStage { CLUSTERING = 0, SOLVING = 1, REFINING = 2, REPAIRING = 3, FINALIZING = 4 };

constexpr int kStageCount = 5;

std::string formatJobStatus(JobStatus status);
std::string formatStage(PipelineStage stage);

/// Whether a status is final (completed, failed or cancelled).
inline bool isTerminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED;
}

/**
 * @brief Client-visible progress of a job.
 */
struct ProgressSnapshot {
    JobStatus status = JobStatus::QUEUED;
    PipelineStage stage = PipelineStage::CLUSTERING;
    double percent = 0.0; ///< Smoothed, monotonic percentage in [0, 100].
    std::optional<double> etaSeconds; ///< Unknown until some progress is displayed.
    std::string message; ///< Diagnostic of a failed job.
};


///////////////////////////
///    STAGE REPORTER   ///
///////////////////////////
/**
 * @brief Raw work counters of one stage.
 *
 * Stages only ever report "done of total"; they never see a percentage.
 * The done counter only grows (an atomic max) and is clamped to the total, so
 * out-of-order and bursty reports cannot move progress backwards.
 */
class StageReporter {
public:
    /// Declare the amount of work of the stage (values below 1 become 1).
    void setTotal(long total);

    /// Report absolute work completed.
    void report(long done);

    /// Report additional completed work.
    void increment(long amount = 1);

    /// Completed fraction in [0, 1].
    double fraction() const;

    long done() const { return done_.load(); }
    long total() const { return total_.load(); }

private:
    std::atomic<long> done_{0};
    std::atomic<long> total_{1};
};


///////////////////////////
///     COORDINATOR     ///
///////////////////////////
/**
 * @brief Per-job progress state machine and smoothing loop.
 *
 * queued -> running -> {completed | failed | cancelled}. An independent
 * reporting thread calls step() every intervalMs; it is the only writer of
 * the displayed percentage. With intervalMs == 0 no thread is started and the
 * owner drives step() itself.
 */
class ProgressCoordinator {
public:
    explicit ProgressCoordinator(const ProgressConfig& config);
    ~ProgressCoordinator();

    ProgressCoordinator(const ProgressCoordinator&) = delete;
    ProgressCoordinator& operator=(const ProgressCoordinator&) = delete;

    /// queued -> running; starts the reporting loop.
    void start();

    /**
     * @brief Make a stage active and return its reporter.
     *
     * Entering a stage earlier than the active one does not change the active
     * stage (the reporter is still returned).
     */
    StageReporter& beginStage(PipelineStage stage);

    /// Reporter of a stage without activating it.
    StageReporter& reporter(PipelineStage stage) { return reporters_[(int)stage]; }

    /// running -> completed; displays 100.
    void complete();

    /// running -> failed; freezes the displayed value.
    void fail(const std::string& message);

    /// queued/running -> cancelled; freezes the displayed value.
    void cancel();

    /**
     * @brief One reporting iteration: move the displayed value toward the target.
     */
    void step();

    ProgressSnapshot snapshot() const;

    /// Displayed percentage.
    double displayedPercent() const;

    /// Target percentage of the active stage from its raw counters.
    double targetPercent() const;

    /// [start%, end%] band of a stage.
    std::pair<double, double> stageBounds(PipelineStage stage) const;

private:
    ProgressConfig config_;
    std::array<StageReporter, kStageCount> reporters_;
    std::atomic<int> activeStage_{0};

    mutable std::mutex mutex_;
    JobStatus status_ = JobStatus::QUEUED;
    double displayed_ = 0.0;
    std::optional<double> eta_;
    std::string message_;
    std::chrono::steady_clock::time_point startedAt_;

    std::thread loop_;
    std::condition_variable wake_;
    bool stopLoop_ = false;

    void runLoop();
    void stopLoop();
    void finish(JobStatus status, const std::string& message);
};
