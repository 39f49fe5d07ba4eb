#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cancellation.hpp"
#include "conflicts.hpp"
#include "config.hpp"
#include "incremental_updater.hpp"
#include "pipeline.hpp"
#include "progress.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Everything a finished job exposes.
 */
struct JobResult {
    std::string jobId;
    JobStatus status = JobStatus::QUEUED;
    std::vector<SessionAssignment> assignment;
    std::vector<Conflict> conflicts;
    PipelineSummary summary;
    std::string message; ///< Diagnostic of a failed job.
    std::chrono::system_clock::time_point submittedAt;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
};

/**
 * @brief Result of detect_conflicts.
 */
struct DetectionResult {
    bool success = false;
    std::string message;
    std::vector<Conflict> conflicts;
};

/**
 * @brief Result of resolve_conflict.
 */
struct ResolutionReport {
    bool success = false;
    std::string message;
    int resolved = 0; ///< Targets whose cells or courses no longer clash.
    int manualReview = 0; ///< Conflict records left for manual review.
    std::vector<std::string> details; ///< One line per targeted conflict.
};


///////////////////////////
///       SERVICE       ///
///////////////////////////
/**
 * @brief Job-oriented facade over the generation pipeline.
 *
 * submit() runs the pipeline on its own thread; progress is read from the
 * job's coordinator. This is the error boundary: no exception escapes a job
 * or a public operation, they become a failed job or an unsuccessful result.
 */
class TimetableService {
public:
    explicit TimetableService(const PipelineConfig& config = PipelineConfig(),
                              std::shared_ptr<IClusterStage> stage = nullptr,
                              EvaluatorFactory evaluators = EvaluatorFactory());

    /// Cancels every running job and waits for it.
    ~TimetableService();

    TimetableService(const TimetableService&) = delete;
    TimetableService& operator=(const TimetableService&) = delete;

    /// Queue a generation run; returns the job id.
    std::string submit(const ProblemInstance& instance);

    /// Smoothed progress, or nullopt for an unknown job.
    std::optional<ProgressSnapshot> getProgress(const std::string& jobId) const;

    /// Result of a completed job; nullopt while running, after failure or cancellation, or for unknown ids.
    std::optional<JobResult> getResult(const std::string& jobId) const;

    /// Status, message and timestamps of any job (assignment only when completed).
    std::optional<JobResult> getJob(const std::string& jobId) const;

    /// Request cooperative cancellation; false for unknown or finished jobs.
    bool cancel(const std::string& jobId);

    /// Block until the job is terminal or the timeout passes; true when terminal.
    bool waitFor(const std::string& jobId, std::chrono::milliseconds timeout) const;

    DetectionResult detectConflicts(const ProblemInstance& instance,
                                    const std::vector<SessionAssignment>& assignment) const;

    /**
     * @brief Resolve one conflict (by id) or every conflict ("all").
     *
     * @param autoApply When false the assignment is left untouched and the
     *                  report describes what would happen.
     */
    ResolutionReport resolveConflict(const ProblemInstance& instance,
                                     std::vector<SessionAssignment>& assignment,
                                     const std::string& conflictId, bool autoApply);

    IncrementalResult addCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                const Course& course);
    IncrementalResult removeCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                   int courseId);
    IncrementalResult updateCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                   const Course& course);

private:
    struct Job {
        std::string id;
        ProblemInstance instance;
        std::unique_ptr<ProgressCoordinator> progress;
        CancellationToken cancel;
        std::thread worker;

        mutable std::mutex mutex; ///< Guards result.
        JobResult result;
    };

    PipelineConfig config_;
    std::shared_ptr<IClusterStage> stage_;
    EvaluatorFactory evaluators_;
    IncrementalUpdater updater_;

    mutable std::mutex jobsMutex_;
    std::map<std::string, std::shared_ptr<Job>> jobs_;
    long nextJobId_ = 1;

    std::shared_ptr<Job> findJob(const std::string& jobId) const;
    void runJob(const std::shared_ptr<Job>& job);
};
