///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "timetable_service.hpp"
#include "catalog.hpp"
#include "conflict_repair.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "schedule_state.hpp"
#include "search_context.hpp"
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/**
 * @brief Whether any remaining record still covers the target's footprint.
 *
 * Faculty and room targets persist while their cell has excess. A student
 * target persists while any student record at its slot involves two or more
 * of its courses, whatever the record's id has become.
 */
bool stillConflicting(const std::vector<Conflict>& remaining, const Conflict& target) {
    for (const Conflict& conflict : remaining) {
        if (conflict.type != target.type || conflict.slotId != target.slotId) continue;
        if (target.type != ConflictType::STUDENT) {
            if (conflict.resourceId == target.resourceId) return true;
            continue;
        }
        int shared = 0;
        for (int courseId : conflict.courseIds) {
            if (std::binary_search(target.courseIds.begin(), target.courseIds.end(), courseId)) ++shared;
        }
        if (shared >= 2) return true;
    }
    return false;
}

}  // namespace


///////////////////////////
///       SERVICE       ///
///////////////////////////
TimetableService::TimetableService(const PipelineConfig& config, std::shared_ptr<IClusterStage> stage,
                                   EvaluatorFactory evaluators)
        : config_(config), stage_(std::move(stage)), evaluators_(std::move(evaluators)) {
    config_.validate();
}

TimetableService::~TimetableService() {
    std::vector<std::shared_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        for (auto& entry : jobs_) jobs.push_back(entry.second);
    }
    for (auto& job : jobs) job->cancel.cancel();
    for (auto& job : jobs) {
        if (job->worker.joinable()) job->worker.join();
    }
}

std::string TimetableService::submit(const ProblemInstance& instance) {
    auto job = std::make_shared<Job>();
    job->instance = instance;
    job->progress.reset(new ProgressCoordinator(config_.progress));
    job->result.submittedAt = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        job->id = "job-" + std::to_string(nextJobId_++);
        job->result.jobId = job->id;
        jobs_[job->id] = job;
    }
    logInfo("Submitted " + job->id + " (" + std::to_string(instance.courses.size()) + " courses)");

    job->worker = std::thread(&TimetableService::runJob, this, job);
    return job->id;
}

void TimetableService::runJob(const std::shared_ptr<Job>& job) {
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->result.startedAt = std::chrono::system_clock::now();
    }
    if (job->cancel.isCancelled()) {
        job->progress->cancel();
        return;
    }
    job->progress->start();

    try {
        GenerationPipeline pipeline(config_, stage_, evaluators_);
        PipelineOutcome outcome = pipeline.run(job->instance, *job->progress, job->cancel);
        {
            std::lock_guard<std::mutex> lock(job->mutex);
            job->result.finishedAt = std::chrono::system_clock::now();
            if (!outcome.cancelled) {
                job->result.assignment = std::move(outcome.assignment);
                job->result.conflicts = std::move(outcome.conflicts);
                job->result.summary = outcome.summary;
            }
        }
        if (outcome.cancelled) {
            job->progress->cancel();
            logWarning(job->id + " cancelled");
        } else {
            job->progress->complete();
            logInfo(job->id + " completed");
        }
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(job->mutex);
            job->result.finishedAt = std::chrono::system_clock::now();
            job->result.message = e.what();
        }
        job->progress->fail(e.what());
        logError(job->id + " failed: " + e.what());
    }
}

std::shared_ptr<TimetableService::Job> TimetableService::findJob(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) return nullptr;
    return it->second;
}

std::optional<ProgressSnapshot> TimetableService::getProgress(const std::string& jobId) const {
    std::shared_ptr<Job> job = findJob(jobId);
    if (!job) return std::nullopt;
    return job->progress->snapshot();
}

std::optional<JobResult> TimetableService::getJob(const std::string& jobId) const {
    std::shared_ptr<Job> job = findJob(jobId);
    if (!job) return std::nullopt;

    ProgressSnapshot snap = job->progress->snapshot();
    std::lock_guard<std::mutex> lock(job->mutex);
    JobResult result = job->result;
    result.status = snap.status;
    if (snap.status == JobStatus::FAILED) result.message = snap.message;
    if (snap.status != JobStatus::COMPLETED) {
        result.assignment.clear();
        result.conflicts.clear();
    }
    return result;
}

std::optional<JobResult> TimetableService::getResult(const std::string& jobId) const {
    std::optional<JobResult> result = getJob(jobId);
    if (!result || result->status != JobStatus::COMPLETED) return std::nullopt;
    return result;
}

bool TimetableService::cancel(const std::string& jobId) {
    std::shared_ptr<Job> job = findJob(jobId);
    if (!job) return false;
    if (isTerminal(job->progress->snapshot().status)) return false;
    job->cancel.cancel();
    logInfo("Cancellation requested for " + jobId);
    return true;
}

bool TimetableService::waitFor(const std::string& jobId, std::chrono::milliseconds timeout) const {
    std::shared_ptr<Job> job = findJob(jobId);
    if (!job) return false;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!isTerminal(job->progress->snapshot().status)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

DetectionResult TimetableService::detectConflicts(const ProblemInstance& instance,
                                                  const std::vector<SessionAssignment>& assignment) const {
    DetectionResult result;
    try {
        SessionCatalog catalog(instance);
        ScheduleState state = ScheduleState::fromAssignment(catalog, assignment);
        result.conflicts = ::detectConflicts(state);
        result.success = true;
        result.message = std::to_string(result.conflicts.size()) + " conflicts";
    } catch (const ValidationError& e) {
        result.message = e.what();
    }
    return result;
}

ResolutionReport TimetableService::resolveConflict(const ProblemInstance& instance,
                                                   std::vector<SessionAssignment>& assignment,
                                                   const std::string& conflictId, bool autoApply) {
    ResolutionReport report;
    try {
        SessionCatalog catalog(instance);
        ScheduleState state = ScheduleState::fromAssignment(catalog, assignment);
        std::vector<Conflict> before = ::detectConflicts(state);

        std::vector<Conflict> targets;
        if (conflictId == "all") {
            targets = before;
        } else {
            auto it = std::find_if(before.begin(), before.end(),
                                   [&conflictId](const Conflict& c) { return c.id == conflictId; });
            if (it == before.end()) {
                report.message = "unknown conflict " + conflictId;
                return report;
            }
            targets.push_back(*it);
        }
        if (targets.empty()) {
            report.success = true;
            report.message = "no conflicts";
            return report;
        }

        SearchContext context(config_);
        if (!config_.valueTablePath.empty()) context.valueTable.load(config_.valueTablePath);
        ConflictRepairer repairer(catalog, config_.repair, config_.clustering, context,
                                  config_.resolvedWorkerThreads());
        if (conflictId == "all") {
            repairer.repair(state);
        } else {
            std::vector<int> courses;
            for (int courseId : targets.front().courseIds) courses.push_back(catalog.courseIndexOf(courseId));
            repairer.repairScope(state, courses);
        }

        std::vector<Conflict> remaining = ::detectConflicts(state);
        for (const Conflict& target : targets) {
            if (stillConflicting(remaining, target)) {
                ++report.manualReview;
                report.details.push_back(target.id + ": manual review");
            } else {
                ++report.resolved;
                report.details.push_back(target.id + ": resolved");
            }
        }

        if (autoApply) {
            assignment = state.toAssignment();
            if (!config_.valueTablePath.empty()) context.valueTable.save(config_.valueTablePath);
        }
        report.success = true;
        report.message = std::to_string(report.resolved) + " resolved, " + std::to_string(report.manualReview) +
                         " for manual review" + (autoApply ? "" : " (not applied)");
        logInfo("Conflict resolution " + conflictId + ": " + report.message);
    } catch (const TimetableError& e) {
        report.message = e.what();
        report.details.clear();
        report.resolved = 0;
        report.manualReview = 0;
    }
    return report;
}

IncrementalResult TimetableService::addCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                              const Course& course) {
    return updater_.addCourse(instance, assignment, course);
}

IncrementalResult TimetableService::removeCourse(ProblemInstance& instance,
                                                 std::vector<SessionAssignment>& assignment, int courseId) {
    return updater_.removeCourse(instance, assignment, courseId);
}

IncrementalResult TimetableService::updateCourse(ProblemInstance& instance,
                                                 std::vector<SessionAssignment>& assignment, const Course& course) {
    return updater_.updateCourse(instance, assignment, course);
}
