///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "pipeline.hpp"
#include "catalog.hpp"
#include "clustering.hpp"
#include "cluster_worker_pool.hpp"
#include "conflict_repair.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "population_refiner.hpp"
#include "schedule_state.hpp"
#include "search_context.hpp"
#include <chrono>
#include <sstream>


///////////////////////////
///      PIPELINE       ///
///////////////////////////
GenerationPipeline::GenerationPipeline(const PipelineConfig& config,
                                       std::shared_ptr<IClusterStage> stage,
                                       EvaluatorFactory evaluators)
        : config_(config), stage_(std::move(stage)), evaluators_(std::move(evaluators)) {
    if (!stage_) stage_ = std::make_shared<ThreadedClusterStage>(config_.resolvedWorkerThreads());
    if (!evaluators_) {
        int threads = config_.resolvedWorkerThreads();
        evaluators_ = [threads](const SessionCatalog& catalog, const FitnessWeights& weights) {
            return std::unique_ptr<IFitnessEvaluator>(new CpuFitnessEvaluator(catalog, weights, threads));
        };
    }
}

PipelineOutcome GenerationPipeline::run(const ProblemInstance& instance, ProgressCoordinator& progress,
                                        const CancellationToken& cancel) {
    auto start = std::chrono::steady_clock::now();
    config_.validate();

    PipelineOutcome outcome;
    PipelineSummary& summary = outcome.summary;
    SessionCatalog catalog(instance);
    SearchContext context(config_);
    logInfo("Generation: " + std::to_string(catalog.courseCount()) + " courses, " +
            std::to_string(catalog.sessionCount()) + " sessions, " + std::to_string(catalog.roomCount()) +
            " rooms, " + std::to_string(catalog.studentCount()) + " students, " +
            std::to_string(catalog.slotCount()) + " slots");

    // Clustering
    StageReporter& clusteringWork = progress.beginStage(PipelineStage::CLUSTERING);
    clusteringWork.setTotal(1);
    CourseClusterer clusterer(catalog, config_.clustering);
    Clustering clustering = clusterer.cluster();
    summary.clusters = (int)clustering.clusters.size();
    summary.modularity = clustering.modularity;
    clusteringWork.report(1);
    if (cancel.isCancelled()) { outcome.cancelled = true; return outcome; }

    // Cluster solving
    StageReporter& solvingWork = progress.beginStage(PipelineStage::SOLVING);
    solvingWork.setTotal((long)clustering.clusters.size());
    std::vector<ClusterResult> results =
            stage_->solveAll(catalog, clustering.clusters, config_.solver, config_.seed, solvingWork, cancel);
    if (cancel.isCancelled()) { outcome.cancelled = true; return outcome; }

    ScheduleState state(catalog);
    for (const ClusterResult& result : results) {
        const ClusterSolveReport& report = result.report;
        if (report.usedFallback) ++summary.fallbackClusters;
        if (report.skippedByPrecheck) ++summary.precheckSkips;
        if (report.suspectedModelingDefect) ++summary.suspectedDefects;
        for (const auto& entry : result.placements) {
            summary.mergeConflicts += state.assignAllowingConflicts(entry.first, entry.second.slot,
                                                                    entry.second.roomIndex);
        }
    }
    if (!state.isComplete()) {
        throw TimetableError(std::to_string(state.unassignedCount()) + " sessions left unassigned after solving");
    }
    summary.conflictsAfterSolving = state.conflictCount();
    {
        std::ostringstream msg;
        msg << "Solving: " << results.size() << " clusters, " << summary.fallbackClusters << " via fallback ("
            << summary.precheckSkips << " by pre-check), " << summary.mergeConflicts << " merge conflicts";
        logInfo(msg.str());
    }
    if (summary.suspectedDefects > 0) {
        logError(std::to_string(summary.suspectedDefects) + " clusters raised the modeling-defect signal");
    }

    // Refinement
    StageReporter& refiningWork = progress.beginStage(PipelineStage::REFINING);
    std::unique_ptr<IFitnessEvaluator> evaluator = evaluators_(catalog, config_.refiner.weights);
    PopulationRefiner refiner(catalog, config_.refiner, *evaluator, context);
    RefinementResult refined = refiner.refine(state.placements(), clustering.clusters, &refiningWork, &cancel);
    if (refined.cancelled || cancel.isCancelled()) { outcome.cancelled = true; return outcome; }
    if (refined.bestFitness.value < refined.initialFitness.value) state.adopt(refined.best);
    context.fitnessCache.clear();
    summary.refinementGenerations = refined.generations;
    summary.conflictsAfterRefinement = state.conflictCount();

    // Repair
    StageReporter& repairingWork = progress.beginStage(PipelineStage::REPAIRING);
    if (!config_.valueTablePath.empty() && context.valueTable.load(config_.valueTablePath)) {
        logInfo("Loaded " + std::to_string(context.valueTable.size()) + " value-table entries from " +
                config_.valueTablePath);
    }
    ConflictRepairer repairer(catalog, config_.repair, config_.clustering, context, config_.resolvedWorkerThreads());
    RepairReport repaired = repairer.repair(state, &repairingWork, &cancel);
    if (repaired.cancelled || cancel.isCancelled()) { outcome.cancelled = true; return outcome; }
    if (!config_.valueTablePath.empty()) context.valueTable.save(config_.valueTablePath);
    summary.conflictsAfterRepair = state.conflictCount();
    summary.repairRollbacks = repaired.rollbacks;
    summary.manualReviewCourseIds = repaired.manualReviewCourseIds;
    logInfo("Repair: conflicts " + std::to_string(repaired.before) + " -> " + std::to_string(repaired.after) +
            " (" + std::to_string(repaired.moves) + " moves, " + std::to_string(repaired.swaps) + " swaps, " +
            std::to_string(repaired.rollbacks) + " rollbacks)");

    // Finalization
    StageReporter& finalizingWork = progress.beginStage(PipelineStage::FINALIZING);
    finalizingWork.setTotal(2);
    outcome.assignment = state.toAssignment();
    finalizingWork.report(1);
    outcome.conflicts = detectConflicts(state);
    finalizingWork.report(2);

    summary.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    logInfo("Generation finished in " + std::to_string(summary.seconds) + "s with " +
            std::to_string(outcome.conflicts.size()) + " conflict records");
    return outcome;
}
