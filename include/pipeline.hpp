#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cancellation.hpp"
#include "conflicts.hpp"
#include "config.hpp"
#include "fitness.hpp"
#include "model.hpp"
#include "progress.hpp"
#include "solver_base.hpp"
#include <functional>
#include <memory>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Per-stage summary of one generation run.
 */
struct PipelineSummary {
    int clusters = 0;
    double modularity = 0.0;
    int fallbackClusters = 0; ///< Clusters placed by the greedy fallback.
    int precheckSkips = 0; ///< Clusters sent to fallback by the capacity pre-check.
    int suspectedDefects = 0; ///< Clusters that raised the modeling-defect signal.
    int mergeConflicts = 0; ///< Conflicts introduced when merging cluster results.
    int refinementGenerations = 0;
    int conflictsAfterSolving = 0;
    int conflictsAfterRefinement = 0;
    int conflictsAfterRepair = 0;
    int repairRollbacks = 0;
    std::vector<int> manualReviewCourseIds; ///< Courses repair could not settle.
    double seconds = 0.0;
};

/**
 * @brief Result of GenerationPipeline::run.
 */
struct PipelineOutcome {
    bool cancelled = false; ///< The run stopped at a checkpoint; nothing else is valid.
    std::vector<SessionAssignment> assignment; ///< Complete assignment.
    std::vector<Conflict> conflicts; ///< Residual conflicts of the assignment.
    PipelineSummary summary;
};

/// Builds the fitness evaluator of a run once its catalog exists.
using EvaluatorFactory =
        std::function<std::unique_ptr<IFitnessEvaluator>(const SessionCatalog&, const FitnessWeights&)>;


///////////////////////////
///      PIPELINE       ///
///////////////////////////
/**
 * @brief Clustering -> cluster solving -> refinement -> repair -> finalization.
 *
 * Each stage reports raw work to its StageReporter and polls the cancellation
 * token at its checkpoints. Exceptions propagate to the caller (the job
 * service turns them into a failed job).
 */
class GenerationPipeline {
public:
    /**
     * @param config     Run configuration (validated by run()).
     * @param stage      Cluster-solving back-end; nullptr uses the local worker pool.
     * @param evaluators Fitness evaluator factory; empty uses the CPU evaluator.
     */
    explicit GenerationPipeline(const PipelineConfig& config,
                                std::shared_ptr<IClusterStage> stage = nullptr,
                                EvaluatorFactory evaluators = EvaluatorFactory());

    PipelineOutcome run(const ProblemInstance& instance, ProgressCoordinator& progress,
                        const CancellationToken& cancel);

    const PipelineConfig& config() const { return config_; }

private:
    PipelineConfig config_;
    std::shared_ptr<IClusterStage> stage_;
    EvaluatorFactory evaluators_;
};
