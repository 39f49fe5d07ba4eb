#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>


///////////////////////////
///    STAGE CONFIGS    ///
///////////////////////////
/**
 * @brief Community detection and cluster size bounds.
 *
 * The two bounds are empirically tuned: clusters feed the exact solver and must stay
 * small; super-clusters feed conflict repair and must be large enough to hold a whole
 * student cohort's cross-enrolled course set.
 */
struct ClusteringConfig {
    int maxClusterSize = 15; ///< Upper bound for exact-solving clusters.
    int superClusterMaxSize = 50; ///< Upper bound for repair super-clusters.
    int minClusterSize = 5; ///< Communities below this size are packed together.
    double minEdgeWeight = 0.1; ///< Edges lighter than this are dropped.
    int maxPasses = 10; ///< Local-moving passes before giving up on further gains.
};

/**
 * @brief Exact solver, relaxation strategies and greedy fallback.
 */
struct SolverConfig {
    double strategyTimeLimitSeconds = 5.0; ///< Wall-clock budget of each strategy.
    double capacityPrecheckRatio = 0.5; ///< Minimum (slot x room) coverage of required sessions.
    int exactStudentThreshold = 200; ///< Clusters with fewer students get every student exactly.
    int priorityStudentLimit = 200; ///< Priority students kept exactly by the full strategy.
    int relaxedPriorityStudentLimit = 60; ///< Priority students kept by the relaxed strategy.
    double studentSampleRate = 0.25; ///< Share of non-priority students sampled by the full strategy.
    long defectDomainPairs = 1000; ///< Domain size above which an instant INFEASIBLE is suspicious.
    double defectMaxSeconds = 0.01; ///< "Instant" threshold for the defect signal.
    int greedyStudentSample = 50; ///< Enrolled students checked per greedy candidate.
};

/**
 * @brief Weights of the refinement fitness (lower fitness is better).
 */
struct FitnessWeights {
    double conflict = 1000.0; ///< Per unit of conflict excess.
    double capacity = 100.0; ///< Per session outside its domain (capacity/type mismatch).
    double preference = 1.0; ///< Multiplier of the department preference penalty.
};

/**
 * @brief Population-based refinement.
 */
struct RefinerConfig {
    int populationSize = 16; ///< Individuals per generation.
    int generations = 60; ///< Generation budget.
    int eliteCount = 2; ///< Best individuals copied unchanged.
    int tournamentSize = 3; ///< Contestants per tournament selection.
    double mutationRate = 0.02; ///< Share of sessions reassigned by one mutation.
    double crossoverRate = 0.8; ///< Probability that a child comes from crossover.
    int plateauGenerations = 15; ///< Stop after this many generations without improvement.
    double timeLimitSeconds = 30.0; ///< Wall-clock budget of the stage.
    int fitnessCacheCapacity = 256; ///< Hard bound on cached fitness values.
    int cacheEvictionInterval = 5; ///< Generations between stale-entry evictions.
    FitnessWeights weights; ///< Fitness weights.
};

/**
 * @brief Local-search conflict repair.
 */
struct RepairConfig {
    int maxPasses = 3; ///< Repair passes over all scopes.
    double timeLimitSeconds = 20.0; ///< Wall-clock budget of the stage.
    int maxCandidatesPerSession = 64; ///< Feasible candidates kept per session.
    double learningRate = 0.3; ///< Value-table update step.
    bool allowSwaps = true; ///< Try placement exchanges when no relocation exists.
    bool concurrentScopes = true; ///< Repair footprint-disjoint scopes in parallel.
};

/**
 * @brief Smoothed progress reporting.
 */
struct ProgressConfig {
    int intervalMs = 100; ///< Reporting-loop period; 0 disables the loop thread.
    double catchUpFactor = 0.25; ///< Share of the remaining gap closed per tick.
    double minStep = 0.05; ///< Smallest forward step while behind target.
    double creep = 0.01; ///< Forward creep per tick when at or ahead of target.
    double creepHeadroom = 1.0; ///< How far past target creep may go (still below stage end).
    double etaSmoothing = 0.3; ///< EMA weight of the newest ETA estimate.
    double clusteringEnd = 5.0; ///< Stage boundaries in percent.
    double solvingEnd = 40.0;
    double refiningEnd = 80.0;
    double repairingEnd = 97.0;
};


///////////////////////////
///   PIPELINE CONFIG   ///
///////////////////////////
/**
 * @brief Complete configuration of one generation run.
 */
struct PipelineConfig {
    ClusteringConfig clustering;
    SolverConfig solver;
    RefinerConfig refiner;
    RepairConfig repair;
    ProgressConfig progress;

    int workerThreads = 0; ///< Cluster worker pool size; 0 = hardware concurrency.
    unsigned seed = 42; ///< Seed of every random decision in the run.
    std::string valueTablePath; ///< Value table to load before and save after repair ("" = none).

    /**
     * @brief Check every parameter range.
     *
     * @throws ConfigError naming the first offending parameter.
     */
    void validate() const;

    /// Worker count with 0 resolved to the hardware concurrency (at least 1).
    int resolvedWorkerThreads() const;
};
