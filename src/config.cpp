///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "errors.hpp"
#include <thread>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void require(bool condition, const std::string& what) {
    if (!condition) throw ConfigError(what);
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
void PipelineConfig::validate() const {
    require(clustering.maxClusterSize >= 1, "clustering.maxClusterSize must be >= 1");
    require(clustering.superClusterMaxSize >= clustering.maxClusterSize,
            "clustering.superClusterMaxSize must be >= clustering.maxClusterSize");
    require(clustering.minClusterSize >= 1 && clustering.minClusterSize <= clustering.maxClusterSize,
            "clustering.minClusterSize must be in [1, maxClusterSize]");
    require(clustering.minEdgeWeight >= 0.0, "clustering.minEdgeWeight must be >= 0");
    require(clustering.maxPasses >= 1, "clustering.maxPasses must be >= 1");

    require(solver.strategyTimeLimitSeconds > 0.0, "solver.strategyTimeLimitSeconds must be > 0");
    require(solver.capacityPrecheckRatio >= 0.0, "solver.capacityPrecheckRatio must be >= 0");
    require(solver.priorityStudentLimit >= 0 && solver.relaxedPriorityStudentLimit >= 0,
            "solver priority limits must be >= 0");
    require(solver.studentSampleRate >= 0.0 && solver.studentSampleRate <= 1.0,
            "solver.studentSampleRate must be in [0, 1]");
    require(solver.greedyStudentSample >= 1, "solver.greedyStudentSample must be >= 1");

    require(refiner.populationSize >= 2, "refiner.populationSize must be >= 2");
    require(refiner.generations >= 0, "refiner.generations must be >= 0");
    require(refiner.eliteCount >= 1 && refiner.eliteCount < refiner.populationSize,
            "refiner.eliteCount must be in [1, populationSize)");
    require(refiner.tournamentSize >= 1, "refiner.tournamentSize must be >= 1");
    require(refiner.mutationRate >= 0.0 && refiner.mutationRate <= 1.0,
            "refiner.mutationRate must be in [0, 1]");
    require(refiner.crossoverRate >= 0.0 && refiner.crossoverRate <= 1.0,
            "refiner.crossoverRate must be in [0, 1]");
    require(refiner.plateauGenerations >= 1, "refiner.plateauGenerations must be >= 1");
    require(refiner.fitnessCacheCapacity >= refiner.populationSize,
            "refiner.fitnessCacheCapacity must be >= populationSize");
    require(refiner.cacheEvictionInterval >= 1, "refiner.cacheEvictionInterval must be >= 1");

    require(repair.maxPasses >= 1, "repair.maxPasses must be >= 1");
    require(repair.maxCandidatesPerSession >= 1, "repair.maxCandidatesPerSession must be >= 1");
    require(repair.learningRate > 0.0 && repair.learningRate <= 1.0,
            "repair.learningRate must be in (0, 1]");

    require(progress.intervalMs >= 0, "progress.intervalMs must be >= 0");
    require(progress.catchUpFactor > 0.0 && progress.catchUpFactor <= 1.0,
            "progress.catchUpFactor must be in (0, 1]");
    require(progress.minStep > 0.0 && progress.creep >= 0.0, "progress steps must be positive");
    require(0.0 <= progress.clusteringEnd &&
            progress.clusteringEnd <= progress.solvingEnd &&
            progress.solvingEnd <= progress.refiningEnd &&
            progress.refiningEnd <= progress.repairingEnd &&
            progress.repairingEnd <= 100.0,
            "progress stage boundaries must be ordered within [0, 100]");

    require(workerThreads >= 0, "workerThreads must be >= 0");
}

int PipelineConfig::resolvedWorkerThreads() const {
    if (workerThreads > 0) return workerThreads;
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : (int)hw;
}
