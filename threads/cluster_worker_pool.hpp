#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include <atomic>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Bounded worker pool solving clusters concurrently.
 *
 * numThreads workers pull cluster indices from a shared atomic cursor; each
 * worker owns its ClusterSolver and shares only the read-only catalog.
 * Results are written to distinct slots of a pre-sized vector, so no lock is
 * needed for them.
 */
class ThreadedClusterStage : public IClusterStage {
public:
    /**
     * @param numThreads Number of worker threads (values below 1 become 1).
     */
    explicit ThreadedClusterStage(int numThreads);

    std::vector<ClusterResult> solveAll(const SessionCatalog& catalog,
                                        const std::vector<std::vector<int>>& clusters,
                                        const SolverConfig& config,
                                        unsigned seed,
                                        StageReporter& reporter,
                                        const CancellationToken& cancel) override;

    /**
     * @brief Solve only the listed clusters (used by MPI ranks for their share).
     *
     * Entries of the returned vector not listed in `indices` stay empty.
     */
    std::vector<ClusterResult> solveSubset(const SessionCatalog& catalog,
                                           const std::vector<std::vector<int>>& clusters,
                                           const std::vector<int>& indices,
                                           const SolverConfig& config,
                                           unsigned seed,
                                           StageReporter& reporter,
                                           const CancellationToken& cancel);

private:
    int numThreads_; ///< Number of worker threads.
};
