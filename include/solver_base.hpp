#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cancellation.hpp"
#include "catalog.hpp"
#include "cluster_solver.hpp"
#include "config.hpp"
#include "progress.hpp"
#include <vector>


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Execution back-end of the cluster-solving stage.
 *
 * Clusters are independent; implementations may solve them on a local thread
 * pool or distribute them over MPI ranks, but all expose the same contract:
 * one ClusterResult per cluster, in cluster order, each holding a placement
 * for every session of the cluster.
 */
class IClusterStage {
public:
    virtual ~IClusterStage() = default;

    /**
     * @brief Solve every cluster.
     *
     * Reports one unit of work per finished cluster. When the token is
     * cancelled, remaining clusters are skipped and their results left empty.
     */
    virtual std::vector<ClusterResult> solveAll(const SessionCatalog& catalog,
                                                const std::vector<std::vector<int>>& clusters,
                                                const SolverConfig& config,
                                                unsigned seed,
                                                StageReporter& reporter,
                                                const CancellationToken& cancel) = 0;
};
