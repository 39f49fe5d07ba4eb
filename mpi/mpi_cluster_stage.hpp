#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cluster_worker_pool.hpp"
#include "solver_base.hpp"
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief Hybrid MPI + threads back-end of the cluster-solving stage.
 *
 * Every rank holds the same snapshot. Rank 0 broadcasts the clusters, the
 * clusters are dealt round-robin (cluster i goes to rank i % size), each rank
 * solves its share on a local ThreadedClusterStage, and the non-root ranks
 * send their results back to rank 0 as flat integer buffers. Rank 0 then
 * continues the pipeline alone.
 */
class MPIClusterStage : public IClusterStage {
public:
    /**
     * @param numThreads Number of worker threads used inside each rank.
     */
    explicit MPIClusterStage(int numThreads);

    /// Rank 0 side: broadcast the clusters, solve the local share and gather the rest.
    std::vector<ClusterResult> solveAll(const SessionCatalog& catalog,
                                        const std::vector<std::vector<int>>& clusters,
                                        const SolverConfig& config,
                                        unsigned seed,
                                        StageReporter& reporter,
                                        const CancellationToken& cancel) override;

    /**
     * @brief Non-root side: answer cluster broadcasts until rank 0 calls shutdown().
     *
     * config and seed must match the ones rank 0 passes to solveAll().
     */
    void serve(const SessionCatalog& catalog, const SolverConfig& config, unsigned seed);

    /// Rank 0 side: release the serving ranks.
    void shutdown();

private:
    ThreadedClusterStage local_; ///< Intra-rank worker pool.

    /**
     * @brief Serialize cluster results into a flat integer buffer.
     *
     * Per result: clusterIndex, courses, sessions, domainPairs, strategy,
     * status, flags, relaxedSessions, milliseconds, placement count, then
     * (session, slot, roomIndex) per placement.
     */
    static void serializeResults(const std::vector<ClusterResult>& results, const std::vector<int>& indices,
                                 std::vector<int>& buffer);

    /// Inverse of serializeResults(); writes each result at its cluster index. Returns the number decoded.
    static int deserializeResults(const std::vector<int>& buffer, std::vector<ClusterResult>& results);

    /// Broadcast the clusters from rank 0 (count -1 means shutdown).
    static void broadcastClusters(std::vector<std::vector<int>>& clusters, int& count);

    /// Indices of the clusters dealt to a rank.
    static std::vector<int> shareOf(int rank, int size, int clusterCount);
};
