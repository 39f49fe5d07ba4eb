///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cluster_worker_pool.hpp"
#include "logging.hpp"
#include <algorithm>
#include <future>
#include <numeric>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
ThreadedClusterStage::ThreadedClusterStage(int numThreads)
        : numThreads_(std::max(1, numThreads)) {}

std::vector<ClusterResult> ThreadedClusterStage::solveAll(const SessionCatalog& catalog,
                                                          const std::vector<std::vector<int>>& clusters,
                                                          const SolverConfig& config,
                                                          unsigned seed,
                                                          StageReporter& reporter,
                                                          const CancellationToken& cancel) {
    std::vector<int> all(clusters.size());
    std::iota(all.begin(), all.end(), 0);
    return solveSubset(catalog, clusters, all, config, seed, reporter, cancel);
}

/**
 * @brief Run the listed clusters on the worker pool.
 *
 * Largest clusters are dispatched first so a long solve does not end up as
 * the tail of the stage.
 */
std::vector<ClusterResult> ThreadedClusterStage::solveSubset(const SessionCatalog& catalog,
                                                             const std::vector<std::vector<int>>& clusters,
                                                             const std::vector<int>& indices,
                                                             const SolverConfig& config,
                                                             unsigned seed,
                                                             StageReporter& reporter,
                                                             const CancellationToken& cancel) {
    std::vector<ClusterResult> results(clusters.size());
    std::vector<int> order = indices;
    std::stable_sort(order.begin(), order.end(), [&clusters](int a, int b) {
        return clusters[a].size() > clusters[b].size();
    });

    std::atomic<size_t> cursor{0};
    auto worker = [&]() {
        ClusterSolver solver(catalog, config, &cancel);
        while (true) {
            if (cancel.isCancelled()) return;
            size_t next = cursor.fetch_add(1);
            if (next >= order.size()) return;
            int index = order[next];
            results[index] = solver.solve(clusters[index], index, seed);
            reporter.increment();
        }
    };

    int threads = std::min<int>(numThreads_, std::max<int>(1, (int)order.size()));
    std::vector<std::future<void>> tasks;
    for (int i = 0; i < threads; ++i) tasks.push_back(std::async(std::launch::async, worker));
    // get() rethrows a worker's exception on the calling thread.
    for (auto& t : tasks) t.get();

    logDebug("Worker pool solved " + std::to_string(order.size()) + " clusters on " +
             std::to_string(threads) + " threads");
    return results;
}
