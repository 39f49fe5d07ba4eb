///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_cluster_stage.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <mpi.h>
#include <algorithm>
#include <climits>


///////////////////////////
///      PROTOCOL       ///
///////////////////////////
namespace {

const int TAG_META = 300;
const int TAG_DATA = 301;

const int kFlagFallback = 1;
const int kFlagPrecheck = 2;
const int kFlagDefect = 4;

const int kHeaderInts = 10;

}  // namespace


///////////////////////////
///       SOLVERS       ///
///////////////////////////
MPIClusterStage::MPIClusterStage(int numThreads) : local_(numThreads) {}

std::vector<int> MPIClusterStage::shareOf(int rank, int size, int clusterCount) {
    std::vector<int> share;
    for (int i = rank; i < clusterCount; i += size) share.push_back(i);
    return share;
}

void MPIClusterStage::serializeResults(const std::vector<ClusterResult>& results, const std::vector<int>& indices,
                                       std::vector<int>& buffer) {
    buffer.clear();
    for (int index : indices) {
        const ClusterResult& result = results[index];
        const ClusterSolveReport& report = result.report;
        int flags = (report.usedFallback ? kFlagFallback : 0) | (report.skippedByPrecheck ? kFlagPrecheck : 0) |
                    (report.suspectedModelingDefect ? kFlagDefect : 0);
        buffer.push_back(index);
        buffer.push_back(report.courses);
        buffer.push_back(report.sessions);
        buffer.push_back((int)std::min<long>(report.domainPairs, INT_MAX));
        buffer.push_back((int)report.strategy);
        buffer.push_back((int)report.status);
        buffer.push_back(flags);
        buffer.push_back(report.relaxedSessions);
        buffer.push_back((int)(report.seconds * 1000.0));
        buffer.push_back((int)result.placements.size());
        for (const auto& entry : result.placements) {
            buffer.push_back(entry.first);
            buffer.push_back(entry.second.slot);
            buffer.push_back(entry.second.roomIndex);
        }
    }
}

int MPIClusterStage::deserializeResults(const std::vector<int>& buffer, std::vector<ClusterResult>& results) {
    size_t pos = 0;
    int decoded = 0;
    while (pos < buffer.size()) {
        if (pos + kHeaderInts > buffer.size()) throw TimetableError("truncated cluster result buffer");
        int index = buffer[pos];
        if (index < 0 || index >= (int)results.size()) throw TimetableError("cluster index out of range in buffer");

        ClusterResult& result = results[index];
        ClusterSolveReport& report = result.report;
        report.clusterIndex = index;
        report.courses = buffer[pos + 1];
        report.sessions = buffer[pos + 2];
        report.domainPairs = buffer[pos + 3];
        report.strategy = (SolveStrategy)buffer[pos + 4];
        report.status = (SolveStatus)buffer[pos + 5];
        int flags = buffer[pos + 6];
        report.usedFallback = (flags & kFlagFallback) != 0;
        report.skippedByPrecheck = (flags & kFlagPrecheck) != 0;
        report.suspectedModelingDefect = (flags & kFlagDefect) != 0;
        report.relaxedSessions = buffer[pos + 7];
        report.seconds = buffer[pos + 8] / 1000.0;
        int count = buffer[pos + 9];
        pos += kHeaderInts;

        if (count < 0 || pos + 3 * (size_t)count > buffer.size()) {
            throw TimetableError("truncated placements in cluster result buffer");
        }
        result.placements.clear();
        result.placements.reserve(count);
        for (int k = 0; k < count; ++k, pos += 3) {
            Placement p;
            p.slot = buffer[pos + 1];
            p.roomIndex = buffer[pos + 2];
            result.placements.push_back({buffer[pos], p});
        }
        ++decoded;
    }
    return decoded;
}

/**
 * @brief Broadcast the clusters as [count, flatLen] followed by (size, members...) per cluster.
 *
 * On rank 0, `clusters` and `count` are the input; on other ranks they are filled in.
 */
void MPIClusterStage::broadcastClusters(std::vector<std::vector<int>>& clusters, int& count) {
    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    std::vector<int> flat;
    if (rank == 0 && count >= 0) {
        for (const auto& cluster : clusters) {
            flat.push_back((int)cluster.size());
            flat.insert(flat.end(), cluster.begin(), cluster.end());
        }
    }
    int header[2] = {count, (int)flat.size()};
    MPI_Bcast(header, 2, MPI_INT, 0, MPI_COMM_WORLD);
    count = header[0];
    if (count < 0) return;

    flat.resize(header[1]);
    if (header[1] > 0) MPI_Bcast(flat.data(), header[1], MPI_INT, 0, MPI_COMM_WORLD);
    if (rank == 0) return;

    clusters.assign(count, {});
    size_t pos = 0;
    for (int i = 0; i < count; ++i) {
        int n = flat[pos++];
        clusters[i].assign(flat.begin() + pos, flat.begin() + pos + n);
        pos += n;
    }
}

std::vector<ClusterResult> MPIClusterStage::solveAll(const SessionCatalog& catalog,
                                                     const std::vector<std::vector<int>>& clusters,
                                                     const SolverConfig& config,
                                                     unsigned seed,
                                                     StageReporter& reporter,
                                                     const CancellationToken& cancel) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
    if (rank != 0) throw TimetableError("MPIClusterStage::solveAll must run on rank 0");

    std::vector<std::vector<int>> shared = clusters;
    int count = (int)clusters.size();
    broadcastClusters(shared, count);

    std::vector<int> share = shareOf(0, size, count);
    std::vector<ClusterResult> results = local_.solveSubset(catalog, clusters, share, config, seed, reporter, cancel);

    // Every serving rank answers each broadcast, so all of them are received even after a cancel.
    for (int source = 1; source < size; ++source) {
        int len = 0;
        MPI_Recv(&len, 1, MPI_INT, source, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
        std::vector<int> buffer(len);
        if (len > 0) MPI_Recv(buffer.data(), len, MPI_INT, source, TAG_DATA, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
        int decoded = deserializeResults(buffer, results);
        reporter.increment(decoded);
        logDebug("Rank " + std::to_string(source) + " returned " + std::to_string(decoded) + " clusters");
    }
    logInfo("MPI cluster stage: " + std::to_string(count) + " clusters over " + std::to_string(size) + " ranks");
    return results;
}

void MPIClusterStage::serve(const SessionCatalog& catalog, const SolverConfig& config, unsigned seed) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    while (true) {
        std::vector<std::vector<int>> clusters;
        int count = 0;
        broadcastClusters(clusters, count);
        if (count < 0) break;

        std::vector<int> share = shareOf(rank, size, count);
        StageReporter reporter;
        reporter.setTotal((long)share.size());
        CancellationToken cancel;
        std::vector<ClusterResult> results =
                local_.solveSubset(catalog, clusters, share, config, seed, reporter, cancel);

        std::vector<int> buffer;
        serializeResults(results, share, buffer);
        int len = (int)buffer.size();
        MPI_Send(&len, 1, MPI_INT, 0, TAG_META, MPI_COMM_WORLD);
        if (len > 0) MPI_Send(buffer.data(), len, MPI_INT, 0, TAG_DATA, MPI_COMM_WORLD);
        logDebug("Rank " + std::to_string(rank) + " solved " + std::to_string(share.size()) + " clusters");
    }
}

void MPIClusterStage::shutdown() {
    std::vector<std::vector<int>> none;
    int count = -1;
    broadcastClusters(none, count);
}
