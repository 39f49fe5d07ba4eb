///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "clustering.hpp"
#include "logging.hpp"
#include <algorithm>
#include <numeric>
#include <queue>
#include <sstream>
#include <unordered_map>


///////////////////////////
///       GRAPH         ///
///////////////////////////
int CourseGraph::edgeCount() const {
    int twice = 0;
    for (const auto& row : adjacency) twice += (int)row.size();
    return twice / 2;
}

CourseClusterer::CourseClusterer(const SessionCatalog& catalog, const ClusteringConfig& config)
        : catalog_(catalog), config_(config) {}

CourseGraph CourseClusterer::buildGraph() const {
    std::vector<int> all(catalog_.courseCount());
    std::iota(all.begin(), all.end(), 0);
    return buildGraph(all);
}

/**
 * @brief Build the weighted graph over a course subset (node i = courses[i]).
 *
 * Pairs are discovered through the faculty and student inverted indices only,
 * so the cost follows the overlap structure instead of n^2.
 */
CourseGraph CourseClusterer::buildGraph(const std::vector<int>& courses) const {
    int n = (int)courses.size();
    std::unordered_map<int, int> local;
    for (int i = 0; i < n; ++i) local[courses[i]] = i;

    auto key = [](int a, int b) {
        if (a > b) std::swap(a, b);
        return ((long long)a << 32) | (unsigned)b;
    };
    std::unordered_map<long long, double> weights;

    // Shared faculty.
    std::unordered_map<int, std::vector<int>> byFaculty;
    for (int i = 0; i < n; ++i) byFaculty[catalog_.facultyOf(courses[i])].push_back(i);
    for (const auto& entry : byFaculty) {
        const std::vector<int>& group = entry.second;
        for (size_t a = 0; a < group.size(); ++a)
            for (size_t b = a + 1; b < group.size(); ++b)
                weights[key(group[a], group[b])] += 10.0;
    }

    // Shared students.
    std::unordered_map<long long, int> shared;
    std::vector<bool> seenStudent(catalog_.studentCount(), false);
    for (int i = 0; i < n; ++i) {
        for (int st : catalog_.studentsOf(courses[i])) {
            if (seenStudent[st]) continue;
            seenStudent[st] = true;
            std::vector<int> mine;
            for (int c : catalog_.coursesOfStudent(st)) {
                auto it = local.find(c);
                if (it != local.end()) mine.push_back(it->second);
            }
            for (size_t a = 0; a < mine.size(); ++a)
                for (size_t b = a + 1; b < mine.size(); ++b)
                    ++shared[key(mine[a], mine[b])];
        }
    }
    for (const auto& entry : shared) {
        int a = (int)(entry.first >> 32);
        int b = (int)(entry.first & 0xffffffffLL);
        double larger = (double)std::max(catalog_.studentsOf(courses[a]).size(),
                                         catalog_.studentsOf(courses[b]).size());
        weights[entry.first] += 10.0 * entry.second / larger;
    }

    CourseGraph graph;
    graph.adjacency.resize(n);
    for (const auto& entry : weights) {
        int a = (int)(entry.first >> 32);
        int b = (int)(entry.first & 0xffffffffLL);
        double w = entry.second;
        // Department affinity strengthens existing links only.
        if (catalog_.course(courses[a]).departmentId == catalog_.course(courses[b]).departmentId) w += 5.0;
        if (w < config_.minEdgeWeight) continue;
        graph.adjacency[a].push_back({b, w});
        graph.adjacency[b].push_back({a, w});
        graph.totalWeight += w;
    }
    // Hash order is unspecified; sort so the community pass is deterministic.
    for (auto& row : graph.adjacency) std::sort(row.begin(), row.end());
    return graph;
}


///////////////////////////
///     COMMUNITIES     ///
///////////////////////////
double CourseClusterer::modularity(const CourseGraph& graph, const std::vector<int>& community) {
    double m = graph.totalWeight;
    if (m <= 0.0) return 0.0;

    int n = graph.nodeCount();
    std::vector<double> inside(n, 0.0), total(n, 0.0);
    for (int i = 0; i < n; ++i) {
        for (const auto& edge : graph.adjacency[i]) {
            total[community[i]] += edge.second;
            if (community[edge.first] == community[i]) inside[community[i]] += edge.second;
        }
    }
    double q = 0.0;
    for (int c = 0; c < n; ++c) {
        q += inside[c] / (2.0 * m) - (total[c] / (2.0 * m)) * (total[c] / (2.0 * m));
    }
    return q;
}

/**
 * @brief Louvain local-moving phase.
 *
 * Each node moves to the neighboring community with the largest modularity
 * gain k_i,in - tot_c * k_i / 2m until a pass makes no move.
 */
std::vector<int> CourseClusterer::localMoving(const CourseGraph& graph) const {
    int n = graph.nodeCount();
    std::vector<int> community(n);
    std::iota(community.begin(), community.end(), 0);
    double m2 = 2.0 * graph.totalWeight;
    if (m2 <= 0.0) return community;

    std::vector<double> degree(n, 0.0), total(n, 0.0);
    for (int i = 0; i < n; ++i) {
        for (const auto& edge : graph.adjacency[i]) degree[i] += edge.second;
        total[i] = degree[i];
    }

    std::vector<double> linkTo(n, 0.0);
    std::vector<int> touched;
    for (int pass = 0; pass < config_.maxPasses; ++pass) {
        int moves = 0;
        for (int i = 0; i < n; ++i) {
            int own = community[i];
            touched.clear();
            for (const auto& edge : graph.adjacency[i]) {
                int c = community[edge.first];
                if (linkTo[c] == 0.0) touched.push_back(c);
                linkTo[c] += edge.second;
            }

            total[own] -= degree[i];
            int best = own;
            double bestGain = linkTo[own] - total[own] * degree[i] / m2;
            for (int c : touched) {
                double gain = linkTo[c] - total[c] * degree[i] / m2;
                if (gain > bestGain + 1e-12) {
                    bestGain = gain;
                    best = c;
                }
            }
            total[best] += degree[i];
            if (best != own) {
                community[i] = best;
                ++moves;
            }
            for (int c : touched) linkTo[c] = 0.0;
        }
        if (moves == 0) break;
    }
    return community;
}

/**
 * @brief Apply the size bounds to raw communities.
 *
 * Oversized communities are cut into chunks along a breadth-first order of
 * the graph (strongest edges first) so each chunk stays connected where
 * possible. Communities below minClusterSize are pooled, ordered by
 * department and packed into clusters of at most maxSize.
 */
std::vector<std::vector<int>> CourseClusterer::boundSizes(const std::vector<std::vector<int>>& communities,
                                                          int maxSize) const {
    std::vector<std::vector<int>> result;
    std::vector<int> small;

    for (const auto& community : communities) {
        if ((int)community.size() > maxSize) {
            for (size_t i = 0; i < community.size(); i += maxSize) {
                size_t end = std::min(community.size(), i + (size_t)maxSize);
                result.emplace_back(community.begin() + i, community.begin() + end);
            }
        } else if ((int)community.size() < config_.minClusterSize) {
            small.insert(small.end(), community.begin(), community.end());
        } else {
            result.push_back(community);
        }
    }

    std::stable_sort(small.begin(), small.end(), [this](int a, int b) {
        return catalog_.course(a).departmentId < catalog_.course(b).departmentId;
    });
    std::vector<int> pack;
    for (int c : small) {
        bool full = (int)pack.size() >= maxSize;
        bool departmentBreak = !pack.empty() && (int)pack.size() >= config_.minClusterSize &&
                               catalog_.course(pack.back()).departmentId != catalog_.course(c).departmentId;
        if (full || departmentBreak) {
            result.push_back(pack);
            pack.clear();
        }
        pack.push_back(c);
    }
    if (!pack.empty()) result.push_back(pack);
    return result;
}

Clustering CourseClusterer::cluster(const std::vector<int>& courses, int maxSize) const {
    Clustering out;
    if (courses.empty()) return out;

    CourseGraph graph = buildGraph(courses);
    std::vector<int> community = localMoving(graph);
    out.modularity = modularity(graph, community);

    // Group members, visiting each community breadth-first from its first node.
    int n = (int)courses.size();
    std::vector<std::vector<int>> members(n);
    std::vector<bool> visited(n, false);
    for (int start = 0; start < n; ++start) {
        if (visited[start]) continue;
        int c = community[start];
        std::queue<int> frontier;
        frontier.push(start);
        visited[start] = true;
        while (!frontier.empty()) {
            int node = frontier.front();
            frontier.pop();
            members[c].push_back(courses[node]);
            std::vector<std::pair<double, int>> next;
            for (const auto& edge : graph.adjacency[node]) {
                if (!visited[edge.first] && community[edge.first] == c) next.push_back({edge.second, edge.first});
            }
            std::sort(next.begin(), next.end(), [](const std::pair<double, int>& a, const std::pair<double, int>& b) {
                return a.first > b.first || (a.first == b.first && a.second < b.second);
            });
            for (const auto& nb : next) {
                if (visited[nb.second]) continue;
                visited[nb.second] = true;
                frontier.push(nb.second);
            }
        }
    }

    std::vector<std::vector<int>> communities;
    size_t largest = 0;
    for (auto& group : members) {
        if (group.empty()) continue;
        largest = std::max(largest, group.size());
        communities.push_back(std::move(group));
    }
    out.degenerate = n > maxSize && largest * 10 >= (size_t)n * 9;
    out.clusters = boundSizes(communities, maxSize);
    return out;
}

Clustering CourseClusterer::cluster() const {
    std::vector<int> all(catalog_.courseCount());
    std::iota(all.begin(), all.end(), 0);
    Clustering result = cluster(all, config_.maxClusterSize);

    size_t smallest = all.size(), largest = 0;
    for (const auto& c : result.clusters) {
        smallest = std::min(smallest, c.size());
        largest = std::max(largest, c.size());
    }
    std::ostringstream msg;
    msg << "Clustering: " << all.size() << " courses -> " << result.clusters.size()
        << " clusters (sizes " << (result.clusters.empty() ? 0 : smallest) << ".." << largest
        << "), modularity " << result.modularity;
    logInfo(msg.str());
    if (result.degenerate) {
        logWarning("Clustering degenerated to one community; clusters are size-bound chunks of it");
    }
    return result;
}

std::vector<std::vector<int>> CourseClusterer::superClusters(const std::vector<int>& courses) const {
    return cluster(courses, config_.superClusterMaxSize).clusters;
}
