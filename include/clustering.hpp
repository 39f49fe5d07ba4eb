#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "config.hpp"
#include <vector>


///////////////////////////
///       TYPES         ///
///////////////////////////
/**
 * @brief Weighted, undirected course graph in adjacency-list form.
 */
struct CourseGraph {
    std::vector<std::vector<std::pair<int, double>>> adjacency; ///< (neighbor, weight) per course.
    double totalWeight = 0.0; ///< Sum of edge weights (each edge counted once).

    int nodeCount() const { return (int)adjacency.size(); }
    int edgeCount() const;
};

/**
 * @brief Partition of courses (dense indices) into clusters.
 */
struct Clustering {
    std::vector<std::vector<int>> clusters; ///< Course indices per cluster.
    double modularity = 0.0; ///< Modularity of the community pass before size bounds.
    bool degenerate = false; ///< One community held (almost) every course.
};


///////////////////////////
///     CLUSTERING      ///
///////////////////////////
/**
 * @brief Community-detection clustering of courses.
 *
 * Edges join courses that share a faculty member (+10), share students
 * (+10 * |A∩B| / max(|A|,|B|)) or, when already linked, belong to the same
 * department (+5). A Louvain-style local-moving pass maximizes modularity;
 * the resulting communities are then split to the size bound and small ones
 * are packed together by department.
 */
class CourseClusterer {
public:
    CourseClusterer(const SessionCatalog& catalog, const ClusteringConfig& config);

    /// Build the course graph from faculty and student inverted indices.
    CourseGraph buildGraph() const;

    /// Partition every course into clusters of at most maxClusterSize courses.
    Clustering cluster() const;

    /// Partition a subset of courses into clusters of at most maxSize courses.
    Clustering cluster(const std::vector<int>& courses, int maxSize) const;

    /**
     * @brief Super-clusters for conflict repair.
     *
     * Groups the given courses by their shared-student connectivity so that a
     * cohort's cross-enrolled course set lands in one scope, bounded by
     * superClusterMaxSize.
     */
    std::vector<std::vector<int>> superClusters(const std::vector<int>& courses) const;

    /// Modularity of a community assignment over a graph.
    static double modularity(const CourseGraph& graph, const std::vector<int>& community);

private:
    const SessionCatalog& catalog_;
    ClusteringConfig config_;

    CourseGraph buildGraph(const std::vector<int>& courses) const;
    std::vector<int> localMoving(const CourseGraph& graph) const;
    std::vector<std::vector<int>> boundSizes(const std::vector<std::vector<int>>& communities, int maxSize) const;
};
