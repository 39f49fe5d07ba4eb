#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "config.hpp"
#include "schedule_state.hpp"
#include <utility>
#include <vector>


///////////////////////////
///       GREEDY        ///
///////////////////////////
/**
 * @brief Placements produced by the greedy fallback for one group of courses.
 */
struct GreedyResult {
    std::vector<std::pair<int, Placement>> placements; ///< (session, placement) for every session.
    int relaxedSessions = 0; ///< Sessions placed without a conflict-free pair.
    int outOfDomainSessions = 0; ///< Sessions placed in a room that does not fit the course.
};

/**
 * @brief Fast first-fit scheduler used when exact solving fails or is skipped.
 *
 * Courses are processed largest enrollment first. Each session takes the first
 * (slot, room) pair whose faculty and room cells are free and where a bounded
 * sample of enrolled students is free. When no such pair exists it relaxes to
 * a free room cell of a fitting room, then to any fitting room, and finally to
 * the largest room of any type; every relaxation is counted so the resulting
 * overlaps reach conflict repair. It always returns a complete assignment.
 */
class GreedyScheduler {
public:
    GreedyScheduler(const SessionCatalog& catalog, const SolverConfig& config);

    /**
     * @param courses Dense course indices to place.
     * @param seed    Rotates the slot scan so independent groups spread over the week.
     */
    GreedyResult schedule(const std::vector<int>& courses, unsigned seed) const;

private:
    const SessionCatalog& catalog_;
    SolverConfig config_;

    std::vector<int> studentSample(int courseIndex) const;
};
