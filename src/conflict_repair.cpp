///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "conflict_repair.hpp"
#include "clustering.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <set>
#include <sstream>
#include <unordered_set>


///////////////////////////
///     CANDIDATES      ///
///////////////////////////
ConflictRepairer::ConflictRepairer(const SessionCatalog& catalog, const RepairConfig& config,
                                   const ClusteringConfig& clustering, SearchContext& context, int numThreads)
        : catalog_(catalog), config_(config), clustering_(clustering), context_(context),
          numThreads_(std::max(1, numThreads)) {}

std::vector<Placement> ConflictRepairer::feasibleCandidates(const ScheduleState& state, int session) const {
    std::vector<Placement> candidates;
    const Placement& current = state.placement(session);
    const std::vector<int>& rooms = catalog_.fittingRooms(catalog_.session(session).courseIndex);
    for (int t = 0; t < catalog_.slotCount(); ++t) {
        if ((int)candidates.size() >= config_.maxCandidatesPerSession) break;
        for (int r : rooms) {
            if (current.slot == t && current.roomIndex == r) continue;
            if (!state.wouldConflict(session, t, r)) {
                candidates.push_back({t, r});
                break;
            }
        }
    }
    return candidates;
}

std::string ConflictRepairer::moveSignature(const ScheduleState& state, int session, int slot, bool swap) const {
    const Placement& p = state.placement(session);
    int c = catalog_.session(session).courseIndex;

    // Dominant conflict kind at the current cell.
    std::string kind = "none";
    if (p.assigned()) {
        if (state.facultyLoad(catalog_.facultyOf(c), p.slot) > 1) kind = "faculty";
        else if (state.roomLoad(p.roomIndex, p.slot) > 1) kind = "room";
        else if (state.sessionConflicts(session) > 0) kind = "student";
    }
    int load = std::min(3, state.sessionConflicts(session));
    std::ostringstream sig;
    sig << kind << "|p" << catalog_.grid().periodOf(slot) << "|c" << load << "|" << (swap ? "swap" : "move");
    return sig.str();
}

/**
 * @brief Order candidates by learned value (cold table: earliest slot first).
 */
void ConflictRepairer::rankCandidates(const ScheduleState& state, int session,
                                      std::vector<Placement>& candidates) const {
    if (context_.valueTable.empty()) return; // already earliest-slot order
    std::vector<std::pair<double, size_t>> scored;
    for (size_t i = 0; i < candidates.size(); ++i) {
        scored.push_back({context_.valueTable.value(moveSignature(state, session, candidates[i].slot, false)), i});
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const std::pair<double, size_t>& a, const std::pair<double, size_t>& b) {
                         return a.first > b.first;
                     });
    std::vector<Placement> ranked;
    ranked.reserve(candidates.size());
    for (const auto& entry : scored) ranked.push_back(candidates[entry.second]);
    candidates.swap(ranked);
}

bool ConflictRepairer::trySwapFor(ScheduleState& state, int session, const std::vector<int>& scopeSessions) {
    int slot = state.placement(session).slot;
    for (int other : scopeSessions) {
        if (other == session || state.placement(other).slot == slot) continue;
        int before = state.sessionConflicts(session) + state.sessionConflicts(other);
        std::string signature = moveSignature(state, session, state.placement(other).slot, true);
        if (state.trySwap(session, other)) {
            context_.valueTable.update(signature, (double)before, config_.learningRate);
            return true;
        }
    }
    return false;
}


///////////////////////////
///      FOOTPRINTS     ///
///////////////////////////
ScopeFootprint ConflictRepairer::footprint(const ScheduleState& state, const std::vector<int>& courses) const {
    std::set<int> faculty, students, rooms;
    for (int c : courses) {
        faculty.insert(catalog_.facultyOf(c));
        students.insert(catalog_.studentsOf(c).begin(), catalog_.studentsOf(c).end());
        rooms.insert(catalog_.fittingRooms(c).begin(), catalog_.fittingRooms(c).end());
        for (int s : catalog_.sessionsOf(c)) {
            if (state.placement(s).assigned()) rooms.insert(state.placement(s).roomIndex);
        }
    }
    ScopeFootprint fp;
    fp.faculty.assign(faculty.begin(), faculty.end());
    fp.students.assign(students.begin(), students.end());
    fp.rooms.assign(rooms.begin(), rooms.end());
    return fp;
}

int ConflictRepairer::footprintConflicts(const ScheduleState& state, const ScopeFootprint& fp) const {
    int total = 0;
    for (int t = 0; t < catalog_.slotCount(); ++t) {
        for (int f : fp.faculty) total += std::max(0, state.facultyLoad(f, t) - 1);
        for (int r : fp.rooms) total += std::max(0, state.roomLoad(r, t) - 1);
        for (int st : fp.students) total += std::max(0, state.studentLoad(st, t) - 1);
    }
    return total;
}

/**
 * @brief Group scopes into waves whose footprints are pairwise disjoint.
 */
std::vector<std::vector<int>> ConflictRepairer::disjointWaves(const ScheduleState& state,
                                                              const std::vector<std::vector<int>>& scopes) const {
    struct Wave {
        std::vector<int> members;
        std::unordered_set<int> faculty, students, rooms;
    };
    std::vector<Wave> waves;
    for (int i = 0; i < (int)scopes.size(); ++i) {
        ScopeFootprint fp = footprint(state, scopes[i]);
        auto overlaps = [&fp](const Wave& w) {
            for (int f : fp.faculty) if (w.faculty.count(f)) return true;
            for (int r : fp.rooms) if (w.rooms.count(r)) return true;
            for (int st : fp.students) if (w.students.count(st)) return true;
            return false;
        };
        Wave* target = nullptr;
        for (Wave& w : waves) {
            if (!overlaps(w)) { target = &w; break; }
        }
        if (!target) {
            waves.emplace_back();
            target = &waves.back();
        }
        target->members.push_back(i);
        target->faculty.insert(fp.faculty.begin(), fp.faculty.end());
        target->rooms.insert(fp.rooms.begin(), fp.rooms.end());
        target->students.insert(fp.students.begin(), fp.students.end());
    }
    std::vector<std::vector<int>> out;
    for (Wave& w : waves) out.push_back(std::move(w.members));
    return out;
}


///////////////////////////
///       REPAIR        ///
///////////////////////////
ScopeReport ConflictRepairer::repairScope(ScheduleState& state, const std::vector<int>& courses) {
    ScopeReport report;
    for (int c : courses) report.courseIds.push_back(catalog_.course(c).id);

    ScopeFootprint fp = footprint(state, courses);
    report.before = footprintConflicts(state, fp);

    std::vector<int> sessions;
    for (int c : courses) {
        for (int s : catalog_.sessionsOf(c)) sessions.push_back(s);
    }
    std::vector<Placement> snapshot;
    for (int s : sessions) snapshot.push_back(state.placement(s));

    // Worst sessions first.
    std::vector<int> order = sessions;
    std::stable_sort(order.begin(), order.end(), [&state](int a, int b) {
        return state.sessionConflicts(a) > state.sessionConflicts(b);
    });

    for (int s : order) {
        int conflicts = state.sessionConflicts(s);
        if (conflicts == 0) continue;

        std::vector<Placement> candidates = feasibleCandidates(state, s);
        rankCandidates(state, s, candidates);

        bool applied = false;
        for (const Placement& candidate : candidates) {
            std::string signature = moveSignature(state, s, candidate.slot, false);
            // Re-validated at apply time: earlier moves change the feasible set.
            if (state.tryMove(s, candidate.slot, candidate.roomIndex)) {
                context_.valueTable.update(signature, (double)conflicts, config_.learningRate);
                ++report.moves;
                applied = true;
                break;
            }
        }
        if (!applied && config_.allowSwaps && trySwapFor(state, s, sessions)) {
            ++report.swaps;
            applied = true;
        }
        if (!applied) ++report.rejected;
    }

    report.after = footprintConflicts(state, fp);
    if (report.after > report.before || (report.before > 0 && report.after == report.before)) {
        if (report.after > report.before) {
            logError("Repair scope regressed (" + std::to_string(report.before) + " -> " +
                     std::to_string(report.after) + "); rolling back");
        }
        for (size_t i = 0; i < sessions.size(); ++i) state.restore(sessions[i], snapshot[i]);
        report.after = footprintConflicts(state, fp);
        report.rolledBack = true;
        report.manualReview = report.after > 0;
    }
    return report;
}

RepairReport ConflictRepairer::repair(ScheduleState& state, StageReporter* reporter,
                                      const CancellationToken* cancel) {
    auto start = std::chrono::steady_clock::now();
    RepairReport report;
    report.before = state.conflictCount();
    report.after = report.before;
    if (reporter) reporter->setTotal(config_.maxPasses);
    auto deadlinePassed = [this, start]() {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return elapsed > config_.timeLimitSeconds;
    };

    CourseClusterer clusterer(catalog_, clustering_);

    for (int pass = 0; pass < config_.maxPasses && state.conflictCount() > 0; ++pass) {
        if (cancel && cancel->isCancelled()) { report.cancelled = true; break; }
        if (deadlinePassed()) { report.timedOut = true; break; }

        // Conflicting courses, grouped into cohort-sized scopes.
        std::set<int> conflicting;
        for (int s = 0; s < catalog_.sessionCount(); ++s) {
            if (state.sessionConflicts(s) > 0) conflicting.insert(catalog_.session(s).courseIndex);
        }
        std::vector<std::vector<int>> scopes =
                clusterer.superClusters(std::vector<int>(conflicting.begin(), conflicting.end()));

        int passBefore = state.conflictCount();
        std::vector<ScopeReport> scopeReports(scopes.size());

        std::vector<std::vector<int>> waves;
        if (config_.concurrentScopes && numThreads_ > 1) {
            waves = disjointWaves(state, scopes);
        } else {
            for (int i = 0; i < (int)scopes.size(); ++i) waves.push_back({i});
        }

        for (const std::vector<int>& wave : waves) {
            if (cancel && cancel->isCancelled()) { report.cancelled = true; break; }
            if (deadlinePassed()) { report.timedOut = true; break; }
            if (wave.size() == 1) {
                scopeReports[wave[0]] = repairScope(state, scopes[wave[0]]);
                continue;
            }
            // Footprints are disjoint: each task touches its own occupancy cells only.
            std::vector<std::future<void>> tasks;
            for (size_t offset = 0; offset < wave.size(); offset += numThreads_) {
                if (offset > 0 && deadlinePassed()) { report.timedOut = true; break; }
                tasks.clear();
                size_t end = std::min(wave.size(), offset + (size_t)numThreads_);
                for (size_t k = offset; k < end; ++k) {
                    int index = wave[k];
                    tasks.push_back(std::async(std::launch::async, [this, &state, &scopes, &scopeReports, index]() {
                        scopeReports[index] = repairScope(state, scopes[index]);
                    }));
                }
                for (auto& task : tasks) task.get();
            }
        }

        ++report.passes;
        for (const ScopeReport& scope : scopeReports) {
            report.moves += scope.moves;
            report.swaps += scope.swaps;
            if (scope.rolledBack) ++report.rollbacks;
        }
        report.scopes = std::move(scopeReports);
        if (reporter) reporter->report(pass + 1);

        std::ostringstream msg;
        msg << "Repair pass " << (pass + 1) << ": " << scopes.size() << " scopes in " << waves.size()
            << " waves, conflicts " << passBefore << " -> " << state.conflictCount();
        logInfo(msg.str());
        if (report.cancelled || report.timedOut) break;
        if (state.conflictCount() >= passBefore) break; // no further progress possible
    }

    report.after = state.conflictCount();
    std::set<int> review;
    for (const ScopeReport& scope : report.scopes) {
        if (scope.manualReview) review.insert(scope.courseIds.begin(), scope.courseIds.end());
    }
    report.manualReviewCourseIds.assign(review.begin(), review.end());
    if (!report.manualReviewCourseIds.empty()) {
        logWarning(std::to_string(report.manualReviewCourseIds.size()) + " courses flagged for manual review");
    }
    if (reporter && !report.cancelled) reporter->report(config_.maxPasses);
    return report;
}
