///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cluster_solver.hpp"
#include "greedy_scheduler.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <random>
#include <sstream>
#include <unordered_map>
#include <unordered_set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string formatStrategy(SolveStrategy strategy) {
    switch (strategy) {
        case SolveStrategy::FULL:             return "full";
        case SolveStrategy::RELAXED_STUDENTS: return "relaxed-students";
        case SolveStrategy::ESSENTIAL:        return "essential";
        case SolveStrategy::GREEDY:           return "greedy";
    }
    return "?";
}

static unsigned clusterSeed(unsigned seed, int clusterIndex) {
    return seed ^ ((unsigned)clusterIndex * 2654435761u);
}


///////////////////////////
///   CLUSTER SOLVER    ///
///////////////////////////
ClusterSolver::ClusterSolver(const SessionCatalog& catalog, const SolverConfig& config,
                             const CancellationToken* cancel)
        : catalog_(catalog), config_(config), cancel_(cancel) {}

long ClusterSolver::domainPairs(const std::vector<int>& courses) const {
    long pairs = 0;
    for (int c : courses) pairs += catalog_.domainSize(c) * (long)catalog_.sessionsOf(c).size();
    return pairs;
}

bool ClusterSolver::passesCapacityPrecheck(const std::vector<int>& courses) const {
    std::unordered_set<int> rooms;
    std::unordered_map<int, int> facultySessions;
    long sessions = 0;
    for (int c : courses) {
        const std::vector<int>& fitting = catalog_.fittingRooms(c);
        if (fitting.empty()) return false;
        rooms.insert(fitting.begin(), fitting.end());
        int count = (int)catalog_.sessionsOf(c).size();
        sessions += count;
        facultySessions[catalog_.facultyOf(c)] += count;
    }
    for (const auto& entry : facultySessions) {
        if (entry.second > catalog_.slotCount()) return false;
    }
    double supply = (double)catalog_.slotCount() * (double)rooms.size();
    return supply >= config_.capacityPrecheckRatio * (double)sessions;
}

std::vector<int> ClusterSolver::rankedStudents(const std::vector<int>& courses) const {
    std::unordered_map<int, int> coursesInCluster;
    for (int c : courses) {
        for (int st : catalog_.studentsOf(c)) ++coursesInCluster[st];
    }
    std::vector<int> ranked;
    for (const auto& entry : coursesInCluster) {
        if (entry.second >= 2) ranked.push_back(entry.first);
    }
    std::sort(ranked.begin(), ranked.end(), [this](int a, int b) {
        size_t ea = catalog_.coursesOfStudent(a).size(), eb = catalog_.coursesOfStudent(b).size();
        if (ea != eb) return ea > eb;
        int da = catalog_.departmentSpread(a), db = catalog_.departmentSpread(b);
        if (da != db) return da > db;
        return a < b;
    });
    return ranked;
}

/**
 * @brief Students whose cells are constrained under a strategy.
 */
std::vector<int> ClusterSolver::modeledStudents(const std::vector<int>& courses, SolveStrategy strategy,
                                                unsigned seed) const {
    if (strategy == SolveStrategy::ESSENTIAL || strategy == SolveStrategy::GREEDY) return {};
    std::vector<int> ranked = rankedStudents(courses);

    if (strategy == SolveStrategy::RELAXED_STUDENTS) {
        if ((int)ranked.size() > config_.relaxedPriorityStudentLimit) ranked.resize(config_.relaxedPriorityStudentLimit);
        return ranked;
    }
    if ((int)ranked.size() < config_.exactStudentThreshold) return ranked;

    int keep = std::min((int)ranked.size(), config_.priorityStudentLimit);
    std::vector<int> chosen(ranked.begin(), ranked.begin() + keep);
    std::mt19937 rng(seed);
    std::bernoulli_distribution sampled(config_.studentSampleRate);
    for (size_t i = keep; i < ranked.size(); ++i) {
        if (sampled(rng)) chosen.push_back(ranked[i]);
    }
    return chosen;
}

SolveResult ClusterSolver::solveWith(const std::vector<int>& courses, SolveStrategy strategy, unsigned seed,
                                     std::vector<std::pair<int, Placement>>& placements) const {
    int slots = catalog_.slotCount();
    std::mt19937 rng(seed);

    BoolModel model;
    struct Triple { int session; int slot; int room; };
    std::vector<Triple> triples;

    std::unordered_map<long long, std::vector<int>> roomCells, facultyCells;
    std::unordered_map<int, std::vector<int>> sessionVarsBySlot; // key: session * slots + slot

    for (int c : courses) {
        const std::vector<int>& rooms = catalog_.fittingRooms(c);
        std::vector<std::pair<int, int>> domain;
        domain.reserve((size_t)slots * rooms.size());
        for (int t = 0; t < slots; ++t)
            for (int r : rooms) domain.push_back({t, r});
        // Shuffled value order spreads independent clusters over the grid.
        std::shuffle(domain.begin(), domain.end(), rng);

        int faculty = catalog_.facultyOf(c);
        for (int s : catalog_.sessionsOf(c)) {
            std::vector<int> vars;
            vars.reserve(domain.size());
            for (const auto& pair : domain) {
                int v = model.newVar(catalog_.preferencePenalty(c, pair.first));
                triples.push_back({s, pair.first, pair.second});
                vars.push_back(v);
                roomCells[(long long)pair.second * slots + pair.first].push_back(v);
                facultyCells[(long long)faculty * slots + pair.first].push_back(v);
                sessionVarsBySlot[s * slots + pair.first].push_back(v);
            }
            model.addExactlyOne(vars);
        }
    }
    for (const auto& cell : roomCells) model.addAtMostOne(cell.second);
    for (const auto& cell : facultyCells) model.addAtMostOne(cell.second);

    std::unordered_set<int> inCluster(courses.begin(), courses.end());
    for (int st : modeledStudents(courses, strategy, seed)) {
        for (int t = 0; t < slots; ++t) {
            std::vector<int> vars;
            for (int c : catalog_.coursesOfStudent(st)) {
                if (!inCluster.count(c)) continue;
                for (int s : catalog_.sessionsOf(c)) {
                    auto it = sessionVarsBySlot.find(s * slots + t);
                    if (it != sessionVarsBySlot.end()) vars.insert(vars.end(), it->second.begin(), it->second.end());
                }
            }
            model.addAtMostOne(vars);
        }
    }

    BoolSolver solver(config_.strategyTimeLimitSeconds, cancel_);
    SolveResult result = solver.solve(model);

    placements.clear();
    if (result.status == SolveStatus::OPTIMAL || result.status == SolveStatus::FEASIBLE) {
        for (int v = 0; v < model.varCount(); ++v) {
            if (result.values[v]) placements.push_back({triples[v].session, Placement{triples[v].slot, triples[v].room}});
        }
    }
    return result;
}

ClusterResult ClusterSolver::solve(const std::vector<int>& courses, int clusterIndex, unsigned seed) const {
    auto start = std::chrono::steady_clock::now();
    unsigned localSeed = clusterSeed(seed, clusterIndex);

    ClusterResult result;
    ClusterSolveReport& report = result.report;
    report.clusterIndex = clusterIndex;
    report.courses = (int)courses.size();
    for (int c : courses) report.sessions += (int)catalog_.sessionsOf(c).size();
    report.domainPairs = domainPairs(courses);

    bool solved = false;
    if (!passesCapacityPrecheck(courses)) {
        report.skippedByPrecheck = true;
        logWarning("Cluster " + std::to_string(clusterIndex) + " fails the capacity pre-check; using greedy fallback");
    } else {
        const SolveStrategy strategies[] = {SolveStrategy::FULL, SolveStrategy::RELAXED_STUDENTS, SolveStrategy::ESSENTIAL};
        for (SolveStrategy strategy : strategies) {
            if (cancel_ && cancel_->isCancelled()) break;
            SolveResult attempt = solveWith(courses, strategy, localSeed, result.placements);

            if (attempt.status == SolveStatus::INFEASIBLE &&
                attempt.seconds <= config_.defectMaxSeconds &&
                report.domainPairs >= config_.defectDomainPairs) {
                report.suspectedModelingDefect = true;
                logError("Cluster " + std::to_string(clusterIndex) + " reported INFEASIBLE in " +
                         std::to_string(attempt.seconds) + "s over " + std::to_string(report.domainPairs) +
                         " domain pairs (" + formatStrategy(strategy) + "); suspected modeling defect");
            }
            logDebug("Cluster " + std::to_string(clusterIndex) + " " + formatStrategy(strategy) + ": " +
                     formatSolveStatus(attempt.status) + " after " + std::to_string(attempt.decisions) + " decisions");

            if (attempt.status == SolveStatus::OPTIMAL || attempt.status == SolveStatus::FEASIBLE) {
                report.strategy = strategy;
                report.status = attempt.status;
                solved = true;
                break;
            }
        }
    }

    if (!solved) {
        GreedyScheduler greedy(catalog_, config_);
        GreedyResult fallback = greedy.schedule(courses, localSeed);
        result.placements = std::move(fallback.placements);
        report.strategy = SolveStrategy::GREEDY;
        report.usedFallback = true;
        report.relaxedSessions = fallback.relaxedSessions;
        if (!report.skippedByPrecheck) {
            logWarning("Cluster " + std::to_string(clusterIndex) + " (" + std::to_string(report.courses) +
                       " courses): every strategy failed, greedy fallback placed " +
                       std::to_string(result.placements.size()) + " sessions (" +
                       std::to_string(fallback.relaxedSessions) + " relaxed)");
        }
    }

    report.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}
