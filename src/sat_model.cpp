///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sat_model.hpp"
#include <algorithm>
#include <chrono>
#include <limits>


///////////////////////////
///       MODEL         ///
///////////////////////////
std::string formatSolveStatus(SolveStatus status) {
    switch (status) {
        case SolveStatus::OPTIMAL:    return "OPTIMAL";
        case SolveStatus::FEASIBLE:   return "FEASIBLE";
        case SolveStatus::INFEASIBLE: return "INFEASIBLE";
        case SolveStatus::UNKNOWN:    return "UNKNOWN";
    }
    return "?";
}

int BoolModel::newVar(double cost) {
    costs_.push_back(cost);
    varConstraints_.emplace_back();
    return (int)costs_.size() - 1;
}

void BoolModel::addExactlyOne(const std::vector<int>& vars) {
    addConstraint(vars, true);
}

void BoolModel::addAtMostOne(const std::vector<int>& vars) {
    if (vars.size() < 2) return; // trivially satisfied
    addConstraint(vars, false);
}

void BoolModel::addConstraint(const std::vector<int>& vars, bool exactlyOne) {
    int index = (int)constraints_.size();
    constraints_.push_back({vars, exactlyOne});
    for (int v : vars) varConstraints_[v].push_back(index);
}

double BoolModel::costLowerBound() const {
    double bound = 0.0;
    for (const Constraint& c : constraints_) {
        if (!c.exactlyOne || c.vars.empty()) continue;
        double best = std::numeric_limits<double>::max();
        for (int v : c.vars) best = std::min(best, costs_[v]);
        bound += best;
    }
    return bound;
}


///////////////////////////
///       SEARCH        ///
///////////////////////////
namespace {

enum class Outcome { FOUND, EXHAUSTED, ABORTED };

/**
 * @brief Trail-based search state for one solve call.
 */
class Search {
public:
    Search(const BoolModel& model,
           const std::vector<std::vector<int>>& varConstraints,
           const std::vector<std::pair<const std::vector<int>*, bool>>& constraints,
           double timeLimit, const CancellationToken* cancel)
            : model_(model), varConstraints_(varConstraints), constraints_(constraints),
              timeLimit_(timeLimit), cancel_(cancel),
              value_(model.varCount(), -1),
              trueCount_(constraints.size(), 0),
              open_(constraints.size(), 0),
              start_(std::chrono::steady_clock::now()) {
        for (size_t c = 0; c < constraints.size(); ++c) open_[c] = (int)constraints[c].first->size();
    }

    Outcome run() {
        // Empty exactly-one constraints can never be satisfied.
        for (size_t c = 0; c < constraints_.size(); ++c) {
            if (constraints_[c].second && open_[c] == 0) return Outcome::EXHAUSTED;
        }
        if (!propagate()) return Outcome::EXHAUSTED;
        return branch();
    }

    long decisions() const { return decisions_; }
    double elapsed() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }
    const std::vector<signed char>& values() const { return value_; }

private:
    const BoolModel& model_;
    const std::vector<std::vector<int>>& varConstraints_;
    const std::vector<std::pair<const std::vector<int>*, bool>>& constraints_;
    double timeLimit_;
    const CancellationToken* cancel_;

    std::vector<signed char> value_;
    std::vector<int> trueCount_;
    std::vector<int> open_;
    std::vector<int> trail_;
    std::vector<int> queue_;
    long decisions_ = 0;
    std::chrono::steady_clock::time_point start_;

    bool assign(int var, bool truth) {
        if (value_[var] >= 0) return value_[var] == (truth ? 1 : 0);
        value_[var] = truth ? 1 : 0;
        trail_.push_back(var);
        queue_.push_back(var);
        for (int c : varConstraints_[var]) {
            --open_[c];
            if (truth) ++trueCount_[c];
        }
        return true;
    }

    void undoTo(size_t mark) {
        while (trail_.size() > mark) {
            int var = trail_.back();
            trail_.pop_back();
            for (int c : varConstraints_[var]) {
                ++open_[c];
                if (value_[var] == 1) --trueCount_[c];
            }
            value_[var] = -1;
        }
        queue_.clear();
    }

    bool propagate() {
        while (!queue_.empty()) {
            int var = queue_.back();
            queue_.pop_back();
            for (int c : varConstraints_[var]) {
                if (trueCount_[c] > 1) return false;
                if (value_[var] == 1) {
                    for (int other : *constraints_[c].first) {
                        if (other != var && !assign(other, false)) return false;
                    }
                } else if (constraints_[c].second && trueCount_[c] == 0) {
                    if (open_[c] == 0) return false;
                    if (open_[c] == 1) {
                        for (int other : *constraints_[c].first) {
                            if (value_[other] < 0) {
                                if (!assign(other, true)) return false;
                                break;
                            }
                        }
                    }
                }
            }
        }
        return true;
    }

    bool outOfBudget() {
        if ((decisions_ & 255) != 0) return false;
        if (cancel_ && cancel_->isCancelled()) return true;
        return elapsed() > timeLimit_;
    }

    Outcome branch() {
        // Most constrained open exactly-one constraint.
        int chosen = -1;
        int fewest = std::numeric_limits<int>::max();
        for (size_t c = 0; c < constraints_.size(); ++c) {
            if (!constraints_[c].second || trueCount_[c] > 0) continue;
            if (open_[c] < fewest) {
                fewest = open_[c];
                chosen = (int)c;
            }
        }
        if (chosen < 0) return Outcome::FOUND;

        std::vector<int> candidates;
        for (int v : *constraints_[chosen].first) {
            if (value_[v] < 0) candidates.push_back(v);
        }
        std::stable_sort(candidates.begin(), candidates.end(),
                         [this](int a, int b) { return model_.cost(a) < model_.cost(b); });

        for (int v : candidates) {
            if (value_[v] >= 0) continue;
            if (outOfBudget()) return Outcome::ABORTED;
            ++decisions_;
            size_t mark = trail_.size();
            if (assign(v, true) && propagate()) {
                Outcome outcome = branch();
                if (outcome != Outcome::EXHAUSTED) return outcome;
            }
            undoTo(mark);
            // v is refuted at this level; the caller undoes these assignments.
            if (!assign(v, false) || !propagate()) return Outcome::EXHAUSTED;
            if (trueCount_[chosen] > 0) return branch();
        }
        return Outcome::EXHAUSTED;
    }
};

} // namespace


///////////////////////////
///       SOLVER        ///
///////////////////////////
BoolSolver::BoolSolver(double timeLimitSeconds, const CancellationToken* cancel)
        : timeLimit_(timeLimitSeconds), cancel_(cancel) {}

SolveResult BoolSolver::solve(const BoolModel& model) {
    std::vector<std::pair<const std::vector<int>*, bool>> constraints;
    constraints.reserve(model.constraints_.size());
    for (const BoolModel::Constraint& c : model.constraints_) constraints.push_back({&c.vars, c.exactlyOne});

    Search search(model, model.varConstraints_, constraints, timeLimit_, cancel_);
    Outcome outcome = search.run();

    SolveResult result;
    result.seconds = search.elapsed();
    result.decisions = search.decisions();
    if (outcome == Outcome::ABORTED) {
        result.status = SolveStatus::UNKNOWN;
        return result;
    }
    if (outcome == Outcome::EXHAUSTED) {
        result.status = SolveStatus::INFEASIBLE;
        return result;
    }

    result.values.resize(model.varCount());
    for (int v = 0; v < model.varCount(); ++v) {
        // Variables untouched by any exactly-one constraint stay false.
        result.values[v] = search.values()[v] == 1 ? 1 : 0;
        if (result.values[v]) result.objective += model.cost(v);
    }
    double bound = model.costLowerBound();
    result.status = result.objective <= bound + 1e-9 ? SolveStatus::OPTIMAL : SolveStatus::FEASIBLE;
    return result;
}
