///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule_state.hpp"
#include "errors.hpp"
#include <unordered_set>


///////////////////////////
///    CONSTRUCTION     ///
///////////////////////////
ScheduleState::ScheduleState(const SessionCatalog& catalog)
        : catalog_(&catalog),
          slots_(catalog.slotCount()),
          placements_(catalog.sessionCount()),
          facultyLoad_((size_t)catalog.facultyCount() * slots_, 0),
          roomLoad_((size_t)catalog.roomCount() * slots_, 0),
          studentLoad_((size_t)catalog.studentCount() * slots_, 0) {}

ScheduleState::ScheduleState(const ScheduleState& other)
        : catalog_(other.catalog_),
          slots_(other.slots_),
          placements_(other.placements_),
          facultyLoad_(other.facultyLoad_),
          roomLoad_(other.roomLoad_),
          studentLoad_(other.studentLoad_),
          excess_(other.excess_.load()),
          assigned_(other.assigned_.load()) {}

ScheduleState& ScheduleState::operator=(const ScheduleState& other) {
    if (this == &other) return *this;
    catalog_ = other.catalog_;
    slots_ = other.slots_;
    placements_ = other.placements_;
    facultyLoad_ = other.facultyLoad_;
    roomLoad_ = other.roomLoad_;
    studentLoad_ = other.studentLoad_;
    excess_ = other.excess_.load();
    assigned_ = other.assigned_.load();
    return *this;
}


///////////////////////////
///       ORACLE        ///
///////////////////////////
bool ScheduleState::wouldConflict(int session, int slot, int roomIndex) const {
    if (slot < 0 || slot >= slots_) return true;
    const Session& s = catalog_->session(session);
    if (!catalog_->roomFits(s.courseIndex, roomIndex)) return true;
    return !cellsFree(session, slot, roomIndex);
}

/**
 * @brief Check that the faculty, room and student cells at a slot are empty,
 *        ignoring the session's own current placement.
 */
bool ScheduleState::cellsFree(int session, int slot, int roomIndex) const {
    const Session& s = catalog_->session(session);
    const Placement& current = placements_[session];
    int own = current.slot == slot ? 1 : 0;

    if (facultyLoad(catalog_->facultyOf(s.courseIndex), slot) - own > 0) return false;

    int ownRoom = (own && current.roomIndex == roomIndex) ? 1 : 0;
    if (roomLoad(roomIndex, slot) - ownRoom > 0) return false;

    for (int st : catalog_->studentsOf(s.courseIndex)) {
        if (studentLoad(st, slot) - own > 0) return false;
    }
    return true;
}


///////////////////////////
///   VALIDATED APPLY   ///
///////////////////////////
bool ScheduleState::tryAssign(int session, int slot, int roomIndex) {
    if (placements_[session].assigned()) return false;
    if (wouldConflict(session, slot, roomIndex)) return false;
    add(session, slot, roomIndex);
    return true;
}

bool ScheduleState::tryMove(int session, int slot, int roomIndex) {
    if (!placements_[session].assigned()) return false;
    if (wouldConflict(session, slot, roomIndex)) return false;
    remove(session);
    add(session, slot, roomIndex);
    return true;
}

bool ScheduleState::trySwap(int sessionA, int sessionB) {
    if (sessionA == sessionB) return false;
    Placement a = placements_[sessionA];
    Placement b = placements_[sessionB];
    if (!a.assigned() || !b.assigned() || a == b) return false;

    remove(sessionA);
    remove(sessionB);
    if (!wouldConflict(sessionA, b.slot, b.roomIndex)) {
        add(sessionA, b.slot, b.roomIndex);
        if (!wouldConflict(sessionB, a.slot, a.roomIndex)) {
            add(sessionB, a.slot, a.roomIndex);
            return true;
        }
        remove(sessionA);
    }
    // Rejected: restore both placements exactly.
    add(sessionA, a.slot, a.roomIndex);
    add(sessionB, b.slot, b.roomIndex);
    return false;
}

int ScheduleState::assignAllowingConflicts(int session, int slot, int roomIndex) {
    if (slot < 0 || slot >= slots_ || roomIndex < 0 || roomIndex >= catalog_->roomCount()) {
        throw ValidationError("placement (" + std::to_string(slot) + ", " +
                              std::to_string(roomIndex) + ") is outside the grid");
    }
    if (placements_[session].assigned()) remove(session);
    return add(session, slot, roomIndex);
}

void ScheduleState::unassign(int session) {
    if (placements_[session].assigned()) remove(session);
}

void ScheduleState::restore(int session, const Placement& placement) {
    if (placements_[session] == placement) return;
    if (placements_[session].assigned()) remove(session);
    if (placement.assigned()) add(session, placement.slot, placement.roomIndex);
}

void ScheduleState::adopt(const std::vector<Placement>& placements) {
    if (placements.size() != placements_.size()) {
        throw ValidationError("placement vector has " + std::to_string(placements.size()) +
                              " entries, expected " + std::to_string(placements_.size()));
    }
    for (int s = 0; s < (int)placements_.size(); ++s) {
        if (placements_[s] == placements[s]) continue;
        if (placements_[s].assigned()) remove(s);
        if (placements[s].assigned()) add(s, placements[s].slot, placements[s].roomIndex);
    }
}


///////////////////////////
///       METRICS       ///
///////////////////////////
int ScheduleState::conflictScore(const std::vector<int>& sessions) const {
    std::unordered_set<long long> seen;
    int score = 0;
    auto visit = [&](int kind, long resource, int slot, int load) {
        long long key = ((long long)resource * slots_ + slot) * 3 + kind;
        if (seen.insert(key).second && load > 1) score += load - 1;
    };
    for (int s : sessions) {
        const Placement& p = placements_[s];
        if (!p.assigned()) continue;
        int c = catalog_->session(s).courseIndex;
        int fac = catalog_->facultyOf(c);
        visit(0, fac, p.slot, facultyLoad(fac, p.slot));
        visit(1, p.roomIndex, p.slot, roomLoad(p.roomIndex, p.slot));
        for (int st : catalog_->studentsOf(c)) visit(2, st, p.slot, studentLoad(st, p.slot));
    }
    return score;
}

int ScheduleState::sessionConflicts(int session) const {
    const Placement& p = placements_[session];
    if (!p.assigned()) return 0;
    int c = catalog_->session(session).courseIndex;
    int total = 0;
    int load = facultyLoad(catalog_->facultyOf(c), p.slot);
    if (load > 1) total += load - 1;
    load = roomLoad(p.roomIndex, p.slot);
    if (load > 1) total += load - 1;
    for (int st : catalog_->studentsOf(c)) {
        load = studentLoad(st, p.slot);
        if (load > 1) total += load - 1;
    }
    return total;
}

int ScheduleState::capacityViolations() const {
    int violations = 0;
    for (int s = 0; s < (int)placements_.size(); ++s) {
        const Placement& p = placements_[s];
        if (p.assigned() && !catalog_->roomFits(catalog_->session(s).courseIndex, p.roomIndex)) ++violations;
    }
    return violations;
}

double ScheduleState::preferencePenalty() const {
    double penalty = 0.0;
    for (int s = 0; s < (int)placements_.size(); ++s) {
        if (placements_[s].assigned()) {
            penalty += catalog_->preferencePenalty(catalog_->session(s).courseIndex, placements_[s].slot);
        }
    }
    return penalty;
}


///////////////////////////
///     CONVERSION      ///
///////////////////////////
std::vector<SessionAssignment> ScheduleState::toAssignment() const {
    std::vector<SessionAssignment> out;
    out.reserve(placements_.size());
    for (int s = 0; s < (int)placements_.size(); ++s) {
        const Placement& p = placements_[s];
        if (!p.assigned()) continue;
        const Session& session = catalog_->session(s);
        out.push_back({catalog_->course(session.courseIndex).id, session.sessionNumber,
                       p.slot, catalog_->room(p.roomIndex).id});
    }
    return out;
}

ScheduleState ScheduleState::fromAssignment(const SessionCatalog& catalog,
                                            const std::vector<SessionAssignment>& assignment) {
    ScheduleState state(catalog);
    for (const SessionAssignment& a : assignment) {
        std::string label = "assignment of course " + std::to_string(a.courseId) +
                            " session " + std::to_string(a.sessionNumber);
        int c = catalog.courseIndexOf(a.courseId);
        if (c < 0) throw ValidationError(label + ": unknown course");
        const std::vector<int>& sessions = catalog.sessionsOf(c);
        if (a.sessionNumber < 0 || a.sessionNumber >= (int)sessions.size()) {
            throw ValidationError(label + ": session number out of range");
        }
        int r = catalog.roomIndexOf(a.roomId);
        if (r < 0) throw ValidationError(label + ": unknown room " + std::to_string(a.roomId));
        if (a.slotId < 0 || a.slotId >= catalog.slotCount()) {
            throw ValidationError(label + ": slot " + std::to_string(a.slotId) + " outside the grid");
        }
        int s = sessions[a.sessionNumber];
        if (state.placements_[s].assigned()) throw ValidationError(label + ": listed twice");
        state.add(s, a.slotId, r);
    }
    return state;
}


///////////////////////////
///      INTERNALS      ///
///////////////////////////
int ScheduleState::bump(int& cell, int delta) {
    if (delta > 0) {
        ++cell;
        return cell > 1 ? 1 : 0;
    }
    --cell;
    return cell >= 1 ? -1 : 0;
}

int ScheduleState::add(int session, int slot, int roomIndex) {
    int c = catalog_->session(session).courseIndex;
    int delta = bump(facultyLoad_[catalog_->facultyOf(c) * slots_ + slot], +1);
    delta += bump(roomLoad_[roomIndex * slots_ + slot], +1);
    for (int st : catalog_->studentsOf(c)) delta += bump(studentLoad_[(long)st * slots_ + slot], +1);
    placements_[session] = {slot, roomIndex};
    excess_ += delta;
    ++assigned_;
    return delta;
}

void ScheduleState::remove(int session) {
    Placement p = placements_[session];
    int c = catalog_->session(session).courseIndex;
    int delta = bump(facultyLoad_[catalog_->facultyOf(c) * slots_ + p.slot], -1);
    delta += bump(roomLoad_[p.roomIndex * slots_ + p.slot], -1);
    for (int st : catalog_->studentsOf(c)) delta += bump(studentLoad_[(long)st * slots_ + p.slot], -1);
    placements_[session] = Placement{};
    excess_ += delta;
    --assigned_;
}
