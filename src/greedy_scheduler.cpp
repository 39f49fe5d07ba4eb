///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "greedy_scheduler.hpp"
#include <algorithm>
#include <unordered_set>


///////////////////////////
///       GREEDY        ///
///////////////////////////
GreedyScheduler::GreedyScheduler(const SessionCatalog& catalog, const SolverConfig& config)
        : catalog_(catalog), config_(config) {}

/**
 * @brief Evenly strided subset of a course's students, at most greedyStudentSample long.
 */
std::vector<int> GreedyScheduler::studentSample(int courseIndex) const {
    const std::vector<int>& students = catalog_.studentsOf(courseIndex);
    int limit = config_.greedyStudentSample;
    if ((int)students.size() <= limit) return students;
    std::vector<int> sample;
    sample.reserve(limit);
    double stride = (double)students.size() / limit;
    for (int i = 0; i < limit; ++i) sample.push_back(students[(size_t)(i * stride)]);
    return sample;
}

GreedyResult GreedyScheduler::schedule(const std::vector<int>& courses, unsigned seed) const {
    GreedyResult result;
    int slots = catalog_.slotCount();
    long long stride = slots;

    std::unordered_set<long long> facultyBusy, roomBusy, studentBusy;
    auto cell = [stride](int resource, int slot) { return (long long)resource * stride + slot; };

    std::vector<int> order = courses;
    std::stable_sort(order.begin(), order.end(), [this](int a, int b) {
        size_t ea = catalog_.studentsOf(a).size(), eb = catalog_.studentsOf(b).size();
        if (ea != eb) return ea > eb;
        return catalog_.course(a).sessionCount > catalog_.course(b).sessionCount;
    });

    int offset = (int)(seed % (unsigned)slots);

    for (int c : order) {
        int faculty = catalog_.facultyOf(c);
        const std::vector<int>& rooms = catalog_.fittingRooms(c);
        std::vector<int> sample = studentSample(c);
        const std::vector<int>& sessions = catalog_.sessionsOf(c);
        int sessionCount = (int)sessions.size();

        for (int k = 0; k < sessionCount; ++k) {
            int session = sessions[k];
            // Spread a course's sessions evenly over the week.
            int start = (offset + k * slots / sessionCount) % slots;
            Placement chosen;
            bool relaxed = false;

            for (int i = 0; i < slots && !chosen.assigned(); ++i) {
                int t = (start + i) % slots;
                if (facultyBusy.count(cell(faculty, t))) continue;
                bool studentsFree = std::none_of(sample.begin(), sample.end(),
                                                 [&](int st) { return studentBusy.count(cell(st, t)) > 0; });
                if (!studentsFree) continue;
                for (int r : rooms) {
                    if (!roomBusy.count(cell(r, t))) {
                        chosen = {t, r};
                        break;
                    }
                }
            }

            // Capacity-only: a free room cell of a fitting room.
            for (int i = 0; i < slots && !chosen.assigned(); ++i) {
                int t = (start + i) % slots;
                for (int r : rooms) {
                    if (!roomBusy.count(cell(r, t))) {
                        chosen = {t, r};
                        relaxed = true;
                        break;
                    }
                }
            }

            // Every fitting room cell is taken.
            if (!chosen.assigned() && !rooms.empty()) {
                chosen = {start, rooms[k % rooms.size()]};
                relaxed = true;
            }

            // No fitting room at all: largest room, same type preferred.
            if (!chosen.assigned()) {
                RoomType wanted = catalog_.course(c).requiredRoomType;
                int best = -1;
                for (int r = 0; r < catalog_.roomCount(); ++r) {
                    if (best < 0) { best = r; continue; }
                    const Room& a = catalog_.room(r);
                    const Room& b = catalog_.room(best);
                    bool aType = a.type == wanted, bType = b.type == wanted;
                    if (aType != bType ? aType : a.capacity > b.capacity) best = r;
                }
                if (best < 0) continue; // no rooms in the instance; the session stays unassigned
                int t = start;
                for (int i = 0; i < slots; ++i) {
                    if (!roomBusy.count(cell(best, (start + i) % slots))) {
                        t = (start + i) % slots;
                        break;
                    }
                }
                chosen = {t, best};
                relaxed = true;
                ++result.outOfDomainSessions;
            }

            if (relaxed) ++result.relaxedSessions;
            facultyBusy.insert(cell(faculty, chosen.slot));
            roomBusy.insert(cell(chosen.roomIndex, chosen.slot));
            for (int st : catalog_.studentsOf(c)) studentBusy.insert(cell(st, chosen.slot));
            result.placements.push_back({session, chosen});
        }
    }
    return result;
}
