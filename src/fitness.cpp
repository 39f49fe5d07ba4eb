///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "fitness.hpp"
#include <algorithm>
#include <future>


///////////////////////////
///       HELPERS       ///
///////////////////////////
double weightedFitness(const FitnessWeights& weights, int conflicts, int capacityViolations, double preferencePenalty) {
    return weights.conflict * conflicts + weights.capacity * capacityViolations + weights.preference * preferencePenalty;
}

uint64_t chromosomeSignature(const Chromosome& chromosome) {
    uint64_t hash = 1469598103934665603ULL;
    auto mix = [&hash](uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            hash ^= (value >> (8 * i)) & 0xffu;
            hash *= 1099511628211ULL;
        }
    };
    for (const Placement& p : chromosome) {
        mix((uint32_t)p.slot);
        mix((uint32_t)p.roomIndex);
    }
    return hash;
}


///////////////////////////
///   CPU EVALUATOR     ///
///////////////////////////
CpuFitnessEvaluator::CpuFitnessEvaluator(const SessionCatalog& catalog, const FitnessWeights& weights, int numThreads)
        : catalog_(catalog), weights_(weights), numThreads_(std::max(1, numThreads)) {}

CpuFitnessEvaluator::Scratch CpuFitnessEvaluator::makeScratch() const {
    size_t slots = (size_t)catalog_.slotCount();
    Scratch scratch;
    scratch.faculty.assign(catalog_.facultyCount() * slots, 0);
    scratch.room.assign(catalog_.roomCount() * slots, 0);
    scratch.student.assign(catalog_.studentCount() * slots, 0);
    return scratch;
}

FitnessBreakdown CpuFitnessEvaluator::evaluate(const Chromosome& chromosome) const {
    Scratch scratch = makeScratch();
    return evaluate(chromosome, scratch);
}

FitnessBreakdown CpuFitnessEvaluator::evaluate(const Chromosome& chromosome, Scratch& scratch) const {
    FitnessBreakdown out;
    long slots = catalog_.slotCount();
    auto occupy = [&out](int& cell) {
        if (cell++ > 0) ++out.conflicts;
    };

    for (int s = 0; s < (int)chromosome.size(); ++s) {
        const Placement& p = chromosome[s];
        if (!p.assigned()) continue;
        int c = catalog_.session(s).courseIndex;
        occupy(scratch.faculty[catalog_.facultyOf(c) * slots + p.slot]);
        occupy(scratch.room[p.roomIndex * slots + p.slot]);
        for (int st : catalog_.studentsOf(c)) occupy(scratch.student[st * slots + p.slot]);
        if (!catalog_.roomFits(c, p.roomIndex)) ++out.capacityViolations;
        out.preferencePenalty += catalog_.preferencePenalty(c, p.slot);
    }

    // Undo only the touched cells so the scratch can be reused.
    for (int s = 0; s < (int)chromosome.size(); ++s) {
        const Placement& p = chromosome[s];
        if (!p.assigned()) continue;
        int c = catalog_.session(s).courseIndex;
        scratch.faculty[catalog_.facultyOf(c) * slots + p.slot] = 0;
        scratch.room[p.roomIndex * slots + p.slot] = 0;
        for (int st : catalog_.studentsOf(c)) scratch.student[st * slots + p.slot] = 0;
    }

    out.value = weightedFitness(weights_, out.conflicts, out.capacityViolations, out.preferencePenalty);
    return out;
}

std::vector<FitnessBreakdown> CpuFitnessEvaluator::evaluateBatch(const std::vector<const Chromosome*>& batch) {
    std::vector<FitnessBreakdown> results(batch.size());
    int threads = std::min<int>(numThreads_, (int)batch.size());
    if (threads <= 1) {
        Scratch scratch = makeScratch();
        for (size_t i = 0; i < batch.size(); ++i) results[i] = evaluate(*batch[i], scratch);
        return results;
    }

    std::vector<std::future<void>> tasks;
    for (int t = 0; t < threads; ++t) {
        tasks.push_back(std::async(std::launch::async, [this, t, threads, &batch, &results]() {
            Scratch scratch = makeScratch();
            for (size_t i = t; i < batch.size(); i += threads) results[i] = evaluate(*batch[i], scratch);
        }));
    }
    for (auto& task : tasks) task.get();
    return results;
}


///////////////////////////
///    FITNESS CACHE    ///
///////////////////////////
FitnessCache::FitnessCache(int capacity, int evictionInterval)
        : capacity_(std::max(1, capacity)), evictionInterval_(std::max(1, evictionInterval)) {}

std::optional<FitnessBreakdown> FitnessCache::lookup(uint64_t signature, int generation) {
    auto it = entries_.find(signature);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    it->second.lastUsed = generation;
    return it->second.fitness;
}

void FitnessCache::insert(uint64_t signature, const FitnessBreakdown& fitness, int generation) {
    auto it = entries_.find(signature);
    if (it != entries_.end()) {
        it->second = {fitness, generation};
        return;
    }
    if ((int)entries_.size() >= capacity_) evictOldest((int)entries_.size() - capacity_ + 1);
    entries_.emplace(signature, Entry{fitness, generation});
}

void FitnessCache::evictOldest(int count) {
    if (count <= 0) return;
    std::vector<std::pair<int, uint64_t>> ages;
    ages.reserve(entries_.size());
    for (const auto& entry : entries_) ages.push_back({entry.second.lastUsed, entry.first});
    count = std::min(count, (int)ages.size());
    std::nth_element(ages.begin(), ages.begin() + (count - 1), ages.end());
    for (int i = 0; i < count; ++i) entries_.erase(ages[i].second);
}

void FitnessCache::endGeneration(int generation) {
    if (generation > 0 && generation % evictionInterval_ == 0) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (generation - it->second.lastUsed >= evictionInterval_) it = entries_.erase(it);
            else ++it;
        }
    }
    reclaim();
}

void FitnessCache::reclaim() {
    if ((int)entries_.size() > capacity_) evictOldest((int)entries_.size() - capacity_);
    // Erasing never shrinks the bucket array; rebuild once it is oversized.
    if (entries_.bucket_count() > (size_t)capacity_ * 4) {
        std::unordered_map<uint64_t, Entry> compact(entries_.begin(), entries_.end());
        entries_.swap(compact);
    }
}

void FitnessCache::clear() {
    std::unordered_map<uint64_t, Entry>().swap(entries_);
}
