#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "config.hpp"
#include "schedule_state.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/// A complete schedule: one placement per session, indexed by dense session index.
using Chromosome = std::vector<Placement>;

/**
 * @brief Components of a chromosome's fitness (lower value is better).
 */
struct FitnessBreakdown {
    int conflicts = 0; ///< Summed faculty/room/student excess.
    int capacityViolations = 0; ///< Sessions outside their domain.
    double preferencePenalty = 0.0; ///< Department soft-preference cost.
    double value = 0.0; ///< Weighted sum of the above.
};

/// Weighted sum of the breakdown components.
double weightedFitness(const FitnessWeights& weights, int conflicts, int capacityViolations, double preferencePenalty);

/// 64-bit FNV-1a hash of every (slot, room) of the chromosome.
uint64_t chromosomeSignature(const Chromosome& chromosome);


///////////////////////////
///     EVALUATORS      ///
///////////////////////////
/**
 * @brief Scores a batch of chromosomes.
 *
 * Implementations: CpuFitnessEvaluator (worker threads) and the OpenCL
 * evaluator, which scores a whole population per kernel launch.
 */
class IFitnessEvaluator {
public:
    virtual ~IFitnessEvaluator() = default;

    virtual std::vector<FitnessBreakdown> evaluateBatch(const std::vector<const Chromosome*>& batch) = 0;
};

/**
 * @brief Exact fitness evaluation on the CPU.
 *
 * Each worker keeps its own occupancy scratch buffers and only undoes the
 * cells it touched, so one evaluation costs O(enrollments) regardless of the
 * number of students.
 */
class CpuFitnessEvaluator : public IFitnessEvaluator {
public:
    CpuFitnessEvaluator(const SessionCatalog& catalog, const FitnessWeights& weights, int numThreads = 1);

    /// Score one chromosome.
    FitnessBreakdown evaluate(const Chromosome& chromosome) const;

    std::vector<FitnessBreakdown> evaluateBatch(const std::vector<const Chromosome*>& batch) override;

private:
    const SessionCatalog& catalog_;
    FitnessWeights weights_;
    int numThreads_;

    struct Scratch {
        std::vector<int> faculty, room, student;
    };

    FitnessBreakdown evaluate(const Chromosome& chromosome, Scratch& scratch) const;
    Scratch makeScratch() const;
};


///////////////////////////
///    FITNESS CACHE    ///
///////////////////////////
/**
 * @brief Bounded cache of fitness values keyed by chromosome signature.
 *
 * The size never exceeds the capacity: inserting into a full cache first
 * drops the least recently used entries. Every evictionInterval generations
 * entries unused for a whole interval are dropped, and reclaim() (run once per
 * generation) compacts the table so its bucket storage stays bounded too.
 */
class FitnessCache {
public:
    FitnessCache(int capacity, int evictionInterval);

    std::optional<FitnessBreakdown> lookup(uint64_t signature, int generation);
    void insert(uint64_t signature, const FitnessBreakdown& fitness, int generation);

    /// End-of-generation maintenance: periodic stale eviction plus reclamation.
    void endGeneration(int generation);

    /// Compact the table; keeps at most capacity entries.
    void reclaim();

    void clear();

    int size() const { return (int)entries_.size(); }
    int capacity() const { return capacity_; }
    size_t bucketCount() const { return entries_.bucket_count(); }
    long hits() const { return hits_; }
    long misses() const { return misses_; }

private:
    struct Entry {
        FitnessBreakdown fitness;
        int lastUsed;
    };

    int capacity_;
    int evictionInterval_;
    std::unordered_map<uint64_t, Entry> entries_;
    long hits_ = 0;
    long misses_ = 0;

    void evictOldest(int count);
};
