#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cancellation.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "fitness.hpp"
#include "progress.hpp"
#include "search_context.hpp"
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Outcome of one refinement run.
 */
struct RefinementResult {
    Chromosome best; ///< Best chromosome found (never worse than the input).
    FitnessBreakdown initialFitness; ///< Fitness of the input chromosome.
    FitnessBreakdown bestFitness; ///< Fitness of best.
    int generations = 0; ///< Generations completed.
    bool plateaued = false; ///< Stopped after plateauGenerations without improvement.
    bool timedOut = false; ///< Stopped by the wall-clock budget.
    bool cancelled = false; ///< Stopped by the cancellation token.
    int peakCacheSize = 0; ///< Largest fitness-cache size observed after any generation.
};


///////////////////////////
///       REFINER       ///
///////////////////////////
/**
 * @brief Generational search over complete schedules.
 *
 * Selection keeps eliteCount individuals and fills the rest by tournament.
 * Crossover copies a contiguous run of clusters from the second parent into
 * the first, so locally consistent sub-schedules travel together. Mutation
 * reassigns mutationRate of the sessions to another (slot, fitting room) pair.
 * Fitness values go through the context's bounded cache; the previous
 * population is released every generation.
 */
class PopulationRefiner {
public:
    PopulationRefiner(const SessionCatalog& catalog, const RefinerConfig& config,
                      IFitnessEvaluator& evaluator, SearchContext& context);

    /**
     * @param initial  Complete chromosome to improve.
     * @param clusters Course clusters defining crossover blocks.
     * @param reporter Receives one unit of work per generation (optional).
     * @param cancel   Polled once per generation (optional).
     */
    RefinementResult refine(const Chromosome& initial,
                            const std::vector<std::vector<int>>& clusters,
                            StageReporter* reporter = nullptr,
                            const CancellationToken* cancel = nullptr);

    /// Reassign mutationRate of the sessions (at least one) to other domain pairs.
    void mutate(Chromosome& chromosome);

    /// Child = a with the sessions of a random contiguous run of clusters taken from b.
    Chromosome crossover(const Chromosome& a, const Chromosome& b,
                         const std::vector<std::vector<int>>& clusters);

private:
    const SessionCatalog& catalog_;
    RefinerConfig config_;
    IFitnessEvaluator& evaluator_;
    SearchContext& context_;

    struct Individual {
        Chromosome genes;
        FitnessBreakdown fitness;
    };

    void score(std::vector<Individual>& population, int generation);
    const Individual& tournament(const std::vector<Individual>& population);
};
