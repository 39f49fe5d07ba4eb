///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "population_refiner.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>


///////////////////////////
///       REFINER       ///
///////////////////////////
PopulationRefiner::PopulationRefiner(const SessionCatalog& catalog, const RefinerConfig& config,
                                     IFitnessEvaluator& evaluator, SearchContext& context)
        : catalog_(catalog), config_(config), evaluator_(evaluator), context_(context) {}

void PopulationRefiner::mutate(Chromosome& chromosome) {
    if (chromosome.empty()) return;
    int count = std::max(1, (int)std::lround(config_.mutationRate * chromosome.size()));
    std::uniform_int_distribution<int> pickSession(0, (int)chromosome.size() - 1);
    std::uniform_int_distribution<int> pickSlot(0, catalog_.slotCount() - 1);

    for (int i = 0; i < count; ++i) {
        int s = pickSession(context_.rng);
        const std::vector<int>& rooms = catalog_.fittingRooms(catalog_.session(s).courseIndex);
        if (rooms.empty()) continue;
        std::uniform_int_distribution<int> pickRoom(0, (int)rooms.size() - 1);
        chromosome[s] = {pickSlot(context_.rng), rooms[pickRoom(context_.rng)]};
    }
}

Chromosome PopulationRefiner::crossover(const Chromosome& a, const Chromosome& b,
                                        const std::vector<std::vector<int>>& clusters) {
    Chromosome child = a;
    if (clusters.empty()) return child;
    std::uniform_int_distribution<int> pick(0, (int)clusters.size() - 1);
    int first = pick(context_.rng);
    int last = pick(context_.rng);
    if (first > last) std::swap(first, last);
    for (int k = first; k <= last; ++k) {
        for (int c : clusters[k]) {
            for (int s : catalog_.sessionsOf(c)) child[s] = b[s];
        }
    }
    return child;
}

/**
 * @brief Fill in the fitness of every individual, through the cache.
 */
void PopulationRefiner::score(std::vector<Individual>& population, int generation) {
    std::vector<const Chromosome*> pending;
    std::vector<size_t> pendingIndex;
    std::vector<uint64_t> signatures(population.size());

    for (size_t i = 0; i < population.size(); ++i) {
        signatures[i] = chromosomeSignature(population[i].genes);
        auto cached = context_.fitnessCache.lookup(signatures[i], generation);
        if (cached) {
            population[i].fitness = *cached;
        } else {
            pending.push_back(&population[i].genes);
            pendingIndex.push_back(i);
        }
    }
    if (pending.empty()) return;

    std::vector<FitnessBreakdown> scores = evaluator_.evaluateBatch(pending);
    for (size_t k = 0; k < pending.size(); ++k) {
        size_t i = pendingIndex[k];
        population[i].fitness = scores[k];
        context_.fitnessCache.insert(signatures[i], scores[k], generation);
    }
}

const PopulationRefiner::Individual& PopulationRefiner::tournament(const std::vector<Individual>& population) {
    std::uniform_int_distribution<int> pick(0, (int)population.size() - 1);
    const Individual* best = &population[pick(context_.rng)];
    for (int i = 1; i < config_.tournamentSize; ++i) {
        const Individual& contender = population[pick(context_.rng)];
        if (contender.fitness.value < best->fitness.value) best = &contender;
    }
    return *best;
}

RefinementResult PopulationRefiner::refine(const Chromosome& initial,
                                           const std::vector<std::vector<int>>& clusters,
                                           StageReporter* reporter,
                                           const CancellationToken* cancel) {
    auto start = std::chrono::steady_clock::now();
    RefinementResult result;
    if (reporter) reporter->setTotal(config_.generations);

    auto byFitness = [](const Individual& a, const Individual& b) { return a.fitness.value < b.fitness.value; };

    // Generation 0: the input plus mutated copies of it.
    std::vector<Individual> population;
    population.reserve(config_.populationSize);
    population.push_back({initial, {}});
    for (int i = 1; i < config_.populationSize; ++i) {
        Individual individual{initial, {}};
        mutate(individual.genes);
        population.push_back(std::move(individual));
    }
    score(population, 0);
    result.initialFitness = population[0].fitness;
    std::sort(population.begin(), population.end(), byFitness);
    result.best = population[0].genes;
    result.bestFitness = population[0].fitness;
    context_.fitnessCache.endGeneration(0);
    result.peakCacheSize = context_.fitnessCache.size();

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    int sinceImprovement = 0;

    for (int generation = 1; generation <= config_.generations; ++generation) {
        if (cancel && cancel->isCancelled()) {
            result.cancelled = true;
            break;
        }
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (elapsed > config_.timeLimitSeconds) {
            result.timedOut = true;
            break;
        }

        std::vector<Individual> next;
        next.reserve(config_.populationSize);
        for (int i = 0; i < config_.eliteCount && i < (int)population.size(); ++i) next.push_back(population[i]);
        while ((int)next.size() < config_.populationSize) {
            const Individual& a = tournament(population);
            Individual child;
            if (coin(context_.rng) < config_.crossoverRate) {
                child.genes = crossover(a.genes, tournament(population).genes, clusters);
            } else {
                child.genes = a.genes;
            }
            mutate(child.genes);
            next.push_back(std::move(child));
        }

        score(next, generation);
        std::sort(next.begin(), next.end(), byFitness);

        // Release the previous generation before the next one is built.
        population.swap(next);
        std::vector<Individual>().swap(next);
        context_.fitnessCache.endGeneration(generation);
        result.peakCacheSize = std::max(result.peakCacheSize, context_.fitnessCache.size());
        result.generations = generation;
        if (reporter) reporter->report(generation);

        if (population[0].fitness.value < result.bestFitness.value - 1e-9) {
            result.best = population[0].genes;
            result.bestFitness = population[0].fitness;
            sinceImprovement = 0;
        } else if (++sinceImprovement >= config_.plateauGenerations) {
            result.plateaued = true;
            break;
        }
    }

    std::ostringstream msg;
    msg << "Refinement: " << result.generations << " generations, fitness "
        << result.initialFitness.value << " -> " << result.bestFitness.value
        << " (conflicts " << result.initialFitness.conflicts << " -> " << result.bestFitness.conflicts
        << "), cache " << context_.fitnessCache.size() << "/" << context_.fitnessCache.capacity();
    if (result.plateaued) msg << ", plateau";
    if (result.timedOut) msg << ", time limit";
    logInfo(msg.str());
    return result;
}
