#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "fitness.hpp"
#include "value_table.hpp"
#include <random>


///////////////////////////
///   SEARCH CONTEXT    ///
///////////////////////////
/**
 * @brief Mutable search state owned by one pipeline run.
 *
 * Passed explicitly to the refiner and the repairer; nothing here is global,
 * so runs and tests are isolated from each other.
 */
struct SearchContext {
    std::mt19937 rng; ///< Source of every random decision of the run.
    ValueTable valueTable; ///< Learned repair move values.
    FitnessCache fitnessCache; ///< Bounded fitness cache of the refiner.

    explicit SearchContext(const PipelineConfig& config)
            : rng(config.seed),
              fitnessCache(config.refiner.fitnessCacheCapacity, config.refiner.cacheEvictionInterval) {}
};
