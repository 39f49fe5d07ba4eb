#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Size presets of the synthetic university snapshots.
 *
 * S: 3 departments, ~12 courses. M: 5 departments, ~40 courses.
 * L: 8 departments, ~120 courses.
 */
enum class DemoSize { S, M, L };

/**
 * @brief Build a deterministic synthetic snapshot.
 *
 * Departments own faculty, typed rooms and courses with one to three weekly
 * sessions; students take courses of their home department plus one
 * elective from another department, which creates the cross-department
 * overlaps the pipeline has to untangle.
 */
ProblemInstance makeDemoInstance(DemoSize size, unsigned seed = 7);
