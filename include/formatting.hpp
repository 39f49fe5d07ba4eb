#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "conflicts.hpp"
#include "model.hpp"
#include "pipeline.hpp"
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Print one table per faculty member, grouped by day and ordered by period.
void printFacultySchedules(const ProblemInstance& inst, const std::vector<SessionAssignment>& assignment);

/// Print every conflict record with its courses and severity.
void printConflictReport(const ProblemInstance& inst, const std::vector<Conflict>& conflicts);

/// Print the per-stage summary of a generation run.
void printSummary(const PipelineSummary& summary);
