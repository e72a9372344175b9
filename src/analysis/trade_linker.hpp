#pragma once

#include "../match/analysis_config.hpp"
#include "../match/match_types.hpp"

#include <vector>

namespace roundstat::analysis {

/*
=============
LinkTrades

Marks kills that avenge a teammate's death. Kills are walked round by round in
tick order; each one looks back through earlier kills of its round while they
are inside the trade window and links the most recent kill made by its victim
on one of its attacker's teammates.

Existing trade annotations are reset first, so repeated calls give the same
result. Returns the number of kills marked as trades.
=============
*/
int LinkTrades(std::vector<match::Kill>& kills, const match::AnalysisConfig& config);

} // namespace roundstat::analysis
