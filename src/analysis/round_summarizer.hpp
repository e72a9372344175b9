#pragma once

#include "../match/match_types.hpp"

#include <vector>

namespace roundstat::analysis {

/*
=============
SummarizeRounds

Builds one RoundStats per round and flags each round's opening kill (earliest
tick, lowest kill id on ties) with isFirstKill. Flags left by an earlier call
are cleared first; kills whose round is not in the round table are never
flagged.
=============
*/
std::vector<match::RoundStats> SummarizeRounds(const std::vector<match::Round>& rounds,
	std::vector<match::Kill>& kills,
	const std::vector<match::BombEvent>& bombEvents,
	const std::vector<match::EconomySnapshot>& economy);

} // namespace roundstat::analysis
