#pragma once

#include "../match/match_types.hpp"

#include <vector>

namespace roundstat::analysis {

/*
=================
AggregationInput

Read-only view of every derived collection of one match. Kills must already
carry their first-kill and trade annotations.
=================
*/
struct AggregationInput {
	const std::vector<match::Player>& players;
	const std::vector<match::Round>& rounds;
	const std::vector<match::Kill>& kills;
	const std::vector<match::Damage>& damages;
	const std::vector<match::Grenade>& grenades;
	const std::vector<match::EconomySnapshot>& economy;
	const std::vector<match::Clutch>& clutches;
};

/*
=============
AggregatePlayerStats

Rebuilds one PlayerMatchStats per player identity seen in the player table,
the kills or the damage rows. Records come back in first-seen order, then
stably sorted by ADR, highest first. Ratios with a zero denominator are 0.
=============
*/
std::vector<match::PlayerMatchStats> AggregatePlayerStats(const AggregationInput& input);

} // namespace roundstat::analysis
