#pragma once

#include "../match/analysis_config.hpp"
#include "../match/match_types.hpp"

#include <optional>
#include <vector>

namespace roundstat::analysis {

/*
=============
DetectRoundClutch

Replays one round's kills against a full roster on both sides and reports the
first moment a side is down to its last player while the other side still has
someone standing. The last player is taken to be whoever lands the next kill
for that side, so a survivor who never fires again goes unrecorded.

Rounds with fewer than two kills and 1v1 endings produce nothing.
=============
*/
std::optional<match::Clutch> DetectRoundClutch(const match::Round& round, const std::vector<const match::Kill*>& roundKills, const match::AnalysisConfig& config);

/*
=============
DetectClutches

Runs DetectRoundClutch over every round; at most one clutch per round.
=============
*/
std::vector<match::Clutch> DetectClutches(const std::vector<match::Round>& rounds, const std::vector<match::Kill>& kills, const match::AnalysisConfig& config);

} // namespace roundstat::analysis
