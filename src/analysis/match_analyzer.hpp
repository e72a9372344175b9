// match_analyzer.hpp (Match Analysis Pipeline)
// Runs the derivation passes over one match in dependency order:
// normalize, link trades, summarize rounds, detect clutches, aggregate
// player statistics. The resulting bundle owns every collection and is what
// the report writers serialize.

#pragma once

#include "../ingest/demo_events.hpp"
#include "../ingest/event_normalizer.hpp"
#include "../match/analysis_config.hpp"
#include "../match/match_types.hpp"

#include <string_view>
#include <vector>

namespace roundstat::analysis {

struct MatchAnalysis {
	match::MatchMetadata metadata;
	match::AnalysisConfig config;

	std::vector<match::Player> players;
	std::vector<match::PlayerMatchStats> playerStats;
	std::vector<match::Round> rounds;
	std::vector<match::RoundStats> roundStats;
	std::vector<match::Kill> kills;
	std::vector<match::Damage> damages;
	std::vector<match::Grenade> grenades;
	std::vector<match::BombEvent> bombEvents;
	std::vector<match::EconomySnapshot> economy;
	std::vector<match::Clutch> clutches;
};

/*
=============
BuildMatchMetadata

Fills the descriptive header of a match: identity from the demo header,
length from the last round end and the score from round winners.
=============
*/
match::MatchMetadata BuildMatchMetadata(const ingest::DemoHeader& header,
	const std::vector<match::Round>& rounds,
	const match::AnalysisConfig& config,
	std::string_view extractedAt);

/*
=============
AnalyzeEvents

Runs the derivation passes over already normalized events. The header tick
rate, when positive, replaces the configured one for this match.
=============
*/
MatchAnalysis AnalyzeEvents(ingest::NormalizedEvents events,
	const ingest::DemoHeader& header,
	const match::AnalysisConfig& config,
	std::string_view extractedAt);

MatchAnalysis AnalyzeMatch(const ingest::DemoEventTables& tables,
	const match::AnalysisConfig& config,
	std::string_view extractedAt);

} // namespace roundstat::analysis
