/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

match_analyzer.cpp implementation.*/

#include "match_analyzer.hpp"

#include "clutch_detector.hpp"
#include "player_stats_aggregator.hpp"
#include "round_summarizer.hpp"
#include "trade_linker.hpp"

#include "../shared/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace roundstat::analysis {

using namespace roundstat::match;

namespace {

/*
=============
FormatDuration

m:ss with the seconds zero padded.
=============
*/
std::string FormatDuration(int seconds) {
	return fmt::format("{}:{:02}", seconds / 60, seconds % 60);
}

std::string MatchIdFromDemoFile(const std::string& demoFile) {
	if (demoFile.empty())
		return std::string(kUnknownIdentity);

	const std::string stem = std::filesystem::path(demoFile).stem().string();
	return stem.empty() ? demoFile : stem;
}

} // namespace

MatchMetadata BuildMatchMetadata(const ingest::DemoHeader& header,
	const std::vector<Round>& rounds,
	const AnalysisConfig& config,
	std::string_view extractedAt) {
	MatchMetadata metadata;
	metadata.matchId = MatchIdFromDemoFile(header.demoFile);
	metadata.demoFile = header.demoFile;
	metadata.mapName = header.mapName.empty() ? std::string(kUnknownIdentity) : header.mapName;
	metadata.serverName = header.serverName.empty() ? std::string(kUnknownIdentity) : header.serverName;
	metadata.tickRate = config.tickRate;
	metadata.extractedAt = std::string(extractedAt);
	metadata.totalRounds = static_cast<int>(rounds.size());

	for (const Round& round : rounds) {
		metadata.totalTicks = std::max(metadata.totalTicks, round.endTick);
		if (round.winner == Team::CT)
			++metadata.scoreCT;
		else if (round.winner == Team::T)
			++metadata.scoreT;
	}

	metadata.durationSeconds = config.tickRate > 0 ? static_cast<int>(metadata.totalTicks / config.tickRate) : 0;
	metadata.durationFormatted = FormatDuration(metadata.durationSeconds);

	if (metadata.scoreCT > metadata.scoreT)
		metadata.winner = std::string(TeamName(Team::CT));
	else if (metadata.scoreT > metadata.scoreCT)
		metadata.winner = std::string(TeamName(Team::T));
	else
		metadata.winner = "draw";

	return metadata;
}

MatchAnalysis AnalyzeEvents(ingest::NormalizedEvents events,
	const ingest::DemoHeader& header,
	const AnalysisConfig& config,
	std::string_view extractedAt) {
	MatchAnalysis analysis;
	analysis.config = config.WithTickRate(header.tickRate);

	analysis.players = std::move(events.players);
	analysis.rounds = std::move(events.rounds);
	analysis.kills = std::move(events.kills);
	analysis.damages = std::move(events.damages);
	analysis.grenades = std::move(events.grenades);
	analysis.bombEvents = std::move(events.bombEvents);
	analysis.economy = std::move(events.economy);

	const int traded = LinkTrades(analysis.kills, analysis.config);
	analysis.roundStats = SummarizeRounds(analysis.rounds, analysis.kills, analysis.bombEvents, analysis.economy);
	analysis.clutches = DetectClutches(analysis.rounds, analysis.kills, analysis.config);

	const AggregationInput input{
		analysis.players,
		analysis.rounds,
		analysis.kills,
		analysis.damages,
		analysis.grenades,
		analysis.economy,
		analysis.clutches
	};
	analysis.playerStats = AggregatePlayerStats(input);

	analysis.metadata = BuildMatchMetadata(header, analysis.rounds, analysis.config, extractedAt);
	analysis.metadata.droppedRecords = events.stats.TotalDropped();

	Logf(LogLevel::Info, "analyzed {} on {}: {} rounds ({}-{}), {} kills, {} trades, {} clutches",
		analysis.metadata.matchId, analysis.metadata.mapName, analysis.metadata.totalRounds,
		analysis.metadata.scoreCT, analysis.metadata.scoreT, analysis.kills.size(), traded, analysis.clutches.size());

	return analysis;
}

MatchAnalysis AnalyzeMatch(const ingest::DemoEventTables& tables,
	const AnalysisConfig& config,
	std::string_view extractedAt) {
	const AnalysisConfig matchConfig = config.WithTickRate(tables.header.tickRate);
	return AnalyzeEvents(ingest::NormalizeDemoEvents(tables, matchConfig.tickRate), tables.header, config, extractedAt);
}

} // namespace roundstat::analysis
