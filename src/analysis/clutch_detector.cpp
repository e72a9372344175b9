/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

clutch_detector.cpp implementation.*/

#include "clutch_detector.hpp"

#include "../shared/logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace roundstat::analysis {

using namespace roundstat::match;

namespace {

constexpr int kMinimumClutchOpponents = 2;

struct AliveCounts {
	int ct;
	int t;

	void Remove(Team team) {
		if (team == Team::CT)
			--ct;
		else if (team == Team::T)
			--t;
	}
};

} // namespace

std::optional<Clutch> DetectRoundClutch(const Round& round, const std::vector<const Kill*>& roundKills, const AnalysisConfig& config) {
	if (roundKills.size() < 2)
		return std::nullopt;

	std::vector<const Kill*> ordered = roundKills;
	std::stable_sort(ordered.begin(), ordered.end(), [](const Kill* a, const Kill* b) {
		if (a->tick != b->tick)
			return a->tick < b->tick;
		return a->killId < b->killId;
	});

	AliveCounts alive{ config.rosterSize, config.rosterSize };
	std::optional<Team> clutchTeam;
	int opponents = 0;
	Tick startTick = 0;

	for (const Kill* kill : ordered) {
		alive.Remove(kill->victimTeam);

		if (alive.ct == 1 && alive.t >= 1) {
			clutchTeam = Team::CT;
			opponents = alive.t;
		}
		else if (alive.t == 1 && alive.ct >= 1) {
			clutchTeam = Team::T;
			opponents = alive.ct;
		}

		if (clutchTeam) {
			startTick = kill->tick;
			break;
		}
	}

	if (!clutchTeam || opponents < kMinimumClutchOpponents)
		return std::nullopt;

	const Kill* clutchKill = nullptr;
	for (const Kill* kill : ordered) {
		if (kill->tick >= startTick && kill->attackerTeam == *clutchTeam && IsPlayerIdentity(kill->attackerId)) {
			clutchKill = kill;
			break;
		}
	}
	if (!clutchKill)
		return std::nullopt;

	Clutch clutch;
	clutch.roundNum = round.roundNum;
	clutch.playerId = clutchKill->attackerId;
	clutch.playerName = clutchKill->attackerName;
	clutch.team = *clutchTeam;
	clutch.opponents = opponents;
	clutch.won = round.winner == *clutchTeam;
	clutch.startTick = startTick;
	clutch.endTick = std::max(round.endTick, startTick);
	clutch.durationSeconds = config.tickRate > 0
		? static_cast<double>(clutch.endTick - clutch.startTick) / static_cast<double>(config.tickRate)
		: 0.0;
	clutch.killsMade = static_cast<int>(std::count_if(ordered.begin(), ordered.end(), [&](const Kill* kill) {
		return kill->tick >= startTick && kill->attackerId == clutch.playerId;
	}));

	return clutch;
}

std::vector<Clutch> DetectClutches(const std::vector<Round>& rounds, const std::vector<Kill>& kills, const AnalysisConfig& config) {
	std::unordered_map<int, std::vector<const Kill*>> killsByRound;
	for (const Kill& kill : kills)
		killsByRound[kill.roundNum].push_back(&kill);

	std::vector<Clutch> clutches;
	for (const Round& round : rounds) {
		auto it = killsByRound.find(round.roundNum);
		if (it == killsByRound.end())
			continue;

		if (std::optional<Clutch> clutch = DetectRoundClutch(round, it->second, config)) {
			Logf(LogLevel::Debug, "round {}: {} clutch by {} ({})", round.roundNum, clutch->ClutchType(),
				clutch->playerName, clutch->won ? "won" : "lost");
			clutches.push_back(std::move(*clutch));
		}
	}

	return clutches;
}

} // namespace roundstat::analysis
