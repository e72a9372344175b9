/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

round_summarizer.cpp implementation.*/

#include "round_summarizer.hpp"

#include "../shared/logger.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <utility>

namespace roundstat::analysis {

using namespace roundstat::match;

namespace {

/*
=============
EarliestSnapshots

Keeps the first snapshot of every player in every round so a round that was
sampled more than once is not counted twice. Snapshots without an equipment
reading are passed over.
=============
*/
std::map<std::pair<int, std::string>, const EconomySnapshot*> EarliestSnapshots(const std::vector<EconomySnapshot>& economy) {
	std::map<std::pair<int, std::string>, const EconomySnapshot*> earliest;
	for (const EconomySnapshot& snapshot : economy) {
		if (!snapshot.equipmentValue)
			continue;

		auto key = std::make_pair(snapshot.roundNum, snapshot.playerId);
		auto it = earliest.find(key);
		if (it == earliest.end())
			earliest.emplace(std::move(key), &snapshot);
		else if (snapshot.tick < it->second->tick)
			it->second = &snapshot;
	}
	return earliest;
}

} // namespace

std::vector<RoundStats> SummarizeRounds(const std::vector<Round>& rounds,
	std::vector<Kill>& kills,
	const std::vector<BombEvent>& bombEvents,
	const std::vector<EconomySnapshot>& economy) {
	for (Kill& kill : kills)
		kill.isFirstKill = false;

	std::unordered_map<int, size_t> statsIndex;
	std::vector<RoundStats> summaries;
	summaries.reserve(rounds.size());
	for (const Round& round : rounds) {
		RoundStats stats;
		stats.roundNum = round.roundNum;
		stats.winner = round.winner;
		stats.reason = round.reason;
		stats.durationSeconds = round.durationSeconds;
		statsIndex.emplace(round.roundNum, summaries.size());
		summaries.push_back(std::move(stats));
	}

	std::vector<Kill*> firstKills(summaries.size(), nullptr);
	for (Kill& kill : kills) {
		auto it = statsIndex.find(kill.roundNum);
		if (it == statsIndex.end())
			continue;

		RoundStats& stats = summaries[it->second];
		++stats.totalKills;
		if (kill.attackerTeam == Team::CT)
			++stats.ctKills;
		else if (kill.attackerTeam == Team::T)
			++stats.tKills;

		Kill*& first = firstKills[it->second];
		if (!first || kill.tick < first->tick || (kill.tick == first->tick && kill.killId < first->killId))
			first = &kill;
	}

	for (size_t i = 0; i < summaries.size(); ++i) {
		Kill* first = firstKills[i];
		if (!first)
			continue;

		first->isFirstKill = true;

		RoundStats& stats = summaries[i];
		stats.firstKillId = first->killId;
		stats.firstKillTick = first->tick;
		stats.firstKillAttacker = first->attackerName;
		stats.firstKillAttackerId = first->attackerId;
		stats.firstKillAttackerTeam = first->attackerTeam;
		stats.firstKillVictim = first->victimName;
		stats.firstKillVictimId = first->victimId;
		stats.firstKillWeapon = first->weapon;
		if (stats.winner != Team::Unknown)
			stats.firstKillTeamWon = first->attackerTeam == stats.winner;
	}

	for (const BombEvent& event : bombEvents) {
		if (event.type != BombEventType::Plant)
			continue;

		auto it = statsIndex.find(event.roundNum);
		if (it == statsIndex.end())
			continue;

		RoundStats& stats = summaries[it->second];
		if (stats.bombPlanted && stats.bombPlantTick && *stats.bombPlantTick <= event.tick)
			continue;

		stats.bombPlanted = true;
		stats.bombPlantTick = event.tick;
		stats.bombSite = event.site;
	}

	for (const auto& [key, snapshot] : EarliestSnapshots(economy)) {
		auto it = statsIndex.find(key.first);
		if (it == statsIndex.end())
			continue;

		RoundStats& stats = summaries[it->second];
		if (snapshot->team == Team::CT)
			stats.ctEquipmentValue += *snapshot->equipmentValue;
		else if (snapshot->team == Team::T)
			stats.tEquipmentValue += *snapshot->equipmentValue;
	}

	Logf(LogLevel::Debug, "round summarizer: {} rounds summarized", summaries.size());
	return summaries;
}

} // namespace roundstat::analysis
