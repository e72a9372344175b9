/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

player_stats_aggregator.cpp implementation.*/

#include "player_stats_aggregator.hpp"

#include "../shared/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace roundstat::analysis {

using namespace roundstat::match;

namespace {

constexpr int kAceKills = 5;

struct PlayerAccumulator {
	PlayerMatchStats stats;
	bool fromPlayerTable = false;

	std::map<int, int> killsPerRound;
	std::set<int> assistRounds;
	std::set<int> deathRounds;
	std::set<int> tradedDeathRounds;

	int64_t equipmentTotal = 0;
	int equipmentSamples = 0;
};

/*
=================
PlayerRoster

Player accumulators in first-seen order, keyed by identity.
=================
*/
class PlayerRoster {
public:
	PlayerAccumulator* Observe(const std::string& id, std::string_view name, Team team, bool fromPlayerTable) {
		if (!IsPlayerIdentity(id))
			return nullptr;

		auto it = index_.find(id);
		if (it == index_.end()) {
			PlayerAccumulator entry;
			entry.stats.playerId = id;
			entry.stats.name = std::string(name);
			entry.stats.team = team;
			entry.fromPlayerTable = fromPlayerTable;
			index_.emplace(id, entries_.size());
			entries_.push_back(std::move(entry));
			return &entries_.back();
		}

		PlayerAccumulator& entry = entries_[it->second];
		if (!entry.fromPlayerTable && !fromPlayerTable) {
			if (name != kUnknownIdentity)
				entry.stats.name = std::string(name);
			if (team != Team::Unknown)
				entry.stats.team = team;
		}
		return &entry;
	}

	PlayerAccumulator* Find(const std::string& id) {
		auto it = index_.find(id);
		return it == index_.end() ? nullptr : &entries_[it->second];
	}

	std::vector<PlayerAccumulator>& Entries() { return entries_; }

private:
	std::vector<PlayerAccumulator> entries_;
	std::unordered_map<std::string, size_t> index_;
};

void CountGrenade(PlayerMatchStats& stats, GrenadeType type) {
	switch (type) {
	case GrenadeType::Flash:
		++stats.flashesThrown;
		break;
	case GrenadeType::Smoke:
		++stats.smokesThrown;
		break;
	case GrenadeType::HE:
		++stats.heThrown;
		break;
	case GrenadeType::Molotov:
		++stats.molotovsThrown;
		break;
	default:
		break;
	}
}

double Percentage(int part, int whole) {
	return whole > 0 ? 100.0 * static_cast<double>(part) / static_cast<double>(whole) : 0.0;
}

/*
=============
FinalizeStats

Turns the per-round tallies into the derived ratios and the KAST rate.
=============
*/
void FinalizeStats(PlayerAccumulator& entry, const std::set<int>& roundNums) {
	PlayerMatchStats& stats = entry.stats;
	const int totalRounds = static_cast<int>(roundNums.size());

	stats.roundsPlayed = totalRounds;
	stats.kdRatio = stats.deaths > 0
		? static_cast<double>(stats.kills) / static_cast<double>(stats.deaths)
		: static_cast<double>(stats.kills);
	stats.adr = totalRounds > 0 ? static_cast<double>(stats.totalDamage) / static_cast<double>(totalRounds) : 0.0;
	stats.hsPercentage = Percentage(stats.headshots, stats.kills);
	stats.fkFdDiff = stats.firstKills - stats.firstDeaths;
	stats.clutchRate = Percentage(stats.clutchWins, stats.clutchAttempts);

	if (entry.equipmentSamples > 0)
		stats.avgEquipmentValue = static_cast<double>(entry.equipmentTotal) / static_cast<double>(entry.equipmentSamples);

	for (const auto& [roundNum, count] : entry.killsPerRound) {
		if (!roundNums.count(roundNum))
			continue;

		++stats.roundsWithKill;
		if (count >= kAceKills)
			++stats.aces;
		else if (count == 4)
			++stats.quadKills;
		else if (count == 3)
			++stats.tripleKills;
		else if (count == 2)
			++stats.doubleKills;
	}

	int kastRounds = 0;
	for (int roundNum : roundNums) {
		const bool survived = !entry.deathRounds.count(roundNum);
		if (survived)
			++stats.roundsSurvived;

		if (entry.killsPerRound.count(roundNum) || entry.assistRounds.count(roundNum) || survived
			|| entry.tradedDeathRounds.count(roundNum))
			++kastRounds;
	}
	stats.kastRounds = kastRounds;
	stats.kast = Percentage(kastRounds, totalRounds);
}

} // namespace

std::vector<PlayerMatchStats> AggregatePlayerStats(const AggregationInput& input) {
	PlayerRoster roster;

	for (const Player& player : input.players)
		roster.Observe(player.id, player.name, player.team, true);

	for (const Kill& kill : input.kills) {
		roster.Observe(kill.attackerId, kill.attackerName, kill.attackerTeam, false);
		roster.Observe(kill.victimId, kill.victimName, kill.victimTeam, false);
		if (kill.assisterId)
			roster.Observe(*kill.assisterId, kill.assisterName.value_or(std::string(kUnknownIdentity)), Team::Unknown, false);
	}
	for (const Damage& damage : input.damages) {
		roster.Observe(damage.attackerId, damage.attackerName, damage.attackerTeam, false);
		roster.Observe(damage.victimId, damage.victimName, damage.victimTeam, false);
	}

	std::set<int> roundNums;
	for (const Round& round : input.rounds)
		roundNums.insert(round.roundNum);

	std::unordered_set<KillId> avengedKills;
	for (const Kill& kill : input.kills) {
		if (kill.tradedKillId)
			avengedKills.insert(*kill.tradedKillId);
	}

	for (const Kill& kill : input.kills) {
		if (PlayerAccumulator* attacker = roster.Find(kill.attackerId)) {
			PlayerMatchStats& stats = attacker->stats;
			++stats.kills;
			if (kill.headshot)
				++stats.headshots;
			if (kill.isFirstKill)
				++stats.firstKills;
			if (kill.isTrade)
				++stats.tradeKills;
			++attacker->killsPerRound[kill.roundNum];
		}

		if (PlayerAccumulator* victim = roster.Find(kill.victimId)) {
			PlayerMatchStats& stats = victim->stats;
			++stats.deaths;
			if (kill.isFirstKill)
				++stats.firstDeaths;
			victim->deathRounds.insert(kill.roundNum);
			if (avengedKills.count(kill.killId)) {
				++stats.tradedDeaths;
				victim->tradedDeathRounds.insert(kill.roundNum);
			}
		}

		if (!kill.assisterId)
			continue;

		if (PlayerAccumulator* assister = roster.Find(*kill.assisterId)) {
			++assister->stats.assists;
			if (kill.assistedflash)
				++assister->stats.flashAssists;
			assister->assistRounds.insert(kill.roundNum);
		}
	}

	for (const Damage& damage : input.damages) {
		PlayerAccumulator* attacker = roster.Find(damage.attackerId);
		if (!attacker || !damage.damageHealth)
			continue;

		attacker->stats.totalDamage += *damage.damageHealth;
		if (damage.isUtility)
			attacker->stats.utilityDamage += *damage.damageHealth;
	}

	for (const Grenade& grenade : input.grenades) {
		if (PlayerAccumulator* thrower = roster.Find(grenade.throwerId))
			CountGrenade(thrower->stats, grenade.type);
	}

	for (const EconomySnapshot& snapshot : input.economy) {
		PlayerAccumulator* player = roster.Find(snapshot.playerId);
		if (!player)
			continue;

		if (snapshot.equipmentValue) {
			player->equipmentTotal += *snapshot.equipmentValue;
			++player->equipmentSamples;
		}
		if (snapshot.totalCashSpent)
			player->stats.totalMoneySpent = std::max(player->stats.totalMoneySpent, *snapshot.totalCashSpent);
	}

	for (const Clutch& clutch : input.clutches) {
		PlayerAccumulator* player = roster.Find(clutch.playerId);
		if (!player)
			continue;

		++player->stats.clutchAttempts;
		if (clutch.won)
			++player->stats.clutchWins;
	}

	std::vector<PlayerMatchStats> result;
	result.reserve(roster.Entries().size());
	for (PlayerAccumulator& entry : roster.Entries()) {
		FinalizeStats(entry, roundNums);
		result.push_back(std::move(entry.stats));
	}

	std::stable_sort(result.begin(), result.end(), [](const PlayerMatchStats& a, const PlayerMatchStats& b) {
		return a.adr > b.adr;
	});

	Logf(LogLevel::Debug, "player stats: {} players over {} rounds", result.size(), roundNums.size());
	return result;
}

} // namespace roundstat::analysis
