// match_fixture.hpp - Record builders shared by the analysis tests.

#pragma once

#include "match/match_types.hpp"

#include <string>
#include <vector>

namespace roundstat::test {

inline match::Kill MakeKill(match::KillId id, match::Tick tick, int roundNum,
	const std::string& attacker, match::Team attackerTeam,
	const std::string& victim, match::Team victimTeam) {
	match::Kill kill;
	kill.killId = id;
	kill.tick = tick;
	kill.roundNum = roundNum;
	kill.attackerId = attacker;
	kill.attackerName = attacker;
	kill.attackerTeam = attackerTeam;
	kill.victimId = victim;
	kill.victimName = victim;
	kill.victimTeam = victimTeam;
	kill.weapon = "ak47";
	return kill;
}

inline match::Round MakeRound(int roundNum, match::Tick startTick, match::Tick endTick, match::Team winner,
	match::RoundEndReason reason = match::RoundEndReason::Elimination) {
	match::Round round;
	round.roundNum = roundNum;
	round.startTick = startTick;
	round.endTick = endTick;
	round.winner = winner;
	round.reason = reason;
	round.durationSeconds = static_cast<double>(endTick - startTick) / 64.0;
	return round;
}

inline match::Damage MakeDamage(match::Tick tick, int roundNum, const std::string& attacker, match::Team attackerTeam,
	const std::string& victim, match::Team victimTeam, int health, const std::string& weapon = "ak47") {
	match::Damage damage;
	damage.tick = tick;
	damage.roundNum = roundNum;
	damage.attackerId = attacker;
	damage.attackerName = attacker;
	damage.attackerTeam = attackerTeam;
	damage.victimId = victim;
	damage.victimName = victim;
	damage.victimTeam = victimTeam;
	damage.weapon = weapon;
	damage.damageHealth = health;
	damage.hitgroup = "1";
	damage.isUtility = match::IsUtilityWeapon(weapon);
	return damage;
}

inline match::Player MakePlayer(const std::string& id, match::Team team) {
	return match::Player{ id, id, team };
}

inline const match::PlayerMatchStats* FindStats(const std::vector<match::PlayerMatchStats>& stats, const std::string& id) {
	for (const match::PlayerMatchStats& entry : stats) {
		if (entry.playerId == id)
			return &entry;
	}
	return nullptr;
}

} // namespace roundstat::test
