/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

record_fields.cpp implementation.*/

#include "record_fields.hpp"

#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <string>

namespace roundstat::report {

using namespace roundstat::match;

namespace {

Json::Value Text(std::string_view value) {
	return Json::Value(std::string(value));
}

Json::Value TeamValue(Team team) {
	return Text(TeamName(team));
}

template<typename T>
Json::Value OptionalValue(const std::optional<T>& value) {
	if (!value)
		return Json::Value(Json::nullValue);
	return Json::Value(*value);
}

Json::Value OptionalRounded(const std::optional<double>& value, int decimals) {
	if (!value)
		return Json::Value(Json::nullValue);
	return Json::Value(RoundTo(*value, decimals));
}

template<typename Record, typename Encoder>
RecordCollection Collect(std::string_view name, const std::vector<Record>& records, Encoder encode) {
	RecordCollection collection{ name, {} };
	collection.rows.reserve(records.size());
	for (const Record& record : records)
		collection.rows.push_back(encode(record));
	return collection;
}

} // namespace

double RoundTo(double value, int decimals) {
	const double scale = std::pow(10.0, decimals);
	return std::round(value * scale) / scale;
}

FieldList MetadataFields(const MatchMetadata& metadata) {
	return {
		{ "match_id", Text(metadata.matchId) },
		{ "demo_file", Text(metadata.demoFile) },
		{ "map_name", Text(metadata.mapName) },
		{ "server_name", Text(metadata.serverName) },
		{ "tickrate", metadata.tickRate },
		{ "total_ticks", Json::Value(metadata.totalTicks) },
		{ "duration_seconds", metadata.durationSeconds },
		{ "duration_formatted", Text(metadata.durationFormatted) },
		{ "total_rounds", metadata.totalRounds },
		{ "score_ct", metadata.scoreCT },
		{ "score_t", metadata.scoreT },
		{ "winner", Text(metadata.winner) },
		{ "extracted_at", Text(metadata.extractedAt) },
		{ "dropped_records", metadata.droppedRecords },
	};
}

FieldList PlayerFields(const Player& player) {
	return {
		{ "steamid", Text(player.id) },
		{ "name", Text(player.name) },
		{ "team", TeamValue(player.team) },
	};
}

FieldList PlayerStatsFields(const PlayerMatchStats& stats) {
	return {
		{ "steamid", Text(stats.playerId) },
		{ "name", Text(stats.name) },
		{ "team", TeamValue(stats.team) },
		{ "kills", stats.kills },
		{ "deaths", stats.deaths },
		{ "assists", stats.assists },
		{ "kd_ratio", RoundTo(stats.kdRatio, 2) },
		{ "adr", RoundTo(stats.adr, 1) },
		{ "kast", RoundTo(stats.kast, 1) },
		{ "kast_rounds", stats.kastRounds },
		{ "headshots", stats.headshots },
		{ "hs_percentage", RoundTo(stats.hsPercentage, 1) },
		{ "first_kills", stats.firstKills },
		{ "first_deaths", stats.firstDeaths },
		{ "fk_fd_diff", stats.fkFdDiff },
		{ "trade_kills", stats.tradeKills },
		{ "traded_deaths", stats.tradedDeaths },
		{ "flash_assists", stats.flashAssists },
		{ "clutch_attempts", stats.clutchAttempts },
		{ "clutch_wins", stats.clutchWins },
		{ "clutch_rate", RoundTo(stats.clutchRate, 1) },
		{ "total_damage", stats.totalDamage },
		{ "utility_damage", stats.utilityDamage },
		{ "rounds_played", stats.roundsPlayed },
		{ "rounds_with_kill", stats.roundsWithKill },
		{ "rounds_survived", stats.roundsSurvived },
		{ "double_kills", stats.doubleKills },
		{ "triple_kills", stats.tripleKills },
		{ "quad_kills", stats.quadKills },
		{ "aces", stats.aces },
		{ "flashes_thrown", stats.flashesThrown },
		{ "smokes_thrown", stats.smokesThrown },
		{ "he_thrown", stats.heThrown },
		{ "molotovs_thrown", stats.molotovsThrown },
		{ "avg_equipment_value", RoundTo(stats.avgEquipmentValue, 1) },
		{ "total_money_spent", stats.totalMoneySpent },
	};
}

FieldList RoundFields(const Round& round) {
	return {
		{ "round_num", round.roundNum },
		{ "start_tick", Json::Value(round.startTick) },
		{ "end_tick", Json::Value(round.endTick) },
		{ "freeze_end_tick", OptionalValue(round.freezeEndTick) },
		{ "duration_seconds", RoundTo(round.durationSeconds, 2) },
		{ "winner", TeamValue(round.winner) },
		{ "reason", Text(RoundEndReasonName(round.reason)) },
	};
}

FieldList RoundStatsFields(const RoundStats& stats) {
	Json::Value firstKillTeam(Json::nullValue);
	if (stats.firstKillAttackerTeam)
		firstKillTeam = TeamValue(*stats.firstKillAttackerTeam);

	return {
		{ "round_num", stats.roundNum },
		{ "winner", TeamValue(stats.winner) },
		{ "reason", Text(RoundEndReasonName(stats.reason)) },
		{ "duration_seconds", RoundTo(stats.durationSeconds, 2) },
		{ "total_kills", stats.totalKills },
		{ "ct_kills", stats.ctKills },
		{ "t_kills", stats.tKills },
		{ "first_kill_id", OptionalValue(stats.firstKillId) },
		{ "first_kill_tick", OptionalValue(stats.firstKillTick) },
		{ "first_kill_attacker", OptionalValue(stats.firstKillAttacker) },
		{ "first_kill_attacker_id", OptionalValue(stats.firstKillAttackerId) },
		{ "first_kill_attacker_team", firstKillTeam },
		{ "first_kill_victim", OptionalValue(stats.firstKillVictim) },
		{ "first_kill_victim_id", OptionalValue(stats.firstKillVictimId) },
		{ "first_kill_weapon", OptionalValue(stats.firstKillWeapon) },
		{ "first_kill_team_won", OptionalValue(stats.firstKillTeamWon) },
		{ "bomb_planted", stats.bombPlanted },
		{ "bomb_plant_tick", OptionalValue(stats.bombPlantTick) },
		{ "bomb_site", OptionalValue(stats.bombSite) },
		{ "ct_equipment_value", stats.ctEquipmentValue },
		{ "t_equipment_value", stats.tEquipmentValue },
	};
}

FieldList KillFields(const Kill& kill) {
	auto coordinate = [](const std::optional<Position>& pos, double Position::*axis) {
		return pos ? Json::Value(RoundTo((*pos).*axis, 2)) : Json::Value(Json::nullValue);
	};

	return {
		{ "kill_id", kill.killId },
		{ "tick", Json::Value(kill.tick) },
		{ "round_num", kill.roundNum },
		{ "attacker_steamid", Text(kill.attackerId) },
		{ "attacker_name", Text(kill.attackerName) },
		{ "attacker_team", TeamValue(kill.attackerTeam) },
		{ "attacker_x", coordinate(kill.attackerPos, &Position::x) },
		{ "attacker_y", coordinate(kill.attackerPos, &Position::y) },
		{ "attacker_z", coordinate(kill.attackerPos, &Position::z) },
		{ "victim_steamid", Text(kill.victimId) },
		{ "victim_name", Text(kill.victimName) },
		{ "victim_team", TeamValue(kill.victimTeam) },
		{ "victim_x", coordinate(kill.victimPos, &Position::x) },
		{ "victim_y", coordinate(kill.victimPos, &Position::y) },
		{ "victim_z", coordinate(kill.victimPos, &Position::z) },
		{ "assister_steamid", OptionalValue(kill.assisterId) },
		{ "assister_name", OptionalValue(kill.assisterName) },
		{ "weapon", Text(kill.weapon) },
		{ "headshot", kill.headshot },
		{ "penetrated", kill.penetrated },
		{ "noscope", kill.noscope },
		{ "thrusmoke", kill.thrusmoke },
		{ "attackerblind", kill.attackerblind },
		{ "assistedflash", kill.assistedflash },
		{ "distance", OptionalRounded(kill.distance, 1) },
		{ "is_first_kill", kill.isFirstKill },
		{ "is_trade", kill.isTrade },
		{ "traded_kill_id", OptionalValue(kill.tradedKillId) },
		{ "trade_time_ticks", OptionalValue(kill.tradeTimeTicks) },
	};
}

FieldList DamageFields(const Damage& damage) {
	return {
		{ "tick", Json::Value(damage.tick) },
		{ "round_num", damage.roundNum },
		{ "attacker_steamid", Text(damage.attackerId) },
		{ "attacker_name", Text(damage.attackerName) },
		{ "attacker_team", TeamValue(damage.attackerTeam) },
		{ "victim_steamid", Text(damage.victimId) },
		{ "victim_name", Text(damage.victimName) },
		{ "victim_team", TeamValue(damage.victimTeam) },
		{ "weapon", Text(damage.weapon) },
		{ "damage_health", OptionalValue(damage.damageHealth) },
		{ "damage_armor", OptionalValue(damage.damageArmor) },
		{ "hitgroup", Text(damage.hitgroup) },
		{ "health_remaining", OptionalValue(damage.healthRemaining) },
		{ "armor_remaining", OptionalValue(damage.armorRemaining) },
		{ "is_utility", damage.isUtility },
	};
}

FieldList GrenadeFields(const Grenade& grenade) {
	auto coordinate = [&grenade](double Position::*axis) {
		return grenade.position ? Json::Value(RoundTo((*grenade.position).*axis, 2)) : Json::Value(Json::nullValue);
	};

	return {
		{ "grenade_type", Text(GrenadeTypeName(grenade.type)) },
		{ "tick", Json::Value(grenade.tick) },
		{ "round_num", grenade.roundNum },
		{ "thrower_steamid", Text(grenade.throwerId) },
		{ "thrower_name", Text(grenade.throwerName) },
		{ "thrower_team", TeamValue(grenade.throwerTeam) },
		{ "x", coordinate(&Position::x) },
		{ "y", coordinate(&Position::y) },
		{ "z", coordinate(&Position::z) },
	};
}

FieldList BombEventFields(const BombEvent& event) {
	return {
		{ "event_type", Text(BombEventTypeName(event.type)) },
		{ "tick", Json::Value(event.tick) },
		{ "round_num", event.roundNum },
		{ "player_steamid", Text(event.playerId) },
		{ "player_name", Text(event.playerName) },
		{ "player_team", TeamValue(event.playerTeam) },
		{ "x", OptionalRounded(event.x, 2) },
		{ "y", OptionalRounded(event.y, 2) },
		{ "site", OptionalValue(event.site) },
	};
}

FieldList EconomyFields(const EconomySnapshot& snapshot) {
	return {
		{ "round_num", snapshot.roundNum },
		{ "tick", Json::Value(snapshot.tick) },
		{ "steamid", Text(snapshot.playerId) },
		{ "name", Text(snapshot.playerName) },
		{ "team", TeamValue(snapshot.team) },
		{ "equipment_value", OptionalValue(snapshot.equipmentValue) },
		{ "cash_spent_round", OptionalValue(snapshot.cashSpentRound) },
		{ "total_cash_spent", OptionalValue(snapshot.totalCashSpent) },
		{ "balance", OptionalValue(snapshot.balance) },
	};
}

FieldList ClutchFields(const Clutch& clutch) {
	return {
		{ "round_num", clutch.roundNum },
		{ "player_steamid", Text(clutch.playerId) },
		{ "player_name", Text(clutch.playerName) },
		{ "player_team", TeamValue(clutch.team) },
		{ "clutch_type", Text(clutch.ClutchType()) },
		{ "opponents", clutch.opponents },
		{ "won", clutch.won },
		{ "start_tick", Json::Value(clutch.startTick) },
		{ "end_tick", Json::Value(clutch.endTick) },
		{ "duration_seconds", RoundTo(clutch.durationSeconds, 2) },
		{ "kills_made", clutch.killsMade },
	};
}

std::vector<RecordCollection> CollectRecords(const analysis::MatchAnalysis& analysis) {
	std::vector<RecordCollection> collections;
	collections.push_back(Collect("players", analysis.players, PlayerFields));
	collections.push_back(Collect("player_stats", analysis.playerStats, PlayerStatsFields));
	collections.push_back(Collect("rounds", analysis.rounds, RoundFields));
	collections.push_back(Collect("round_stats", analysis.roundStats, RoundStatsFields));
	collections.push_back(Collect("kills", analysis.kills, KillFields));
	collections.push_back(Collect("damages", analysis.damages, DamageFields));
	collections.push_back(Collect("grenades", analysis.grenades, GrenadeFields));
	collections.push_back(Collect("bomb_events", analysis.bombEvents, BombEventFields));
	collections.push_back(Collect("economy", analysis.economy, EconomyFields));
	collections.push_back(Collect("clutches", analysis.clutches, ClutchFields));
	return collections;
}

std::string FieldText(const Json::Value& value) {
	switch (value.type()) {
	case Json::nullValue:
		return {};
	case Json::booleanValue:
		return value.asBool() ? "true" : "false";
	case Json::intValue:
		return std::to_string(value.asInt64());
	case Json::uintValue:
		return std::to_string(value.asUInt64());
	case Json::realValue:
		return fmt::format("{}", value.asDouble());
	case Json::stringValue:
		return value.asString();
	default:
		return {};
	}
}

} // namespace roundstat::report
