/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

event_normalizer.cpp implementation.*/

#include "event_normalizer.hpp"

#include "../shared/logger.hpp"
#include "../shared/text_utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <set>
#include <utility>

namespace roundstat::ingest {

using namespace roundstat::match;

namespace {

using KeyList = std::initializer_list<const char*>;

/*
=============
FindField

Returns the first non-null member among the aliases, or nullptr.
=============
*/
const Json::Value* FindField(const RawRecord& row, KeyList keys) {
	for (const char* key : keys) {
		const Json::Value* value = row.find(key, key + std::char_traits<char>::length(key));
		if (value && !value->isNull())
			return value;
	}
	return nullptr;
}

bool HasKey(const RawRecord& row, KeyList keys) {
	for (const char* key : keys) {
		if (row.isMember(key))
			return true;
	}
	return false;
}

std::optional<double> OptionalDouble(const RawRecord& row, KeyList keys) {
	const Json::Value* value = FindField(row, keys);
	if (!value)
		return std::nullopt;

	std::optional<double> result;
	if (value->isNumeric())
		result = value->asDouble();
	else if (value->isString())
		result = ParseDouble(value->asString());

	if (result && !std::isfinite(*result))
		return std::nullopt;
	return result;
}

std::optional<int64_t> OptionalInt64(const RawRecord& row, KeyList keys) {
	const Json::Value* value = FindField(row, keys);
	if (!value)
		return std::nullopt;

	if (value->isInt64())
		return value->asInt64();
	if (value->isString()) {
		if (const std::optional<int64_t> parsed = ParseInt64(value->asString()))
			return parsed;
	}

	// 2^63 is exactly representable; anything at or past it does not fit.
	const std::optional<double> number = OptionalDouble(row, keys);
	if (!number || *number >= 9223372036854775808.0 || *number < -9223372036854775808.0)
		return std::nullopt;
	return static_cast<int64_t>(std::llround(*number));
}

std::optional<int> OptionalInt(const RawRecord& row, KeyList keys) {
	const std::optional<int64_t> value = OptionalInt64(row, keys);
	if (!value || *value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
		return std::nullopt;
	return static_cast<int>(*value);
}

std::optional<std::string> OptionalText(const RawRecord& row, KeyList keys) {
	const Json::Value* value = FindField(row, keys);
	if (!value)
		return std::nullopt;

	if (value->isUInt64())
		return std::to_string(value->asUInt64());
	if (value->isInt64())
		return std::to_string(value->asInt64());
	if (value->isString() || value->isNumeric() || value->isBool())
		return value->asString();
	return std::nullopt;
}

/*
=============
IdentityField

Steam id of a participant. A missing field becomes the unknown marker. When
blankIsWorld, a null, blank or zero id names the world (no attacker);
otherwise those are unknown too.
=============
*/
std::string IdentityField(const RawRecord& row, KeyList keys, bool blankIsWorld) {
	const std::optional<std::string> text = OptionalText(row, keys);
	if (!text) {
		if (blankIsWorld && HasKey(row, keys))
			return std::string(kWorldIdentity);
		return std::string(kUnknownIdentity);
	}

	const std::optional<std::string_view> trimmed = TrimNonEmpty(*text);
	if (!trimmed || *trimmed == "0")
		return std::string(blankIsWorld ? kWorldIdentity : kUnknownIdentity);

	return std::string(*trimmed);
}

std::string NameField(const RawRecord& row, KeyList keys) {
	const std::optional<std::string> text = OptionalText(row, keys);
	return text ? *text : std::string(kUnknownIdentity);
}

Team TeamField(const RawRecord& row, KeyList keys) {
	const std::optional<std::string> text = OptionalText(row, keys);
	return text ? ParseTeam(*text) : Team::Unknown;
}

bool BoolField(const RawRecord& row, KeyList keys) {
	const Json::Value* value = FindField(row, keys);
	if (!value)
		return false;

	if (value->isBool())
		return value->asBool();
	if (value->isNumeric())
		return value->asDouble() != 0.0;
	if (value->isString()) {
		const std::string upper = ToUpperCopy(value->asString());
		return upper == "TRUE" || upper == "1" || upper == "YES";
	}
	return false;
}

std::optional<Position> PositionField(const RawRecord& row, KeyList xKeys, KeyList yKeys, KeyList zKeys) {
	const std::optional<double> x = OptionalDouble(row, xKeys);
	const std::optional<double> y = OptionalDouble(row, yKeys);
	const std::optional<double> z = OptionalDouble(row, zKeys);
	if (!x || !y || !z)
		return std::nullopt;
	return Position{ *x, *y, *z };
}

/*
=============
RoundNumField

Explicit round_num, else the parser's zero-based rounds-played counter + 1.
=============
*/
std::optional<int> RoundNumField(const RawRecord& row) {
	if (const std::optional<int> explicitRound = OptionalInt(row, { "round_num" }))
		return explicitRound;

	const std::optional<int> played = OptionalInt(row, { "total_rounds_played" });
	if (played && *played < std::numeric_limits<int>::max())
		return *played + 1;

	return std::nullopt;
}

std::optional<double> Distance(const std::optional<Position>& a, const std::optional<Position>& b) {
	if (!a || !b)
		return std::nullopt;

	const double dx = b->x - a->x;
	const double dy = b->y - a->y;
	const double dz = b->z - a->z;
	return std::sqrt(dx * dx + dy * dy + dz * dz);
}

constexpr std::array<std::pair<std::string_view, GrenadeType>, 5> kGrenadeTables = { {
	{ events::kHeGrenadeDetonate, GrenadeType::HE },
	{ events::kFlashbangDetonate, GrenadeType::Flash },
	{ events::kSmokeGrenadeDetonate, GrenadeType::Smoke },
	{ events::kInfernoStartBurn, GrenadeType::Molotov },
	{ events::kDecoyStarted, GrenadeType::Decoy },
} };

constexpr std::array<std::pair<std::string_view, BombEventType>, 5> kBombTables = { {
	{ events::kBombPlanted, BombEventType::Plant },
	{ events::kBombDefused, BombEventType::Defuse },
	{ events::kBombExploded, BombEventType::Explode },
	{ events::kBombDropped, BombEventType::Drop },
	{ events::kBombPickup, BombEventType::Pickup },
} };

/*
=============
NormalizeTable

Runs one row normalizer over a table, counting rows it rejects.
=============
*/
template<typename Record, typename Fn>
void NormalizeTable(const DemoEventTables& tables, std::string_view kind, NormalizeStats& stats, std::vector<Record>& out, Fn&& normalize) {
	const RawTable& rows = tables.Table(kind);
	if (rows.empty()) {
		Logf(LogLevel::Info, "no {} events in this match", kind);
		return;
	}

	out.reserve(out.size() + rows.size());
	for (const RawRecord& row : rows) {
		std::optional<Record> record = normalize(row);
		if (!record) {
			stats.CountDrop(kind);
			continue;
		}
		out.push_back(std::move(*record));
	}
}

} // namespace

void NormalizeStats::CountDrop(std::string_view kind) {
	auto it = dropped.find(kind);
	if (it == dropped.end())
		dropped.emplace(std::string(kind), 1);
	else
		++it->second;
}

int NormalizeStats::Dropped(std::string_view kind) const {
	auto it = dropped.find(kind);
	return it == dropped.end() ? 0 : it->second;
}

int NormalizeStats::TotalDropped() const {
	int total = 0;
	for (const auto& [kind, count] : dropped)
		total += count;
	return total;
}

std::optional<Kill> NormalizeKill(const RawRecord& row) {
	const std::optional<int64_t> tick = OptionalInt64(row, { "tick" });
	const std::optional<int> roundNum = RoundNumField(row);
	if (!tick || !roundNum)
		return std::nullopt;

	Kill kill;
	kill.tick = *tick;
	kill.roundNum = *roundNum;

	kill.attackerId = IdentityField(row, { "attacker_steamid" }, true);
	kill.attackerName = NameField(row, { "attacker_name" });
	if (kill.attackerId == kWorldIdentity && kill.attackerName == kUnknownIdentity)
		kill.attackerName = kWorldIdentity;
	kill.attackerTeam = TeamField(row, { "attacker_team_name", "attacker_team" });
	kill.attackerPos = PositionField(row, { "attacker_X", "attacker_x" }, { "attacker_Y", "attacker_y" }, { "attacker_Z", "attacker_z" });

	kill.victimId = IdentityField(row, { "user_steamid", "victim_steamid" }, false);
	kill.victimName = NameField(row, { "user_name", "victim_name" });
	kill.victimTeam = TeamField(row, { "user_team_name", "victim_team_name", "victim_team" });
	kill.victimPos = PositionField(row, { "user_X", "victim_X", "user_x", "victim_x" }, { "user_Y", "victim_Y", "user_y", "victim_y" }, { "user_Z", "victim_Z", "user_z", "victim_z" });

	const std::optional<std::string> assister = OptionalText(row, { "assister_steamid" });
	if (assister) {
		const std::optional<std::string_view> trimmed = TrimNonEmpty(*assister);
		if (trimmed && *trimmed != "0") {
			kill.assisterId = std::string(*trimmed);
			kill.assisterName = OptionalText(row, { "assister_name" });
		}
	}

	kill.weapon = NameField(row, { "weapon" });
	kill.headshot = BoolField(row, { "headshot" });
	kill.penetrated = BoolField(row, { "penetrated" });
	kill.noscope = BoolField(row, { "noscope" });
	kill.thrusmoke = BoolField(row, { "thrusmoke" });
	kill.attackerblind = BoolField(row, { "attackerblind" });
	kill.assistedflash = BoolField(row, { "assistedflash" });
	kill.distance = Distance(kill.attackerPos, kill.victimPos);

	return kill;
}

std::optional<Damage> NormalizeDamage(const RawRecord& row) {
	const std::optional<int64_t> tick = OptionalInt64(row, { "tick" });
	const std::optional<int> roundNum = RoundNumField(row);
	if (!tick || !roundNum)
		return std::nullopt;

	Damage damage;
	damage.tick = *tick;
	damage.roundNum = *roundNum;
	damage.attackerId = IdentityField(row, { "attacker_steamid" }, true);
	damage.attackerName = NameField(row, { "attacker_name" });
	if (damage.attackerId == kWorldIdentity && damage.attackerName == kUnknownIdentity)
		damage.attackerName = kWorldIdentity;
	damage.attackerTeam = TeamField(row, { "attacker_team_name", "attacker_team" });
	damage.victimId = IdentityField(row, { "user_steamid", "victim_steamid" }, false);
	damage.victimName = NameField(row, { "user_name", "victim_name" });
	damage.victimTeam = TeamField(row, { "user_team_name", "victim_team_name", "victim_team" });
	damage.weapon = NameField(row, { "weapon" });
	damage.damageHealth = OptionalInt(row, { "dmg_health", "damage_health" });
	damage.damageArmor = OptionalInt(row, { "dmg_armor", "damage_armor" });
	damage.hitgroup = NameField(row, { "hitgroup" });
	damage.healthRemaining = OptionalInt(row, { "health", "health_remaining" });
	damage.armorRemaining = OptionalInt(row, { "armor", "armor_remaining" });
	damage.isUtility = IsUtilityWeapon(damage.weapon);
	return damage;
}

std::optional<Grenade> NormalizeGrenade(const RawRecord& row, GrenadeType type) {
	const std::optional<int64_t> tick = OptionalInt64(row, { "tick" });
	const std::optional<int> roundNum = RoundNumField(row);
	if (!tick || !roundNum)
		return std::nullopt;

	Grenade grenade;
	grenade.type = type;
	grenade.tick = *tick;
	grenade.roundNum = *roundNum;
	grenade.throwerId = IdentityField(row, { "user_steamid", "steamid" }, false);
	grenade.throwerName = NameField(row, { "user_name", "name" });
	grenade.throwerTeam = TeamField(row, { "user_team_name", "team_name" });
	grenade.position = PositionField(row, { "x", "X" }, { "y", "Y" }, { "z", "Z" });
	return grenade;
}

std::optional<BombEvent> NormalizeBombEvent(const RawRecord& row, BombEventType type) {
	const std::optional<int64_t> tick = OptionalInt64(row, { "tick" });
	const std::optional<int> roundNum = RoundNumField(row);
	if (!tick || !roundNum)
		return std::nullopt;

	BombEvent event;
	event.type = type;
	event.tick = *tick;
	event.roundNum = *roundNum;
	event.playerId = IdentityField(row, { "user_steamid", "steamid" }, false);
	event.playerName = NameField(row, { "user_name", "name" });
	event.playerTeam = TeamField(row, { "user_team_name", "team_name" });
	event.x = OptionalDouble(row, { "x", "X" });
	event.y = OptionalDouble(row, { "y", "Y" });
	event.site = OptionalText(row, { "site" });
	return event;
}

std::optional<EconomySnapshot> NormalizeEconomySnapshot(const RawRecord& row, const std::vector<Round>& rounds) {
	const std::optional<int64_t> tick = OptionalInt64(row, { "tick" });
	if (!tick)
		return std::nullopt;

	const std::string playerId = IdentityField(row, { "steamid", "user_steamid" }, false);
	if (!IsPlayerIdentity(playerId))
		return std::nullopt;

	std::optional<int> roundNum = RoundNumField(row);
	if (!roundNum) {
		for (const Round& round : rounds) {
			if (*tick >= round.startTick && *tick <= round.endTick) {
				roundNum = round.roundNum;
				break;
			}
		}
	}
	if (!roundNum)
		return std::nullopt;

	EconomySnapshot snapshot;
	snapshot.roundNum = *roundNum;
	snapshot.tick = *tick;
	snapshot.playerId = playerId;
	snapshot.playerName = NameField(row, { "name", "user_name" });
	snapshot.team = TeamField(row, { "team_name", "team" });
	snapshot.equipmentValue = OptionalInt(row, { "current_equip_value", "equipment_value" });
	snapshot.cashSpentRound = OptionalInt(row, { "cash_spent_this_round", "cash_spent_round" });
	snapshot.totalCashSpent = OptionalInt(row, { "total_cash_spent" });
	snapshot.balance = OptionalInt(row, { "balance", "money" });
	return snapshot;
}

std::optional<Player> NormalizePlayer(const RawRecord& row) {
	const std::string playerId = IdentityField(row, { "steamid", "user_steamid" }, false);
	if (!IsPlayerIdentity(playerId))
		return std::nullopt;

	Player player;
	player.id = playerId;
	player.name = NameField(row, { "name", "user_name" });
	player.team = TeamField(row, { "team_name", "team" });
	return player;
}

std::vector<Round> BuildRounds(const RawTable& roundEnds, const RawTable& freezeEnds, int tickRate, NormalizeStats& stats) {
	struct RoundEndRow {
		Tick tick;
		Team winner;
		RoundEndReason reason;
	};

	std::vector<RoundEndRow> ends;
	ends.reserve(roundEnds.size());
	for (const RawRecord& row : roundEnds) {
		const std::optional<int64_t> tick = OptionalInt64(row, { "tick" });
		if (!tick) {
			stats.CountDrop(events::kRoundEnd);
			continue;
		}

		const std::optional<std::string> reason = OptionalText(row, { "reason" });
		ends.push_back({ *tick, TeamField(row, { "winner" }), reason ? ParseRoundEndReason(*reason) : RoundEndReason::Unknown });
	}
	std::stable_sort(ends.begin(), ends.end(), [](const RoundEndRow& a, const RoundEndRow& b) { return a.tick < b.tick; });

	std::vector<Tick> freezeTicks;
	freezeTicks.reserve(freezeEnds.size());
	for (const RawRecord& row : freezeEnds) {
		const std::optional<int64_t> tick = OptionalInt64(row, { "tick" });
		if (!tick) {
			stats.CountDrop(events::kRoundFreezeEnd);
			continue;
		}
		freezeTicks.push_back(*tick);
	}
	std::sort(freezeTicks.begin(), freezeTicks.end());

	std::vector<Round> rounds;
	rounds.reserve(ends.size());
	std::optional<Tick> previousEnd;
	for (const RoundEndRow& end : ends) {
		Round round;
		round.roundNum = static_cast<int>(rounds.size()) + 1;
		round.endTick = end.tick;
		round.winner = end.winner;
		round.reason = end.reason;

		// last freeze-end in (previousEnd, end]
		auto upper = std::upper_bound(freezeTicks.begin(), freezeTicks.end(), end.tick);
		if (upper != freezeTicks.begin()) {
			const Tick candidate = *std::prev(upper);
			if (!previousEnd || candidate > *previousEnd)
				round.freezeEndTick = candidate;
		}

		round.startTick = round.freezeEndTick.value_or(previousEnd.value_or(0));
		round.durationSeconds = tickRate > 0
			? static_cast<double>(round.endTick - round.startTick) / static_cast<double>(tickRate)
			: 0.0;

		previousEnd = end.tick;
		rounds.push_back(round);
	}

	return rounds;
}

NormalizedEvents NormalizeDemoEvents(const DemoEventTables& tables, int tickRate) {
	NormalizedEvents normalized;
	NormalizeStats& stats = normalized.stats;

	if (!tables.HasRows(events::kRoundEnd))
		Logf(LogLevel::Info, "no {} events in this match", events::kRoundEnd);
	normalized.rounds = BuildRounds(tables.Table(events::kRoundEnd), tables.Table(events::kRoundFreezeEnd), tickRate, stats);

	NormalizeTable(tables, events::kPlayerDeath, stats, normalized.kills, [](const RawRecord& row) { return NormalizeKill(row); });
	std::stable_sort(normalized.kills.begin(), normalized.kills.end(), [](const Kill& a, const Kill& b) { return a.tick < b.tick; });
	for (size_t i = 0; i < normalized.kills.size(); ++i)
		normalized.kills[i].killId = static_cast<KillId>(i);

	NormalizeTable(tables, events::kPlayerHurt, stats, normalized.damages, [](const RawRecord& row) { return NormalizeDamage(row); });

	for (const auto& [kind, type] : kGrenadeTables) {
		const GrenadeType grenadeType = type;
		NormalizeTable(tables, kind, stats, normalized.grenades, [grenadeType](const RawRecord& row) { return NormalizeGrenade(row, grenadeType); });
	}
	std::stable_sort(normalized.grenades.begin(), normalized.grenades.end(), [](const Grenade& a, const Grenade& b) { return a.tick < b.tick; });

	for (const auto& [kind, type] : kBombTables) {
		const BombEventType bombType = type;
		NormalizeTable(tables, kind, stats, normalized.bombEvents, [bombType](const RawRecord& row) { return NormalizeBombEvent(row, bombType); });
	}
	std::stable_sort(normalized.bombEvents.begin(), normalized.bombEvents.end(), [](const BombEvent& a, const BombEvent& b) { return a.tick < b.tick; });

	if (tables.playerSnapshots.empty())
		Log(LogLevel::Info, "no player snapshots in this match");
	for (const RawRecord& row : tables.playerSnapshots) {
		std::optional<EconomySnapshot> snapshot = NormalizeEconomySnapshot(row, normalized.rounds);
		if (!snapshot) {
			stats.CountDrop("player_snapshots");
			continue;
		}
		normalized.economy.push_back(std::move(*snapshot));
	}

	std::set<std::string, std::less<>> seenPlayers;
	auto addPlayer = [&](std::optional<Player> player) {
		if (player && seenPlayers.insert(player->id).second)
			normalized.players.push_back(std::move(*player));
	};
	if (!tables.players.empty()) {
		for (const RawRecord& row : tables.players) {
			std::optional<Player> player = NormalizePlayer(row);
			if (!player)
				stats.CountDrop("players");
			addPlayer(std::move(player));
		}
	}
	else {
		for (const RawRecord& row : tables.playerSnapshots)
			addPlayer(NormalizePlayer(row));
	}

	for (const auto& [kind, count] : stats.dropped)
		Logf(LogLevel::Warn, "dropped {} malformed {} records", count, kind);

	Logf(LogLevel::Debug, "normalized {} rounds, {} kills, {} damages, {} grenades, {} bomb events, {} snapshots, {} players",
		normalized.rounds.size(), normalized.kills.size(), normalized.damages.size(), normalized.grenades.size(),
		normalized.bombEvents.size(), normalized.economy.size(), normalized.players.size());

	return normalized;
}

} // namespace roundstat::ingest
