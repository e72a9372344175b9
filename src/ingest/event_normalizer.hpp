#pragma once

#include "demo_events.hpp"
#include "../match/match_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roundstat::ingest {

/*
=================
NormalizeStats

Per-kind tally of rows dropped because they lacked their identity fields.
=================
*/
struct NormalizeStats {
	std::map<std::string, int, std::less<>> dropped;

	void CountDrop(std::string_view kind);
	int Dropped(std::string_view kind) const;
	int TotalDropped() const;
};

struct NormalizedEvents {
	std::vector<match::Player> players;
	std::vector<match::Round> rounds;
	std::vector<match::Kill> kills;
	std::vector<match::Damage> damages;
	std::vector<match::Grenade> grenades;
	std::vector<match::BombEvent> bombEvents;
	std::vector<match::EconomySnapshot> economy;
	NormalizeStats stats;
};

/*
=============
NormalizeKill

Maps one player_death row onto a Kill. Returns nullopt when the row has no
tick or no round number. kill_id is left at 0 for the caller to assign.
=============
*/
std::optional<match::Kill> NormalizeKill(const RawRecord& row);

std::optional<match::Damage> NormalizeDamage(const RawRecord& row);
std::optional<match::Grenade> NormalizeGrenade(const RawRecord& row, match::GrenadeType type);
std::optional<match::BombEvent> NormalizeBombEvent(const RawRecord& row, match::BombEventType type);

/*
=============
NormalizeEconomySnapshot

Maps one player-state snapshot. The round comes from the row when present,
otherwise from the round whose tick span contains the snapshot tick.
=============
*/
std::optional<match::EconomySnapshot> NormalizeEconomySnapshot(const RawRecord& row, const std::vector<match::Round>& rounds);

std::optional<match::Player> NormalizePlayer(const RawRecord& row);

/*
=============
BuildRounds

Pairs round_end rows with the freeze-end that opened each round. Rounds are
numbered from 1 in end-tick order.
=============
*/
std::vector<match::Round> BuildRounds(const RawTable& roundEnds, const RawTable& freezeEnds, int tickRate, NormalizeStats& stats);

/*
=============
NormalizeDemoEvents

Runs every normalizer over the dump. Missing tables are empty collections;
kills come back sorted by tick with sequential kill ids.
=============
*/
NormalizedEvents NormalizeDemoEvents(const DemoEventTables& tables, int tickRate);

} // namespace roundstat::ingest
