// demo_events.hpp (Raw Event Tables)
// In-memory form of the event dump handed over by the external demo parser:
// a match header plus named tables of flat key/value rows. Rows keep the
// parser's own field names; the event normalizer maps them onto the
// canonical records in match_types.hpp.

#pragma once

#include <json/json.h>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace roundstat::ingest {

using RawRecord = Json::Value;
using RawTable = std::vector<RawRecord>;

namespace events {
inline constexpr std::string_view kPlayerDeath{"player_death"};
inline constexpr std::string_view kPlayerHurt{"player_hurt"};
inline constexpr std::string_view kRoundEnd{"round_end"};
inline constexpr std::string_view kRoundFreezeEnd{"round_freeze_end"};
inline constexpr std::string_view kHeGrenadeDetonate{"hegrenade_detonate"};
inline constexpr std::string_view kFlashbangDetonate{"flashbang_detonate"};
inline constexpr std::string_view kSmokeGrenadeDetonate{"smokegrenade_detonate"};
inline constexpr std::string_view kInfernoStartBurn{"inferno_startburn"};
inline constexpr std::string_view kDecoyStarted{"decoy_started"};
inline constexpr std::string_view kBombPlanted{"bomb_planted"};
inline constexpr std::string_view kBombDefused{"bomb_defused"};
inline constexpr std::string_view kBombExploded{"bomb_exploded"};
inline constexpr std::string_view kBombDropped{"bomb_dropped"};
inline constexpr std::string_view kBombPickup{"bomb_pickup"};
} // namespace events

struct DemoHeader {
	std::string demoFile;
	std::string mapName;
	std::string serverName;
	int tickRate = 0;
};

struct DemoEventTables {
	DemoHeader header;
	std::map<std::string, RawTable, std::less<>> events;
	RawTable players;
	RawTable playerSnapshots;

	/*
	=============
	DemoEventTables::Table

	Rows of the named event kind; a kind absent from the dump yields an
	empty table.
	=============
	*/
	const RawTable& Table(std::string_view kind) const;
	bool HasRows(std::string_view kind) const;
};

/*
=============
ParseDemoEvents

Builds event tables from an already parsed dump document. Fails only when the
document shape is unusable (non-object root or non-object "events").
=============
*/
bool ParseDemoEvents(const Json::Value& root, DemoEventTables& out, std::string& error);

bool ParseDemoEventsText(std::string_view text, DemoEventTables& out, std::string& error);

/*
=============
LoadDemoEvents

Reads and parses an event dump file. An unreadable file or malformed JSON is
a hard failure; the demo file name defaults to the dump's file name.
=============
*/
bool LoadDemoEvents(const std::filesystem::path& path, DemoEventTables& out, std::string& error);

} // namespace roundstat::ingest
