/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

match_types.cpp implementation.*/

#include "match_types.hpp"

#include "../shared/text_utils.hpp"

#include <array>
#include <utility>

namespace roundstat::match {

namespace {

constexpr std::array<std::string_view, static_cast<size_t>(GrenadeType::Total)> kGrenadeTypeNames = {
	"he", "flash", "smoke", "molotov", "decoy"
};

constexpr std::array<std::string_view, static_cast<size_t>(BombEventType::Total)> kBombEventTypeNames = {
	"plant", "defuse", "explode", "drop", "pickup"
};

// Round end reasons as emitted by demo parsers, both the string form and the
// numeric CSRoundEndReason codes.
constexpr std::array<std::pair<std::string_view, RoundEndReason>, 18> kRoundEndReasonAliases = { {
	{ "elimination", RoundEndReason::Elimination },
	{ "t_killed", RoundEndReason::Elimination },
	{ "ct_killed", RoundEndReason::Elimination },
	{ "ct_win", RoundEndReason::Elimination },
	{ "t_win", RoundEndReason::Elimination },
	{ "terrorists_win", RoundEndReason::Elimination },
	{ "cts_win", RoundEndReason::Elimination },
	{ "8", RoundEndReason::Elimination },
	{ "9", RoundEndReason::Elimination },
	{ "bomb_exploded", RoundEndReason::BombExploded },
	{ "target_bombed", RoundEndReason::BombExploded },
	{ "1", RoundEndReason::BombExploded },
	{ "bomb_defused", RoundEndReason::BombDefused },
	{ "7", RoundEndReason::BombDefused },
	{ "time_expired", RoundEndReason::TimeExpired },
	{ "time_ran_out", RoundEndReason::TimeExpired },
	{ "target_saved", RoundEndReason::TimeExpired },
	{ "12", RoundEndReason::TimeExpired },
} };

} // namespace

std::string_view TeamName(Team team) {
	switch (team) {
	case Team::CT:
		return "CT";
	case Team::T:
		return "T";
	case Team::Unknown:
	default:
		return kUnknownIdentity;
	}
}

/*
=============
ParseTeam

Resolves the team spellings emitted by demo parsers (names and side numbers).
=============
*/
Team ParseTeam(std::string_view value) {
	const std::optional<std::string_view> trimmed = TrimNonEmpty(value);
	if (!trimmed)
		return Team::Unknown;

	const std::string upper = ToUpperCopy(*trimmed);
	if (upper == "CT" || upper == "COUNTERTERRORIST" || upper == "COUNTER-TERRORIST" || upper == "COUNTER_TERRORIST" || upper == "3")
		return Team::CT;
	if (upper == "T" || upper == "TERRORIST" || upper == "TERRORISTS" || upper == "2")
		return Team::T;

	return Team::Unknown;
}

std::string_view RoundEndReasonName(RoundEndReason reason) {
	switch (reason) {
	case RoundEndReason::Elimination:
		return "elimination";
	case RoundEndReason::BombExploded:
		return "bomb_exploded";
	case RoundEndReason::BombDefused:
		return "bomb_defused";
	case RoundEndReason::TimeExpired:
		return "time_expired";
	case RoundEndReason::Unknown:
	default:
		return kUnknownIdentity;
	}
}

RoundEndReason ParseRoundEndReason(std::string_view value) {
	const std::optional<std::string_view> trimmed = TrimNonEmpty(value);
	if (!trimmed)
		return RoundEndReason::Unknown;

	std::string lowered;
	lowered.reserve(trimmed->size());
	for (char ch : *trimmed)
		lowered.push_back(ToLowerASCII(ch));

	for (const auto& [alias, reason] : kRoundEndReasonAliases) {
		if (lowered == alias)
			return reason;
	}
	return RoundEndReason::Unknown;
}

std::string_view GrenadeTypeName(GrenadeType type) {
	const size_t index = static_cast<size_t>(type);
	if (index >= kGrenadeTypeNames.size())
		return kUnknownIdentity;
	return kGrenadeTypeNames[index];
}

std::string_view BombEventTypeName(BombEventType type) {
	const size_t index = static_cast<size_t>(type);
	if (index >= kBombEventTypeNames.size())
		return kUnknownIdentity;
	return kBombEventTypeNames[index];
}

/*
=============
IsPlayerIdentity

True for identities that name a real player rather than a marker.
=============
*/
bool IsPlayerIdentity(std::string_view id) {
	return !id.empty() && id != kUnknownIdentity && id != kWorldIdentity;
}

bool IsUtilityWeapon(std::string_view weapon) {
	return weapon == "hegrenade" || weapon == "inferno" || weapon == "molotov" || weapon == "incgrenade";
}

} // namespace roundstat::match
