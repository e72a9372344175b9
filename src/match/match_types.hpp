// match_types.hpp (Canonical Match Records)
// Typed records produced by the event normalizer and the derivation passes.
// Every collection in a MatchAnalysis bundle is a vector of one of these.
//
// Optional numeric fields are std::optional so a missing source value never
// turns into a zero that would skew distances or sums. Player identities are
// steam id strings; the markers kUnknownIdentity and kWorldIdentity stand in
// for a missing identity and for environmental damage respectively.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace roundstat::match {

using Tick = int64_t;
using KillId = int;

inline constexpr std::string_view kUnknownIdentity{"unknown"};
inline constexpr std::string_view kWorldIdentity{"World"};

enum class Team : uint8_t {
	Unknown,
	CT,
	T
};

enum class RoundEndReason : uint8_t {
	Unknown,
	Elimination,
	BombExploded,
	BombDefused,
	TimeExpired
};

enum class GrenadeType : uint8_t {
	HE,
	Flash,
	Smoke,
	Molotov,
	Decoy,
	Total
};

enum class BombEventType : uint8_t {
	Plant,
	Defuse,
	Explode,
	Drop,
	Pickup,
	Total
};

struct Position {
	double x = 0.0;
	double y = 0.0;
	double z = 0.0;
};

struct Player {
	std::string id;
	std::string name;
	Team team = Team::Unknown;
};

struct Round {
	int roundNum = 0;
	Tick startTick = 0;
	Tick endTick = 0;
	std::optional<Tick> freezeEndTick;
	double durationSeconds = 0.0;
	Team winner = Team::Unknown;
	RoundEndReason reason = RoundEndReason::Unknown;
};

struct Kill {
	KillId killId = 0;
	Tick tick = 0;
	int roundNum = 0;

	std::string attackerId;
	std::string attackerName;
	Team attackerTeam = Team::Unknown;
	std::optional<Position> attackerPos;

	std::string victimId;
	std::string victimName;
	Team victimTeam = Team::Unknown;
	std::optional<Position> victimPos;

	std::optional<std::string> assisterId;
	std::optional<std::string> assisterName;

	std::string weapon;
	bool headshot = false;
	bool penetrated = false;
	bool noscope = false;
	bool thrusmoke = false;
	bool attackerblind = false;
	bool assistedflash = false;

	std::optional<double> distance;

	// Derived by the round summarizer and the trade linker.
	bool isFirstKill = false;
	bool isTrade = false;
	std::optional<KillId> tradedKillId;
	std::optional<Tick> tradeTimeTicks;
};

struct Damage {
	Tick tick = 0;
	int roundNum = 0;

	std::string attackerId;
	std::string attackerName;
	Team attackerTeam = Team::Unknown;

	std::string victimId;
	std::string victimName;
	Team victimTeam = Team::Unknown;

	std::string weapon;
	std::optional<int> damageHealth;
	std::optional<int> damageArmor;
	std::string hitgroup;
	std::optional<int> healthRemaining;
	std::optional<int> armorRemaining;
	bool isUtility = false;
};

struct Grenade {
	GrenadeType type = GrenadeType::HE;
	Tick tick = 0;
	int roundNum = 0;
	std::string throwerId;
	std::string throwerName;
	Team throwerTeam = Team::Unknown;
	std::optional<Position> position;
};

struct BombEvent {
	BombEventType type = BombEventType::Plant;
	Tick tick = 0;
	int roundNum = 0;
	std::string playerId;
	std::string playerName;
	Team playerTeam = Team::Unknown;
	std::optional<double> x;
	std::optional<double> y;
	std::optional<std::string> site;
};

struct EconomySnapshot {
	int roundNum = 0;
	Tick tick = 0;
	std::string playerId;
	std::string playerName;
	Team team = Team::Unknown;
	std::optional<int> equipmentValue;
	std::optional<int> cashSpentRound;
	std::optional<int> totalCashSpent;
	std::optional<int> balance;
};

struct Clutch {
	int roundNum = 0;
	std::string playerId;
	std::string playerName;
	Team team = Team::Unknown;
	int opponents = 0;
	bool won = false;
	Tick startTick = 0;
	Tick endTick = 0;
	double durationSeconds = 0.0;
	int killsMade = 0;

	std::string ClutchType() const { return "1v" + std::to_string(opponents); }
};

struct RoundStats {
	int roundNum = 0;
	Team winner = Team::Unknown;
	RoundEndReason reason = RoundEndReason::Unknown;
	double durationSeconds = 0.0;

	int totalKills = 0;
	int ctKills = 0;
	int tKills = 0;

	std::optional<KillId> firstKillId;
	std::optional<Tick> firstKillTick;
	std::optional<std::string> firstKillAttacker;
	std::optional<std::string> firstKillAttackerId;
	std::optional<Team> firstKillAttackerTeam;
	std::optional<std::string> firstKillVictim;
	std::optional<std::string> firstKillVictimId;
	std::optional<std::string> firstKillWeapon;
	std::optional<bool> firstKillTeamWon;

	bool bombPlanted = false;
	std::optional<Tick> bombPlantTick;
	std::optional<std::string> bombSite;

	int ctEquipmentValue = 0;
	int tEquipmentValue = 0;
};

struct PlayerMatchStats {
	std::string playerId;
	std::string name;
	Team team = Team::Unknown;

	int kills = 0;
	int deaths = 0;
	int assists = 0;
	double kdRatio = 0.0;

	int totalDamage = 0;
	int utilityDamage = 0;
	double adr = 0.0;

	int headshots = 0;
	double hsPercentage = 0.0;

	int firstKills = 0;
	int firstDeaths = 0;
	int fkFdDiff = 0;

	int tradeKills = 0;
	int tradedDeaths = 0;
	int flashAssists = 0;

	int clutchAttempts = 0;
	int clutchWins = 0;
	double clutchRate = 0.0;

	int doubleKills = 0;
	int tripleKills = 0;
	int quadKills = 0;
	int aces = 0;

	int flashesThrown = 0;
	int smokesThrown = 0;
	int heThrown = 0;
	int molotovsThrown = 0;

	double avgEquipmentValue = 0.0;
	int totalMoneySpent = 0;

	double kast = 0.0;
	int kastRounds = 0;

	int roundsPlayed = 0;
	int roundsWithKill = 0;
	int roundsSurvived = 0;
};

struct MatchMetadata {
	std::string matchId;
	std::string demoFile;
	std::string mapName;
	std::string serverName;
	int tickRate = 0;
	Tick totalTicks = 0;
	int durationSeconds = 0;
	std::string durationFormatted;
	int totalRounds = 0;
	int scoreCT = 0;
	int scoreT = 0;
	std::string winner;
	std::string extractedAt;
	int droppedRecords = 0;
};

/*
=============
TeamName

Short side label used in every exported record.
=============
*/
std::string_view TeamName(Team team);

/*
=============
ParseTeam

Resolves the team spellings emitted by demo parsers (names and side numbers).
=============
*/
Team ParseTeam(std::string_view value);

std::string_view RoundEndReasonName(RoundEndReason reason);
RoundEndReason ParseRoundEndReason(std::string_view value);

std::string_view GrenadeTypeName(GrenadeType type);
std::string_view BombEventTypeName(BombEventType type);

/*
=============
IsPlayerIdentity

True for identities that name a real player rather than a marker.
=============
*/
bool IsPlayerIdentity(std::string_view id);

bool IsUtilityWeapon(std::string_view weapon);

} // namespace roundstat::match
