#include "analysis/round_summarizer.hpp"
#include "shared/logger.hpp"

#include "match_fixture.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace roundstat;
using namespace roundstat::match;
using roundstat::test::MakeKill;
using roundstat::test::MakeRound;

/*
=============
MakeSnapshot
=============
*/
static EconomySnapshot MakeSnapshot(int roundNum, Tick tick, const std::string& player, Team team, int equipment)
{
	EconomySnapshot snapshot;
	snapshot.roundNum = roundNum;
	snapshot.tick = tick;
	snapshot.playerId = player;
	snapshot.playerName = player;
	snapshot.team = team;
	snapshot.equipmentValue = equipment;
	return snapshot;
}

/*
=============
main

One opening kill per round, tie-breaking on kill id, the bomb plant and the
per-side equipment totals.
=============
*/
int main()
{
	InitLogger("rounds-test", nullptr, nullptr);

	std::vector<Round> rounds;
	rounds.push_back(MakeRound(1, 0, 1000, Team::CT));
	rounds.push_back(MakeRound(2, 1100, 2000, Team::T, RoundEndReason::BombExploded));
	rounds.push_back(MakeRound(3, 2100, 3000, Team::Unknown));

	std::vector<Kill> kills;
	kills.push_back(MakeKill(0, 200, 1, "A", Team::T, "B", Team::CT));
	kills.push_back(MakeKill(1, 300, 1, "C", Team::CT, "A", Team::T));
	kills.push_back(MakeKill(3, 1200, 2, "D", Team::T, "C", Team::CT));
	kills.push_back(MakeKill(2, 1200, 2, "C", Team::CT, "E", Team::T));
	kills.push_back(MakeKill(4, 2200, 3, "A", Team::T, "C", Team::CT));
	kills.push_back(MakeKill(5, 5000, 9, "A", Team::T, "B", Team::CT));
	kills[1].isFirstKill = true;
	kills[5].isFirstKill = true;

	std::vector<BombEvent> bombEvents(3);
	bombEvents[0].type = BombEventType::Plant;
	bombEvents[0].roundNum = 2;
	bombEvents[0].tick = 1800;
	bombEvents[0].site = "B";
	bombEvents[1].type = BombEventType::Plant;
	bombEvents[1].roundNum = 2;
	bombEvents[1].tick = 1500;
	bombEvents[1].site = "A";
	bombEvents[2].type = BombEventType::Explode;
	bombEvents[2].roundNum = 2;
	bombEvents[2].tick = 1950;

	std::vector<EconomySnapshot> economy;
	economy.push_back(MakeSnapshot(1, 10, "A", Team::T, 800));
	economy.push_back(MakeSnapshot(1, 5, "A", Team::T, 650));
	economy.push_back(MakeSnapshot(1, 10, "C", Team::CT, 1000));
	economy.push_back(MakeSnapshot(2, 1110, "C", Team::CT, 4750));
	economy.push_back(MakeSnapshot(2, 1105, "D", Team::T, 0));
	economy.back().equipmentValue.reset();
	economy.push_back(MakeSnapshot(2, 1120, "D", Team::T, 900));

	const std::vector<RoundStats> stats = analysis::SummarizeRounds(rounds, kills, bombEvents, economy);
	assert(stats.size() == 3);

	assert(stats[0].roundNum == 1);
	assert(stats[0].totalKills == 2);
	assert(stats[0].ctKills == 1);
	assert(stats[0].tKills == 1);
	assert(stats[0].firstKillId == 0);
	assert(stats[0].firstKillAttacker == std::optional<std::string>("A"));
	assert(stats[0].firstKillAttackerTeam == Team::T);
	assert(stats[0].firstKillTeamWon == false);
	assert(!stats[0].bombPlanted);
	assert(stats[0].tEquipmentValue == 650);
	assert(stats[0].ctEquipmentValue == 1000);

	// tick tie: the lower kill id opens the round
	assert(stats[1].firstKillId == 2);
	assert(stats[1].firstKillAttackerTeam == Team::CT);
	assert(stats[1].firstKillTeamWon == false);
	assert(stats[1].reason == RoundEndReason::BombExploded);
	assert(stats[1].bombPlanted);
	assert(stats[1].bombPlantTick == 1500);
	assert(stats[1].bombSite == std::optional<std::string>("A"));
	assert(stats[1].ctEquipmentValue == 4750);
	// unread equipment falls through to the next snapshot
	assert(stats[1].tEquipmentValue == 900);

	// unknown winner leaves the outcome open
	assert(stats[2].firstKillId == 4);
	assert(!stats[2].firstKillTeamWon.has_value());

	assert(kills[0].isFirstKill);
	assert(!kills[1].isFirstKill);
	assert(!kills[2].isFirstKill);
	assert(kills[3].isFirstKill);
	assert(kills[4].isFirstKill);
	assert(!kills[5].isFirstKill);

	int flagged = 0;
	for (const Kill& kill : kills)
		flagged += kill.isFirstKill ? 1 : 0;
	assert(flagged == 3);

	{
		std::vector<Kill> none;
		const std::vector<RoundStats> empty = analysis::SummarizeRounds(rounds, none, {}, {});
		assert(empty.size() == 3);
		assert(empty[0].totalKills == 0);
		assert(!empty[0].firstKillId.has_value());
		assert(!empty[0].firstKillTeamWon.has_value());
	}

	return 0;
}
