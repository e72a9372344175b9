#include "analysis/player_stats_aggregator.hpp"
#include "shared/logger.hpp"

#include "match_fixture.hpp"

#include <cassert>
#include <cmath>
#include <string>
#include <vector>

using namespace roundstat;
using namespace roundstat::match;
using namespace roundstat::test;

/*
=============
Near
=============
*/
static bool Near(double a, double b)
{
	return std::fabs(a - b) < 1e-9;
}

/*
=============
CheckTwoRounds

Kills, assists, survival and traded deaths each earn a KAST round; the result
is ordered by ADR with ties left in first-seen order.
=============
*/
static void CheckTwoRounds()
{
	std::vector<Player> players{ MakePlayer("A", Team::T), MakePlayer("B", Team::CT),
		MakePlayer("C", Team::CT), MakePlayer("D", Team::T) };
	players[0].name = "Alpha";

	std::vector<Round> rounds{ MakeRound(1, 0, 1000, Team::CT), MakeRound(2, 1100, 2000, Team::CT) };

	std::vector<Kill> kills;
	kills.push_back(MakeKill(0, 100, 1, "A", Team::T, "B", Team::CT));
	kills.push_back(MakeKill(1, 110, 1, "C", Team::CT, "A", Team::T));
	kills.push_back(MakeKill(2, 150, 1, "C", Team::CT, "E", Team::T));
	kills.push_back(MakeKill(3, 1200, 2, "C", Team::CT, "A", Team::T));
	kills.push_back(MakeKill(4, 1300, 2, "B", Team::CT, "E", Team::T));
	kills[0].isFirstKill = true;
	kills[0].headshot = true;
	kills[1].isTrade = true;
	kills[1].tradedKillId = 0;
	kills[1].tradeTimeTicks = 10;
	kills[3].isFirstKill = true;
	kills[3].assisterId = "D";
	kills[3].assisterName = "D";
	kills[3].assistedflash = true;

	std::vector<Damage> damages;
	damages.push_back(MakeDamage(100, 1, "A", Team::T, "B", Team::CT, 100));
	damages.push_back(MakeDamage(110, 1, "C", Team::CT, "A", Team::T, 150));
	damages.push_back(MakeDamage(150, 1, "C", Team::CT, "E", Team::T, 100));
	damages.push_back(MakeDamage(1200, 2, "C", Team::CT, "A", Team::T, 100));
	damages.push_back(MakeDamage(1250, 2, "B", Team::CT, "E", Team::T, 50, "hegrenade"));
	damages.push_back(MakeDamage(1260, 2, std::string(kWorldIdentity), Team::Unknown, "E", Team::T, 30, "world"));
	damages.push_back(MakeDamage(1270, 2, "A", Team::T, "C", Team::CT, 0));
	damages.back().damageHealth.reset();

	std::vector<Grenade> grenades(3);
	grenades[0].type = GrenadeType::Flash;
	grenades[0].throwerId = "D";
	grenades[1].type = GrenadeType::Flash;
	grenades[1].throwerId = "D";
	grenades[2].type = GrenadeType::Smoke;
	grenades[2].throwerId = "D";

	std::vector<EconomySnapshot> economy(3);
	economy[0].roundNum = 1;
	economy[0].playerId = "A";
	economy[0].equipmentValue = 1000;
	economy[0].totalCashSpent = 500;
	economy[1].roundNum = 2;
	economy[1].playerId = "A";
	economy[1].equipmentValue = 3000;
	economy[1].totalCashSpent = 2500;
	// sampled without an equipment reading: not a $0 sample
	economy[2].roundNum = 2;
	economy[2].tick = 1300;
	economy[2].playerId = "A";

	std::vector<Clutch> clutches(1);
	clutches[0].roundNum = 2;
	clutches[0].playerId = "C";
	clutches[0].won = true;

	const std::vector<PlayerMatchStats> stats = analysis::AggregatePlayerStats(
		analysis::AggregationInput{ players, rounds, kills, damages, grenades, economy, clutches });

	assert(stats.size() == 5);
	assert(stats[0].playerId == "C");
	assert(stats[1].playerId == "A");
	assert(stats[2].playerId == "B");
	assert(stats[3].playerId == "D");
	assert(stats[4].playerId == "E");

	const PlayerMatchStats* a = FindStats(stats, "A");
	assert(a->name == "Alpha");
	assert(a->kills == 1 && a->deaths == 2);
	assert(Near(a->kdRatio, 0.5));
	assert(Near(a->hsPercentage, 100.0));
	assert(a->firstKills == 1 && a->firstDeaths == 1);
	assert(a->fkFdDiff == 0);
	assert(a->kastRounds == 1);
	assert(Near(a->kast, 50.0));
	assert(Near(a->adr, 50.0));
	assert(Near(a->avgEquipmentValue, 2000.0));
	assert(a->totalMoneySpent == 2500);

	const PlayerMatchStats* b = FindStats(stats, "B");
	assert(b->tradedDeaths == 1);
	assert(b->firstDeaths == 1);
	assert(b->kastRounds == 2);
	assert(Near(b->kast, 100.0));
	assert(b->utilityDamage == 50);
	assert(Near(b->adr, 25.0));

	const PlayerMatchStats* c = FindStats(stats, "C");
	assert(c->kills == 3 && c->deaths == 0);
	assert(Near(c->kdRatio, 3.0));
	assert(c->tradeKills == 1);
	assert(c->doubleKills == 1);
	assert(c->roundsWithKill == 2);
	assert(c->roundsSurvived == 2);
	assert(Near(c->adr, 175.0));
	assert(c->clutchAttempts == 1 && c->clutchWins == 1);
	assert(Near(c->clutchRate, 100.0));

	const PlayerMatchStats* d = FindStats(stats, "D");
	assert(d->assists == 1 && d->flashAssists == 1);
	assert(d->flashesThrown == 2 && d->smokesThrown == 1);
	assert(Near(d->kast, 100.0));
	assert(Near(d->kdRatio, 0.0));

	const PlayerMatchStats* e = FindStats(stats, "E");
	assert(e->name == "E");
	assert(e->team == Team::T);
	assert(e->deaths == 2);
	assert(e->roundsSurvived == 0);
	assert(e->kastRounds == 0);
	assert(Near(e->kast, 0.0));

	assert(FindStats(stats, std::string(kWorldIdentity)) == nullptr);
	for (const PlayerMatchStats& entry : stats)
		assert(entry.roundsPlayed == 2);
}

/*
=============
CheckWithoutRounds

No round table: counts survive but every per-round rate is 0.
=============
*/
static void CheckWithoutRounds()
{
	std::vector<Player> players;
	std::vector<Round> rounds;
	std::vector<Kill> kills;
	kills.push_back(MakeKill(0, 100, 9, "A", Team::T, "B", Team::CT));
	kills.push_back(MakeKill(1, 120, 9, "A", Team::T, "C", Team::CT));
	std::vector<Damage> damages;
	damages.push_back(MakeDamage(100, 9, "A", Team::T, "B", Team::CT, 100));
	std::vector<Grenade> grenades;
	std::vector<EconomySnapshot> economy;
	std::vector<Clutch> clutches;

	const std::vector<PlayerMatchStats> stats = analysis::AggregatePlayerStats(
		analysis::AggregationInput{ players, rounds, kills, damages, grenades, economy, clutches });

	assert(stats.size() == 3);
	const PlayerMatchStats* a = FindStats(stats, "A");
	assert(a->kills == 2);
	assert(a->totalDamage == 100);
	assert(Near(a->adr, 0.0));
	assert(Near(a->kast, 0.0));
	assert(a->doubleKills == 0);
	assert(a->roundsPlayed == 0);
	assert(Near(a->kdRatio, 2.0));
	assert(Near(a->avgEquipmentValue, 0.0));
	assert(Near(a->clutchRate, 0.0));
}

/*
=============
main
=============
*/
int main()
{
	InitLogger("stats-test", nullptr, nullptr);

	CheckTwoRounds();
	CheckWithoutRounds();

	return 0;
}
