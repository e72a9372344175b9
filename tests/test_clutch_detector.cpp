#include "analysis/clutch_detector.hpp"
#include "shared/logger.hpp"

#include "match_fixture.hpp"

#include <cassert>
#include <cmath>
#include <vector>

using namespace roundstat;
using namespace roundstat::match;
using roundstat::test::MakeKill;
using roundstat::test::MakeRound;

/*
=============
Pointers
=============
*/
static std::vector<const Kill*> Pointers(const std::vector<Kill>& kills)
{
	std::vector<const Kill*> out;
	out.reserve(kills.size());
	for (const Kill& kill : kills)
		out.push_back(&kill);
	return out;
}

/*
=============
CheckWonClutch

Three T deaths then four CT deaths leave one CT against two.
=============
*/
static void CheckWonClutch()
{
	AnalysisConfig config;
	const Round round = MakeRound(1, 0, 1000, Team::CT);

	std::vector<Kill> kills;
	kills.push_back(MakeKill(0, 100, 1, "W", Team::CT, "t1", Team::T));
	kills.push_back(MakeKill(1, 110, 1, "X", Team::CT, "t2", Team::T));
	kills.push_back(MakeKill(2, 120, 1, "Y", Team::CT, "t3", Team::T));
	kills.push_back(MakeKill(3, 130, 1, "t4", Team::T, "W", Team::CT));
	kills.push_back(MakeKill(4, 140, 1, "t4", Team::T, "X", Team::CT));
	kills.push_back(MakeKill(5, 150, 1, "t5", Team::T, "Y", Team::CT));
	kills.push_back(MakeKill(6, 160, 1, "t5", Team::T, "V", Team::CT));
	kills.push_back(MakeKill(7, 200, 1, "Z", Team::CT, "t4", Team::T));
	kills.push_back(MakeKill(8, 264, 1, "Z", Team::CT, "t5", Team::T));

	const std::optional<Clutch> clutch = analysis::DetectRoundClutch(round, Pointers(kills), config);
	assert(clutch.has_value());
	assert(clutch->roundNum == 1);
	assert(clutch->playerId == "Z");
	assert(clutch->team == Team::CT);
	assert(clutch->opponents == 2);
	assert(clutch->ClutchType() == "1v2");
	assert(clutch->won);
	assert(clutch->startTick == 160);
	assert(clutch->endTick == 1000);
	assert(std::fabs(clutch->durationSeconds - 840.0 / 64.0) < 1e-9);
	assert(clutch->killsMade == 2);
}

/*
=============
CheckLostClutch

The last T standing against a full CT side, given in shuffled order.
=============
*/
static void CheckLostClutch()
{
	AnalysisConfig config;
	const Round round = MakeRound(4, 3000, 4000, Team::CT);

	std::vector<Kill> kills;
	kills.push_back(MakeKill(14, 3500, 4, "Q", Team::T, "c1", Team::CT));
	kills.push_back(MakeKill(10, 3100, 4, "c1", Team::CT, "t1", Team::T));
	kills.push_back(MakeKill(12, 3300, 4, "c1", Team::CT, "t3", Team::T));
	kills.push_back(MakeKill(11, 3200, 4, "c2", Team::CT, "t2", Team::T));
	kills.push_back(MakeKill(13, 3400, 4, "c2", Team::CT, "t4", Team::T));
	kills.push_back(MakeKill(15, 3600, 4, "c2", Team::CT, "Q", Team::T));

	const std::optional<Clutch> clutch = analysis::DetectRoundClutch(round, Pointers(kills), config);
	assert(clutch.has_value());
	assert(clutch->playerId == "Q");
	assert(clutch->team == Team::T);
	assert(clutch->opponents == 5);
	assert(!clutch->won);
	assert(clutch->startTick == 3400);
	assert(clutch->killsMade == 1);
}

/*
=============
CheckNoClutch

Too few kills, no side reduced to one, or a last player who never fires again.
=============
*/
static void CheckNoClutch()
{
	AnalysisConfig config;
	const Round round = MakeRound(2, 0, 1000, Team::T);

	std::vector<Kill> single;
	single.push_back(MakeKill(0, 100, 2, "A", Team::T, "B", Team::CT));
	assert(!analysis::DetectRoundClutch(round, Pointers(single), config).has_value());

	std::vector<Kill> trades;
	trades.push_back(MakeKill(0, 100, 2, "A", Team::T, "B", Team::CT));
	trades.push_back(MakeKill(1, 110, 2, "C", Team::CT, "A", Team::T));
	trades.push_back(MakeKill(2, 120, 2, "D", Team::T, "C", Team::CT));
	assert(!analysis::DetectRoundClutch(round, Pointers(trades), config).has_value());

	std::vector<Kill> silent;
	silent.push_back(MakeKill(0, 100, 2, "t1", Team::T, "c1", Team::CT));
	silent.push_back(MakeKill(1, 110, 2, "t1", Team::T, "c2", Team::CT));
	silent.push_back(MakeKill(2, 120, 2, "t1", Team::T, "c3", Team::CT));
	silent.push_back(MakeKill(3, 130, 2, "t2", Team::T, "c4", Team::CT));
	assert(!analysis::DetectRoundClutch(round, Pointers(silent), config).has_value());
}

/*
=============
CheckRoster

A smaller roster reaches the last player sooner.
=============
*/
static void CheckRoster()
{
	AnalysisConfig config;
	config.rosterSize = 2;
	const Round round = MakeRound(3, 0, 640, Team::T);

	std::vector<Kill> kills;
	kills.push_back(MakeKill(0, 64, 3, "A", Team::CT, "B", Team::T));
	kills.push_back(MakeKill(1, 128, 3, "E", Team::T, "A", Team::CT));

	const std::optional<Clutch> clutch = analysis::DetectRoundClutch(round, Pointers(kills), config);
	assert(clutch.has_value());
	assert(clutch->team == Team::T);
	assert(clutch->opponents == 2);
	assert(clutch->playerId == "E");
	assert(clutch->startTick == 64);
	assert(clutch->won);
}

/*
=============
CheckMatchScan

At most one clutch per round, rounds without kills are skipped.
=============
*/
static void CheckMatchScan()
{
	AnalysisConfig config;
	config.rosterSize = 2;

	std::vector<Round> rounds;
	rounds.push_back(MakeRound(1, 0, 500, Team::T));
	rounds.push_back(MakeRound(2, 600, 1100, Team::CT));
	rounds.push_back(MakeRound(3, 1200, 1700, Team::CT));

	std::vector<Kill> kills;
	kills.push_back(MakeKill(0, 100, 1, "A", Team::CT, "B", Team::T));
	kills.push_back(MakeKill(1, 150, 1, "E", Team::T, "A", Team::CT));
	kills.push_back(MakeKill(2, 700, 2, "E", Team::T, "A", Team::CT));
	kills.push_back(MakeKill(3, 800, 2, "F", Team::CT, "E", Team::T));
	kills.push_back(MakeKill(4, 900, 2, "F", Team::CT, "B", Team::T));

	const std::vector<Clutch> clutches = analysis::DetectClutches(rounds, kills, config);
	assert(clutches.size() == 2);
	assert(clutches[0].roundNum == 1);
	assert(clutches[0].playerId == "E");
	assert(clutches[1].roundNum == 2);
	assert(clutches[1].playerId == "F");
	assert(clutches[1].won);
	assert(clutches[1].killsMade == 2);
}

/*
=============
main
=============
*/
int main()
{
	InitLogger("clutch-test", nullptr, nullptr);

	CheckWonClutch();
	CheckLostClutch();
	CheckNoClutch();
	CheckRoster();
	CheckMatchScan();

	return 0;
}
