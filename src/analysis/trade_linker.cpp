/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

trade_linker.cpp implementation.*/

#include "trade_linker.hpp"

#include "../shared/logger.hpp"

#include <algorithm>
#include <numeric>

namespace roundstat::analysis {

using namespace roundstat::match;

int LinkTrades(std::vector<Kill>& kills, const AnalysisConfig& config) {
	for (Kill& kill : kills) {
		kill.isTrade = false;
		kill.tradedKillId.reset();
		kill.tradeTimeTicks.reset();
	}

	std::vector<size_t> order(kills.size());
	std::iota(order.begin(), order.end(), size_t{ 0 });
	std::stable_sort(order.begin(), order.end(), [&kills](size_t a, size_t b) {
		if (kills[a].roundNum != kills[b].roundNum)
			return kills[a].roundNum < kills[b].roundNum;
		if (kills[a].tick != kills[b].tick)
			return kills[a].tick < kills[b].tick;
		return kills[a].killId < kills[b].killId;
	});

	const Tick window = config.TradeWindowTicks();
	std::vector<bool> avenged(kills.size(), false);
	int linked = 0;

	for (size_t pos = 0; pos < order.size(); ++pos) {
		Kill& kill = kills[order[pos]];
		if (kill.attackerTeam == Team::Unknown || !IsPlayerIdentity(kill.victimId))
			continue;

		for (size_t back = pos; back-- > 0;) {
			const Kill& candidate = kills[order[back]];
			if (candidate.roundNum != kill.roundNum)
				break;

			const Tick elapsed = kill.tick - candidate.tick;
			if (elapsed > window)
				break;

			if (avenged[order[back]])
				continue;

			if (candidate.victimTeam == kill.attackerTeam && candidate.attackerId == kill.victimId) {
				kill.isTrade = true;
				kill.tradedKillId = candidate.killId;
				kill.tradeTimeTicks = elapsed;
				avenged[order[back]] = true;
				++linked;
				break;
			}
		}
	}

	Logf(LogLevel::Debug, "trade linker: {} of {} kills traded (window {} ticks)", linked, kills.size(), window);
	return linked;
}

} // namespace roundstat::analysis
