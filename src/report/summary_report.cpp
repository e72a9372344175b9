/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

summary_report.cpp implementation.*/

#include "match_report.hpp"

#include "../shared/logger.hpp"
#include "../shared/text_utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace roundstat::report {

using namespace roundstat::match;
using analysis::MatchAnalysis;

namespace {

constexpr size_t kTopListSize = 5;
constexpr size_t kLongListSize = 10;
const std::string kRule(70, '=');
const std::string kSectionRule(40, '-');

/*
=================
Tally

Occurrence counter that remembers first-seen order so equal counts keep the
order in which they were met.
=================
*/
class Tally {
public:
	void Add(const std::string& key, int amount = 1) {
		auto it = index_.find(key);
		if (it == index_.end()) {
			index_.emplace(key, entries_.size());
			entries_.emplace_back(key, amount);
			return;
		}
		entries_[it->second].second += amount;
	}

	std::vector<std::pair<std::string, int>> MostCommon(size_t limit = std::numeric_limits<size_t>::max()) const {
		std::vector<std::pair<std::string, int>> sorted = entries_;
		std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
		if (sorted.size() > limit)
			sorted.resize(limit);
		return sorted;
	}

	bool Empty() const { return entries_.empty(); }

private:
	std::vector<std::pair<std::string, int>> entries_;
	std::map<std::string, size_t> index_;
};

std::string HitgroupLabel(const std::string& hitgroup) {
	static constexpr std::array<const char*, 8> kNames = {
		"Generic", "Head", "Chest", "Stomach", "Left Arm", "Right Arm", "Left Leg", "Right Leg"
	};

	if (std::optional<int64_t> id = ParseInt64(hitgroup)) {
		if (*id >= 0 && *id < static_cast<int64_t>(kNames.size()))
			return kNames[static_cast<size_t>(*id)];
		return fmt::format("Unknown ({})", *id);
	}
	return hitgroup;
}

void Section(std::string& out, int number, std::string_view title) {
	out += fmt::format("\n[{}] {}\n{}\n", number, title, kSectionRule);
}

void WriteOverview(std::string& out, const MatchAnalysis& analysis) {
	const MatchMetadata& meta = analysis.metadata;
	Section(out, 1, "MATCH OVERVIEW");
	out += fmt::format("  Match: {}\n", meta.matchId);
	out += fmt::format("  Map: {}\n", meta.mapName);
	out += fmt::format("  Server: {}\n", meta.serverName);
	out += fmt::format("  Duration: {} ({} seconds)\n", meta.durationFormatted, meta.durationSeconds);
	out += fmt::format("  Tickrate: {}\n", meta.tickRate);
	out += fmt::format("  Total ticks: {}\n", meta.totalTicks);
	out += fmt::format("  Score: CT {} - {} T (winner: {})\n", meta.scoreCT, meta.scoreT, meta.winner);
	if (meta.droppedRecords > 0)
		out += fmt::format("  Dropped malformed records: {}\n", meta.droppedRecords);
}

void WriteTeams(std::string& out, const MatchAnalysis& analysis) {
	Section(out, 2, "TEAM COMPOSITION");

	std::vector<std::pair<std::string, std::vector<std::string>>> teams;
	for (const Player& player : analysis.players) {
		const std::string team(TeamName(player.team));
		auto it = std::find_if(teams.begin(), teams.end(), [&team](const auto& entry) { return entry.first == team; });
		if (it == teams.end()) {
			teams.emplace_back(team, std::vector<std::string>{});
			it = std::prev(teams.end());
		}
		it->second.push_back(player.name);
	}

	for (const auto& [team, names] : teams) {
		out += fmt::format("  {}:\n", team);
		for (const std::string& name : names)
			out += fmt::format("    - {}\n", name);
	}
}

void WriteRounds(std::string& out, const MatchAnalysis& analysis) {
	Section(out, 3, "ROUND RESULTS");
	out += fmt::format("  Total rounds: {}\n", analysis.rounds.size());

	Tally winners;
	Tally reasons;
	for (const Round& round : analysis.rounds) {
		winners.Add(std::string(TeamName(round.winner)));
		reasons.Add(std::string(RoundEndReasonName(round.reason)));
	}

	for (const auto& [winner, count] : winners.MostCommon())
		out += fmt::format("    {}: {} rounds\n", winner, count);

	out += "\n  Win reasons:\n";
	for (const auto& [reason, count] : reasons.MostCommon())
		out += fmt::format("    {}: {}\n", reason, count);
}

void WriteKills(std::string& out, const MatchAnalysis& analysis) {
	const std::vector<Kill>& kills = analysis.kills;
	Section(out, 4, "KILL STATISTICS");
	out += fmt::format("  Total kills: {}\n", kills.size());

	Tally killsByPlayer;
	Tally deathsByPlayer;
	Tally weapons;
	int headshots = 0;
	int wallbangs = 0;
	int noscopes = 0;
	int throughSmoke = 0;
	int blind = 0;
	for (const Kill& kill : kills) {
		if (IsPlayerIdentity(kill.attackerId))
			killsByPlayer.Add(kill.attackerName);
		deathsByPlayer.Add(kill.victimName);
		weapons.Add(kill.weapon);
		headshots += kill.headshot ? 1 : 0;
		wallbangs += kill.penetrated ? 1 : 0;
		noscopes += kill.noscope ? 1 : 0;
		throughSmoke += kill.thrusmoke ? 1 : 0;
		blind += kill.attackerblind ? 1 : 0;
	}

	out += "\n  Top fraggers:\n";
	for (const auto& [name, count] : killsByPlayer.MostCommon(kTopListSize))
		out += fmt::format("    {}: {} kills\n", name, count);

	out += "\n  Most deaths:\n";
	for (const auto& [name, count] : deathsByPlayer.MostCommon(kTopListSize))
		out += fmt::format("    {}: {} deaths\n", name, count);

	out += "\n  K/D Ratios:\n";
	for (const PlayerMatchStats& stats : analysis.playerStats)
		out += fmt::format("    {}: {}/{} ({:.2f})\n", stats.name, stats.kills, stats.deaths, stats.kdRatio);

	const double hsPercent = kills.empty() ? 0.0 : 100.0 * headshots / static_cast<double>(kills.size());
	out += fmt::format("\n  Headshot kills: {} ({:.1f}%)\n", headshots, hsPercent);

	out += "\n  Most used weapons (for kills):\n";
	for (const auto& [weapon, count] : weapons.MostCommon(kLongListSize))
		out += fmt::format("    {}: {}\n", weapon, count);

	out += "\n  Special kills:\n";
	out += fmt::format("    Wallbangs: {}\n", wallbangs);
	out += fmt::format("    Noscopes: {}\n", noscopes);
	out += fmt::format("    Through smoke: {}\n", throughSmoke);
	out += fmt::format("    While blind: {}\n", blind);
}

void WriteDamage(std::string& out, const MatchAnalysis& analysis) {
	const std::vector<Damage>& damages = analysis.damages;
	Section(out, 5, "DAMAGE STATISTICS");
	out += fmt::format("  Total damage events: {}\n", damages.size());

	int total = 0;
	Tally hitgroups;
	for (const Damage& damage : damages) {
		total += damage.damageHealth.value_or(0);
		hitgroups.Add(HitgroupLabel(damage.hitgroup));
	}
	out += fmt::format("  Total damage dealt: {}\n", total);

	out += "\n  Player ratings:\n";
	out += fmt::format("    {:<20} {:>6} {:>6} {:>6} {:>6}\n", "Player", "ADR", "KAST", "HS%", "FK-FD");
	for (const PlayerMatchStats& stats : analysis.playerStats) {
		out += fmt::format("    {:<20} {:>6.1f} {:>5.1f}% {:>5.1f}% {:>+6}\n",
			stats.name, stats.adr, stats.kast, stats.hsPercentage, stats.fkFdDiff);
	}

	out += "\n  Hitgroup distribution:\n";
	for (const auto& [label, count] : hitgroups.MostCommon()) {
		const double percent = damages.empty() ? 0.0 : 100.0 * count / static_cast<double>(damages.size());
		out += fmt::format("    {}: {} ({:.1f}%)\n", label, count, percent);
	}
}

void WriteGrenades(std::string& out, const MatchAnalysis& analysis) {
	Section(out, 6, "GRENADE USAGE");

	Tally types;
	for (const Grenade& grenade : analysis.grenades)
		types.Add(std::string(GrenadeTypeName(grenade.type)));

	const size_t rounds = analysis.rounds.size();
	for (const auto& [type, count] : types.MostCommon()) {
		const double perRound = rounds > 0 ? count / static_cast<double>(rounds) : 0.0;
		out += fmt::format("  {}: {} ({:.1f} per round)\n", type, count, perRound);
	}
}

void WriteBomb(std::string& out, const MatchAnalysis& analysis) {
	Section(out, 7, "BOMB EVENTS");

	Tally types;
	Tally sites;
	for (const BombEvent& event : analysis.bombEvents) {
		types.Add(std::string(BombEventTypeName(event.type)));
		if (event.type == BombEventType::Plant && event.site)
			sites.Add(*event.site);
	}

	for (const auto& [type, count] : types.MostCommon())
		out += fmt::format("  {}: {}\n", type, count);

	if (!sites.Empty()) {
		out += "\n  Plants by site:\n";
		for (const auto& [site, count] : sites.MostCommon())
			out += fmt::format("    {}: {}\n", site, count);
	}
}

void WriteEconomy(std::string& out, const MatchAnalysis& analysis) {
	Section(out, 8, "ECONOMY ANALYSIS");
	if (analysis.roundStats.empty())
		return;

	int64_t ctTotal = 0;
	int64_t tTotal = 0;
	for (const RoundStats& stats : analysis.roundStats) {
		ctTotal += stats.ctEquipmentValue;
		tTotal += stats.tEquipmentValue;
	}

	const double rounds = static_cast<double>(analysis.roundStats.size());
	out += "  Average equipment value per round by team:\n";
	out += fmt::format("    CT: ${:.0f}\n", static_cast<double>(ctTotal) / rounds);
	out += fmt::format("    T: ${:.0f}\n", static_cast<double>(tTotal) / rounds);
}

void WriteAdvanced(std::string& out, const MatchAnalysis& analysis) {
	Section(out, 9, "ADVANCED METRICS");

	Tally openers;
	int openerWins = 0;
	int decided = 0;
	for (const RoundStats& stats : analysis.roundStats) {
		if (!stats.firstKillAttacker)
			continue;
		openers.Add(*stats.firstKillAttacker);
		if (stats.firstKillTeamWon) {
			++decided;
			openerWins += *stats.firstKillTeamWon ? 1 : 0;
		}
	}

	out += "  First kill leaders:\n";
	for (const auto& [name, count] : openers.MostCommon(kTopListSize))
		out += fmt::format("    {}: {} opening kills\n", name, count);
	if (decided > 0)
		out += fmt::format("  Opening kill conversion: {}/{} rounds\n", openerWins, decided);

	std::vector<double> distances;
	int trades = 0;
	for (const Kill& kill : analysis.kills) {
		if (kill.distance && *kill.distance > 0.0)
			distances.push_back(*kill.distance);
		trades += kill.isTrade ? 1 : 0;
	}

	if (!distances.empty()) {
		double sum = 0.0;
		for (double distance : distances)
			sum += distance;
		const auto [shortest, longest] = std::minmax_element(distances.begin(), distances.end());
		out += "\n  Kill distances:\n";
		out += fmt::format("    Average: {:.0f} units\n", sum / static_cast<double>(distances.size()));
		out += fmt::format("    Longest: {:.0f} units\n", *longest);
		out += fmt::format("    Shortest: {:.0f} units\n", *shortest);
	}

	out += fmt::format("\n  Trade kills: {}\n", trades);

	out += "\n  Clutches:\n";
	if (analysis.clutches.empty())
		out += "    none\n";
	for (const Clutch& clutch : analysis.clutches) {
		out += fmt::format("    Round {}: {} {} ({}) {} with {} kills\n", clutch.roundNum, clutch.playerName,
			clutch.ClutchType(), TeamName(clutch.team), clutch.won ? "won" : "lost", clutch.killsMade);
	}
}

class SummaryReportWriter final : public MatchReportWriter {
public:
	std::string_view Name() const override { return "summary"; }

	bool Write(const analysis::MatchAnalysis& analysis, const std::filesystem::path& outDir, std::string& error) const override {
		if (!EnsureDirectory(outDir, error))
			return false;

		const std::filesystem::path path = outDir / (analysis.metadata.matchId + "_summary.txt");
		if (!WriteTextFile(path, RenderSummary(analysis), error))
			return false;

		Logf(LogLevel::Info, "match summary written to {}", path.string());
		return true;
	}
};

} // namespace

std::string RenderSummary(const MatchAnalysis& analysis) {
	std::string out;
	out += kRule + "\nMATCH ANALYSIS REPORT\n" + kRule + "\n";

	WriteOverview(out, analysis);
	WriteTeams(out, analysis);
	WriteRounds(out, analysis);
	WriteKills(out, analysis);
	WriteDamage(out, analysis);
	WriteGrenades(out, analysis);
	WriteBomb(out, analysis);
	WriteEconomy(out, analysis);
	WriteAdvanced(out, analysis);

	out += "\n" + kRule + "\nANALYSIS COMPLETE\n" + kRule + "\n";
	return out;
}

std::unique_ptr<MatchReportWriter> MakeSummaryReportWriter() {
	return std::make_unique<SummaryReportWriter>();
}

} // namespace roundstat::report
