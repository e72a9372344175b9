#pragma once

#include "match_types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace Json {
class Value;
}

namespace roundstat::match {

inline constexpr int kDefaultTickRate = 64;
inline constexpr double kDefaultTradeWindowSeconds = 5.0;
inline constexpr int kDefaultRosterSize = 5;

/*
=================
AnalysisConfig

Tunables for one match derivation. A copy travels with every pass so
matches recorded at different tick rates can be analyzed side by side.
=================
*/
struct AnalysisConfig {
	int tickRate = kDefaultTickRate;
	double tradeWindowSeconds = kDefaultTradeWindowSeconds;
	// Overrides the seconds based window when set.
	std::optional<Tick> tradeWindowTicks;
	int rosterSize = kDefaultRosterSize;

	Tick TradeWindowTicks() const;
	AnalysisConfig WithTickRate(int demoTickRate) const;
};

/*
=============
ApplyAnalysisConfigJson

Copies recognised keys from a config document. Invalid entries are logged
and skipped; returns false when at least one entry was rejected.
=============
*/
bool ApplyAnalysisConfigJson(const Json::Value& root, AnalysisConfig& config);

/*
=============
LoadAnalysisConfig

Reads a JSON config file into config. Fails when the file cannot be opened
or parsed; rejected entries do not fail the load.
=============
*/
bool LoadAnalysisConfig(const std::filesystem::path& path, AnalysisConfig& config, std::string& error);

} // namespace roundstat::match
