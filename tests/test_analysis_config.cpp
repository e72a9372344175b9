#include "cli/command_line.hpp"
#include "match/analysis_config.hpp"
#include "shared/logger.hpp"

#include <json/json.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

using namespace roundstat;
using namespace roundstat::match;

/*
=============
WriteFile
=============
*/
static std::filesystem::path WriteFile(const std::string& name, const std::string& contents)
{
	const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	out << contents;
	return path;
}

/*
=============
main

Covers the trade window derivation, JSON config loading and command line
overrides.
=============
*/
int main()
{
	InitLogger("config-test", nullptr, nullptr);

	AnalysisConfig defaults;
	assert(defaults.tickRate == 64);
	assert(defaults.rosterSize == 5);
	assert(defaults.TradeWindowTicks() == 320);

	AnalysisConfig demo128 = defaults.WithTickRate(128);
	assert(demo128.tickRate == 128);
	assert(demo128.TradeWindowTicks() == 640);
	assert(defaults.WithTickRate(0).tickRate == 64);

	AnalysisConfig explicitTicks;
	explicitTicks.tradeWindowTicks = 200;
	assert(explicitTicks.WithTickRate(128).TradeWindowTicks() == 200);

	{
		Json::Value root(Json::objectValue);
		root["tickrate"] = 128;
		root["trade_window_seconds"] = 3.0;
		root["roster_size"] = 2;
		AnalysisConfig config;
		assert(ApplyAnalysisConfigJson(root, config));
		assert(config.tickRate == 128);
		assert(config.rosterSize == 2);
		assert(config.TradeWindowTicks() == 384);
	}

	{
		Json::Value root(Json::objectValue);
		root["tickrate"] = -1;
		root["roster_size"] = 1;
		root["trade_window_ticks"] = "soon";
		AnalysisConfig config;
		assert(!ApplyAnalysisConfigJson(root, config));
		assert(config.tickRate == 64);
		assert(config.rosterSize == 5);
		assert(!config.tradeWindowTicks.has_value());
	}

	{
		const std::filesystem::path path = WriteFile("roundstat_config_test.json",
			R"({ "tickrate": 64, "trade_window_ticks": 256 })");
		AnalysisConfig config;
		std::string error;
		assert(LoadAnalysisConfig(path, config, error));
		assert(error.empty());
		assert(config.TradeWindowTicks() == 256);
		std::filesystem::remove(path);
	}

	{
		const std::filesystem::path path = WriteFile("roundstat_config_broken.json", "{ \"tickrate\": ");
		AnalysisConfig config;
		std::string error;
		assert(!LoadAnalysisConfig(path, config, error));
		assert(!error.empty());
		std::filesystem::remove(path);
	}

	{
		AnalysisConfig config;
		std::string error;
		assert(!LoadAnalysisConfig("/nonexistent/roundstat/config.json", config, error));
		assert(error.find("failed to open") != std::string::npos);
	}

	{
		AnalysisConfig config;
		config.tradeWindowTicks = 100;

		cli::CliOptions options;
		options.tradeWindowSeconds = 2.0;
		options.rosterSize = 3;
		cli::ApplyCliOverrides(options, config);
		assert(!config.tradeWindowTicks.has_value());
		assert(config.TradeWindowTicks() == 128);
		assert(config.rosterSize == 3);

		options.tradeWindowTicks = 50;
		cli::ApplyCliOverrides(options, config);
		assert(config.TradeWindowTicks() == 50);
	}

	return 0;
}
