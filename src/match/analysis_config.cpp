/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

analysis_config.cpp implementation.*/

#include "analysis_config.hpp"

#include "../shared/logger.hpp"

#include <json/json.h>

#include <cmath>
#include <exception>
#include <fstream>

namespace roundstat::match {

/*
=============
AnalysisConfig::TradeWindowTicks

Explicit tick window when configured, otherwise seconds scaled by tick rate.
=============
*/
Tick AnalysisConfig::TradeWindowTicks() const {
	if (tradeWindowTicks.has_value())
		return *tradeWindowTicks;

	return static_cast<Tick>(std::llround(tradeWindowSeconds * static_cast<double>(tickRate)));
}

/*
=============
AnalysisConfig::WithTickRate

Returns a copy using the demo's tick rate when the header reports one.
=============
*/
AnalysisConfig AnalysisConfig::WithTickRate(int demoTickRate) const {
	AnalysisConfig copy = *this;
	if (demoTickRate > 0)
		copy.tickRate = demoTickRate;
	return copy;
}

bool ApplyAnalysisConfigJson(const Json::Value& root, AnalysisConfig& config) {
	if (!root.isObject()) {
		Log(LogLevel::Warn, "analysis config: root must be a JSON object");
		return false;
	}

	bool valid = true;
	auto reject = [&](const char* key, const std::string& reason) {
		Logf(LogLevel::Warn, "analysis config: ignoring '{}' ({})", key, reason);
		valid = false;
	};

	if (root.isMember("tickrate")) {
		const Json::Value& value = root["tickrate"];
		if (!value.isInt() || value.asInt() <= 0)
			reject("tickrate", "expected a positive integer");
		else
			config.tickRate = value.asInt();
	}

	if (root.isMember("trade_window_seconds")) {
		const Json::Value& value = root["trade_window_seconds"];
		if (!value.isNumeric() || value.asDouble() < 0.0)
			reject("trade_window_seconds", "expected a non-negative number");
		else
			config.tradeWindowSeconds = value.asDouble();
	}

	if (root.isMember("trade_window_ticks")) {
		const Json::Value& value = root["trade_window_ticks"];
		if (value.isNull())
			config.tradeWindowTicks.reset();
		else if (!value.isInt64() || value.asInt64() < 0)
			reject("trade_window_ticks", "expected a non-negative integer");
		else
			config.tradeWindowTicks = value.asInt64();
	}

	if (root.isMember("roster_size")) {
		const Json::Value& value = root["roster_size"];
		if (!value.isInt() || value.asInt() < 2)
			reject("roster_size", "expected an integer of at least 2");
		else
			config.rosterSize = value.asInt();
	}

	return valid;
}

bool LoadAnalysisConfig(const std::filesystem::path& path, AnalysisConfig& config, std::string& error) {
	try {
		std::ifstream file(path, std::ifstream::binary);
		if (!file.is_open()) {
			error = "failed to open config file '" + path.string() + "'";
			return false;
		}

		Json::Value root;
		Json::CharReaderBuilder builder;
		std::string errs;
		if (!Json::parseFromStream(builder, file, &root, &errs)) {
			error = "JSON parsing failed for '" + path.string() + "': " + errs;
			return false;
		}

		if (!ApplyAnalysisConfigJson(root, config))
			Logf(LogLevel::Warn, "analysis config '{}' contained rejected entries", path.string());

		Logf(LogLevel::Debug, "analysis config loaded: tickrate={} window={} ticks roster={}",
			config.tickRate, config.TradeWindowTicks(), config.rosterSize);
		return true;
	}
	catch (const std::exception& e) {
		error = "exception while reading config '" + path.string() + "': " + e.what();
	}

	return false;
}

} // namespace roundstat::match
