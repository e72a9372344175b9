/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

command_line.cpp implementation.*/

#include "command_line.hpp"

#include "../shared/text_utils.hpp"

#include <cstdint>
#include <limits>

namespace roundstat::cli {

namespace {

/*
=============
IsKnownLogLevel

True for the level names ParseLogLevel understands; it maps anything else
to info.
=============
*/
bool IsKnownLogLevel(std::string_view value) {
	const std::string upper = ToUpperCopy(value);
	return upper == "TRACE" || upper == "DEBUG" || upper == "INFO" || upper == "WARN" || upper == "WARNING"
		|| upper == "ERROR";
}

} // namespace

CommandArgs::CommandArgs(int argc, const char* const* argv) {
	for (int i = 1; i < argc; ++i)
		_args.emplace_back(argv[i]);
}

std::optional<int> CommandArgs::ParseInt(std::string_view str) {
	const std::optional<int64_t> value = ParseInt64(str);
	if (!value || *value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
		return std::nullopt;
	return static_cast<int>(*value);
}

std::optional<double> CommandArgs::ParseDouble(std::string_view str) {
	return roundstat::ParseDouble(str);
}

std::optional<OutputFormat> ParseOutputFormat(std::string_view value) {
	const std::string upper = ToUpperCopy(value);
	if (upper == "JSON")
		return OutputFormat::Json;
	if (upper == "CSV")
		return OutputFormat::Csv;
	if (upper == "ALL")
		return OutputFormat::All;
	if (upper == "NONE")
		return OutputFormat::None;
	return std::nullopt;
}

bool ParseCommandLine(const CommandArgs& args, CliOptions& options, std::string& error) {
	bool positionalOnly = false;

	for (int i = 0; i < args.count(); ++i) {
		const std::string_view arg = args.getString(i);

		if (positionalOnly || arg.size() < 2 || arg.front() != '-') {
			options.inputs.emplace_back(std::string(arg));
			continue;
		}

		if (arg == "--") {
			positionalOnly = true;
			continue;
		}

		std::string_view name = arg;
		std::optional<std::string_view> inlineValue;
		if (const size_t eq = arg.find('='); eq != std::string_view::npos) {
			name = arg.substr(0, eq);
			inlineValue = arg.substr(eq + 1);
		}

		auto takeValue = [&](std::string_view& value) {
			if (inlineValue) {
				value = *inlineValue;
				return true;
			}
			if (i + 1 >= args.count()) {
				error = "missing value for " + std::string(name);
				return false;
			}
			value = args.getString(++i);
			return true;
		};
		auto invalid = [&](std::string_view value, std::string_view expected) {
			error = "invalid value '" + std::string(value) + "' for " + std::string(name) + " (expected "
				+ std::string(expected) + ")";
			return false;
		};

		if (name == "-h" || name == "--help") {
			options.showHelp = true;
			continue;
		}
		if (name == "-V" || name == "--version") {
			options.showVersion = true;
			continue;
		}
		if (name == "--summary") {
			options.summary = true;
			continue;
		}

		std::string_view value;
		if (name == "-o" || name == "--out-dir") {
			if (!takeValue(value))
				return false;
			if (value.empty())
				return invalid(value, "a directory");
			options.outDir = std::string(value);
		}
		else if (name == "--format") {
			if (!takeValue(value))
				return false;
			const std::optional<OutputFormat> format = ParseOutputFormat(value);
			if (!format)
				return invalid(value, "json, csv, all or none");
			options.format = *format;
		}
		else if (name == "-c" || name == "--config") {
			if (!takeValue(value))
				return false;
			options.configFile = std::filesystem::path(std::string(value));
		}
		else if (name == "--tickrate") {
			if (!takeValue(value))
				return false;
			const std::optional<int> rate = CommandArgs::ParseInt(value);
			if (!rate || *rate <= 0)
				return invalid(value, "a positive integer");
			options.tickRate = *rate;
		}
		else if (name == "--trade-window-ticks") {
			if (!takeValue(value))
				return false;
			const std::optional<int64_t> ticks = ParseInt64(value);
			if (!ticks || *ticks < 0)
				return invalid(value, "a non-negative integer");
			options.tradeWindowTicks = *ticks;
		}
		else if (name == "--trade-window-seconds") {
			if (!takeValue(value))
				return false;
			const std::optional<double> seconds = CommandArgs::ParseDouble(value);
			if (!seconds || *seconds < 0.0)
				return invalid(value, "a non-negative number");
			options.tradeWindowSeconds = *seconds;
		}
		else if (name == "--roster-size") {
			if (!takeValue(value))
				return false;
			const std::optional<int> size = CommandArgs::ParseInt(value);
			if (!size || *size < 2)
				return invalid(value, "an integer of at least 2");
			options.rosterSize = *size;
		}
		else if (name == "-j" || name == "--jobs") {
			if (!takeValue(value))
				return false;
			const std::optional<int> jobs = CommandArgs::ParseInt(value);
			if (!jobs || *jobs < 0)
				return invalid(value, "a non-negative integer");
			options.jobs = *jobs;
		}
		else if (name == "--log-level") {
			if (!takeValue(value))
				return false;
			if (!IsKnownLogLevel(value))
				return invalid(value, "trace, debug, info, warn or error");
			options.logLevel = ParseLogLevel(value);
		}
		else {
			error = "unknown option " + std::string(name);
			return false;
		}
	}

	if (options.inputs.empty() && !options.showHelp && !options.showVersion) {
		error = "no input files";
		return false;
	}

	return true;
}

void ApplyCliOverrides(const CliOptions& options, match::AnalysisConfig& config) {
	if (options.tickRate)
		config.tickRate = *options.tickRate;
	if (options.tradeWindowSeconds) {
		config.tradeWindowSeconds = *options.tradeWindowSeconds;
		if (!options.tradeWindowTicks)
			config.tradeWindowTicks.reset();
	}
	if (options.tradeWindowTicks)
		config.tradeWindowTicks = *options.tradeWindowTicks;
	if (options.rosterSize)
		config.rosterSize = *options.rosterSize;
}

std::string UsageText(std::string_view program) {
	std::string usage;
	usage += "Usage: " + std::string(program) + " [options] <events.json>...\n\n";
	usage += "Derives match analytics (trades, clutches, ADR, KAST) from event dumps.\n";
	usage += "A directory argument expands to the .json files it contains.\n\n";
	usage += "Options:\n";
	usage += "  -o, --out-dir DIR             Output directory (default: data)\n";
	usage += "      --format FMT              json, csv, all or none (default: all)\n";
	usage += "      --summary                 Also write a text summary per match\n";
	usage += "  -c, --config FILE             JSON analysis config\n";
	usage += "      --tickrate N              Tick rate when the dump header has none (default: 64)\n";
	usage += "      --trade-window-ticks N    Trade window in ticks\n";
	usage += "      --trade-window-seconds S  Trade window in seconds (default: 5)\n";
	usage += "      --roster-size N           Players per side (default: 5)\n";
	usage += "  -j, --jobs N                  Matches analyzed in parallel, 0 = one per core (default: 1)\n";
	usage += "      --log-level LEVEL         trace, debug, info, warn or error\n";
	usage += "  -V, --version                 Print the version and exit\n";
	usage += "  -h, --help                    Show this help\n\n";
	usage += "Exit status: 0 on success, 1 when an input failed, 2 on usage errors.\n";
	return usage;
}

} // namespace roundstat::cli
