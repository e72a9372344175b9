// command_line.hpp - Argument parsing for the roundstat driver.

#pragma once

#include "../match/analysis_config.hpp"
#include "../shared/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace roundstat::cli {

class CommandArgs {
private:
	std::vector<std::string_view> _args;
public:
	CommandArgs(int argc, const char* const* argv);
	explicit CommandArgs(std::vector<std::string_view> args) : _args(std::move(args)) {}

	int count() const { return static_cast<int>(_args.size()); }

	std::string_view getString(int index) const {
		if (index < 0 || index >= count()) return "";
		return _args[index];
	}

	std::optional<int> getInt(int index) const {
		return ParseInt(getString(index));
	}

	static std::optional<int> ParseInt(std::string_view str);

	std::optional<double> getDouble(int index) const {
		return ParseDouble(getString(index));
	}

	static std::optional<double> ParseDouble(std::string_view str);
};

enum class OutputFormat {
	Json,
	Csv,
	All,
	None
};

std::optional<OutputFormat> ParseOutputFormat(std::string_view value);

struct CliOptions {
	std::vector<std::filesystem::path> inputs;
	std::filesystem::path outDir = "data";
	OutputFormat format = OutputFormat::All;
	bool summary = false;

	std::optional<std::filesystem::path> configFile;
	std::optional<int> tickRate;
	std::optional<match::Tick> tradeWindowTicks;
	std::optional<double> tradeWindowSeconds;
	std::optional<int> rosterSize;

	// 0 picks one worker per hardware thread.
	int jobs = 1;
	std::optional<LogLevel> logLevel;

	bool showVersion = false;
	bool showHelp = false;
};

/*
=============
ParseCommandLine

Fills options from the arguments following the program name. Accepts both
"--flag value" and "--flag=value". Fails on unknown flags, missing or
malformed values, and when no input is given (unless help or version was
requested).
=============
*/
bool ParseCommandLine(const CommandArgs& args, CliOptions& options, std::string& error);

/*
=============
ApplyCliOverrides

Flags given on the command line win over the config file.
=============
*/
void ApplyCliOverrides(const CliOptions& options, match::AnalysisConfig& config);

std::string UsageText(std::string_view program);

} // namespace roundstat::cli
