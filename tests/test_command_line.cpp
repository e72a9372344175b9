#include "cli/command_line.hpp"

#include <cassert>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace roundstat;
using namespace roundstat::cli;

/*
=============
Parse
=============
*/
static bool Parse(std::vector<std::string_view> argv, CliOptions& options, std::string& error)
{
	return ParseCommandLine(CommandArgs(std::move(argv)), options, error);
}

/*
=============
CheckFullCommand
=============
*/
static void CheckFullCommand()
{
	CliOptions options;
	std::string error;
	const bool ok = Parse({ "match1.json", "-o", "reports", "--format=csv", "--summary", "--config", "cfg.json",
		"--tickrate", "128", "--trade-window-seconds=2.5", "--roster-size", "2", "-j", "0",
		"--log-level", "Warning", "match2.json" }, options, error);
	assert(ok);
	assert(error.empty());

	assert(options.inputs.size() == 2);
	assert(options.inputs[0] == "match1.json");
	assert(options.inputs[1] == "match2.json");
	assert(options.outDir == "reports");
	assert(options.format == OutputFormat::Csv);
	assert(options.summary);
	assert(options.configFile.has_value() && *options.configFile == "cfg.json");
	assert(options.tickRate == 128);
	assert(options.tradeWindowSeconds == 2.5);
	assert(!options.tradeWindowTicks.has_value());
	assert(options.rosterSize == 2);
	assert(options.jobs == 0);
	assert(options.logLevel == LogLevel::Warn);
}

/*
=============
CheckDefaults
=============
*/
static void CheckDefaults()
{
	CliOptions options;
	std::string error;
	const bool ok = Parse({ "--", "-odd-name.json" }, options, error);
	assert(ok);
	assert(options.inputs.size() == 1);
	assert(options.inputs[0] == "-odd-name.json");
	assert(options.outDir == "data");
	assert(options.format == OutputFormat::All);
	assert(!options.summary);
	assert(options.jobs == 1);
	assert(!options.logLevel.has_value());

	CliOptions help;
	assert(Parse({ "--help" }, help, error));
	assert(help.showHelp);
	assert(help.inputs.empty());

	CliOptions version;
	assert(Parse({ "-V" }, version, error));
	assert(version.showVersion);

	assert(UsageText("roundstat").rfind("Usage: roundstat [options]", 0) == 0);
}

/*
=============
CheckErrors
=============
*/
static void CheckErrors()
{
	struct BadCase {
		std::vector<std::string_view> argv;
		std::string expected;
	};

	const std::vector<BadCase> cases{
		{ {}, "no input files" },
		{ { "--summary" }, "no input files" },
		{ { "m.json", "--bogus" }, "unknown option --bogus" },
		{ { "m.json", "--tickrate" }, "missing value for --tickrate" },
		{ { "m.json", "--tickrate", "0" }, "invalid value '0' for --tickrate (expected a positive integer)" },
		{ { "m.json", "--tickrate=fast" }, "invalid value 'fast' for --tickrate (expected a positive integer)" },
		{ { "m.json", "--trade-window-ticks", "-5" }, "invalid value '-5' for --trade-window-ticks (expected a non-negative integer)" },
		{ { "m.json", "--trade-window-seconds", "soon" }, "invalid value 'soon' for --trade-window-seconds (expected a non-negative number)" },
		{ { "m.json", "--roster-size", "1" }, "invalid value '1' for --roster-size (expected an integer of at least 2)" },
		{ { "m.json", "-j", "-1" }, "invalid value '-1' for -j (expected a non-negative integer)" },
		{ { "m.json", "--format", "xml" }, "invalid value 'xml' for --format (expected json, csv, all or none)" },
		{ { "m.json", "--log-level", "loud" }, "invalid value 'loud' for --log-level (expected trace, debug, info, warn or error)" },
		{ { "m.json", "-o=" }, "invalid value '' for -o (expected a directory)" },
	};

	for (const BadCase& bad : cases) {
		CliOptions options;
		std::string error;
		assert(!Parse(bad.argv, options, error));
		assert(error == bad.expected);
	}
}

/*
=============
CheckArgAccessors
=============
*/
static void CheckArgAccessors()
{
	const char* argv[] = { "roundstat", "12", "x", "0.5" };
	const CommandArgs args(4, argv);
	assert(args.count() == 3);
	assert(args.getString(0) == "12");
	assert(args.getInt(0) == 12);
	assert(!args.getInt(1).has_value());
	assert(args.getDouble(2) == 0.5);
	assert(args.getString(7).empty());
	assert(!CommandArgs::ParseInt("99999999999").has_value());

	assert(ParseOutputFormat("JSON") == OutputFormat::Json);
	assert(ParseOutputFormat("none") == OutputFormat::None);
	assert(!ParseOutputFormat("yaml").has_value());
}

/*
=============
CheckOverrides

Ticks given alongside seconds keep precedence.
=============
*/
static void CheckOverrides()
{
	CliOptions options;
	std::string error;
	const bool ok = Parse({ "m.json", "--trade-window-seconds", "1", "--trade-window-ticks", "100", "--tickrate", "32" },
		options, error);
	assert(ok);

	match::AnalysisConfig config;
	ApplyCliOverrides(options, config);
	assert(config.tickRate == 32);
	assert(config.tradeWindowSeconds == 1.0);
	assert(config.TradeWindowTicks() == 100);
	assert(config.rosterSize == 5);
}

/*
=============
main
=============
*/
int main()
{
	CheckFullCommand();
	CheckDefaults();
	CheckErrors();
	CheckArgAccessors();
	CheckOverrides();

	return 0;
}
