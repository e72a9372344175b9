/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

main.cpp implementation.*/

#include "analysis/match_analyzer.hpp"
#include "cli/command_line.hpp"
#include "ingest/demo_events.hpp"
#include "match/analysis_config.hpp"
#include "report/match_report.hpp"
#include "shared/logger.hpp"
#include "shared/version.hpp"
#include "shared/text_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace roundstat;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInputFailed = 1;
constexpr int kExitUsage = 2;

void WriteStream(std::FILE* stream, std::string_view message) {
	std::fwrite(message.data(), 1, message.size(), stream);
	std::fflush(stream);
}

/*
=============
CurrentTimestamp

UTC time of this run in ISO 8601, stamped into every match's metadata.
=============
*/
std::string CurrentTimestamp() {
	const std::time_t now = std::time(nullptr);
	const std::tm* tm = std::gmtime(&now);
	if (!tm)
		return "invalid";

	char buf[64];
	if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", tm))
		return buf;
	return "error";
}

/*
=============
ExpandInputs

Directories expand to the .json files directly inside them, in name order.
Anything else is passed through and left for the loader to reject.
=============
*/
std::vector<std::filesystem::path> ExpandInputs(const std::vector<std::filesystem::path>& inputs) {
	std::vector<std::filesystem::path> files;
	for (const std::filesystem::path& input : inputs) {
		std::error_code ec;
		if (!std::filesystem::is_directory(input, ec)) {
			files.push_back(input);
			continue;
		}

		std::vector<std::filesystem::path> found;
		for (auto it = std::filesystem::directory_iterator(input, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
			std::error_code fileError;
			if (it->is_regular_file(fileError) && ToUpperCopy(it->path().extension().string()) == ".JSON")
				found.push_back(it->path());
		}
		if (ec)
			Logf(LogLevel::Warn, "could not list '{}': {}", input.string(), ec.message());
		if (found.empty())
			Logf(LogLevel::Warn, "no .json event dumps in '{}'", input.string());

		std::sort(found.begin(), found.end());
		files.insert(files.end(), found.begin(), found.end());
	}
	return files;
}

std::vector<std::unique_ptr<report::MatchReportWriter>> BuildWriters(const cli::CliOptions& options) {
	std::vector<std::unique_ptr<report::MatchReportWriter>> writers;
	if (options.format == cli::OutputFormat::Json || options.format == cli::OutputFormat::All)
		writers.push_back(report::MakeJsonReportWriter());
	if (options.format == cli::OutputFormat::Csv || options.format == cli::OutputFormat::All)
		writers.push_back(report::MakeCsvReportWriter());
	if (options.summary)
		writers.push_back(report::MakeSummaryReportWriter());
	return writers;
}

/*
=============
ProcessMatch

Loads, analyzes and writes one event dump. Returns false when the dump could
not be loaded or any writer failed.
=============
*/
bool ProcessMatch(const std::filesystem::path& input,
	const match::AnalysisConfig& config,
	const std::vector<std::unique_ptr<report::MatchReportWriter>>& writers,
	const std::filesystem::path& outDir,
	const std::string& extractedAt) {
	const MatchLogScope scope(input.stem().string());

	ingest::DemoEventTables tables;
	std::string error;
	if (!ingest::LoadDemoEvents(input, tables, error)) {
		Logf(LogLevel::Error, "{}", error);
		return false;
	}

	const analysis::MatchAnalysis result = analysis::AnalyzeMatch(tables, config, extractedAt);

	bool ok = true;
	for (const auto& writer : writers) {
		std::string writeError;
		if (!writer->Write(result, outDir, writeError)) {
			Logf(LogLevel::Error, "{} report for '{}' failed: {}", writer->Name(), input.string(), writeError);
			ok = false;
		}
	}
	return ok;
}

} // namespace

int main(int argc, char** argv) {
	InitLogger(version::kToolTitle,
		[](std::string_view message) { WriteStream(stdout, message); },
		[](std::string_view message) { WriteStream(stderr, message); });

	const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : std::string(version::kToolTitle);

	cli::CliOptions options;
	std::string error;
	if (!cli::ParseCommandLine(cli::CommandArgs(argc, argv), options, error)) {
		WriteStream(stderr, program + ": " + error + "\n\n" + cli::UsageText(program));
		return kExitUsage;
	}

	if (options.showHelp) {
		WriteStream(stdout, cli::UsageText(program));
		return kExitOk;
	}
	if (options.showVersion) {
		WriteStream(stdout, std::string(version::kToolTitle) + " " + std::string(version::kToolVersion) + "\n");
		return kExitOk;
	}

	if (options.logLevel)
		SetLogLevel(*options.logLevel);

	match::AnalysisConfig config;
	if (options.configFile && !match::LoadAnalysisConfig(*options.configFile, config, error)) {
		Logf(LogLevel::Error, "{}", error);
		return kExitUsage;
	}
	cli::ApplyCliOverrides(options, config);

	const std::vector<std::filesystem::path> inputs = ExpandInputs(options.inputs);
	if (inputs.empty()) {
		Log(LogLevel::Error, "nothing to analyze");
		return kExitInputFailed;
	}

	const auto writers = BuildWriters(options);
	const std::string extractedAt = CurrentTimestamp();

	size_t workerCount = options.jobs > 0 ? static_cast<size_t>(options.jobs) : std::thread::hardware_concurrency();
	workerCount = std::clamp<size_t>(workerCount, 1, inputs.size());

	Logf(LogLevel::Info, "{} {}: {} event dumps, {} workers, trade window {} ticks", version::kToolTitle,
		version::kToolVersion, inputs.size(), workerCount, config.TradeWindowTicks());

	std::atomic<size_t> next{ 0 };
	std::atomic<int> failures{ 0 };
	auto worker = [&]() {
		for (size_t index = next.fetch_add(1); index < inputs.size(); index = next.fetch_add(1)) {
			try {
				if (!ProcessMatch(inputs[index], config, writers, options.outDir, extractedAt))
					failures.fetch_add(1);
			}
			catch (const std::exception& e) {
				Logf(LogLevel::Error, "exception while analyzing '{}': {}", inputs[index].string(), e.what());
				failures.fetch_add(1);
			}
		}
	};

	if (workerCount == 1) {
		worker();
	}
	else {
		std::vector<std::thread> threads;
		threads.reserve(workerCount);
		for (size_t i = 0; i < workerCount; ++i)
			threads.emplace_back(worker);
		for (std::thread& thread : threads)
			thread.join();
	}

	const int failed = failures.load();
	if (failed > 0) {
		Logf(LogLevel::Error, "{} of {} matches failed", failed, inputs.size());
		return kExitInputFailed;
	}

	Logf(LogLevel::Info, "{} matches analyzed, {} warnings", inputs.size(), LoggedCount(LogLevel::Warn));
	return kExitOk;
}
