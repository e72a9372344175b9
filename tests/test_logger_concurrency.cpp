#include "shared/logger.hpp"

#include <cassert>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace roundstat;

/*
=============
main

Several workers analyze their own match at once. Every line must carry the
match id of the thread that logged it, and the tallies must add up.
=============
*/
int main()
{
	std::mutex sink_mutex;
	std::vector<std::string> printed;
	std::vector<std::string> errors;

	InitLogger("workers", [&](std::string_view message) {
		std::lock_guard lock(sink_mutex);
		printed.emplace_back(message);
	}, [&](std::string_view message) {
		std::lock_guard lock(sink_mutex);
		errors.emplace_back(message);
	});
	SetLogLevel(LogLevel::Info);

	constexpr int kMatches = 6;
	constexpr int kRounds = 30;

	std::vector<std::thread> workers;
	workers.reserve(kMatches);
	for (int i = 0; i < kMatches; ++i) {
		workers.emplace_back([i]() {
			const MatchLogScope scope("match_" + std::to_string(i));
			for (int round = 1; round <= kRounds; ++round) {
				Logf(LogLevel::Warn, "round {} owner=match_{}", round, i);
				Logf(LogLevel::Debug, "round {} filtered", round);
			}
			Log(LogLevel::Error, "writer failed");
		});
	}
	for (std::thread& worker : workers)
		worker.join();

	assert(static_cast<int>(printed.size()) == kMatches * kRounds);
	assert(static_cast<int>(errors.size()) == kMatches);
	assert(LoggedCount(LogLevel::Warn) == static_cast<size_t>(kMatches * kRounds));
	assert(LoggedCount(LogLevel::Error) == static_cast<size_t>(kMatches));
	assert(LoggedCount(LogLevel::Debug) == 0);

	std::map<std::string, int> perMatch;
	for (const std::string& line : printed) {
		const std::string prefix = "[ROUNDSTAT][workers] [WARN] ";
		assert(line.rfind(prefix, 0) == 0);
		const size_t colon = line.find(':', prefix.size());
		assert(colon != std::string::npos);
		const std::string matchId = line.substr(prefix.size(), colon - prefix.size());
		assert(line.find("owner=" + matchId + "\n") != std::string::npos);
		++perMatch[matchId];
	}
	assert(static_cast<int>(perMatch.size()) == kMatches);
	for (const auto& [matchId, count] : perMatch)
		assert(count == kRounds);

	for (const std::string& line : errors)
		assert(line.find("] [ERROR] match_") != std::string::npos);

	// the main thread never entered a scope
	assert(CurrentMatchScope().empty());

	return 0;
}
