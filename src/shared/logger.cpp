/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

logger.cpp implementation.*/

#include "logger.hpp"

#include "text_utils.hpp"

#include <array>
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <string>
#include <string_view>

namespace roundstat {
namespace {

constexpr size_t kLevelCount = static_cast<size_t>(LogLevel::Error) + 1;

struct LoggerConfig {
	std::string module_name = "roundstat";
	LogSink print_sink;
	LogSink error_sink;
};

std::mutex g_logger_mutex;
LoggerConfig g_config;
std::atomic<LogLevel> g_log_level = LogLevel::Info;
std::array<std::atomic<size_t>, kLevelCount> g_logged{};

thread_local std::string t_match_scope;

size_t LevelIndex(LogLevel level)
{
	const size_t index = static_cast<size_t>(level);
	return index < kLevelCount ? index : kLevelCount - 1;
}

/*
=============
SnapshotConfig

Copy the sinks under the lock; they are called without it.
=============
*/
LoggerConfig SnapshotConfig()
{
	std::scoped_lock lock(g_logger_mutex);
	return g_config;
}

} // namespace

LogLevel ParseLogLevel(std::string_view value)
{
	const std::string upper = ToUpperCopy(value);

	if (upper == "TRACE")
		return LogLevel::Trace;
	if (upper == "DEBUG")
		return LogLevel::Debug;
	if (upper == "WARN" || upper == "WARNING")
		return LogLevel::Warn;
	if (upper == "ERROR")
		return LogLevel::Error;

	return LogLevel::Info;
}

LogLevel ReadLogLevelFromEnv()
{
	const char* env_value = std::getenv("ROUNDSTAT_LOG_LEVEL");
	if (!env_value)
		return LogLevel::Info;

	return ParseLogLevel(env_value);
}

const char* LogLevelLabel(LogLevel level)
{
	static constexpr std::array<const char*, kLevelCount> labels{ "TRACE", "DEBUG", "INFO", "WARN", "ERROR" };
	return labels[LevelIndex(level)];
}

std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view match_id, std::string_view message)
{
	std::string formatted = match_id.empty()
		? fmt::format("[ROUNDSTAT][{}] [{}] {}", module_name, LogLevelLabel(level), message)
		: fmt::format("[ROUNDSTAT][{}] [{}] {}: {}", module_name, LogLevelLabel(level), match_id, message);
	if (formatted.back() != '\n')
		formatted.push_back('\n');

	return formatted;
}

void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink)
{
	{
		std::scoped_lock lock(g_logger_mutex);
		g_config.module_name = module_name;
		g_config.print_sink = std::move(print_sink);
		g_config.error_sink = std::move(error_sink);
	}

	for (std::atomic<size_t>& count : g_logged)
		count.store(0, std::memory_order_relaxed);
	g_log_level.store(ReadLogLevelFromEnv(), std::memory_order_relaxed);
}

void SetLogLevel(LogLevel level)
{
	g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
	return g_log_level.load(std::memory_order_relaxed);
}

bool IsLogLevelEnabled(LogLevel level)
{
	return LevelIndex(level) >= LevelIndex(g_log_level.load(std::memory_order_relaxed));
}

size_t LoggedCount(LogLevel level)
{
	return g_logged[LevelIndex(level)].load(std::memory_order_relaxed);
}

MatchLogScope::MatchLogScope(std::string match_id)
	: _previous(std::exchange(t_match_scope, std::move(match_id)))
{
}

MatchLogScope::~MatchLogScope()
{
	t_match_scope = std::move(_previous);
}

std::string_view CurrentMatchScope()
{
	return t_match_scope;
}

/*
=============
Log

Filtered messages return before the sinks are copied and are not tallied.
=============
*/
void Log(LogLevel level, std::string_view message)
{
	if (!IsLogLevelEnabled(level))
		return;

	const LoggerConfig config = SnapshotConfig();
	const std::string formatted = FormatMessage(level, config.module_name, t_match_scope, message);
	g_logged[LevelIndex(level)].fetch_add(1, std::memory_order_relaxed);

	const LogSink& sink = level == LogLevel::Error ? config.error_sink : config.print_sink;
	if (sink)
		sink(formatted);
}

} // namespace roundstat
