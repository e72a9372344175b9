#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace roundstat {
	enum class LogLevel {
	Trace = 0,
	Debug,
	Info,
	Warn,
	Error
	};

	using LogSink = std::function<void(std::string_view)>;

	/*
	=============
	ParseLogLevel

	Parse an environment or --log-level value. Unknown names map to Info.
	=============
	*/
	LogLevel ParseLogLevel(std::string_view value);

	/*
	=============
	ReadLogLevelFromEnv

	Retrieve the log level from ROUNDSTAT_LOG_LEVEL or return Info.
	=============
	*/
	LogLevel ReadLogLevelFromEnv();

	const char* LogLevelLabel(LogLevel level);

	/*
	=============
	FormatMessage

	Build one output line: "[ROUNDSTAT][module] [LEVEL] match: message\n".
	The match part is left out when match_id is empty.
	=============
	*/
	std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view match_id, std::string_view message);

	/*
	=============
	InitLogger

	Install the module name and sinks, read the level from the environment and
	clear the emitted-message tallies. A null sink discards its messages.
	=============
	*/
	void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink);

	void SetLogLevel(LogLevel level);
	LogLevel GetLogLevel();
	bool IsLogLevelEnabled(LogLevel level);

	/*
	=============
	LoggedCount

	Number of messages emitted at the given level since InitLogger. Filtered
	messages are not counted.
	=============
	*/
	size_t LoggedCount(LogLevel level);

	/*
	=============
	MatchLogScope

	Tags every message logged on the current thread with a match id until the
	scope ends. Scopes nest; the previous tag is restored on destruction.
	=============
	*/
	class MatchLogScope {
	public:
		explicit MatchLogScope(std::string match_id);
		~MatchLogScope();

		MatchLogScope(const MatchLogScope&) = delete;
		MatchLogScope& operator=(const MatchLogScope&) = delete;

	private:
		std::string _previous;
	};

	std::string_view CurrentMatchScope();

	/*
	=============
	Log

	Log a pre-formatted message if the level is enabled. Error messages are
	routed to the error sink, everything else to the print sink.
	=============
	*/
	void Log(LogLevel level, std::string_view message);

	template<typename... Args>
	inline void Logf(LogLevel level, fmt::format_string<Args...> format_str, Args &&... args)
	{
		if (!IsLogLevelEnabled(level))
			return;

		Log(level, fmt::format(format_str, std::forward<Args>(args)...));
	}

} // namespace roundstat
