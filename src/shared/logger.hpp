#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace fragline {
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

	Parse the provided text value into a LogLevel.
	=============
	*/
	LogLevel ParseLogLevel(std::string_view value);

	/*
	=============
	ReadLogLevelFromEnv

	Retrieve the log level from FRAGLINE_LOG_LEVEL or return the fallback.
	=============
	*/
	LogLevel ReadLogLevelFromEnv(LogLevel fallback = LogLevel::Info);

	/*
	=============
	LevelWeight

	Assign a numeric weight to a log level for comparison.
	=============
	*/
	int LevelWeight(LogLevel level);

	/*
	=============
	FormatMessage

	Build a structured log message for output.
	=============
	*/
	std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message);

	/*
	=============
	InitLogger

	Initialize the logger with module metadata and output sinks.
	=============
	*/
	void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink);

	/*
	=============
	SetLogLevel

	Override the current logging level programmatically.
	=============
	*/
	void SetLogLevel(LogLevel level);

	/*
	=============
	GetLogLevel

	Fetch the currently active log level.
	=============
	*/
	LogLevel GetLogLevel();

	/*
	=============
	IsLogLevelEnabled

	Return whether the provided log level should emit output.
	=============
	*/
	bool IsLogLevelEnabled(LogLevel level);

	/*
	=============
	Log

	Log a pre-formatted message if the level is enabled. Error messages are
	also forwarded to the error sink.
	=============
	*/
	void Log(LogLevel level, std::string_view message);

	/*
	=============
	Logf

	Stream the arguments into one message and log it if the level is enabled.
	Call sites pass the message pieces in order, not a format string: the
	toolchain this builds with ships no <format>, so the arguments are folded
	through an ostringstream.
	=============
	*/
	template<typename... Args>
	inline void Logf(LogLevel level, Args &&... args)
	{
		if (!IsLogLevelEnabled(level))
			return;

		std::ostringstream stream;
		(stream << ... << std::forward<Args>(args));
		Log(level, stream.str());
	}

	/*
	=============
	ScopedLogContext

	Tags every message logged on the current thread with a context label,
	such as the log file a replay job works on, for the lifetime of the
	scope. Scopes nest and restore the previous label on exit.
	=============
	*/
	class ScopedLogContext {
	public:
		explicit ScopedLogContext(std::string context);
		~ScopedLogContext();

		ScopedLogContext(const ScopedLogContext&) = delete;
		ScopedLogContext& operator=(const ScopedLogContext&) = delete;

	private:
		std::string previous_;
	};

	std::string_view CurrentLogContext();

	/*
	=============
	LogLevelLabel

	Provide a short string label for the supplied log level.
	=============
	*/
	const char* LogLevelLabel(LogLevel level);

} // namespace fragline
