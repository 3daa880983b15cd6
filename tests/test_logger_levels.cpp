#include "shared/logger.hpp"

#include <atomic>
#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace fragline;

namespace {

std::mutex g_sinkMutex;
std::vector<std::string> g_printed;
std::vector<std::string> g_errors;

void ClearSinks()
{
	std::scoped_lock lock(g_sinkMutex);
	g_printed.clear();
	g_errors.clear();
}

/*
=============
LevelParsing
=============
*/
void LevelParsing()
{
	assert(ParseLogLevel("trace") == LogLevel::Trace);
	assert(ParseLogLevel("DEBUG") == LogLevel::Debug);
	assert(ParseLogLevel("Warning") == LogLevel::Warn);
	assert(ParseLogLevel("warn") == LogLevel::Warn);
	assert(ParseLogLevel("error") == LogLevel::Error);
	assert(ParseLogLevel("unknown") == LogLevel::Info);
	assert(std::string(LogLevelLabel(LogLevel::Warn)) == "WARN");

	setenv("FRAGLINE_LOG_LEVEL", "error", 1);
	assert(ReadLogLevelFromEnv(LogLevel::Debug) == LogLevel::Error);
	setenv("FRAGLINE_LOG_LEVEL", "", 1);
	assert(ReadLogLevelFromEnv(LogLevel::Debug) == LogLevel::Debug);
	unsetenv("FRAGLINE_LOG_LEVEL");
	assert(ReadLogLevelFromEnv() == LogLevel::Info);
}

void MessageFormat()
{
	assert(FormatMessage(LogLevel::Info, "replay", "ready") == "[FRAGLINE][replay] [INFO] ready\n");
	assert(FormatMessage(LogLevel::Error, "replay", "boom\n") == "[FRAGLINE][replay] [ERROR] boom\n");
}

/*
=============
FilteringAndRouting

Messages below the active level are dropped; errors go to the error sink.
=============
*/
void FilteringAndRouting()
{
	ClearSinks();
	SetLogLevel(LogLevel::Warn);
	assert(GetLogLevel() == LogLevel::Warn);
	assert(!IsLogLevelEnabled(LogLevel::Info));
	assert(IsLogLevelEnabled(LogLevel::Error));

	Log(LogLevel::Info, "hidden");
	Log(LogLevel::Warn, "shown");
	Logf(LogLevel::Error, "game ", 3, " failed after ", 2.5, " min");

	std::scoped_lock lock(g_sinkMutex);
	assert(g_printed.size() == 1);
	assert(g_printed[0] == "[FRAGLINE][levels] [WARN] shown\n");
	assert(g_errors.size() == 1);
	assert(g_errors[0] == "[FRAGLINE][levels] [ERROR] game 3 failed after 2.5 min\n");
}

/*
=============
ContextIsPerThread

A context label applies to the thread that set it and nests.
=============
*/
void ContextIsPerThread()
{
	ClearSinks();
	SetLogLevel(LogLevel::Info);

	{
		const ScopedLogContext outer("first.log");
		assert(CurrentLogContext() == "first.log");
		Log(LogLevel::Info, "outer");
		{
			const ScopedLogContext inner("second.log");
			Log(LogLevel::Info, "inner");
		}
		std::thread other([]() { Log(LogLevel::Info, "other"); });
		other.join();
		Log(LogLevel::Info, "outer again");
	}
	assert(CurrentLogContext().empty());
	Log(LogLevel::Info, "plain");

	std::scoped_lock lock(g_sinkMutex);
	assert(g_printed.size() == 5);
	assert(g_printed[0] == "[FRAGLINE][levels:first.log] [INFO] outer\n");
	assert(g_printed[1] == "[FRAGLINE][levels:second.log] [INFO] inner\n");
	assert(g_printed[2] == "[FRAGLINE][levels] [INFO] other\n");
	assert(g_printed[3] == "[FRAGLINE][levels:first.log] [INFO] outer again\n");
	assert(g_printed[4] == "[FRAGLINE][levels] [INFO] plain\n");
}

/*
=============
ConcurrentLogging

Independent replays log from their own threads while the level changes.
=============
*/
void ConcurrentLogging()
{
	ClearSinks();
	SetLogLevel(LogLevel::Debug);

	constexpr int kThreads = 8;
	constexpr int kIterations = 50;

	std::atomic<bool> running{ true };
	std::thread toggler([&]() {
		for (int i = 0; i < kThreads * kIterations; ++i)
			SetLogLevel((i % 2 == 0) ? LogLevel::Debug : LogLevel::Info);
		running = false;
	});

	std::vector<std::thread> workers;
	workers.reserve(kThreads);
	for (int i = 0; i < kThreads; ++i) {
		workers.emplace_back([i]() {
			for (int j = 0; j < kIterations; ++j) {
				Logf(LogLevel::Info, "worker ", i, " line ", j);
				Log(LogLevel::Error, "worker error");
			}
		});
	}

	for (auto& worker : workers)
		worker.join();
	toggler.join();
	assert(!running.load());

	std::scoped_lock lock(g_sinkMutex);
	assert(static_cast<int>(g_printed.size()) == kThreads * kIterations);
	assert(static_cast<int>(g_errors.size()) == kThreads * kIterations);
	for (const auto& message : g_printed)
		assert(message.rfind("[FRAGLINE][levels] [INFO] worker ", 0) == 0);
	for (const auto& message : g_errors)
		assert(message.rfind("[FRAGLINE][levels]", 0) == 0);
}

} // namespace

/*
=============
main
=============
*/
int main()
{
	LevelParsing();
	MessageFormat();

	InitLogger("levels", [](std::string_view message) {
		std::scoped_lock lock(g_sinkMutex);
		g_printed.emplace_back(message);
	}, [](std::string_view message) {
		std::scoped_lock lock(g_sinkMutex);
		g_errors.emplace_back(message);
	});

	FilteringAndRouting();
	ContextIsPerThread();
	ConcurrentLogging();
	return 0;
}
