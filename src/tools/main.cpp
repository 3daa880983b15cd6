// main.cpp (fragline-replay)
// Replays one CS2 JSON-lines server log and writes the recovered events as
// JSON lines.
//
//   fragline-replay [--config FILE] [--ledger FILE] [--output FILE] [--version] LOGFILE
//
// Exit codes: 0 success, 1 bad usage, 2 I/O or configuration failure.

#include "pipeline/json_event_writer.hpp"
#include "pipeline/processed_ledger.hpp"
#include "pipeline/replay_config.hpp"
#include "pipeline/replay_driver.hpp"
#include "parser/replay_state_machine.hpp"
#include "shared/logger.hpp"
#include "shared/version.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

struct CommandLine {
	std::optional<std::string> configPath;
	std::optional<std::string> ledgerPath;
	std::optional<std::string> outputPath;
	std::string logPath;
	bool showVersion = false;
};

void PrintUsage(std::ostream& out)
{
	out << "usage: fragline-replay [--config FILE] [--ledger FILE] [--output FILE] [--version] LOGFILE\n";
}

/*
=============
ParseCommandLine

Returns std::nullopt on unknown flags, a flag missing its value, or a
missing or repeated LOGFILE.
=============
*/
std::optional<CommandLine> ParseCommandLine(int argc, char** argv)
{
	CommandLine cmd;
	bool haveLog = false;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];

		auto takeValue = [&](std::optional<std::string>& target) {
			if (i + 1 >= argc) {
				std::cerr << "fragline-replay: " << arg << " needs a value\n";
				return false;
			}
			target = argv[++i];
			return true;
		};

		if (arg == "--version") {
			cmd.showVersion = true;
		}
		else if (arg == "--config") {
			if (!takeValue(cmd.configPath))
				return std::nullopt;
		}
		else if (arg == "--ledger") {
			if (!takeValue(cmd.ledgerPath))
				return std::nullopt;
		}
		else if (arg == "--output" || arg == "-o") {
			if (!takeValue(cmd.outputPath))
				return std::nullopt;
		}
		else if (arg == "--help" || arg == "-h") {
			return std::nullopt;
		}
		else if (!arg.empty() && arg.front() == '-') {
			std::cerr << "fragline-replay: unknown option " << arg << '\n';
			return std::nullopt;
		}
		else if (haveLog) {
			std::cerr << "fragline-replay: only one LOGFILE is accepted\n";
			return std::nullopt;
		}
		else {
			cmd.logPath = std::string(arg);
			haveLog = true;
		}
	}

	if (!haveLog && !cmd.showVersion)
		return std::nullopt;

	return cmd;
}

} // namespace

int main(int argc, char** argv)
{
	using namespace fragline;

	InitLogger("replay",
		[](std::string_view message) { std::cerr << message; },
		[](std::string_view message) { std::cerr << message; });

	const auto cmd = ParseCommandLine(argc, argv);
	if (!cmd) {
		PrintUsage(std::cerr);
		return kExitUsage;
	}

	if (cmd->showVersion) {
		std::cout << version::kToolTitle << ' ' << version::kToolVersion << '\n';
		return kExitOk;
	}

	ReplayConfig config;
	if (cmd->configPath) {
		auto loaded = LoadReplayConfig(*cmd->configPath);
		if (!loaded)
			return kExitFailure;
		config = *loaded;
	}
	ApplyEnvironmentOverrides(config);
	SetLogLevel(config.logLevel);

	ProcessedLedger ledger;
	if (cmd->ledgerPath && !ledger.Load(*cmd->ledgerPath))
		return kExitFailure;

	const ScopedLogContext logContext(std::filesystem::path(cmd->logPath).filename().string());

	const auto lines = ReadLogFile(cmd->logPath);
	if (!lines)
		return kExitFailure;

	std::ofstream file;
	if (cmd->outputPath) {
		file.open(*cmd->outputPath, std::ios::trunc);
		if (!file.is_open()) {
			Logf(LogLevel::Error, "Failed to open output file ", *cmd->outputPath);
			return kExitFailure;
		}
	}
	std::ostream& out = cmd->outputPath ? static_cast<std::ostream&>(file) : std::cout;

	JsonLinesEventSink sink(out, &ledger);
	ReplayOptions replayOptions;
	replayOptions.accoladeThreshold = config.accoladeThreshold;
	replayOptions.roundStatsLookahead = config.roundStatsLookahead;
	ReplayStateMachine machine(ledger, sink, replayOptions);

	DriverOptions driverOptions;
	driverOptions.skipBotOnlyEvents = config.skipBotOnlyEvents;
	const ReplaySummary summary = ReplayLogLines(*lines, machine, sink, driverOptions);

	out.flush();
	if (!out) {
		Log(LogLevel::Error, "Failed to write event output");
		return kExitFailure;
	}

	for (size_t i = 0; i < static_cast<size_t>(EventType::Total); ++i) {
		const auto type = static_cast<EventType>(i);
		if (summary.EventsOf(type))
			Logf(LogLevel::Info, EventTypeName(type), ": ", summary.EventsOf(type));
	}
	Logf(LogLevel::Info, "Rewinds: ", summary.rewinds, ", accolades written: ", sink.AccoladesWritten());

	if (cmd->ledgerPath && !ledger.Save(*cmd->ledgerPath))
		return kExitFailure;

	return kExitOk;
}
