#include "replay_driver.hpp"

#include "../shared/logger.hpp"

#include <fstream>
#include <numeric>

namespace fragline {

size_t ReplaySummary::TotalEvents() const
{
	return std::accumulate(eventsByType.begin(), eventsByType.end(), size_t{ 0 });
}

/*
=============
ReplayLogLines
=============
*/
ReplaySummary ReplayLogLines(const std::vector<std::string>& lines, ReplayStateMachine& machine, EventSink& sink, const DriverOptions& options)
{
	ReplaySummary summary;
	Logf(LogLevel::Info, "Replaying ", lines.size(), " lines");

	size_t index = 0;
	while (index < lines.size()) {
		++summary.linesVisited;

		auto result = machine.ParseLine(lines[index], lines, index);
		if (!result) {
			++index;
			continue;
		}

		const EventType type = EventTypeOf(result->event);
		if (result->nextIndex <= index)
			++summary.rewinds;
		if (type == EventType::GameOver)
			++summary.gamesOpened;
		else if (type == EventType::GameProcessed)
			++summary.gamesClosed;

		if (options.skipBotOnlyEvents && IsBotOnlyAction(result->event)) {
			++summary.botOnlyDropped;
		}
		else {
			++summary.eventsByType[static_cast<size_t>(type)];
			sink.OnEvent(result->event);
		}

		index = result->nextIndex;
	}

	Logf(LogLevel::Info, "Replay finished: ", summary.linesVisited, " lines visited, ", summary.gamesOpened,
		" games, ", summary.TotalEvents(), " events, ", summary.botOnlyDropped, " bot-only events dropped");
	return summary;
}

/*
=============
ReadLogFile
=============
*/
std::optional<std::vector<std::string>> ReadLogFile(const std::string& path)
{
	std::ifstream in(path, std::ios::binary);
	if (!in.is_open()) {
		Logf(LogLevel::Error, "Failed to open log file ", path);
		return std::nullopt;
	}

	std::vector<std::string> lines;
	std::string line;
	while (std::getline(in, line)) {
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		lines.push_back(std::move(line));
		line.clear();
	}

	if (in.bad()) {
		Logf(LogLevel::Error, "Read error in log file ", path);
		return std::nullopt;
	}

	Logf(LogLevel::Debug, "Loaded ", lines.size(), " lines from ", path);
	return lines;
}

} // namespace fragline
