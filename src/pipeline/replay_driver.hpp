#pragma once

#include "../parser/event_sink.hpp"
#include "../parser/events.hpp"
#include "../parser/replay_state_machine.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fragline {

struct DriverOptions {
	// Drop kill, assist and attack events whose two players are both bots.
	bool skipBotOnlyEvents = true;
};

struct ReplaySummary {
	size_t linesVisited = 0;
	size_t rewinds = 0;
	size_t gamesOpened = 0;
	size_t gamesClosed = 0;
	size_t botOnlyDropped = 0;
	std::array<size_t, static_cast<size_t>(EventType::Total)> eventsByType{};

	size_t EventsOf(EventType type) const { return eventsByType[static_cast<size_t>(type)]; }
	size_t TotalEvents() const;
};

/*
=============
ReplayLogLines

Runs the state machine over the whole buffer starting at index 0. The
returned nextIndex is honored exactly, so accepted games are rewound and
replayed. Every emitted event that survives the bot filter goes to sink.
=============
*/
ReplaySummary ReplayLogLines(const std::vector<std::string>& lines, ReplayStateMachine& machine, EventSink& sink, const DriverOptions& options = {});

/*
=============
ReadLogFile

Loads every line of a log file in order, stripping a trailing carriage
return. Returns std::nullopt when the file cannot be read.
=============
*/
std::optional<std::vector<std::string>> ReadLogFile(const std::string& path);

} // namespace fragline
