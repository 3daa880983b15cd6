#pragma once

#include "events.hpp"

#include <vector>

namespace fragline {

/*
=================
EventSink

Receives every event the replay emits, in emission order. Attaching events
to stored games and rounds is the implementation's concern.
=================
*/
class EventSink {
public:
	virtual ~EventSink() = default;

	virtual void OnEvent(const ParsedEvent& event) = 0;
};

/*
=================
AccoladeSink

Receives the accolades of a game once its GAME_OVER has been accepted, as
one batch per game.
=================
*/
class AccoladeSink {
public:
	virtual ~AccoladeSink() = default;

	virtual void QueueAccolades(std::vector<AccoladeRecord> accolades) = 0;
};

/*
=================
ProcessedEventGate

Read-only lookup answering whether an event with this type and timestamp
was already ingested in an earlier run.
=================
*/
class ProcessedEventGate {
public:
	virtual ~ProcessedEventGate() = default;

	virtual bool AlreadyProcessed(EventType type, Timestamp timestamp) const = 0;
};

} // namespace fragline
