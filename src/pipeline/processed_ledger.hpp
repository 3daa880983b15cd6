// processed_ledger.hpp (Already-Processed Ledger)
// File-backed record of the (event type, timestamp) keys that earlier runs
// ingested. The replay consults it before opening a game so that running
// over the same log twice emits every game once.

#pragma once

#include "../parser/event_sink.hpp"
#include "../parser/events.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <utility>

namespace fragline {

class ProcessedLedger final : public ProcessedEventGate {
public:
	bool AlreadyProcessed(EventType type, Timestamp timestamp) const override;

	// Returns false when the key was already present.
	bool MarkProcessed(EventType type, Timestamp timestamp);

	size_t Size() const { return entries_.size(); }
	bool Empty() const { return entries_.empty(); }

	/*
	=============
	Load

	Merges the keys stored in a ledger file. A missing file is an empty
	ledger and succeeds; unreadable or malformed files fail. Entries with an
	unknown type or a bad timestamp are skipped with a warning.
	=============
	*/
	bool Load(const std::string& path);

	bool Save(const std::string& path) const;

private:
	using Key = std::pair<EventType, Timestamp>;

	std::set<Key> entries_;
};

} // namespace fragline
