// json_event_writer.hpp (JSON-Lines Output)
// Writes every emitted event and every accepted accolade batch as one
// compact JSON object per line. Players are written as
//   {"name":..., "slot":..., "steam_id":... | null, "team":..., "bot":...}
// and kill, attack and assist events always carry attacker_position and
// victim_position keys (null for assists).

#pragma once

#include "../parser/event_sink.hpp"
#include "../parser/events.hpp"

#include <json/json.h>

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <vector>

namespace fragline {

class ProcessedLedger;

Json::Value EventToJson(const ParsedEvent& event);
Json::Value AccoladeToJson(const AccoladeRecord& accolade);

class JsonLinesEventSink final : public EventSink, public AccoladeSink {
public:
	// ledger may be null; when set, each written GAME_OVER is marked in it.
	JsonLinesEventSink(std::ostream& out, ProcessedLedger* ledger = nullptr);

	void OnEvent(const ParsedEvent& event) override;
	void QueueAccolades(std::vector<AccoladeRecord> accolades) override;

	size_t EventsWritten() const { return eventsWritten_; }
	size_t AccoladesWritten() const { return accoladesWritten_; }

private:
	void WriteLine(const Json::Value& value);

	std::ostream& out_;
	ProcessedLedger* ledger_;
	std::unique_ptr<Json::StreamWriter> writer_;
	size_t eventsWritten_ = 0;
	size_t accoladesWritten_ = 0;
};

} // namespace fragline
