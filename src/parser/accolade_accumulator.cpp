#include "accolade_accumulator.hpp"

#include "event_matchers.hpp"
#include "line_decoder.hpp"
#include "../shared/logger.hpp"

#include <algorithm>

namespace fragline {

AccoladeAccumulator::AccoladeAccumulator(size_t threshold)
	: threshold_(threshold) {}

/*
=============
AccoladeAccumulator::Collect
=============
*/
std::vector<AccoladeRecord> AccoladeAccumulator::Collect(const std::vector<std::string>& lines, size_t start, size_t end) const
{
	std::vector<AccoladeRecord> accolades;
	end = std::min(end, lines.size());

	for (size_t i = start; i < end; ++i) {
		const auto line = DecodeLine(lines[i], i);
		if (!line || line->text.find("ACCOLADE") == std::string::npos)
			continue;

		auto record = AccoladeMatcher::Parse(*line);
		if (!record) {
			Logf(LogLevel::Debug, "Accolade line ", i, " did not match the grammar: ", line->text);
			continue;
		}

		Logf(LogLevel::Trace, "Parsed accolade type=", record->type, " player=", record->playerName,
			" value=", record->value, " pos=", record->position, " score=", record->score);
		accolades.push_back(std::move(*record));
	}

	return accolades;
}

bool AccoladeAccumulator::IsComplete(const std::vector<AccoladeRecord>& accolades) const
{
	return accolades.size() >= threshold_;
}

} // namespace fragline
