// line_decoder.hpp (Log Envelope Decoding)
// Server logs arrive one JSON object per line, for example
//   {"time":"2024-04-20T17:54:00Z","log":"L 04/20/2024 - 17:54:00: ..."}
// and the decoder unwraps the object into the raw server log text.

#pragma once

#include "events.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fragline {

inline constexpr std::string_view kLogSentinel = "L ";

enum class DecodeError : uint8_t {
	NotJson,
	NotObject,
	MissingContent,
	EmptyContent,
	MissingTimestamp,
	MissingSentinel
};

struct LogEnvelope {
	std::string time;
	// Content of the "log" field with trailing whitespace removed.
	std::string content;
};

struct DecodedLine {
	size_t index = 0;
	Timestamp timestamp{};
	std::string timeText;
	std::string text;
};

/*
=============
DecodeEnvelope

Unwraps the JSON object without judging its content. Used for metadata
lines that do not carry the "L " prefix and for look-ahead scans.
=============
*/
std::optional<LogEnvelope> DecodeEnvelope(std::string_view raw, DecodeError* error = nullptr);

/*
=============
DecodeLine

Unwraps the JSON object and accepts it only when the content is a server
log line ("L " prefix) and the "time" field is a valid ISO-8601 stamp.
=============
*/
std::optional<DecodedLine> DecodeLine(std::string_view raw, size_t index, DecodeError* error = nullptr);

bool HasLogSentinel(std::string_view content);

std::string_view DecodeErrorName(DecodeError error);

} // namespace fragline
