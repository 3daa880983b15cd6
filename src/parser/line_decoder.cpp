#include "line_decoder.hpp"

#include "log_time.hpp"
#include "../shared/string_utils.hpp"

#include <json/json.h>

#include <memory>

namespace fragline {
namespace {

/*
=============
EnvelopeReader

Per-thread jsoncpp reader so repeated decoding during backward scans does
not rebuild the reader for every line.
=============
*/
Json::CharReader& EnvelopeReader()
{
	thread_local std::unique_ptr<Json::CharReader> reader = [] {
		Json::CharReaderBuilder builder;
		builder["collectComments"] = false;
		return std::unique_ptr<Json::CharReader>(builder.newCharReader());
	}();
	return *reader;
}

void SetError(DecodeError* error, DecodeError value)
{
	if (error)
		*error = value;
}

} // namespace

std::optional<LogEnvelope> DecodeEnvelope(std::string_view raw, DecodeError* error)
{
	const std::string_view trimmed = TrimView(raw);
	if (trimmed.empty() || trimmed.front() != '{') {
		SetError(error, DecodeError::NotJson);
		return std::nullopt;
	}

	Json::Value root;
	std::string errs;
	if (!EnvelopeReader().parse(trimmed.data(), trimmed.data() + trimmed.size(), &root, &errs)) {
		SetError(error, DecodeError::NotJson);
		return std::nullopt;
	}

	if (!root.isObject()) {
		SetError(error, DecodeError::NotObject);
		return std::nullopt;
	}

	const Json::Value& log = root["log"];
	if (!log.isString()) {
		SetError(error, DecodeError::MissingContent);
		return std::nullopt;
	}

	const std::string content = log.asString();
	const auto nonEmpty = TrimNonEmpty(content);
	if (!nonEmpty) {
		SetError(error, DecodeError::EmptyContent);
		return std::nullopt;
	}

	LogEnvelope envelope;
	const Json::Value& time = root["time"];
	if (time.isString())
		envelope.time = time.asString();

	// Leading whitespace is kept so the sentinel check stays exact.
	const size_t end = content.find_last_not_of(" \t\r\n");
	envelope.content = content.substr(0, end + 1);
	return envelope;
}

std::optional<DecodedLine> DecodeLine(std::string_view raw, size_t index, DecodeError* error)
{
	auto envelope = DecodeEnvelope(raw, error);
	if (!envelope)
		return std::nullopt;

	if (!HasLogSentinel(envelope->content)) {
		SetError(error, DecodeError::MissingSentinel);
		return std::nullopt;
	}

	const auto timestamp = ParseIsoTimestamp(envelope->time);
	if (!timestamp) {
		SetError(error, DecodeError::MissingTimestamp);
		return std::nullopt;
	}

	DecodedLine line;
	line.index = index;
	line.timestamp = *timestamp;
	line.timeText = std::move(envelope->time);
	line.text = std::move(envelope->content);
	return line;
}

bool HasLogSentinel(std::string_view content)
{
	return content.substr(0, kLogSentinel.size()) == kLogSentinel;
}

std::string_view DecodeErrorName(DecodeError error)
{
	switch (error) {
	case DecodeError::NotJson:
		return "not_json";
	case DecodeError::NotObject:
		return "not_object";
	case DecodeError::MissingContent:
		return "missing_content";
	case DecodeError::EmptyContent:
		return "empty_content";
	case DecodeError::MissingTimestamp:
		return "missing_timestamp";
	case DecodeError::MissingSentinel:
	default:
		return "missing_sentinel";
	}
}

} // namespace fragline
