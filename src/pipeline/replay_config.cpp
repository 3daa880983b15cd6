#include "replay_config.hpp"

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <istream>
#include <sstream>

namespace fragline {
namespace {

/*
=============
ReadSize

Copies a non-negative integer key into target. Any other type leaves the
default in place.
=============
*/
void ReadSize(const Json::Value& root, const char* key, size_t& target)
{
	if (!root.isMember(key))
		return;

	const Json::Value& value = root[key];
	if (!value.isUInt64()) {
		Logf(LogLevel::Warn, "Config key '", key, "' must be a non-negative integer; keeping ", target);
		return;
	}

	target = static_cast<size_t>(value.asUInt64());
}

void ReadBool(const Json::Value& root, const char* key, bool& target)
{
	if (!root.isMember(key))
		return;

	const Json::Value& value = root[key];
	if (!value.isBool()) {
		Logf(LogLevel::Warn, "Config key '", key, "' must be a boolean; keeping ", target ? "true" : "false");
		return;
	}

	target = value.asBool();
}

void ReadLevel(const Json::Value& root, const char* key, LogLevel& target)
{
	if (!root.isMember(key))
		return;

	const Json::Value& value = root[key];
	if (!value.isString()) {
		Logf(LogLevel::Warn, "Config key '", key, "' must be a string; keeping ", LogLevelLabel(target));
		return;
	}

	target = ParseLogLevel(value.asString());
}

std::optional<ReplayConfig> ParseConfigStream(std::istream& in, const std::string& origin)
{
	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;
	if (!Json::parseFromStream(builder, in, &root, &errs)) {
		Logf(LogLevel::Error, "Config parse error in ", origin, ": ", errs);
		return std::nullopt;
	}

	if (!root.isObject()) {
		Logf(LogLevel::Error, "Config ", origin, " must contain a JSON object");
		return std::nullopt;
	}

	ReplayConfig config;
	ReadSize(root, "accolade_threshold", config.accoladeThreshold);
	ReadSize(root, "round_stats_lookahead", config.roundStatsLookahead);
	ReadBool(root, "skip_bot_only_events", config.skipBotOnlyEvents);
	ReadLevel(root, "log_level", config.logLevel);
	return config;
}

} // namespace

/*
=============
LoadReplayConfig
=============
*/
std::optional<ReplayConfig> LoadReplayConfig(const std::string& path)
{
	std::ifstream in(path);
	if (!in.is_open()) {
		Logf(LogLevel::Error, "Failed to open config file ", path);
		return std::nullopt;
	}

	return ParseConfigStream(in, path);
}

std::optional<ReplayConfig> ReplayConfigFromJsonText(const std::string& text)
{
	std::istringstream in(text);
	return ParseConfigStream(in, "<memory>");
}

void ApplyEnvironmentOverrides(ReplayConfig& config)
{
	config.logLevel = ReadLogLevelFromEnv(config.logLevel);
}

} // namespace fragline
