#pragma once

#include "../shared/logger.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace fragline {

struct ReplayConfig {
	size_t accoladeThreshold = 6;
	size_t roundStatsLookahead = 64;
	bool skipBotOnlyEvents = true;
	LogLevel logLevel = LogLevel::Info;
};

/*
=============
LoadReplayConfig

Reads a JSON object with the keys accolade_threshold, round_stats_lookahead,
skip_bot_only_events and log_level. Missing keys keep their defaults and
keys of the wrong type keep their defaults with a warning. Returns
std::nullopt when the file cannot be opened or parsed.
=============
*/
std::optional<ReplayConfig> LoadReplayConfig(const std::string& path);

/*
=============
ReplayConfigFromJsonText

Same rules as LoadReplayConfig applied to an in-memory document.
=============
*/
std::optional<ReplayConfig> ReplayConfigFromJsonText(const std::string& text);

/*
=============
ApplyEnvironmentOverrides

FRAGLINE_LOG_LEVEL replaces the configured log level when set.
=============
*/
void ApplyEnvironmentOverrides(ReplayConfig& config);

} // namespace fragline
