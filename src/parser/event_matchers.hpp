// event_matchers.hpp (Log Line Grammars)
// One matcher per server log grammar. Matchers are purely syntactic: a line
// either fits the grammar and becomes a typed record, or it yields nothing.
// The replay state machine tries the in-round matchers in the order returned
// by BuildInRoundMatchers and keeps the first hit; new grammars are added by
// appending a matcher to that list.

#pragma once

#include "events.hpp"
#include "line_decoder.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fragline {

inline constexpr size_t kDefaultRoundStatsLookahead = 64;

struct MatchContext {
	const std::vector<std::string>& lines;
	size_t roundStatsLookahead = kDefaultRoundStatsLookahead;
};

/*
=================
EventMatcher

Interface for the in-round grammars. TryMatch must not depend on anything
but the decoded line and, for block grammars, the raw lines that follow it.
=================
*/
class EventMatcher {
public:
	virtual ~EventMatcher() = default;

	virtual std::string_view Name() const = 0;
	virtual std::optional<ParsedEvent> TryMatch(const DecodedLine& line, const MatchContext& context) const = 0;
};

class RoundStartMatcher final : public EventMatcher {
public:
	static bool Matches(std::string_view text);

	std::string_view Name() const override { return "round_start"; }
	std::optional<ParsedEvent> TryMatch(const DecodedLine& line, const MatchContext& context) const override;
};

class AttackMatcher final : public EventMatcher {
public:
	static std::optional<AttackEvent> Parse(const DecodedLine& line);

	std::string_view Name() const override { return "attack"; }
	std::optional<ParsedEvent> TryMatch(const DecodedLine& line, const MatchContext& context) const override;
};

class KillMatcher final : public EventMatcher {
public:
	static std::optional<KillEvent> Parse(const DecodedLine& line);

	std::string_view Name() const override { return "kill"; }
	std::optional<ParsedEvent> TryMatch(const DecodedLine& line, const MatchContext& context) const override;
};

class AssistMatcher final : public EventMatcher {
public:
	static std::optional<AssistEvent> Parse(const DecodedLine& line);

	std::string_view Name() const override { return "assist"; }
	std::optional<ParsedEvent> TryMatch(const DecodedLine& line, const MatchContext& context) const override;
};

/*
=================
BombMatcher

Recognizes plant, defuse start, defused and target bombed lines. The last
two are team notices, so the returned record has no actor; the state
machine attributes them from what it tracked earlier in the round.
=================
*/
class BombMatcher final : public EventMatcher {
public:
	static std::optional<BombEvent> Parse(const DecodedLine& line);

	std::string_view Name() const override { return "bomb"; }
	std::optional<ParsedEvent> TryMatch(const DecodedLine& line, const MatchContext& context) const override;
};

/*
=================
RoundEndMatcher

Matches the Round_End trigger and reads the per-player stat block that the
server prints after it (JSON_BEGIN ... "player_N" : "id, ..." ... JSON_END).
The look-ahead stops at JSON_END, at the next round or game boundary, or
after roundStatsLookahead lines.
=================
*/
class RoundEndMatcher final : public EventMatcher {
public:
	static bool Matches(std::string_view text);
	static std::vector<int64_t> CollectPlayers(const std::vector<std::string>& lines, size_t roundEndIndex, size_t lookahead);

	std::string_view Name() const override { return "round_end"; }
	std::optional<ParsedEvent> TryMatch(const DecodedLine& line, const MatchContext& context) const override;
};

class GameOverMatcher {
public:
	static std::optional<GameOverEvent> Parse(const DecodedLine& line);
};

class AccoladeMatcher {
public:
	static std::optional<AccoladeRecord> Parse(const DecodedLine& line);
};

/*
=============
ParseAppServerId

Extracts the dedicated server app id from a ResetBreakpadAppId notice.
These lines are printed before any game and have no "L " prefix.
=============
*/
std::optional<int64_t> ParseAppServerId(std::string_view content);

std::vector<std::unique_ptr<EventMatcher>> BuildInRoundMatchers();

} // namespace fragline
