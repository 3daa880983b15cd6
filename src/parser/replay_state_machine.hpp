// replay_state_machine.hpp (Game Replay State Machine)
// CS2 servers print the final score only after every round of a game has
// already been logged. The state machine therefore ignores in-round lines
// until it meets an accepted GAME_OVER, rewinds the driver to the first
// ROUND_START of that game, re-emits the rounds with the game open, and
// closes the game when the replay reaches the GAME_OVER line again.
//
// One instance per log file; instances share no state.

#pragma once

#include "accolade_accumulator.hpp"
#include "event_matchers.hpp"
#include "event_sink.hpp"
#include "events.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fragline {

struct ReplayOptions {
	size_t accoladeThreshold = kDefaultAccoladeThreshold;
	size_t roundStatsLookahead = kDefaultRoundStatsLookahead;
};

struct ParseLineResult {
	ParsedEvent event;
	// Index the driver must process next. Smaller than the current index
	// after a GAME_OVER opens a game (rewind).
	size_t nextIndex = 0;
};

class ReplayStateMachine {
public:
	ReplayStateMachine(const ProcessedEventGate& gate, AccoladeSink& accoladeSink, ReplayOptions options = {});

	ReplayStateMachine(const ReplayStateMachine&) = delete;
	ReplayStateMachine& operator=(const ReplayStateMachine&) = delete;

	/*
	=============
	ParseLine

	Consumes lines[currentIndex] (passed as rawLine). Returns std::nullopt
	when the line yields no event, in which case the driver advances by
	one. Throws std::out_of_range when currentIndex is outside lines.
	=============
	*/
	std::optional<ParseLineResult> ParseLine(std::string_view rawLine, const std::vector<std::string>& lines, size_t currentIndex);

	bool MatchStarted() const { return matchStarted_; }
	std::optional<size_t> MatchProcessingIndex() const { return matchProcessingIndex_; }
	size_t RoundsSeenSinceRewind() const { return roundsSeenSinceRewind_; }
	std::optional<int64_t> AppServerId() const { return appServerId_; }

private:
	struct RewindScan {
		size_t rewindTarget = 0;
		// First index after the closest earlier GAME_OVER; accolades are
		// never collected below it.
		size_t accoladeFloor = 0;
		int64_t roundsFound = 0;
	};

	RewindScan ScanBackForRounds(const std::vector<std::string>& lines, size_t gameOverIndex, int64_t expectedRounds) const;
	std::optional<ParseLineResult> HandleGameOver(GameOverEvent gameOver, const std::vector<std::string>& lines, size_t currentIndex);
	std::optional<ParseLineResult> HandleInRound(const DecodedLine& line, const std::vector<std::string>& lines, size_t currentIndex);
	std::optional<ParsedEvent> AttributeBombEvent(BombEvent event);
	void ResetRoundTracking();
	void CloseMatch();

	const ProcessedEventGate& gate_;
	AccoladeSink& accoladeSink_;
	ReplayOptions options_;
	AccoladeAccumulator accumulator_;
	std::vector<std::unique_ptr<EventMatcher>> matchers_;

	bool matchStarted_ = false;
	std::optional<size_t> matchProcessingIndex_;
	size_t roundsSeenSinceRewind_ = 0;
	std::optional<int64_t> appServerId_;

	// Per-round bomb attribution.
	std::optional<Player> bombPlanter_;
	std::optional<std::string> bombsite_;
	std::optional<Player> bombDefuser_;
};

} // namespace fragline
