#include "replay_state_machine.hpp"

#include "line_decoder.hpp"
#include "../shared/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace fragline {

ReplayStateMachine::ReplayStateMachine(const ProcessedEventGate& gate, AccoladeSink& accoladeSink, ReplayOptions options)
	: gate_(gate)
	, accoladeSink_(accoladeSink)
	, options_(options)
	, accumulator_(options.accoladeThreshold)
	, matchers_(BuildInRoundMatchers()) {}

/*
=============
ReplayStateMachine::ParseLine
=============
*/
std::optional<ParseLineResult> ReplayStateMachine::ParseLine(std::string_view rawLine, const std::vector<std::string>& lines, size_t currentIndex)
{
	if (currentIndex >= lines.size())
		throw std::out_of_range("ParseLine: index " + std::to_string(currentIndex) + " outside a buffer of " + std::to_string(lines.size()) + " lines");

	DecodeError error{};
	const auto line = DecodeLine(rawLine, currentIndex, &error);
	if (!line) {
		if (error == DecodeError::MissingSentinel) {
			const auto envelope = DecodeEnvelope(rawLine);
			if (envelope) {
				if (const auto id = ParseAppServerId(envelope->content)) {
					appServerId_ = id;
					Logf(LogLevel::Info, "App server id ", *id, " found at line ", currentIndex);
				}
			}
		}
		Logf(LogLevel::Trace, "Line ", currentIndex, " not decodable: ", DecodeErrorName(error));
		return std::nullopt;
	}

	if (matchStarted_ && matchProcessingIndex_ && currentIndex == *matchProcessingIndex_) {
		Logf(LogLevel::Debug, "Replay reached game over at ", currentIndex, " after ", roundsSeenSinceRewind_, " rounds");
		CloseMatch();
		return ParseLineResult{ GameProcessedEvent{ line->timestamp }, currentIndex + 1 };
	}

	if (auto gameOver = GameOverMatcher::Parse(*line))
		return HandleGameOver(std::move(*gameOver), lines, currentIndex);

	if (!matchStarted_)
		return std::nullopt;

	return HandleInRound(*line, lines, currentIndex);
}

/*
=============
ReplayStateMachine::ScanBackForRounds

Walks backwards from the line before the GAME_OVER counting ROUND_START
lines until expectedRounds are found. When the log runs out first the
rewind target is line 0.
=============
*/
ReplayStateMachine::RewindScan ReplayStateMachine::ScanBackForRounds(const std::vector<std::string>& lines, size_t gameOverIndex, int64_t expectedRounds) const
{
	RewindScan scan;
	if (expectedRounds <= 0) {
		scan.rewindTarget = gameOverIndex;
		scan.accoladeFloor = gameOverIndex;
		return scan;
	}

	bool floorFound = false;
	bool targetFound = false;
	for (size_t i = gameOverIndex; i-- > 0;) {
		const auto line = DecodeLine(lines[i], i);
		if (!line)
			continue;

		if (RoundStartMatcher::Matches(line->text)) {
			if (++scan.roundsFound == expectedRounds) {
				scan.rewindTarget = i;
				targetFound = true;
				break;
			}
			continue;
		}

		if (!floorFound && GameOverMatcher::Parse(*line)) {
			scan.accoladeFloor = i + 1;
			floorFound = true;
		}
	}

	if (!targetFound)
		scan.rewindTarget = 0;

	scan.accoladeFloor = std::max(scan.accoladeFloor, scan.rewindTarget);
	return scan;
}

/*
=============
ReplayStateMachine::HandleGameOver

Accepts the game when enough accolades precede it and it was not ingested
before, then opens the match and rewinds to its first round.
=============
*/
std::optional<ParseLineResult> ReplayStateMachine::HandleGameOver(GameOverEvent gameOver, const std::vector<std::string>& lines, size_t currentIndex)
{
	if (matchStarted_) {
		Logf(LogLevel::Debug, "Ignoring game over at ", currentIndex, " while replaying the game that ends at ", *matchProcessingIndex_);
		return std::nullopt;
	}

	Logf(LogLevel::Info, "Game over detected at index ", currentIndex, ": ", gameOver.map, " ", gameOver.team1Score, ":", gameOver.team2Score);

	const int64_t expectedRounds = gameOver.TotalRounds();
	const RewindScan scan = ScanBackForRounds(lines, currentIndex, expectedRounds);

	std::vector<AccoladeRecord> accolades = accumulator_.Collect(lines, scan.accoladeFloor, currentIndex);
	if (!accumulator_.IsComplete(accolades)) {
		Logf(LogLevel::Info, "Skipping game at index ", currentIndex, ": ", accolades.size(), " accolades, need ", accumulator_.Threshold());
		return std::nullopt;
	}

	if (gate_.AlreadyProcessed(EventType::GameOver, gameOver.timestamp)) {
		Logf(LogLevel::Info, "Game at index ", currentIndex, " already processed in a previous run");
		return std::nullopt;
	}

	if (scan.roundsFound < expectedRounds) {
		Logf(LogLevel::Warn, "Game over at ", currentIndex, " expects ", expectedRounds, " rounds but only ",
			scan.roundsFound, " round starts precede it; rewinding to line 0");
	}

	gameOver.appServerId = appServerId_;
	matchStarted_ = true;
	matchProcessingIndex_ = currentIndex;
	roundsSeenSinceRewind_ = 0;
	ResetRoundTracking();

	Logf(LogLevel::Info, "Moving pointer back ", expectedRounds, " rounds to ", scan.rewindTarget,
		", game over at ", currentIndex, ", duration ", gameOver.durationMinutes, " min");

	accoladeSink_.QueueAccolades(std::move(accolades));
	return ParseLineResult{ std::move(gameOver), scan.rewindTarget };
}

/*
=============
ReplayStateMachine::HandleInRound
=============
*/
std::optional<ParseLineResult> ReplayStateMachine::HandleInRound(const DecodedLine& line, const std::vector<std::string>& lines, size_t currentIndex)
{
	const MatchContext context{ lines, options_.roundStatsLookahead };

	for (const auto& matcher : matchers_) {
		auto event = matcher->TryMatch(line, context);
		if (!event)
			continue;

		if (std::holds_alternative<RoundStartEvent>(*event)) {
			ResetRoundTracking();
			++roundsSeenSinceRewind_;
		}
		else if (auto* bomb = std::get_if<BombEvent>(&*event)) {
			event = AttributeBombEvent(std::move(*bomb));
			if (!event)
				return std::nullopt;
		}

		return ParseLineResult{ std::move(*event), currentIndex + 1 };
	}

	return std::nullopt;
}

/*
=============
ReplayStateMachine::AttributeBombEvent

Remembers planter, bombsite and the latest defuser for the round and fills
the actor of the team-level defused / bombed notices.
=============
*/
std::optional<ParsedEvent> ReplayStateMachine::AttributeBombEvent(BombEvent event)
{
	switch (event.action) {
	case BombAction::Planted:
		bombPlanter_ = event.actor;
		bombsite_ = event.bombsite;
		return event;

	case BombAction::DefuseBegin:
		bombDefuser_ = event.actor;
		return std::nullopt;

	case BombAction::Defused:
		if (!bombDefuser_) {
			Log(LogLevel::Warn, "Bomb defused but no defuser tracked this round");
			return std::nullopt;
		}
		event.actor = bombDefuser_;
		event.bombsite = bombsite_;
		return event;

	case BombAction::Exploded:
	default:
		if (!bombPlanter_) {
			Log(LogLevel::Warn, "Bomb exploded but no planter tracked this round");
			return std::nullopt;
		}
		event.actor = bombPlanter_;
		event.bombsite = bombsite_;
		return event;
	}
}

void ReplayStateMachine::ResetRoundTracking()
{
	bombPlanter_.reset();
	bombsite_.reset();
	bombDefuser_.reset();
}

void ReplayStateMachine::CloseMatch()
{
	matchStarted_ = false;
	matchProcessingIndex_.reset();
	ResetRoundTracking();
}

} // namespace fragline
