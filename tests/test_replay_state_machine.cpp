#include "parser/replay_state_machine.hpp"
#include "parser/log_time.hpp"
#include "replay_test_support.hpp"

#include <cassert>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace fragline;
using namespace fragline::test;

namespace {

/*
=============
CompleteGameRewindsToFirstRound

26 round starts, 6 accolades and a 16:10 game over: the game over opens the
match and rewinds to index 0, the replay re-emits the 26 rounds and the
second visit of the game over closes the match.
=============
*/
void CompleteGameRewindsToFirstRound()
{
	LogBuilder log;
	std::vector<std::string> lines;
	for (int i = 0; i < 26; ++i)
		lines.push_back(log.RoundStart());
	for (int i = 0; i < 6; ++i)
		lines.push_back(log.Accolade(i + 1));
	lines.push_back(log.GameOver(16, 10, 45, "de_inferno"));
	assert(lines.size() == 33);

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	for (size_t i = 0; i < 32; ++i)
		assert(!machine.ParseLine(lines[i], lines, i));

	auto opened = machine.ParseLine(lines[32], lines, 32);
	assert(opened);
	assert(opened->nextIndex == 0);
	const auto* gameOver = std::get_if<GameOverEvent>(&opened->event);
	assert(gameOver);
	assert(gameOver->map == "de_inferno");
	assert(gameOver->mode == "competitive");
	assert(gameOver->submode == "mg_active");
	assert(gameOver->team1Score == 16);
	assert(gameOver->team2Score == 10);
	assert(gameOver->durationMinutes == 45);
	assert(!gameOver->appServerId);
	assert(machine.MatchStarted());
	assert(machine.MatchProcessingIndex() == std::optional<size_t>(32));
	assert(accolades.batches.size() == 1);
	assert(accolades.batches[0].size() == 6);
	assert(gate.queries == 1);

	size_t roundStarts = 0;
	size_t index = opened->nextIndex;
	while (index < 32) {
		auto result = machine.ParseLine(lines[index], lines, index);
		if (!result) {
			assert(index >= 26);
			++index;
			continue;
		}
		assert(std::holds_alternative<RoundStartEvent>(result->event));
		assert(result->nextIndex == index + 1);
		++roundStarts;
		index = result->nextIndex;
	}
	assert(roundStarts == 26);
	assert(machine.RoundsSeenSinceRewind() == 26);

	auto closed = machine.ParseLine(lines[32], lines, 32);
	assert(closed);
	assert(std::holds_alternative<GameProcessedEvent>(closed->event));
	assert(closed->nextIndex == 33);
	assert(!machine.MatchStarted());
	assert(!machine.MatchProcessingIndex());
}

/*
=============
FiveAccoladesAreNotEnough
=============
*/
void FiveAccoladesAreNotEnough()
{
	LogBuilder log;
	std::vector<std::string> lines;
	const size_t gameOverIndex = AppendGame(lines, log, 1, 0, 5);

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	assert(!machine.ParseLine(lines[gameOverIndex], lines, gameOverIndex));
	assert(!machine.MatchStarted());
	assert(accolades.batches.empty());
	// The gate is only consulted for games that pass the accolade check.
	assert(gate.queries == 0);
}

void SixAccoladesOpenTheGame()
{
	LogBuilder log;
	std::vector<std::string> lines;
	const size_t gameOverIndex = AppendGame(lines, log, 1, 0, 6);

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	auto result = machine.ParseLine(lines[gameOverIndex], lines, gameOverIndex);
	assert(result);
	assert(std::holds_alternative<GameOverEvent>(result->event));
	assert(result->nextIndex == 0);
	assert(accolades.batches.size() == 1);
	assert(accolades.batches[0][0].type == "type1");
	assert(accolades.batches[0][5].playerName == "Player6");
	assert(accolades.batches[0][5].playerId == std::optional<int64_t>(6));
}

/*
=============
MalformedAccoladeDoesNotCount

Six ACCOLADE lines of which one breaks the grammar leave five records.
=============
*/
void MalformedAccoladeDoesNotCount()
{
	LogBuilder log;
	std::vector<std::string> lines;
	lines.push_back(log.RoundStart());
	for (int i = 0; i < 5; ++i)
		lines.push_back(log.Accolade(i + 1));
	lines.push_back(log.Line("ACCOLADE, FINAL: {broken}, nobody"));
	lines.push_back(log.GameOver(1, 0));

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);
	assert(!machine.ParseLine(lines.back(), lines, lines.size() - 1));
	assert(!machine.MatchStarted());
}

/*
=============
RewindStopsAtExpectedRoundCount

Four warm-up rounds before a 16:10 game: the scan finds exactly 26 round
starts and rewinds to the first of them, not to the warm-up.
=============
*/
void RewindStopsAtExpectedRoundCount()
{
	LogBuilder log;
	std::vector<std::string> lines;
	for (int i = 0; i < 4; ++i)
		lines.push_back(log.RoundStart());
	const size_t gameOverIndex = AppendGame(lines, log, 16, 10);

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	auto result = machine.ParseLine(lines[gameOverIndex], lines, gameOverIndex);
	assert(result);
	assert(result->nextIndex == 4);

	size_t roundStarts = 0;
	size_t kills = 0;
	size_t index = result->nextIndex;
	while (index < lines.size()) {
		auto step = machine.ParseLine(lines[index], lines, index);
		if (!step) {
			++index;
			continue;
		}
		if (std::holds_alternative<RoundStartEvent>(step->event))
			++roundStarts;
		else if (std::holds_alternative<KillEvent>(step->event))
			++kills;
		else if (std::holds_alternative<GameProcessedEvent>(step->event)) {
			assert(index == gameOverIndex);
			index = step->nextIndex;
			break;
		}
		index = step->nextIndex;
	}
	assert(roundStarts == 26);
	assert(kills == 26);
	assert(index == lines.size());
}

/*
=============
UnderrunRewindsToStart

A 16:10 game with only 10 round starts in the buffer still opens and
rewinds to line 0.
=============
*/
void UnderrunRewindsToStart()
{
	LogBuilder log;
	std::vector<std::string> lines;
	lines.push_back(log.Raw("Server is hibernating"));
	for (int i = 0; i < 10; ++i)
		lines.push_back(log.RoundStart());
	for (int i = 0; i < 6; ++i)
		lines.push_back(log.Accolade(i + 1));
	lines.push_back(log.GameOver(16, 10));

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	auto result = machine.ParseLine(lines.back(), lines, lines.size() - 1);
	assert(result);
	assert(std::holds_alternative<GameOverEvent>(result->event));
	assert(result->nextIndex == 0);
	assert(machine.MatchStarted());
}

/*
=============
ExtremeScoresRewindToStart

Scores at the top of the int range add up without wrapping; the scan runs
out of round starts and the game rewinds to line 0.
=============
*/
void ExtremeScoresRewindToStart()
{
	LogBuilder log;
	std::vector<std::string> lines;
	lines.push_back(log.RoundStart());
	for (int i = 0; i < 6; ++i)
		lines.push_back(log.Accolade(i + 1));
	lines.push_back(log.GameOver(2147483647, 1));

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	auto result = machine.ParseLine(lines.back(), lines, lines.size() - 1);
	assert(result);
	const auto* gameOver = std::get_if<GameOverEvent>(&result->event);
	assert(gameOver);
	assert(gameOver->team1Score == 2147483647);
	assert(gameOver->TotalRounds() == 2147483648LL);
	assert(result->nextIndex == 0);
	assert(machine.MatchStarted());
}

void ProcessedGameIsSkipped()
{
	LogBuilder log;
	std::vector<std::string> lines;
	const size_t gameOverIndex = AppendGame(lines, log, 2, 1);

	InMemoryGate gate;
	gate.Add(EventType::GameOver, *ParseIsoTimestamp(log.LastTime()));
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	assert(!machine.ParseLine(lines[gameOverIndex], lines, gameOverIndex));
	assert(gate.queries == 1);
	assert(!machine.MatchStarted());
	assert(accolades.batches.empty());

	// A different game over timestamp is not covered by the gate.
	InMemoryGate otherGate;
	otherGate.Add(EventType::GameOver, *ParseIsoTimestamp("2020-01-01T00:00:00Z"));
	ReplayStateMachine fresh(otherGate, accolades);
	assert(fresh.ParseLine(lines[gameOverIndex], lines, gameOverIndex));
}

void InRoundLinesIgnoredWithoutOpenGame()
{
	LogBuilder log;
	std::vector<std::string> lines;
	lines.push_back(log.RoundStart());
	lines.push_back(log.Kill(kAlice, kBob, " (headshot)"));
	lines.push_back(log.RoundEnd());

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	for (size_t i = 0; i < lines.size(); ++i)
		assert(!machine.ParseLine(lines[i], lines, i));
}

/*
=============
NestedGameOverIsIgnored

The second game over underruns and rewinds to 0, so the replay walks over
the first game's GAME_OVER while a match is open. That line yields nothing
and the accolades of the first game are not counted for the second.
=============
*/
void NestedGameOverIsIgnored()
{
	LogBuilder log;
	std::vector<std::string> lines;
	const size_t firstGameOver = AppendGame(lines, log, 1, 0);
	lines.push_back(log.RoundStart());
	for (int i = 0; i < 6; ++i)
		lines.push_back(log.Accolade(10 + i));
	lines.push_back(log.GameOver(5, 0));
	const size_t secondGameOver = lines.size() - 1;

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	auto opened = machine.ParseLine(lines[secondGameOver], lines, secondGameOver);
	assert(opened);
	assert(opened->nextIndex == 0);
	assert(accolades.batches.size() == 1);
	assert(accolades.batches[0].size() == 6);
	assert(accolades.batches[0][0].type == "type10");

	assert(!machine.ParseLine(lines[firstGameOver], lines, firstGameOver));
	assert(machine.MatchStarted());
	assert(machine.MatchProcessingIndex() == std::optional<size_t>(secondGameOver));

	auto closed = machine.ParseLine(lines[secondGameOver], lines, secondGameOver);
	assert(closed);
	assert(std::holds_alternative<GameProcessedEvent>(closed->event));
}

/*
=============
BombNoticesAreAttributed
=============
*/
void BombNoticesAreAttributed()
{
	LogBuilder log;
	std::vector<std::string> lines;
	lines.push_back(log.RoundStart());
	lines.push_back(log.Line(kBob + R"( triggered "Planted_The_Bomb" at bombsite A)"));
	lines.push_back(log.Line(kAlice + R"( triggered "Begin_Bomb_Defuse_With_Kit")"));
	lines.push_back(log.Line(R"(Team "CT" triggered "SFUI_Notice_Bomb_Defused" (CT "1") (T "0"))"));
	lines.push_back(log.RoundStart());
	lines.push_back(log.Line(R"(Team "TERRORIST" triggered "SFUI_Notice_Target_Bombed" (CT "1") (T "1"))"));
	for (int i = 0; i < 6; ++i)
		lines.push_back(log.Accolade(i + 1));
	lines.push_back(log.GameOver(1, 1));
	const size_t gameOverIndex = lines.size() - 1;

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	auto opened = machine.ParseLine(lines[gameOverIndex], lines, gameOverIndex);
	assert(opened && opened->nextIndex == 0);

	std::vector<BombEvent> bombs;
	size_t index = 0;
	while (index < gameOverIndex) {
		auto step = machine.ParseLine(lines[index], lines, index);
		if (!step) {
			++index;
			continue;
		}
		if (const auto* bomb = std::get_if<BombEvent>(&step->event))
			bombs.push_back(*bomb);
		index = step->nextIndex;
	}

	// Planted and Defused; the Exploded notice of the second round has no
	// tracked planter and the defuse start itself emits nothing.
	assert(bombs.size() == 2);
	assert(bombs[0].action == BombAction::Planted);
	assert(bombs[0].actor && bombs[0].actor->name == "Bob");
	assert(bombs[0].bombsite == std::optional<std::string>("A"));
	assert(bombs[1].action == BombAction::Defused);
	assert(bombs[1].actor && bombs[1].actor->name == "Alice");
	assert(bombs[1].actor->team == Team::CT);
	assert(bombs[1].bombsite == std::optional<std::string>("A"));
}

void AppServerIdIsAttached()
{
	LogBuilder log;
	std::vector<std::string> lines;
	lines.push_back(log.Raw("ResetBreakpadAppId: Setting dedicated server app id: 730"));
	AppendGame(lines, log, 1, 0);

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	std::optional<GameOverEvent> gameOver;
	for (size_t i = 0; i < lines.size() && !gameOver; ++i) {
		if (auto result = machine.ParseLine(lines[i], lines, i)) {
			if (const auto* event = std::get_if<GameOverEvent>(&result->event))
				gameOver = *event;
		}
	}

	assert(machine.AppServerId() == std::optional<int64_t>(730));
	assert(gameOver);
	assert(gameOver->appServerId == std::optional<int64_t>(730));
}

void IndexOutsideBufferThrows()
{
	LogBuilder log;
	std::vector<std::string> lines{ log.RoundStart() };

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	bool threw = false;
	try {
		machine.ParseLine(lines[0], lines, 1);
	}
	catch (const std::out_of_range&) {
		threw = true;
	}
	assert(threw);
}

void UndecodableLinesYieldNothing()
{
	std::vector<std::string> lines{ "not json at all", "{\"time\":\"2024-04-20T17:00:00Z\"}", "[1,2,3]" };

	InMemoryGate gate;
	RecordingAccoladeSink accolades;
	ReplayStateMachine machine(gate, accolades);

	for (size_t i = 0; i < lines.size(); ++i)
		assert(!machine.ParseLine(lines[i], lines, i));
}

} // namespace

/*
=============
main
=============
*/
int main()
{
	CompleteGameRewindsToFirstRound();
	FiveAccoladesAreNotEnough();
	SixAccoladesOpenTheGame();
	MalformedAccoladeDoesNotCount();
	RewindStopsAtExpectedRoundCount();
	UnderrunRewindsToStart();
	ExtremeScoresRewindToStart();
	ProcessedGameIsSkipped();
	InRoundLinesIgnoredWithoutOpenGame();
	NestedGameOverIsIgnored();
	BombNoticesAreAttributed();
	AppServerIdIsAttached();
	IndexOutsideBufferThrows();
	UndecodableLinesYieldNothing();
	return 0;
}
