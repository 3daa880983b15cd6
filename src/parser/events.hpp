// events.hpp (Parsed Event Model)
// Typed records produced by the line matchers and the replay state machine.
// Every record is created once per matched line and is not mutated by the
// parser after it has been returned to the driver.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fragline {

using Timestamp = std::chrono::system_clock::time_point;

enum class Team : uint8_t {
	CT,
	Terrorist
};

struct Player {
	std::string name;
	int slot = 0;
	// Steam ID3 text such as "[U:1:123]"; absent for bots.
	std::optional<std::string> steamId;
	Team team = Team::CT;

	bool IsBot() const { return !steamId.has_value(); }
};

struct Position {
	int x = 0;
	int y = 0;
	int z = 0;

	bool operator==(const Position&) const = default;
};

struct KillEvent {
	Timestamp timestamp{};
	Player attacker;
	Position attackerPosition;
	Player victim;
	Position victimPosition;
	std::string weapon;
	bool headshot = false;
	// Parenthesised trailers such as "headshot", "penetrated", "throughsmoke".
	std::vector<std::string> modifiers;
};

enum class AssistKind : uint8_t {
	Regular,
	Flash
};

struct AssistEvent {
	Timestamp timestamp{};
	Player assister;
	Player victim;
	AssistKind kind = AssistKind::Regular;
};

struct AttackEvent {
	Timestamp timestamp{};
	Player attacker;
	Position attackerPosition;
	Player victim;
	Position victimPosition;
	std::string weapon;
	int damage = 0;
	int armorDamage = 0;
	int healthRemaining = 0;
	int armorRemaining = 0;
	std::string hitGroup;
};

enum class BombAction : uint8_t {
	Planted,
	DefuseBegin,
	Defused,
	Exploded
};

struct BombEvent {
	Timestamp timestamp{};
	BombAction action = BombAction::Planted;
	// Planted and DefuseBegin name the actor on the line itself. Defused and
	// Exploded are team-level notices attributed from round tracking.
	std::optional<Player> actor;
	std::optional<std::string> bombsite;
};

struct RoundStartEvent {
	Timestamp timestamp{};
};

struct RoundEndEvent {
	Timestamp timestamp{};
	std::vector<int64_t> players;
};

struct GameOverEvent {
	Timestamp timestamp{};
	std::string mode;
	std::string submode;
	std::string map;
	int team1Score = 0;
	int team2Score = 0;
	int durationMinutes = 0;
	std::optional<int64_t> appServerId;

	int64_t TotalRounds() const { return static_cast<int64_t>(team1Score) + team2Score; }
};

struct GameProcessedEvent {
	Timestamp timestamp{};
};

using ParsedEvent = std::variant<
	KillEvent,
	AssistEvent,
	AttackEvent,
	BombEvent,
	RoundStartEvent,
	RoundEndEvent,
	GameOverEvent,
	GameProcessedEvent>;

enum class EventType : uint8_t {
	Kill,
	Assist,
	Attack,
	Bomb,
	RoundStart,
	RoundEnd,
	GameOver,
	GameProcessed,
	Total
};

struct AccoladeRecord {
	std::string type;
	std::string playerName;
	// Numeric id from the trailing <...> token; absent when that token is
	// not numeric.
	std::optional<int64_t> playerId;
	double value = 0.0;
	int position = 0;
	double score = 0.0;
};

/*
=============
EventTypeOf

Maps a parsed event variant to its EventType tag.
=============
*/
EventType EventTypeOf(const ParsedEvent& event);

/*
=============
EventTypeName

Stable upper-case identifier used in logs, the ledger and JSON output.
=============
*/
std::string_view EventTypeName(EventType type);

std::optional<EventType> EventTypeFromName(std::string_view name);

Timestamp EventTimestamp(const ParsedEvent& event);

std::string_view TeamName(Team team);
std::string_view AssistKindName(AssistKind kind);
std::string_view BombActionName(BombAction action);

/*
=============
AttackerPosition / VictimPosition

Positions for grammars that carry them; std::nullopt for every other event.
=============
*/
std::optional<Position> AttackerPosition(const ParsedEvent& event);
std::optional<Position> VictimPosition(const ParsedEvent& event);

/*
=============
IsBotOnlyAction

True for kill, assist and attack events where both players are bots.
=============
*/
bool IsBotOnlyAction(const ParsedEvent& event);

} // namespace fragline
