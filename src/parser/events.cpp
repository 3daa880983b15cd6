#include "events.hpp"

#include <array>
#include <type_traits>

namespace fragline {
namespace {

// Declaration order of ParsedEvent and EventType must stay in lockstep.
static_assert(std::variant_size_v<ParsedEvent> == static_cast<size_t>(EventType::Total));
static_assert(std::is_same_v<std::variant_alternative_t<0, ParsedEvent>, KillEvent>);
static_assert(std::is_same_v<std::variant_alternative_t<6, ParsedEvent>, GameOverEvent>);
static_assert(std::is_same_v<std::variant_alternative_t<7, ParsedEvent>, GameProcessedEvent>);

constexpr std::array<std::string_view, static_cast<size_t>(EventType::Total)> kEventTypeNames = {
	"KILL",
	"ASSIST",
	"ATTACK",
	"BOMB_EVENT",
	"ROUND_START",
	"ROUND_END",
	"GAME_OVER",
	"GAME_PROCESSED",
};

} // namespace

EventType EventTypeOf(const ParsedEvent& event)
{
	return static_cast<EventType>(event.index());
}

std::string_view EventTypeName(EventType type)
{
	const size_t index = static_cast<size_t>(type);
	if (index >= kEventTypeNames.size())
		return "UNKNOWN";

	return kEventTypeNames[index];
}

std::optional<EventType> EventTypeFromName(std::string_view name)
{
	for (size_t i = 0; i < kEventTypeNames.size(); ++i) {
		if (kEventTypeNames[i] == name)
			return static_cast<EventType>(i);
	}
	return std::nullopt;
}

Timestamp EventTimestamp(const ParsedEvent& event)
{
	return std::visit([](const auto& e) { return e.timestamp; }, event);
}

std::string_view TeamName(Team team)
{
	return team == Team::CT ? "CT" : "TERRORIST";
}

std::string_view AssistKindName(AssistKind kind)
{
	return kind == AssistKind::Flash ? "flash" : "regular";
}

std::string_view BombActionName(BombAction action)
{
	switch (action) {
	case BombAction::Planted:
		return "planted";
	case BombAction::DefuseBegin:
		return "defuse_begin";
	case BombAction::Defused:
		return "defused";
	case BombAction::Exploded:
	default:
		return "exploded";
	}
}

std::optional<Position> AttackerPosition(const ParsedEvent& event)
{
	if (const auto* kill = std::get_if<KillEvent>(&event))
		return kill->attackerPosition;
	if (const auto* attack = std::get_if<AttackEvent>(&event))
		return attack->attackerPosition;
	return std::nullopt;
}

std::optional<Position> VictimPosition(const ParsedEvent& event)
{
	if (const auto* kill = std::get_if<KillEvent>(&event))
		return kill->victimPosition;
	if (const auto* attack = std::get_if<AttackEvent>(&event))
		return attack->victimPosition;
	return std::nullopt;
}

bool IsBotOnlyAction(const ParsedEvent& event)
{
	if (const auto* kill = std::get_if<KillEvent>(&event))
		return kill->attacker.IsBot() && kill->victim.IsBot();
	if (const auto* assist = std::get_if<AssistEvent>(&event))
		return assist->assister.IsBot() && assist->victim.IsBot();
	if (const auto* attack = std::get_if<AttackEvent>(&event))
		return attack->attacker.IsBot() && attack->victim.IsBot();
	return false;
}

} // namespace fragline
