#include "json_event_writer.hpp"

#include "processed_ledger.hpp"
#include "../parser/log_time.hpp"

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace fragline {
namespace {

Json::Value PlayerToJson(const Player& player)
{
	Json::Value json(Json::objectValue);
	json["name"] = player.name;
	json["slot"] = player.slot;
	json["steam_id"] = player.steamId ? Json::Value(*player.steamId) : Json::Value(Json::nullValue);
	json["team"] = std::string(TeamName(player.team));
	json["bot"] = player.IsBot();
	return json;
}

Json::Value PositionToJson(const std::optional<Position>& position)
{
	if (!position)
		return Json::Value(Json::nullValue);

	Json::Value json(Json::arrayValue);
	json.append(position->x);
	json.append(position->y);
	json.append(position->z);
	return json;
}

/*
=============
FillEventFields

Adds the per-type payload. Common keys (type, time, positions) are set by
the caller.
=============
*/
void FillEventFields(Json::Value& json, const ParsedEvent& event)
{
	std::visit([&json](const auto& e) {
		using T = std::decay_t<decltype(e)>;

		if constexpr (std::is_same_v<T, KillEvent>) {
			json["attacker"] = PlayerToJson(e.attacker);
			json["victim"] = PlayerToJson(e.victim);
			json["weapon"] = e.weapon;
			json["headshot"] = e.headshot;
			Json::Value modifiers(Json::arrayValue);
			for (const auto& modifier : e.modifiers)
				modifiers.append(modifier);
			json["modifiers"] = modifiers;
		}
		else if constexpr (std::is_same_v<T, AssistEvent>) {
			json["assister"] = PlayerToJson(e.assister);
			json["victim"] = PlayerToJson(e.victim);
			json["kind"] = std::string(AssistKindName(e.kind));
		}
		else if constexpr (std::is_same_v<T, AttackEvent>) {
			json["attacker"] = PlayerToJson(e.attacker);
			json["victim"] = PlayerToJson(e.victim);
			json["weapon"] = e.weapon;
			json["damage"] = e.damage;
			json["armor_damage"] = e.armorDamage;
			json["health_remaining"] = e.healthRemaining;
			json["armor_remaining"] = e.armorRemaining;
			json["hitgroup"] = e.hitGroup;
		}
		else if constexpr (std::is_same_v<T, BombEvent>) {
			json["action"] = std::string(BombActionName(e.action));
			json["actor"] = e.actor ? PlayerToJson(*e.actor) : Json::Value(Json::nullValue);
			json["bombsite"] = e.bombsite ? Json::Value(*e.bombsite) : Json::Value(Json::nullValue);
		}
		else if constexpr (std::is_same_v<T, RoundEndEvent>) {
			Json::Value players(Json::arrayValue);
			for (const int64_t id : e.players)
				players.append(Json::Value::Int64(id));
			json["players"] = players;
		}
		else if constexpr (std::is_same_v<T, GameOverEvent>) {
			json["mode"] = e.mode;
			json["submode"] = e.submode;
			json["map"] = e.map;
			json["team1_score"] = e.team1Score;
			json["team2_score"] = e.team2Score;
			json["duration_minutes"] = e.durationMinutes;
			json["app_server_id"] = e.appServerId ? Json::Value(Json::Value::Int64(*e.appServerId)) : Json::Value(Json::nullValue);
		}
	}, event);
}

} // namespace

/*
=============
EventToJson
=============
*/
Json::Value EventToJson(const ParsedEvent& event)
{
	Json::Value json(Json::objectValue);
	const EventType type = EventTypeOf(event);
	json["type"] = std::string(EventTypeName(type));
	json["time"] = FormatIsoTimestamp(EventTimestamp(event));

	if (type == EventType::Kill || type == EventType::Attack || type == EventType::Assist) {
		json["attacker_position"] = PositionToJson(AttackerPosition(event));
		json["victim_position"] = PositionToJson(VictimPosition(event));
	}

	FillEventFields(json, event);
	return json;
}

Json::Value AccoladeToJson(const AccoladeRecord& accolade)
{
	Json::Value json(Json::objectValue);
	json["type"] = "ACCOLADE";
	json["accolade"] = accolade.type;
	json["player"] = accolade.playerName;
	json["player_id"] = accolade.playerId ? Json::Value(Json::Value::Int64(*accolade.playerId)) : Json::Value(Json::nullValue);
	json["value"] = accolade.value;
	json["position"] = accolade.position;
	json["score"] = accolade.score;
	return json;
}

JsonLinesEventSink::JsonLinesEventSink(std::ostream& out, ProcessedLedger* ledger)
	: out_(out)
	, ledger_(ledger)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	writer_.reset(builder.newStreamWriter());
}

void JsonLinesEventSink::WriteLine(const Json::Value& value)
{
	writer_->write(value, &out_);
	out_ << '\n';
}

/*
=============
JsonLinesEventSink::OnEvent
=============
*/
void JsonLinesEventSink::OnEvent(const ParsedEvent& event)
{
	WriteLine(EventToJson(event));
	++eventsWritten_;

	if (ledger_ && EventTypeOf(event) == EventType::GameOver)
		ledger_->MarkProcessed(EventType::GameOver, EventTimestamp(event));
}

/*
=============
JsonLinesEventSink::QueueAccolades
=============
*/
void JsonLinesEventSink::QueueAccolades(std::vector<AccoladeRecord> accolades)
{
	for (const auto& accolade : accolades) {
		WriteLine(AccoladeToJson(accolade));
		++accoladesWritten_;
	}
}

} // namespace fragline
