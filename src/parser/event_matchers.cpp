#include "event_matchers.hpp"

#include "../shared/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace fragline {
namespace {

// "L 04/20/2024 - 17:52:34: "
constexpr std::string_view kLinePrefix = R"(L \d{2}/\d{2}/\d{4} - \d{2}:\d{2}:\d{2}: )";
// "Name<slot><[U:1:N]|BOT><CT|TERRORIST>" -> name, slot, id, team
constexpr std::string_view kPlayerToken = R"("(.+?)<(\d+)><(BOT|\[U:\d+:\d+\])><(CT|TERRORIST)>")";
// "[x y z]"
constexpr std::string_view kPositionToken = R"(\[(-?\d+) (-?\d+) (-?\d+)\])";

constexpr size_t kPlayerGroups = 4;
constexpr size_t kPositionGroups = 3;

constexpr std::string_view kRoundStartMarker = R"(World triggered "Round_Start")";
constexpr std::string_view kRoundEndMarker = R"(World triggered "Round_End")";

/*
=============
BuildPattern

Concatenates grammar fragments into one optimized regex.
=============
*/
std::regex BuildPattern(std::initializer_list<std::string_view> parts)
{
	std::string pattern;
	for (std::string_view part : parts)
		pattern.append(part);
	return std::regex(pattern, std::regex::optimize);
}

/*
=============
ReadPlayer

Builds a Player from the four groups of kPlayerToken starting at first.
=============
*/
std::optional<Player> ReadPlayer(const std::smatch& match, size_t first)
{
	const auto slot = ParseInt<int>(match.str(first + 1));
	if (!slot)
		return std::nullopt;

	Player player;
	player.name = match.str(first);
	player.slot = *slot;
	const std::string id = match.str(first + 2);
	if (id != "BOT")
		player.steamId = id;
	player.team = match.str(first + 3) == "CT" ? Team::CT : Team::Terrorist;
	return player;
}

std::optional<Position> ReadPosition(const std::smatch& match, size_t first)
{
	const auto x = ParseInt<int>(match.str(first));
	const auto y = ParseInt<int>(match.str(first + 1));
	const auto z = ParseInt<int>(match.str(first + 2));
	if (!x || !y || !z)
		return std::nullopt;

	return Position{ *x, *y, *z };
}

/*
=============
SplitModifiers

Turns " (headshot) (penetrated)" into { "headshot", "penetrated" }.
=============
*/
std::vector<std::string> SplitModifiers(const std::string& trailer)
{
	std::vector<std::string> modifiers;
	size_t pos = 0;
	while ((pos = trailer.find('(', pos)) != std::string::npos) {
		const size_t close = trailer.find(')', pos);
		if (close == std::string::npos)
			break;
		modifiers.emplace_back(trailer.substr(pos + 1, close - pos - 1));
		pos = close + 1;
	}
	return modifiers;
}

bool ContainsAny(std::string_view text, std::initializer_list<std::string_view> needles)
{
	for (std::string_view needle : needles) {
		if (text.find(needle) != std::string_view::npos)
			return true;
	}
	return false;
}

/*
=============
ContainsNoCase

Case-insensitive substring test; needle must be lower case.
=============
*/
bool ContainsNoCase(std::string_view text, std::string_view needle)
{
	const auto it = std::search(text.begin(), text.end(), needle.begin(), needle.end(), [](char a, char b) {
		return std::tolower(static_cast<unsigned char>(a)) == b;
	});
	return it != text.end();
}

} // namespace

/*
=============
RoundStartMatcher
=============
*/
bool RoundStartMatcher::Matches(std::string_view text)
{
	return HasLogSentinel(text) && text.find(kRoundStartMarker) != std::string_view::npos;
}

std::optional<ParsedEvent> RoundStartMatcher::TryMatch(const DecodedLine& line, const MatchContext&) const
{
	if (!Matches(line.text))
		return std::nullopt;

	return RoundStartEvent{ line.timestamp };
}

/*
=============
AttackMatcher::Parse

"A" [x y z] attacked "B" [x y z] with "w" (damage "d") (damage_armor "a")
(health "h") (armor "r") (hitgroup "g")
=============
*/
std::optional<AttackEvent> AttackMatcher::Parse(const DecodedLine& line)
{
	static const std::regex s_Regex = BuildPattern({
		kLinePrefix, kPlayerToken, " ", kPositionToken, " attacked ", kPlayerToken, " ", kPositionToken,
		R"rx( with "([^"]+)" \(damage "(\d+)"\) \(damage_armor "(\d+)"\) \(health "(\d+)"\) \(armor "(\d+)"\) \(hitgroup "([^"]+)"\))rx"
	});

	std::smatch match;
	if (!std::regex_match(line.text, match, s_Regex))
		return std::nullopt;

	constexpr size_t attackerAt = 1;
	constexpr size_t attackerPosAt = attackerAt + kPlayerGroups;
	constexpr size_t victimAt = attackerPosAt + kPositionGroups;
	constexpr size_t victimPosAt = victimAt + kPlayerGroups;
	constexpr size_t detailAt = victimPosAt + kPositionGroups;

	auto attacker = ReadPlayer(match, attackerAt);
	auto attackerPos = ReadPosition(match, attackerPosAt);
	auto victim = ReadPlayer(match, victimAt);
	auto victimPos = ReadPosition(match, victimPosAt);
	const auto damage = ParseInt<int>(match.str(detailAt + 1));
	const auto armorDamage = ParseInt<int>(match.str(detailAt + 2));
	const auto health = ParseInt<int>(match.str(detailAt + 3));
	const auto armor = ParseInt<int>(match.str(detailAt + 4));
	if (!attacker || !attackerPos || !victim || !victimPos || !damage || !armorDamage || !health || !armor)
		return std::nullopt;

	AttackEvent event;
	event.timestamp = line.timestamp;
	event.attacker = std::move(*attacker);
	event.attackerPosition = *attackerPos;
	event.victim = std::move(*victim);
	event.victimPosition = *victimPos;
	event.weapon = match.str(detailAt);
	event.damage = *damage;
	event.armorDamage = *armorDamage;
	event.healthRemaining = *health;
	event.armorRemaining = *armor;
	event.hitGroup = match.str(detailAt + 5);
	return event;
}

std::optional<ParsedEvent> AttackMatcher::TryMatch(const DecodedLine& line, const MatchContext&) const
{
	if (auto event = Parse(line))
		return ParsedEvent{ std::move(*event) };
	return std::nullopt;
}

/*
=============
KillMatcher::Parse

"A" [x y z] killed "B" [x y z] with "w" followed by optional modifiers such
as (headshot) or (throughsmoke penetrated).
=============
*/
std::optional<KillEvent> KillMatcher::Parse(const DecodedLine& line)
{
	static const std::regex s_Regex = BuildPattern({
		kLinePrefix, kPlayerToken, " ", kPositionToken, " killed (?:other )?", kPlayerToken, " ", kPositionToken,
		R"rx( with "([^"]+)"((?: \([^)]+\))*))rx"
	});

	std::smatch match;
	if (!std::regex_match(line.text, match, s_Regex))
		return std::nullopt;

	constexpr size_t killerAt = 1;
	constexpr size_t killerPosAt = killerAt + kPlayerGroups;
	constexpr size_t victimAt = killerPosAt + kPositionGroups;
	constexpr size_t victimPosAt = victimAt + kPlayerGroups;
	constexpr size_t weaponAt = victimPosAt + kPositionGroups;

	auto killer = ReadPlayer(match, killerAt);
	auto killerPos = ReadPosition(match, killerPosAt);
	auto victim = ReadPlayer(match, victimAt);
	auto victimPos = ReadPosition(match, victimPosAt);
	if (!killer || !killerPos || !victim || !victimPos)
		return std::nullopt;

	KillEvent event;
	event.timestamp = line.timestamp;
	event.attacker = std::move(*killer);
	event.attackerPosition = *killerPos;
	event.victim = std::move(*victim);
	event.victimPosition = *victimPos;
	event.weapon = match.str(weaponAt);
	event.modifiers = SplitModifiers(match.str(weaponAt + 1));
	for (const std::string& modifier : event.modifiers) {
		if (modifier.find("headshot") != std::string::npos)
			event.headshot = true;
	}
	return event;
}

std::optional<ParsedEvent> KillMatcher::TryMatch(const DecodedLine& line, const MatchContext&) const
{
	if (auto event = Parse(line))
		return ParsedEvent{ std::move(*event) };
	return std::nullopt;
}

/*
=============
AssistMatcher::Parse

"A" assisted killing "B" or "A" flash-assisted killing "B". The grammar has
no coordinates.
=============
*/
std::optional<AssistEvent> AssistMatcher::Parse(const DecodedLine& line)
{
	static const std::regex s_Regex = BuildPattern({
		kLinePrefix, kPlayerToken, R"( (flash-)?assisted killing )", kPlayerToken
	});

	std::smatch match;
	if (!std::regex_match(line.text, match, s_Regex))
		return std::nullopt;

	constexpr size_t assisterAt = 1;
	constexpr size_t flashAt = assisterAt + kPlayerGroups;
	constexpr size_t victimAt = flashAt + 1;

	auto assister = ReadPlayer(match, assisterAt);
	auto victim = ReadPlayer(match, victimAt);
	if (!assister || !victim)
		return std::nullopt;

	AssistEvent event;
	event.timestamp = line.timestamp;
	event.assister = std::move(*assister);
	event.victim = std::move(*victim);
	event.kind = match[flashAt].matched ? AssistKind::Flash : AssistKind::Regular;
	return event;
}

std::optional<ParsedEvent> AssistMatcher::TryMatch(const DecodedLine& line, const MatchContext&) const
{
	if (auto event = Parse(line))
		return ParsedEvent{ std::move(*event) };
	return std::nullopt;
}

/*
=============
BombMatcher::Parse
=============
*/
std::optional<BombEvent> BombMatcher::Parse(const DecodedLine& line)
{
	static const std::regex s_Planted = BuildPattern({
		kLinePrefix, kPlayerToken, R"( triggered "Planted_The_Bomb" at bombsite ([AB]))"
	});
	static const std::regex s_DefuseBegin = BuildPattern({
		kLinePrefix, R"("(.+?)<(\d+)><(BOT|\[U:\d+:\d+\])><(CT)>")",
		R"( triggered "Begin_Bomb_Defuse_(?:With|Without)_Kit")"
	});
	static const std::regex s_Defused = BuildPattern({
		kLinePrefix, R"(Team "CT" triggered "SFUI_Notice_Bomb_Defused".*)"
	});
	static const std::regex s_Exploded = BuildPattern({
		kLinePrefix, R"(Team "TERRORIST" triggered "SFUI_Notice_Target_Bombed".*)"
	});

	if (line.text.find("triggered") == std::string::npos)
		return std::nullopt;

	BombEvent event;
	event.timestamp = line.timestamp;

	std::smatch match;
	if (std::regex_match(line.text, match, s_Planted)) {
		event.action = BombAction::Planted;
		event.actor = ReadPlayer(match, 1);
		if (!event.actor)
			return std::nullopt;
		event.bombsite = match.str(1 + kPlayerGroups);
		return event;
	}

	if (std::regex_match(line.text, match, s_DefuseBegin)) {
		event.action = BombAction::DefuseBegin;
		event.actor = ReadPlayer(match, 1);
		if (!event.actor)
			return std::nullopt;
		return event;
	}

	if (std::regex_match(line.text, s_Defused)) {
		event.action = BombAction::Defused;
		return event;
	}

	if (std::regex_match(line.text, s_Exploded)) {
		event.action = BombAction::Exploded;
		return event;
	}

	return std::nullopt;
}

std::optional<ParsedEvent> BombMatcher::TryMatch(const DecodedLine& line, const MatchContext&) const
{
	if (auto event = Parse(line))
		return ParsedEvent{ std::move(*event) };
	return std::nullopt;
}

/*
=============
RoundEndMatcher
=============
*/
bool RoundEndMatcher::Matches(std::string_view text)
{
	return HasLogSentinel(text) && text.find(kRoundEndMarker) != std::string_view::npos;
}

std::vector<int64_t> RoundEndMatcher::CollectPlayers(const std::vector<std::string>& lines, size_t roundEndIndex, size_t lookahead)
{
	static const std::regex s_PlayerRow(R"rx("player_\d+"\s*:\s*"\s*(\d+)\s*,)rx", std::regex::optimize);

	std::vector<int64_t> players;
	bool inBlock = false;
	const size_t last = std::min(lines.size(), roundEndIndex + 1 + lookahead);

	for (size_t i = roundEndIndex + 1; i < last; ++i) {
		const auto envelope = DecodeEnvelope(lines[i]);
		if (!envelope)
			continue;

		const std::string& content = envelope->content;
		if (!inBlock) {
			// The final round of a game prints accolades instead of the table.
			if (ContainsAny(content, { "ACCOLADE", "Game Over:", kRoundStartMarker, kRoundEndMarker }))
				break;
			if (content.find("JSON_BEGIN") != std::string::npos)
				inBlock = true;
			continue;
		}

		if (content.find("JSON_END") != std::string::npos)
			break;

		std::smatch match;
		if (!std::regex_search(content, match, s_PlayerRow))
			continue;

		if (const auto id = ParseInt<int64_t>(match.str(1)))
			players.push_back(*id);
	}

	return players;
}

std::optional<ParsedEvent> RoundEndMatcher::TryMatch(const DecodedLine& line, const MatchContext& context) const
{
	if (!Matches(line.text))
		return std::nullopt;

	RoundEndEvent event;
	event.timestamp = line.timestamp;
	event.players = CollectPlayers(context.lines, line.index, context.roundStatsLookahead);
	return event;
}

/*
=============
GameOverMatcher::Parse

Game Over: <mode> <submode> <map> score <a>:<b> after <n> min
=============
*/
std::optional<GameOverEvent> GameOverMatcher::Parse(const DecodedLine& line)
{
	static const std::regex s_Regex = BuildPattern({
		kLinePrefix, R"(Game Over: (\w+) (\w+) (\S+) score (\d+):(\d+) after (\d+) min)"
	});

	if (line.text.find("Game Over:") == std::string::npos)
		return std::nullopt;

	std::smatch match;
	if (!std::regex_match(line.text, match, s_Regex))
		return std::nullopt;

	const auto team1 = ParseInt<int>(match.str(4));
	const auto team2 = ParseInt<int>(match.str(5));
	const auto duration = ParseInt<int>(match.str(6));
	if (!team1 || !team2 || !duration)
		return std::nullopt;

	GameOverEvent event;
	event.timestamp = line.timestamp;
	event.mode = match.str(1);
	event.submode = match.str(2);
	event.map = match.str(3);
	event.team1Score = *team1;
	event.team2Score = *team2;
	event.durationMinutes = *duration;
	return event;
}

/*
=============
AccoladeMatcher::Parse

ACCOLADE, FINAL: {type}, Name<id>, VALUE: v, POS: p, SCORE: s
Separators are any mix of commas, spaces and tabs. Names may contain spaces
and brackets; the id is taken from the last <...> token.
=============
*/
std::optional<AccoladeRecord> AccoladeMatcher::Parse(const DecodedLine& line)
{
	static const std::regex s_Regex = BuildPattern({
		kLinePrefix,
		R"(ACCOLADE, FINAL: \{([^}]+)\}[,\s]+(.+)<([^<>]*)>[,\s]+VALUE: (\d+(?:\.\d+)?)[,\s]+POS: (\d+)[,\s]+SCORE: (\d+(?:\.\d+)?))"
	});

	if (line.text.find("ACCOLADE") == std::string::npos)
		return std::nullopt;

	std::smatch match;
	if (!std::regex_match(line.text, match, s_Regex))
		return std::nullopt;

	const auto value = ParseDouble(match.str(4));
	const auto position = ParseInt<int>(match.str(5));
	const auto score = ParseDouble(match.str(6));
	if (!value || !position || !score)
		return std::nullopt;

	AccoladeRecord record;
	record.type = match.str(1);
	record.playerName = std::string(TrimView(match.str(2)));
	record.playerId = ParseInt<int64_t>(match.str(3));
	record.value = *value;
	record.position = *position;
	record.score = *score;
	return record;
}

std::optional<int64_t> ParseAppServerId(std::string_view content)
{
	static const std::regex s_Regex(R"(ResetBreakpadAppId:\s*Setting\s+dedicated\s+server\s+app\s+id:\s*(\d+))",
		std::regex::optimize | std::regex::icase);

	if (!ContainsNoCase(content, "resetbreakpadappid"))
		return std::nullopt;

	std::match_results<std::string_view::const_iterator> match;
	if (!std::regex_search(content.begin(), content.end(), match, s_Regex))
		return std::nullopt;

	return ParseInt<int64_t>(match.str(1));
}

std::vector<std::unique_ptr<EventMatcher>> BuildInRoundMatchers()
{
	std::vector<std::unique_ptr<EventMatcher>> matchers;
	matchers.emplace_back(std::make_unique<RoundStartMatcher>());
	matchers.emplace_back(std::make_unique<AttackMatcher>());
	matchers.emplace_back(std::make_unique<KillMatcher>());
	matchers.emplace_back(std::make_unique<AssistMatcher>());
	matchers.emplace_back(std::make_unique<BombMatcher>());
	matchers.emplace_back(std::make_unique<RoundEndMatcher>());
	return matchers;
}

} // namespace fragline
