#include "protocol/codec.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace duelnet::protocol {
namespace {

using nlohmann::json;

constexpr const char* kCommandKey = "command";
constexpr const char* kGameIdKey = "game_id";
constexpr const char* kNameKey = "name";
constexpr const char* kMetaKey = "meta";
constexpr const char* kErrorKey = "error";
constexpr const char* kInfoKey = "info";
constexpr const char* kGamesKey = "games";
constexpr const char* kGameKey = "game";

json RectToJson(const game::Rect& rect) {
    return json{
        {"x", rect.x},
        {"y", rect.y},
        {"w", rect.w},
        {"h", rect.h},
    };
}

// Wire numbers must survive a dump/parse cycle, so non-finite or
// out-of-range values are rejected instead of converted.
float ReadFloatField(const json& object, const char* key) {
    const json& field = object.at(key);
    if (!field.is_number()) {
        throw std::invalid_argument(std::string(key) + " must be a number");
    }
    const double number = field.get<double>();
    if (!std::isfinite(number) || std::fabs(number) > std::numeric_limits<float>::max()) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    return static_cast<float>(number);
}

int ReadIntField(const json& object, const char* key) {
    const json& field = object.at(key);
    if (!field.is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer");
    }
    if (field.is_number_unsigned()) {
        const std::uint64_t number = field.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw std::invalid_argument(std::string(key) + " is out of range");
        }
        return static_cast<int>(number);
    }
    const std::int64_t number = field.get<std::int64_t>();
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    return static_cast<int>(number);
}

game::Rect RectFromJson(const json& value) {
    return game::Rect{
        .x = ReadFloatField(value, "x"),
        .y = ReadFloatField(value, "y"),
        .w = ReadFloatField(value, "w"),
        .h = ReadFloatField(value, "h"),
    };
}

json DirectionToJson(const game::Direction& direction) {
    return json{
        {"up", direction.up},
        {"down", direction.down},
        {"left", direction.left},
        {"right", direction.right},
    };
}

game::Direction DirectionFromJson(const json& value) {
    return game::Direction{
        .up = value.at("up").get<bool>(),
        .down = value.at("down").get<bool>(),
        .left = value.at("left").get<bool>(),
        .right = value.at("right").get<bool>(),
    };
}

json PlayerToJson(const game::Player& player) {
    json value{
        {"name", player.name},
        {"body", RectToJson(player.body)},
        {"direction", DirectionToJson(player.direction)},
        {"last_direction", DirectionToJson(player.last_direction)},
        {"acceleration", player.acceleration},
        {"jump",
         json{
             {"jumping", player.jump.jumping},
             {"offset", player.jump.offset},
             {"ascending", player.jump.ascending},
         }},
        {"hp", player.hp},
        {"mp", player.mp},
        {"str", player.str},
    };
    if (player.ate.has_value()) {
        value["ate"] = game::PotionTypeName(*player.ate);
    } else {
        value["ate"] = nullptr;
    }
    return value;
}

game::Player PlayerFromJson(const json& value) {
    game::Player player{};
    player.name = value.at("name").get<std::string>();
    player.body = RectFromJson(value.at("body"));
    player.direction = DirectionFromJson(value.at("direction"));
    player.last_direction = DirectionFromJson(value.at("last_direction"));
    player.acceleration = ReadFloatField(value, "acceleration");

    const json& jump = value.at("jump");
    player.jump = game::JumpState{
        .jumping = jump.at("jumping").get<bool>(),
        .offset = ReadFloatField(jump, "offset"),
        .ascending = jump.at("ascending").get<bool>(),
    };

    player.hp = ReadIntField(value, "hp");
    player.mp = ReadIntField(value, "mp");
    player.str = ReadIntField(value, "str");

    const auto ate_it = value.find("ate");
    if (ate_it != value.end() && !ate_it->is_null()) {
        game::PotionType potion_type = game::PotionType::Health;
        if (!game::TryParsePotionType(ate_it->get<std::string>(), potion_type)) {
            throw std::invalid_argument("unknown potion type: " + ate_it->get<std::string>());
        }
        player.ate = potion_type;
    }
    return player;
}

json SessionToJson(const session::Session& session) {
    json players = json::array();
    for (const game::Player& player : session.players) {
        players.push_back(PlayerToJson(player));
    }

    return json{
        {"id", session.id},
        {"players", std::move(players)},
        {"started", session.started},
        {"completed", session.completed},
    };
}

session::Session SessionFromJson(const json& value) {
    session::Session session{};
    session.id = value.at("id").get<std::string>();
    const json& players = value.at("players");
    if (!players.is_array()) {
        throw std::invalid_argument("players must be an array");
    }
    for (const json& player : players) {
        session.players.push_back(PlayerFromJson(player));
    }
    session.started = value.at("started").get<bool>();
    session.completed = value.at("completed").get<bool>();
    return session;
}

json SummaryToJson(const session::SessionSummary& summary) {
    return json::array({summary.id, summary.player_count});
}

session::SessionSummary SummaryFromJson(const json& value) {
    if (!value.is_array() || value.size() != 2) {
        throw std::invalid_argument("game summary must be a [id, player_count] pair");
    }
    return session::SessionSummary{
        .id = value.at(0).get<std::string>(),
        .player_count = value.at(1).get<std::size_t>(),
    };
}

bool TryReadStringField(const json& object, const char* key, std::string& out_value) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return false;
    }
    out_value = it->get<std::string>();
    return true;
}

bool TryParseObject(std::string_view text, json& out_value, std::string& out_error) {
    out_value = json::parse(text.begin(), text.end(), nullptr, false);
    if (out_value.is_discarded()) {
        out_error = "payload is not valid JSON";
        return false;
    }
    if (!out_value.is_object()) {
        out_error = "payload is not a JSON object";
        return false;
    }
    return true;
}

}  // namespace

std::string Codec::EncodeRequest(const Request& request) {
    json value{{kCommandKey, CommandName(KindOf(request))}};
    std::visit(
        [&value](const auto& typed_request) {
            using T = std::decay_t<decltype(typed_request)>;
            if constexpr (std::is_same_v<T, JoinGameRequest>) {
                value[kGameIdKey] = typed_request.game_id;
                value[kNameKey] = typed_request.name;
            } else if constexpr (std::is_same_v<T, SendPositionRequest>) {
                value[kGameIdKey] = typed_request.game_id;
                value[kNameKey] = typed_request.name;
                value[kMetaKey] = EncodePlayer(typed_request.player);
            } else if constexpr (
                std::is_same_v<T, GameInfoRequest> ||
                std::is_same_v<T, GetWorldRequest> ||
                std::is_same_v<T, EndGameRequest>) {
                value[kGameIdKey] = typed_request.game_id;
            }
        },
        request);
    return value.dump();
}

DecodeStatus Codec::DecodeRequest(
    std::string_view text,
    Request& out_request,
    std::string& out_error) {
    json value;
    if (!TryParseObject(text, value, out_error)) {
        return DecodeStatus::Malformed;
    }

    std::string command_name;
    CommandKind kind = CommandKind::NewGame;
    if (!TryReadStringField(value, kCommandKey, command_name)) {
        out_error = "missing command field";
        return DecodeStatus::InvalidCommand;
    }
    if (!TryParseCommandName(command_name, kind)) {
        out_error = "unknown command: " + command_name;
        return DecodeStatus::InvalidCommand;
    }

    std::string game_id;
    std::string name;
    const bool has_game_id = TryReadStringField(value, kGameIdKey, game_id);
    const bool has_name = TryReadStringField(value, kNameKey, name);

    switch (kind) {
        case CommandKind::NewGame:
            out_request = NewGameRequest{};
            break;
        case CommandKind::ListGames:
            out_request = ListGamesRequest{};
            break;
        case CommandKind::JoinGame:
            if (!has_game_id || !has_name) {
                out_error = "joingame requires game_id and name";
                return DecodeStatus::InvalidCommand;
            }
            out_request = JoinGameRequest{.game_id = std::move(game_id), .name = std::move(name)};
            break;
        case CommandKind::GameInfo:
            if (!has_game_id) {
                out_error = "gameinfo requires game_id";
                return DecodeStatus::InvalidCommand;
            }
            out_request = GameInfoRequest{.game_id = std::move(game_id)};
            break;
        case CommandKind::SendPosition: {
            std::string meta;
            const auto meta_it = value.find(kMetaKey);
            if (meta_it != value.end() && meta_it->is_object()) {
                meta = meta_it->dump();
            } else if (meta_it != value.end() && meta_it->is_string()) {
                meta = meta_it->get<std::string>();
            }
            if (!has_game_id || !has_name || meta.empty()) {
                out_error = "sendposition requires game_id, name and meta";
                return DecodeStatus::InvalidCommand;
            }
            game::Player player{};
            std::string player_error;
            if (!DecodePlayer(meta, player, player_error)) {
                out_error = "sendposition meta is not a player record: " + player_error;
                return DecodeStatus::InvalidCommand;
            }
            out_request = SendPositionRequest{
                .game_id = std::move(game_id),
                .name = std::move(name),
                .player = std::move(player),
            };
            break;
        }
        case CommandKind::GetWorld:
            if (!has_game_id) {
                out_error = "getworld requires game_id";
                return DecodeStatus::InvalidCommand;
            }
            out_request = GetWorldRequest{.game_id = std::move(game_id)};
            break;
        case CommandKind::EndGame:
            if (!has_game_id) {
                out_error = "endgame requires game_id";
                return DecodeStatus::InvalidCommand;
            }
            out_request = EndGameRequest{.game_id = std::move(game_id)};
            break;
    }

    out_error.clear();
    return DecodeStatus::Ok;
}

std::string Codec::EncodeResponse(const Response& response) {
    return std::visit(
        [](const auto& typed_response) -> std::string {
            using T = std::decay_t<decltype(typed_response)>;
            if constexpr (std::is_same_v<T, ErrorResponse>) {
                return json{{kErrorKey, typed_response.message}}.dump();
            } else if constexpr (std::is_same_v<T, GameCreatedResponse>) {
                return json{{kGameIdKey, typed_response.game_id}}.dump();
            } else if constexpr (std::is_same_v<T, GameListResponse>) {
                json games = json::array();
                for (const session::SessionSummary& summary : typed_response.games) {
                    games.push_back(SummaryToJson(summary));
                }
                return json{{kGamesKey, std::move(games)}}.dump();
            } else if constexpr (std::is_same_v<T, InfoResponse>) {
                return json{{kInfoKey, typed_response.info}}.dump();
            } else if constexpr (std::is_same_v<T, GameInfoResponse>) {
                return json{{kGameKey, SummaryToJson(typed_response.game)}}.dump();
            } else {
                static_assert(std::is_same_v<T, WorldResponse>);
                return SessionToJson(typed_response.session).dump();
            }
        },
        response);
}

bool Codec::DecodeResponse(
    CommandKind issued_command,
    std::string_view text,
    Response& out_response,
    std::string& out_error) {
    json value;
    if (!TryParseObject(text, value, out_error)) {
        return false;
    }

    std::string error_message;
    if (TryReadStringField(value, kErrorKey, error_message)) {
        out_response = ErrorResponse{.message = std::move(error_message)};
        out_error.clear();
        return true;
    }

    try {
        switch (issued_command) {
            case CommandKind::NewGame:
                out_response = GameCreatedResponse{
                    .game_id = value.at(kGameIdKey).get<std::string>(),
                };
                break;
            case CommandKind::ListGames: {
                GameListResponse list{};
                for (const json& entry : value.at(kGamesKey)) {
                    list.games.push_back(SummaryFromJson(entry));
                }
                out_response = std::move(list);
                break;
            }
            case CommandKind::JoinGame:
            case CommandKind::EndGame:
                out_response = InfoResponse{.info = value.at(kInfoKey).get<std::string>()};
                break;
            case CommandKind::GameInfo:
                out_response = GameInfoResponse{.game = SummaryFromJson(value.at(kGameKey))};
                break;
            case CommandKind::SendPosition:
            case CommandKind::GetWorld:
                out_response = WorldResponse{.session = SessionFromJson(value)};
                break;
        }
    } catch (const json::exception& exception) {
        out_error = std::string(CommandName(issued_command)) + " response: " + exception.what();
        return false;
    } catch (const std::invalid_argument& exception) {
        out_error = std::string(CommandName(issued_command)) + " response: " + exception.what();
        return false;
    }

    out_error.clear();
    return true;
}

std::string Codec::EncodePlayer(const game::Player& player) {
    return PlayerToJson(player).dump();
}

bool Codec::DecodePlayer(std::string_view text, game::Player& out_player, std::string& out_error) {
    json value;
    if (!TryParseObject(text, value, out_error)) {
        return false;
    }

    try {
        out_player = PlayerFromJson(value);
    } catch (const json::exception& exception) {
        out_error = std::string("player: ") + exception.what();
        return false;
    } catch (const std::invalid_argument& exception) {
        out_error = std::string("player: ") + exception.what();
        return false;
    }

    out_error.clear();
    return true;
}

std::string Codec::EncodeSession(const session::Session& session) {
    return SessionToJson(session).dump();
}

bool Codec::DecodeSession(
    std::string_view text,
    session::Session& out_session,
    std::string& out_error) {
    json value;
    if (!TryParseObject(text, value, out_error)) {
        return false;
    }

    try {
        out_session = SessionFromJson(value);
    } catch (const json::exception& exception) {
        out_error = std::string("session: ") + exception.what();
        return false;
    } catch (const std::invalid_argument& exception) {
        out_error = std::string("session: ") + exception.what();
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace duelnet::protocol
