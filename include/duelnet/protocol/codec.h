#pragma once

#include "game/player.h"
#include "protocol/messages.h"
#include "session/session.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace duelnet::protocol {

enum class DecodeStatus : std::uint8_t {
    Ok = 0,
    // Not a JSON object at all. The server drops these without replying.
    Malformed = 1,
    // Well-formed JSON naming an unknown command or missing required fields.
    InvalidCommand = 2,
};

// JSON text codec for the session protocol. Every function is stateless.
class Codec final {
public:
    static std::string EncodeRequest(const Request& request);
    static DecodeStatus DecodeRequest(
        std::string_view text,
        Request& out_request,
        std::string& out_error);

    static std::string EncodeResponse(const Response& response);

    // Success shapes differ per command, so the caller names the command it issued.
    static bool DecodeResponse(
        CommandKind issued_command,
        std::string_view text,
        Response& out_response,
        std::string& out_error);

    // Transient fields (animation_frame) are not encoded.
    static std::string EncodePlayer(const game::Player& player);
    static bool DecodePlayer(std::string_view text, game::Player& out_player, std::string& out_error);

    static std::string EncodeSession(const session::Session& session);
    static bool DecodeSession(
        std::string_view text,
        session::Session& out_session,
        std::string& out_error);
};

}  // namespace duelnet::protocol
