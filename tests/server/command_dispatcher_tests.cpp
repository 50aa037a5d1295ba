#include "protocol/codec.h"
#include "protocol/messages.h"
#include "server/command_dispatcher.h"
#include "session/session_registry.h"

#include <chrono>
#include <iostream>
#include <string>
#include <variant>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

std::string DispatchToText(
    duelnet::server::CommandDispatcher& dispatcher,
    const duelnet::protocol::Request& request) {
    return duelnet::protocol::Codec::EncodeResponse(dispatcher.Dispatch(request));
}

std::string NewGame(duelnet::server::CommandDispatcher& dispatcher) {
    const duelnet::protocol::Response response = dispatcher.Dispatch(duelnet::protocol::NewGameRequest{});
    const auto* created = std::get_if<duelnet::protocol::GameCreatedResponse>(&response);
    return created != nullptr ? created->game_id : std::string();
}

bool TestNewGameAndListing() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(1);
    duelnet::server::CommandDispatcher dispatcher(registry);

    const std::string first_id = NewGame(dispatcher);
    const std::string second_id = NewGame(dispatcher);
    passed &= Expect(!first_id.empty(), "newgame should return a game id.");
    passed &= Expect(first_id != second_id, "newgame should return a fresh id each time.");

    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::ListGamesRequest{}) ==
            "{\"games\":[[\"" + first_id + "\",0],[\"" + second_id + "\",0]]}",
        "listgames should include new games with zero players.");

    return passed;
}

bool TestJoinSequence() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(2);
    duelnet::server::CommandDispatcher dispatcher(registry);
    const std::string id = NewGame(dispatcher);

    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::JoinGameRequest{.game_id = id, .name = "alice"}) ==
            "{\"info\":\"joined not started game " + id + " with 1 players\"}",
        "First join should report a game that has not started.");
    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::JoinGameRequest{.game_id = id, .name = "alice"}) ==
            "{\"error\":\"player alice already in game " + id + "\"}",
        "Duplicate name should be rejected.");
    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::JoinGameRequest{.game_id = id, .name = "bob"}) ==
            "{\"info\":\"joined started game " + id + " with 2 players\"}",
        "Second join should report a started game.");
    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::ListGamesRequest{}) == "{\"games\":[]}",
        "Started game should no longer be listed.");

    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::JoinGameRequest{.game_id = id, .name = "carol"}) ==
            "{\"error\":\"game " + id + " is full\"}",
        "Third join should report a full game.");
    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::GameInfoRequest{.game_id = id}) ==
            "{\"game\":[\"" + id + "\",2]}",
        "gameinfo should still report two players.");
    passed &= Expect(registry.Find(id)->started, "Full game should stay started.");

    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::JoinGameRequest{.game_id = "nope", .name = "dave"}) ==
            "{\"error\":\"Invalid Game nope\"}",
        "Join on an unknown game should be invalid.");

    return passed;
}

bool TestPositionAndWorld() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(3);
    duelnet::server::CommandDispatcher dispatcher(registry);
    const std::string id = NewGame(dispatcher);
    (void)dispatcher.Dispatch(duelnet::protocol::JoinGameRequest{.game_id = id, .name = "Fred"});
    (void)dispatcher.Dispatch(duelnet::protocol::JoinGameRequest{.game_id = id, .name = "Wilma"});

    duelnet::game::Player fred = duelnet::game::MakePlayer("Fred");
    fred.body = duelnet::game::Rect{.x = 10.0F, .y = 20.0F, .w = 34.0F, .h = 44.0F};
    const duelnet::protocol::Response pushed = dispatcher.Dispatch(duelnet::protocol::SendPositionRequest{
        .game_id = id,
        .name = "Fred",
        .player = fred,
    });
    passed &= Expect(
        std::holds_alternative<duelnet::protocol::WorldResponse>(pushed),
        "sendposition should answer with the session.");

    const duelnet::protocol::Response world = dispatcher.Dispatch(duelnet::protocol::GetWorldRequest{.game_id = id});
    const auto* world_response = std::get_if<duelnet::protocol::WorldResponse>(&world);
    passed &= Expect(world_response != nullptr, "getworld should answer with the session.");
    if (world_response != nullptr) {
        const duelnet::game::Player* stored = world_response->session.FindPlayer("Fred");
        passed &= Expect(
            stored != nullptr && stored->body == fred.body,
            "getworld should return the exact body sent for Fred.");
        passed &= Expect(world_response->session.started, "Session should be started.");
    }

    duelnet::game::Player ghost = duelnet::game::MakePlayer("Ghost");
    const std::string before = DispatchToText(dispatcher, duelnet::protocol::GetWorldRequest{.game_id = id});
    const std::string ignored = DispatchToText(
        dispatcher,
        duelnet::protocol::SendPositionRequest{.game_id = id, .name = "Ghost", .player = ghost});
    passed &= Expect(ignored == before, "Unknown player update should return the unchanged session.");

    duelnet::game::Player renamed = duelnet::game::MakePlayer("Wilma");
    renamed.body.x = 77.0F;
    const duelnet::protocol::Response rename_attempt = dispatcher.Dispatch(
        duelnet::protocol::SendPositionRequest{.game_id = id, .name = "Fred", .player = renamed});
    const auto* rename_world = std::get_if<duelnet::protocol::WorldResponse>(&rename_attempt);
    passed &= Expect(
        rename_world != nullptr && rename_world->session.players[0].name == "Fred" &&
            rename_world->session.players[1].name == "Wilma",
        "A record carrying another name should not rename the sender.");
    passed &= Expect(
        rename_world != nullptr && rename_world->session.players[0].body.x == 77.0F,
        "A record carrying another name should still update the sender's position.");

    return passed;
}

bool TestInvalidGames() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(4);
    duelnet::server::CommandDispatcher dispatcher(registry);
    const std::string fabricated = "00000000-0000-4000-8000-000000000000";

    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::GameInfoRequest{.game_id = fabricated}) ==
            "{\"error\":\"Invalid Game " + fabricated + "\"}",
        "gameinfo on a fabricated id should be invalid.");
    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::GetWorldRequest{.game_id = fabricated}) ==
            "{\"error\":\"Invalid Game " + fabricated + "\"}",
        "getworld on a fabricated id should be invalid.");
    passed &= Expect(
        DispatchToText(
            dispatcher,
            duelnet::protocol::SendPositionRequest{
                .game_id = fabricated,
                .name = "Fred",
                .player = duelnet::game::MakePlayer("Fred"),
            }) == "{\"error\":\"Invalid Game " + fabricated + "\"}",
        "sendposition on a fabricated id should be invalid.");
    passed &= Expect(registry.Size() == 0, "Invalid lookups should not create sessions.");
    passed &= Expect(
        duelnet::protocol::Codec::EncodeResponse(duelnet::server::CommandDispatcher::InvalidCommand()) ==
            "{\"error\":\"Invalid Command\"}",
        "Invalid command reply should be fixed text.");

    return passed;
}

bool TestEndGame() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(5);
    auto fake_now = duelnet::server::CommandDispatcher::Clock::time_point{} + std::chrono::hours(2);
    duelnet::server::CommandDispatcher dispatcher(registry, [&fake_now]() { return fake_now; });
    const std::string id = NewGame(dispatcher);

    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::EndGameRequest{.game_id = id}) ==
            "{\"info\":\"completed game " + id + "\"}",
        "endgame should confirm completion.");
    passed &= Expect(registry.Find(id)->completed, "endgame should set completed.");
    passed &= Expect(
        registry.Find(id)->completed_at == fake_now,
        "endgame should stamp completion with the dispatcher clock.");
    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::EndGameRequest{.game_id = id}) ==
            "{\"info\":\"completed game " + id + "\"}",
        "endgame should be idempotent.");
    passed &= Expect(
        DispatchToText(dispatcher, duelnet::protocol::EndGameRequest{.game_id = "gone"}) ==
            "{\"error\":\"Invalid Game gone\"}",
        "endgame on an unknown game should be invalid.");

    const std::string world = DispatchToText(dispatcher, duelnet::protocol::GetWorldRequest{.game_id = id});
    passed &= Expect(
        world.find("\"completed\":true") != std::string::npos,
        "Completed flag should be visible on the wire.");

    return passed;
}

}  // namespace

int main() {
    bool passed = true;

    passed &= TestNewGameAndListing();
    passed &= TestJoinSequence();
    passed &= TestPositionAndWorld();
    passed &= TestInvalidGames();
    passed &= TestEndGame();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] duelnet_command_dispatcher_tests\n";
    return 0;
}
