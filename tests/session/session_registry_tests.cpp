#include "session/session.h"
#include "session/session_registry.h"

#include <chrono>
#include <iostream>
#include <set>
#include <string>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

bool IsUuidText(const std::string& id) {
    if (id.size() != 36) {
        return false;
    }
    for (std::size_t index = 0; index < id.size(); ++index) {
        const bool dash_position = index == 8 || index == 13 || index == 18 || index == 23;
        const char ch = id[index];
        if (dash_position != (ch == '-')) {
            return false;
        }
    }
    return id[14] == '4';
}

bool TestCreateAndFind() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(1234);

    const std::string first_id = registry.CreateSession().id;
    const std::string second_id = registry.CreateSession().id;
    passed &= Expect(first_id != second_id, "Session ids should be unique.");
    passed &= Expect(IsUuidText(first_id), "Session id should be a version 4 UUID.");
    passed &= Expect(registry.Size() == 2, "Registry should hold both sessions.");

    const duelnet::session::Session* first = registry.Find(first_id);
    passed &= Expect(first != nullptr, "Created session should be found.");
    passed &= Expect(first != nullptr && first->players.empty(), "New session should have no players.");
    passed &= Expect(first != nullptr && !first->started, "New session should not be started.");
    passed &= Expect(first != nullptr && !first->completed, "New session should not be completed.");
    passed &= Expect(registry.Find(first_id) == first, "Repeated lookups should return the same session.");
    passed &= Expect(registry.Find("no-such-game") == nullptr, "Unknown id should not be found.");

    std::set<std::string> ids;
    duelnet::session::SessionRegistry busy_registry(99);
    for (int index = 0; index < 200; ++index) {
        ids.insert(busy_registry.CreateSession().id);
    }
    passed &= Expect(ids.size() == 200, "Many created sessions should all get distinct ids.");

    return passed;
}

bool TestJoinCapacityAndStart() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(7);
    const std::string id = registry.CreateSession().id;

    duelnet::session::JoinResult result = registry.Join(id, "alice");
    passed &= Expect(result.outcome == duelnet::session::JoinOutcome::Joined, "First join should succeed.");
    passed &= Expect(!result.started && result.player_count == 1, "One player should not start the game.");

    result = registry.Join(id, "alice");
    passed &= Expect(
        result.outcome == duelnet::session::JoinOutcome::NameTaken,
        "Duplicate name should be rejected.");
    passed &= Expect(registry.Find(id)->players.size() == 1, "Rejected join should not add a player.");

    result = registry.Join(id, "bob");
    passed &= Expect(result.outcome == duelnet::session::JoinOutcome::Joined, "Second join should succeed.");
    passed &= Expect(result.started && result.player_count == 2, "Filling the session should start it.");

    const duelnet::session::Session* session = registry.Find(id);
    passed &= Expect(session->started, "Full session should be started.");
    passed &= Expect(
        session->players[0].name == "alice" && session->players[1].name == "bob",
        "Players should be kept in join order.");

    result = registry.Join(id, "carol");
    passed &= Expect(result.outcome == duelnet::session::JoinOutcome::GameFull, "Third join should be full.");
    passed &= Expect(session->players.size() == duelnet::session::kMaxPlayers, "Capacity should never be exceeded.");
    passed &= Expect(session->started, "Started flag should never revert.");

    result = registry.Join(id, "alice");
    passed &= Expect(
        result.outcome == duelnet::session::JoinOutcome::GameFull,
        "Capacity should be checked before duplicate names.");

    result = registry.Join("missing", "dave");
    passed &= Expect(result.outcome == duelnet::session::JoinOutcome::InvalidGame, "Unknown game should be invalid.");

    return passed;
}

bool TestListOpen() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(11);
    const std::string open_id = registry.CreateSession().id;
    const std::string full_id = registry.CreateSession().id;
    const std::string half_id = registry.CreateSession().id;

    (void)registry.Join(full_id, "alice");
    (void)registry.Join(full_id, "bob");
    (void)registry.Join(half_id, "carol");

    const std::vector<duelnet::session::SessionSummary> open = registry.ListOpen();
    passed &= Expect(open.size() == 2, "Only non-started sessions should be listed.");
    passed &= Expect(
        open.size() == 2 &&
            open[0] == duelnet::session::SessionSummary{.id = open_id, .player_count = 0} &&
            open[1] == duelnet::session::SessionSummary{.id = half_id, .player_count = 1},
        "Listing should keep creation order and player counts.");
    passed &= Expect(registry.ListOpen() == open, "Listing should not change registry state.");

    return passed;
}

bool TestReplacePlayer() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(13);
    const std::string id = registry.CreateSession().id;
    (void)registry.Join(id, "alice");
    (void)registry.Join(id, "bob");

    duelnet::game::Player record = duelnet::game::MakePlayer("alice");
    record.body.x = 321.0F;
    record.direction.left = true;
    record.jump.jumping = true;

    const duelnet::session::Session* session = registry.ReplacePlayer(id, "alice", record);
    passed &= Expect(session != nullptr, "Replacing in a known game should return the session.");
    passed &= Expect(
        session != nullptr && session->players[0].body.x == 321.0F && session->players[0].direction.left,
        "Matching player should be overwritten.");
    passed &= Expect(
        session != nullptr && session->players[1].body.x == 100.0F,
        "Other player should be untouched.");

    duelnet::game::Player stranger = duelnet::game::MakePlayer("mallory");
    stranger.body.x = 1.0F;
    session = registry.ReplacePlayer(id, "mallory", stranger);
    passed &= Expect(session != nullptr, "Unknown name should still return the session.");
    passed &= Expect(
        session != nullptr && session->players.size() == 2 && !session->HasPlayer("mallory"),
        "Unknown name should not add a player.");
    passed &= Expect(
        session != nullptr && session->players[0].body.x == 321.0F && session->players[1].body.x == 100.0F,
        "Unknown name should leave every player untouched.");

    passed &= Expect(
        registry.ReplacePlayer("missing", "alice", record) == nullptr,
        "Unknown game should return nullptr.");

    return passed;
}

bool TestReplacePlayerKeepsName() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(19);
    const std::string id = registry.CreateSession().id;
    (void)registry.Join(id, "fred");
    (void)registry.Join(id, "wilma");

    duelnet::game::Player impostor = duelnet::game::MakePlayer("wilma");
    impostor.body.x = 55.0F;
    const duelnet::session::Session* session = registry.ReplacePlayer(id, "fred", impostor);
    passed &= Expect(session != nullptr, "Mismatched record name should still update the game.");
    passed &= Expect(
        session != nullptr && session->players[0].name == "fred" && session->players[1].name == "wilma",
        "Record name should not rename the keyed player.");
    passed &= Expect(
        session != nullptr && session->players[0].body.x == 55.0F && session->players[1].body.x == 100.0F,
        "Mismatched record should only update the keyed player.");

    duelnet::game::Player follow_up = duelnet::game::MakePlayer("fred");
    follow_up.body.x = 66.0F;
    session = registry.ReplacePlayer(id, "fred", follow_up);
    passed &= Expect(
        session != nullptr && session->players[0].body.x == 66.0F,
        "Later updates keyed on the original name should still apply.");

    return passed;
}

bool TestCompletionAndCollection() {
    bool passed = true;
    duelnet::session::SessionRegistry registry(17);
    const std::string done_id = registry.CreateSession().id;
    const std::string live_id = registry.CreateSession().id;

    const auto start = duelnet::session::SessionRegistry::Clock::time_point{} + std::chrono::hours(1);
    passed &= Expect(registry.MarkCompleted(done_id, start), "Known game should be marked completed.");
    passed &= Expect(registry.Find(done_id)->completed, "Completed flag should be set.");
    passed &= Expect(
        registry.MarkCompleted(done_id, start + std::chrono::seconds(50)),
        "Marking twice should still succeed.");
    passed &= Expect(!registry.MarkCompleted("missing", start), "Unknown game cannot be completed.");

    passed &= Expect(
        registry.CollectCompleted(start + std::chrono::seconds(59), std::chrono::seconds(60)) == 0,
        "Completed session younger than the TTL should be kept.");
    passed &= Expect(
        registry.CollectCompleted(start + std::chrono::seconds(60), std::chrono::seconds(60)) == 1,
        "Completion time should not move when marked twice.");
    passed &= Expect(registry.Find(done_id) == nullptr, "Collected session should be gone.");
    passed &= Expect(registry.Find(live_id) != nullptr, "Running session should never be collected.");
    passed &= Expect(registry.Size() == 1, "Only the live session should remain.");

    return passed;
}

}  // namespace

int main() {
    bool passed = true;

    passed &= TestCreateAndFind();
    passed &= TestJoinCapacityAndStart();
    passed &= TestListOpen();
    passed &= TestReplacePlayer();
    passed &= TestReplacePlayerKeepsName();
    passed &= TestCompletionAndCollection();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] duelnet_session_registry_tests\n";
    return 0;
}
