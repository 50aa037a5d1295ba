#include "client/loopback_channel.h"
#include "client/session_client.h"
#include "client/sync_loop.h"
#include "game/local_simulation.h"
#include "server/command_dispatcher.h"
#include "session/session_registry.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using Clock = duelnet::client::ClientSyncLoop::Clock;
using std::chrono::milliseconds;

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

duelnet::client::SyncSettings DefaultSettings() {
    return duelnet::client::SyncSettings{
        .physics_period = milliseconds(33),
        .network_period = milliseconds(20),
        .wait_poll_period = milliseconds(500),
    };
}

// Forwards everything except sendposition, which always times out.
class PushFailingChannel final : public duelnet::client::IRequestChannel {
public:
    explicit PushFailingChannel(duelnet::client::IRequestChannel& inner)
        : inner_(inner) {}

    bool Exchange(
        const duelnet::protocol::Request& request,
        duelnet::protocol::Response& out_response,
        std::string& out_error) override {
        if (duelnet::protocol::KindOf(request) == duelnet::protocol::CommandKind::SendPosition) {
            out_error = "sendposition reply timed out";
            return false;
        }
        return inner_.Exchange(request, out_response, out_error);
    }

private:
    duelnet::client::IRequestChannel& inner_;
};

struct ServerSide final {
    duelnet::session::SessionRegistry registry{21};
    duelnet::server::CommandDispatcher dispatcher{registry};
};

bool TestSessionClientErrors() {
    bool passed = true;
    ServerSide server;
    duelnet::client::LoopbackChannel channel(server.dispatcher);
    duelnet::client::SessionClient session_client(channel);
    std::string error;

    std::string game_id;
    passed &= Expect(session_client.NewGame(game_id, error), "newgame should succeed.");
    std::vector<duelnet::session::SessionSummary> games;
    passed &= Expect(session_client.ListGames(games, error), "listgames should succeed.");
    passed &= Expect(games.size() == 1 && games[0].player_count == 0, "New game should be listed empty.");

    duelnet::session::SessionSummary summary{};
    passed &= Expect(!session_client.GameInfo("missing", summary, error), "Unknown game should fail.");
    passed &= Expect(error == "Invalid Game missing", "Error response text should be surfaced.");

    channel.SetDropReplies(true);
    std::string info;
    passed &= Expect(
        !session_client.JoinGame(game_id, "alice", info, error),
        "Dropped reply should fail the call.");
    passed &= Expect(
        server.registry.Find(game_id)->players.size() == 1,
        "Request should still reach the server when only the reply is lost.");
    passed &= Expect(channel.ExchangeCount() == 4, "Every call should go through the channel.");

    return passed;
}

bool TestWaitingThenRunning() {
    bool passed = true;
    ServerSide server;
    duelnet::client::LoopbackChannel alice_channel(server.dispatcher);
    duelnet::client::LoopbackChannel bob_channel(server.dispatcher);
    duelnet::client::SessionClient alice_client(alice_channel);
    duelnet::client::SessionClient bob_client(bob_channel);
    std::string error;
    std::string info;

    std::string game_id;
    passed &= Expect(alice_client.NewGame(game_id, error), "newgame should succeed.");
    passed &= Expect(alice_client.JoinGame(game_id, "alice", info, error), "alice should join.");

    duelnet::game::LocalSimulation alice_sim(duelnet::game::MakePlayer("alice"), 1);
    duelnet::client::ClientSyncLoop alice_loop(alice_channel, game_id, alice_sim, DefaultSettings());
    passed &= Expect(
        alice_loop.Phase() == duelnet::client::SyncPhase::WaitingForStart,
        "Loop should start out waiting.");

    const Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);
    alice_loop.Tick(t0);
    passed &= Expect(alice_loop.Diagnostics().wait_poll_count == 1, "First tick should poll immediately.");
    passed &= Expect(alice_loop.Diagnostics().physics_tick_count == 1, "First tick should run physics.");
    passed &= Expect(
        alice_loop.Phase() == duelnet::client::SyncPhase::WaitingForStart,
        "Single-player game should keep waiting.");

    alice_loop.Tick(t0 + milliseconds(100));
    passed &= Expect(alice_loop.Diagnostics().wait_poll_count == 1, "Waiting poll should respect its slower period.");
    passed &= Expect(alice_loop.Diagnostics().network_tick_count == 0, "No network ticks before the game starts.");

    passed &= Expect(bob_client.JoinGame(game_id, "bob", info, error), "bob should join.");
    duelnet::game::Player bob = duelnet::game::MakePlayer("bob");
    bob.body.x = 400.0F;
    duelnet::session::Session session{};
    passed &= Expect(bob_client.SendPosition(game_id, bob, session, error), "bob should push his position.");

    alice_loop.Tick(t0 + milliseconds(500));
    passed &= Expect(alice_loop.Diagnostics().wait_poll_count == 2, "Second poll should fire after its period.");
    passed &= Expect(
        alice_loop.Phase() == duelnet::client::SyncPhase::Running,
        "Started game should switch the loop to running.");
    passed &= Expect(alice_sim.HasOpponent(), "Start should hydrate the opponent.");
    passed &= Expect(
        alice_sim.HasOpponent() && alice_sim.Opponent().name == "bob" && alice_sim.Opponent().body.x == 400.0F,
        "Opponent should be the other player's record.");

    alice_loop.Tick(t0 + milliseconds(501));
    passed &= Expect(alice_loop.Diagnostics().network_tick_count == 1, "First running tick should sync immediately.");

    const duelnet::session::Session* stored = server.registry.Find(game_id);
    passed &= Expect(
        stored != nullptr && stored->FindPlayer("alice") != nullptr,
        "alice's record should be on the server.");

    alice_sim.LocalPlayer().body.x = 222.0F;
    alice_loop.Tick(t0 + milliseconds(510));
    passed &= Expect(alice_loop.Diagnostics().network_tick_count == 1, "Network tick should respect its period.");
    alice_loop.Tick(t0 + milliseconds(521));
    passed &= Expect(alice_loop.Diagnostics().network_tick_count == 2, "Network tick should fire after 20 ms.");
    stored = server.registry.Find(game_id);
    passed &= Expect(
        stored != nullptr && stored->FindPlayer("alice")->body.x >= 222.0F - 10.0F,
        "Pushed record should carry the local position.");

    bob.body.x = 50.0F;
    bob.direction.up = true;
    passed &= Expect(bob_client.SendPosition(game_id, bob, session, error), "bob should move.");
    alice_loop.Tick(t0 + milliseconds(545));
    passed &= Expect(alice_sim.Opponent().body.x == 50.0F, "Opponent body should follow the server.");
    passed &= Expect(alice_sim.Opponent().direction.up, "Opponent direction should follow the server.");

    return passed;
}

bool TestDroppedRepliesKeepLastKnownState() {
    bool passed = true;
    ServerSide server;
    duelnet::client::LoopbackChannel alice_channel(server.dispatcher);
    duelnet::client::LoopbackChannel bob_channel(server.dispatcher);
    duelnet::client::SessionClient bob_client(bob_channel);
    std::string error;
    std::string info;

    const std::string game_id = server.registry.CreateSession().id;
    (void)server.registry.Join(game_id, "alice");
    (void)server.registry.Join(game_id, "bob");

    duelnet::game::LocalSimulation alice_sim(duelnet::game::MakePlayer("alice"), 2);
    duelnet::client::ClientSyncLoop alice_loop(alice_channel, game_id, alice_sim, DefaultSettings());
    const Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);
    alice_loop.Tick(t0);
    passed &= Expect(alice_loop.Phase() == duelnet::client::SyncPhase::Running, "Full game should run at once.");

    duelnet::game::Player bob = duelnet::game::MakePlayer("bob");
    bob.body.x = 300.0F;
    duelnet::session::Session session{};
    passed &= Expect(bob_client.SendPosition(game_id, bob, session, error), "bob should push.");
    alice_loop.Tick(t0 + milliseconds(20));
    passed &= Expect(alice_sim.Opponent().body.x == 300.0F, "Opponent should be synced.");

    alice_channel.SetDropReplies(true);
    bob.body.x = 10.0F;
    passed &= Expect(bob_client.SendPosition(game_id, bob, session, error), "bob should push again.");
    alice_loop.Tick(t0 + milliseconds(40));
    passed &= Expect(alice_sim.Opponent().body.x == 300.0F, "Lost replies should keep the last known opponent.");
    passed &= Expect(alice_loop.Diagnostics().push_failure_count == 1, "Lost push reply should be counted.");
    passed &= Expect(alice_loop.Diagnostics().pull_failure_count == 1, "Lost pull reply should be counted.");
    passed &= Expect(alice_loop.Diagnostics().stale_tick_count == 1, "Stale tick should be counted.");
    passed &= Expect(alice_loop.ConsecutiveFailures() == 2, "Both failed round trips should be tracked.");
    passed &= Expect(!alice_loop.LastError().empty(), "Last error should be kept.");
    passed &= Expect(
        alice_loop.Phase() == duelnet::client::SyncPhase::Running,
        "Lost replies should not leave the running phase.");

    const std::uint64_t steps_before = alice_sim.StepCount();
    alice_loop.Tick(t0 + milliseconds(80));
    passed &= Expect(alice_sim.StepCount() == steps_before + 1, "Physics should keep running without replies.");

    alice_channel.SetDropReplies(false);
    alice_loop.Tick(t0 + milliseconds(100));
    passed &= Expect(alice_sim.Opponent().body.x == 10.0F, "Recovered link should catch up with the server.");
    passed &= Expect(alice_loop.ConsecutiveFailures() == 0, "Recovered link should reset the failure streak.");

    return passed;
}

bool TestFailedPushKeepsLinkDegraded() {
    bool passed = true;
    ServerSide server;
    duelnet::client::LoopbackChannel loopback(server.dispatcher);
    PushFailingChannel channel(loopback);

    const std::string game_id = server.registry.CreateSession().id;
    (void)server.registry.Join(game_id, "alice");
    (void)server.registry.Join(game_id, "bob");

    duelnet::game::LocalSimulation sim(duelnet::game::MakePlayer("alice"), 6);
    duelnet::client::ClientSyncLoop loop(channel, game_id, sim, DefaultSettings());
    const Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);
    loop.Tick(t0);
    passed &= Expect(loop.Phase() == duelnet::client::SyncPhase::Running, "Full game should run at once.");

    loop.Tick(t0 + milliseconds(20));
    loop.Tick(t0 + milliseconds(40));
    loop.Tick(t0 + milliseconds(60));
    passed &= Expect(loop.Diagnostics().push_failure_count == 3, "Every failed push should be counted.");
    passed &= Expect(loop.Diagnostics().pull_failure_count == 0, "Pulls should keep succeeding.");
    passed &= Expect(sim.HasOpponent(), "Successful pulls should still reconcile the opponent.");
    passed &= Expect(
        loop.ConsecutiveFailures() == 3,
        "A successful pull should not clear a streak of failed pushes.");
    passed &= Expect(
        loop.LastError() == "sendposition reply timed out",
        "Failed push should leave its error visible.");

    return passed;
}

bool TestOpponentMissingAndCadence() {
    bool passed = true;
    ServerSide server;
    duelnet::client::LoopbackChannel channel(server.dispatcher);

    const std::string game_id = server.registry.CreateSession().id;
    (void)server.registry.Join(game_id, "alice");
    (void)server.registry.Join(game_id, "bob");

    duelnet::game::LocalSimulation sim(duelnet::game::MakePlayer("alice"), 3);
    duelnet::client::ClientSyncLoop loop(channel, game_id, sim, DefaultSettings());
    const Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);

    for (int millisecond = 0; millisecond <= 990; millisecond += 10) {
        loop.Tick(t0 + milliseconds(millisecond));
    }
    passed &= Expect(loop.Diagnostics().physics_tick_count == 25, "Physics should fire every 33 ms on a 10 ms clock.");
    passed &= Expect(loop.Diagnostics().network_tick_count == 50, "Network should fire every 20 ms once running.");

    duelnet::session::SessionRegistry lonely_registry(4);
    duelnet::server::CommandDispatcher lonely_dispatcher(lonely_registry);
    duelnet::client::LoopbackChannel lonely_channel(lonely_dispatcher);
    const std::string lonely_id = lonely_registry.CreateSession().id;
    (void)lonely_registry.Join(lonely_id, "alice");
    (void)lonely_registry.Join(lonely_id, "alice2");
    lonely_registry.Find(lonely_id)->players[1].name = "alice";

    duelnet::game::LocalSimulation lonely_sim(duelnet::game::MakePlayer("alice"), 5);
    duelnet::client::ClientSyncLoop lonely_loop(lonely_channel, lonely_id, lonely_sim, DefaultSettings());
    lonely_loop.Tick(t0);
    lonely_loop.Tick(t0 + milliseconds(20));
    passed &= Expect(!lonely_sim.HasOpponent(), "Session without a differently named player has no opponent.");
    passed &= Expect(lonely_loop.Diagnostics().stale_tick_count == 1, "Missing opponent should count as stale.");

    return passed;
}

}  // namespace

int main() {
    bool passed = true;

    passed &= TestSessionClientErrors();
    passed &= TestWaitingThenRunning();
    passed &= TestDroppedRepliesKeepLastKnownState();
    passed &= TestFailedPushKeepsLinkDegraded();
    passed &= TestOpponentMissingAndCadence();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] duelnet_sync_loop_tests\n";
    return 0;
}
