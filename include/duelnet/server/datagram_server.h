#pragma once

#include "core/config.h"
#include "net/udp_transport.h"
#include "server/command_dispatcher.h"
#include "session/session_registry.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace duelnet::server {

struct ServerDiagnostics final {
    std::uint64_t received_count = 0;
    std::uint64_t dispatched_count = 0;
    std::uint64_t dropped_malformed_count = 0;
    std::uint64_t invalid_command_count = 0;
    std::uint64_t error_response_count = 0;
    std::uint64_t send_failure_count = 0;
    std::uint64_t receive_failure_count = 0;
    std::uint64_t collected_session_count = 0;
};

// Single-threaded receive -> decode -> dispatch -> encode -> reply loop. The
// server owns the registry, so all session mutations are serialized here.
class DatagramServer final {
public:
    using Clock = std::chrono::steady_clock;

    explicit DatagramServer(const core::ServerConfig& config);
    DatagramServer(const core::ServerConfig& config, session::SessionRegistry registry);

    DatagramServer(const DatagramServer&) = delete;
    DatagramServer& operator=(const DatagramServer&) = delete;

    bool Open(std::string& out_error);
    void Close();
    bool IsOpen() const;
    std::uint16_t LocalPort() const;

    // Waits up to receive_timeout_ms for one packet and handles it. Returns
    // false only when the socket itself failed.
    bool PollOnce(std::string& out_error);

    // Polls until keep_running clears or the socket is closed. Other receive
    // failures back off for receive_timeout_ms before the next poll.
    void Run(const std::atomic_bool& keep_running);

    // Decodes and dispatches one payload. Returns false when the payload is
    // dropped and no reply must be sent.
    bool HandlePayload(std::string_view payload, std::string& out_reply);

    // Removes expired completed sessions once per sweep interval.
    void MaybeSweep(Clock::time_point now);

    session::SessionRegistry& Registry();
    const session::SessionRegistry& Registry() const;
    const ServerDiagnostics& Diagnostics() const;

private:
    core::ServerConfig config_;
    session::SessionRegistry registry_;
    CommandDispatcher dispatcher_;
    net::UdpTransport transport_;
    ServerDiagnostics diagnostics_;
    Clock::time_point last_sweep_time_ = Clock::now();
};

}  // namespace duelnet::server
