#include "server/datagram_server.h"

#include "core/logger.h"
#include "protocol/codec.h"

#include <string>
#include <thread>
#include <utility>

namespace duelnet::server {
namespace {

constexpr std::size_t kLoggedPayloadPrefix = 96;

std::string PayloadPreview(std::string_view payload) {
    if (payload.size() <= kLoggedPayloadPrefix) {
        return std::string(payload);
    }
    return std::string(payload.substr(0, kLoggedPayloadPrefix)) + "...";
}

}  // namespace

DatagramServer::DatagramServer(const core::ServerConfig& config)
    : config_(config),
      dispatcher_(registry_) {}

DatagramServer::DatagramServer(const core::ServerConfig& config, session::SessionRegistry registry)
    : config_(config),
      registry_(std::move(registry)),
      dispatcher_(registry_) {}

bool DatagramServer::Open(std::string& out_error) {
    if (!transport_.Open(config_.bind_host, config_.port, out_error)) {
        return false;
    }

    core::Logger::Info(
        "server",
        "Listening on " + config_.bind_host + ":" + std::to_string(transport_.LocalPort()) +
            ", receive_timeout_ms=" + std::to_string(config_.receive_timeout_ms));
    out_error.clear();
    return true;
}

void DatagramServer::Close() {
    transport_.Close();
}

bool DatagramServer::IsOpen() const {
    return transport_.IsOpen();
}

std::uint16_t DatagramServer::LocalPort() const {
    return transport_.LocalPort();
}

bool DatagramServer::PollOnce(std::string& out_error) {
    std::string payload;
    net::UdpEndpoint sender{};
    const net::ReceiveStatus status = transport_.ReceiveFor(
        std::chrono::milliseconds(config_.receive_timeout_ms),
        payload,
        sender,
        out_error);
    if (status == net::ReceiveStatus::TimedOut) {
        out_error.clear();
        return true;
    }
    if (status == net::ReceiveStatus::Failed) {
        ++diagnostics_.receive_failure_count;
        return false;
    }

    std::string reply;
    if (!HandlePayload(payload, reply)) {
        core::Logger::Warn("server", "Dropped undecodable packet from " + net::EndpointToString(sender));
        out_error.clear();
        return true;
    }

    std::string send_error;
    if (!transport_.SendTo(sender, reply, send_error)) {
        ++diagnostics_.send_failure_count;
        core::Logger::Warn(
            "server",
            "Reply to " + net::EndpointToString(sender) + " failed: " + send_error);
    }

    out_error.clear();
    return true;
}

void DatagramServer::Run(const std::atomic_bool& keep_running) {
    std::string error;
    std::uint64_t consecutive_failures = 0;
    while (keep_running.load()) {
        if (!PollOnce(error)) {
            if (!transport_.IsOpen()) {
                core::Logger::Error("server", "Socket is closed, stopping loop: " + error);
                break;
            }
            ++consecutive_failures;
            if (consecutive_failures == 1) {
                core::Logger::Error("server", "Receive failed: " + error);
            } else {
                core::Logger::Debug("server", "Receive failed again: " + error);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.receive_timeout_ms));
        } else if (consecutive_failures > 0) {
            core::Logger::Info(
                "server",
                "Receive recovered after " + std::to_string(consecutive_failures) + " failure(s)");
            consecutive_failures = 0;
        }
        MaybeSweep(Clock::now());
    }

    core::Logger::Info(
        "server",
        "Loop stopped: received=" + std::to_string(diagnostics_.received_count) +
            ", dispatched=" + std::to_string(diagnostics_.dispatched_count) +
            ", dropped_malformed=" + std::to_string(diagnostics_.dropped_malformed_count) +
            ", invalid_commands=" + std::to_string(diagnostics_.invalid_command_count) +
            ", error_responses=" + std::to_string(diagnostics_.error_response_count) +
            ", send_failures=" + std::to_string(diagnostics_.send_failure_count) +
            ", sessions=" + std::to_string(registry_.Size()));
}

bool DatagramServer::HandlePayload(std::string_view payload, std::string& out_reply) {
    ++diagnostics_.received_count;

    protocol::Request request;
    std::string decode_error;
    const protocol::DecodeStatus status = protocol::Codec::DecodeRequest(payload, request, decode_error);
    if (status == protocol::DecodeStatus::Malformed) {
        ++diagnostics_.dropped_malformed_count;
        core::Logger::Warn(
            "server",
            "Decode failed (" + decode_error + "): " + PayloadPreview(payload));
        out_reply.clear();
        return false;
    }

    protocol::Response response;
    if (status == protocol::DecodeStatus::InvalidCommand) {
        ++diagnostics_.invalid_command_count;
        core::Logger::Debug("server", "Invalid command: " + decode_error);
        response = CommandDispatcher::InvalidCommand();
    } else {
        ++diagnostics_.dispatched_count;
        core::Logger::Debug(
            "server",
            std::string("Dispatching ") + protocol::CommandName(protocol::KindOf(request)));
        response = dispatcher_.Dispatch(request);
    }

    if (protocol::IsError(response)) {
        ++diagnostics_.error_response_count;
    }
    out_reply = protocol::Codec::EncodeResponse(response);
    return true;
}

void DatagramServer::MaybeSweep(Clock::time_point now) {
    if (now - last_sweep_time_ < std::chrono::seconds(config_.session_sweep_interval_seconds)) {
        return;
    }

    last_sweep_time_ = now;
    diagnostics_.collected_session_count += registry_.CollectCompleted(
        now,
        std::chrono::seconds(config_.completed_session_ttl_seconds));
}

session::SessionRegistry& DatagramServer::Registry() {
    return registry_;
}

const session::SessionRegistry& DatagramServer::Registry() const {
    return registry_;
}

const ServerDiagnostics& DatagramServer::Diagnostics() const {
    return diagnostics_;
}

}  // namespace duelnet::server
