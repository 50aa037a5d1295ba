#include "client/request_channel.h"

#include "core/logger.h"
#include "protocol/codec.h"

#include <utility>

namespace duelnet::client {

UdpRequestChannel::UdpRequestChannel(UdpChannelSettings settings)
    : settings_(std::move(settings)) {}

bool UdpRequestChannel::Exchange(
    const protocol::Request& request,
    protocol::Response& out_response,
    std::string& out_error) {
    const protocol::CommandKind kind = protocol::KindOf(request);
    std::string reply_text;
    if (!ExchangeText(protocol::Codec::EncodeRequest(request), reply_text, out_error)) {
        return false;
    }

    if (!protocol::Codec::DecodeResponse(kind, reply_text, out_response, out_error)) {
        out_error = "undecodable " + std::string(protocol::CommandName(kind)) + " reply: " + out_error;
        return false;
    }
    return true;
}

bool UdpRequestChannel::ExchangeText(
    std::string_view request_text,
    std::string& out_reply_text,
    std::string& out_error) {
    ++diagnostics_.request_count;

    net::UdpTransport transport;
    if (!transport.Open(settings_.local_host, 0, out_error)) {
        ++diagnostics_.transport_failure_count;
        return false;
    }
    if (!transport.SendTo(settings_.server, request_text, out_error)) {
        ++diagnostics_.transport_failure_count;
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + settings_.reply_timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        net::UdpEndpoint sender{};
        const net::ReceiveStatus status =
            transport.ReceiveFor(remaining, out_reply_text, sender, out_error);
        if (status == net::ReceiveStatus::TimedOut) {
            break;
        }
        if (status == net::ReceiveStatus::Failed) {
            ++diagnostics_.transport_failure_count;
            return false;
        }
        if (!IsServerEndpoint(sender)) {
            ++diagnostics_.ignored_foreign_reply_count;
            core::Logger::Debug(
                "client",
                "Ignored datagram from unexpected sender " + net::EndpointToString(sender));
            continue;
        }

        out_error.clear();
        return true;
    }

    ++diagnostics_.timeout_count;
    out_error = "no reply from " + net::EndpointToString(settings_.server) + " within " +
        std::to_string(settings_.reply_timeout.count()) + " ms";
    return false;
}

const UdpChannelSettings& UdpRequestChannel::Settings() const {
    return settings_;
}

const UdpChannelDiagnostics& UdpRequestChannel::Diagnostics() const {
    return diagnostics_;
}

bool UdpRequestChannel::IsServerEndpoint(const net::UdpEndpoint& sender) const {
    if (sender.port != settings_.server.port) {
        return false;
    }
    const std::string& host = settings_.server.host;
    return host == "0.0.0.0" || host == "localhost" || host == sender.host;
}

}  // namespace duelnet::client
