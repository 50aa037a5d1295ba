#pragma once

#include "net/udp_transport.h"
#include "protocol/messages.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace duelnet::client {

class IRequestChannel {
public:
    virtual ~IRequestChannel() = default;

    // Returns false on transport failure or timeout. Protocol-level failures
    // come back as an ErrorResponse with a true return.
    virtual bool Exchange(
        const protocol::Request& request,
        protocol::Response& out_response,
        std::string& out_error) = 0;
};

struct UdpChannelSettings final {
    net::UdpEndpoint server{};
    std::string local_host = "0.0.0.0";
    std::chrono::milliseconds reply_timeout{50};
};

struct UdpChannelDiagnostics final {
    std::uint64_t request_count = 0;
    std::uint64_t timeout_count = 0;
    std::uint64_t transport_failure_count = 0;
    std::uint64_t ignored_foreign_reply_count = 0;
};

// Sends each request from a freshly bound ephemeral port and waits a bounded
// time for the reply.
class UdpRequestChannel final : public IRequestChannel {
public:
    explicit UdpRequestChannel(UdpChannelSettings settings);

    bool Exchange(
        const protocol::Request& request,
        protocol::Response& out_response,
        std::string& out_error) override;

    bool ExchangeText(
        std::string_view request_text,
        std::string& out_reply_text,
        std::string& out_error);

    const UdpChannelSettings& Settings() const;
    const UdpChannelDiagnostics& Diagnostics() const;

private:
    bool IsServerEndpoint(const net::UdpEndpoint& sender) const;

    UdpChannelSettings settings_;
    UdpChannelDiagnostics diagnostics_;
};

}  // namespace duelnet::client
