#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace duelnet::net {

struct UdpEndpoint final {
    std::string host = "127.0.0.1";
    std::uint16_t port = 0;
};

std::string EndpointToString(const UdpEndpoint& endpoint);

enum class ReceiveStatus : std::uint8_t {
    Received = 0,
    TimedOut = 1,
    Failed = 2,
};

class UdpTransport final {
public:
    static constexpr std::size_t kMaxDatagramSize = 65507;

    UdpTransport();
    ~UdpTransport();

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    bool Open(std::string_view local_host, std::uint16_t local_port, std::string& out_error);
    bool Open(std::uint16_t local_port, std::string& out_error);
    void Close();

    bool IsOpen() const;
    std::uint16_t LocalPort() const;

    bool SendTo(const UdpEndpoint& endpoint, std::string_view payload, std::string& out_error);

    // Non-blocking: returns false with an empty out_error when nothing is pending.
    bool Receive(std::string& out_payload, UdpEndpoint& out_sender, std::string& out_error);

    // Waits up to timeout for one datagram.
    ReceiveStatus ReceiveFor(
        std::chrono::milliseconds timeout,
        std::string& out_payload,
        UdpEndpoint& out_sender,
        std::string& out_error);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace duelnet::net
