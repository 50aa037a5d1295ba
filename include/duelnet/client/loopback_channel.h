#pragma once

#include "client/request_channel.h"
#include "server/command_dispatcher.h"

#include <cstdint>
#include <string>

namespace duelnet::client {

// In-process channel that runs requests through the full codec and a local
// dispatcher. Can be told to drop replies to emulate packet loss.
class LoopbackChannel final : public IRequestChannel {
public:
    explicit LoopbackChannel(server::CommandDispatcher& dispatcher);

    bool Exchange(
        const protocol::Request& request,
        protocol::Response& out_response,
        std::string& out_error) override;

    void SetDropReplies(bool drop_replies);
    std::uint64_t ExchangeCount() const;

private:
    server::CommandDispatcher& dispatcher_;
    bool drop_replies_ = false;
    std::uint64_t exchange_count_ = 0;
};

}  // namespace duelnet::client
