#include "client/loopback_channel.h"

#include "protocol/codec.h"

namespace duelnet::client {

LoopbackChannel::LoopbackChannel(server::CommandDispatcher& dispatcher)
    : dispatcher_(dispatcher) {}

bool LoopbackChannel::Exchange(
    const protocol::Request& request,
    protocol::Response& out_response,
    std::string& out_error) {
    ++exchange_count_;

    const protocol::CommandKind kind = protocol::KindOf(request);
    protocol::Request decoded_request;
    const protocol::DecodeStatus status =
        protocol::Codec::DecodeRequest(protocol::Codec::EncodeRequest(request), decoded_request, out_error);
    const protocol::Response response = status == protocol::DecodeStatus::Ok
        ? dispatcher_.Dispatch(decoded_request)
        : server::CommandDispatcher::InvalidCommand();

    if (drop_replies_) {
        out_error = "reply dropped";
        return false;
    }

    return protocol::Codec::DecodeResponse(
        kind,
        protocol::Codec::EncodeResponse(response),
        out_response,
        out_error);
}

void LoopbackChannel::SetDropReplies(bool drop_replies) {
    drop_replies_ = drop_replies;
}

std::uint64_t LoopbackChannel::ExchangeCount() const {
    return exchange_count_;
}

}  // namespace duelnet::client
