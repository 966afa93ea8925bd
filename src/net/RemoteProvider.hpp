//
// RemoteProvider.hpp
//

#ifndef ARENA_REMOTEPROVIDER_HPP
#define ARENA_REMOTEPROVIDER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

#include "core/DecisionProvider.hpp"

namespace arena::net
{
    // Sends one encoded RequestMsg envelope and returns the peer's ReplyMsg envelope.
    // The transport behind it is the caller's business.
    using Exchange = std::function<std::vector<std::uint8_t>(std::span<std::byte const>)>;

    // DecisionProvider that forwards every request over the FlatBuffers wire format.
    // Any transport failure, undecodable reply or mismatched msg_id surfaces as an
    // ExternalFailureError.
    class RemoteProvider final : public core::DecisionProvider
    {
    public:
        explicit RemoteProvider(Exchange exchange);

        auto DecidePoker(core::PokerRequest const& req) -> core::PokerReply override;
        auto DecideBid(core::BidRequest const& req) -> core::BidReply override;
        auto DecideAbility(core::AbilityRequest const& req) -> core::AbilityReply override;

    private:
        template <class Reply>
        auto RoundTrip(core::DecisionRequest const& req) -> Reply;

    private:
        Exchange exchange_;
        std::uint64_t next_msg_id_{1};
    };

    // Peer side: decodes a RequestMsg, asks `local` and encodes its ReplyMsg with the same msg_id.
    // Throws SerializationError when the request cannot be decoded.
    auto Serve(core::DecisionProvider& local, std::span<std::byte const> request) -> std::vector<std::uint8_t>;
}

#endif //ARENA_REMOTEPROVIDER_HPP
