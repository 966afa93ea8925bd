//
// RemoteProvider.cpp
//

#include "RemoteProvider.hpp"

#include <exception>
#include <format>
#include <utility>
#include <variant>

#include "codec.hpp"
#include "core/Exception.hpp"

namespace arena::net
{
    RemoteProvider::RemoteProvider(Exchange exchange) :
        exchange_{std::move(exchange)}
    {
        if (!exchange_) ARN_THROW(core::error::Code::Config, "RemoteProvider needs an exchange function");
    }

    template <class Reply>
    auto RemoteProvider::RoundTrip(core::DecisionRequest const& req) -> Reply
    {
        std::uint64_t const id = next_msg_id_++;
        flatbuffers::DetachedBuffer const out = BuildRequest(req, id);

        std::vector<std::uint8_t> in;
        try
        {
            in = exchange_(AsBytes(out));
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            ARN_THROW(core::error::Code::ExternalFailure, std::format("Exchange failed: {}", e.what()));
        }
        catch (std::exception const& e)
        {
            ARN_THROW(core::error::Code::ExternalFailure, std::format("Exchange failed: {}", e.what()));
        }

        auto decoded = DecodeReply(AsBytes(in));
        if (!decoded)
        {
            ARN_THROW(core::error::Code::ExternalFailure, std::format("Bad reply: {}", decoded.error().message));
        }
        if (decoded->msg_id != id)
        {
            ARN_THROW(core::error::Code::ExternalFailure,
                      std::format("Reply msg_id {} does not match request {}", decoded->msg_id, id));
        }

        Reply* reply = std::get_if<Reply>(&decoded->reply);
        if (!reply)
        {
            ARN_THROW(core::error::Code::ExternalFailure, "Reply kind does not match the request");
        }
        return std::move(*reply);
    }

    auto RemoteProvider::DecidePoker(core::PokerRequest const& req) -> core::PokerReply
    {
        return RoundTrip<core::PokerReply>(req);
    }

    auto RemoteProvider::DecideBid(core::BidRequest const& req) -> core::BidReply
    {
        return RoundTrip<core::BidReply>(req);
    }

    auto RemoteProvider::DecideAbility(core::AbilityRequest const& req) -> core::AbilityReply
    {
        return RoundTrip<core::AbilityReply>(req);
    }

    auto Serve(core::DecisionProvider& local, std::span<std::byte const> request) -> std::vector<std::uint8_t>
    {
        auto decoded = DecodeRequest(request);
        if (!decoded)
        {
            ARN_THROW(core::error::Code::Serialization, std::format("Bad request: {}", decoded.error().message));
        }

        core::DecisionReply const reply = std::visit(
            [&]<typename T0>(T0 const& r) -> core::DecisionReply
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, core::PokerRequest>)
                {
                    return local.DecidePoker(r);
                }
                else if constexpr (std::is_same_v<T, core::BidRequest>)
                {
                    return local.DecideBid(r);
                }
                else
                {
                    return local.DecideAbility(r);
                }
            },
            decoded->request
        );

        return ToVector(BuildReply(reply, decoded->msg_id));
    }
}
