#ifndef ARENA_CODEC_HPP
#define ARENA_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "core/Decisions.hpp"
#include "core/GameResult.hpp"
#include "core/Requests.hpp"
#include "core/Types.hpp"

#include "generated/flatbuffers/arena_generated.h"

namespace arena::net
{
    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    struct DecodedRequest
    {
        std::uint64_t msg_id{};
        core::DecisionRequest request{};
    };

    struct DecodedReply
    {
        std::uint64_t msg_id{};
        core::DecisionReply reply{};
    };

    auto ToFbSuit(core::Suit s) noexcept -> gen::net::Suit;
    auto FromFbSuit(gen::net::Suit s) noexcept -> core::Suit;
    auto ToFbStreet(core::Street s) noexcept -> gen::net::Street;
    auto FromFbStreet(gen::net::Street s) noexcept -> core::Street;

    // --- Outbound builders ---

    auto BuildRequest(core::DecisionRequest const& req, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildReply(core::DecisionReply const& reply, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Full result export, decision log included
    auto BuildResult(core::GameResult const& r)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    // Runs the FlatBuffers verifier over the whole buffer before handing out the root
    auto VerifyEnvelope(std::span<std::byte const> bytes)
        -> std::expected<gen::net::Envelope const*, ParseError>;

    auto DecodeRequest(std::span<std::byte const> bytes)
        -> std::expected<DecodedRequest, ParseError>;

    auto DecodeReply(std::span<std::byte const> bytes)
        -> std::expected<DecodedReply, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    inline auto AsBytes(std::vector<std::uint8_t> const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    inline auto ToVector(flatbuffers::DetachedBuffer const& buf) -> std::vector<std::uint8_t>
    {
        return {buf.data(), buf.data() + buf.size()};
    }
} // namespace arena::net

#endif //ARENA_CODEC_HPP
