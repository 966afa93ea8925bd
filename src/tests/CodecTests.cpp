#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "../core/AuctionSimulator.hpp"
#include "../core/CombatSimulator.hpp"
#include "../core/Exception.hpp"
#include "../core/PokerSimulator.hpp"
#include "../core/RandomProvider.hpp"
#include "../net/RemoteProvider.hpp"
#include "../net/codec.hpp"
#include "ScriptedProvider.hpp"

using namespace arena::core;
namespace fb = arena::gen::net;
namespace net = arena::net;

namespace
{
    auto Direct(uint64_t seed) -> Providers
    {
        Providers ps;
        ps.push_back(std::make_unique<RandomProvider>(seed));
        ps.push_back(std::make_unique<RandomProvider>(seed + 1));
        return ps;
    }

    // Same random players, but every call goes through the wire format and back
    auto Looped(uint64_t seed) -> Providers
    {
        Providers ps;
        for (uint64_t s : {seed, seed + 1})
        {
            auto local = std::make_shared<RandomProvider>(s);
            ps.push_back(std::make_unique<net::RemoteProvider>([local](std::span<std::byte const> bytes)
            {
                return net::Serve(*local, bytes);
            }));
        }
        return ps;
    }

    auto SampleRequest() -> PokerRequest
    {
        return PokerRequest{
            .player = "alice",
            .hole_cards = {Card{Rank::Ace, Suit::Spades}, Card{Rank::King, Suit::Hearts}},
            .pot = 0.03,
            .stack = 0.99,
            .opponent_stack = 0.98,
            .position = Position::SmallBlind,
            .to_call = 0.01,
            .street = Street::PreFlop
        };
    }

    auto ExpectSameMatch(GameResult const& x, GameResult const& y) -> void
    {
        EXPECT_EQ(x.winner, y.winner);
        EXPECT_EQ(x.loser, y.loser);
        EXPECT_EQ(x.rounds_played, y.rounds_played);
        EXPECT_EQ(WinMethod(x), WinMethod(y));
        ASSERT_EQ(x.decision_log.size(), y.decision_log.size());
        for (size_t i = 0; i < x.decision_log.size(); ++i)
        {
            EXPECT_EQ(x.decision_log[i].player, y.decision_log[i].player) << i;
            EXPECT_EQ(x.decision_log[i].label, y.decision_log[i].label) << i;
            EXPECT_EQ(x.decision_log[i].coercions.size(), y.decision_log[i].coercions.size()) << i;
        }
    }
}

TEST(Codec, LoopbackPokerPlaysLikeDirectCalls)
{
    PokerConfig const cfg{.seed = 31, .small_blind = 0.01};
    PokerSimulator direct{cfg, Direct(500)};
    PokerSimulator looped{cfg, Looped(500)};

    GameResult const x = direct.Play("alice", "bob", 1.0);
    GameResult const y = looped.Play("alice", "bob", 1.0);
    ExpectSameMatch(x, y);
    EXPECT_DOUBLE_EQ(std::get<PokerDetails>(x.details).pot, std::get<PokerDetails>(y.details).pot);
}

TEST(Codec, LoopbackAuctionPlaysLikeDirectCalls)
{
    AuctionConfig const cfg{.seed = 32, .rounds = 6};
    AuctionSimulator direct{cfg, Direct(600)};
    AuctionSimulator looped{cfg, Looped(600)};

    GameResult const x = direct.Play("alice", "bob", 0.1);
    GameResult const y = looped.Play("alice", "bob", 0.1);
    ExpectSameMatch(x, y);
    EXPECT_DOUBLE_EQ(std::get<AuctionDetails>(x.details).profits[0], std::get<AuctionDetails>(y.details).profits[0]);
    EXPECT_DOUBLE_EQ(std::get<AuctionDetails>(x.details).profits[1], std::get<AuctionDetails>(y.details).profits[1]);
}

TEST(Codec, LoopbackCombatPlaysLikeDirectCalls)
{
    CombatConfig const cfg{.seed = 33, .max_turns = 12};
    CombatSimulator direct{cfg, Direct(700)};
    CombatSimulator looped{cfg, Looped(700)};

    GameResult const x = direct.Play("alice", "bob", 0.5);
    GameResult const y = looped.Play("alice", "bob", 0.5);
    ExpectSameMatch(x, y);
    EXPECT_EQ(std::get<CombatDetails>(x.details).final_hp, std::get<CombatDetails>(y.details).final_hp);
}

TEST(Codec, GarbageReplyIsAnExternalFailure)
{
    net::RemoteProvider p{[](std::span<std::byte const>)
    {
        return std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9};
    }};
    EXPECT_THROW((void)p.DecidePoker(SampleRequest()), error::ExternalFailureError);
}

TEST(Codec, ThrowingExchangeIsAnExternalFailure)
{
    net::RemoteProvider p{[](std::span<std::byte const>) -> std::vector<std::uint8_t>
    {
        ARN_THROW(error::Code::Timeout, "peer went away");
    }};
    EXPECT_THROW((void)p.DecidePoker(SampleRequest()), error::ExternalFailureError);
}

TEST(Codec, MismatchedMessageIdIsRejected)
{
    net::RemoteProvider p{[](std::span<std::byte const>)
    {
        return net::ToVector(net::BuildReply(arena::test::ScriptedProvider::Poker("call"), 999));
    }};
    EXPECT_THROW((void)p.DecidePoker(SampleRequest()), error::ExternalFailureError);
}

TEST(Codec, WrongReplyKindIsRejected)
{
    net::RemoteProvider p{[](std::span<std::byte const> bytes)
    {
        auto const req = net::DecodeRequest(bytes);
        EXPECT_TRUE(req.has_value());
        return net::ToVector(net::BuildReply(arena::test::ScriptedProvider::Bid(0.5), req ? req->msg_id : 0));
    }};
    EXPECT_THROW((void)p.DecidePoker(SampleRequest()), error::ExternalFailureError);
}

TEST(Codec, NullExchangeIsAConfigError)
{
    EXPECT_THROW((net::RemoteProvider{net::Exchange{}}), error::ConfigError);
}

TEST(Codec, ServeRejectsGarbage)
{
    arena::test::ScriptedProvider local;
    std::vector<std::uint8_t> const junk(32, 0xAB);
    EXPECT_THROW((void)net::Serve(local, net::AsBytes(junk)), error::SerializationError);
    EXPECT_EQ(local.calls, 0u);

    // a well formed reply is not a request either
    auto const reply = net::BuildReply(arena::test::ScriptedProvider::Poker("fold"), 1);
    EXPECT_THROW((void)net::Serve(local, net::AsBytes(reply)), error::SerializationError);
}

TEST(Codec, RequestSurvivesTheWire)
{
    PokerRequest req = SampleRequest();
    req.community = {Card{Rank::Two, Suit::Clubs}, Card{Rank::Ten, Suit::Diamonds}, Card{Rank::Queen, Suit::Spades}};
    req.street = Street::Flop;
    req.position = Position::BigBlind;
    req.opponent_context = "tight";

    auto const buf = net::BuildRequest(req, 42);
    auto const decoded = net::DecodeRequest(net::AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->msg_id, 42u);

    auto const& got = std::get<PokerRequest>(decoded->request);
    EXPECT_EQ(got.player, "alice");
    EXPECT_EQ(got.hole_cards, req.hole_cards);
    EXPECT_EQ(got.community, req.community);
    EXPECT_EQ(got.street, Street::Flop);
    EXPECT_EQ(got.position, Position::BigBlind);
    EXPECT_DOUBLE_EQ(got.to_call, 0.01);
    EXPECT_EQ(got.opponent_context, "tight");
}

TEST(Codec, AbsentReplyFieldsStayAbsent)
{
    PokerReply partial{};
    partial.action = "raise";
    partial.confidence = 0.75;

    auto const buf = net::BuildReply(partial, 7);
    auto const decoded = net::DecodeReply(net::AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->msg_id, 7u);

    auto const& got = std::get<PokerReply>(decoded->reply);
    EXPECT_EQ(got.action, std::optional<std::string>{"raise"});
    EXPECT_EQ(got.confidence, std::optional<double>{0.75});
    EXPECT_FALSE(got.raise_amount.has_value());
    EXPECT_FALSE(got.bluff_probability.has_value());
    EXPECT_FALSE(got.estimated_win_prob.has_value());

    // a zero that was sent is not the same as nothing sent
    BidReply zero{};
    zero.bid_amount = 0.0;
    auto const bid = net::DecodeReply(net::AsBytes(net::BuildReply(zero, 8)));
    ASSERT_TRUE(bid.has_value());
    EXPECT_EQ(std::get<BidReply>(bid->reply).bid_amount, std::optional<double>{0.0});
    EXPECT_FALSE(std::get<BidReply>(bid->reply).strategy.has_value());
}

TEST(Codec, ExportedResultVerifies)
{
    AuctionSimulator sim{AuctionConfig{.seed = 5, .rounds = 3}, Direct(800)};
    GameResult const r = sim.Play("alice", "bob", 0.1);

    auto const buf = net::BuildResult(r);
    auto const env = net::VerifyEnvelope(net::AsBytes(buf));
    ASSERT_TRUE(env.has_value()) << env.error().message;
    ASSERT_EQ((*env)->message_type(), fb::Message::GameResult);

    fb::GameResult const* out = (*env)->message_as_GameResult();
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->game_type(), fb::GameType::Auction);
    EXPECT_EQ(out->winner()->str(), r.winner);
    EXPECT_EQ(out->seed(), r.seed);
    EXPECT_EQ(out->rounds_played(), 3u);
    ASSERT_NE(out->decision_log(), nullptr);
    EXPECT_EQ(out->decision_log()->size(), r.decision_log.size());
    ASSERT_EQ(out->details_type(), fb::Details::AuctionDetails);
    EXPECT_EQ(out->details_as_AuctionDetails()->rounds()->size(), 3u);
}

TEST(Codec, TruncatedBufferFailsVerification)
{
    auto const buf = net::BuildRequest(SampleRequest(), 1);
    std::vector<std::uint8_t> bytes = net::ToVector(buf);

    EXPECT_TRUE(net::VerifyEnvelope(net::AsBytes(bytes)).has_value());

    bytes.resize(bytes.size() / 2);
    EXPECT_FALSE(net::VerifyEnvelope(net::AsBytes(bytes)).has_value());
    EXPECT_FALSE(net::DecodeRequest(net::AsBytes(bytes)).has_value());

    std::vector<std::uint8_t> const tiny{0, 1, 2};
    auto const err = net::VerifyEnvelope(net::AsBytes(tiny));
    ASSERT_FALSE(err.has_value());
    EXPECT_EQ(err.error().message, "buffer too small");
}
