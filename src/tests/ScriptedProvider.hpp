//
// ScriptedProvider.hpp
//

#ifndef ARENA_SCRIPTEDPROVIDER_HPP
#define ARENA_SCRIPTEDPROVIDER_HPP

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "../core/DecisionProvider.hpp"
#include "../core/Simulator.hpp"

namespace arena::test
{
    using namespace arena::core;

    // Test double whose replies come from per-game callbacks. Unset callbacks answer
    // with a fully populated passive reply (call / minimum bid / first option).
    class ScriptedProvider final : public DecisionProvider
    {
    public:
        std::function<PokerReply(PokerRequest const&)> poker{};
        std::function<BidReply(BidRequest const&)> bid{};
        std::function<AbilityReply(AbilityRequest const&)> ability{};

        auto DecidePoker(PokerRequest const& req) -> PokerReply override
        {
            ++calls;
            return poker ? poker(req) : Poker("call");
        }

        auto DecideBid(BidRequest const& req) -> BidReply override
        {
            ++calls;
            return bid ? bid(req) : Bid(req.min_value);
        }

        auto DecideAbility(AbilityRequest const& req) -> AbilityReply override
        {
            ++calls;
            return ability ? ability(req) : Ability(req.available.front().name);
        }

        static auto Poker(std::string action, double raise = 0.0) -> PokerReply
        {
            return PokerReply{
                .action = std::move(action),
                .raise_amount = raise,
                .confidence = 0.5,
                .bluff_probability = 0.0,
                .estimated_win_prob = 0.5,
                .reasoning = "scripted"
            };
        }

        static auto Bid(double amount) -> BidReply
        {
            return BidReply{.bid_amount = amount, .confidence = 0.5, .strategy = "scripted", .reasoning = ""};
        }

        static auto Ability(std::string name) -> AbilityReply
        {
            return AbilityReply{.ability = std::move(name), .confidence = 0.5, .reasoning = ""};
        }

        size_t calls{0};
    };

    // Builds the two seat providers and hands back raw pointers for scripting
    inline auto MakeSeats(ScriptedProvider*& a, ScriptedProvider*& b) -> Providers
    {
        Providers ps;
        auto pa = std::make_unique<ScriptedProvider>();
        auto pb = std::make_unique<ScriptedProvider>();
        a = pa.get();
        b = pb.get();
        ps.push_back(std::move(pa));
        ps.push_back(std::move(pb));
        return ps;
    }

    inline auto HasCoercion(DecisionRecord const& rec, error::CoercionCode code) -> bool
    {
        return std::ranges::any_of(rec.coercions, [&](error::Coercion const& c) { return c.code == code; });
    }

    inline auto CountCoercions(std::vector<DecisionRecord> const& log, error::CoercionCode code) -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(log, [&](DecisionRecord const& r)
        {
            return HasCoercion(r, code);
        }));
    }
}

#endif //ARENA_SCRIPTEDPROVIDER_HPP
