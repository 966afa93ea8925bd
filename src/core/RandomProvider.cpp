//
// RandomProvider.cpp
//

#include "RandomProvider.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

#include "Exception.hpp"

namespace arena::core
{
    RandomProvider::RandomProvider(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomProvider::DecidePoker(PokerRequest const& req) -> PokerReply
    {
        static constexpr std::array<char const*, 2> actions{"call", "raise"};

        PokerReply r{};
        r.action = actions[pick(actions)];
        // pot sized raise, the judge clamps it into range
        r.raise_amount = req.pot;
        r.confidence = 0.5;
        r.bluff_probability = 0.0;
        r.estimated_win_prob = 0.5;
        r.reasoning = "random choice";
        return r;
    }

    auto RandomProvider::DecideBid(BidRequest const& req) -> BidReply
    {
        double lo = req.min_value * 0.8;
        double hi = req.max_value * 0.7;
        if (lo > hi) std::swap(lo, hi);

        double const bid = lo == hi ? lo : std::uniform_real_distribution<double>{lo, hi}(rng_);

        BidReply r{};
        r.bid_amount = std::min(bid, req.budget);
        r.confidence = 0.5;
        r.strategy = "random";
        r.reasoning = "random bid";
        return r;
    }

    auto RandomProvider::DecideAbility(AbilityRequest const& req) -> AbilityReply
    {
        ARN_ASSERT(!req.available.empty(), "No abilities offered");

        AbilityReply r{};
        r.ability = req.available[pick(req.available)].name;
        r.confidence = 0.5;
        r.reasoning = "random choice";
        return r;
    }
}
