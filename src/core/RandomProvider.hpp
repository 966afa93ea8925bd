//
// RandomProvider.hpp
//

#ifndef ARENA_RANDOMPROVIDER_HPP
#define ARENA_RANDOMPROVIDER_HPP

#include <cstdint>
#include <random>

#include "DecisionProvider.hpp"

namespace arena::core
{
    // Seeded random legal choices. Used for self-play and as the CLI's default provider.
    class RandomProvider final : public DecisionProvider
    {
    public:
        explicit RandomProvider(uint64_t rng_seed);

        auto DecidePoker(PokerRequest const& req) -> PokerReply override;
        auto DecideBid(BidRequest const& req) -> BidReply override;
        auto DecideAbility(AbilityRequest const& req) -> AbilityReply override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //ARENA_RANDOMPROVIDER_HPP
