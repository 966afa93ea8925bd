//
// AuctionSimulator.hpp
//

#ifndef ARENA_AUCTIONSIMULATOR_HPP
#define ARENA_AUCTIONSIMULATOR_HPP

#include <random>

#include "Config.hpp"
#include "EventSink.hpp"
#include "Simulator.hpp"

namespace arena::core
{
    // Sealed-bid rounds over randomly drawn items. Budgets start at the wager and shrink
    // only for the round winner. Highest total profit wins, seat A on a tie.
    class AuctionSimulator final : public Simulator
    {
    public:
        AuctionSimulator(AuctionConfig cfg, Providers providers, Collaborators collab = {});

        [[nodiscard]]
        auto Type() const noexcept -> GameType override { return GameType::Auction; }

        auto Play(PlayerId const& a, PlayerId const& b, double wager) -> GameResult override;

        auto ProviderAt(Seat s) -> DecisionProvider* { return providers_[Index(s)].get(); }

    private:
        AuctionConfig cfg_;
        Providers providers_;
        Collaborators collab_;
        std::mt19937_64 rng_;
    };
}

#endif //ARENA_AUCTIONSIMULATOR_HPP
