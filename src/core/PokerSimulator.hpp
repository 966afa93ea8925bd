//
// PokerSimulator.hpp
//

#ifndef ARENA_POKERSIMULATOR_HPP
#define ARENA_POKERSIMULATOR_HPP

#include <optional>
#include <random>
#include <utility>

#include "Config.hpp"
#include "EventSink.hpp"
#include "Simulator.hpp"

namespace arena::core
{
    // Heads-up hold'em, a single hand. Seat A posts the small blind and acts first on every street.
    class PokerSimulator final : public Simulator
    {
    public:
        PokerSimulator(PokerConfig cfg, Providers providers, Collaborators collab = {});

        [[nodiscard]]
        auto Type() const noexcept -> GameType override { return GameType::Poker; }

        auto Play(PlayerId const& a, PlayerId const& b, double wager) -> GameResult override;

        // (small, big) before clamping to the stacks
        [[nodiscard]]
        auto Blinds(double wager) const -> std::pair<double, double>;

        auto ProviderAt(Seat s) -> DecisionProvider* { return providers_[Index(s)].get(); }

    private:
        struct Hand;

        // Returns the folding seat, if any
        auto RunStreet(Hand& h, Street street, double opening_to_call) -> std::optional<Seat>;
        auto MakeRequest(Hand const& h, Seat s, Street street, double to_call) const -> PokerRequest;
        auto Finish(Hand& h, std::optional<Seat> folder) -> GameResult;

    private:
        PokerConfig cfg_;
        Providers providers_;
        Collaborators collab_;
        std::mt19937_64 rng_;
    };
}

#endif //ARENA_POKERSIMULATOR_HPP
