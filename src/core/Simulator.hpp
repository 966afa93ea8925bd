//
// Simulator.hpp
//

#ifndef ARENA_SIMULATOR_HPP
#define ARENA_SIMULATOR_HPP

#include <cmath>
#include <format>
#include <memory>
#include <vector>

#include "DecisionProvider.hpp"
#include "Exception.hpp"
#include "GameResult.hpp"
#include "Types.hpp"

namespace arena::core
{
    // One match per Play() call. All match state is created inside the call and only the
    // returned result outlives it. Seat A is the first player.
    class Simulator
    {
    public:
        virtual ~Simulator() = default;

        [[nodiscard]]
        virtual auto Type() const noexcept -> GameType = 0;

        // Throws StateError for a non-positive wager and ExternalFailureError when a
        // provider fails.
        virtual auto Play(PlayerId const& a, PlayerId const& b, double wager) -> GameResult = 0;
    };

    using Providers = std::vector<std::unique_ptr<DecisionProvider>>;

    inline auto CheckProviders(Providers const& ps) -> void
    {
        if (ps.size() != constants::Seats)
        {
            ARN_THROW(error::Code::Config, std::format("Expected {} providers, got {}", constants::Seats, ps.size()));
        }
        for (auto const& p : ps)
        {
            if (!p) ARN_THROW(error::Code::Config, "Null decision provider");
        }
    }

    inline auto CheckWager(double const wager) -> void
    {
        if (!std::isfinite(wager) || wager <= 0.0)
        {
            ARN_THROW(error::Code::State, std::format("Wager must be positive, got {}", wager));
        }
    }
}

#endif //ARENA_SIMULATOR_HPP
