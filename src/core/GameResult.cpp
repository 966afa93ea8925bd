//
// GameResult.cpp
//

#include "GameResult.hpp"

#include <format>

namespace arena::core
{
    auto WinMethod(GameResult const& r) -> std::string
    {
        return std::visit(
            []<typename T0>(T0 const& d) -> std::string
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, AuctionDetails>)
                {
                    return "profit";
                }
                else
                {
                    return d.win_method;
                }
            },
            r.details);
    }

    auto Summarize(GameResult const& r) -> std::string
    {
        return std::format("{}: {} beat {} ({}), {} round(s), wager {:.4f}",
                           ToString(r.game_type), r.winner, r.loser, WinMethod(r), r.rounds_played, r.wager);
    }
}
