//
// Invariants.hpp
//

#ifndef ARENA_INVARIANTS_HPP
#define ARENA_INVARIANTS_HPP

#include <algorithm>
#include <array>
#include <expected>
#include <format>
#include <string>

#include "../core/GameResult.hpp"
#include "../core/Util.hpp"

namespace arena::core::debug
{
    // A second layer of checks run over finished results by the tests and by the CLI's
    // --verbose mode. Each returns the first broken rule it finds.
    using CheckResult = std::expected<void, std::string>;

    inline auto CheckPoker(GameResult const& r, PokerDetails const& d) -> CheckResult
    {
        using util::NearlyEqual;

        // 1) Every street that was not cut short by a fold closed settled
        for (StreetRecord const& s : d.streets)
        {
            if (s.folded) continue;
            if (!s.acted[0] || !s.acted[1])
                return std::unexpected(std::format("{}: closed before both seats acted", ToString(s.street)));
            if (s.to_call[0] > 0.0 || s.to_call[1] > 0.0)
                return std::unexpected(std::format("{}: closed with chips owed", ToString(s.street)));
            if (s.stacks[0] < 0.0 || s.stacks[1] < 0.0)
                return std::unexpected(std::format("{}: negative stack", ToString(s.street)));
        }

        // 2) Pot is exactly the blinds plus everything the actions moved
        double moved = std::min(d.small_blind, r.wager) + std::min(d.big_blind, r.wager);
        for (BettingEntry const& e : d.actions) moved += e.amount;
        if (!NearlyEqual(moved, d.pot))
            return std::unexpected(std::format("pot {} != chips moved {}", d.pot, moved));

        // 3) Nothing created or destroyed
        if (!NearlyEqual(d.final_stacks[0] + d.final_stacks[1] + d.pot, 2.0 * r.wager))
            return std::unexpected("stacks + pot do not add up to both buy-ins");
        if (d.final_stacks[0] < 0.0 || d.final_stacks[1] < 0.0)
            return std::unexpected("negative final stack");

        // 4) No card dealt twice
        util::CardUniqueChecker uniq;
        uniq.AddAll(d.hole_cards[0]);
        uniq.AddAll(d.hole_cards[1]);
        uniq.AddAll(d.board);
        if (uniq.ContainsDup())
            return std::unexpected("duplicate card dealt");

        if (d.win_method == "showdown" && d.board.size() != constants::BoardCards)
            return std::unexpected("showdown without a full board");
        if (r.rounds_played != d.actions.size())
            return std::unexpected("rounds_played does not match the action count");
        return {};
    }

    inline auto CheckAuction(GameResult const& r, AuctionDetails const& d) -> CheckResult
    {
        using util::NearlyEqual;

        std::array<double, constants::Seats> budget{r.wager, r.wager};
        std::array<double, constants::Seats> profit{0.0, 0.0};

        for (AuctionRoundRecord const& rd : d.rounds)
        {
            for (size_t i = 0; i < constants::Seats; ++i)
            {
                if (rd.bids[i] < 0.0 || rd.bids[i] > budget[i] + util::Epsilon)
                    return std::unexpected(std::format("round {}: bid outside [0, budget]", rd.round));
            }
            size_t const w = Index(rd.winner);
            if (rd.winning_bid != rd.bids[w])
                return std::unexpected(std::format("round {}: winning bid is not the winner's bid", rd.round));
            if (rd.bids[w] < rd.bids[1 - w])
                return std::unexpected(std::format("round {}: lower bid won", rd.round));
            if (!NearlyEqual(rd.profit, rd.true_value - rd.winning_bid))
                return std::unexpected(std::format("round {}: profit != value - bid", rd.round));
            if (rd.true_value < rd.min_value || rd.true_value > rd.max_value)
                return std::unexpected(std::format("round {}: true value outside its range", rd.round));

            budget[w] -= rd.winning_bid;
            profit[w] += rd.profit;
        }

        for (size_t i = 0; i < constants::Seats; ++i)
        {
            if (!NearlyEqual(budget[i], d.budgets[i]))
                return std::unexpected("final budget does not match winning bids");
            if (!NearlyEqual(profit[i], d.profits[i]))
                return std::unexpected("cumulative profit does not match round profits");
        }
        if (r.rounds_played != d.rounds.size())
            return std::unexpected("rounds_played does not match the round count");
        return {};
    }

    inline auto CheckCombat(GameResult const& r, CombatDetails const& d) -> CheckResult
    {
        for (CombatTurnRecord const& t : d.log)
        {
            for (size_t i = 0; i < constants::Seats; ++i)
            {
                if (t.hp[i] < 0 || t.hp[i] > d.max_hp[i])
                    return std::unexpected(std::format("turn {}: HP out of range", t.turn));
                if (t.mp[i] < 0 || t.mp[i] > d.max_mp[i])
                    return std::unexpected(std::format("turn {}: MP out of range", t.turn));
            }
            if (t.damage && *t.damage < 1)
                return std::unexpected(std::format("turn {}: damaging ability dealt {}", t.turn, *t.damage));
        }
        if (r.rounds_played != d.log.size())
            return std::unexpected("rounds_played does not match the resolved action count");
        if (r.decision_log.size() != d.log.size())
            return std::unexpected("every resolved action needs exactly one decision");
        bool const ko = d.final_hp[0] == 0 || d.final_hp[1] == 0;
        if (ko != (d.win_method == "KO"))
            return std::unexpected("win method does not match final HP");
        return {};
    }

    inline auto CheckInvariants(GameResult const& r) -> CheckResult
    {
#if ARN_ENABLE_TEST_HOOKS == false
        (void)r;
        return {};
#else
        if (r.winner == r.loser && r.players[0] != r.players[1])
            return std::unexpected("winner and loser are the same player");

        for (size_t i = 0; i < r.decision_log.size(); ++i)
        {
            if (r.decision_log[i].index != i)
                return std::unexpected("decision log is out of order");
        }

        return std::visit(
            [&]<typename T0>(T0 const& d) -> CheckResult
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, PokerDetails>) return CheckPoker(r, d);
                else if constexpr (std::is_same_v<T, AuctionDetails>) return CheckAuction(r, d);
                else return CheckCombat(r, d);
            },
            r.details);
#endif
    }
}
#endif //ARENA_INVARIANTS_HPP
