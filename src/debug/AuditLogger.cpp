#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "../core/Cards.hpp"
#include "../core/Exception.hpp"

using namespace arena::core;

namespace
{

auto s_cards(std::vector<Card> const& cs) -> std::string
{
    return cs.empty() ? std::string{"none"} : ToString(cs);
}

auto s_request(DecisionRequest const& req) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& r) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PokerRequest>)
            {
                return std::format("hole=[{}] board=[{}] pot={:.4f} stack={:.4f} opp_stack={:.4f} pos={} to_call={:.4f}",
                                   ToString(r.hole_cards), s_cards(r.community), r.pot, r.stack, r.opponent_stack,
                                   ToString(r.position), r.to_call);
            }
            else if constexpr (std::is_same_v<T, BidRequest>)
            {
                return std::format("item='{}' est={:.4f} range=[{:.4f}, {:.4f}] budget={:.4f} round={}/{} history={}",
                                   r.item, r.estimated_value, r.min_value, r.max_value, r.budget, r.round,
                                   r.total_rounds, r.history.size());
            }
            else
            {
                std::string names;
                for (size_t i{}; i < r.available.size(); ++i)
                {
                    names += (i ? "," : "");
                    names += r.available[i].name;
                }
                return std::format("self=<{}> opp=<{}> turn={}/{} options=[{}]",
                                   r.fighter_status, r.opponent_status, r.turn, r.max_turns, names);
            }
        },
        req
    );
}

auto s_decision(ValidatedDecision const& d) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& v) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PokerDecision>)
            {
                if (v.action == PokerAction::Raise)
                {
                    return std::format("raise {:.4f} (conf={:.2f} bluff={:.2f} win={:.2f})", v.raise_amount,
                                       v.confidence, v.bluff_probability, v.estimated_win_prob);
                }
                return std::format("{} (conf={:.2f} bluff={:.2f} win={:.2f})", ToString(v.action), v.confidence,
                                   v.bluff_probability, v.estimated_win_prob);
            }
            else if constexpr (std::is_same_v<T, BidDecision>)
            {
                return std::format("bid {:.4f} (conf={:.2f} strategy={})", v.bid_amount, v.confidence, v.strategy);
            }
            else
            {
                return std::format("{} (conf={:.2f})", v.ability, v.confidence);
            }
        },
        d
    );
}

auto s_reasoning(DecisionReply const& r) -> std::string
{
    return std::visit([](auto const& v) { return v.reasoning; }, r);
}

} // anonymous namespace

namespace arena::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(path, std::ios::out | std::ios::trunc)
{
    if (!out_)
    {
        ARN_THROW(error::Code::State, std::format("Cannot open transcript '{}'", path));
    }
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameResult const& r) -> void
{
    out_ << std::format("Game={}\n", ToString(r.game_type));
    out_ << std::format("Players=A:{} B:{}\n", r.players[0], r.players[1]);
    out_ << std::format("Wager={:.4f}\n", r.wager);
    out_ << std::format("Seed={}\n", r.seed);
    out_.flush();
}

auto AuditLogger::decision(DecisionRecord const& rec) -> void
{
    out_ << std::format("Decision #{} [{}] {}\n", rec.index, rec.label, rec.player);
    out_ << std::format("  Request: {}\n", s_request(rec.request));
    out_ << std::format("  Response: {}\n", s_decision(rec.decision));

    if (auto const why = s_reasoning(rec.reply); !why.empty())
    {
        out_ << std::format("  Reasoning: {}\n", why);
    }
    for (error::Coercion const& c : rec.coercions)
    {
        out_ << std::format("  Coerced: {}\n", error::describe(c));
    }
}

auto AuditLogger::details(GameResult const& r) -> void
{
    std::visit(
        [&]<typename T0>(T0 const& d)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PokerDetails>)
            {
                out_ << std::format("Hands: A=[{}] {} | B=[{}] {}\n", d.hands[0], d.hand_names[0], d.hands[1],
                                    d.hand_names[1]);
                out_ << std::format("Blinds: SB={:.4f} BB={:.4f}\n", d.small_blind, d.big_blind);
                for (BettingEntry const& e : d.actions)
                {
                    out_ << std::format("Bet {} {} {} amount={:.4f}\n", ToString(e.street), e.player,
                                        ToString(e.action), e.amount);
                }
                for (StreetRecord const& s : d.streets)
                {
                    out_ << std::format("Street {} passes={} pot={:.4f} stacks={:.4f}/{:.4f}{}\n", ToString(s.street),
                                        s.passes, s.pot, s.stacks[0], s.stacks[1], s.folded ? " (fold)" : "");
                }
                out_ << std::format("Board=[{}] Pot={:.4f}\n", d.community, d.pot);
            }
            else if constexpr (std::is_same_v<T, AuctionDetails>)
            {
                for (AuctionRoundRecord const& rd : d.rounds)
                {
                    out_ << std::format("Round {} '{}' value={:.4f} bids={:.4f}/{:.4f} winner={}{} profit={:+.4f}\n",
                                        rd.round, rd.item, rd.true_value, rd.bids[0], rd.bids[1],
                                        rd.winner == Seat::A ? "A" : "B", rd.tie ? " (coin flip)" : "", rd.profit);
                }
                out_ << std::format("Profits: A={:+.4f} B={:+.4f}\n", d.profits[0], d.profits[1]);
                out_ << std::format("Budgets: A={:.4f} B={:.4f}\n", d.budgets[0], d.budgets[1]);
            }
            else
            {
                out_ << std::format("Archetypes: A={} B={}\n", d.archetypes[0], d.archetypes[1]);
                for (CombatTurnRecord const& t : d.log)
                {
                    out_ << std::format("Turn {} {} {} {}{} hp={}/{} mp={}/{}\n", t.turn, t.actor == Seat::A ? "A" : "B",
                                        t.ability,
                                        t.damage ? std::format("dmg={} ", *t.damage) : std::string{},
                                        t.effect, t.hp[0], t.hp[1], t.mp[0], t.mp[1]);
                }
                out_ << std::format("HP: A={}/{} B={}/{}\n", d.final_hp[0], d.max_hp[0], d.final_hp[1], d.max_hp[1]);
            }
        },
        r.details
    );
}

auto AuditLogger::end(GameResult const& r) -> void
{
    out_ << std::format("Winner={} Loser={} Method={} Rounds={}\n", r.winner, r.loser, WinMethod(r), r.rounds_played);
    out_.flush();
}

auto AuditLogger::write(GameResult const& r) -> void
{
    start(r);
    for (DecisionRecord const& rec : r.decision_log)
    {
        decision(rec);
    }
    details(r);
    end(r);
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

}
