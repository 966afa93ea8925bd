//
// PokerSimulator.cpp
//

#include "PokerSimulator.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <print>
#include <utility>

#include "Cards.hpp"
#include "HandEval.hpp"
#include "Judge.hpp"

namespace arena::core
{
    struct PokerSimulator::Hand
    {
        std::array<PlayerId, constants::Seats> players{};
        double wager{};
        Deck deck{};
        std::array<std::vector<Card>, constants::Seats> hole{};
        std::vector<Card> board{};
        std::array<double, constants::Seats> stacks{};
        double pot{};
        double small_blind{};
        double big_blind{};
        Judge judge{};
        std::vector<BettingEntry> actions{};
        std::vector<StreetRecord> streets{};
    };

    PokerSimulator::PokerSimulator(PokerConfig cfg, Providers providers, Collaborators collab) :
        cfg_{std::move(cfg)},
        providers_{std::move(providers)},
        collab_{std::move(collab)},
        rng_{cfg_.seed}
    {
        CheckProviders(providers_);
        if (cfg_.max_passes == 0)
        {
            ARN_THROW(error::Code::Config, "max_passes must be at least 1");
        }
        if (cfg_.small_blind && !(*cfg_.small_blind > 0.0))
        {
            ARN_THROW(error::Code::Config, std::format("small_blind must be positive, got {}", *cfg_.small_blind));
        }
        if (!cfg_.small_blind && !(cfg_.blind_fraction > 0.0))
        {
            ARN_THROW(error::Code::Config, std::format("blind_fraction must be positive, got {}", cfg_.blind_fraction));
        }
    }

    auto PokerSimulator::Blinds(double const wager) const -> std::pair<double, double>
    {
        double const sb = cfg_.small_blind ? *cfg_.small_blind : wager * cfg_.blind_fraction;
        return {sb, sb * 2.0};
    }

    auto PokerSimulator::MakeRequest(Hand const& h, Seat const s, Street const street, double const to_call) const
        -> PokerRequest
    {
        size_t const me = Index(s);
        size_t const opp = Index(Other(s));

        PokerRequest req{
            .player = h.players[me],
            .hole_cards = h.hole[me],
            .community = h.board,
            .pot = h.pot,
            .stack = h.stacks[me],
            .opponent_stack = h.stacks[opp],
            .position = s == Seat::A ? Position::SmallBlind : Position::BigBlind,
            .to_call = to_call,
            .street = street
        };
        if (collab_.context)
        {
            req.opponent_context = collab_.context->OpponentContext(h.players[me], h.players[opp]);
            req.bankroll_context = collab_.context->BankrollContext(h.players[me]);
        }
        return req;
    }

    auto PokerSimulator::RunStreet(Hand& h, Street const street, double const opening_to_call) -> std::optional<Seat>
    {
        std::array<double, constants::Seats> to_call{opening_to_call, 0.0};
        std::array<bool, constants::Seats> acted{false, false};

        auto const settled = [&]
        {
            return acted[0] && acted[1] && to_call[0] <= 0.0 && to_call[1] <= 0.0;
        };
        auto const record = [&](size_t const passes, bool const folded)
        {
            h.streets.push_back(StreetRecord{
                .street = street,
                .to_call = to_call,
                .acted = acted,
                .stacks = h.stacks,
                .pot = h.pot,
                .passes = passes,
                .folded = folded
            });
        };

        size_t pass = 0;
        for (; pass < cfg_.max_passes; ++pass)
        {
            for (Seat const s : {Seat::A, Seat::B})
            {
                size_t const me = Index(s);
                size_t const opp = Index(Other(s));

                if (acted[me] && to_call[me] <= 0.0) continue;

                // all-in: nothing left to act with and nothing more can be owed
                if (h.stacks[me] <= 0.0)
                {
                    acted[me] = true;
                    to_call[me] = 0.0;
                    continue;
                }

                PokerLimits const lim{
                    .to_call = to_call[me],
                    .stack = h.stacks[me],
                    .big_blind = h.big_blind,
                    .raise_allowed = pass + 1 < cfg_.max_passes
                };
                PokerDecision const d = h.judge.AskPoker(*providers_[me], MakeRequest(h, s, street, to_call[me]), lim);

                BettingEntry entry{
                    .street = street,
                    .player = h.players[me],
                    .action = d.action,
                    .amount = 0.0,
                    .raise_amount = 0.0,
                    .bluff_probability = d.bluff_probability
                };

                if (d.action == PokerAction::Fold)
                {
                    h.actions.push_back(entry);
                    if (cfg_.verbose) std::print("[poker]   {}: FOLD\n", h.players[me]);
                    Emit(collab_.events.get(), PokerActionEvent{entry, h.pot});
                    record(pass + 1, true);
                    return s;
                }

                double const call_amt = std::min(to_call[me], h.stacks[me]);
                h.stacks[me] -= call_amt;
                h.pot += call_amt;
                entry.amount = call_amt;

                if (d.action == PokerAction::Raise)
                {
                    // already clamped to [big blind, what is left after the call]
                    double const raise_amt = std::min(d.raise_amount, h.stacks[me]);
                    h.stacks[me] -= raise_amt;
                    h.pot += raise_amt;
                    entry.amount += raise_amt;
                    entry.raise_amount = raise_amt;
                    to_call[opp] = raise_amt;
                    if (cfg_.verbose) std::print("[poker]   {}: RAISE {:.4f} (pot={:.4f})\n", h.players[me], raise_amt, h.pot);
                }
                else if (cfg_.verbose)
                {
                    if (call_amt > 0.0) std::print("[poker]   {}: CALL {:.4f} (pot={:.4f})\n", h.players[me], call_amt, h.pot);
                    else std::print("[poker]   {}: CHECK\n", h.players[me]);
                }

                to_call[me] = 0.0;
                acted[me] = true;
                h.actions.push_back(entry);
                Emit(collab_.events.get(), PokerActionEvent{entry, h.pot});
            }

            if (settled())
            {
                ++pass;
                break;
            }
        }

        ARN_ASSERT(settled(), std::format("{} did not settle within {} passes", ToString(street), cfg_.max_passes));
        ARN_ASSERT(h.stacks[0] >= 0.0 && h.stacks[1] >= 0.0, "Negative stack after betting");
        record(pass, false);
        return std::nullopt;
    }

    auto PokerSimulator::Play(PlayerId const& a, PlayerId const& b, double const wager) -> GameResult
    {
        CheckWager(wager);

        Hand h{};
        h.players = {a, b};
        h.wager = wager;
        h.stacks = {wager, wager};

        h.deck.Reset();
        h.deck.Shuffle(rng_);
        h.hole[Index(Seat::A)] = h.deck.Deal(constants::HoleCards);
        h.hole[Index(Seat::B)] = h.deck.Deal(constants::HoleCards);

        auto const [sb, bb] = Blinds(wager);
        h.small_blind = sb;
        h.big_blind = bb;

        double const posted_sb = std::min(sb, h.stacks[Index(Seat::A)]);
        double const posted_bb = std::min(bb, h.stacks[Index(Seat::B)]);
        h.stacks[Index(Seat::A)] -= posted_sb;
        h.stacks[Index(Seat::B)] -= posted_bb;
        h.pot = posted_sb + posted_bb;

        if (cfg_.verbose)
        {
            std::print("[poker] {} vs {}, wager={:.4f}\n", a, b, wager);
            std::print("[poker]   hands: {}=[{}] {}=[{}]\n", a, ToString(h.hole[0]), b, ToString(h.hole[1]));
            std::print("[poker]   blinds: SB={:.4f} BB={:.4f}\n", posted_sb, posted_bb);
        }
        Emit(collab_.events.get(), MatchStarted{GameType::Poker, h.players, wager, {}});

        constexpr std::array<std::pair<Street, size_t>, 4> streets{{
            {Street::PreFlop, 0}, {Street::Flop, 3}, {Street::Turn, 1}, {Street::River, 1}
        }};

        std::optional<Seat> folder{};
        for (auto const& [street, deal] : streets)
        {
            if (deal > 0)
            {
                std::vector<Card> const dealt = h.deck.Deal(deal);
                h.board.insert(h.board.end(), dealt.begin(), dealt.end());
            }
            if (cfg_.verbose)
            {
                std::print("[poker]   --- {} --- board=[{}] pot={:.4f}\n", ToString(street),
                           h.board.empty() ? std::string{"none"} : ToString(h.board), h.pot);
            }
            Emit(collab_.events.get(), StreetDealt{street, h.board, h.pot});

            double const opening = street == Street::PreFlop ? std::max(0.0, posted_bb - posted_sb) : 0.0;
            folder = RunStreet(h, street, opening);
            if (folder) break;
        }

        return Finish(h, folder);
    }

    auto PokerSimulator::Finish(Hand& h, std::optional<Seat> const folder) -> GameResult
    {
        PokerDetails d{};
        d.hole_cards = h.hole;
        d.hands = {ToString(h.hole[0]), ToString(h.hole[1])};
        d.board = h.board;
        d.community = h.board.empty() ? "none" : ToString(h.board);
        d.pot = h.pot;
        d.final_stacks = h.stacks;
        d.small_blind = h.small_blind;
        d.big_blind = h.big_blind;

        Seat winner = Seat::A;
        if (folder)
        {
            winner = Other(*folder);
            d.win_method = "fold";
            d.hand_names[Index(*folder)] = "folded";
        }
        else
        {
            for (Seat const s : {Seat::A, Seat::B})
            {
                std::vector<Card> seven = h.hole[Index(s)];
                seven.insert(seven.end(), h.board.begin(), h.board.end());
                d.scores[Index(s)] = Score(seven);
                d.hand_names[Index(s)] = std::string{CategoryName(d.scores[Index(s)]->category)};
            }
            // exact tie goes to seat A
            winner = *d.scores[1] > *d.scores[0] ? Seat::B : Seat::A;
            d.win_method = "showdown";
            if (cfg_.verbose)
            {
                std::print("[poker]   SHOWDOWN: {}=[{}] {} vs {}=[{}] {}\n", h.players[0], d.hands[0], d.hand_names[0],
                           h.players[1], d.hands[1], d.hand_names[1]);
            }
        }

        d.actions = std::move(h.actions);
        d.streets = std::move(h.streets);

        GameResult r{};
        r.game_type = GameType::Poker;
        r.players = h.players;
        r.winner = h.players[Index(winner)];
        r.loser = h.players[Index(Other(winner))];
        r.wager = h.wager;
        r.seed = cfg_.seed;
        r.rounds_played = d.actions.size();
        r.decision_log = h.judge.TakeLog();

        if (cfg_.verbose) std::print("[poker]   WINNER: {} by {}, pot={:.4f}\n", r.winner, d.win_method, d.pot);
        Emit(collab_.events.get(), MatchEnded{GameType::Poker, r.winner, r.loser, d.win_method});

        r.details = std::move(d);
        return r;
    }
}
