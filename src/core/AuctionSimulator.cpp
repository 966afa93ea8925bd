//
// AuctionSimulator.cpp
//

#include "AuctionSimulator.hpp"

#include <array>
#include <format>
#include <print>
#include <utility>

#include "Judge.hpp"

namespace arena::core
{
    AuctionSimulator::AuctionSimulator(AuctionConfig cfg, Providers providers, Collaborators collab) :
        cfg_{std::move(cfg)},
        providers_{std::move(providers)},
        collab_{std::move(collab)},
        rng_{cfg_.seed}
    {
        CheckProviders(providers_);
        if (cfg_.rounds == 0)
        {
            ARN_THROW(error::Code::Config, "rounds must be at least 1");
        }
        if (cfg_.items.empty())
        {
            ARN_THROW(error::Code::Config, "Auction needs at least one item");
        }
        for (AuctionItem const& it : cfg_.items)
        {
            if (!(it.min_value <= it.max_value))
            {
                ARN_THROW(error::Code::Config, std::format("Item '{}' has an empty value range", it.name));
            }
        }
        if (!(cfg_.min_bid >= 0.0))
        {
            ARN_THROW(error::Code::Config, std::format("min_bid must not be negative, got {}", cfg_.min_bid));
        }
    }

    auto AuctionSimulator::Play(PlayerId const& a, PlayerId const& b, double const wager) -> GameResult
    {
        CheckWager(wager);

        std::array<PlayerId, constants::Seats> const players{a, b};
        Judge judge{};
        AuctionDetails d{};
        d.budgets = {wager, wager};
        d.profits = {0.0, 0.0};
        std::array<std::vector<BidHistoryEntry>, constants::Seats> history{};

        if (cfg_.verbose) std::print("[auction] {} vs {}, budget={:.4f} each\n", a, b, wager);
        Emit(collab_.events.get(), MatchStarted{GameType::Auction, players, wager, {}});

        for (size_t round = 1; round <= cfg_.rounds; ++round)
        {
            AuctionItem const& item = cfg_.items[std::uniform_int_distribution<size_t>{0, cfg_.items.size() - 1}(rng_)];
            double const true_value = item.min_value == item.max_value
                                          ? item.min_value
                                          : std::uniform_real_distribution<double>{item.min_value, item.max_value}(rng_);

            AuctionRoundRecord rec{
                .round = round,
                .item = item.name,
                .min_value = item.min_value,
                .max_value = item.max_value,
                .true_value = true_value
            };

            for (Seat const s : {Seat::A, Seat::B})
            {
                size_t const me = Index(s);
                BidRequest req{
                    .player = players[me],
                    .item = item.name,
                    .estimated_value = (item.min_value + item.max_value) / 2.0,
                    .min_value = item.min_value,
                    .max_value = item.max_value,
                    .budget = d.budgets[me],
                    .bidders = constants::Seats,
                    .round = round,
                    .total_rounds = cfg_.rounds,
                    .history = history[me]
                };
                if (collab_.context)
                {
                    req.opponent_context = collab_.context->OpponentContext(players[me], players[Index(Other(s))]);
                    req.bankroll_context = collab_.context->BankrollContext(players[me]);
                }
                rec.bids[me] = judge.AskBid(*providers_[me], std::move(req), cfg_.min_bid).bid_amount;
            }

            if (rec.bids[0] > rec.bids[1]) rec.winner = Seat::A;
            else if (rec.bids[1] > rec.bids[0]) rec.winner = Seat::B;
            else
            {
                rec.tie = true;
                rec.winner = std::bernoulli_distribution{0.5}(rng_) ? Seat::A : Seat::B;
            }

            size_t const w = Index(rec.winner);
            rec.winning_bid = rec.bids[w];
            rec.profit = true_value - rec.winning_bid;
            d.profits[w] += rec.profit;
            d.budgets[w] -= rec.winning_bid;

            for (size_t i = 0; i < constants::Seats; ++i)
            {
                history[i].push_back(BidHistoryEntry{round, item.name, rec.bids[i], rec.winning_bid, i == w});
            }

            if (cfg_.verbose)
            {
                std::print("[auction]   round {}: {} (true value {:.4f}) bids {}={:.4f} {}={:.4f} -> {} profit {:+.4f}\n",
                           round, item.name, true_value, a, rec.bids[0], b, rec.bids[1], players[w], rec.profit);
            }
            Emit(collab_.events.get(), AuctionRoundEvent{rec});
            d.rounds.push_back(std::move(rec));
        }

        // tie goes to seat A
        Seat const winner = d.profits[1] > d.profits[0] ? Seat::B : Seat::A;

        GameResult r{};
        r.game_type = GameType::Auction;
        r.players = players;
        r.winner = players[Index(winner)];
        r.loser = players[Index(Other(winner))];
        r.wager = wager;
        r.seed = cfg_.seed;
        r.rounds_played = d.rounds.size();
        r.decision_log = judge.TakeLog();

        if (cfg_.verbose)
        {
            std::print("[auction]   final: {} profit={:+.4f}, {} profit={:+.4f}, winner {}\n", a, d.profits[0], b,
                       d.profits[1], r.winner);
        }
        Emit(collab_.events.get(), MatchEnded{GameType::Auction, r.winner, r.loser, "profit"});

        r.details = std::move(d);
        return r;
    }
}
