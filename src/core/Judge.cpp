//
// Judge.cpp
//
#include "Judge.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

namespace arena::core
{
    using error::Coercion;
    using error::CoercionCode;

    namespace
    {
        // Runs one provider call. Anything thrown out of it ends the match as ExternalFailure.
        template <class F>
        auto Consult(PlayerId const& who, std::string_view what, F&& call) -> decltype(call())
        {
            try
            {
                return call();
            }
            catch (error::ExternalFailureError const&)
            {
                throw;
            }
            catch (error::TimeoutError const& e)
            {
                ARN_THROW(error::Code::ExternalFailure,
                          std::format("Provider for {} timed out on {}: {}", who, what, e.what()));
            }
            catch (OmegaException<error::Code> const& e)
            {
                ARN_THROW(error::Code::ExternalFailure,
                          std::format("Provider for {} failed on {}: {}", who, what, e.what()));
            }
            catch (std::exception const& e)
            {
                ARN_THROW(error::Code::ExternalFailure,
                          std::format("Provider for {} failed on {}: {}", who, what, e.what()));
            }
            catch (...)
            {
                ARN_THROW(error::Code::ExternalFailure,
                          std::format("Provider for {} failed on {} with a non-standard exception", who, what));
            }
        }

        auto ParseAction(std::string_view const s) -> std::optional<PokerAction>
        {
            if (s == "fold") return PokerAction::Fold;
            if (s == "call") return PokerAction::Call;
            if (s == "raise") return PokerAction::Raise;
            return std::nullopt;
        }

        auto Num(double const v) -> std::string
        {
            return std::format("{}", v);
        }

        auto OrDefault(std::optional<double> const& v, double const def, CoercionCode const code,
                       std::vector<Coercion>& out) -> double
        {
            if (v && std::isfinite(*v)) return *v;
            Coercion c{code};
            if (v) c.with_requested(Num(*v));
            out.push_back(c.with_applied(Num(def)));
            return def;
        }
    }

    auto Judge::ValidatePoker(PokerReply const& r, PokerLimits const& lim,
                              std::vector<Coercion>& out) -> PokerDecision
    {
        PokerDecision d{};

        if (!r.action)
        {
            out.push_back(Coercion{CoercionCode::Missing_Action}.with_applied("fold"));
            d.action = PokerAction::Fold;
        }
        else if (auto const a = ParseAction(*r.action))
        {
            d.action = *a;
        }
        else
        {
            out.push_back(Coercion{CoercionCode::Action_Unknown}.with_requested(*r.action).with_applied("fold"));
            d.action = PokerAction::Fold;
        }

        d.confidence = OrDefault(r.confidence, 0.5, CoercionCode::Missing_Confidence, out);
        d.bluff_probability = OrDefault(r.bluff_probability, 0.0, CoercionCode::Missing_BluffProbability, out);
        d.estimated_win_prob = OrDefault(r.estimated_win_prob, 0.5, CoercionCode::Missing_WinProbability, out);

        if (d.action == PokerAction::Fold && lim.to_call <= 0.0)
        {
            out.push_back(Coercion{CoercionCode::Fold_NothingToCall}.with_requested("fold").with_applied("call"));
            d.action = PokerAction::Call;
        }

        if (d.action == PokerAction::Raise && !lim.raise_allowed)
        {
            out.push_back(Coercion{CoercionCode::Raise_PassCapReached}.with_requested("raise").with_applied("call"));
            d.action = PokerAction::Call;
        }

        if (d.action != PokerAction::Raise)
        {
            d.raise_amount = 0.0;
            return d;
        }

        double amt = OrDefault(r.raise_amount, 0.0, CoercionCode::Missing_RaiseAmount, out);
        // what is left once the outstanding amount is paid
        double const remaining = std::max(0.0, lim.stack - std::min(lim.to_call, lim.stack));

        if (amt < lim.big_blind)
        {
            out.push_back(Coercion{CoercionCode::Raise_BelowBigBlind}.with_requested(Num(amt))
                                                                     .with_applied(Num(lim.big_blind)));
            amt = lim.big_blind;
        }
        if (amt > remaining)
        {
            out.push_back(Coercion{CoercionCode::Raise_AboveStack}.with_requested(Num(amt))
                                                                  .with_applied(Num(remaining)));
            amt = remaining;
        }
        d.raise_amount = amt;
        return d;
    }

    auto Judge::ValidateBid(BidReply const& r, double const budget, double const min_bid,
                            std::vector<Coercion>& out) -> BidDecision
    {
        BidDecision d{};
        d.confidence = OrDefault(r.confidence, 0.5, CoercionCode::Missing_Confidence, out);

        if (r.strategy)
        {
            d.strategy = *r.strategy;
        }
        else
        {
            out.push_back(Coercion{CoercionCode::Missing_Strategy}.with_applied("value"));
            d.strategy = "value";
        }

        double amt = OrDefault(r.bid_amount, 0.0, CoercionCode::Missing_BidAmount, out);

        if (budget < min_bid)
        {
            // cannot afford the minimum, the whole remaining budget is the only legal bid
            double const all_in = std::max(0.0, budget);
            if (amt != all_in)
            {
                auto const code = amt > all_in ? CoercionCode::Bid_AboveBudget : CoercionCode::Bid_BelowMinimum;
                out.push_back(Coercion{code}.with_requested(Num(amt)).with_applied(Num(all_in)));
            }
            d.bid_amount = all_in;
            return d;
        }

        if (amt > budget)
        {
            out.push_back(Coercion{CoercionCode::Bid_AboveBudget}.with_requested(Num(amt)).with_applied(Num(budget)));
            amt = budget;
        }
        if (amt < min_bid)
        {
            out.push_back(Coercion{CoercionCode::Bid_BelowMinimum}.with_requested(Num(amt)).with_applied(Num(min_bid)));
            amt = min_bid;
        }
        d.bid_amount = amt;
        return d;
    }

    auto Judge::ValidateAbility(AbilityReply const& r, std::span<AbilityOption const> options,
                                std::vector<Coercion>& out) -> AbilityDecision
    {
        ARN_ASSERT(!options.empty(), "Ability request offered no options");

        AbilityDecision d{};
        d.confidence = OrDefault(r.confidence, 0.5, CoercionCode::Missing_Confidence, out);

        std::string const& first = options.front().name;
        if (!r.ability)
        {
            out.push_back(Coercion{CoercionCode::Missing_Ability}.with_applied(first));
            d.ability = first;
            return d;
        }

        bool const offered = std::ranges::any_of(options, [&](AbilityOption const& o) { return o.name == *r.ability; });
        if (!offered)
        {
            out.push_back(Coercion{CoercionCode::Ability_NotAvailable}.with_requested(*r.ability).with_applied(first));
            d.ability = first;
            return d;
        }
        d.ability = *r.ability;
        return d;
    }

    auto Judge::AskPoker(DecisionProvider& provider, PokerRequest req, PokerLimits const& lim) -> PokerDecision
    {
        std::string label{ToString(req.street)};
        PokerReply reply = Consult(req.player, label, [&] { return provider.DecidePoker(req); });

        std::vector<Coercion> coercions;
        PokerDecision const d = ValidatePoker(reply, lim, coercions);

        PlayerId who = req.player;
        Append(std::move(who), std::move(label), std::move(req), std::move(reply), d, std::move(coercions));
        return d;
    }

    auto Judge::AskBid(DecisionProvider& provider, BidRequest req, double const min_bid) -> BidDecision
    {
        std::string label = std::format("round {}", req.round);
        BidReply reply = Consult(req.player, label, [&] { return provider.DecideBid(req); });

        std::vector<Coercion> coercions;
        BidDecision d = ValidateBid(reply, req.budget, min_bid, coercions);

        PlayerId who = req.player;
        Append(std::move(who), std::move(label), std::move(req), std::move(reply), d, std::move(coercions));
        return d;
    }

    auto Judge::AskAbility(DecisionProvider& provider, AbilityRequest req,
                           std::vector<Coercion> narrowed) -> AbilityDecision
    {
        std::string label = std::format("turn {}", req.turn);
        AbilityReply reply = Consult(req.player, label, [&] { return provider.DecideAbility(req); });

        std::vector<Coercion> coercions = std::move(narrowed);
        AbilityDecision d = ValidateAbility(reply, req.available, coercions);

        PlayerId who = req.player;
        Append(std::move(who), std::move(label), std::move(req), std::move(reply), d, std::move(coercions));
        return d;
    }

    auto Judge::Append(PlayerId player, std::string label, DecisionRequest req, DecisionReply reply,
                       ValidatedDecision decision, std::vector<Coercion> coercions) -> void
    {
        log_.push_back(DecisionRecord{
            .index = log_.size(),
            .player = std::move(player),
            .label = std::move(label),
            .request = std::move(req),
            .reply = std::move(reply),
            .decision = std::move(decision),
            .coercions = std::move(coercions)
        });
    }
}
