//
// Judge.hpp
//

#ifndef ARENA_JUDGE_HPP
#define ARENA_JUDGE_HPP

#include <span>
#include <string>
#include <utility>
#include <vector>

#include "DecisionProvider.hpp"
#include "Decisions.hpp"
#include "Exception.hpp"
#include "GameResult.hpp"
#include "Requests.hpp"

namespace arena::core
{
    // Betting bounds for the seat about to act
    struct PokerLimits
    {
        double to_call{};
        double stack{};
        double big_blind{};
        bool raise_allowed{true};
    };

    // Sits between a simulator and its providers. Every consultation goes through here:
    // the provider is called, its reply is validated into a decision the simulator can
    // apply without further checks, and the exchange is appended to the decision log.
    class Judge
    {
    public:
        Judge() = default;

        auto AskPoker(DecisionProvider& provider, PokerRequest req, PokerLimits const& lim) -> PokerDecision;
        auto AskBid(DecisionProvider& provider, BidRequest req, double min_bid) -> BidDecision;
        // narrowed carries coercions already applied to the legal set before asking
        auto AskAbility(DecisionProvider& provider, AbilityRequest req,
                        std::vector<error::Coercion> narrowed = {}) -> AbilityDecision;

        [[nodiscard]]
        auto Log() const noexcept -> std::vector<DecisionRecord> const& { return log_; }
        auto TakeLog() -> std::vector<DecisionRecord> { return std::move(log_); }

        // Pure validators, exposed for tests. Coercions are appended to out.
        static auto ValidatePoker(PokerReply const& r, PokerLimits const& lim,
                                  std::vector<error::Coercion>& out) -> PokerDecision;
        static auto ValidateBid(BidReply const& r, double budget, double min_bid,
                                std::vector<error::Coercion>& out) -> BidDecision;
        static auto ValidateAbility(AbilityReply const& r, std::span<AbilityOption const> options,
                                    std::vector<error::Coercion>& out) -> AbilityDecision;

    private:
        auto Append(PlayerId player, std::string label, DecisionRequest req, DecisionReply reply,
                    ValidatedDecision decision, std::vector<error::Coercion> coercions) -> void;

    private:
        std::vector<DecisionRecord> log_;
    };
}
#endif //ARENA_JUDGE_HPP
