//
// Decisions.hpp
//

#ifndef ARENA_DECISIONS_HPP
#define ARENA_DECISIONS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace arena::core
{
    // Raw provider replies. Any field may be absent; the Judge fills defaults.
    struct PokerReply
    {
        std::optional<std::string> action{};
        std::optional<double> raise_amount{};
        std::optional<double> confidence{};
        std::optional<double> bluff_probability{};
        std::optional<double> estimated_win_prob{};
        std::string reasoning{};
    };

    struct BidReply
    {
        std::optional<double> bid_amount{};
        std::optional<double> confidence{};
        std::optional<std::string> strategy{};
        std::string reasoning{};
    };

    struct AbilityReply
    {
        std::optional<std::string> ability{};
        std::optional<double> confidence{};
        std::string reasoning{};
    };

    using DecisionReply = std::variant<PokerReply, BidReply, AbilityReply>;

    enum class PokerAction : uint8_t
    {
        Fold = 0,
        Call,
        Raise
    };

    inline auto ToString(PokerAction const a) -> std::string_view
    {
        switch (a)
        {
        case PokerAction::Fold: return "fold";
        case PokerAction::Call: return "call";
        case PokerAction::Raise: return "raise";
        }
        return "unknown";
    }

    // Validated, fully populated decisions the simulators act on
    struct PokerDecision
    {
        PokerAction action{PokerAction::Fold};
        double raise_amount{};
        double confidence{0.5};
        double bluff_probability{};
        double estimated_win_prob{0.5};
    };

    struct BidDecision
    {
        double bid_amount{};
        double confidence{0.5};
        std::string strategy{"value"};
    };

    struct AbilityDecision
    {
        std::string ability{};
        double confidence{0.5};
    };
}

#endif //ARENA_DECISIONS_HPP
