//
// Requests.hpp
//

#ifndef ARENA_REQUESTS_HPP
#define ARENA_REQUESTS_HPP

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace arena::core
{
    enum class Street : uint8_t
    {
        PreFlop = 0,
        Flop,
        Turn,
        River
    };

    enum class Position : uint8_t
    {
        SmallBlind = 0,
        BigBlind
    };

    inline auto ToString(Street const s) -> std::string_view
    {
        switch (s)
        {
        case Street::PreFlop: return "preflop";
        case Street::Flop: return "flop";
        case Street::Turn: return "turn";
        case Street::River: return "river";
        }
        return "unknown";
    }

    inline auto ToString(Position const p) -> std::string_view
    {
        return p == Position::SmallBlind ? "SB" : "BB";
    }

    // What the provider sees at a poker decision point
    struct PokerRequest
    {
        PlayerId player{};
        std::vector<Card> hole_cards{};
        std::vector<Card> community{};
        double pot{};
        double stack{};
        double opponent_stack{};
        Position position{Position::SmallBlind};
        double to_call{};
        Street street{Street::PreFlop};
        std::string opponent_context{};
        std::string bankroll_context{};
    };

    struct BidHistoryEntry
    {
        size_t round{};
        std::string item{};
        double your_bid{};
        double winning_bid{};
        bool won{};
    };

    struct BidRequest
    {
        PlayerId player{};
        std::string item{};
        double estimated_value{};
        double min_value{};
        double max_value{};
        double budget{};
        size_t bidders{};
        size_t round{};
        size_t total_rounds{};
        // Own prior rounds only, oldest first
        std::vector<BidHistoryEntry> history{};
        std::string opponent_context{};
        std::string bankroll_context{};
    };

    struct AbilityOption
    {
        std::string name{};
        std::string description{};
        int cost{};
    };

    struct AbilityRequest
    {
        PlayerId player{};
        std::string fighter_status{};
        std::string opponent_status{};
        // Never empty; catalog order
        std::vector<AbilityOption> available{};
        size_t turn{};
        size_t max_turns{};
        std::string opponent_context{};
    };

    using DecisionRequest = std::variant<PokerRequest, BidRequest, AbilityRequest>;
}

#endif //ARENA_REQUESTS_HPP
