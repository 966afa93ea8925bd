//
// GameResult.hpp
//

#ifndef ARENA_GAMERESULT_HPP
#define ARENA_GAMERESULT_HPP

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Decisions.hpp"
#include "Exception.hpp"
#include "HandEval.hpp"
#include "Requests.hpp"
#include "Types.hpp"

namespace arena::core
{
    using ValidatedDecision = std::variant<PokerDecision, BidDecision, AbilityDecision>;

    // One provider call: what it was shown, what it said, what was acted on
    struct DecisionRecord
    {
        size_t index{};
        PlayerId player{};
        // "preflop", "round 3", "turn 7"
        std::string label{};
        DecisionRequest request{};
        DecisionReply reply{};
        ValidatedDecision decision{};
        std::vector<error::Coercion> coercions{};
    };

    // ---------- poker ----------

    struct BettingEntry
    {
        Street street{};
        PlayerId player{};
        PokerAction action{};
        // chips moved into the pot by this action (call part + raise part)
        double amount{};
        double raise_amount{};
        double bluff_probability{};
    };

    // Betting state captured when a street closes (or is cut short by a fold)
    struct StreetRecord
    {
        Street street{};
        std::array<double, constants::Seats> to_call{};
        std::array<bool, constants::Seats> acted{};
        std::array<double, constants::Seats> stacks{};
        double pot{};
        size_t passes{};
        bool folded{};
    };

    struct PokerDetails
    {
        // Indexed by Seat
        std::array<std::vector<Card>, constants::Seats> hole_cards{};
        std::array<std::string, constants::Seats> hands{};
        std::array<std::string, constants::Seats> hand_names{};
        std::array<std::optional<HandScore>, constants::Seats> scores{};
        std::vector<Card> board{};
        std::string community{};
        double pot{};
        std::array<double, constants::Seats> final_stacks{};
        double small_blind{};
        double big_blind{};
        std::string win_method{};
        std::vector<BettingEntry> actions{};
        std::vector<StreetRecord> streets{};
    };

    // ---------- auction ----------

    struct AuctionRoundRecord
    {
        size_t round{};
        std::string item{};
        double min_value{};
        double max_value{};
        double true_value{};
        std::array<double, constants::Seats> bids{};
        Seat winner{Seat::A};
        double winning_bid{};
        double profit{};
        bool tie{};
    };

    struct AuctionDetails
    {
        std::vector<AuctionRoundRecord> rounds{};
        std::array<double, constants::Seats> profits{};
        std::array<double, constants::Seats> budgets{};
    };

    // ---------- combat ----------

    struct CombatTurnRecord
    {
        size_t turn{};
        Seat actor{Seat::A};
        std::string attacker{};
        std::string ability{};
        std::string kind{};
        int dot_taken{};
        std::optional<int> damage{};
        std::string effect{};
        std::array<int, constants::Seats> hp{};
        std::array<int, constants::Seats> mp{};
    };

    struct CombatDetails
    {
        std::array<std::string, constants::Seats> archetypes{};
        std::array<int, constants::Seats> final_hp{};
        std::array<int, constants::Seats> max_hp{};
        std::array<int, constants::Seats> final_mp{};
        std::array<int, constants::Seats> max_mp{};
        size_t turns{};
        std::string win_method{};
        std::vector<CombatTurnRecord> log{};
    };

    using GameDetails = std::variant<PokerDetails, AuctionDetails, CombatDetails>;

    struct GameResult
    {
        GameType game_type{GameType::Poker};
        std::array<PlayerId, constants::Seats> players{};
        PlayerId winner{};
        PlayerId loser{};
        double wager{};
        uint64_t seed{};
        size_t rounds_played{};
        GameDetails details{};
        std::vector<DecisionRecord> decision_log{};
    };

    // One line verdict, e.g. "poker: alice beat bob (showdown), 7 round(s)"
    auto Summarize(GameResult const& r) -> std::string;
    auto WinMethod(GameResult const& r) -> std::string;
}

#endif //ARENA_GAMERESULT_HPP
