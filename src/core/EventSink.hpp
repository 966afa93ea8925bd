//
// EventSink.hpp
//

#ifndef ARENA_EVENTSINK_HPP
#define ARENA_EVENTSINK_HPP

#include <array>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "DecisionProvider.hpp"
#include "GameResult.hpp"
#include "Types.hpp"

namespace arena::core
{
    struct MatchStarted
    {
        GameType game{};
        std::array<PlayerId, constants::Seats> players{};
        double wager{};
        // archetype names for combat, empty otherwise
        std::array<std::string, constants::Seats> roles{};
    };

    struct StreetDealt
    {
        Street street{};
        std::vector<Card> board{};
        double pot{};
    };

    struct PokerActionEvent
    {
        BettingEntry entry{};
        double pot{};
    };

    struct AuctionRoundEvent
    {
        AuctionRoundRecord round{};
    };

    struct CombatTurnEvent
    {
        CombatTurnRecord turn{};
    };

    struct MatchEnded
    {
        GameType game{};
        PlayerId winner{};
        PlayerId loser{};
        std::string win_method{};
    };

    using MatchEvent = std::variant<MatchStarted, StreetDealt, PokerActionEvent,
                                    AuctionRoundEvent, CombatTurnEvent, MatchEnded>;

    // Progress observer. Implementations may throw; the simulators carry on regardless.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;
        virtual auto Notify(MatchEvent const& e) -> void = 0;
    };

    // Fire-and-forget delivery, failures are reported to stderr and dropped
    auto Emit(EventSink* sink, MatchEvent const& e) noexcept -> void;

    // Optional collaborators handed to every simulator
    struct Collaborators
    {
        std::shared_ptr<EventSink> events{};
        std::shared_ptr<ContextSource const> context{};
    };
}

#endif //ARENA_EVENTSINK_HPP
