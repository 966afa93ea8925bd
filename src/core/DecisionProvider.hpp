//
// DecisionProvider.hpp
//

#ifndef ARENA_DECISIONPROVIDER_HPP
#define ARENA_DECISIONPROVIDER_HPP

#include <string>

#include "Decisions.hpp"
#include "Requests.hpp"
#include "Types.hpp"

namespace arena::core
{
    class DecisionProvider
    {
    public:
        virtual ~DecisionProvider() = default;

        // Called synchronously by the simulator that owns the match. The simulator waits
        // as long as the call takes. Any exception escaping here ends the match as an
        // ExternalFailure.
        virtual auto DecidePoker(PokerRequest const& req) -> PokerReply = 0;
        virtual auto DecideBid(BidRequest const& req) -> BidReply = 0;
        virtual auto DecideAbility(AbilityRequest const& req) -> AbilityReply = 0;
    };

    // Read-only text about opponents and bankroll folded into requests.
    // Shared instances must be synchronized by whoever owns them.
    class ContextSource
    {
    public:
        virtual ~ContextSource() = default;

        virtual auto OpponentContext(PlayerId const& self, PlayerId const& opponent) const -> std::string = 0;
        virtual auto BankrollContext(PlayerId const& self) const -> std::string = 0;
    };
}

#endif //ARENA_DECISIONPROVIDER_HPP
