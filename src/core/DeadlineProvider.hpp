//
// DeadlineProvider.hpp
//

#ifndef ARENA_DEADLINEPROVIDER_HPP
#define ARENA_DEADLINEPROVIDER_HPP

#include <chrono>
#include <memory>

#include "DecisionProvider.hpp"

namespace arena::core
{
    // Bounds every call to the wrapped provider. The call runs on its own thread; when the
    // deadline passes first a TimeoutError is thrown and the simulator reports the match
    // as an ExternalFailure. An abandoned call keeps running in the background, so the
    // inner provider must tolerate a later call overlapping it.
    class DeadlineProvider final : public DecisionProvider
    {
    public:
        DeadlineProvider(std::shared_ptr<DecisionProvider> inner, std::chrono::milliseconds timeout);

        auto DecidePoker(PokerRequest const& req) -> PokerReply override;
        auto DecideBid(BidRequest const& req) -> BidReply override;
        auto DecideAbility(AbilityRequest const& req) -> AbilityReply override;

        [[nodiscard]]
        auto Timeout() const noexcept -> std::chrono::milliseconds { return timeout_; }

    private:
        template <class Reply, class Req, class Call>
        auto Run(Req const& req, Call call) -> Reply;

    private:
        std::shared_ptr<DecisionProvider> inner_;
        std::chrono::milliseconds timeout_;
    };
}

#endif //ARENA_DEADLINEPROVIDER_HPP
