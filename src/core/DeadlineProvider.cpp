//
// DeadlineProvider.cpp
//

#include "DeadlineProvider.hpp"

#include <format>
#include <future>
#include <thread>
#include <utility>

#include "Exception.hpp"

namespace arena::core
{
    DeadlineProvider::DeadlineProvider(std::shared_ptr<DecisionProvider> inner, std::chrono::milliseconds timeout) :
        inner_{std::move(inner)},
        timeout_{timeout}
    {
        if (!inner_) ARN_THROW(error::Code::Config, "DeadlineProvider needs an inner provider");
    }

    template <class Reply, class Req, class Call>
    auto DeadlineProvider::Run(Req const& req, Call call) -> Reply
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout_;

        // the worker owns copies of everything it touches, it may outlive this call
        std::packaged_task<Reply()> task(
            [p = inner_, r = req, call]() mutable
            {
                return call(*p, r);
            }
        );

        std::future<Reply> fut = task.get_future();

        std::thread worker(std::move(task));
        worker.detach();

        if (fut.wait_until(deadline) == std::future_status::ready)
        {
            // rethrows whatever the provider threw
            return fut.get();
        }

        ARN_THROW(error::Code::Timeout, std::format("No decision within {} ms", timeout_.count()));
    }

    auto DeadlineProvider::DecidePoker(PokerRequest const& req) -> PokerReply
    {
        return Run<PokerReply>(req, [](DecisionProvider& p, PokerRequest const& r) { return p.DecidePoker(r); });
    }

    auto DeadlineProvider::DecideBid(BidRequest const& req) -> BidReply
    {
        return Run<BidReply>(req, [](DecisionProvider& p, BidRequest const& r) { return p.DecideBid(r); });
    }

    auto DeadlineProvider::DecideAbility(AbilityRequest const& req) -> AbilityReply
    {
        return Run<AbilityReply>(req, [](DecisionProvider& p, AbilityRequest const& r) { return p.DecideAbility(r); });
    }
}
