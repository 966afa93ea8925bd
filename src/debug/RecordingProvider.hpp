//
// RecordingProvider.hpp
//

#ifndef ARENA_RECORDINGPROVIDER_HPP
#define ARENA_RECORDINGPROVIDER_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../core/DecisionProvider.hpp"

namespace arena::core::debug
{
    // Keeps the last request and raw reply seen by the wrapped provider
    class RecordingProvider final : public DecisionProvider
    {
    public:
        explicit RecordingProvider(std::unique_ptr<DecisionProvider> inner)
            : inner_{std::move(inner)}
        {
        }

        auto DecidePoker(PokerRequest const& req) -> PokerReply override
        {
            return Record(req, inner_->DecidePoker(req));
        }

        auto DecideBid(BidRequest const& req) -> BidReply override
        {
            return Record(req, inner_->DecideBid(req));
        }

        auto DecideAbility(AbilityRequest const& req) -> AbilityReply override
        {
            return Record(req, inner_->DecideAbility(req));
        }

        auto HasLast() const -> bool
        {
            return last_reply_.has_value();
        }

        auto LastRequest() const -> DecisionRequest const&
        {
            return *last_request_;
        }

        auto LastReply() const -> DecisionReply const&
        {
            return *last_reply_;
        }

        auto Calls() const -> size_t
        {
            return calls_;
        }

    private:
        template <class Req, class Reply>
        auto Record(Req const& req, Reply reply) -> Reply
        {
            last_request_ = req;
            last_reply_ = reply;
            ++calls_;
            return reply;
        }

    private:
        std::unique_ptr<DecisionProvider> inner_;
        std::optional<DecisionRequest> last_request_{};
        std::optional<DecisionReply> last_reply_{};
        size_t calls_{0};
    };

    // Helper to wrap a vector<unique_ptr<DecisionProvider>>
    inline auto WrapRecording(std::vector<std::unique_ptr<DecisionProvider>>& providers)
        -> std::vector<std::unique_ptr<DecisionProvider>>
    {
        std::vector<std::unique_ptr<DecisionProvider>> out;
        out.reserve(providers.size());

        for (auto& p : providers)
        {
            out.emplace_back(std::make_unique<RecordingProvider>(std::move(p)));
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(DecisionProvider* p) -> RecordingProvider*
    {
        return dynamic_cast<RecordingProvider*>(p);
    }
} // namespace arena::core::debug

#endif //ARENA_RECORDINGPROVIDER_HPP
