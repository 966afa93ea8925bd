//
// AuditLogger.hpp
//

#ifndef ARENA_AUDITLOGGER_HPP
#define ARENA_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/GameResult.hpp"
#include "../core/Types.hpp"

namespace arena::core::debug
{
    // Plain text transcript of one finished match
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Header (game, players, wager, seed)
        auto start(GameResult const& r) -> void;

        // One block per decision log entry: request summary, validated response, coercions
        auto decision(DecisionRecord const& rec) -> void;

        // Game specific play-by-play (streets, rounds, turns)
        auto details(GameResult const& r) -> void;

        // Verdict footer
        auto end(GameResult const& r) -> void;

        // start + every decision + details + end
        auto write(GameResult const& r) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //ARENA_AUDITLOGGER_HPP
