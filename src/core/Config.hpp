//
// Config.hpp
//

#ifndef ARENA_CONFIG_HPP
#define ARENA_CONFIG_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

namespace arena::core
{
    struct PokerConfig
    {
        uint64_t seed{0xA11CE};
        // Explicit small blind; when absent it is wager * blind_fraction
        std::optional<double> small_blind{};
        double blind_fraction{0.05};
        // Betting passes per street; raises are refused on the last one
        uint32_t max_passes{4};
        bool verbose{false};
    };

    struct AuctionItem
    {
        std::string name{};
        double min_value{};
        double max_value{};
    };

    inline auto DefaultAuctionItems() -> std::vector<AuctionItem>
    {
        return {
            {"Rare NFT Collection", 0.01, 0.05},
            {"DeFi Yield Position", 0.005, 0.03},
            {"Governance Token Bundle", 0.008, 0.04},
            {"Exclusive Access Pass", 0.003, 0.02},
            {"Validator Stake Slot", 0.015, 0.06},
        };
    }

    struct AuctionConfig
    {
        uint64_t seed{0xB1D};
        uint32_t rounds{5};
        std::vector<AuctionItem> items{DefaultAuctionItems()};
        double min_bid{0.001};
        bool verbose{false};
    };

    struct CombatConfig
    {
        uint64_t seed{0xF16};
        uint32_t max_turns{20};
        // player -> archetype name ("warrior", "mage", "rogue", "healer")
        std::map<PlayerId, std::string> archetypes{};
        // player -> personality ("aggressive", "conservative", "balanced", "adaptive")
        std::map<PlayerId, std::string> personalities{};
        bool verbose{false};
    };
}

#endif //ARENA_CONFIG_HPP
