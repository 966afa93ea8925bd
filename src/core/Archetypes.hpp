//
// Archetypes.hpp
//

#ifndef ARENA_ARCHETYPES_HPP
#define ARENA_ARCHETYPES_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace arena::core
{
    enum class Stat : uint8_t
    {
        Attack = 0,
        Defense,
        Speed
    };

    inline auto ToString(Stat const s) -> std::string_view
    {
        switch (s)
        {
        case Stat::Attack: return "atk";
        case Stat::Defense: return "defense";
        case Stat::Speed: return "speed";
        }
        return "unknown";
    }

    enum class DamageKind : uint8_t
    {
        Physical = 0,
        Magical
    };

    // Timed stat change template, applied as a fresh independent entry each time
    struct StatModifierSpec
    {
        Stat stat{};
        int amount{};
        int turns{};
    };

    struct DotSpec
    {
        int damage{};
        int turns{};
    };

    struct DamageEffect
    {
        DamageKind kind{};
        int base{};
        // x1.4 when the attacker is strictly faster
        bool speed_bonus{false};
        std::optional<StatModifierSpec> debuff{};
        std::optional<StatModifierSpec> self_debuff{};
        std::optional<DotSpec> dot{};
    };

    struct HealEffect
    {
        int amount{};
    };

    struct DefendEffect
    {
        int mp_restore{};
    };

    // Drops every DoT and negative modifier, then heals
    struct CleanseEffect
    {
        int heal{};
    };

    using AbilityEffect = std::variant<DamageEffect, HealEffect, DefendEffect, CleanseEffect>;

    struct Ability
    {
        std::string name{};
        std::string description{};
        int cost{};
        AbilityEffect effect{};
    };

    struct Archetype
    {
        std::string key{};
        std::string name{};
        int hp{};
        int mp{};
        int attack{};
        int defense{};
        int speed{};
        std::vector<Ability> abilities{};
    };

    inline constexpr std::string_view DefendAbility = "defend";

    // warrior, mage, rogue, healer
    auto ArchetypeCatalog() -> std::span<Archetype const>;
    auto FindArchetype(std::string_view key) -> Archetype const*;
    auto FindAbility(Archetype const& a, std::string_view name) -> Ability const*;

    // aggressive -> warrior, conservative -> healer, balanced -> mage, adaptive -> rogue.
    // Unknown personalities map to mage.
    auto ArchetypeForPersonality(std::string_view personality) -> std::string_view;

    // "physical", "magic", "heal", "defend", "cleanse"
    auto KindName(AbilityEffect const& e) -> std::string_view;
}

#endif //ARENA_ARCHETYPES_HPP
