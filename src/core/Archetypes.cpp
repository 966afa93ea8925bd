//
// Archetypes.cpp
//

#include "Archetypes.hpp"

#include <algorithm>

namespace arena::core
{
    namespace
    {
        auto BuildCatalog() -> std::vector<Archetype>
        {
            using P = DamageKind;
            return {
                Archetype{
                    "warrior", "Warrior", 120, 40, 18, 14, 8,
                    {
                        {"slash", "Basic sword slash", 0, DamageEffect{P::Physical, 22}},
                        {"shield_bash", "Stun strike, reduces opponent ATK by 3 for 2 turns", 8,
                         DamageEffect{P::Physical, 15, false, StatModifierSpec{Stat::Attack, -3, 2}}},
                        {"berserk", "Powerful attack but lowers own defense by 4 for 2 turns", 15,
                         DamageEffect{P::Physical, 35, false, std::nullopt, StatModifierSpec{Stat::Defense, -4, 2}}},
                        {"defend", "Block stance, halves incoming damage this turn and restores 5 MP", 0, DefendEffect{5}},
                        {"heal", "Bandage wounds, restore 25 HP", 12, HealEffect{25}},
                    }
                },
                Archetype{
                    "mage", "Mage", 80, 100, 10, 8, 10,
                    {
                        {"fireball", "Hurls a fireball dealing 30 magic damage", 15, DamageEffect{P::Magical, 30}},
                        {"ice_shard", "Ice projectile, slows opponent (speed -3 for 2 turns)", 8,
                         DamageEffect{P::Magical, 18, false, StatModifierSpec{Stat::Speed, -3, 2}}},
                        {"arcane_burst", "Devastating arcane explosion, very high damage", 30, DamageEffect{P::Magical, 45}},
                        {"defend", "Magical barrier, halves damage this turn and restores 8 MP", 0, DefendEffect{8}},
                        {"heal", "Healing light, restore 20 HP", 10, HealEffect{20}},
                    }
                },
                Archetype{
                    "rogue", "Rogue", 90, 60, 16, 10, 16,
                    {
                        {"backstab", "Quick stab, bonus damage if faster than opponent", 5,
                         DamageEffect{P::Physical, 25, true}},
                        {"poison_blade", "Poison strike, deals 8 damage per turn for 3 turns", 10,
                         DamageEffect{P::Physical, 12, false, std::nullopt, std::nullopt, DotSpec{8, 3}}},
                        {"shadow_strike", "Critical strike from the shadows, high damage", 20, DamageEffect{P::Physical, 38}},
                        {"defend", "Evasive dodge, halves damage this turn and restores 6 MP", 0, DefendEffect{6}},
                        {"heal", "Quick bandage, restore 18 HP", 10, HealEffect{18}},
                    }
                },
                Archetype{
                    "healer", "Healer", 100, 90, 10, 12, 9,
                    {
                        {"smite", "Holy damage strike", 5, DamageEffect{P::Magical, 16}},
                        {"divine_heal", "Powerful healing, restore 40 HP", 15, HealEffect{40}},
                        {"holy_fire", "Sacred fire, burns for 6 damage over 2 turns", 18,
                         DamageEffect{P::Magical, 28, false, std::nullopt, std::nullopt, DotSpec{6, 2}}},
                        {"defend", "Prayer shield, halves damage and restores 8 MP", 0, DefendEffect{8}},
                        {"purify", "Remove all debuffs and DoTs, restore 10 HP", 10, CleanseEffect{10}},
                    }
                },
            };
        }
    }

    auto ArchetypeCatalog() -> std::span<Archetype const>
    {
        static std::vector<Archetype> const catalog = BuildCatalog();
        return catalog;
    }

    auto FindArchetype(std::string_view const key) -> Archetype const*
    {
        auto const cat = ArchetypeCatalog();
        auto const it = std::ranges::find(cat, key, &Archetype::key);
        return it == cat.end() ? nullptr : &*it;
    }

    auto FindAbility(Archetype const& a, std::string_view const name) -> Ability const*
    {
        auto const it = std::ranges::find(a.abilities, name, &Ability::name);
        return it == a.abilities.end() ? nullptr : &*it;
    }

    auto ArchetypeForPersonality(std::string_view const personality) -> std::string_view
    {
        if (personality == "aggressive") return "warrior";
        if (personality == "conservative") return "healer";
        if (personality == "balanced") return "mage";
        if (personality == "adaptive") return "rogue";
        return "mage";
    }

    auto KindName(AbilityEffect const& e) -> std::string_view
    {
        return std::visit(
            []<typename T0>(T0 const& eff) -> std::string_view
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, DamageEffect>)
                {
                    return eff.kind == DamageKind::Physical ? "physical" : "magic";
                }
                else if constexpr (std::is_same_v<T, HealEffect>)
                {
                    return "heal";
                }
                else if constexpr (std::is_same_v<T, DefendEffect>)
                {
                    return "defend";
                }
                else
                {
                    return "cleanse";
                }
            },
            e);
    }
}
