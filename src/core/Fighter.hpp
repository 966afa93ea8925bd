//
// Fighter.hpp
//

#ifndef ARENA_FIGHTER_HPP
#define ARENA_FIGHTER_HPP

#include <string>
#include <vector>

#include "Archetypes.hpp"
#include "Types.hpp"

namespace arena::core
{
    struct StatModifier
    {
        Stat stat{};
        int amount{};
        int turns{};
    };

    struct DamageOverTime
    {
        int damage{};
        int turns{};
    };

    // Combat state for one seat. HP and MP are kept inside [0, max] by every mutator.
    class Fighter
    {
    public:
        Fighter(PlayerId id, Archetype const& archetype);

        [[nodiscard]] auto Id() const noexcept -> PlayerId const& { return id_; }
        [[nodiscard]] auto Kind() const noexcept -> Archetype const& { return *archetype_; }
        [[nodiscard]] auto Name() const noexcept -> std::string const& { return archetype_->name; }

        [[nodiscard]] auto Hp() const noexcept -> int { return hp_; }
        [[nodiscard]] auto MaxHp() const noexcept -> int { return archetype_->hp; }
        [[nodiscard]] auto Mp() const noexcept -> int { return mp_; }
        [[nodiscard]] auto MaxMp() const noexcept -> int { return archetype_->mp; }
        [[nodiscard]] auto Alive() const noexcept -> bool { return hp_ > 0; }
        [[nodiscard]] auto Defending() const noexcept -> bool { return defending_; }

        [[nodiscard]] auto BaseStat(Stat s) const noexcept -> int;
        // base plus every active modifier on that stat, never below 1
        [[nodiscard]] auto EffectiveStat(Stat s) const noexcept -> int;

        [[nodiscard]] auto Modifiers() const noexcept -> std::vector<StatModifier> const& { return modifiers_; }
        [[nodiscard]] auto Dots() const noexcept -> std::vector<DamageOverTime> const& { return dots_; }

        auto SetHp(int v) noexcept -> void;
        auto SetMp(int v) noexcept -> void;
        auto Damage(int amount) noexcept -> void { SetHp(hp_ - amount); }
        auto Heal(int amount) noexcept -> void { SetHp(hp_ + amount); }
        auto Spend(int cost) noexcept -> void { SetMp(mp_ - cost); }
        auto Restore(int amount) noexcept -> void { SetMp(mp_ + amount); }
        auto SetDefending(bool v) noexcept -> void { defending_ = v; }

        auto AddModifier(StatModifierSpec const& m) -> void;
        auto AddDot(DotSpec const& d) -> void;

        // Keeps positive modifiers, drops DoTs and negative modifiers
        auto Cleanse() -> void;

        // Start-of-turn upkeep. Every DoT deals its damage and loses a turn, expired ones
        // are removed; then modifiers lose a turn and expire; then defending is cleared.
        // Returns the DoT damage dealt (already applied to HP).
        auto TickStartOfTurn() -> int;

        // Abilities whose cost fits the current MP, catalog order
        [[nodiscard]] auto Affordable() const -> std::vector<Ability const*>;

        // "Warrior HP:120/120 MP:40/40 ATK:18 DEF:14 [DoT:8/turn, atk-3(2t)]"
        [[nodiscard]] auto Status() const -> std::string;

    private:
        PlayerId id_;
        Archetype const* archetype_;
        int hp_;
        int mp_;
        bool defending_{false};
        std::vector<StatModifier> modifiers_{};
        std::vector<DamageOverTime> dots_{};
    };
}

#endif //ARENA_FIGHTER_HPP
