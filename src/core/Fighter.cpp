//
// Fighter.cpp
//

#include "Fighter.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace arena::core
{
    Fighter::Fighter(PlayerId id, Archetype const& archetype) :
        id_{std::move(id)},
        archetype_{&archetype},
        hp_{archetype.hp},
        mp_{archetype.mp}
    {
    }

    auto Fighter::BaseStat(Stat const s) const noexcept -> int
    {
        switch (s)
        {
        case Stat::Attack: return archetype_->attack;
        case Stat::Defense: return archetype_->defense;
        case Stat::Speed: return archetype_->speed;
        }
        return 0;
    }

    auto Fighter::EffectiveStat(Stat const s) const noexcept -> int
    {
        int v = BaseStat(s);
        for (StatModifier const& m : modifiers_)
        {
            if (m.stat == s) v += m.amount;
        }
        return std::max(1, v);
    }

    auto Fighter::SetHp(int const v) noexcept -> void
    {
        hp_ = std::clamp(v, 0, MaxHp());
    }

    auto Fighter::SetMp(int const v) noexcept -> void
    {
        mp_ = std::clamp(v, 0, MaxMp());
    }

    auto Fighter::AddModifier(StatModifierSpec const& m) -> void
    {
        modifiers_.push_back(StatModifier{m.stat, m.amount, m.turns});
    }

    auto Fighter::AddDot(DotSpec const& d) -> void
    {
        dots_.push_back(DamageOverTime{d.damage, d.turns});
    }

    auto Fighter::Cleanse() -> void
    {
        dots_.clear();
        std::erase_if(modifiers_, [](StatModifier const& m) { return m.amount <= 0; });
    }

    auto Fighter::TickStartOfTurn() -> int
    {
        int dot_damage = 0;
        for (DamageOverTime& d : dots_)
        {
            dot_damage += d.damage;
            --d.turns;
        }
        std::erase_if(dots_, [](DamageOverTime const& d) { return d.turns <= 0; });

        for (StatModifier& m : modifiers_) --m.turns;
        std::erase_if(modifiers_, [](StatModifier const& m) { return m.turns <= 0; });

        defending_ = false;
        Damage(dot_damage);
        return dot_damage;
    }

    auto Fighter::Affordable() const -> std::vector<Ability const*>
    {
        std::vector<Ability const*> out;
        for (Ability const& a : archetype_->abilities)
        {
            if (a.cost <= mp_) out.push_back(&a);
        }
        return out;
    }

    auto Fighter::Status() const -> std::string
    {
        std::vector<std::string> effects;
        if (!dots_.empty())
        {
            int total = 0;
            for (DamageOverTime const& d : dots_) total += d.damage;
            effects.push_back(std::format("DoT:{}/turn", total));
        }
        for (StatModifier const& m : modifiers_)
        {
            effects.push_back(std::format("{}{:+d}({}t)", ToString(m.stat), m.amount, m.turns));
        }

        std::string eff;
        for (size_t i{}; i < effects.size(); ++i)
        {
            eff += (i ? ", " : "");
            eff += effects[i];
        }

        return std::format("{} HP:{}/{} MP:{}/{} ATK:{} DEF:{}{}", Name(), hp_, MaxHp(), mp_, MaxMp(),
                           EffectiveStat(Stat::Attack), EffectiveStat(Stat::Defense),
                           eff.empty() ? std::string{} : std::format(" [{}]", eff));
    }
}
