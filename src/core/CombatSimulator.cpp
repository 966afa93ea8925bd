//
// CombatSimulator.cpp
//

#include "CombatSimulator.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <print>
#include <utility>

#include "Judge.hpp"

namespace arena::core
{
    namespace
    {
        auto Describe(StatModifierSpec const& m) -> std::string
        {
            return std::format("{} {:+d} for {}t", ToString(m.stat), m.amount, m.turns);
        }
    }

    CombatSimulator::CombatSimulator(CombatConfig cfg, Providers providers, Collaborators collab) :
        cfg_{std::move(cfg)},
        providers_{std::move(providers)},
        collab_{std::move(collab)},
        rng_{cfg_.seed}
    {
        CheckProviders(providers_);
        if (cfg_.max_turns == 0)
        {
            ARN_THROW(error::Code::Config, "max_turns must be at least 1");
        }
        for (auto const& [player, key] : cfg_.archetypes)
        {
            if (!FindArchetype(key))
            {
                ARN_THROW(error::Code::Config, std::format("Unknown archetype '{}' for {}", key, player));
            }
        }
    }

    auto CombatSimulator::PickArchetype(PlayerId const& player) -> Archetype const&
    {
        if (auto const it = cfg_.archetypes.find(player); it != cfg_.archetypes.end())
        {
            Archetype const* a = FindArchetype(it->second);
            if (!a) ARN_THROW(error::Code::Config, std::format("Unknown archetype '{}'", it->second));
            return *a;
        }
        if (auto const it = cfg_.personalities.find(player); it != cfg_.personalities.end())
        {
            Archetype const* a = FindArchetype(ArchetypeForPersonality(it->second));
            ARN_ASSERT(a != nullptr, "Personality mapped to a missing archetype");
            return *a;
        }
        auto const cat = ArchetypeCatalog();
        size_t const idx = std::uniform_int_distribution<size_t>{0, cat.size() - 1}(rng_);
        return cat[idx];
    }

    auto CombatSimulator::BaseDamage(Fighter const& attacker, Fighter const& defender, DamageEffect const& e) -> int
    {
        double const atk = attacker.EffectiveStat(Stat::Attack);
        double const def = defender.EffectiveStat(Stat::Defense);
        double const base = e.base;

        double const raw = e.kind == DamageKind::Physical
                               ? base * (atk / 15.0) - base * (def / 20.0) * 0.3
                               : base * 0.9 + atk * 0.2 - def * 0.15;
        return std::max(1, static_cast<int>(raw));
    }

    auto CombatSimulator::ComputeDamage(Fighter const& attacker, Fighter const& defender, DamageEffect const& e) -> int
    {
        int dmg = BaseDamage(attacker, defender, e);
        if (e.speed_bonus && attacker.EffectiveStat(Stat::Speed) > defender.EffectiveStat(Stat::Speed))
        {
            dmg = static_cast<int>(dmg * 1.4);
        }
        if (defender.Defending())
        {
            dmg = std::max(1, dmg / 2);
        }
        return dmg;
    }

    auto CombatSimulator::Resolve(Fighter& attacker, Fighter& defender, Ability const& ability) -> ResolvedAction
    {
        attacker.Spend(ability.cost);

        return std::visit(
            [&]<typename T0>(T0 const& eff) -> ResolvedAction
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, DefendEffect>)
                {
                    attacker.SetDefending(true);
                    attacker.Restore(eff.mp_restore);
                    return {std::nullopt, std::format("defending (+{} MP)", eff.mp_restore)};
                }
                else if constexpr (std::is_same_v<T, HealEffect>)
                {
                    attacker.Heal(eff.amount);
                    return {std::nullopt, std::format("healed {} HP", eff.amount)};
                }
                else if constexpr (std::is_same_v<T, CleanseEffect>)
                {
                    attacker.Cleanse();
                    attacker.Heal(eff.heal);
                    return {std::nullopt, std::format("cleansed all debuffs, healed {}", eff.heal)};
                }
                else
                {
                    int const dmg = ComputeDamage(attacker, defender, eff);
                    defender.Damage(dmg);

                    std::string effect;
                    auto const append = [&](std::string s)
                    {
                        effect += (effect.empty() ? "" : "; ");
                        effect += s;
                    };
                    if (eff.debuff)
                    {
                        defender.AddModifier(*eff.debuff);
                        append(Describe(*eff.debuff));
                    }
                    if (eff.self_debuff)
                    {
                        attacker.AddModifier(*eff.self_debuff);
                        append(std::format("self {}", Describe(*eff.self_debuff)));
                    }
                    if (eff.dot)
                    {
                        defender.AddDot(*eff.dot);
                        append(std::format("{} dmg/turn for {}t", eff.dot->damage, eff.dot->turns));
                    }
                    return {dmg, std::move(effect)};
                }
            },
            ability.effect);
    }

    auto CombatSimulator::Play(PlayerId const& a, PlayerId const& b, double const wager) -> GameResult
    {
        CheckWager(wager);

        std::array<Fighter, constants::Seats> fighters{
            Fighter{a, PickArchetype(a)},
            Fighter{b, PickArchetype(b)}
        };
        std::array<PlayerId, constants::Seats> const players{a, b};
        Judge judge{};
        CombatDetails d{};

        if (cfg_.verbose)
        {
            std::print("[combat] {} ({}) vs {} ({}), wager={:.4f}\n", a, fighters[0].Name(), b, fighters[1].Name(), wager);
        }
        Emit(collab_.events.get(), MatchStarted{GameType::Combat, players, wager,
                                                {fighters[0].Kind().key, fighters[1].Kind().key}});

        auto const both_alive = [&] { return fighters[0].Alive() && fighters[1].Alive(); };

        size_t turn = 1;
        for (; turn <= cfg_.max_turns && both_alive(); ++turn)
        {
            bool const a_first = fighters[0].EffectiveStat(Stat::Speed) >= fighters[1].EffectiveStat(Stat::Speed);
            std::array<Seat, constants::Seats> const order = a_first
                                                                 ? std::array{Seat::A, Seat::B}
                                                                 : std::array{Seat::B, Seat::A};

            for (Seat const s : order)
            {
                Fighter& attacker = fighters[Index(s)];
                Fighter& defender = fighters[Index(Other(s))];

                if (!both_alive()) break;

                int const dot = attacker.TickStartOfTurn();
                if (dot > 0 && cfg_.verbose)
                {
                    std::print("[combat]   turn {}: {} takes {} DoT damage (HP: {})\n", turn, attacker.Name(), dot, attacker.Hp());
                }
                if (!attacker.Alive()) break;

                std::vector<Ability const*> affordable = attacker.Affordable();
                std::vector<error::Coercion> narrowed;
                bool const only_defend = std::ranges::none_of(affordable, [](Ability const* ab)
                {
                    return ab->name != DefendAbility;
                });
                if (only_defend)
                {
                    Ability const* defend = FindAbility(attacker.Kind(), DefendAbility);
                    ARN_ASSERT(defend != nullptr, "Archetype has no defend ability");
                    affordable = {defend};
                    narrowed.push_back(error::Coercion{error::CoercionCode::Abilities_DefendOnly}
                                       .with_applied(std::string{DefendAbility}));
                }

                AbilityRequest req{
                    .player = attacker.Id(),
                    .fighter_status = attacker.Status(),
                    .opponent_status = defender.Status(),
                    .available = {},
                    .turn = turn,
                    .max_turns = cfg_.max_turns
                };
                for (Ability const* ab : affordable)
                {
                    req.available.push_back(AbilityOption{
                        ab->name,
                        std::format("{} (MP cost: {})", ab->description, ab->cost),
                        ab->cost
                    });
                }
                if (collab_.context)
                {
                    req.opponent_context = collab_.context->OpponentContext(attacker.Id(), defender.Id());
                }

                AbilityDecision const choice = judge.AskAbility(*providers_[Index(s)], std::move(req), std::move(narrowed));
                Ability const* ability = FindAbility(attacker.Kind(), choice.ability);
                ARN_ASSERT(ability != nullptr, std::format("Validated ability '{}' missing from catalog", choice.ability));

                ResolvedAction const res = Resolve(attacker, defender, *ability);

                CombatTurnRecord rec{
                    .turn = turn,
                    .actor = s,
                    .attacker = attacker.Name(),
                    .ability = ability->name,
                    .kind = std::string{KindName(ability->effect)},
                    .dot_taken = dot,
                    .damage = res.damage,
                    .effect = res.effect,
                    .hp = {fighters[0].Hp(), fighters[1].Hp()},
                    .mp = {fighters[0].Mp(), fighters[1].Mp()}
                };

                if (cfg_.verbose)
                {
                    if (res.damage)
                    {
                        std::print("[combat]   turn {}: {} uses {} -> {} dmg (opponent HP: {})\n", turn, attacker.Name(),
                                   ability->name, *res.damage, defender.Hp());
                    }
                    else
                    {
                        std::print("[combat]   turn {}: {} uses {}: {}\n", turn, attacker.Name(), ability->name, res.effect);
                    }
                }
                Emit(collab_.events.get(), CombatTurnEvent{rec});
                d.log.push_back(std::move(rec));
            }
        }

        Seat winner = Seat::A;
        if (fighters[0].Alive() && !fighters[1].Alive()) winner = Seat::A;
        else if (fighters[1].Alive() && !fighters[0].Alive()) winner = Seat::B;
        else if (fighters[1].Hp() > fighters[0].Hp()) winner = Seat::B;

        Fighter const& loser = fighters[Index(Other(winner))];
        d.win_method = loser.Alive() ? "HP advantage" : "KO";
        for (size_t i = 0; i < constants::Seats; ++i)
        {
            d.archetypes[i] = fighters[i].Kind().key;
            d.final_hp[i] = fighters[i].Hp();
            d.max_hp[i] = fighters[i].MaxHp();
            d.final_mp[i] = fighters[i].Mp();
            d.max_mp[i] = fighters[i].MaxMp();
        }
        d.turns = turn - 1;

        GameResult r{};
        r.game_type = GameType::Combat;
        r.players = players;
        r.winner = players[Index(winner)];
        r.loser = players[Index(Other(winner))];
        r.wager = wager;
        r.seed = cfg_.seed;
        r.rounds_played = d.log.size();
        r.decision_log = judge.TakeLog();

        if (cfg_.verbose)
        {
            std::print("[combat]   WINNER: {} by {} | {} | {}\n", r.winner, d.win_method,
                       fighters[0].Status(), fighters[1].Status());
        }
        Emit(collab_.events.get(), MatchEnded{GameType::Combat, r.winner, r.loser, d.win_method});

        r.details = std::move(d);
        return r;
    }
}
