#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <string_view>
#include <variant>

#include "../core/CombatSimulator.hpp"
#include "../core/Exception.hpp"
#include "../debug/Invariants.hpp"
#include "ScriptedProvider.hpp"

using namespace arena::core;
using arena::test::HasCoercion;
using arena::test::ScriptedProvider;
using error::CoercionCode;

namespace
{
    auto Make(std::string_view key) -> Fighter
    {
        Archetype const* a = FindArchetype(key);
        EXPECT_NE(a, nullptr) << key;
        return Fighter{std::string{key}, *a};
    }

    auto Attack(std::string_view archetype, std::string_view ability) -> DamageEffect const&
    {
        Ability const* ab = FindAbility(*FindArchetype(archetype), ability);
        return std::get<DamageEffect>(ab->effect);
    }

    auto Details(GameResult const& r) -> CombatDetails const&
    {
        return std::get<CombatDetails>(r.details);
    }

    auto Offered(AbilityRequest const& req, std::string_view name) -> bool
    {
        return std::ranges::any_of(req.available, [&](AbilityOption const& o) { return o.name == name; });
    }
}

TEST(Combat, CatalogHasFourArchetypesWithDefend)
{
    auto const cat = ArchetypeCatalog();
    ASSERT_EQ(cat.size(), 4u);
    for (Archetype const& a : cat)
    {
        EXPECT_EQ(a.abilities.size(), 5u) << a.key;
        Ability const* d = FindAbility(a, DefendAbility);
        ASSERT_NE(d, nullptr) << a.key;
        EXPECT_EQ(d->cost, 0);
    }
    EXPECT_EQ(FindArchetype("paladin"), nullptr);
}

TEST(Combat, PhysicalAndMagicDamage)
{
    Fighter const warrior = Make("warrior");
    Fighter const other = Make("warrior");
    Fighter const mage = Make("mage");

    // 22 * 18/15 - 22 * 14/20 * 0.3 = 21.78
    EXPECT_EQ(CombatSimulator::BaseDamage(warrior, other, Attack("warrior", "slash")), 21);
    // 30 * 0.9 + 10 * 0.2 - 14 * 0.15 = 26.9
    EXPECT_EQ(CombatSimulator::BaseDamage(mage, warrior, Attack("mage", "fireball")), 26);
}

TEST(Combat, DefendingHalvesDamage)
{
    Fighter const warrior = Make("warrior");
    Fighter other = Make("warrior");
    other.SetDefending(true);

    EXPECT_EQ(CombatSimulator::ComputeDamage(warrior, other, Attack("warrior", "slash")), 10);
}

TEST(Combat, BackstabBonusOnlyWhenFaster)
{
    Fighter const rogue = Make("rogue");
    Fighter const warrior = Make("warrior");
    Fighter const twin = Make("rogue");

    // 21 before the x1.4 bonus
    EXPECT_EQ(CombatSimulator::ComputeDamage(rogue, warrior, Attack("rogue", "backstab")), 29);
    EXPECT_EQ(CombatSimulator::ComputeDamage(rogue, twin, Attack("rogue", "backstab")), 22);
}

TEST(Combat, DamageNeverBelowOne)
{
    Fighter const healer = Make("healer");
    Fighter warrior = Make("warrior");
    warrior.AddModifier(StatModifierSpec{Stat::Defense, 100, 3});
    warrior.SetDefending(true);

    EXPECT_EQ(CombatSimulator::ComputeDamage(healer, warrior, Attack("healer", "smite")), 1);
}

TEST(Combat, ResolveAppliesDebuffAndSpendsMp)
{
    Fighter warrior = Make("warrior");
    Fighter target = Make("mage");
    Ability const* bash = FindAbility(warrior.Kind(), "shield_bash");
    ASSERT_NE(bash, nullptr);

    ResolvedAction const res = CombatSimulator::Resolve(warrior, target, *bash);

    ASSERT_TRUE(res.damage.has_value());
    EXPECT_GE(*res.damage, 1);
    EXPECT_EQ(target.Hp(), target.MaxHp() - *res.damage);
    EXPECT_EQ(warrior.Mp(), 40 - 8);
    EXPECT_EQ(target.EffectiveStat(Stat::Attack), 10 - 3);
    EXPECT_NE(res.effect.find("atk -3"), std::string::npos) << res.effect;
}

TEST(Combat, HealIsCappedAtMaxHp)
{
    Fighter healer = Make("healer");
    Fighter other = Make("mage");
    healer.Damage(10);

    ResolvedAction const res = CombatSimulator::Resolve(healer, other, *FindAbility(healer.Kind(), "divine_heal"));

    EXPECT_FALSE(res.damage.has_value());
    EXPECT_EQ(healer.Hp(), healer.MaxHp());
    EXPECT_EQ(healer.Mp(), 90 - 15);
}

TEST(Combat, DamageOverTimeStacksIndependently)
{
    Fighter w = Make("warrior");
    w.AddDot(DotSpec{8, 3});
    w.AddDot(DotSpec{8, 3});

    EXPECT_EQ(w.TickStartOfTurn(), 16);
    ASSERT_EQ(w.Dots().size(), 2u);

    w.AddDot(DotSpec{8, 3});
    EXPECT_EQ(w.TickStartOfTurn(), 24);
    EXPECT_EQ(w.TickStartOfTurn(), 24);
    // the first two ran out, the late one has a turn left
    ASSERT_EQ(w.Dots().size(), 1u);
    EXPECT_EQ(w.TickStartOfTurn(), 8);
    EXPECT_EQ(w.TickStartOfTurn(), 0);
    EXPECT_EQ(w.Hp(), 120 - 16 - 24 - 24 - 8);
}

TEST(Combat, ModifiersExpireAndStack)
{
    Fighter w = Make("warrior");
    w.AddModifier(StatModifierSpec{Stat::Attack, -3, 2});
    w.AddModifier(StatModifierSpec{Stat::Attack, -3, 1});
    EXPECT_EQ(w.EffectiveStat(Stat::Attack), 12);

    (void)w.TickStartOfTurn();
    EXPECT_EQ(w.EffectiveStat(Stat::Attack), 15);
    (void)w.TickStartOfTurn();
    EXPECT_EQ(w.EffectiveStat(Stat::Attack), 18);
    EXPECT_TRUE(w.Modifiers().empty());
}

TEST(Combat, CleanseKeepsBuffsOnly)
{
    Fighter h = Make("healer");
    h.AddDot(DotSpec{6, 2});
    h.AddModifier(StatModifierSpec{Stat::Attack, -3, 2});
    h.AddModifier(StatModifierSpec{Stat::Defense, 2, 2});
    h.Damage(30);
    Fighter other = Make("rogue");

    (void)CombatSimulator::Resolve(h, other, *FindAbility(h.Kind(), "purify"));

    EXPECT_TRUE(h.Dots().empty());
    ASSERT_EQ(h.Modifiers().size(), 1u);
    EXPECT_EQ(h.Modifiers()[0].stat, Stat::Defense);
    EXPECT_EQ(h.Hp(), 100 - 30 + 10);
}

TEST(Combat, StatusLine)
{
    Fighter w = Make("warrior");
    EXPECT_EQ(w.Status(), "Warrior HP:120/120 MP:40/40 ATK:18 DEF:14");

    w.AddDot(DotSpec{8, 3});
    w.AddModifier(StatModifierSpec{Stat::Attack, -3, 2});
    EXPECT_EQ(w.Status(), "Warrior HP:120/120 MP:40/40 ATK:15 DEF:14 [DoT:8/turn, atk-3(2t)]");
}

TEST(Combat, OnlyDefendIsOfferedWhenMpRunsDry)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 6, .archetypes = {{"alice", "mage"}, {"bob", "warrior"}}},
        arena::test::MakeSeats(a, b)
    };
    // burn MP: arcane burst while affordable, then heal, then whatever is left
    a->ability = [](AbilityRequest const& req)
    {
        if (Offered(req, "arcane_burst")) return ScriptedProvider::Ability("arcane_burst");
        if (Offered(req, "heal")) return ScriptedProvider::Ability("heal");
        return ScriptedProvider::Ability(req.available.front().name);
    };
    b->ability = [](AbilityRequest const&) { return ScriptedProvider::Ability("defend"); };

    GameResult const r = sim.Play("alice", "bob", 1.0);

    size_t defend_only = 0;
    for (DecisionRecord const& rec : r.decision_log)
    {
        auto const& req = std::get<AbilityRequest>(rec.request);
        if (!HasCoercion(rec, CoercionCode::Abilities_DefendOnly)) continue;

        ++defend_only;
        EXPECT_EQ(rec.player, "alice");
        ASSERT_EQ(req.available.size(), 1u);
        EXPECT_EQ(req.available[0].name, "defend");
        EXPECT_EQ(std::get<AbilityDecision>(rec.decision).ability, "defend");
    }
    EXPECT_GE(defend_only, 1u);

    // the warrior always has a free slash, so it is never narrowed
    for (DecisionRecord const& rec : r.decision_log)
    {
        if (rec.player == "bob")
        {
            EXPECT_GT(std::get<AbilityRequest>(rec.request).available.size(), 1u);
        }
    }

    auto const ok = debug::CheckInvariants(r);
    EXPECT_TRUE(ok.has_value()) << ok.error();
}

TEST(Combat, UnavailableAbilityFallsBackToFirstOption)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 1, .archetypes = {{"alice", "warrior"}, {"bob", "warrior"}}},
        arena::test::MakeSeats(a, b)
    };
    a->ability = [](AbilityRequest const&) { return ScriptedProvider::Ability("fireball"); };

    GameResult const r = sim.Play("alice", "bob", 1.0);

    ASSERT_FALSE(r.decision_log.empty());
    DecisionRecord const& first = r.decision_log[0];
    EXPECT_EQ(first.player, "alice");
    EXPECT_TRUE(HasCoercion(first, CoercionCode::Ability_NotAvailable));
    EXPECT_EQ(std::get<AbilityDecision>(first.decision).ability, "slash");
    EXPECT_EQ(Details(r).log[0].ability, "slash");
}

TEST(Combat, MirrorMatchEndsInKnockout)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 20, .archetypes = {{"alice", "warrior"}, {"bob", "warrior"}}},
        arena::test::MakeSeats(a, b)
    };

    GameResult const r = sim.Play("alice", "bob", 1.0);
    CombatDetails const& d = Details(r);

    // 21 per slash, equal speed so alice always swings first
    EXPECT_EQ(r.winner, "alice");
    EXPECT_EQ(d.win_method, "KO");
    EXPECT_EQ(d.turns, 6u);
    EXPECT_EQ(d.final_hp[1], 0);
    EXPECT_EQ(d.final_hp[0], 120 - 5 * 21);
    EXPECT_EQ(r.rounds_played, 11u);
    EXPECT_EQ(r.decision_log.size(), 11u);
    EXPECT_EQ(d.log.front().actor, Seat::A);
    EXPECT_EQ(d.log.front().kind, "physical");

    auto const ok = debug::CheckInvariants(r);
    EXPECT_TRUE(ok.has_value()) << ok.error();
}

TEST(Combat, TurnLimitDecidesOnHp)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 3, .archetypes = {{"alice", "warrior"}, {"bob", "warrior"}}},
        arena::test::MakeSeats(a, b)
    };
    b->ability = [](AbilityRequest const&) { return ScriptedProvider::Ability("defend"); };

    GameResult const r = sim.Play("alice", "bob", 1.0);
    CombatDetails const& d = Details(r);

    EXPECT_EQ(r.winner, "alice");
    EXPECT_EQ(d.win_method, "HP advantage");
    EXPECT_EQ(d.turns, 3u);
    // first slash lands in full, the rest hit a defending target
    EXPECT_EQ(d.final_hp[1], 120 - 21 - 10 - 10);
    EXPECT_EQ(d.final_hp[0], 120);

    auto const ok = debug::CheckInvariants(r);
    EXPECT_TRUE(ok.has_value()) << ok.error();
}

TEST(Combat, FasterSecondSeatActsFirst)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 2, .archetypes = {{"alice", "warrior"}, {"bob", "rogue"}}},
        arena::test::MakeSeats(a, b)
    };

    GameResult const r = sim.Play("alice", "bob", 1.0);
    CombatDetails const& d = Details(r);

    // rogue speed 16 against warrior speed 8
    ASSERT_EQ(d.log.size(), 4u);
    EXPECT_EQ(d.log[0].actor, Seat::B);
    EXPECT_EQ(d.log[1].actor, Seat::A);
    EXPECT_EQ(d.log[2].actor, Seat::B);
    EXPECT_EQ(r.decision_log[0].player, "bob");
    EXPECT_EQ(r.decision_log[1].player, "alice");
    EXPECT_EQ(std::get<AbilityRequest>(r.decision_log[0].request).turn, 1u);
}

TEST(Combat, PoisonKnockoutEndsTheFightBeforeTheVictimActs)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 20, .archetypes = {{"alice", "rogue"}, {"bob", "warrior"}}},
        arena::test::MakeSeats(a, b)
    };
    a->ability = [](AbilityRequest const& req)
    {
        return ScriptedProvider::Ability(Offered(req, "poison_blade") ? "poison_blade" : "defend");
    };
    b->ability = [](AbilityRequest const&) { return ScriptedProvider::Ability("defend"); };

    GameResult const r = sim.Play("alice", "bob", 1.0);
    CombatDetails const& d = Details(r);

    // 10 on the first hit, 5 against a defending target after that, plus 8 per stacked poison.
    // Bob is on 18 HP when turn 5 starts for him and three poisons tick for 24.
    EXPECT_EQ(r.winner, "alice");
    EXPECT_EQ(d.win_method, "KO");
    EXPECT_EQ(d.turns, 5u);
    EXPECT_EQ(d.final_hp[1], 0);
    EXPECT_EQ(d.final_hp[0], 90);

    // alice's turn-5 strike is the last action; bob never gets asked in turn 5
    ASSERT_EQ(d.log.size(), 9u);
    EXPECT_EQ(d.log.back().actor, Seat::A);
    EXPECT_EQ(d.log.back().turn, 5u);
    EXPECT_EQ(d.log.back().hp[1], 18);
    EXPECT_EQ(d.log[7].dot_taken, 24);
    EXPECT_EQ(r.rounds_played, 9u);
    ASSERT_EQ(r.decision_log.size(), 9u);
    EXPECT_EQ(r.decision_log.back().player, "alice");

    auto const ok = debug::CheckInvariants(r);
    EXPECT_TRUE(ok.has_value()) << ok.error();
}

TEST(Combat, EqualHpAtTheTurnLimitGoesToFirstSeat)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 3, .archetypes = {{"alice", "warrior"}, {"bob", "warrior"}}},
        arena::test::MakeSeats(a, b)
    };
    a->ability = [](AbilityRequest const&) { return ScriptedProvider::Ability("defend"); };
    b->ability = [](AbilityRequest const&) { return ScriptedProvider::Ability("defend"); };

    GameResult const r = sim.Play("alice", "bob", 1.0);
    CombatDetails const& d = Details(r);

    EXPECT_EQ(d.final_hp[0], d.final_hp[1]);
    EXPECT_EQ(d.turns, 3u);
    EXPECT_EQ(r.winner, "alice");
    EXPECT_EQ(r.loser, "bob");
    EXPECT_EQ(d.win_method, "HP advantage");
}

TEST(Combat, PersonalityPicksArchetype)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{
            .seed = 3,
            .archetypes = {{"carol", "rogue"}},
            .personalities = {{"alice", "aggressive"}, {"bob", "zen"}, {"carol", "conservative"}, {"dave", "adaptive"}}
        },
        arena::test::MakeSeats(a, b)
    };

    EXPECT_EQ(sim.PickArchetype("alice").key, "warrior");
    EXPECT_EQ(sim.PickArchetype("bob").key, "mage");
    // an explicit archetype beats the personality
    EXPECT_EQ(sim.PickArchetype("carol").key, "rogue");
    EXPECT_EQ(sim.PickArchetype("dave").key, "rogue");
    EXPECT_NE(FindArchetype(sim.PickArchetype("erin").key), nullptr);

    EXPECT_EQ(ArchetypeForPersonality("conservative"), "healer");
    EXPECT_EQ(ArchetypeForPersonality("balanced"), "mage");
}

TEST(Combat, UnknownArchetypeIsAConfigError)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    EXPECT_THROW((CombatSimulator{CombatConfig{.archetypes = {{"alice", "paladin"}}}, arena::test::MakeSeats(a, b)}),
                 error::ConfigError);
}

TEST(Combat, RequestDescribesCosts)
{
    ScriptedProvider* a{};
    ScriptedProvider* b{};
    CombatSimulator sim{
        CombatConfig{.seed = 3, .max_turns = 1, .archetypes = {{"alice", "mage"}, {"bob", "warrior"}}},
        arena::test::MakeSeats(a, b)
    };

    GameResult const r = sim.Play("alice", "bob", 1.0);

    auto const& req = std::get<AbilityRequest>(r.decision_log[0].request);
    EXPECT_EQ(req.turn, 1u);
    EXPECT_EQ(req.max_turns, 1u);
    EXPECT_EQ(req.available.size(), 5u);
    EXPECT_EQ(req.available[0].description, "Hurls a fireball dealing 30 magic damage (MP cost: 15)");
    EXPECT_EQ(req.fighter_status, "Mage HP:80/80 MP:100/100 ATK:10 DEF:8");
    EXPECT_EQ(r.decision_log[0].label, "turn 1");
}
