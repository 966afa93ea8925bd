//
// CombatSimulator.hpp
//

#ifndef ARENA_COMBATSIMULATOR_HPP
#define ARENA_COMBATSIMULATOR_HPP

#include <optional>
#include <random>
#include <string>

#include "Archetypes.hpp"
#include "Config.hpp"
#include "EventSink.hpp"
#include "Fighter.hpp"
#include "Simulator.hpp"

namespace arena::core
{
    struct ResolvedAction
    {
        std::optional<int> damage{};
        std::string effect{};
    };

    // Turn-based duel. Each turn both fighters act once, the faster one first (seat A on a tie).
    class CombatSimulator final : public Simulator
    {
    public:
        CombatSimulator(CombatConfig cfg, Providers providers, Collaborators collab = {});

        [[nodiscard]]
        auto Type() const noexcept -> GameType override { return GameType::Combat; }

        auto Play(PlayerId const& a, PlayerId const& b, double wager) -> GameResult override;

        // Override map, then personality, then a seeded random pick.
        // Throws ConfigError for an unknown archetype name.
        auto PickArchetype(PlayerId const& player) -> Archetype const&;

        auto ProviderAt(Seat s) -> DecisionProvider* { return providers_[Index(s)].get(); }

        // Damage before the defending halving and the speed bonus
        [[nodiscard]]
        static auto BaseDamage(Fighter const& attacker, Fighter const& defender, DamageEffect const& e) -> int;
        [[nodiscard]]
        static auto ComputeDamage(Fighter const& attacker, Fighter const& defender, DamageEffect const& e) -> int;

        // Spends MP then applies the ability's effect
        static auto Resolve(Fighter& attacker, Fighter& defender, Ability const& ability) -> ResolvedAction;

    private:
        CombatConfig cfg_;
        Providers providers_;
        Collaborators collab_;
        std::mt19937_64 rng_;
    };
}

#endif //ARENA_COMBATSIMULATOR_HPP
