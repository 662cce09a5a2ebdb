/// @file main.cpp
/// @brief battle_sim entry point.
///
/// Loads a YAML configuration, builds a small skirmish on the reference
/// grid and runs it to completion on virtual time. Player units are driven
/// by a simple autopilot so the battle needs no input.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tbc/foundation/config_manager.hpp"
#include "tbc/foundation/random_source.hpp"
#include "tbc/foundation/signal.hpp"
#include "tbc/game/ai_behavior.hpp"
#include "tbc/service/battle_session.hpp"
#include "tbc/version.hpp"

namespace {

using namespace std::chrono_literals;
using tbc::foundation::CombatantId;
using tbc::foundation::SkillId;
using namespace tbc::game;

std::string parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return "config/battle.yaml";
}

std::unique_ptr<Combatant> makeUnit(uint64_t id, std::string name, Faction faction,
                                    CombatStats stats, GridPos pos) {
    return std::make_unique<Combatant>(CombatantId(id), std::move(name), faction, stats, pos);
}

Skill damageSkill(uint32_t id, std::string name, int32_t range, int32_t power) {
    Skill skill;
    skill.id = SkillId(id);
    skill.name = std::move(name);
    skill.range = range;
    skill.power = power;
    return skill;
}

/// Plays the head of every player window with Berserker scoring.
class PlayerAutopilot {
public:
    explicit PlayerAutopilot(tbc::service::BattleSession& session)
        : session_(session),
          behavior_(AIBehavior::Make(AIBehaviorKind::Berserker)),
          rng_(session.config().seed + 1) {
        connection_ = tbc::foundation::connectScoped(
            session_.events().turnWindowChanged,
            [this](const std::vector<CombatantId>&) { schedule(); });
    }

private:
    void schedule() {
        auto timer = session_.timers().scheduleAfter(250ms, [this] { playHead(); });
        if (timer.hasError()) {
            std::cerr << "autopilot: " << timer.error().message() << "\n";
        }
    }

    void playHead() {
        const auto& window = session_.engine().GetCurrentWindow();
        if (window.empty()) {
            return;
        }
        auto* unit = session_.roster().Find(window.front());
        if (unit == nullptr || !unit->IsPlayerControlled()) {
            return;
        }
        auto id = unit->Id();

        if (unit->CanAct()) {
            auto units = static_cast<const CombatantRoster&>(session_.roster()).All();
            AIContext ctx{*unit, units, session_.factions(), &session_.grid(), rng_};
            if (const auto* target = behavior_.ChooseTarget(ctx)) {
                auto targetId = target->Id();
                if (ChebyshevDistance(unit->Position(), target->Position()) > 1) {
                    auto cells = session_.grid().ReachableCells(*unit, unit->MovementRemaining());
                    if (auto best = behavior_.EvaluateBestMove(ctx, *target, cells)) {
                        auto moved = session_.requestMove(id, *best);
                        if (moved.hasError()) {
                            std::cerr << "  move refused: " << moved.error().message() << "\n";
                        }
                    }
                }
                if (ChebyshevDistance(unit->Position(), target->Position()) == 1) {
                    auto attacked = session_.requestAttack(id, targetId);
                    if (attacked.hasError()) {
                        std::cerr << "  attack refused: " << attacked.error().message() << "\n";
                    }
                }
            }
        }

        if (session_.engine().IsUnitInCurrentWindow(id)) {
            auto ended = session_.requestEndTurn(id);
            if (ended.hasError()) {
                std::cerr << "  end turn refused: " << ended.error().message() << "\n";
            }
        }
    }

    tbc::service::BattleSession& session_;
    AIBehavior behavior_;
    tbc::foundation::MersenneRandomSource rng_;
    tbc::foundation::ScopedConnection connection_;
};

void populate(tbc::service::BattleSession& session) {
    auto add = [&session](std::unique_ptr<Combatant> unit, std::optional<AIBehavior> behavior) {
        auto name = unit->Name();
        auto added = session.addCombatant(std::move(unit), std::move(behavior));
        if (added.hasError()) {
            std::cerr << "cannot add " << name << ": " << added.error().message() << "\n";
        }
    };

    auto knight = makeUnit(1, "Knight", Faction::Player,
                           {.maxHp = 40, .attack = 9, .defense = 3, .speed = 6, .finesse = 4},
                           {1, 3});
    knight->SetProficiency(ProficiencyTier::Expert);
    add(std::move(knight), std::nullopt);

    auto ranger = makeUnit(2, "Ranger", Faction::Player,
                           {.maxHp = 28, .attack = 7, .speed = 7, .luck = 6, .finesse = 6},
                           {1, 5});
    ranger->AddSkill(damageSkill(10, "Longshot", 3, 6));
    add(std::move(ranger), std::nullopt);

    auto militia = makeUnit(3, "Militia", Faction::Faction2,
                            {.maxHp = 22, .attack = 5, .defense = 1, .speed = 4}, {2, 1});
    add(std::move(militia), AIBehavior::Make(AIBehaviorKind::Protector));

    auto brute = makeUnit(20, "Goblin Brute", Faction::Faction1,
                          {.maxHp = 30, .attack = 8, .defense = 1, .speed = 6}, {8, 3});
    brute->SetArchetype(UnitArchetype::Beast);
    brute->AddSkill(damageSkill(20, "Frenzy", 1, 11));
    add(std::move(brute), AIBehavior::Make(AIBehaviorKind::Berserker));

    auto shaman = makeUnit(21, "Goblin Shaman", Faction::Faction1,
                           {.maxHp = 20, .attack = 3, .speed = 5, .focus = 6}, {9, 4});
    shaman->SetArchetype(UnitArchetype::Magi);
    auto ember = damageSkill(21, "Ember", 3, 4);
    ember.appliesEffect = std::make_shared<const StatusEffectDefinition>(
        StatusEffectDefinition::Preset(StatusEffectType::Burn));
    ember.effectDuration = 2;
    shaman->AddSkill(std::move(ember));
    Skill mend;
    mend.id = SkillId(22);
    mend.name = "Mend";
    mend.kind = SkillKind::Support;
    mend.range = 2;
    mend.healAmount = 6;
    shaman->AddSkill(std::move(mend));
    add(std::move(shaman), AIBehavior::Make(AIBehaviorKind::Support));

    auto sneak = makeUnit(22, "Goblin Sneak", Faction::Faction1,
                          {.maxHp = 18, .attack = 6, .speed = 8, .luck = 8, .finesse = 5},
                          {8, 6});
    add(std::move(sneak), AIBehavior::Make(AIBehaviorKind::Coward));
}

}  // namespace

int main(int argc, char* argv[]) {
    auto configPath = parseConfigArg(argc, argv);

    tbc::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto sessionConfig = tbc::service::BattleSessionConfig::fromConfig(config);
    if (!sessionConfig) {
        std::cerr << "Invalid config: " << sessionConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "battle_sim " << TBC_VERSION_STRING << "\n";
    tbc::service::BattleSession session(sessionConfig.value());
    auto factions = session.applyFactionConfig(config);
    if (!factions) {
        std::cerr << "Invalid faction config: " << factions.error().message() << "\n";
        return EXIT_FAILURE;
    }

    session.grid().SetObstacle({5, 2});
    session.grid().SetObstacle({5, 3});
    session.grid().PlaceHazard({4, 5}, HazardSpec{6, 4});
    populate(session);

    auto& events = session.events();
    auto nameOf = [&session](CombatantId id) {
        const auto* unit = session.roster().Find(id);
        return unit != nullptr ? unit->Name() : std::string("?");
    };
    std::vector<tbc::foundation::ScopedConnection> narration;
    narration.push_back(tbc::foundation::connectScoped(
        events.roundStarted, [](int32_t round) { std::cout << "-- round " << round << " --\n"; }));
    narration.push_back(tbc::foundation::connectScoped(
        events.attackResolved,
        [&nameOf](CombatantId a, CombatantId t, const CombatResolutionResult& r) {
            std::cout << "  " << nameOf(a) << " -> " << nameOf(t) << ": ";
            if (!r.hit) {
                std::cout << "miss\n";
            } else if (r.parried) {
                std::cout << "parried\n";
            } else {
                std::cout << r.finalDamage << " damage"
                          << (r.criticalHit && !r.criticalDefended ? " (critical)" : "") << "\n";
            }
        }));
    narration.push_back(tbc::foundation::connectScoped(
        events.unitDefeated,
        [&nameOf](CombatantId id) { std::cout << "  " << nameOf(id) << " is defeated\n"; }));

    PlayerAutopilot autopilot(session);

    auto started = session.start();
    if (!started) {
        std::cerr << "Cannot start battle: " << started.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (session.state() == tbc::service::SessionState::AwaitingStakes) {
        std::cout << "Stakes: the village granary. Acknowledged.\n";
        auto acknowledged = session.acknowledgeStakes();
        if (!acknowledged) {
            std::cerr << "Cannot begin battle: " << acknowledged.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto limitMs = config.getOr<int64_t>("battle.simulation_limit_ms", 600000);
    auto limit = std::chrono::milliseconds(limitMs ? limitMs.value() : 600000);
    while (session.state() == tbc::service::SessionState::Running &&
           session.timers().now() < limit) {
        session.advance(16ms);
    }

    if (!session.outcome()) {
        std::cout << "Simulation limit reached without a result\n";
        session.shutdown();
        return EXIT_FAILURE;
    }
    std::cout << (*session.outcome() ? "Victory" : "Defeat") << " after "
              << session.statistics().RoundsPlayed() << " round(s)\n";
    for (auto id : session.roster().Ids()) {
        auto stats = session.statistics().For(id);
        std::cout << "  " << nameOf(id) << ": dealt " << stats.damageDealt << ", taken "
                  << stats.damageTaken << ", kills " << stats.kills << "\n";
    }
    session.shutdown();
    return EXIT_SUCCESS;
}
