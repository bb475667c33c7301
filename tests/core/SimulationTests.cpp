/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SimulationTests
#include <boost/test/unit_test.hpp>

#include "core/ConfigurationError.hpp"
#include "core/GameSession.hpp"
#include "core/Simulation.hpp"
#include "managers/EconomyManager.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include <limits>

using namespace Bulwark;

namespace {

// One enemy type walking a straight 10-cell strip, one tower that always one-shots it
const char* STRIP_DEFINITIONS = R"({
    "enemies": [
        { "name": "Dummy", "health": 20, "speed": 40, "size": 16, "bounty": 7, "spawnCost": 1 }
    ],
    "projectiles": [
        { "name": "bullet", "speed": 1000, "size": 10, "maxDistance": 2000, "lifetime": 3, "homing": true }
    ],
    "towers": [
        { "name": "gun", "cost": 50, "upgradeCost": 20, "range": 200, "fireRate": 0.5, "damage": 100,
          "damageVariance": 0, "projectileType": "bullet" }
    ],
    "maps": [
        { "name": "strip", "columns": 10, "rows": 3, "tileSize": 40, "path": [[0, 1], [9, 1]] }
    ]
})";

EntityConfigRegistry makeStripRegistry() {
    EntityConfigRegistry registry;
    registry.loadFromJsonString(STRIP_DEFINITIONS, "strip definitions");
    registry.validate();
    return registry;
}

SimulationConfig makeStripConfig() {
    SimulationConfig config;
    config.seed = 123;
    config.mapName = "strip";
    config.startingMoney = 100;
    config.waves.baseBudget = 1;
    config.waves.autoStart = false;
    return config;
}

// Steps until the first wave has completed (bounded)
FrameSummary runUntilWaveComplete(Simulation& simulation, int maxSteps = 400) {
    FrameSummary totals;
    for (int i = 0; i < maxSteps; ++i) {
        FrameSummary summary = simulation.step(0.1f);
        totals.enemiesSpawned += summary.enemiesSpawned;
        totals.enemiesKilled += summary.enemiesKilled;
        totals.enemiesEscaped += summary.enemiesEscaped;
        totals.bountyEarned += summary.bountyEarned;
        totals.livesLost += summary.livesLost;
        totals.projectilesFired += summary.projectilesFired;
        totals.hits += summary.hits;
        if (summary.waveCompleted) {
            totals.waveCompleted = true;
            totals.waveReward = summary.waveReward;
            break;
        }
    }
    return totals;
}

} // namespace

struct SimulationFixture {
    EntityConfigRegistry registry = makeStripRegistry();
    SimulationConfig config = makeStripConfig();
    EconomyManager economy{100};
};

BOOST_FIXTURE_TEST_SUITE(SimulationStepTests, SimulationFixture)

BOOST_AUTO_TEST_CASE(UndefendedEnemyEscapes) {
    Simulation simulation(registry, config, economy);
    FrameSummary result = runUntilWaveComplete(simulation);

    BOOST_CHECK(result.waveCompleted);
    BOOST_CHECK_EQUAL(result.enemiesSpawned, 1u);
    BOOST_CHECK_EQUAL(result.enemiesEscaped, 1u);
    BOOST_CHECK_EQUAL(result.livesLost, 1);
    BOOST_CHECK_EQUAL(result.enemiesKilled, 0u);
    BOOST_CHECK_EQUAL(result.waveReward, 55);
    BOOST_CHECK_EQUAL(economy.getBalance(), 155);
    BOOST_CHECK_EQUAL(simulation.getEnemyManager().getEnemyCount(), 0u);
}

BOOST_AUTO_TEST_CASE(KillPaysBountyOnce) {
    Simulation simulation(registry, config, economy);
    PlacementResult placed = simulation.placeTower("gun", GridCell{2, 0});
    BOOST_REQUIRE(placed.succeeded());
    BOOST_CHECK_EQUAL(economy.getBalance(), 50);

    FrameSummary result = runUntilWaveComplete(simulation);
    BOOST_CHECK(result.waveCompleted);
    BOOST_CHECK_EQUAL(result.enemiesKilled, 1u);
    BOOST_CHECK_EQUAL(result.enemiesEscaped, 0u);
    BOOST_CHECK_EQUAL(result.bountyEarned, 7);
    BOOST_CHECK_GE(result.projectilesFired, 1u);
    BOOST_CHECK_GE(result.hits, 1u);
    // 100 - 50 (tower) + 7 (bounty) + 55 (wave 1 reward)
    BOOST_CHECK_EQUAL(economy.getBalance(), 112);
    BOOST_CHECK_EQUAL(simulation.getTotals().enemiesKilled, 1u);
    BOOST_CHECK_EQUAL(simulation.getTotals().bountyEarned, 7);
    BOOST_CHECK_EQUAL(simulation.getWaveDirector().getStats().totalBudgetKilled, 1);

    const Tower* tower = simulation.getTowerManager().findTower(placed.towerId);
    BOOST_REQUIRE(tower != nullptr);
    BOOST_CHECK_EQUAL(tower->getStats().kills, 1u);
    BOOST_CHECK_CLOSE(tower->getStats().damageDealt, 20.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(DeltaTimeIsSanitised) {
    Simulation simulation(registry, config, economy);
    BOOST_CHECK_EQUAL(simulation.step(-1.0f).deltaTime, 0.0f);
    BOOST_CHECK_EQUAL(simulation.step(std::numeric_limits<float>::quiet_NaN()).deltaTime, 0.0f);
    BOOST_CHECK_CLOSE(simulation.step(5.0f).deltaTime, 0.1f, 0.001f);
    BOOST_CHECK_CLOSE(simulation.getElapsedTime(), 0.1f, 0.001f);
    BOOST_CHECK_EQUAL(simulation.getTotals().ticks, 3u);
}

BOOST_AUTO_TEST_CASE(ManualWaveStart) {
    Simulation simulation(registry, config, economy);
    BOOST_CHECK(!simulation.startNextWave());
    runUntilWaveComplete(simulation);

    // Auto start is off, so the director waits
    for (int i = 0; i < 50; ++i) {
        simulation.step(0.1f);
    }
    BOOST_CHECK_EQUAL(simulation.getWaveDirector().getCurrentWave(), 1);
    BOOST_CHECK(simulation.startNextWave());
    BOOST_CHECK_EQUAL(simulation.getWaveDirector().getCurrentWave(), 2);
    BOOST_CHECK_EQUAL(simulation.getWaveDirector().getWaveBudget(), 2);
}

BOOST_AUTO_TEST_CASE(TowerCommands) {
    Simulation simulation(registry, config, economy);
    BOOST_CHECK(simulation.placeTower("gun", GridCell{3, 1}).error == PlacementError::OnPath);

    EntityId id = simulation.placeTower("gun", GridCell{3, 2}).towerId;
    BOOST_CHECK(simulation.selectTower(GridCell{3, 2}) == id);
    BOOST_CHECK(simulation.setTowerTargeting(id, TargetingStrategy::Strongest));
    BOOST_CHECK(simulation.upgradeTower(id) == UpgradeResult::None);
    BOOST_CHECK_EQUAL(economy.getBalance(), 30);

    auto refund = simulation.sellTower(id);
    BOOST_REQUIRE(refund);
    // floor(50 * 0.5 + 1 * 20 * 0.25)
    BOOST_CHECK_EQUAL(*refund, 30);
    BOOST_CHECK_EQUAL(economy.getBalance(), 60);
}

BOOST_AUTO_TEST_CASE(SnapshotMirrorsState) {
    Simulation simulation(registry, config, economy);
    simulation.placeTower("gun", GridCell{8, 0});
    simulation.step(0.1f);

    SimulationSnapshot snap = simulation.snapshot();
    BOOST_CHECK_EQUAL(snap.wave, 1);
    BOOST_CHECK(snap.waveState == WaveState::WaveActive);
    BOOST_REQUIRE_EQUAL(snap.enemies.size(), 1u);
    BOOST_CHECK_EQUAL(snap.enemies[0].type, "Dummy");
    BOOST_CHECK_EQUAL(snap.enemies[0].healthFraction, 1.0f);
    BOOST_REQUIRE_EQUAL(snap.towers.size(), 1u);
    BOOST_CHECK_EQUAL(snap.towers[0].type, "gun");
    BOOST_CHECK_EQUAL(snap.towers[0].level, 1);
    BOOST_CHECK(snap.towers[0].cell == (GridCell{8, 0}));
}

BOOST_AUTO_TEST_CASE(DroppedShotsAreNotCounted) {
    config.maxProjectiles = 1;
    Simulation simulation(registry, config, economy);
    EntityId first = simulation.placeTower("gun", GridCell{1, 0}).towerId;
    EntityId second = simulation.placeTower("gun", GridCell{1, 2}).towerId;

    // Both towers fire on the first tick; only one shot fits under the cap
    FrameSummary summary = simulation.step(0.1f);
    BOOST_CHECK_EQUAL(summary.projectilesFired, 1u);
    BOOST_CHECK_EQUAL(simulation.getProjectileManager().getDroppedCount(), 1u);

    const TowerManager& towers = simulation.getTowerManager();
    BOOST_CHECK_EQUAL(towers.findTower(first)->getStats().shotsFired, 1u);
    BOOST_CHECK_EQUAL(towers.findTower(second)->getStats().shotsFired, 0u);
}

BOOST_AUTO_TEST_CASE(UnknownMapThrows) {
    config.mapName = "nowhere";
    BOOST_CHECK_THROW(Simulation(registry, config, economy), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DefaultContentTests)

BOOST_AUTO_TEST_CASE(SameSeedSameOutcome) {
    EntityConfigRegistry registry;
    registry.loadDefaults();
    SimulationConfig config;
    config.seed = 99;

    auto run = [&](EconomyManager& economy) {
        Simulation simulation(registry, config, economy);
        simulation.placeTower("archer", GridCell{4, 6});
        simulation.placeTower("mage", GridCell{9, 4});
        simulation.placeTower("frost", GridCell{6, 4});
        for (int i = 0; i < 1500; ++i) {
            simulation.step(1.0f / 60.0f);
        }
        return simulation.getTotals();
    };

    EconomyManager first(config.startingMoney);
    EconomyManager second(config.startingMoney);
    SimulationTotals a = run(first);
    SimulationTotals b = run(second);

    BOOST_CHECK_EQUAL(a.enemiesKilled, b.enemiesKilled);
    BOOST_CHECK_EQUAL(a.enemiesEscaped, b.enemiesEscaped);
    BOOST_CHECK_EQUAL(a.projectilesFired, b.projectilesFired);
    BOOST_CHECK_EQUAL(first.getBalance(), second.getBalance());
    BOOST_CHECK_GT(a.projectilesFired, 0u);
}

BOOST_AUTO_TEST_CASE(PooledObjectsAreNeverLive) {
    EntityConfigRegistry registry;
    registry.loadDefaults();
    SimulationConfig config;
    config.seed = 7;
    config.enemyPoolSize = 8;
    config.projectilePoolSize = 8;
    EconomyManager economy(config.startingMoney);
    Simulation simulation(registry, config, economy);
    simulation.placeTower("archer", GridCell{4, 6});
    simulation.placeTower("cannon", GridCell{6, 4});

    for (int i = 0; i < 600; ++i) {
        simulation.step(1.0f / 30.0f);
        const EnemyManager& enemies = simulation.getEnemyManager();
        for (const auto& enemy : enemies.getEnemies()) {
            BOOST_REQUIRE(!enemies.getPool().contains(enemy.get()));
            BOOST_REQUIRE(enemy->getHealth() >= 0.0f && enemy->getHealth() <= enemy->getMaxHealth());
        }
        const ProjectileManager& projectiles = simulation.getProjectileManager();
        for (const auto& projectile : projectiles.getProjectiles()) {
            BOOST_REQUIRE(!projectiles.getPool().contains(projectile.get()));
            BOOST_REQUIRE(!projectile->isDead());
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(GameSessionTests)

BOOST_AUTO_TEST_CASE(EscapesEndTheGame) {
    SimulationConfig config = makeStripConfig();
    config.startingLives = 1;
    config.waves.autoStart = true;
    GameSession session(makeStripRegistry(), config);

    for (int i = 0; i < 400 && !session.isOver(); ++i) {
        session.update(0.1f);
    }
    BOOST_CHECK(session.getState() == SessionState::GameOver);
    BOOST_CHECK_EQUAL(session.getLives(), 0);
    BOOST_CHECK(!session.update(0.1f).has_value());
    BOOST_CHECK_EQUAL(session.getFailedTicks(), 0u);
}

BOOST_AUTO_TEST_CASE(ClearingLastWaveWins) {
    SimulationConfig config = makeStripConfig();
    config.waves.maxWaves = 1;
    GameSession session(makeStripRegistry(), config);
    BOOST_REQUIRE(session.getSimulation().placeTower("gun", GridCell{2, 0}).succeeded());

    for (int i = 0; i < 400 && !session.isOver(); ++i) {
        session.update(0.1f);
    }
    BOOST_CHECK(session.getState() == SessionState::Victory);
    BOOST_CHECK_EQUAL(session.finalScore(), 7);
    BOOST_CHECK_EQUAL(session.getBestScore(), 7);
    BOOST_CHECK_EQUAL(session.getLives(), config.startingLives);
}

BOOST_AUTO_TEST_CASE(PauseAndRestart) {
    SimulationConfig config = makeStripConfig();
    config.waves.maxWaves = 1;
    GameSession session(makeStripRegistry(), config);
    session.getSimulation().placeTower("gun", GridCell{2, 0});

    session.pause();
    BOOST_CHECK(session.getState() == SessionState::Paused);
    BOOST_CHECK(!session.update(0.1f).has_value());
    session.resume();
    BOOST_CHECK(session.update(0.1f).has_value());

    for (int i = 0; i < 400 && !session.isOver(); ++i) {
        session.update(0.1f);
    }
    BOOST_REQUIRE(session.isOver());

    session.restart();
    BOOST_CHECK(session.getState() == SessionState::Running);
    BOOST_CHECK_EQUAL(session.getScore(), 0);
    BOOST_CHECK_EQUAL(session.getBestScore(), 7);
    BOOST_CHECK_EQUAL(session.getEconomy().getBalance(), 100);
    BOOST_CHECK_EQUAL(session.getSimulation().getTowerManager().getTowerCount(), 0u);
}

BOOST_AUTO_TEST_CASE(InvalidSetupThrows) {
    SimulationConfig config = makeStripConfig();
    config.startingLives = 0;
    BOOST_CHECK_THROW(GameSession(makeStripRegistry(), config), ConfigurationError);

    BOOST_CHECK_THROW(GameSession(EntityConfigRegistry{}, makeStripConfig()), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()
