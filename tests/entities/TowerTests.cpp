/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TowerTests
#include <boost/test/unit_test.hpp>

#include "entities/Tower.hpp"
#include <memory>
#include <random>

using namespace Bulwark;

struct TowerFixture {
    std::mt19937 rng{42};
    TowerDefinition definition;
    Tower tower;
    EnemyList enemies;

    TowerFixture() {
        definition.name = "archer";
        definition.cost = 100;
        definition.upgradeCost = 50;
        definition.range = 100.0f;
        definition.fireRate = 1.0f;
        definition.damage = 15.0f;
        definition.damageVariance = 0.0f;
        definition.projectileType = "arrow";
        definition.maxLevel = 3;
        tower.place(1, definition, GridCell{0, 0}, Vector2D(0.0f, 0.0f));
    }

    // Stationary enemy standing at 'position'
    Enemy& addEnemy(EntityId id, const Vector2D& position, float health = 30.0f, float speed = 0.0f) {
        EnemyDefinition enemyDefinition;
        enemyDefinition.name = "Goblin";
        enemyDefinition.health = health;
        enemyDefinition.speed = speed;
        auto path = std::make_shared<const WaypointPath>(
            std::vector<Vector2D>{position, position + Vector2D(1000.0f, 0.0f)});
        enemies.push_back(std::make_unique<Enemy>());
        enemies.back()->spawn(id, enemyDefinition, health, path);
        return *enemies.back();
    }
};

BOOST_FIXTURE_TEST_SUITE(TowerFiringTests, TowerFixture)

BOOST_AUTO_TEST_CASE(CooldownCarriesAcrossShortTicks) {
    addEnemy(10, Vector2D(50.0f, 0.0f));

    std::vector<int> firedOnCall;
    for (int call = 1; call <= 6; ++call) {
        if (tower.update(0.4f, enemies, rng)) {
            firedOnCall.push_back(call);
        }
    }
    // t = 0 and t = 1.2, never t = 0.8
    BOOST_REQUIRE_EQUAL(firedOnCall.size(), 2u);
    BOOST_CHECK_EQUAL(firedOnCall[0], 1);
    BOOST_CHECK_EQUAL(firedOnCall[1], 4);
    // Requests alone are not launched shots
    BOOST_CHECK_EQUAL(tower.getStats().shotsFired, 0u);
}

BOOST_AUTO_TEST_CASE(FireRequestDescribesShot) {
    definition.piercing = true;
    definition.splashRadius = 25.0f;
    definition.onHit = OnHitEffect{StatusEffectType::Slow, 0.5f, 2.0f};
    tower.place(2, definition, GridCell{1, 1}, Vector2D(0.0f, 0.0f));
    addEnemy(10, Vector2D(0.0f, 60.0f));

    auto request = tower.update(0.1f, enemies, rng);
    BOOST_REQUIRE(request);
    BOOST_CHECK_EQUAL(request->sourceTowerId, 2u);
    BOOST_CHECK_EQUAL(request->targetId, 10u);
    BOOST_CHECK_EQUAL(request->projectileType, "arrow");
    BOOST_CHECK_EQUAL(request->damage, 15.0f);
    BOOST_CHECK(request->piercing);
    BOOST_CHECK_EQUAL(request->splashRadius, 25.0f);
    BOOST_REQUIRE(request->onHit);
    BOOST_CHECK(request->onHit->type == StatusEffectType::Slow);
    BOOST_CHECK_CLOSE(request->targetPoint.getY(), 60.0f, 0.001f);
    BOOST_CHECK_EQUAL(tower.getTargetId(), 10u);
    // Turned to face the target (straight down the y axis)
    BOOST_CHECK_CLOSE(tower.getRotation(), 1.5707963f, 0.001f);
}

BOOST_AUTO_TEST_CASE(IdleWithoutTargets) {
    BOOST_CHECK(!tower.update(0.1f, enemies, rng));
    addEnemy(10, Vector2D(150.0f, 0.0f));
    BOOST_CHECK(!tower.update(0.1f, enemies, rng));
    BOOST_CHECK_EQUAL(tower.getTargetId(), INVALID_ENTITY_ID);
}

BOOST_AUTO_TEST_CASE(CooldownTicksWhileIdle) {
    addEnemy(10, Vector2D(50.0f, 0.0f));
    BOOST_REQUIRE(tower.update(0.0f, enemies, rng));
    enemies.clear();
    tower.update(0.6f, enemies, rng);
    tower.update(0.6f, enemies, rng);
    BOOST_CHECK_EQUAL(tower.getCooldown(), 0.0f);
}

BOOST_AUTO_TEST_CASE(DeadTargetIsReplaced) {
    Enemy& first = addEnemy(10, Vector2D(20.0f, 0.0f));
    addEnemy(11, Vector2D(60.0f, 0.0f));

    BOOST_REQUIRE(tower.update(0.0f, enemies, rng));
    BOOST_CHECK_EQUAL(tower.getTargetId(), 10u);

    first.takeDamage(1000.0f, DamageType::Normal);
    tower.update(0.1f, enemies, rng);
    BOOST_CHECK_EQUAL(tower.getTargetId(), 11u);
}

BOOST_AUTO_TEST_CASE(RemovedTargetIsReplaced) {
    addEnemy(10, Vector2D(20.0f, 0.0f));
    BOOST_REQUIRE(tower.update(0.0f, enemies, rng));
    enemies.clear();
    addEnemy(12, Vector2D(80.0f, 0.0f));
    tower.update(0.1f, enemies, rng);
    BOOST_CHECK_EQUAL(tower.getTargetId(), 12u);
}

BOOST_AUTO_TEST_CASE(LockedTargetIsKeptWhileValid) {
    addEnemy(10, Vector2D(60.0f, 0.0f));
    BOOST_REQUIRE(tower.update(0.0f, enemies, rng));
    addEnemy(11, Vector2D(10.0f, 0.0f));
    tower.update(0.1f, enemies, rng);
    BOOST_CHECK_EQUAL(tower.getTargetId(), 10u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TargetingStrategyTests, TowerFixture)

BOOST_AUTO_TEST_CASE(DistanceStrategies) {
    addEnemy(10, Vector2D(30.0f, 0.0f));
    addEnemy(11, Vector2D(10.0f, 0.0f));
    addEnemy(12, Vector2D(50.0f, 0.0f));
    addEnemy(13, Vector2D(500.0f, 0.0f));
    const Vector2D origin(0.0f, 0.0f);

    BOOST_CHECK_EQUAL(selectTarget(TargetingStrategy::Closest, origin, 100.0f, enemies)->getId(), 11u);
    BOOST_CHECK_EQUAL(selectTarget(TargetingStrategy::Furthest, origin, 100.0f, enemies)->getId(), 12u);
}

BOOST_AUTO_TEST_CASE(HealthStrategies) {
    addEnemy(10, Vector2D(30.0f, 0.0f), 40.0f);
    addEnemy(11, Vector2D(10.0f, 0.0f), 20.0f);
    addEnemy(12, Vector2D(50.0f, 0.0f), 80.0f);
    const Vector2D origin(0.0f, 0.0f);

    BOOST_CHECK_EQUAL(selectTarget(TargetingStrategy::Weakest, origin, 100.0f, enemies)->getId(), 11u);
    BOOST_CHECK_EQUAL(selectTarget(TargetingStrategy::Strongest, origin, 100.0f, enemies)->getId(), 12u);
}

BOOST_AUTO_TEST_CASE(PathProgressPrefersLeader) {
    addEnemy(10, Vector2D(-50.0f, 0.0f), 30.0f, 10.0f);
    addEnemy(11, Vector2D(-90.0f, 0.0f), 30.0f, 10.0f);
    enemies[0]->update(1.0f);
    enemies[1]->update(6.0f);

    BOOST_CHECK_EQUAL(selectTarget(TargetingStrategy::PathProgress, Vector2D(0.0f, 0.0f), 100.0f, enemies)->getId(),
                      11u);
}

BOOST_AUTO_TEST_CASE(TiesGoToFirstEnemy) {
    addEnemy(10, Vector2D(40.0f, 0.0f), 30.0f);
    addEnemy(11, Vector2D(0.0f, 40.0f), 30.0f);
    const Vector2D origin(0.0f, 0.0f);

    for (auto strategy : {TargetingStrategy::Closest, TargetingStrategy::Furthest, TargetingStrategy::Weakest,
                          TargetingStrategy::Strongest, TargetingStrategy::PathProgress}) {
        BOOST_CHECK_EQUAL(selectTarget(strategy, origin, 100.0f, enemies)->getId(), 10u);
    }
}

BOOST_AUTO_TEST_CASE(RangeBoundaryIsInclusive) {
    addEnemy(10, Vector2D(100.0f, 0.0f));
    BOOST_CHECK(selectTarget(TargetingStrategy::Closest, Vector2D(0.0f, 0.0f), 100.0f, enemies) != nullptr);
    BOOST_CHECK(selectTarget(TargetingStrategy::Closest, Vector2D(0.0f, 0.0f), 99.0f, enemies) == nullptr);
}

BOOST_AUTO_TEST_CASE(StrategyNames) {
    BOOST_CHECK(targetingStrategyFromString("pathProgress") == TargetingStrategy::PathProgress);
    BOOST_CHECK(!targetingStrategyFromString("random").has_value());
    BOOST_CHECK_EQUAL(std::string(toString(TargetingStrategy::Weakest)), "weakest");
}

BOOST_AUTO_TEST_CASE(StrategyOverride) {
    addEnemy(10, Vector2D(30.0f, 0.0f), 80.0f);
    addEnemy(11, Vector2D(60.0f, 0.0f), 20.0f);
    tower.setTargetingStrategy(TargetingStrategy::Weakest);
    BOOST_REQUIRE(tower.update(0.0f, enemies, rng));
    BOOST_CHECK_EQUAL(tower.getTargetId(), 11u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TowerUpgradeTests, TowerFixture)

BOOST_AUTO_TEST_CASE(LevelScaling) {
    BOOST_CHECK_EQUAL(tower.getLevel(), 1);
    BOOST_CHECK_EQUAL(tower.getUpgradeCost(), 50);
    BOOST_CHECK_EQUAL(tower.getSellValue(0.5f, 0.25f), 50);

    BOOST_REQUIRE(tower.upgrade());
    BOOST_CHECK_EQUAL(tower.getLevel(), 2);
    BOOST_CHECK_CLOSE(tower.getRange(), 105.0f, 0.001f);
    BOOST_CHECK_CLOSE(tower.getBaseDamageAtLevel(), 17.25f, 0.001f);
    BOOST_CHECK_EQUAL(tower.rollDamage(rng), 17.0f);
    // floor(50 * 1.15)
    BOOST_CHECK_EQUAL(tower.getUpgradeCost(), 57);
    // floor(100 * 0.5 + 1 * 50 * 0.25)
    BOOST_CHECK_EQUAL(tower.getSellValue(0.5f, 0.25f), 62);
}

BOOST_AUTO_TEST_CASE(StopsAtMaxLevel) {
    BOOST_CHECK(tower.upgrade());
    BOOST_CHECK(tower.upgrade());
    BOOST_CHECK(!tower.canUpgrade());
    BOOST_CHECK(!tower.upgrade());
    BOOST_CHECK_EQUAL(tower.getLevel(), 3);
}

BOOST_AUTO_TEST_CASE(DamageVarianceStaysInBand) {
    definition.damage = 100.0f;
    definition.damageVariance = 0.1f;
    tower.place(3, definition, GridCell{0, 0}, Vector2D(0.0f, 0.0f));
    for (int i = 0; i < 200; ++i) {
        float damage = tower.rollDamage(rng);
        BOOST_CHECK_GE(damage, 90.0f);
        BOOST_CHECK_LE(damage, 110.0f);
    }
}

BOOST_AUTO_TEST_CASE(HitsAreCredited) {
    tower.recordHit(12.0f, false);
    tower.recordHit(8.0f, true);
    BOOST_CHECK_CLOSE(tower.getStats().damageDealt, 20.0f, 0.001f);
    BOOST_CHECK_EQUAL(tower.getStats().kills, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
