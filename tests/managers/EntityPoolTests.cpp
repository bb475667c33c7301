/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityPoolTests
#include <boost/test/unit_test.hpp>

#include "entities/EntityPool.hpp"
#include "entities/Tower.hpp"
#include "managers/EnemyManager.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include "managers/ProjectileManager.hpp"
#include <memory>
#include <stdexcept>

using namespace Bulwark;

BOOST_AUTO_TEST_SUITE(PoolTests)

BOOST_AUTO_TEST_CASE(PrewarmedObjectsAreReused) {
    EntityPool<Projectile> pool(4);
    pool.prewarm(10);
    BOOST_CHECK_EQUAL(pool.available(), 4u);
    BOOST_CHECK_EQUAL(pool.getStats().created, 4u);

    std::unique_ptr<Projectile> object = pool.acquire();
    Projectile* raw = object.get();
    BOOST_CHECK_EQUAL(pool.available(), 3u);
    BOOST_CHECK_EQUAL(pool.getStats().reused, 1u);
    BOOST_CHECK(!pool.contains(raw));

    pool.release(std::move(object));
    BOOST_CHECK(pool.contains(raw));
    BOOST_CHECK_EQUAL(pool.getStats().released, 1u);
}

BOOST_AUTO_TEST_CASE(EmptyPoolAllocates) {
    EntityPool<Enemy> pool(1);
    auto first = pool.acquire();
    auto second = pool.acquire();
    BOOST_CHECK_EQUAL(pool.getStats().created, 2u);

    pool.release(std::move(first));
    pool.release(std::move(second));
    BOOST_CHECK_EQUAL(pool.available(), 1u);
    BOOST_CHECK_EQUAL(pool.getStats().discarded, 1u);

    pool.release(nullptr);
    BOOST_CHECK_EQUAL(pool.getStats().released, 2u);
}

BOOST_AUTO_TEST_CASE(ZeroCapacityThrows) {
    BOOST_CHECK_THROW(EntityPool<Tower>(0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

struct ManagerFixture {
    EntityConfigRegistry registry;
    std::shared_ptr<const WaypointPath> path = std::make_shared<const WaypointPath>(
        std::vector<Vector2D>{Vector2D(0.0f, 0.0f), Vector2D(100.0f, 0.0f)});

    ManagerFixture() { registry.loadDefaults(); }
};

BOOST_FIXTURE_TEST_SUITE(EnemyManagerTests, ManagerFixture)

BOOST_AUTO_TEST_CASE(SpawnAssignsUniqueIds) {
    EnemyManager enemies(registry, path, 10, 4);
    Enemy* first = enemies.spawnEnemy("Goblin", 30.0f);
    Enemy* second = enemies.spawnEnemy("Hobbit", 25.0f);
    BOOST_REQUIRE(first != nullptr);
    BOOST_REQUIRE(second != nullptr);
    BOOST_CHECK_NE(first->getId(), second->getId());
    BOOST_CHECK(enemies.findEnemy(second->getId()) == second);
    BOOST_CHECK_EQUAL(first->getPosition().getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(UnknownTypeAndCap) {
    EnemyManager enemies(registry, path, 2, 4);
    BOOST_CHECK(enemies.spawnEnemy("Troll", 10.0f) == nullptr);
    BOOST_CHECK(enemies.spawnEnemy("Goblin", 30.0f) != nullptr);
    BOOST_CHECK(enemies.spawnEnemy("Goblin", 30.0f) != nullptr);
    BOOST_CHECK(enemies.isAtCapacity());
    BOOST_CHECK(enemies.spawnEnemy("Goblin", 30.0f) == nullptr);
    BOOST_CHECK_EQUAL(enemies.getEnemyCount(), 2u);
}

BOOST_AUTO_TEST_CASE(RequiresPath) {
    BOOST_CHECK_THROW(EnemyManager(registry, nullptr, 10, 4), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(ReapSeparatesKillsFromEscapes) {
    EnemyManager enemies(registry, path, 10, 4);
    Enemy* killed = enemies.spawnEnemy("Goblin", 30.0f);
    Enemy* survivor = enemies.spawnEnemy("Dwarve", 60.0f);
    Enemy* runner = enemies.spawnEnemy("Hobbit", 25.0f);
    const EntityId killedId = killed->getId();
    const EntityId survivorId = survivor->getId();
    const EntityId runnerId = runner->getId();

    killed->takeDamage(100.0f, DamageType::Normal);
    // Hobbits walk at 100 units per second, Dwarves at 50
    enemies.updateAll(1.0f);

    auto finished = enemies.reapFinished();
    BOOST_REQUIRE_EQUAL(finished.size(), 2u);
    BOOST_CHECK_EQUAL(finished[0].id, killedId);
    BOOST_CHECK(finished[0].killed);
    BOOST_CHECK_EQUAL(finished[0].bounty, 10);
    BOOST_CHECK_EQUAL(finished[1].id, runnerId);
    BOOST_CHECK(!finished[1].killed);
    BOOST_CHECK_EQUAL(finished[1].type, "Hobbit");

    BOOST_REQUIRE_EQUAL(enemies.getEnemyCount(), 1u);
    BOOST_CHECK_EQUAL(enemies.getEnemies().front()->getId(), survivorId);
    BOOST_CHECK(enemies.findEnemy(killedId) == nullptr);
    BOOST_CHECK(enemies.reapFinished().empty());
}

BOOST_AUTO_TEST_CASE(LiveEnemiesAreNeverPooled) {
    EnemyManager enemies(registry, path, 10, 4);
    for (int i = 0; i < 6; ++i) {
        enemies.spawnEnemy("Goblin", 30.0f);
    }
    enemies.getEnemies()[1]->takeDamage(100.0f, DamageType::Normal);
    enemies.getEnemies()[4]->takeDamage(100.0f, DamageType::Normal);
    enemies.reapFinished();

    for (const auto& enemy : enemies.getEnemies()) {
        BOOST_CHECK(!enemies.getPool().contains(enemy.get()));
    }
    BOOST_CHECK_EQUAL(enemies.getPool().available(), 2u);

    enemies.clear();
    BOOST_CHECK_EQUAL(enemies.getEnemyCount(), 0u);
    BOOST_CHECK_EQUAL(enemies.getPool().available(), 4u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ProjectileManagerTests, ManagerFixture)

BOOST_AUTO_TEST_CASE(SpawnFromFireRequest) {
    ProjectileManager projectiles(registry, 4, 4);
    ProjectileSpawnRequest request;
    request.projectileType = "magicMissile";
    request.targetPoint = Vector2D(10.0f, 0.0f);
    request.damage = 25.0f;

    Projectile* projectile = projectiles.spawnProjectile(request);
    BOOST_REQUIRE(projectile != nullptr);
    BOOST_CHECK(projectile->isHoming());
    BOOST_CHECK_EQUAL(projectile->getDamage(), 25.0f);

    request.projectileType = "rock";
    BOOST_CHECK(projectiles.spawnProjectile(request) == nullptr);
    BOOST_CHECK_EQUAL(projectiles.getProjectileCount(), 1u);
}

BOOST_AUTO_TEST_CASE(CapDropsExtraShots) {
    ProjectileManager projectiles(registry, 2, 2);
    ProjectileSpawnRequest request;
    request.projectileType = "arrow";
    request.targetPoint = Vector2D(10.0f, 0.0f);

    BOOST_CHECK(projectiles.spawnProjectile(request) != nullptr);
    BOOST_CHECK(projectiles.spawnProjectile(request) != nullptr);
    BOOST_CHECK(projectiles.spawnProjectile(request) == nullptr);
    BOOST_CHECK_EQUAL(projectiles.getDroppedCount(), 1u);
}

BOOST_AUTO_TEST_CASE(ReapKeepsLaunchOrder) {
    ProjectileManager projectiles(registry, 8, 8);
    ProjectileSpawnRequest request;
    request.projectileType = "arrow";
    request.targetPoint = Vector2D(10.0f, 0.0f);
    for (int i = 0; i < 4; ++i) {
        projectiles.spawnProjectile(request);
    }
    projectiles.getProjectiles()[0]->hit(1);
    projectiles.getProjectiles()[2]->hit(1);
    const EntityId secondId = projectiles.getProjectiles()[1]->getId();
    const EntityId fourthId = projectiles.getProjectiles()[3]->getId();

    BOOST_CHECK_EQUAL(projectiles.reapDead(), 2u);
    BOOST_REQUIRE_EQUAL(projectiles.getProjectileCount(), 2u);
    BOOST_CHECK_EQUAL(projectiles.getProjectiles()[0]->getId(), secondId);
    BOOST_CHECK_EQUAL(projectiles.getProjectiles()[1]->getId(), fourthId);

    EnemyList noEnemies;
    projectiles.updateAll(10.0f, noEnemies);
    BOOST_CHECK_EQUAL(projectiles.reapDead(), 2u);
    BOOST_CHECK_EQUAL(projectiles.getPool().available(), 8u);
}

BOOST_AUTO_TEST_SUITE_END()
