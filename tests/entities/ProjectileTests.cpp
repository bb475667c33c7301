/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ProjectileTests
#include <boost/test/unit_test.hpp>

#include "entities/Projectile.hpp"
#include <memory>

using namespace Bulwark;

struct ProjectileFixture {
    ProjectileDefinition definition;
    ProjectileSpawnRequest request;
    Projectile projectile;
    EnemyList enemies;

    ProjectileFixture() {
        definition.name = "arrow";
        definition.speed = 100.0f;
        definition.size = 4.0f;
        definition.maxDistance = 1000.0f;
        definition.lifetime = 5.0f;

        request.sourceTowerId = 1;
        request.projectileType = "arrow";
        request.origin = Vector2D(0.0f, 0.0f);
        request.targetPoint = Vector2D(100.0f, 0.0f);
        request.damage = 10.0f;
    }

    Enemy& addEnemy(EntityId id, const Vector2D& start, const Vector2D& end, float speed) {
        EnemyDefinition enemyDefinition;
        enemyDefinition.name = "Goblin";
        enemyDefinition.health = 30.0f;
        enemyDefinition.speed = speed;
        auto path = std::make_shared<const WaypointPath>(std::vector<Vector2D>{start, end});
        enemies.push_back(std::make_unique<Enemy>());
        enemies.back()->spawn(id, enemyDefinition, 30.0f, path);
        return *enemies.back();
    }
};

BOOST_FIXTURE_TEST_SUITE(ProjectileFlightTests, ProjectileFixture)

BOOST_AUTO_TEST_CASE(FliesTowardTargetPoint) {
    projectile.launch(5, definition, request);
    projectile.update(0.5f, enemies);

    BOOST_CHECK_CLOSE(projectile.getPosition().getX(), 50.0f, 0.001f);
    BOOST_CHECK_EQUAL(projectile.getPosition().getY(), 0.0f);
    BOOST_CHECK_CLOSE(projectile.getDistanceTraveled(), 50.0f, 0.001f);
    BOOST_CHECK(!projectile.isDead());
    // Non-homing shots do not track
    BOOST_CHECK_EQUAL(projectile.getTargetId(), INVALID_ENTITY_ID);
}

BOOST_AUTO_TEST_CASE(ExpiresAfterLifetime) {
    definition.lifetime = 1.0f;
    projectile.launch(5, definition, request);
    projectile.update(0.6f, enemies);
    BOOST_CHECK(!projectile.isDead());
    projectile.update(0.6f, enemies);
    BOOST_CHECK(projectile.isDead());
}

BOOST_AUTO_TEST_CASE(ExpiresAfterMaxDistance) {
    definition.maxDistance = 80.0f;
    projectile.launch(5, definition, request);
    projectile.update(1.0f, enemies);
    BOOST_CHECK(projectile.isDead());
}

BOOST_AUTO_TEST_CASE(NegativeDeltaIsIgnored) {
    projectile.launch(5, definition, request);
    projectile.update(-1.0f, enemies);
    BOOST_CHECK_EQUAL(projectile.getAge(), 0.0f);
    BOOST_CHECK_EQUAL(projectile.getPosition().getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(HomingFollowsTarget) {
    definition.homing = true;
    addEnemy(9, Vector2D(0.0f, 50.0f), Vector2D(0.0f, 1000.0f), 0.0f);
    request.targetId = 9;
    projectile.launch(5, definition, request);
    BOOST_CHECK(projectile.isHoming());

    projectile.update(0.1f, enemies);
    // Steered straight up toward the enemy instead of along +x
    BOOST_CHECK_CLOSE(projectile.getPosition().getY(), 10.0f, 0.001f);
    BOOST_CHECK_SMALL(projectile.getPosition().getX(), 0.0001f);
}

BOOST_AUTO_TEST_CASE(HomingDoesNotOvershoot) {
    definition.homing = true;
    addEnemy(9, Vector2D(30.0f, 0.0f), Vector2D(1000.0f, 0.0f), 0.0f);
    request.targetId = 9;
    projectile.launch(5, definition, request);

    projectile.update(1.0f, enemies);
    BOOST_CHECK_CLOSE(projectile.getPosition().getX(), 30.0f, 0.001f);
    BOOST_CHECK_CLOSE(projectile.getDistanceTraveled(), 30.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(LostTargetKeepsHeading) {
    definition.homing = true;
    addEnemy(9, Vector2D(0.0f, 50.0f), Vector2D(0.0f, 1000.0f), 0.0f);
    request.targetId = 9;
    projectile.launch(5, definition, request);
    projectile.update(0.1f, enemies);

    enemies.clear();
    projectile.update(0.1f, enemies);
    BOOST_CHECK_EQUAL(projectile.getTargetId(), INVALID_ENTITY_ID);
    BOOST_CHECK_CLOSE(projectile.getPosition().getY(), 20.0f, 0.001f);
    BOOST_CHECK(!projectile.isDead());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ProjectileHitTests, ProjectileFixture)

BOOST_AUTO_TEST_CASE(SingleTargetDiesOnHit) {
    projectile.launch(5, definition, request);
    BOOST_CHECK(projectile.canHit(9));
    projectile.hit(9);

    BOOST_CHECK(projectile.hasHit());
    BOOST_CHECK(projectile.isDead());
    BOOST_CHECK(!projectile.canHit(10));
}

BOOST_AUTO_TEST_CASE(PiercingHitsEachEnemyOnce) {
    request.piercing = true;
    projectile.launch(5, definition, request);
    BOOST_CHECK(projectile.isPiercing());

    projectile.hit(9);
    BOOST_CHECK(!projectile.isDead());
    BOOST_CHECK(!projectile.canHit(9));
    BOOST_CHECK(projectile.canHit(10));
    projectile.hit(10);
    BOOST_CHECK_EQUAL(projectile.getHitCount(), 2u);
}

BOOST_AUTO_TEST_CASE(DefinitionPiercingAlsoCounts) {
    definition.piercing = true;
    projectile.launch(5, definition, request);
    BOOST_CHECK(projectile.isPiercing());
}

BOOST_AUTO_TEST_CASE(RelaunchClearsState) {
    projectile.launch(5, definition, request);
    projectile.hit(9);
    projectile.reset();
    projectile.launch(6, definition, request);
    BOOST_CHECK(!projectile.isDead());
    BOOST_CHECK(!projectile.hasHit());
    BOOST_CHECK(projectile.canHit(9));
    BOOST_CHECK_EQUAL(projectile.getId(), 6u);
}

BOOST_AUTO_TEST_SUITE_END()
