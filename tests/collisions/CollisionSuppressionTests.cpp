/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionSuppressionTests
#include <boost/test/unit_test.hpp>

#include "collisions/CollisionSuppressionManager.hpp"
#include "core/TaskScheduler.hpp"
#include "physics/PhysicsWorld.hpp"
#include "ragdoll/RagdollHandoffController.hpp"
#include "ragdoll/RagdollInstance.hpp"
#include "ragdoll/RagdollTemplate.hpp"
#include <memory>
#include <vector>

using namespace Ragfall;

namespace {
constexpr float TICK = 0.1f;
}

struct SuppressionFixture {
    SuppressionFixture()
        : ragdolls(world, RagdollTemplate::humanoid()),
          suppression(world, scheduler) {
        // Pit floor: top face at y = 0
        pit = world.createVolume(AABB(Vector3D(0.0f, -1.0f, 0.0f), Vector3D(2.0f, 1.0f, 2.0f)),
                                 true, ClassificationTag::Hazard);
        ragdoll = ragdolls.spawn(Pose(Vector3D(0.0f, 1.0f, 0.0f)), Vector3D());
    }

    void advance(float seconds) {
        const double target = scheduler.now() + seconds;
        while (scheduler.now() < target - 1e-6) {
            scheduler.update(TICK);
        }
    }

    bool allIgnoring(const std::vector<ColliderID>& colliders) const {
        for (ColliderID collider : colliders) {
            if (!world.isIgnoring(collider, pit)) {
                return false;
            }
        }
        return true;
    }

    PhysicsWorld world;
    TaskScheduler scheduler;
    RagdollHandoffController ragdolls;
    CollisionSuppressionManager suppression;
    ColliderID pit{INVALID_COLLIDER};
    std::shared_ptr<RagdollInstance> ragdoll;
};

// ============================================================================
// Timed Ignore Records
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(IgnoreTests, SuppressionFixture)

BOOST_AUTO_TEST_CASE(TestIgnoreIsImmediateAndExpires)
{
    BOOST_REQUIRE(ragdoll);
    const auto colliders = ragdoll->getColliders();

    auto id = suppression.ignore(colliders, pit, 1.0f);
    BOOST_CHECK_NE(id, CollisionSuppressionManager::INVALID_RECORD);
    BOOST_CHECK(allIgnoring(colliders));
    BOOST_CHECK(suppression.isSuppressed(colliders.front(), pit));
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 1u);

    advance(0.5f);
    BOOST_CHECK(allIgnoring(colliders));

    advance(0.6f);
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 0u);
    for (ColliderID collider : colliders) {
        BOOST_CHECK(!world.isIgnoring(collider, pit));
        BOOST_CHECK(world.canCollide(collider, pit));
    }
}

BOOST_AUTO_TEST_CASE(TestExpiryAfterTargetDestroyed)
{
    const auto colliders = ragdoll->getColliders();
    suppression.ignore(colliders, pit, 1.0f);

    BOOST_CHECK(world.destroyCollider(pit) == PhysicsResult::Ok);
    BOOST_CHECK_NO_THROW(advance(2.0f));
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 0u);
    BOOST_CHECK_EQUAL(world.getIgnoredPairCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestExpiryAfterRagdollTornDown)
{
    const auto colliders = ragdoll->getColliders();
    suppression.ignore(colliders, pit, 1.0f);

    ragdolls.teardown(*ragdoll);
    BOOST_CHECK_NO_THROW(advance(1.5f));
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 0u);
    BOOST_CHECK(world.hasCollider(pit));
}

BOOST_AUTO_TEST_CASE(TestOverlappingRecordsHoldPairUntilLastExpires)
{
    const auto colliders = ragdoll->getColliders();
    suppression.ignore(colliders, pit, 1.0f);
    suppression.ignore(colliders, pit, 2.0f);
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 2u);

    advance(1.2f);
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 1u);
    BOOST_CHECK(allIgnoring(colliders));

    advance(1.0f);
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 0u);
    BOOST_CHECK(!world.isIgnoring(colliders.front(), pit));
}

BOOST_AUTO_TEST_CASE(TestMissingTargetRejected)
{
    const auto colliders = ragdoll->getColliders();
    BOOST_CHECK_EQUAL(suppression.ignore(colliders, 999, 1.0f),
                      CollisionSuppressionManager::INVALID_RECORD);
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 0u);
    BOOST_CHECK_EQUAL(scheduler.pendingCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestMissingCollidersSkipped)
{
    std::vector<ColliderID> colliders = ragdoll->getColliders();
    colliders.push_back(12345);

    BOOST_CHECK_NE(suppression.ignore(colliders, pit, 1.0f),
                   CollisionSuppressionManager::INVALID_RECORD);
    BOOST_CHECK(!suppression.isSuppressed(12345, pit));

    const std::vector<ColliderID> onlyMissing{12345};
    BOOST_CHECK_EQUAL(suppression.ignore(onlyMissing, pit, 1.0f),
                      CollisionSuppressionManager::INVALID_RECORD);
}

BOOST_AUTO_TEST_CASE(TestDestructionRestoresPendingPairs)
{
    const auto colliders = ragdoll->getColliders();
    {
        CollisionSuppressionManager scoped(world, scheduler);
        scoped.ignore(colliders, pit, 10.0f);
        BOOST_CHECK(allIgnoring(colliders));
    }
    BOOST_CHECK(!world.isIgnoring(colliders.front(), pit));
    // The expiry task is bound to the destroyed manager and must not run
    BOOST_CHECK_NO_THROW(advance(11.0f));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Nudge
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(NudgeTests, SuppressionFixture)

BOOST_AUTO_TEST_CASE(TestNudgeMovesAwayFromClosestPoint)
{
    BOOST_REQUIRE(ragdoll);
    const BodyID root = ragdoll->getRootBody();
    const float rootYBefore = world.getBody(root)->position.getY();

    BOOST_CHECK(suppression.nudgeAway(*ragdoll, pit, 0.25f));

    BOOST_CHECK_CLOSE(ragdoll->getPosition().getY(), 1.25f, 0.01f);
    BOOST_CHECK_CLOSE(world.getBody(root)->position.getY(), rootYBefore + 0.25f, 0.01f);
    BOOST_CHECK_SMALL(ragdoll->getPosition().getX(), 0.0001f);

    for (const auto& part : ragdoll->getParts()) {
        const BodyState* body = world.getBody(part.body);
        BOOST_REQUIRE(body != nullptr);
        BOOST_CHECK_CLOSE(body->velocity.getY(), CollisionSuppressionManager::DEFAULT_NUDGE_IMPULSE,
                          0.01f);
    }
}

BOOST_AUTO_TEST_CASE(TestCoincidentFallsBackToForwardAndUp)
{
    auto inside = ragdolls.spawn(Pose(Vector3D(0.0f, -1.0f, 0.0f)), Vector3D());
    BOOST_REQUIRE(inside);

    BOOST_CHECK(suppression.nudgeAway(*inside, pit, 1.0f));

    const Vector3D moved = inside->getPosition() - Vector3D(0.0f, -1.0f, 0.0f);
    BOOST_CHECK_CLOSE(moved.length(), 1.0f, 0.01f);
    BOOST_CHECK_GT(moved.getZ(), 0.9f);
    BOOST_CHECK_GT(moved.getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestCustomImpulse)
{
    suppression.setNudgeImpulse(4.0f);
    BOOST_CHECK(suppression.nudgeAway(*ragdoll, pit, 0.1f));
    BOOST_CHECK_CLOSE(world.getBody(ragdoll->getRootBody())->velocity.getY(), 4.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestNudgeStaleReferencesSkipped)
{
    BOOST_CHECK(!suppression.nudgeAway(*ragdoll, 999, 0.25f));
    BOOST_CHECK_CLOSE(ragdoll->getPosition().getY(), 1.0f, 0.01f);

    ragdolls.teardown(*ragdoll);
    BOOST_CHECK(!suppression.nudgeAway(*ragdoll, pit, 0.25f));
}

BOOST_AUTO_TEST_SUITE_END()
