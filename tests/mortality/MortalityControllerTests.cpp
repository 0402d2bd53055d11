/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MortalityControllerTests
#include <boost/test/unit_test.hpp>

#include "mocks/MortalityFixture.hpp"
#include "mortality/DeathFocusListener.hpp"
#include "ragdoll/RagdollInstance.hpp"
#include <memory>
#include <stdexcept>

using namespace Ragfall;

namespace {

class RecordingFocusListener : public DeathFocusListener {
public:
    void focusOnRagdoll(const std::shared_ptr<RagdollInstance>& ragdoll, const Pose& deathPose,
                        bool isFallDeath) override {
        ++calls;
        lastRagdoll = ragdoll;
        lastPose = deathPose;
        lastWasFall = isFallDeath;
    }

    int calls{0};
    std::shared_ptr<RagdollInstance> lastRagdoll;
    Pose lastPose;
    bool lastWasFall{false};
};

class ThrowingFocusListener : public DeathFocusListener {
public:
    void focusOnRagdoll(const std::shared_ptr<RagdollInstance>&, const Pose&, bool) override {
        throw std::runtime_error("camera exploded");
    }
};

class IntThrowingFocusListener : public DeathFocusListener {
public:
    void focusOnRagdoll(const std::shared_ptr<RagdollInstance>&, const Pose&, bool) override {
        throw 42;
    }
};

struct CountingFixture : MortalityFixture {
    CountingFixture() {
        mortality->registerHandler(MortalityEventType::Death, [this]() { ++deaths; });
        mortality->registerHandler(MortalityEventType::Respawn, [this]() { ++respawns; });
    }

    int deaths{0};
    int respawns{0};
};

} // namespace

// ============================================================================
// Health
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(HealthTests, CountingFixture)

BOOST_AUTO_TEST_CASE(TestHealthStaysInRangeAndDiesOnce)
{
    const int sequence[] = {10, 0, -5, 35, 40, 7, 30, 25, 100};
    int previous = mortality->getCurrentHealth();
    for (int amount : sequence) {
        mortality->applyDamage(amount);
        const int health = mortality->getCurrentHealth();
        BOOST_CHECK_GE(health, 0);
        BOOST_CHECK_LE(health, mortality->getMaxHealth());
        BOOST_CHECK_LE(health, previous);
        previous = health;
    }

    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), 0);
    BOOST_CHECK(mortality->isDead());
    BOOST_CHECK_EQUAL(deaths, 1);
    BOOST_CHECK_EQUAL(mortality->getDeathCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestOverkillClampsAndSpawnsOneRagdoll)
{
    mortality->applyDamage(150);

    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), 0);
    BOOST_CHECK(mortality->getState() == MortalityState::Dead);
    BOOST_CHECK_EQUAL(deaths, 1);
    BOOST_CHECK_EQUAL(ragdolls.getSpawnCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveDamageIgnored)
{
    mortality->applyDamage(0);
    mortality->applyDamage(-20);
    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), mortality->getMaxHealth());
}

BOOST_AUTO_TEST_CASE(TestHealClampsToMax)
{
    mortality->applyDamage(30);
    mortality->heal(10);
    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), 80);

    mortality->heal(500);
    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), mortality->getMaxHealth());
    BOOST_CHECK(!mortality->isDead());
}

BOOST_AUTO_TEST_CASE(TestDamageAndHealIgnoredWhileDead)
{
    mortality->die();
    const int health = mortality->getCurrentHealth();

    mortality->applyDamage(10);
    mortality->heal(10);
    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), health);
    BOOST_CHECK_EQUAL(deaths, 1);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Death
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DeathTests, CountingFixture)

BOOST_AUTO_TEST_CASE(TestDieTwiceProducesOneRagdollAndOneNotification)
{
    mortality->die();
    mortality->die(DeathCause::ForcedFall);

    BOOST_CHECK_EQUAL(deaths, 1);
    BOOST_CHECK_EQUAL(ragdolls.getSpawnCount(), 1u);
    BOOST_CHECK_EQUAL(mortality->getDeathCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestDieHandsOffToRagdoll)
{
    actor.setVelocity(Vector3D(0.0f, -2.0f, 1.0f));
    mortality->die();

    BOOST_REQUIRE(mortality->hasRagdoll());
    auto ragdoll = mortality->getRagdoll().lock();
    BOOST_REQUIRE(ragdoll);
    const BodyState* root = world.getBody(ragdoll->getRootBody());
    BOOST_REQUIRE(root != nullptr);
    BOOST_CHECK_CLOSE(root->velocity.getY(), -2.0f, 0.01f);

    BOOST_CHECK(!actor.isLocomotionEnabled());
    BOOST_CHECK(!actor.isInteractionEnabled());
    BOOST_CHECK(!actor.isVisible());
    BOOST_CHECK(actor.isBodyFrozen());
}

BOOST_AUTO_TEST_CASE(TestHandlersSeeCompletedDeath)
{
    bool sawDead = false;
    bool sawRagdoll = false;
    mortality->registerHandler(MortalityEventType::Death, [&]() {
        sawDead = mortality->getState() == MortalityState::Dead;
        sawRagdoll = mortality->hasRagdoll();
    });

    mortality->die();
    BOOST_CHECK(sawDead);
    BOOST_CHECK(sawRagdoll);
}

BOOST_AUTO_TEST_CASE(TestThrowingHandlerDoesNotBlockOthers)
{
    int after = 0;
    mortality->registerHandler(MortalityEventType::Death, []() {
        throw std::runtime_error("observer failure");
    });
    mortality->registerHandler(MortalityEventType::Death, [&after]() { ++after; });

    BOOST_CHECK_NO_THROW(mortality->die());
    BOOST_CHECK_EQUAL(deaths, 1);
    BOOST_CHECK_EQUAL(after, 1);
    BOOST_CHECK(mortality->isDead());
}

BOOST_AUTO_TEST_CASE(TestNonStandardThrowDoesNotBlockRespawn)
{
    int after = 0;
    mortality->registerHandler(MortalityEventType::Death, []() { throw 42; });
    mortality->registerHandler(MortalityEventType::Death, [&after]() { ++after; });

    BOOST_CHECK_NO_THROW(mortality->die());
    BOOST_CHECK_EQUAL(after, 1);
    BOOST_CHECK(mortality->isDead());

    advance(mortality->getConfig().respawnDelay + 0.1f);
    BOOST_CHECK(!mortality->isDead());
    BOOST_CHECK_EQUAL(respawns, 1);
}

BOOST_AUTO_TEST_CASE(TestFocusListenerReceivesRagdoll)
{
    RecordingFocusListener listener;
    mortality->setDeathFocusListener(&listener);
    actor.setPose(Pose(Vector3D(1.0f, 2.0f, 3.0f)));

    mortality->die(DeathCause::ForcedFall);

    BOOST_CHECK_EQUAL(listener.calls, 1);
    BOOST_CHECK(listener.lastRagdoll == mortality->getRagdoll().lock());
    BOOST_CHECK(listener.lastWasFall);
    BOOST_CHECK_CLOSE(listener.lastPose.position.getZ(), 3.0f, 0.01f);
    mortality->setDeathFocusListener(nullptr);
}

BOOST_AUTO_TEST_CASE(TestThrowingFocusListenerIsIsolated)
{
    ThrowingFocusListener listener;
    mortality->setDeathFocusListener(&listener);

    BOOST_CHECK_NO_THROW(mortality->die());
    BOOST_CHECK(mortality->isDead());
    mortality->setDeathFocusListener(nullptr);
}

BOOST_AUTO_TEST_CASE(TestNonStandardThrowFromFocusListenerIsIsolated)
{
    IntThrowingFocusListener listener;
    mortality->setDeathFocusListener(&listener);

    BOOST_CHECK_NO_THROW(mortality->die());
    advance(mortality->getConfig().respawnDelay + 0.1f);
    BOOST_CHECK(!mortality->isDead());
    mortality->setDeathFocusListener(nullptr);
}

BOOST_AUTO_TEST_CASE(TestScheduledDeathFires)
{
    mortality->scheduleDeath(0.5f, DeathCause::ForcedFall);
    advance(0.4f);
    BOOST_CHECK(!mortality->isDead());

    advance(0.2f);
    BOOST_CHECK(mortality->isDead());
    BOOST_CHECK_EQUAL(deaths, 1);
}

BOOST_AUTO_TEST_CASE(TestScheduledDeathDroppedAfterInterveningDeath)
{
    mortality->scheduleDeath(1.5f);
    mortality->die();
    // Respawn happens at 2s, the stale delayed death must not kill the new life
    advance(1.6f);
    BOOST_CHECK(mortality->isDead());
    advance(0.5f);
    BOOST_CHECK(!mortality->isDead());
    advance(1.0f);
    BOOST_CHECK(!mortality->isDead());
    BOOST_CHECK_EQUAL(deaths, 1);
}

BOOST_AUTO_TEST_CASE(TestScheduledDeathWhileDeadDoesNotKillNextLife)
{
    mortality->die();
    mortality->scheduleDeath(3.0f);

    advance(2.5f);
    BOOST_CHECK(!mortality->isDead());
    BOOST_CHECK_EQUAL(respawns, 1);

    advance(1.0f);
    BOOST_CHECK(!mortality->isDead());
    BOOST_CHECK_EQUAL(deaths, 1);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Fall Classification
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(FallClassificationTests, MortalityFixture)

BOOST_AUTO_TEST_CASE(TestForcedFallAlwaysFall)
{
    BOOST_CHECK(mortality->isFallDeath(DeathCause::ForcedFall, Pose(Vector3D()), Vector3D()));
}

BOOST_AUTO_TEST_CASE(TestGenericDeathClassifiedByVelocityOrHeight)
{
    BOOST_CHECK(!mortality->isFallDeath(DeathCause::Generic, Pose(Vector3D()), Vector3D()));
    BOOST_CHECK(mortality->isFallDeath(DeathCause::Generic, Pose(Vector3D()),
                                       Vector3D(0.0f, -6.0f, 0.0f)));
    BOOST_CHECK(mortality->isFallDeath(DeathCause::Generic, Pose(Vector3D(0.0f, -3.5f, 0.0f)),
                                       Vector3D()));
    BOOST_CHECK(!mortality->isFallDeath(DeathCause::Generic, Pose(Vector3D(0.0f, -2.5f, 0.0f)),
                                        Vector3D(0.0f, -4.0f, 0.0f)));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Respawn
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RespawnTests, CountingFixture)

BOOST_AUTO_TEST_CASE(TestRespawnRestoresEverything)
{
    actor.setPose(Pose(Vector3D(0.0f, -10.0f, 4.0f)));
    actor.setVelocity(Vector3D(0.0f, -9.0f, 0.0f));
    mortality->applyDamage(1000);
    auto ragdoll = mortality->getRagdoll().lock();
    BOOST_REQUIRE(ragdoll);

    BOOST_CHECK(mortality->respawn());

    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), mortality->getMaxHealth());
    BOOST_CHECK(!mortality->isDead());
    BOOST_CHECK(!mortality->hasRagdoll());
    BOOST_CHECK(ragdoll->isDestroyed());
    BOOST_CHECK_EQUAL(respawns, 1);

    BOOST_CHECK(actor.isLocomotionEnabled());
    BOOST_CHECK(actor.isInteractionEnabled());
    BOOST_CHECK(actor.isVisible());
    BOOST_CHECK(!actor.isBodyFrozen());
    BOOST_CHECK_SMALL(actor.getPose().position.getY(), 0.0001f);
    BOOST_CHECK_SMALL(actor.getVelocity().getY(), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestRespawnWhileAliveIgnored)
{
    BOOST_CHECK(!mortality->respawn());
    BOOST_CHECK_EQUAL(respawns, 0);
}

BOOST_AUTO_TEST_CASE(TestRespawnAfterDelay)
{
    mortality->die();
    advance(1.9f);
    BOOST_CHECK(mortality->isDead());

    advance(0.2f);
    BOOST_CHECK(!mortality->isDead());
    BOOST_CHECK_EQUAL(respawns, 1);
}

BOOST_AUTO_TEST_CASE(TestManualRespawnCancelsTimer)
{
    mortality->die();
    BOOST_CHECK(mortality->respawn());
    mortality->applyDamage(10);

    advance(3.0f);
    BOOST_CHECK_EQUAL(respawns, 1);
    BOOST_CHECK_EQUAL(mortality->getCurrentHealth(), 90);
}

BOOST_AUTO_TEST_CASE(TestSecondLifeCycle)
{
    mortality->die();
    advance(2.1f);
    mortality->die(DeathCause::ForcedFall);
    advance(2.1f);

    BOOST_CHECK_EQUAL(deaths, 2);
    BOOST_CHECK_EQUAL(respawns, 2);
    BOOST_CHECK_EQUAL(ragdolls.getSpawnCount(), 2u);
    BOOST_CHECK_EQUAL(ragdolls.getTeardownCount(), 2u);
}

BOOST_AUTO_TEST_CASE(TestTimerDroppedWithController)
{
    mortality->die();
    mortality.reset();
    BOOST_CHECK_NO_THROW(advance(3.0f));
    BOOST_CHECK_EQUAL(respawns, 0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Respawn Anchor And Scene Reload
// ============================================================================

BOOST_AUTO_TEST_SUITE(ConfigurationTests)

BOOST_AUTO_TEST_CASE(TestExplicitRespawnPosition)
{
    MortalityConfig config = MortalityFixture::inPlaceConfig();
    config.useRespawnPosition = true;
    config.respawnPosition = Vector3D(10.0f, 1.0f, -4.0f);
    MortalityFixture f(config);

    f.mortality->die();
    f.advance(2.1f);

    BOOST_CHECK(!f.mortality->isDead());
    BOOST_CHECK_CLOSE(f.actor.getPose().position.getX(), 10.0f, 0.01f);
    BOOST_CHECK_CLOSE(f.actor.getPose().position.getZ(), -4.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestSceneReloaderInvokedInsteadOfRespawn)
{
    MortalityConfig config = MortalityFixture::inPlaceConfig();
    config.reloadSceneOnDeath = true;
    MortalityFixture f(config);
    int reloads = 0;
    f.mortality->setSceneReloader([&reloads]() { ++reloads; });

    f.mortality->die();
    f.advance(2.1f);

    BOOST_CHECK_EQUAL(reloads, 1);
    BOOST_CHECK(f.mortality->isDead());
}

BOOST_AUTO_TEST_CASE(TestReloadWithoutReloaderRespawnsInPlace)
{
    MortalityConfig config = MortalityFixture::inPlaceConfig();
    config.reloadSceneOnDeath = true;
    MortalityFixture f(config);

    f.mortality->die();
    f.advance(2.1f);
    BOOST_CHECK(!f.mortality->isDead());
}

BOOST_AUTO_TEST_CASE(TestFailingReloaderFallsBackToRespawn)
{
    MortalityConfig config = MortalityFixture::inPlaceConfig();
    config.reloadSceneOnDeath = true;
    MortalityFixture f(config);
    f.mortality->setSceneReloader([]() { throw std::runtime_error("scene missing"); });

    f.mortality->die();
    BOOST_CHECK_NO_THROW(f.advance(2.1f));
    BOOST_CHECK(!f.mortality->isDead());
}

BOOST_AUTO_TEST_CASE(TestMissingTemplateFreezesVisibleBody)
{
    MortalityFixture f;
    f.ragdolls.clearTemplate();

    f.mortality->die();
    BOOST_CHECK(f.mortality->isDead());
    BOOST_CHECK(!f.mortality->hasRagdoll());
    BOOST_CHECK(f.actor.isVisible());
    BOOST_CHECK(f.actor.isBodyFrozen());

    BOOST_CHECK(f.mortality->respawn());
    BOOST_CHECK(!f.actor.isBodyFrozen());
}

BOOST_AUTO_TEST_CASE(TestInvalidConfigFallsBackToDefaults)
{
    MortalityConfig config = MortalityFixture::inPlaceConfig();
    config.maxHealth = -3;
    MortalityFixture f(config);
    BOOST_CHECK_EQUAL(f.mortality->getMaxHealth(), MortalityConfig{}.maxHealth);
    BOOST_CHECK_EQUAL(f.mortality->getCurrentHealth(), MortalityConfig{}.maxHealth);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Ragdoll Collision Suppression
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SuppressionRequestTests, MortalityFixture)

BOOST_AUTO_TEST_CASE(TestSuppressionAppliedImmediatelyWithRagdoll)
{
    const ColliderID pit = createHazard(Vector3D(0.0f, -2.0f, 0.0f), Vector3D(3.0f, 1.0f, 3.0f));
    mortality->die(DeathCause::ForcedFall);
    auto ragdoll = mortality->getRagdoll().lock();
    BOOST_REQUIRE(ragdoll);
    const float yBefore = ragdoll->getPosition().getY();

    mortality->suppressRagdollCollisionWith(pit, 0.5f);

    for (ColliderID collider : ragdoll->getColliders()) {
        BOOST_CHECK(world.isIgnoring(collider, pit));
    }
    BOOST_CHECK_GT(ragdoll->getPosition().getY(), yBefore);
    BOOST_CHECK_EQUAL(mortality->pendingSuppressionRequests(), 0u);

    advance(0.6f);
    for (ColliderID collider : ragdoll->getColliders()) {
        BOOST_CHECK(!world.isIgnoring(collider, pit));
    }
}

BOOST_AUTO_TEST_CASE(TestDefaultDurationUsed)
{
    const ColliderID pit = createHazard(Vector3D(0.0f, -2.0f, 0.0f), Vector3D(3.0f, 1.0f, 3.0f));
    mortality->die();
    auto ragdoll = mortality->getRagdoll().lock();
    BOOST_REQUIRE(ragdoll);

    mortality->suppressRagdollCollisionWith(pit);
    advance(0.9f);
    BOOST_CHECK(world.isIgnoring(ragdoll->getColliders().front(), pit));
    advance(0.2f);
    BOOST_CHECK(!world.isIgnoring(ragdoll->getColliders().front(), pit));
}

BOOST_AUTO_TEST_CASE(TestRequestBeforeRagdollIsRetried)
{
    const ColliderID pit = createHazard(Vector3D(0.0f, -2.0f, 0.0f), Vector3D(3.0f, 1.0f, 3.0f));

    // The trigger fires before the death it causes
    mortality->suppressRagdollCollisionWith(pit, 1.0f);
    BOOST_CHECK_EQUAL(mortality->pendingSuppressionRequests(), 1u);
    mortality->die(DeathCause::ForcedFall);

    tick();
    BOOST_CHECK_EQUAL(mortality->pendingSuppressionRequests(), 0u);
    auto ragdoll = mortality->getRagdoll().lock();
    BOOST_REQUIRE(ragdoll);
    BOOST_CHECK(world.isIgnoring(ragdoll->getColliders().front(), pit));
}

BOOST_AUTO_TEST_CASE(TestRequestDroppedAfterRetryBudget)
{
    const ColliderID pit = createHazard(Vector3D(0.0f, -2.0f, 0.0f), Vector3D(3.0f, 1.0f, 3.0f));
    const int budget = mortality->getConfig().suppressionRetryFrames;

    mortality->suppressRagdollCollisionWith(pit, 1.0f);
    tick(budget - 1);
    BOOST_CHECK_EQUAL(mortality->pendingSuppressionRequests(), 1u);
    tick();
    BOOST_CHECK_EQUAL(mortality->pendingSuppressionRequests(), 0u);

    // A ragdoll appearing later does not resurrect the request
    mortality->die();
    tick(2);
    BOOST_CHECK_EQUAL(world.getIgnoredPairCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestRespawnWithPendingRecordIsHarmless)
{
    const ColliderID pit = createHazard(Vector3D(0.0f, -2.0f, 0.0f), Vector3D(3.0f, 1.0f, 3.0f));
    mortality->die(DeathCause::ForcedFall);
    mortality->suppressRagdollCollisionWith(pit, 3.0f);
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 1u);

    advance(2.1f); // respawn destroys the ragdoll with 1s of suppression left
    BOOST_CHECK(!mortality->isDead());
    BOOST_CHECK_EQUAL(world.getIgnoredPairCount(), 0u);

    BOOST_CHECK_NO_THROW(advance(1.5f));
    BOOST_CHECK_EQUAL(suppression.activeRecordCount(), 0u);
    BOOST_CHECK(world.canCollide(actor.getColliderId(), pit));
}

BOOST_AUTO_TEST_SUITE_END()
