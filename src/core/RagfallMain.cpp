/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "camera/CameraFocusConfig.hpp"
#include "camera/CameraFocusCoordinator.hpp"
#include "camera/PitRimRegistry.hpp"
#include "collisions/CollisionSuppressionManager.hpp"
#include "core/Logger.hpp"
#include "core/TaskScheduler.hpp"
#include "core/TimestepManager.hpp"
#include "entities/Actor.hpp"
#include "managers/SettingsManager.hpp"
#include "mortality/MortalityConfig.hpp"
#include "mortality/MortalityController.hpp"
#include "physics/PhysicsWorld.hpp"
#include "ragdoll/RagdollHandoffController.hpp"
#include "ragdoll/RagdollTemplate.hpp"
#include <format>
#include <memory>
#include <string>

using namespace Ragfall;

namespace {

const std::string DEMO_NAME{"Ragfall Pit Demo"};
const std::string SETTINGS_PATH{"res/ragfall.json"};

constexpr float GRAVITY{-9.81f};
constexpr float WALK_SPEED{3.0f};
// Edge of the ledge the actor walks off
constexpr float LEDGE_Z{4.0f};

enum class DemoPhase { Walking, Falling, Dead, Recovered };

const char* toString(DemoPhase phase) {
  switch (phase) {
    case DemoPhase::Walking: return "Walking";
    case DemoPhase::Falling: return "Falling";
    case DemoPhase::Dead: return "Dead";
    case DemoPhase::Recovered: return "Recovered";
  }
  return "Unknown";
}

} // namespace

// Walks an actor off a ledge into a hazard pit, lets the death sequence run
// and exits once the actor has been back on its feet for a second.
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  DEMO_INFO(std::format("Initializing {}", DEMO_NAME));

  SettingsManager settings;
  if (!settings.loadFromFile(SETTINGS_PATH)) {
    DEMO_WARN(std::format("Failed to load {} - using defaults", SETTINGS_PATH));
  }

  const MortalityConfig mortalityConfig = MortalityConfig::fromSettings(settings);
  const CameraFocusConfig cameraConfig = CameraFocusConfig::fromSettings(settings);
  const float targetFPS = settings.get<float>("demo", "target_fps", 60.0f);
  const int maxFrames = settings.get<int>("demo", "max_frames", 900);

  if (settings.get<bool>("demo", "benchmark_mode", false)) {
    RAGFALL_ENABLE_BENCHMARK_MODE();
  }

  PhysicsWorld world;
  TaskScheduler scheduler;

  // Hazard pit past the ledge, with a rim marker for the death camera
  const ColliderID pitVolume = world.createVolume(
      AABB(Vector3D(0.0f, -6.0f, LEDGE_Z + 4.0f), Vector3D(4.0f, 4.0f, 4.0f)),
      true, ClassificationTag::Hazard);
  PitRimRegistry pitRims;
  pitRims.registerMarker(Pose(Vector3D(0.0f, 2.5f, LEDGE_Z), Quaternion::fromYaw(0.0f)));

  Actor actor(world, "Player", Pose(Vector3D(0.0f, 0.0f, 0.0f)));
  actor.setGrounded(true);

  RagdollHandoffController ragdolls(world, RagdollTemplate::humanoid());
  CollisionSuppressionManager suppression(world, scheduler, mortalityConfig.nudgeImpulse);
  MortalityController mortality(actor, ragdolls, suppression, scheduler, mortalityConfig);

  CameraFocusCoordinator camera(actor, mortality, pitRims, cameraConfig);
  auto nearView = std::make_shared<Viewpoint>("NearView", cameraConfig.nearPriority);
  nearView->follow = actor.getEyeNode();
  nearView->lookAt = actor.getRootNode();
  auto farView = std::make_shared<Viewpoint>("FarView", cameraConfig.farPriority);
  farView->follow = actor.getRootNode();
  farView->lookAt = actor.getRootNode();
  camera.setViewpoints(nearView, farView);

  DemoPhase phase = DemoPhase::Walking;
  double recoveredAt = 0.0;

  mortality.setSceneReloader([&]() {
    DEMO_INFO("Scene reload requested, resetting the pit scene");
    mortality.respawn();
  });
  mortality.registerHandler(MortalityEventType::Respawn, [&]() {
    phase = DemoPhase::Recovered;
    recoveredAt = scheduler.now();
    actor.setGrounded(true);
  });

  TimestepManager ts(targetFPS, 1.0f / targetFPS);
  ts.setPaced(settings.get<bool>("demo", "paced", true));

  DEMO_INFO("Starting Main Loop");

  int frame = 0;
  bool running = true;
  while (running && frame < maxFrames) {
    ts.startFrame();

    while (ts.shouldUpdate()) {
      const float dt = ts.getUpdateDeltaTime();
      const DemoPhase before = phase;

      switch (phase) {
        case DemoPhase::Walking:
          actor.setVelocity(Vector3D(0.0f, 0.0f, WALK_SPEED));
          if (actor.getPose().position.getZ() > LEDGE_Z) {
            actor.setGrounded(false);
            phase = DemoPhase::Falling;
          }
          break;
        case DemoPhase::Falling: {
          const Vector3D v = actor.getVelocity();
          actor.setVelocity(Vector3D(v.getX(), v.getY() + GRAVITY * dt, v.getZ()));
          if (world.overlaps(actor.getColliderId(), pitVolume)) {
            mortality.die(DeathCause::ForcedFall);
            mortality.suppressRagdollCollisionWith(pitVolume);
            phase = DemoPhase::Dead;
          }
          break;
        }
        case DemoPhase::Dead:
          break;
        case DemoPhase::Recovered:
          actor.setVelocity(Vector3D());
          if (scheduler.now() - recoveredAt > 1.0) {
            running = false;
          }
          break;
      }

      actor.update(dt);
      camera.update(dt);
      scheduler.update(dt);

      if (phase != before) {
        const Vector3D p = actor.getPose().position;
        const Viewpoint* live = camera.activeViewpoint();
        DEMO_INFO(std::format("t={:.2f}s {} -> {} at ({:.2f}, {:.2f}, {:.2f}), camera {} ({})",
                              scheduler.now(), toString(before), toString(phase),
                              p.getX(), p.getY(), p.getZ(), toString(camera.getMode()),
                              live ? live->name : "none"));
      }
    }

    ts.endFrame();
    ++frame;
  }

  if (running) {
    DEMO_WARN(std::format("Stopped after {} frames without recovering", frame));
  }

  DEMO_INFO(std::format("Done: {} death(s), {} ragdoll(s) spawned, {} torn down, health {}/{}",
                        mortality.getDeathCount(), ragdolls.getSpawnCount(),
                        ragdolls.getTeardownCount(), mortality.getCurrentHealth(),
                        mortality.getMaxHealth()));
  return running ? 1 : 0;
}
