/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>

#include "camera/CameraFocusConfig.hpp"
#include "managers/SettingsManager.hpp"
#include "mortality/MortalityConfig.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Ragfall;

// ============================================================================
// Typed Access
// ============================================================================

BOOST_AUTO_TEST_SUITE(TypedAccessTests)

BOOST_AUTO_TEST_CASE(TestSetAndGetEachType)
{
    SettingsManager settings;
    BOOST_CHECK(settings.set("demo", "max_frames", 600));
    BOOST_CHECK(settings.set("demo", "target_fps", 60.0f));
    BOOST_CHECK(settings.set("demo", "paced", false));
    BOOST_CHECK(settings.set("demo", "label", "pit"));

    BOOST_CHECK_EQUAL(settings.get<int>("demo", "max_frames"), 600);
    BOOST_CHECK_CLOSE(settings.get<float>("demo", "target_fps"), 60.0f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("demo", "paced", true), false);
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "label"), "pit");
}

BOOST_AUTO_TEST_CASE(TestIntAndFloatConvert)
{
    SettingsManager settings;
    settings.set("mortality", "respawn_delay", 2);
    settings.set("mortality", "max_health", 99.0f);

    BOOST_CHECK_CLOSE(settings.get<float>("mortality", "respawn_delay"), 2.0f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<int>("mortality", "max_health"), 99);
}

BOOST_AUTO_TEST_CASE(TestMissingOrMismatchedReturnsDefault)
{
    SettingsManager settings;
    settings.set("demo", "label", "pit");

    BOOST_CHECK_EQUAL(settings.get<int>("demo", "missing", 7), 7);
    BOOST_CHECK_EQUAL(settings.get<int>("nowhere", "label", 3), 3);
    BOOST_CHECK_EQUAL(settings.get<bool>("demo", "label", true), true);
}

BOOST_AUTO_TEST_CASE(TestRemoveAndClear)
{
    SettingsManager settings;
    settings.set("camera", "near_priority", 20);
    settings.set("camera", "far_priority", 10);
    settings.set("demo", "paced", true);

    BOOST_CHECK(settings.remove("camera", "near_priority"));
    BOOST_CHECK(!settings.remove("camera", "near_priority"));
    BOOST_CHECK(!settings.has("camera", "near_priority"));

    const std::vector<std::string> keys = settings.getKeys("camera");
    BOOST_REQUIRE_EQUAL(keys.size(), 1u);
    BOOST_CHECK_EQUAL(keys[0], "far_priority");

    BOOST_CHECK(settings.clearCategory("camera"));
    BOOST_CHECK(!settings.clearCategory("camera"));

    const std::vector<std::string> categories = settings.getCategories();
    BOOST_REQUIRE_EQUAL(categories.size(), 1u);
    BOOST_CHECK_EQUAL(categories[0], "demo");

    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Persistence
// ============================================================================

BOOST_AUTO_TEST_SUITE(PersistenceTests)

BOOST_AUTO_TEST_CASE(TestLoadFromString)
{
    SettingsManager settings;
    BOOST_REQUIRE(settings.loadFromString(R"({
        "mortality": { "max_health": 150, "respawn_delay": 0.5, "reload_scene_on_death": false },
        "camera": { "switching_mode": "exclusive", "ignored": [1, 2] },
        "stray": 4
    })"));

    BOOST_CHECK_EQUAL(settings.get<int>("mortality", "max_health"), 150);
    BOOST_CHECK_CLOSE(settings.get<float>("mortality", "respawn_delay"), 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("mortality", "reload_scene_on_death", true), false);
    BOOST_CHECK_EQUAL(settings.get<std::string>("camera", "switching_mode"), "exclusive");

    // Arrays and non-object categories are skipped
    BOOST_CHECK(!settings.has("camera", "ignored"));
    BOOST_CHECK(!settings.has("stray", "stray"));
}

BOOST_AUTO_TEST_CASE(TestMalformedInputRejected)
{
    SettingsManager settings;
    BOOST_CHECK(!settings.loadFromString("{ \"mortality\": "));
    BOOST_CHECK(!settings.loadFromString("[1, 2]"));
    BOOST_CHECK(!settings.loadFromFile("does/not/exist.json"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload)
{
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "ragfall_settings_test.json";

    SettingsManager original;
    original.set("mortality", "max_health", 80);
    original.set("mortality", "respawn_delay", 1.25f);
    original.set("camera", "switching_mode", "exclusive");
    original.set("demo", "paced", false);
    BOOST_REQUIRE(original.saveToFile(path.string()));

    SettingsManager reloaded;
    BOOST_REQUIRE(reloaded.loadFromFile(path.string()));
    BOOST_CHECK_EQUAL(reloaded.get<int>("mortality", "max_health"), 80);
    BOOST_CHECK_CLOSE(reloaded.get<float>("mortality", "respawn_delay"), 1.25f, 0.001f);
    BOOST_CHECK_EQUAL(reloaded.get<std::string>("camera", "switching_mode"), "exclusive");
    BOOST_CHECK_EQUAL(reloaded.get<bool>("demo", "paced", true), false);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Change Listeners
// ============================================================================

BOOST_AUTO_TEST_SUITE(ListenerTests)

BOOST_AUTO_TEST_CASE(TestListenerFiltersByCategory)
{
    SettingsManager settings;
    int cameraChanges = 0;
    int allChanges = 0;
    settings.registerChangeListener("camera", [&cameraChanges](const std::string&, const std::string&,
                                                               const SettingsManager::SettingValue&) {
        ++cameraChanges;
    });
    const size_t allId = settings.registerChangeListener(
        "", [&allChanges](const std::string&, const std::string&, const SettingsManager::SettingValue&) {
            ++allChanges;
        });

    settings.set("camera", "far_priority", 5);
    settings.set("demo", "paced", true);
    BOOST_CHECK_EQUAL(cameraChanges, 1);
    BOOST_CHECK_EQUAL(allChanges, 2);

    settings.unregisterChangeListener(allId);
    settings.set("demo", "paced", false);
    BOOST_CHECK_EQUAL(allChanges, 2);
}

BOOST_AUTO_TEST_CASE(TestListenerReceivesNewValue)
{
    SettingsManager settings;
    int received = 0;
    settings.registerChangeListener("mortality", [&received](const std::string&, const std::string& key,
                                                             const SettingsManager::SettingValue& value) {
        if (key == "max_health") {
            received = std::get<int>(value);
        }
    });

    settings.set("mortality", "max_health", 42);
    BOOST_CHECK_EQUAL(received, 42);
}

BOOST_AUTO_TEST_CASE(TestThrowingListenerIsolated)
{
    SettingsManager settings;
    int calls = 0;
    settings.registerChangeListener("", [](const std::string&, const std::string&,
                                           const SettingsManager::SettingValue&) {
        throw std::runtime_error("listener failure");
    });
    settings.registerChangeListener("", [&calls](const std::string&, const std::string&,
                                                 const SettingsManager::SettingValue&) {
        ++calls;
    });

    BOOST_CHECK_NO_THROW(settings.set("demo", "paced", true));
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK(settings.get<bool>("demo", "paced"));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Config Loading
// ============================================================================

BOOST_AUTO_TEST_SUITE(ConfigLoadingTests)

BOOST_AUTO_TEST_CASE(TestMortalityConfigFromSettings)
{
    SettingsManager settings;
    BOOST_REQUIRE(settings.loadFromString(R"({"mortality": {
        "max_health": 250, "respawn_delay": 3.5, "reload_scene_on_death": false,
        "use_respawn_position": true, "respawn_position_x": 1, "respawn_position_y": 2.5,
        "suppression_retry_frames": 5, "nudge_impulse": 0
    }})"));

    const MortalityConfig config = MortalityConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.maxHealth, 250);
    BOOST_CHECK_CLOSE(config.respawnDelay, 3.5f, 0.001f);
    BOOST_CHECK(!config.reloadSceneOnDeath);
    BOOST_CHECK(config.useRespawnPosition);
    BOOST_CHECK_CLOSE(config.respawnPosition.getX(), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(config.respawnPosition.getY(), 2.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.suppressionRetryFrames, 5);
    BOOST_CHECK_EQUAL(config.nudgeImpulse, 0.0f);

    // Untouched keys keep their defaults
    BOOST_CHECK_CLOSE(config.ragdollIgnoreDuration, MortalityConfig{}.ragdollIgnoreDuration, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestInvalidMortalityConfigFallsBack)
{
    SettingsManager settings;
    settings.set("mortality", "max_health", 0);
    settings.set("mortality", "respawn_delay", 9.0f);

    const MortalityConfig config = MortalityConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.maxHealth, MortalityConfig{}.maxHealth);
    BOOST_CHECK_CLOSE(config.respawnDelay, MortalityConfig{}.respawnDelay, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestCameraConfigFromSettings)
{
    SettingsManager settings;
    settings.set("camera", "switching_mode", "exclusive");
    settings.set("camera", "pit_search_radius", 12.0f);
    settings.set("camera", "near_priority", 3);
    settings.set("camera", "far_priority", 8);

    const CameraFocusConfig config = CameraFocusConfig::fromSettings(settings);
    BOOST_CHECK(config.switchingMode == SwitchingMode::Exclusive);
    BOOST_CHECK_CLOSE(config.pitSearchRadius, 12.0f, 0.001f);
    BOOST_CHECK_EQUAL(config.activePriority(), 8);
    BOOST_CHECK_EQUAL(config.inactivePriority(), 3);
}

BOOST_AUTO_TEST_CASE(TestUnknownSwitchingModeKeepsPriority)
{
    SettingsManager settings;
    settings.set("camera", "switching_mode", "sideways");
    BOOST_CHECK(CameraFocusConfig::fromSettings(settings).switchingMode == SwitchingMode::Priority);
}

BOOST_AUTO_TEST_CASE(TestEqualPrioritiesFallBack)
{
    SettingsManager settings;
    settings.set("camera", "near_priority", 10);
    settings.set("camera", "far_priority", 10);
    settings.set("camera", "pit_search_radius", 5.0f);

    const CameraFocusConfig config = CameraFocusConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.nearPriority, CameraFocusConfig{}.nearPriority);
    BOOST_CHECK_CLOSE(config.pitSearchRadius, CameraFocusConfig{}.pitSearchRadius, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
