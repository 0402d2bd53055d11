/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace Ragfall {

class JsonValue;

/**
 * @brief Categorised settings store with JSON persistence
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/ragfall.json");
 *   float delay = settings.get<float>("mortality", "respawn_delay", 2.0f);
 *   settings.set("camera", "pit_search_radius", 40.0f);
 *   settings.saveToFile("ragfall.json");
 *
 * Numbers are stored as int when they have no fractional part. get<float>()
 * and get<int>() convert between the two so "2" and "2.0" read the same.
 */
class SettingsManager {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Callback function type for change notifications
     * @param category The category that changed
     * @param key The setting key that changed
     * @param newValue The new value of the setting
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    /**
     * @brief Merges settings from a JSON file
     * @return true if loading successful, false otherwise
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Merges settings from JSON text
     * @return true if parsing successful, false otherwise
     */
    bool loadFromString(const std::string& json);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     * @tparam T int, float, bool or std::string
     * @return The setting value, or defaultValue if missing or of another type
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value and notifies listeners
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Registers a callback for setting changes
     * @param category Category to watch (empty string watches all categories)
     * @return Callback ID that can be used to unregister
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::map<std::string, SettingValue>;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };

    bool loadFromJson(const JsonValue& root, const std::string& source);
    const SettingValue* find(const std::string& category, const std::string& key) const;
    void store(const std::string& category, const std::string& key, SettingValue value);
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    std::map<std::string, CategorySettings> m_settings;
    std::vector<ListenerInfo> m_listeners;
    size_t m_nextCallbackId{0};
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const SettingValue* value = find(category, key);
    if (!value) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const float* f = std::get_if<float>(value)) {
            return *f;
        }
        if (const int* i = std::get_if<int>(value)) {
            return static_cast<float>(*i);
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, int>) {
        if (const int* i = std::get_if<int>(value)) {
            return *i;
        }
        if (const float* f = std::get_if<float>(value)) {
            return static_cast<int>(*f);
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* v = std::get_if<T>(value)) {
            return *v;
        }
        return defaultValue;
    } else {
        static_assert(std::is_same_v<T, void>, "Unsupported setting type");
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        store(category, key, SettingValue(value));
        return true;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        store(category, key, SettingValue(std::string(value)));
        return true;
    } else {
        return false;
    }
}

} // namespace Ragfall

#endif // SETTINGS_MANAGER_HPP
