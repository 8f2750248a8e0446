/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Kickoff {

/**
 * @brief Category/key store for simulation tuning values
 *
 * Backed by a two-level JSON document ("category": {"key": value}). Values
 * are int, float, bool or string. Reads take a shared lock, writes an
 * exclusive one, and listeners run after the write lock is released.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   float maxSpeed = settings.get<float>("player", "max_speed", 0.11f);
 */
class SettingsManager {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;
    using ChangeCallback = std::function<void(const std::string& category,
                                              const std::string& key,
                                              const SettingValue& newValue)>;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    /**
     * @brief Merges every category of a JSON file into the store
     * @return false if the file is missing, malformed, or not an object
     */
    bool loadFromFile(const std::string& filepath);
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed lookup
     *
     * Returns defaultValue when the key is absent. An int stored where a
     * float is requested is widened; any other mismatch yields the default.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    // Empty category watches everything
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    SettingsManager() = default;
    ~SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    void store(const std::string& category, const std::string& key, SettingValue value);
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };
    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId{0};
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }
    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<float>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
    }
    return defaultValue;
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

} // namespace Kickoff

#endif // SETTINGS_MANAGER_HPP
