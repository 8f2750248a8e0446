/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>

namespace Kickoff {

namespace {

bool toSettingValue(const JsonValue& value, SettingsManager::SettingValue& out) {
    if (value.isBool()) {
        out = value.asBool();
        return true;
    }
    if (value.isNumber()) {
        const double number = value.asNumber();
        // Whole numbers become ints, get<float> widens them back on request
        if (std::floor(number) == number &&
            std::abs(number) <= static_cast<double>(std::numeric_limits<int>::max())) {
            out = static_cast<int>(number);
        } else {
            out = static_cast<float>(number);
        }
        return true;
    }
    if (value.isString()) {
        out = value.asString();
        return true;
    }
    return false;
}

} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from {}: {}", filepath,
                                   reader.getLastError()));
        return false;
    }

    const JsonObject* root = reader.getRoot().tryAsObject();
    if (root == nullptr) {
        SETTINGS_ERROR(std::format("Settings root is not an object: {}", filepath));
        return false;
    }

    size_t loaded = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categoryValue] : *root) {
            const JsonObject* category = categoryValue.tryAsObject();
            if (category == nullptr) {
                SETTINGS_WARNING(std::format("Category '{}' is not an object, skipping",
                                             categoryName));
                continue;
            }

            for (const auto& [key, value] : *category) {
                SettingValue settingValue;
                if (!toSettingValue(value, settingValue)) {
                    SETTINGS_WARNING(std::format("Unsupported value for '{}.{}', skipping",
                                                 categoryName, key));
                    continue;
                }
                m_settings[categoryName][key] = std::move(settingValue);
                ++loaded;
            }
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {}", loaded, filepath));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR(std::format("Failed to open settings file for writing: {}", filepath));
        return false;
    }

    file << "{\n";
    size_t categoryIndex = 0;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        file << "  \"" << categoryName << "\": {\n";

        size_t keyIndex = 0;
        for (const auto& [key, value] : categorySettings) {
            file << "    \"" << key << "\": ";
            std::visit([&file](const auto& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, bool>) {
                    file << (arg ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    file << '"' << arg << '"';
                } else if constexpr (std::is_same_v<T, float>) {
                    // Keep a decimal point so the value reloads as a float
                    std::string text = std::format("{}", arg);
                    if (text.find_first_of(".eE") == std::string::npos) {
                        text += ".0";
                    }
                    file << text;
                } else {
                    file << arg;
                }
            }, value);
            file << (++keyIndex < categorySettings.size() ? ",\n" : "\n");
        }

        file << (++categoryIndex < m_settings.size() ? "  },\n" : "  }\n");
    }
    file << "}\n";

    SETTINGS_INFO(std::format("Saved settings to {}", filepath));
    return true;
}

void SettingsManager::store(const std::string& category, const std::string& key,
                            SettingValue value) {
    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = value;
    }
    notifyListeners(category, key, value);
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() &&
           categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category,
                                               ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    std::erase_if(m_listeners, [callbackId](const ListenerInfo& info) {
        return info.id == callbackId;
    });
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& entry : m_settings) {
        categories.push_back(entry.first);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> keys;

    auto categoryIt = m_settings.find(category);
    if (categoryIt != m_settings.end()) {
        keys.reserve(categoryIt->second.size());
        for (const auto& entry : categoryIt->second) {
            keys.push_back(entry.first);
        }
        std::sort(keys.begin(), keys.end());
    }
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key,
                                      const SettingValue& newValue) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    for (const auto& listener : m_listeners) {
        if (listener.category.empty() || listener.category == category) {
            listener.callback(category, key, newValue);
        }
    }
}

} // namespace Kickoff
