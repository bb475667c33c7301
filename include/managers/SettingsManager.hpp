/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Bulwark {

/**
 * @brief Category/key settings store with JSON persistence
 *
 * Owned by whoever runs a game session; simulations read their tunables
 * from it once at construction (see SimulationConfig::fromSettings).
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/settings.json");
 *   float growth = settings.get<float>("waves", "growth_factor", 2.0f);
 *   settings.set("player", "starting_lives", 30);
 */
class SettingsManager {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merges settings from a JSON file of { "category": { "key": value } }
     * @return false if the file is missing or malformed; existing values are kept
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile but from an in-memory JSON document
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Writes every category to a JSON file
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     *
     * int and float settings convert into each other, so a whole-number
     * entry such as "growth_factor": 2 still reads as 2.0f.
     * @return The stored value, or defaultValue if absent or of another type
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    void set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll() { m_settings.clear(); }

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;

    const SettingValue* find(const std::string& category, const std::string& key) const;
    bool mergeDocument(const std::string& json, const std::string& origin);

    std::unordered_map<std::string, CategorySettings> m_settings;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const SettingValue* value = find(category, key);
    if (value == nullptr) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, int>) {
        if (const int* i = std::get_if<int>(value)) return *i;
        if (const float* f = std::get_if<float>(value)) return static_cast<int>(*f);
    } else if constexpr (std::is_same_v<T, float>) {
        if (const float* f = std::get_if<float>(value)) return *f;
        if (const int* i = std::get_if<int>(value)) return static_cast<float>(*i);
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const bool* b = std::get_if<bool>(value)) return *b;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const std::string* s = std::get_if<std::string>(value)) return *s;
    } else {
        static_assert(std::is_same_v<T, int>, "SettingsManager supports int, float, bool and std::string");
    }
    return defaultValue;
}

template<typename T>
void SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, double>) {
        m_settings[category][key] = static_cast<float>(value);
    } else if constexpr (std::is_convertible_v<T, std::string> && !std::is_same_v<T, bool>) {
        m_settings[category][key] = std::string(value);
    } else {
        m_settings[category][key] = value;
    }
}

} // namespace Bulwark

#endif // SETTINGS_MANAGER_HPP
