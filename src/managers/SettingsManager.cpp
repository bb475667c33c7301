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
#include <sstream>

namespace Bulwark {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("SettingsManager::loadFromFile - cannot open " + filepath);
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return mergeDocument(buffer.str(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    return mergeDocument(json, "<string>");
}

bool SettingsManager::mergeDocument(const std::string& json, const std::string& origin) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR(std::format("SettingsManager::load - {} is not valid JSON: {}",
                                   origin, reader.getLastError()));
        return false;
    }

    const JsonObject* root = reader.getRoot().tryAsObject();
    if (root == nullptr) {
        SETTINGS_ERROR("SettingsManager::load - root of " + origin + " is not a JSON object");
        return false;
    }

    size_t loaded = 0;
    for (const auto& [categoryName, categoryValue] : *root) {
        const JsonObject* category = categoryValue.tryAsObject();
        if (category == nullptr) {
            SETTINGS_WARN("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *category) {
            if (value.isBool()) {
                m_settings[categoryName][key] = value.asBool();
            } else if (value.isNumber()) {
                double number = value.asNumber();
                if (number == std::floor(number) && std::fabs(number) < 2147483647.0) {
                    m_settings[categoryName][key] = static_cast<int>(number);
                } else {
                    m_settings[categoryName][key] = static_cast<float>(number);
                }
            } else if (value.isString()) {
                m_settings[categoryName][key] = value.asString();
            } else {
                SETTINGS_WARN("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            ++loaded;
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {}", loaded, origin));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject root;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        JsonObject category;
        for (const auto& [key, value] : categorySettings) {
            category[key] = std::visit([](const auto& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, float>) {
                    return JsonValue(static_cast<double>(arg));
                } else {
                    return JsonValue(arg);
                }
            }, value);
        }
        root[categoryName] = JsonValue(std::move(category));
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("SettingsManager::saveToFile - cannot open " + filepath + " for writing");
        return false;
    }
    file << JsonValue(std::move(root)).toString() << '\n';

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return static_cast<bool>(file);
}

const SettingsManager::SettingValue* SettingsManager::find(const std::string& category,
                                                           const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt == categoryIt->second.end() ? nullptr : &keyIt->second;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    return find(category, key) != nullptr;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [name, values] : m_settings) {
        categories.push_back(name);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::vector<std::string> keys;
    auto categoryIt = m_settings.find(category);
    if (categoryIt != m_settings.end()) {
        for (const auto& [key, value] : categoryIt->second) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace Bulwark
