/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_CONFIG_REGISTRY_HPP
#define ENTITY_CONFIG_REGISTRY_HPP

#include "entities/EntityDefinitions.hpp"
#include "world/LevelMap.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bulwark {

class JsonValue;

/**
 * @brief Definitions of every enemy, tower, projectile and map type, keyed by name
 *
 * Data comes from JSON documents with any of the top-level arrays
 * "enemies", "towers", "projectiles" and "maps". Entries with a name that is
 * already registered replace the earlier definition, so a data directory can
 * be layered over the built-in defaults.
 *
 * Every loader throws ConfigurationError after logging each bad entry, and
 * validate() checks cross references (a tower's projectile type must exist,
 * the enemy roster must not be empty). Iteration order is load order, which
 * keeps seeded simulations reproducible.
 *
 * Usage:
 *   EntityConfigRegistry registry;
 *   registry.loadDefaults();
 *   registry.loadFromDirectory("res/data");
 *   registry.validate();
 *   const TowerDefinition& archer = registry.getTower("archer");
 */
class EntityConfigRegistry {
public:
    // Built-in tables, identical to the shipped res/data files
    void loadDefaults();

    // Loads enemies.json, towers.json, projectiles.json and maps.json
    void loadFromDirectory(const std::string& dataDirectory);

    void loadFromFile(const std::string& path);
    void loadFromJsonString(const std::string& json, const std::string& origin = "<string>");

    void validate() const;

    const EnemyDefinition* findEnemy(const std::string& name) const { return m_enemies.find(name); }
    const TowerDefinition* findTower(const std::string& name) const { return m_towers.find(name); }
    const ProjectileDefinition* findProjectile(const std::string& name) const { return m_projectiles.find(name); }
    const MapDefinition* findMap(const std::string& name) const { return m_maps.find(name); }

    // Throwing lookups for data that must exist
    const EnemyDefinition& getEnemy(const std::string& name) const;
    const TowerDefinition& getTower(const std::string& name) const;
    const ProjectileDefinition& getProjectile(const std::string& name) const;
    const MapDefinition& getMap(const std::string& name) const;

    const std::vector<EnemyDefinition>& getEnemies() const { return m_enemies.items; }
    const std::vector<TowerDefinition>& getTowers() const { return m_towers.items; }
    const std::vector<ProjectileDefinition>& getProjectiles() const { return m_projectiles.items; }
    const std::vector<MapDefinition>& getMaps() const { return m_maps.items; }

    void clear();

private:
    template <typename T>
    struct Table {
        std::vector<T> items;
        std::unordered_map<std::string, size_t> index;

        void upsert(T definition) {
            auto it = index.find(definition.name);
            if (it != index.end()) {
                items[it->second] = std::move(definition);
                return;
            }
            index.emplace(definition.name, items.size());
            items.push_back(std::move(definition));
        }

        const T* find(const std::string& name) const {
            auto it = index.find(name);
            return it == index.end() ? nullptr : &items[it->second];
        }

        void clear() {
            items.clear();
            index.clear();
        }
    };

    void loadDocument(const JsonValue& root, const std::string& origin);

    template <typename T, typename ParseFn>
    size_t loadSection(const JsonValue& root, const char* section, Table<T>& table,
                       ParseFn parse, const std::string& origin);

    static EnemyDefinition parseEnemy(const JsonValue& json);
    static TowerDefinition parseTower(const JsonValue& json);
    static ProjectileDefinition parseProjectile(const JsonValue& json);
    static MapDefinition parseMap(const JsonValue& json);

    Table<EnemyDefinition> m_enemies;
    Table<TowerDefinition> m_towers;
    Table<ProjectileDefinition> m_projectiles;
    Table<MapDefinition> m_maps;
};

} // namespace Bulwark

#endif // ENTITY_CONFIG_REGISTRY_HPP
