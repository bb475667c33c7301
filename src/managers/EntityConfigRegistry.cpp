/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityConfigRegistry.hpp"
#include "core/ConfigurationError.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <filesystem>
#include <format>

namespace Bulwark {

namespace {

// Keep in sync with res/data/*.json
constexpr const char* DEFAULT_DEFINITIONS = R"json({
  "enemies": [
    { "name": "Goblin", "health": 30, "speed": 80, "size": 16, "bounty": 10, "armor": 0,
      "resistances": { "fire": 0.1 }, "spawnCost": 3 },
    { "name": "Hobbit", "health": 25, "speed": 100, "size": 14, "bounty": 8, "armor": 0,
      "resistances": {}, "spawnCost": 2 },
    { "name": "Dwarve", "health": 60, "speed": 50, "size": 20, "bounty": 20, "armor": 2,
      "resistances": { "fire": 0.2, "ice": 0.1 }, "spawnCost": 5, "introWave": 1, "rampWaves": 1 },
    { "name": "Elve", "health": 45, "speed": 90, "size": 18, "bounty": 15, "armor": 0,
      "resistances": { "ice": 0.3 }, "spawnCost": 4, "introWave": 3, "rampWaves": 8 },
    { "name": "Dragon", "health": 150, "speed": 40, "size": 32, "bounty": 100, "armor": 5,
      "resistances": { "fire": 0.8, "ice": 0.3 }, "spawnCost": 40, "introWave": 5, "rampWaves": 5 }
  ],
  "projectiles": [
    { "name": "arrow", "speed": 300, "size": 4, "maxDistance": 1000, "lifetime": 5 },
    { "name": "fireball", "speed": 150, "size": 8, "maxDistance": 800, "lifetime": 6 },
    { "name": "iceShard", "speed": 250, "size": 6, "maxDistance": 900, "lifetime": 5 },
    { "name": "cannonball", "speed": 200, "size": 10, "maxDistance": 1200, "lifetime": 8, "piercing": true },
    { "name": "bolt", "speed": 400, "size": 2, "maxDistance": 1000, "lifetime": 3 },
    { "name": "magicMissile", "speed": 180, "size": 7, "maxDistance": 900, "lifetime": 7, "homing": true }
  ],
  "towers": [
    { "name": "archer", "cost": 100, "upgradeCost": 50, "range": 150, "fireRate": 0.5, "damage": 15,
      "damageType": "normal", "projectileType": "arrow", "targeting": "closest" },
    { "name": "mage", "cost": 150, "upgradeCost": 75, "range": 120, "fireRate": 0.75, "damage": 25,
      "damageType": "magic", "projectileType": "magicMissile", "targeting": "pathProgress",
      "splashRadius": 40 },
    { "name": "cannon", "cost": 200, "upgradeCost": 100, "range": 180, "fireRate": 1.5, "damage": 50,
      "damageType": "normal", "projectileType": "cannonball", "piercing": true, "targeting": "strongest" },
    { "name": "frost", "cost": 120, "upgradeCost": 60, "range": 140, "fireRate": 0.6, "damage": 12,
      "damageType": "ice", "projectileType": "iceShard", "targeting": "weakest",
      "onHit": { "type": "slow", "magnitude": 0.4, "duration": 2 } },
    { "name": "alchemist", "cost": 140, "upgradeCost": 70, "range": 130, "fireRate": 0.8, "damage": 20,
      "damageType": "poison", "projectileType": "fireball", "targeting": "pathProgress",
      "onHit": { "type": "burn", "magnitude": 5, "duration": 4 } },
    { "name": "tesla", "cost": 180, "upgradeCost": 90, "range": 110, "fireRate": 1.0, "damage": 30,
      "damageType": "lightning", "projectileType": "bolt", "piercing": true, "targeting": "closest",
      "chain": { "maxChains": 3, "chainRange": 80, "damageMultiplier": 0.8 } }
  ],
  "maps": [
    { "name": "map1", "columns": 20, "rows": 15, "tileSize": 40,
      "path": [[0, 7], [5, 7], [5, 3], [10, 3], [10, 11], [15, 11], [15, 7], [19, 7]],
      "blocked": [] }
  ]
})json";

const std::string& requireName(const JsonValue& json) {
    const JsonValue& name = json["name"];
    if (!name.isString() || name.asString().empty()) {
        throw ConfigurationError("entry is missing a non-empty 'name'");
    }
    return name.asString();
}

float nonNegative(const JsonValue& json, const char* key, float fallback) {
    float value = static_cast<float>(json.numberOr(key, fallback));
    if (value < 0.0f) {
        throw ConfigurationError(std::format("'{}' must not be negative (got {})", key, value));
    }
    return value;
}

DamageType parseDamageType(const JsonValue& json, const char* key) {
    std::string name = json.stringOr(key, "normal");
    auto type = damageTypeFromString(name);
    if (!type) {
        throw ConfigurationError(std::format("unknown damage type '{}'", name));
    }
    return *type;
}

GridCell parseCell(const JsonValue& json) {
    if (!json.isArray() || json.size() != 2 || !json[0].isNumber() || !json[1].isNumber()) {
        throw ConfigurationError("grid cells must be [column, row] pairs");
    }
    return GridCell{json[0].asInt(), json[1].asInt()};
}

} // namespace

void EntityConfigRegistry::loadDefaults() {
    loadFromJsonString(DEFAULT_DEFINITIONS, "built-in defaults");
}

void EntityConfigRegistry::loadFromDirectory(const std::string& dataDirectory) {
    namespace fs = std::filesystem;
    for (const char* file : {"enemies.json", "projectiles.json", "towers.json", "maps.json"}) {
        loadFromFile((fs::path(dataDirectory) / file).string());
    }
}

void EntityConfigRegistry::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        throw ConfigurationError(std::format("EntityConfigRegistry::loadFromFile - {}: {}",
                                             path, reader.getLastError()));
    }
    loadDocument(reader.getRoot(), path);
}

void EntityConfigRegistry::loadFromJsonString(const std::string& json, const std::string& origin) {
    JsonReader reader;
    if (!reader.parse(json)) {
        throw ConfigurationError(std::format("EntityConfigRegistry::loadFromJsonString - "
                                             "failed to parse {}: {}", origin, reader.getLastError()));
    }

    loadDocument(reader.getRoot(), origin);
}

void EntityConfigRegistry::loadDocument(const JsonValue& root, const std::string& origin) {
    if (!root.isObject()) {
        throw ConfigurationError(std::format("EntityConfigRegistry::loadDocument - "
                                             "root of {} is not an object", origin));
    }

    size_t failed = 0;
    failed += loadSection(root, "enemies", m_enemies, &EntityConfigRegistry::parseEnemy, origin);
    failed += loadSection(root, "projectiles", m_projectiles, &EntityConfigRegistry::parseProjectile, origin);
    failed += loadSection(root, "towers", m_towers, &EntityConfigRegistry::parseTower, origin);
    failed += loadSection(root, "maps", m_maps, &EntityConfigRegistry::parseMap, origin);

    if (failed > 0) {
        throw ConfigurationError(std::format("{} invalid definition(s) in {}", failed, origin));
    }
}

template <typename T, typename ParseFn>
size_t EntityConfigRegistry::loadSection(const JsonValue& root, const char* section, Table<T>& table,
                                         ParseFn parse, const std::string& origin) {
    if (!root.hasKey(section)) {
        return 0;
    }
    const JsonValue& entries = root[section];
    if (!entries.isArray()) {
        CONFIG_ERROR(std::format("EntityConfigRegistry::loadSection - '{}' in {} is not an array",
                                 section, origin));
        return 1;
    }

    size_t loadedCount = 0;
    size_t failedCount = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        try {
            T definition = parse(entries[i]);
            CONFIG_DEBUG(std::format("Loaded {} definition '{}'", section, definition.name));
            table.upsert(std::move(definition));
            ++loadedCount;
        } catch (const std::exception& ex) {
            ++failedCount;
            CONFIG_ERROR(std::format("EntityConfigRegistry::loadSection - {}[{}] in {}: {}",
                                     section, i, origin, ex.what()));
        }
    }

    CONFIG_INFO(std::format("Loaded {} {} from {} ({} failed)", loadedCount, section, origin, failedCount));
    return failedCount;
}

EnemyDefinition EntityConfigRegistry::parseEnemy(const JsonValue& json) {
    EnemyDefinition def;
    def.name = requireName(json);
    def.health = nonNegative(json, "health", 0.0f);
    if (def.health <= 0.0f) {
        throw ConfigurationError(std::format("enemy '{}' needs a positive 'health'", def.name));
    }
    def.speed = nonNegative(json, "speed", 0.0f);
    def.size = nonNegative(json, "size", 16.0f);
    def.bounty = static_cast<int>(nonNegative(json, "bounty", 0.0f));
    def.armor = nonNegative(json, "armor", 0.0f);
    def.spawnCost = static_cast<int>(json.numberOr("spawnCost", 1.0));
    if (def.spawnCost < 1) {
        throw ConfigurationError(std::format("enemy '{}' needs a 'spawnCost' of at least 1", def.name));
    }
    def.introWave = static_cast<int>(nonNegative(json, "introWave", 0.0f));
    def.rampWaves = static_cast<int>(nonNegative(json, "rampWaves", 0.0f));

    if (const JsonObject* resistances = json["resistances"].tryAsObject()) {
        for (const auto& [typeName, value] : *resistances) {
            auto type = damageTypeFromString(typeName);
            if (!type) {
                throw ConfigurationError(std::format("enemy '{}' resists unknown damage type '{}'",
                                                     def.name, typeName));
            }
            auto fraction = value.tryAsNumber();
            if (!fraction || *fraction < 0.0 || *fraction >= 1.0) {
                throw ConfigurationError(std::format("enemy '{}' resistance '{}' must be in [0, 1)",
                                                     def.name, typeName));
            }
            def.resistances[static_cast<size_t>(*type)] = static_cast<float>(*fraction);
        }
    }
    return def;
}

TowerDefinition EntityConfigRegistry::parseTower(const JsonValue& json) {
    TowerDefinition def;
    def.name = requireName(json);
    def.cost = static_cast<int>(nonNegative(json, "cost", 0.0f));
    def.upgradeCost = static_cast<int>(nonNegative(json, "upgradeCost", 0.0f));
    def.range = nonNegative(json, "range", 0.0f);
    def.fireRate = nonNegative(json, "fireRate", 1.0f);
    if (def.fireRate <= 0.0f) {
        throw ConfigurationError(std::format("tower '{}' needs a positive 'fireRate'", def.name));
    }
    def.damage = nonNegative(json, "damage", 0.0f);
    def.damageType = parseDamageType(json, "damageType");
    def.projectileType = json.stringOr("projectileType", "");
    if (def.projectileType.empty()) {
        throw ConfigurationError(std::format("tower '{}' is missing 'projectileType'", def.name));
    }
    def.piercing = json.boolOr("piercing", false);

    std::string strategy = json.stringOr("targeting", "closest");
    auto targeting = targetingStrategyFromString(strategy);
    if (!targeting) {
        throw ConfigurationError(std::format("tower '{}' has unknown targeting '{}'", def.name, strategy));
    }
    def.targeting = *targeting;

    def.maxLevel = static_cast<int>(json.numberOr("maxLevel", 10.0));
    if (def.maxLevel < 1) {
        throw ConfigurationError(std::format("tower '{}' needs a 'maxLevel' of at least 1", def.name));
    }
    def.damageVariance = nonNegative(json, "damageVariance", 0.1f);
    if (def.damageVariance >= 1.0f) {
        throw ConfigurationError(std::format("tower '{}' 'damageVariance' must be below 1", def.name));
    }
    def.splashRadius = nonNegative(json, "splashRadius", 0.0f);

    const JsonValue& onHit = json["onHit"];
    if (onHit.isObject()) {
        std::string typeName = onHit.stringOr("type", "");
        auto type = statusEffectTypeFromString(typeName);
        if (!type) {
            throw ConfigurationError(std::format("tower '{}' has unknown onHit type '{}'", def.name, typeName));
        }
        def.onHit = OnHitEffect{*type, nonNegative(onHit, "magnitude", 0.0f), nonNegative(onHit, "duration", 0.0f)};
    }

    const JsonValue& chain = json["chain"];
    if (chain.isObject()) {
        ChainSpec spec;
        spec.maxChains = static_cast<int>(nonNegative(chain, "maxChains", 0.0f));
        spec.chainRange = nonNegative(chain, "chainRange", 0.0f);
        spec.damageMultiplier = nonNegative(chain, "damageMultiplier", 1.0f);
        def.chain = spec;
    }
    return def;
}

ProjectileDefinition EntityConfigRegistry::parseProjectile(const JsonValue& json) {
    ProjectileDefinition def;
    def.name = requireName(json);
    def.speed = nonNegative(json, "speed", def.speed);
    def.size = nonNegative(json, "size", def.size);
    def.maxDistance = nonNegative(json, "maxDistance", def.maxDistance);
    def.lifetime = nonNegative(json, "lifetime", def.lifetime);
    def.piercing = json.boolOr("piercing", false);
    def.homing = json.boolOr("homing", false);
    return def;
}

MapDefinition EntityConfigRegistry::parseMap(const JsonValue& json) {
    MapDefinition def;
    def.name = requireName(json);
    def.columns = static_cast<int>(json.numberOr("columns", def.columns));
    def.rows = static_cast<int>(json.numberOr("rows", def.rows));
    def.tileSize = static_cast<float>(json.numberOr("tileSize", def.tileSize));

    const JsonValue& path = json["path"];
    if (!path.isArray()) {
        throw ConfigurationError(std::format("map '{}' is missing its 'path' array", def.name));
    }
    for (const JsonValue& cell : path.asArray()) {
        def.path.push_back(parseCell(cell));
    }
    if (const JsonArray* blocked = json["blocked"].tryAsArray()) {
        for (const JsonValue& cell : *blocked) {
            def.blocked.push_back(parseCell(cell));
        }
    }
    return def;
}

void EntityConfigRegistry::validate() const {
    if (m_enemies.items.empty()) {
        throw ConfigurationError("No enemy definitions loaded");
    }
    if (m_towers.items.empty()) {
        throw ConfigurationError("No tower definitions loaded");
    }
    if (m_maps.items.empty()) {
        throw ConfigurationError("No map definitions loaded");
    }
    for (const TowerDefinition& tower : m_towers.items) {
        if (m_projectiles.find(tower.projectileType) == nullptr) {
            throw ConfigurationError(std::format("Tower '{}' fires unknown projectile type '{}'",
                                                 tower.name, tower.projectileType));
        }
    }
    for (const MapDefinition& map : m_maps.items) {
        if (map.path.size() < 2) {
            throw ConfigurationError(std::format("Map '{}' path needs at least 2 waypoints", map.name));
        }
    }
}

const EnemyDefinition& EntityConfigRegistry::getEnemy(const std::string& name) const {
    if (const EnemyDefinition* def = findEnemy(name)) {
        return *def;
    }
    throw ConfigurationError(std::format("Unknown enemy type '{}'", name));
}

const TowerDefinition& EntityConfigRegistry::getTower(const std::string& name) const {
    if (const TowerDefinition* def = findTower(name)) {
        return *def;
    }
    throw ConfigurationError(std::format("Unknown tower type '{}'", name));
}

const ProjectileDefinition& EntityConfigRegistry::getProjectile(const std::string& name) const {
    if (const ProjectileDefinition* def = findProjectile(name)) {
        return *def;
    }
    throw ConfigurationError(std::format("Unknown projectile type '{}'", name));
}

const MapDefinition& EntityConfigRegistry::getMap(const std::string& name) const {
    if (const MapDefinition* def = findMap(name)) {
        return *def;
    }
    throw ConfigurationError(std::format("Unknown map '{}'", name));
}

void EntityConfigRegistry::clear() {
    m_enemies.clear();
    m_towers.clear();
    m_projectiles.clear();
    m_maps.clear();
}

} // namespace Bulwark
