/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ConfigurationError.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include "managers/SettingsManager.hpp"
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct RunOptions {
  std::string resourceDir{"res"};
  bool fast{false};
  int maxWaves{-1};                   // -1 keeps the settings value
  uint64_t maxTicks{60ull * 60 * 30}; // 30 simulated minutes at 60 Hz
};

struct ScriptedBuild {
  const char* type;
  Bulwark::GridCell cell;
};

// Defence for map1, built in order as money allows
const std::vector<ScriptedBuild> BUILD_ORDER{
    {"archer", {4, 6}},   {"frost", {6, 4}},   {"mage", {9, 4}},
    {"archer", {11, 8}},  {"cannon", {14, 10}}, {"alchemist", {16, 8}},
    {"tesla", {11, 5}},   {"archer", {4, 8}},  {"mage", {16, 6}},
};

void printUsage(const char* program) {
  std::printf("Usage: %s [--res <dir>] [--fast] [--waves <n>] [--max-ticks <n>]\n", program);
}

bool parseArgs(int argc, char* argv[], RunOptions& options) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};
    auto nextValue = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

    if (arg == "--fast") {
      options.fast = true;
    } else if (arg == "--res") {
      const char* value = nextValue();
      if (value == nullptr) return false;
      options.resourceDir = value;
    } else if (arg == "--waves") {
      const char* value = nextValue();
      if (value == nullptr) return false;
      options.maxWaves = std::atoi(value);
    } else if (arg == "--max-ticks") {
      const char* value = nextValue();
      if (value == nullptr) return false;
      options.maxTicks = std::strtoull(value, nullptr, 10);
    } else {
      return false;
    }
  }
  return true;
}

// Places the next affordable tower of the build order, else upgrades the cheapest tower
void spendMoney(Bulwark::GameSession& session, size_t& nextBuild) {
  Bulwark::Simulation& simulation = session.getSimulation();

  while (nextBuild < BUILD_ORDER.size()) {
    const ScriptedBuild& build = BUILD_ORDER[nextBuild];
    Bulwark::PlacementResult result = simulation.placeTower(build.type, build.cell);
    if (result.error == Bulwark::PlacementError::InsufficientFunds) {
      return;
    }
    if (!result.succeeded()) {
      SESSION_WARN(std::format("Scripted {} at ({}, {}) rejected: {}", build.type, build.cell.col,
                               build.cell.row, Bulwark::toString(result.error)));
    }
    ++nextBuild;
  }

  const Bulwark::Tower* cheapest = nullptr;
  for (const auto& tower : simulation.getTowerManager().getTowers()) {
    if (tower->canUpgrade() && (cheapest == nullptr || tower->getUpgradeCost() < cheapest->getUpgradeCost())) {
      cheapest = tower.get();
    }
  }
  if (cheapest != nullptr) {
    Bulwark::UpgradeResult result = simulation.upgradeTower(cheapest->getId());
    if (result != Bulwark::UpgradeResult::None && result != Bulwark::UpgradeResult::InsufficientFunds) {
      SESSION_WARN(std::format("Upgrade of tower #{} rejected: {}", cheapest->getId(), Bulwark::toString(result)));
    }
  }
}

} // namespace

int main(int argc, char* argv[]) {
  RunOptions options;
  if (!parseArgs(argc, argv, options)) {
    printUsage(argv[0]);
    return 2;
  }

  GAMELOOP_INFO(std::format("Initializing {}", BULWARK_APP_NAME));

  namespace fs = std::filesystem;
  const fs::path resourceDir{options.resourceDir};

  Bulwark::SettingsManager settings;
  if (!settings.loadFromFile((resourceDir / "settings.json").string())) {
    GAMELOOP_WARN("Failed to load settings.json - using defaults");
  }

  try {
    Bulwark::SimulationConfig config = Bulwark::SimulationConfig::fromSettings(settings);
    if (options.maxWaves >= 0) {
      config.waves.maxWaves = options.maxWaves;
    }

    Bulwark::EntityConfigRegistry registry;
    registry.loadDefaults();
    const fs::path dataDir = resourceDir / "data";
    if (fs::is_directory(dataDir)) {
      registry.loadFromDirectory(dataDir.string());
    } else {
      GAMELOOP_WARN(std::format("No data directory at {} - using built-in definitions", dataDir.string()));
    }

    Bulwark::GameSession session(std::move(registry), config);
    Bulwark::TimestepManager ts(1.0f / config.fixedTimestep, config.fixedTimestep, config.maxDeltaTime);
    ts.setPacingEnabled(!options.fast);

    if (options.fast) {
      BULWARK_ENABLE_BENCHMARK_MODE();
    }

    size_t nextBuild = 0;
    spendMoney(session, nextBuild);

    GAMELOOP_INFO(std::format("Starting {} run on seed {}", options.fast ? "fast" : "real-time",
                              session.getSimulation().getSeed()));

    uint64_t ticks = 0;
    while (!session.isOver() && ticks < options.maxTicks) {
      ts.startFrame();
      while (ts.shouldUpdate() && !session.isOver()) {
        auto summary = session.update(ts.getUpdateDeltaTime());
        ++ticks;
        if (summary && (summary->waveCompleted || summary->bountyEarned > 0)) {
          spendMoney(session, nextBuild);
        }
      }
      ts.endFrame();
    }

    BULWARK_DISABLE_BENCHMARK_MODE();

    const Bulwark::Simulation& simulation = session.getSimulation();
    const Bulwark::SimulationTotals& totals = simulation.getTotals();
    const Bulwark::WaveStats& waveStats = simulation.getWaveDirector().getStats();
    GAMELOOP_INFO(std::format("Run finished ({}) after {} ticks / {:.1f}s simulated",
                              Bulwark::toString(session.getState()), ticks, simulation.getElapsedTime()));
    GAMELOOP_INFO(std::format("Wave {}, {} waves cleared, {} enemies spawned, {} killed, {} escaped",
                              simulation.getWaveDirector().getCurrentWave(), waveStats.wavesCompleted,
                              waveStats.enemiesSpawned, totals.enemiesKilled, totals.enemiesEscaped));
    GAMELOOP_INFO(std::format("Towers {}, projectiles fired {}, money {}, lives {}",
                              simulation.getTowerManager().getTowerCount(), totals.projectilesFired,
                              session.getEconomy().getBalance(), session.getLives()));

    std::printf("Final score: %lld\n", static_cast<long long>(session.finalScore()));
  } catch (const Bulwark::ConfigurationError& e) {
    GAMELOOP_CRITICAL(std::format("Configuration error: {}", e.what()));
    return 1;
  }

  GAMELOOP_INFO(std::format("{} shutting down", BULWARK_APP_NAME));
  return 0;
}
