/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#include "core/Simulation.hpp"
#include "core/SimulationConfig.hpp"
#include "managers/EconomyManager.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include <cstdint>
#include <memory>
#include <optional>

namespace Bulwark {

enum class SessionState : uint8_t {
    Running = 0,
    Paused,
    GameOver, // lives ran out
    Victory   // every configured wave cleared
};

const char* toString(SessionState state);

/**
 * @brief Player-side state wrapped around a Simulation
 *
 * Applies each FrameSummary to the lives and score: score grows by the
 * bounty earned, every escaped enemy costs one life. The best score survives
 * restart().
 *
 * update() contains failures: an exception thrown by a tick is logged and the
 * session keeps running.
 */
class GameSession {
public:
    GameSession(EntityConfigRegistry registry, SimulationConfig config);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * @brief Runs one simulation step while the session is running
     * @return The step's summary, or nullopt if nothing ran (paused, over, or the tick failed)
     */
    std::optional<FrameSummary> update(float deltaTime);

    void pause();
    void resume();

    // Fresh simulation, economy, lives and score
    void restart();

    bool isOver() const { return m_state == SessionState::GameOver || m_state == SessionState::Victory; }
    SessionState getState() const { return m_state; }

    int getLives() const { return m_lives; }
    int64_t getScore() const { return m_score; }
    int64_t getBestScore() const { return m_bestScore; }
    int64_t finalScore() const { return m_score; }
    uint32_t getFailedTicks() const { return m_failedTicks; }

    Simulation& getSimulation() { return *m_simulation; }
    const Simulation& getSimulation() const { return *m_simulation; }
    EconomyManager& getEconomy() { return m_economy; }
    const EconomyManager& getEconomy() const { return m_economy; }
    const EntityConfigRegistry& getRegistry() const { return m_registry; }
    const SimulationConfig& getConfig() const { return m_config; }

private:
    void applySummary(const FrameSummary& summary);
    void finish(SessionState state);

    EntityConfigRegistry m_registry;
    SimulationConfig m_config;
    EconomyManager m_economy;
    std::unique_ptr<Simulation> m_simulation;

    SessionState m_state{SessionState::Running};
    int m_lives{0};
    int64_t m_score{0};
    int64_t m_bestScore{0};
    uint32_t m_failedTicks{0};
};

} // namespace Bulwark

#endif // GAME_SESSION_HPP
