/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Bulwark {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Running: return "Running";
        case SessionState::Paused: return "Paused";
        case SessionState::GameOver: return "GameOver";
        case SessionState::Victory: return "Victory";
    }
    return "Unknown";
}

GameSession::GameSession(EntityConfigRegistry registry, SimulationConfig config)
    : m_registry(std::move(registry))
    , m_config(std::move(config))
    , m_economy(m_config.startingMoney) {
    m_config.validate();
    m_registry.validate();
    restart();
}

std::optional<FrameSummary> GameSession::update(float deltaTime) {
    if (m_state != SessionState::Running) {
        return std::nullopt;
    }

    try {
        FrameSummary summary = m_simulation->step(deltaTime);
        applySummary(summary);
        return summary;
    } catch (const std::exception& e) {
        ++m_failedTicks;
        SESSION_ERROR(std::format("GameSession::update - tick failed, continuing: {}", e.what()));
        return std::nullopt;
    }
}

void GameSession::applySummary(const FrameSummary& summary) {
    m_score += summary.bountyEarned;

    if (summary.waveCompleted) {
        SESSION_INFO(std::format("Wave {} cleared: +{} money, {} lives left, score {}",
                                 summary.completedWave, summary.waveReward, m_lives, m_score));
    }

    if (summary.livesLost > 0) {
        m_lives = std::max(0, m_lives - summary.livesLost);
        SESSION_DEBUG(std::format("Lost {} lives, {} remaining", summary.livesLost, m_lives));
    }

    if (m_lives == 0) {
        finish(SessionState::GameOver);
    } else if (summary.allWavesComplete) {
        finish(SessionState::Victory);
    }
}

void GameSession::finish(SessionState state) {
    m_state = state;
    m_bestScore = std::max(m_bestScore, m_score);
    SESSION_INFO(std::format("Session ended ({}) on wave {} with score {} (best {})", toString(state),
                             m_simulation->getWaveDirector().getCurrentWave(), m_score, m_bestScore));
}

void GameSession::pause() {
    if (m_state == SessionState::Running) {
        m_state = SessionState::Paused;
    }
}

void GameSession::resume() {
    if (m_state == SessionState::Paused) {
        m_state = SessionState::Running;
    }
}

void GameSession::restart() {
    m_bestScore = std::max(m_bestScore, m_score);

    // Destroy the old simulation before its economy is reset
    m_simulation.reset();
    m_economy.reset(m_config.startingMoney);
    m_lives = m_config.startingLives;
    m_score = 0;
    m_failedTicks = 0;
    m_simulation = std::make_unique<Simulation>(m_registry, m_config, m_economy);
    m_state = SessionState::Running;

    SESSION_INFO(std::format("Session started: {} money, {} lives", m_economy.getBalance(), m_lives));
}

} // namespace Bulwark
