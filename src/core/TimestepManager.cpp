/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

namespace Bulwark {

namespace {
constexpr float FPS_EMA_ALPHA = 0.03f;
constexpr float DEFAULT_RATE = 60.0f;
}

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep, float maxFrameDelta)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : DEFAULT_RATE)
    , m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / DEFAULT_RATE)
    , m_maxFrameDelta(maxFrameDelta > 0.0f ? maxFrameDelta : 0.1f)
    , m_frameBegin(Clock::now())
    , m_previousBegin(m_frameBegin)
{
}

void TimestepManager::startFrame() {
    const auto now = Clock::now();

    if (!m_pacingEnabled) {
        // Fast mode grants exactly one step, whatever the wall clock says
        m_previousBegin = m_frameBegin = now;
        m_pendingTime = m_fixedTimestep;
        return;
    }

    if (m_awaitingFirstFrame) {
        m_awaitingFirstFrame = false;
        m_previousBegin = m_frameBegin = now;
        return;
    }

    creditElapsed(now);
}

void TimestepManager::creditElapsed(Clock::time_point now) {
    const std::chrono::duration<double> elapsed = now - m_previousBegin;
    m_previousBegin = m_frameBegin = now;

    const double seconds = elapsed.count();
    m_lastFrameTimeMs = static_cast<uint32_t>(seconds * 1000.0);

    // A stalled process must not replay its whole backlog
    m_pendingTime += std::min(seconds, m_maxFrameDelta);

    smoothFPS(seconds);
}

bool TimestepManager::shouldUpdate() {
    if (m_pendingTime < m_fixedTimestep) {
        return false;
    }
    m_pendingTime -= m_fixedTimestep;
    ++m_totalUpdates;
    return true;
}

void TimestepManager::endFrame() {
    if (m_pacingEnabled) {
        sleepOutFrame();
    }
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps <= 0.0f) {
        return;
    }
    m_targetFPS = fps;
}

void TimestepManager::setFixedTimestep(float timestep) {
    if (timestep <= 0.0f) {
        return;
    }
    m_fixedTimestep = timestep;
}

void TimestepManager::reset() {
    m_pendingTime = 0.0;
    m_currentFPS = 0.0f;
    m_awaitingFirstFrame = true;
    m_previousBegin = m_frameBegin = Clock::now();
}

void TimestepManager::smoothFPS(double frameSeconds) {
    if (frameSeconds <= 0.0) {
        return;
    }
    const float sample = std::clamp(static_cast<float>(1.0 / frameSeconds), 0.1f, 1000.0f);
    m_currentFPS = (m_currentFPS > 0.0f)
        ? m_currentFPS + FPS_EMA_ALPHA * (sample - m_currentFPS)
        : sample;
}

void TimestepManager::sleepOutFrame() const {
    const auto frameBudget = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / m_targetFPS));
    const auto deadline = m_frameBegin + frameBudget;
    const auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - Clock::now());

    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}

} // namespace Bulwark
