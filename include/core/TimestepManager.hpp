/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace Bulwark {

/**
 * TimestepManager drives a simulation at a fixed timestep from wall-clock time.
 *
 * Elapsed frame time feeds an accumulator (clamped so a stalled process does
 * not replay seconds of backlog), and shouldUpdate() hands out fixed steps
 * until the accumulator is drained. With pacing enabled endFrame() sleeps
 * until the target frame time using SDL_DelayPrecise; with pacing disabled
 * every frame yields exactly one step and returns immediately.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Frames per second to pace at (e.g., 60.0f)
     * @param fixedTimestep Simulation step in seconds (e.g., 1.0f/60.0f)
     * @param maxFrameDelta Upper bound on the time credited for one frame
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f,
                             float maxFrameDelta = 0.1f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Returns true if a fixed step should run. May return true several
     * times per frame to catch up.
     */
    bool shouldUpdate();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call this at the end of each frame; sleeps out the rest of the frame
     * when pacing is enabled.
     */
    void endFrame();

    // Fast mode: no sleeping, one step per frame
    void setPacingEnabled(bool enabled) { m_pacingEnabled = enabled; }
    bool isPacingEnabled() const { return m_pacingEnabled; }

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }
    uint64_t getTotalUpdates() const { return m_totalUpdates; }

    void setTargetFPS(float fps);
    void setFixedTimestep(float timestep);

    float getUpdateFrequencyHz() const { return 1.0f / m_fixedTimestep; }

    /**
     * Reset timing state (useful when pausing/unpausing)
     */
    void reset();

private:
    using Clock = std::chrono::steady_clock;

    void creditElapsed(Clock::time_point now);
    void smoothFPS(double frameSeconds);
    void sleepOutFrame() const;

    float m_targetFPS;
    float m_fixedTimestep;
    double m_maxFrameDelta;

    Clock::time_point m_frameBegin;
    Clock::time_point m_previousBegin;

    double m_pendingTime{0.0};
    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};
    uint64_t m_totalUpdates{0};

    bool m_awaitingFirstFrame{true};
    bool m_pacingEnabled{true};
};

} // namespace Bulwark

#endif // TIMESTEP_MANAGER_HPP
