/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace Ragfall {

/**
 * TimestepManager drives the simulation with a fixed update step.
 *
 * Each frame adds the measured wall time to an accumulator (clamped so a
 * stall cannot trigger an update storm) and shouldUpdate() drains it one
 * fixed step at a time. In paced mode every frame runs exactly one step and
 * endFrame() sleeps out the rest of the frame with SDL_DelayPrecise, which
 * keeps scheduled gameplay timers deterministic in headless runs.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS Frames per second used for pacing
     * @param fixedTimestep Seconds advanced by each update
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f / 60.0f);

    /**
     * Call at the start of each frame
     */
    void startFrame();

    /**
     * @return true while another fixed step is owed for this frame
     */
    bool shouldUpdate();

    /**
     * Fixed step in seconds, identical for every update
     */
    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call at the end of each frame. Sleeps when pacing is enabled.
     */
    void endFrame();

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    /**
     * Total simulated seconds across all updates since the last reset
     */
    double getSimulationTime() const { return static_cast<double>(m_updateCount) * m_fixedTimestep; }
    uint64_t getUpdateCount() const { return m_updateCount; }

    void setTargetFPS(float fps);
    void setFixedTimestep(float timestep);

    /**
     * Paced mode forces one update per frame and sleeps to the target FPS
     */
    void setPaced(bool paced) { m_paced = paced; }
    bool isPaced() const { return m_paced; }

    void reset();

private:
    using Clock = std::chrono::steady_clock;

    void updateFPS(double deltaSeconds);
    void limitFrameRate() const;

    float m_targetFPS;
    float m_fixedTimestep;
    float m_targetFrameTime;

    Clock::time_point m_frameStart;
    Clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    static constexpr double MAX_FRAME_DELTA = 0.25;

    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};
    static constexpr float FPS_SMOOTHING = 0.05f;

    uint64_t m_updateCount{0};
    bool m_firstFrame{true};
    bool m_paced{true};
};

} // namespace Ragfall

#endif // TIMESTEP_MANAGER_HPP
