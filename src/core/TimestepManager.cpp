/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <format>

namespace Ragfall {

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / 60.0f)
    , m_targetFrameTime(1.0f / m_targetFPS)
{
    const auto now = Clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
    TIMESTEP_DEBUG(std::format("Fixed step {:.4f}s at {:.1f} FPS", m_fixedTimestep, m_targetFPS));
}

void TimestepManager::startFrame() {
    const auto now = Clock::now();
    m_frameStart = now;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = now;
        // Owe one step so the first frame is not empty
        m_accumulator = m_fixedTimestep;
        return;
    }

    const double deltaSeconds = std::chrono::duration<double>(now - m_lastFrameTime).count();
    m_lastFrameTime = now;
    m_lastFrameTimeMs = static_cast<uint32_t>(deltaSeconds * 1000.0);
    updateFPS(deltaSeconds);

    if (m_paced) {
        m_accumulator = m_fixedTimestep;
    } else {
        m_accumulator += std::min(deltaSeconds, MAX_FRAME_DELTA);
    }
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        ++m_updateCount;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() {
    limitFrameRate();
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps <= 0.0f) {
        TIMESTEP_WARN(std::format("Ignoring non-positive target FPS {}", fps));
        return;
    }
    m_targetFPS = fps;
    m_targetFrameTime = 1.0f / fps;
}

void TimestepManager::setFixedTimestep(float timestep) {
    if (timestep <= 0.0f) {
        TIMESTEP_WARN(std::format("Ignoring non-positive timestep {}", timestep));
        return;
    }
    m_fixedTimestep = timestep;
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_updateCount = 0;
    m_currentFPS = 0.0f;
    m_lastFrameTimeMs = 0;
    m_firstFrame = true;

    const auto now = Clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::updateFPS(double deltaSeconds) {
    if (deltaSeconds <= 0.0) {
        return;
    }
    const float instantFPS = std::clamp(static_cast<float>(1.0 / deltaSeconds), 0.1f, 1000.0f);
    m_currentFPS = m_currentFPS <= 0.0f
        ? instantFPS
        : FPS_SMOOTHING * instantFPS + (1.0f - FPS_SMOOTHING) * m_currentFPS;
}

void TimestepManager::limitFrameRate() const {
    if (!m_paced) {
        return;
    }

    const auto targetEnd = m_frameStart + std::chrono::nanoseconds(
        static_cast<int64_t>(static_cast<double>(m_targetFrameTime) * 1e9));
    const auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEnd - Clock::now());
    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}

} // namespace Ragfall
