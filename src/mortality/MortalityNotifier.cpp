/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "mortality/MortalityNotifier.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace Ragfall {

const char* toString(MortalityEventType type) {
    switch (type) {
    case MortalityEventType::Death:
        return "Death";
    case MortalityEventType::Respawn:
        return "Respawn";
    default:
        return "Unknown";
    }
}

MortalityNotifier::HandlerToken
MortalityNotifier::registerHandler(MortalityEventType type, Handler handler) {
    const size_t idx = static_cast<size_t>(type);
    if (idx >= m_handlersByType.size() || !handler) {
        MORTALITY_WARN("Ignoring invalid handler registration");
        return HandlerToken{};
    }

    auto& entries = m_handlersByType[idx];
    // Drop entries cleared by removeHandler()
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const HandlerEntry& e) { return !e.callable; }),
                  entries.end());

    const uint64_t id = m_nextHandlerId++;
    entries.push_back(HandlerEntry{std::move(handler), id});
    return HandlerToken{type, id};
}

bool MortalityNotifier::removeHandler(const HandlerToken& token) {
    const size_t idx = static_cast<size_t>(token.type);
    if (!token.isValid() || idx >= m_handlersByType.size()) {
        return false;
    }

    auto& entries = m_handlersByType[idx];
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&token](const HandlerEntry& entry) { return entry.id == token.id; });
    if (it == entries.end()) {
        return false;
    }
    // Compacted on the next registration
    *it = HandlerEntry();
    return true;
}

void MortalityNotifier::removeAllHandlers() {
    for (auto& entries : m_handlersByType) {
        for (auto& entry : entries) {
            entry = HandlerEntry();
        }
    }
}

size_t MortalityNotifier::notify(MortalityEventType type) {
    const size_t idx = static_cast<size_t>(type);
    if (idx >= m_handlersByType.size()) {
        return 0;
    }

    // Snapshot: handlers registered during dispatch wait for the next one
    const std::vector<HandlerEntry> snapshot = m_handlersByType[idx];

    size_t completed = 0;
    for (const auto& entry : snapshot) {
        if (!entry.callable) {
            continue;
        }
        try {
            entry.callable();
            ++completed;
        } catch (const std::exception& e) {
            MORTALITY_ERROR(std::format("{} handler {} threw: {}", toString(type), entry.id,
                                        e.what()));
        } catch (...) {
            MORTALITY_ERROR(std::format("{} handler {} threw an unknown exception", toString(type),
                                        entry.id));
        }
    }
    return completed;
}

size_t MortalityNotifier::getHandlerCount(MortalityEventType type) const {
    const size_t idx = static_cast<size_t>(type);
    if (idx >= m_handlersByType.size()) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(m_handlersByType[idx].begin(),
                                             m_handlersByType[idx].end(),
                                             [](const HandlerEntry& e) {
                                                 return static_cast<bool>(e.callable);
                                             }));
}

} // namespace Ragfall
