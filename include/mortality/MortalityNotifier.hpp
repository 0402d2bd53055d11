/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MORTALITY_NOTIFIER_HPP
#define MORTALITY_NOTIFIER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace Ragfall {

enum class MortalityEventType : uint8_t {
    Death = 0,
    Respawn = 1,
    COUNT = 2
};

const char* toString(MortalityEventType type);

/**
 * @brief Ordered, synchronous fan-out of death and respawn notifications.
 *
 * Handlers run in registration order on the caller's stack. A handler that
 * throws is logged and skipped; the remaining handlers still run. Handlers
 * may register or remove handlers while a notification is in flight; the
 * change takes effect from the next notification.
 */
class MortalityNotifier {
public:
    using Handler = std::function<void()>;

    struct HandlerToken {
        MortalityEventType type{MortalityEventType::Death};
        uint64_t id{0};

        bool isValid() const { return id != 0; }
    };

    HandlerToken registerHandler(MortalityEventType type, Handler handler);
    bool removeHandler(const HandlerToken& token);
    void removeAllHandlers();

    /**
     * @brief Invokes every handler of the given type
     * @return Number of handlers that completed without throwing
     */
    size_t notify(MortalityEventType type);

    size_t getHandlerCount(MortalityEventType type) const;

private:
    struct HandlerEntry {
        Handler callable;
        uint64_t id{0};
    };

    std::array<std::vector<HandlerEntry>, static_cast<size_t>(MortalityEventType::COUNT)>
        m_handlersByType{};
    uint64_t m_nextHandlerId{1};
};

} // namespace Ragfall

#endif // MORTALITY_NOTIFIER_HPP
