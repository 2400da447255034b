/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef BTP_TYPES_HPP_
#define BTP_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/basic_types.hpp>

namespace bt_power {

    /** \addtogroup BTPowerAPI
     *
     *  @{
     */

    class PowerException : public jau::RuntimeException {
        public:
        PowerException(std::string const m, const char* file, int line) noexcept
        : RuntimeException("PowerException", m, file, line) {}

        PowerException(const char *m, const char* file, int line) noexcept
        : RuntimeException("PowerException", m, file, line) {}
    };

    /**
     * Internal state of the AdapterState machine.
     *
     * Reported to the AdapterService and all sub-state listeners on each state entry.
     */
    enum class AdapterSubState : uint16_t {
        /** A power transition is in flight, see AdapterState::isTurningOn() and AdapterState::isTurningOff(). */
        PENDING     = 200,
        /** Radio is down. Initial state. */
        OFF         = 201,
        /** Radio is up due to a power hold only, not promoted to the user visible AdapterLifecycleState::ON. */
        POWERED     = 202,
        /** Radio is fully operational and user visible. */
        ON          = 203
    };
    constexpr uint16_t number(const AdapterSubState rhs) noexcept {
        return static_cast<uint16_t>(rhs);
    }
    std::string to_string(const AdapterSubState v) noexcept;

    /**
     * Returns true if the given AdapterSubState implies a powered radio,
     * i.e. AdapterSubState::POWERED or AdapterSubState::ON.
     */
    constexpr bool isPowered(const AdapterSubState v) noexcept {
        return AdapterSubState::POWERED == v || AdapterSubState::ON == v;
    }

    /**
     * User visible adapter state, broadcast via AdapterService::updateAdapterState().
     */
    enum class AdapterLifecycleState : uint8_t {
        OFF         = 10,
        TURNING_ON  = 11,
        ON          = 12,
        TURNING_OFF = 13
    };
    constexpr uint8_t number(const AdapterLifecycleState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const AdapterLifecycleState v) noexcept;

    /**
     * Radio state as reported by the hardware abstraction layer,
     * see AdapterState::stateChangeCallback().
     */
    enum class HALState : uint8_t {
        OFF         = 0,
        ON          = 1
    };
    constexpr uint8_t number(const HALState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const HALState v) noexcept;

    /**
     * Classification of one processed AdapterMessage.
     *
     * Each message processed by AdapterState results in exactly one of these outcomes.
     */
    enum class ProcessResult : uint8_t {
        /** Message caused a transition and/or side effects. */
        HANDLED     = 0,
        /** Message is a duplicate or a no-op in the current state. */
        IGNORED     = 1,
        /** Message has been deferred until the pending transition completes. */
        DEFERRED    = 2,
        /** Message is not expected in the current state. */
        REJECTED    = 3,
        /** Unrecoverable, the hosting process shall be terminated. See AdapterState::setFatalErrorCallback(). */
        FATAL       = 4,
        /** Collaborators have been released via AdapterState::cleanup(), message dropped. */
        SHUTDOWN    = 5
    };
    constexpr uint8_t number(const ProcessResult rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ProcessResult v) noexcept;

    /**@}*/

} // namespace bt_power

#endif /* BTP_TYPES_HPP_ */
