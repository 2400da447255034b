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

#ifndef BTP_ADAPTER_MESSAGE_HPP_
#define BTP_ADAPTER_MESSAGE_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "PowerTypes.hpp"

namespace bt_power {

    /** \addtogroup BTPowerAPI
     *
     *  @{
     */

    /**
     * Message consumed by the AdapterState machine.
     *
     * Messages are posted by external callers (user requests, power holds),
     * by the hardware abstraction layer (completion callbacks)
     * and by the AdapterState itself (delayed timeouts).
     */
    class AdapterMessage {
        public:
            enum class Opcode : uint16_t {
                INVALID                 = 0x0000,
                /** User request to turn on the adapter. */
                USER_TURN_ON            = 1,
                /** Hardware process came up. */
                STARTED                 = 2,
                /** Hardware reports full bring-up. */
                ENABLED_READY           = 3,
                /** Power hold acquired, see VendorEventRegistry. */
                POWER_ON                = 4,
                /** User request to turn off the adapter. */
                USER_TURN_OFF           = 20,
                /** Disable preparation (scan mode cleared) has been completed. */
                BEGIN_DISABLE           = 21,
                /** Power hold released, see VendorEventRegistry. */
                POWER_OFF               = 23,
                /** Hardware confirms the radio is down. */
                DISABLED                = 24,
                /** All dependent profile services have been stopped. */
                STOPPED                 = 25,
                START_TIMEOUT           = 100,
                ENABLE_TIMEOUT          = 101,
                DISABLE_TIMEOUT         = 103,
                STOP_TIMEOUT            = 104,
                SET_SCAN_MODE_TIMEOUT   = 105
            };
            static constexpr uint16_t number(const Opcode rhs) noexcept {
                return static_cast<uint16_t>(rhs);
            }
            static std::string getOpcodeString(const Opcode opc) noexcept;

            /**
             * Returns true if the given Opcode denotes one of the timeout messages,
             * i.e. a message only being posted delayed by the AdapterState itself.
             */
            static constexpr bool isTimeout(const Opcode opc) noexcept {
                return number(opc) >= number(Opcode::START_TIMEOUT);
            }

        private:
            Opcode opcode;
            uint64_t ts_creation;

        public:
            AdapterMessage() noexcept
            : opcode(Opcode::INVALID), ts_creation(0) {}

            AdapterMessage(const Opcode opc) noexcept
            : opcode(opc), ts_creation(jau::getCurrentMilliseconds()) {}

            AdapterMessage(const AdapterMessage &o) noexcept = default;
            AdapterMessage(AdapterMessage &&o) noexcept = default;
            AdapterMessage& operator=(const AdapterMessage &o) noexcept = default;
            AdapterMessage& operator=(AdapterMessage &&o) noexcept = default;

            Opcode getOpcode() const noexcept { return opcode; }

            /** Returns the creation timestamp in monotonic milliseconds. */
            uint64_t getTimestamp() const noexcept { return ts_creation; }

            bool isValid() const noexcept { return Opcode::INVALID != opcode; }

            bool operator==(const Opcode rhs) const noexcept { return opcode == rhs; }
            bool operator!=(const Opcode rhs) const noexcept { return opcode != rhs; }

            std::string toString() const noexcept;
    };

    inline std::string to_string(const AdapterMessage::Opcode opc) noexcept {
        return AdapterMessage::getOpcodeString(opc);
    }

    /**@}*/

} // namespace bt_power

#endif /* BTP_ADAPTER_MESSAGE_HPP_ */
