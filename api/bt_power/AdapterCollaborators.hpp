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

#ifndef BTP_ADAPTER_COLLABORATORS_HPP_
#define BTP_ADAPTER_COLLABORATORS_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "PowerTypes.hpp"

namespace bt_power {

    /** \addtogroup BTPowerAPI
     *
     *  @{
     */

    /**
     * Hardware abstraction layer used by AdapterState.
     *
     * Calls shall not block on hardware responses.
     * Completion is reported back by posting the corresponding AdapterMessage,
     * i.e. AdapterMessage::Opcode::STARTED after processStart()
     * or via AdapterState::stateChangeCallback() after enableNative() and disableNative().
     */
    class PowerHAL {
        public:
            virtual ~PowerHAL() noexcept {}

            /** Initiates start of the hardware process, completed by AdapterMessage::Opcode::STARTED. */
            virtual void processStart() = 0;

            /**
             * Initiates radio bring-up, completed by HALState::ON.
             * @return true if initiated, otherwise false
             */
            virtual bool enableNative() = 0;

            /**
             * Initiates radio shutdown, completed by HALState::OFF.
             * @return true if initiated, otherwise false
             */
            virtual bool disableNative() = 0;

            /** Enables or disables reception of vendor specific events, best effort. */
            virtual bool setVendorEventsEnabled(const bool enable) = 0;

            /** Forced stop and cleanup of the hardware process after an unrecoverable disable timeout. */
            virtual void forceCleanup() = 0;

            virtual std::string toString() const { return "PowerHAL["+jau::to_hexstring(this)+"]"; }
    };

    /**
     * Adapter properties owner, holding the user visible AdapterLifecycleState.
     */
    class AdapterProperties {
        public:
            virtual ~AdapterProperties() noexcept {}

            virtual AdapterLifecycleState getState() const = 0;

            virtual void setState(const AdapterLifecycleState s) = 0;

            /** Radio has been promoted to the user visible ON state. */
            virtual void onBluetoothReady() = 0;

            /** Begin of the disable preparation, i.e. clearing the scan mode, completed by AdapterMessage::Opcode::BEGIN_DISABLE. */
            virtual void onBluetoothDisable() = 0;

            virtual std::string toString() const { return "AdapterProperties["+jau::to_hexstring(this)+"]"; }
    };

    /**
     * Owning adapter service.
     */
    class AdapterService {
        public:
            virtual ~AdapterService() noexcept {}

            /** Reports each entered AdapterSubState. */
            virtual void updateStateMachineState(const AdapterSubState s) = 0;

            /** User visible AdapterLifecycleState broadcast. */
            virtual void updateAdapterState(const AdapterLifecycleState oldState, const AdapterLifecycleState newState) = 0;

            /** Reconnect previously bonded devices. */
            virtual void autoConnect() = 0;

            /**
             * Stops all dependent profile services.
             * @return true if at least one profile service is still stopping,
             *         completed by AdapterMessage::Opcode::STOPPED. Otherwise false if none were running.
             */
            virtual bool stopProfileServices() = 0;

            /** Returns true if a power hold is active, see VendorEventRegistry::areLocksHeld(). */
            virtual bool isPowerLockHeld() = 0;

            virtual std::string toString() const { return "AdapterService["+jau::to_hexstring(this)+"]"; }
    };

    /**
     * Immutable collaborator set of one AdapterState.
     *
     * Held by AdapterState as a revocable handle, see AdapterState::cleanup().
     */
    struct AdapterCollaborators {
        std::shared_ptr<PowerHAL> hal;
        std::shared_ptr<AdapterProperties> properties;
        std::shared_ptr<AdapterService> service;

        bool isComplete() const noexcept {
            return nullptr != hal && nullptr != properties && nullptr != service;
        }
    };

    /**@}*/

} // namespace bt_power

#endif /* BTP_ADAPTER_COLLABORATORS_HPP_ */
