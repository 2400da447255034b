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

#ifndef BTP_ADAPTER_STATE_HPP_
#define BTP_ADAPTER_STATE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <atomic>

#include <jau/environment.hpp>
#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/functional.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/fraction_type.hpp>
#include <jau/service_runner.hpp>

#include "PowerConst.hpp"
#include "PowerTypes.hpp"
#include "AdapterMessage.hpp"
#include "MessageQueue.hpp"
#include "AdapterCollaborators.hpp"

namespace bt_power {

    /** \addtogroup BTPowerAPI
     *
     *  @{
     */

    class AdapterState; // forward

    /**
     * AdapterState Singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class AdapterStateEnv : public jau::root_environment {
        friend class AdapterState;

        private:
            AdapterStateEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to triggers environment initialization. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Timeout for the hardware process start, defaults to 5s.
             * <p>
             * Environment variable is 'bt_power.adapter.start.timeout'.
             * </p>
             */
            const jau::fraction_i64 START_TIMEOUT;

            /**
             * Timeout for the radio bring-up, defaults to 8s.
             * <p>
             * Environment variable is 'bt_power.adapter.enable.timeout'.
             * </p>
             */
            const jau::fraction_i64 ENABLE_TIMEOUT;

            /**
             * Timeout for the radio shutdown, defaults to 8s.
             * <p>
             * Environment variable is 'bt_power.adapter.disable.timeout'.
             * </p>
             */
            const jau::fraction_i64 DISABLE_TIMEOUT;

            /**
             * Timeout for stopping all dependent profile services, defaults to 5s.
             * <p>
             * Environment variable is 'bt_power.adapter.stop.timeout'.
             * </p>
             */
            const jau::fraction_i64 STOP_TIMEOUT;

            /**
             * Timeout for clearing the scan mode before disabling, defaults to 2s.
             * <p>
             * Environment variable is 'bt_power.adapter.scanmode.timeout'.
             * </p>
             */
            const jau::fraction_i64 SCAN_MODE_TIMEOUT;

            /**
             * Poll timeout for the message worker thread, defaults to 1s.
             * <p>
             * Environment variable is 'bt_power.adapter.worker.poll'.
             * </p>
             */
            const jau::fraction_i64 WORKER_POLL_TIMEOUT;

            /**
             * Debug all processed AdapterMessage with their ProcessResult
             * <p>
             * Environment variable is 'bt_power.debug.adapter.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static AdapterStateEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static AdapterStateEnv e;
                return e;
            }
    };

    /**
     * Timeout set of one AdapterState instance.
     *
     * Default constructed values are taken from AdapterStateEnv.
     */
    struct AdapterTimeouts {
        jau::fraction_i64 start;
        jau::fraction_i64 enable;
        jau::fraction_i64 disable;
        jau::fraction_i64 stop;
        jau::fraction_i64 scan_mode;

        AdapterTimeouts() noexcept;

        AdapterTimeouts(const jau::fraction_i64& start_, const jau::fraction_i64& enable_, const jau::fraction_i64& disable_,
                        const jau::fraction_i64& stop_, const jau::fraction_i64& scan_mode_) noexcept
        : start(start_), enable(enable_), disable(disable_), stop(stop_), scan_mode(scan_mode_) {}

        std::string toString() const noexcept;
    };

    /** Invoked on each entered AdapterSubState, by the worker thread. */
    typedef jau::function<void(AdapterSubState)> AdapterSubStateCallback;
    typedef jau::cow_darray<AdapterSubStateCallback> AdapterSubStateCallbackList;

    /** Invoked after each processed AdapterMessage with the state it has been processed in and its ProcessResult, by the worker thread. */
    typedef jau::function<void(const AdapterMessage&, AdapterSubState, ProcessResult)> ProcessedMessageCallback;
    typedef jau::cow_darray<ProcessedMessageCallback> ProcessedMessageCallbackList;

    /**
     * Invoked once after an unrecoverable AdapterMessage, i.e. ProcessResult::FATAL, by the worker thread.
     *
     * The hosting process shall be terminated and restarted by its supervisor.
     */
    typedef jau::function<void(const AdapterMessage&)> FatalErrorCallback;

    /**
     * Adapter power state machine.
     *
     * Drives the radio through AdapterSubState OFF, PENDING, POWERED and ON,
     * processing one AdapterMessage at a time on its own worker thread.
     *
     * A transition requested while processing a message is applied after the handler returns,
     * exiting PENDING clears the user-operation flag before the destination state is entered.
     * Messages deferred while in PENDING are re-posted at the head of the queue once PENDING is left.
     *
     * A handler interrupted by a collaborator exception is classified ProcessResult::REJECTED and rolled back:
     * its requested transition is dropped, the turning and user-operation flags, deferred messages
     * and armed timeouts are restored, and a changed AdapterLifecycleState is re-announced.
     * A timeout the handler had cancelled is re-armed with its full delay.
     *
     * Only ProcessResult::FATAL messages, i.e. AdapterMessage::Opcode::STOP_TIMEOUT and
     * AdapterMessage::Opcode::DISABLE_TIMEOUT in PENDING, stop the worker and invoke the FatalErrorCallback.
     */
    class AdapterState {
        private:
            const AdapterStateEnv & env;
            const AdapterTimeouts timeouts;

            mutable std::mutex mtx_collaborators;
            std::shared_ptr<const AdapterCollaborators> collaborators;

            MessageQueue queue;
            jau::service_runner worker_service;
            std::mutex mtx_lifecycle;
            bool started;

            std::atomic<AdapterSubState> currentState;
            /** Destination state of the current handler, applied after it returns. */
            AdapterSubState destState;
            bool transitionRequested;
            /** Messages deferred in PENDING, only accessed by the worker. */
            jau::darray<AdapterMessage> deferred;

            jau::sc_atomic_bool turningOn;
            jau::sc_atomic_bool turningOff;
            jau::sc_atomic_bool userOperation;

            /** Held during a sub-state broadcast and by removeSubStateListener(). */
            std::recursive_mutex mtx_subStateCallbacks;
            AdapterSubStateCallbackList subStateCallbackList;
            ProcessedMessageCallbackList processedMessageCallbackList;
            std::mutex mtx_fatalCallback;
            FatalErrorCallback fatalErrorCallback;

            /** Worker state before a handler ran, restored if the handler throws. */
            struct HandlerSnapshot {
                bool turningOn;
                bool turningOff;
                bool userOperation;
                jau::nsize_t deferredCount;
                bool timeoutArmed[5];
                bool hasLifecycleState;
                AdapterLifecycleState lifecycleState;
            };
            static const AdapterMessage::Opcode timeoutOpcodes[5];

            std::shared_ptr<const AdapterCollaborators> getCollaborators() const noexcept;

            void workerWork(jau::service_runner& sr) noexcept;
            void workerEndLocked(jau::service_runner& sr) noexcept;

            void dispatchMessage(const AdapterMessage& msg, jau::service_runner* sr) noexcept;

            HandlerSnapshot takeSnapshot(const AdapterCollaborators& c) noexcept;
            void rollback(const HandlerSnapshot& snap, const AdapterCollaborators& c) noexcept;
            const jau::fraction_i64& getTimeout(const AdapterMessage::Opcode opc) const noexcept;

            ProcessResult processOff(const AdapterMessage& msg, const AdapterCollaborators& c);
            ProcessResult processPending(const AdapterMessage& msg, const AdapterCollaborators& c);
            ProcessResult processOn(const AdapterMessage& msg, const AdapterCollaborators& c);
            ProcessResult processPowered(const AdapterMessage& msg, const AdapterCollaborators& c);

            /** Shared by AdapterMessage::Opcode::USER_TURN_ON and AdapterMessage::Opcode::POWER_ON in OFF. */
            ProcessResult beginTurnOn(const AdapterCollaborators& c);
            /** Shared by AdapterMessage::Opcode::SET_SCAN_MODE_TIMEOUT and AdapterMessage::Opcode::BEGIN_DISABLE in PENDING. */
            ProcessResult beginDisable(const AdapterCollaborators& c);
            /** Shared by AdapterMessage::Opcode::DISABLED without running profile services and AdapterMessage::Opcode::STOPPED in PENDING. */
            ProcessResult completeStop(const AdapterCollaborators& c);
            /** Shared by AdapterMessage::Opcode::START_TIMEOUT and AdapterMessage::Opcode::ENABLE_TIMEOUT in PENDING. */
            ProcessResult enableFailed(const AdapterCollaborators& c, const AdapterMessage& msg);

            void transitionTo(const AdapterSubState s) noexcept;
            void performTransition(const AdapterCollaborators* c) noexcept;
            void enterState(const AdapterSubState s, const AdapterCollaborators* c) noexcept;
            void deferMessage(const AdapterMessage& msg) noexcept;

            void notifyAdapterStateChange(const AdapterCollaborators& c, const AdapterLifecycleState newState) noexcept;
            void setVendorEvents(const AdapterCollaborators& c, const bool enable);

            ProcessResult unexpectedMessage(const AdapterMessage& msg) noexcept;

            void sendSubStateChanged(const AdapterSubState s) noexcept;
            void sendMessageProcessed(const AdapterMessage& msg, const AdapterSubState s, const ProcessResult res) noexcept;
            void sendFatalError(const AdapterMessage& msg) noexcept;

        public:
            /**
             * Constructs an AdapterState in OFF, not yet started.
             *
             * @param hal hardware abstraction layer
             * @param properties adapter properties owner
             * @param service owning adapter service
             * @param timeouts timeout set, defaults to AdapterStateEnv values
             * @throws PowerException if one collaborator is nullptr
             */
            AdapterState(std::shared_ptr<PowerHAL> hal, std::shared_ptr<AdapterProperties> properties,
                         std::shared_ptr<AdapterService> service,
                         const AdapterTimeouts& timeouts=AdapterTimeouts());

            AdapterState(const AdapterState&) = delete;
            void operator=(const AdapterState&) = delete;

            /**
             * Stops the worker via quit().
             */
            ~AdapterState() noexcept;

            /**
             * Enters the initial OFF state on the calling thread and starts the worker.
             *
             * @throws PowerException if already started
             */
            void start();

            /**
             * Stops the worker and discards all pending messages.
             *
             * Messages sent afterwards are queued but never processed.
             */
            void quit() noexcept;

            /**
             * Revokes all collaborators.
             *
             * All messages processed afterwards are logged and classified ProcessResult::SHUTDOWN.
             */
            void cleanup() noexcept;

            /** Returns true if started and not yet quit. */
            bool isRunning() const noexcept;

            void sendMessage(const AdapterMessage::Opcode opc) noexcept;
            void sendMessageDelayed(const AdapterMessage::Opcode opc, const jau::fraction_i64& delay) noexcept;
            bool hasMessages(const AdapterMessage::Opcode opc) const noexcept;
            void removeMessages(const AdapterMessage::Opcode opc) noexcept;

            /**
             * Hardware status entry point.
             *
             * HALState::OFF posts AdapterMessage::Opcode::DISABLED,
             * HALState::ON posts AdapterMessage::Opcode::ENABLED_READY.
             */
            void stateChangeCallback(const HALState status) noexcept;

            bool isTurningOn() const noexcept { return turningOn; }
            bool isTurningOff() const noexcept { return turningOff; }
            bool isUserOperation() const noexcept { return userOperation; }

            AdapterSubState getCurrentState() const noexcept { return currentState.load(); }

            const AdapterTimeouts& getTimeouts() const noexcept { return timeouts; }

            /**
             * Adds the given AdapterSubStateCallback, invoked on each entered state.
             * @return true if added, false if already present
             */
            bool addSubStateListener(const AdapterSubStateCallback& cb) noexcept;

            /**
             * Removes the given AdapterSubStateCallback.
             *
             * Blocks while a sub-state broadcast is in progress on another thread,
             * hence the removed callback is no more invoked once this method returns.
             * @return true if removed, false if not present
             */
            bool removeSubStateListener(const AdapterSubStateCallback& cb) noexcept;

            void addProcessedMessageListener(const ProcessedMessageCallback& cb) noexcept;
            void clearProcessedMessageListener() noexcept;

            /**
             * Replaces the FatalErrorCallback, defaults to an ABORT terminating the process.
             */
            void setFatalErrorCallback(const FatalErrorCallback& cb) noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace bt_power

#endif /* BTP_ADAPTER_STATE_HPP_ */
