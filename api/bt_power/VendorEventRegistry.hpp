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

#ifndef BTP_VENDOR_EVENT_REGISTRY_HPP_
#define BTP_VENDOR_EVENT_REGISTRY_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <condition_variable>

#include <jau/environment.hpp>
#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/functional.hpp>
#include <jau/service_runner.hpp>

#include "PowerConst.hpp"
#include "PowerTypes.hpp"
#include "AdapterState.hpp"

namespace bt_power {

    /** \addtogroup BTPowerAPI
     *
     *  @{
     */

    class VendorEventRegistry; // forward

    /**
     * VendorEventRegistry Singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class VendorEventEnv : public jau::root_environment {
        friend class VendorEventRegistry;

        private:
            VendorEventEnv() noexcept; // NOLINT(modernize-use-equals-delete)

            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Debug all vendor event, command complete and interface state fan-out
             * <p>
             * Environment variable is 'bt_power.debug.vendor.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static VendorEventEnv& get() noexcept {
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
                static VendorEventEnv e;
                return e;
            }
    };

    /** Opaque vendor specific payload bytes. */
    typedef jau::darray<uint8_t> vendor_payload_t;

    /**
     * Vendor event listener, held by VendorEventRegistry as a subscription.
     * <p>
     * Any registered listener keeps the radio powered, see VendorEventRegistry::areLocksHeld().
     * </p>
     * <p>
     * User implementations shall return as early as possible to avoid blocking the notifying thread.
     * </p>
     * <p>
     * The listener receiver maintains a unique set of listener instances without duplicates.
     * </p>
     */
    class VendorEventListener {
        public:
            /**
             * Radio is up, i.e. AdapterSubState::POWERED or AdapterSubState::ON.
             */
            virtual void interfaceReady() { }

            /**
             * Radio is down after having been up.
             * <p>
             * Terminal notification, the listener has been unregistered.
             * </p>
             */
            virtual void interfaceDown() { }

            /**
             * Vendor specific event matching this listener's filter.
             * @param payload the event payload
             */
            virtual void vendorEventReceived(const vendor_payload_t& payload) {
                (void)payload;
            }

            /**
             * Vendor specific command has been completed, delivered unfiltered.
             * @param opcode the vendor command opcode
             * @param payload the completion parameter
             */
            virtual void vendorCommandCompleteReceived(const uint16_t opcode, const vendor_payload_t& payload) {
                (void)opcode;
                (void)payload;
            }

            virtual ~VendorEventListener() noexcept {}

            virtual std::string toString() const { return "VendorEventListener["+jau::to_hexstring(this)+"]"; }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const VendorEventListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const VendorEventListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<VendorEventListener> VendorEventListenerRef;

    /**
     * Vendor event subscriber registry, power hold accounting and interface state fan-out.
     * <p>
     * Registered VendorEventListener are notified about AdapterSubState changes mapped to
     * VendorEventListener::interfaceReady() (POWERED and ON) and VendorEventListener::interfaceDown() (OFF).
     * PENDING is not notified.
     * </p>
     * <p>
     * The registered listener set transitioning from empty to non-empty posts AdapterMessage::Opcode::POWER_ON,
     * vice versa AdapterMessage::Opcode::POWER_OFF to the AdapterState.
     * </p>
     * <p>
     * All methods are thread safe.
     * </p>
     */
    class VendorEventRegistry {
        private:
            struct Subscription {
                const VendorEventListenerRef listener;
                std::recursive_mutex mtx_sub;
                /** A state broadcast reached this subscription */
                bool updated;
                /** This subscription has been notified about a mapped state */
                bool hasSeenStableState;
                /** Unregistered, no further notifications */
                bool removed;
                bool hasFilter;
                vendor_payload_t filterMask;
                /** Pre-masked, same length as filterMask */
                vendor_payload_t filterValue;

                Subscription(const VendorEventListenerRef& l) noexcept
                : listener(l), updated(false), hasSeenStableState(false), removed(false), hasFilter(false) {}

                std::string toString() const noexcept;
            };
            typedef std::shared_ptr<Subscription> SubscriptionRef;
            typedef jau::cow_darray<SubscriptionRef> SubscriptionList;

            const VendorEventEnv & env;
            AdapterState & adapterState;
            const AdapterSubStateCallback stateCallback;

            /** Serializes state broadcasts against registration's state check. Lock order: mtx_state, mtx_registry. */
            std::recursive_mutex mtx_state;
            /** Last AdapterSubState reported, including PENDING */
            AdapterSubState lastState;
            /** Last broadcast mapped state, true for up */
            bool previousUp;

            /** Serializes membership changes and power hold accounting, never held while waiting for Subscription::mtx_sub. */
            std::mutex mtx_registry;
            SubscriptionList subscriptions;

            /** Pending initial ready deliveries, served one at a time by ready_service. */
            std::mutex mtx_readyQueue;
            std::condition_variable cv_readyQueue;
            jau::darray<SubscriptionRef> readyQueue;
            jau::service_runner ready_service;

            void readyWork(jau::service_runner& sr) noexcept;
            void readyEndLocked(jau::service_runner& sr) noexcept;

            static void applyFilter(Subscription& sub, const vendor_payload_t& mask, const vendor_payload_t& value) noexcept;
            static bool matchFilter(const Subscription& sub, const vendor_payload_t& payload) noexcept;
            static void sendInitialReady(SubscriptionRef sub) noexcept;

            SubscriptionRef findSubscription(const VendorEventListener& l) noexcept;
            bool registerImpl(const VendorEventListenerRef& l, const bool withFilter, const vendor_payload_t& mask, const vendor_payload_t& value) noexcept;
            bool unregisterImpl(const VendorEventListener& l) noexcept;

        public:
            /**
             * Constructs the registry, attaching onStateUpdate() to the given AdapterState,
             * and starts the initial ready delivery thread.
             * <p>
             * The AdapterState must outlive this instance, which may be destroyed while the AdapterState is running.
             * </p>
             */
            VendorEventRegistry(AdapterState& adapterState_) noexcept;

            VendorEventRegistry(const VendorEventRegistry&) = delete;
            void operator=(const VendorEventRegistry&) = delete;

            /**
             * Detaches from the AdapterState, waiting for a sub-state broadcast in progress,
             * stops the initial ready delivery and drops all subscriptions without notification.
             */
            ~VendorEventRegistry() noexcept;

            /**
             * Registers the given listener without filter, i.e. receiving no vendor events.
             * <p>
             * If the adapter is up, a single VendorEventListener::interfaceReady() is delivered on the registry's
             * ready delivery thread, serialized with other registrations,
             * unless a state broadcast reached the listener first or it has been unregistered meanwhile.
             * </p>
             * @return true if registered or already registered, false if the listener is nullptr
             */
            bool registerListener(const VendorEventListenerRef& l) noexcept;

            /**
             * Registers the given listener with the given event filter, see setFilter() and registerListener(const VendorEventListenerRef&).
             */
            bool registerListener(const VendorEventListenerRef& l, const vendor_payload_t& mask, const vendor_payload_t& value) noexcept;

            /**
             * Unregisters the given listener, idempotent.
             * @return true if the listener was registered, otherwise false
             */
            bool unregisterListener(const VendorEventListenerRef& l) noexcept;

            /**
             * Transport death notification of the given listener, same as unregisterListener().
             */
            void onListenerDied(const VendorEventListenerRef& l) noexcept;

            /**
             * Replaces the given listener's vendor event filter.
             * <p>
             * A mask longer than the value is truncated to the value's length,
             * the stored value is pre-masked, i.e. `value[i] &= mask[i]`.
             * </p>
             * @return true if the listener is registered, otherwise false w/o change
             */
            bool setFilter(const VendorEventListenerRef& l, const vendor_payload_t& mask, const vendor_payload_t& value) noexcept;

            /**
             * Removes the given listener's vendor event filter, i.e. it receives no vendor events.
             * @return true if the listener is registered, otherwise false
             */
            bool clearFilter(const VendorEventListenerRef& l) noexcept;

            /**
             * AdapterSubState change, invoked by the AdapterState worker for each entered state.
             */
            void onStateUpdate(const AdapterSubState newState) noexcept;

            /**
             * Vendor specific event fan-out to all listeners with a matching filter.
             * <p>
             * A payload matches a filter if it is not shorter than the filter mask
             * and `(payload[i] & mask[i]) == value[i]` for all mask bytes.
             * </p>
             */
            void onVendorEvent(const vendor_payload_t& payload) noexcept;

            /**
             * Vendor specific command complete fan-out to all listeners, unfiltered.
             */
            void onVendorCommandComplete(const uint16_t opcode, const vendor_payload_t& payload) noexcept;

            /** Returns true if at least one listener is registered, i.e. a power hold is active. */
            bool areLocksHeld() const noexcept { return 0 < subscriptions.size(); }

            jau::nsize_t getListenerCount() const noexcept { return subscriptions.size(); }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace bt_power

#endif /* BTP_VENDOR_EVENT_REGISTRY_HPP_ */
