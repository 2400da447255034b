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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cstdio>

#include <algorithm>
#include <chrono>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "VendorEventRegistry.hpp"

using namespace bt_power;

VendorEventEnv::VendorEventEnv() noexcept
: exploding( jau::environment::getExplodingProperties("bt_power.vendor") ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("bt_power.debug.vendor.event", false) )
{
}

std::string VendorEventRegistry::Subscription::toString() const noexcept {
    return "Subscription["+listener->toString()+", updated "+std::to_string(updated)+
           ", seen "+std::to_string(hasSeenStableState)+", removed "+std::to_string(removed)+
           ", filter "+( hasFilter ? std::to_string(filterMask.size())+" bytes" : std::string("none") )+"]";
}

VendorEventRegistry::VendorEventRegistry(AdapterState& adapterState_) noexcept
: env(VendorEventEnv::get()),
  adapterState(adapterState_),
  stateCallback( jau::bind_member(this, &VendorEventRegistry::onStateUpdate) ),
  lastState( adapterState_.getCurrentState() ),
  previousUp( isPowered( adapterState_.getCurrentState() ) ),
  ready_service("VendorEventRegistry::ready", THREAD_SHUTDOWN_TIMEOUT,
                jau::bind_member(this, &VendorEventRegistry::readyWork),
                jau::service_runner::Callback() /* init */,
                jau::bind_member(this, &VendorEventRegistry::readyEndLocked))
{
    ready_service.start();
    adapterState.addSubStateListener(stateCallback);
    DBG_PRINT("VendorEventRegistry::ctor: %s", toString().c_str());
}

VendorEventRegistry::~VendorEventRegistry() noexcept {
    DBG_PRINT("VendorEventRegistry::dtor: %s", toString().c_str());
    adapterState.removeSubStateListener(stateCallback);
    if( ready_service.is_running() ) {
        ready_service.set_shall_stop();
        {
            // readyWork evaluates shall_stop under this lock, no lost notify
            const std::lock_guard<std::mutex> lock(mtx_readyQueue); // RAII-style acquire and relinquish via destructor
        }
        cv_readyQueue.notify_all();
        ready_service.stop();
    }
    subscriptions.clear();
}

void VendorEventRegistry::readyWork(jau::service_runner& sr) noexcept {
    SubscriptionRef sub;
    {
        std::unique_lock<std::mutex> lock(mtx_readyQueue); // RAII-style acquire and relinquish via destructor
        cv_readyQueue.wait_for(lock, std::chrono::seconds(1), [&]() -> bool {
            return sr.shall_stop() || 0 < readyQueue.size();
        });
        if( sr.shall_stop() || 0 == readyQueue.size() ) {
            return;
        }
        sub = readyQueue[0];
        readyQueue.erase(readyQueue.begin());
    }
    sendInitialReady(sub);
}

void VendorEventRegistry::readyEndLocked(jau::service_runner& sr) noexcept {
    (void)sr;
    const std::lock_guard<std::mutex> lock(mtx_readyQueue); // RAII-style acquire and relinquish via destructor
    WORDY_PRINT("VendorEventRegistry::ready: Ended. Dropping %zu pending deliveries", readyQueue.size());
    readyQueue.clear();
}

void VendorEventRegistry::applyFilter(Subscription& sub, const vendor_payload_t& mask, const vendor_payload_t& value) noexcept {
    const jau::nsize_t len = std::min(mask.size(), value.size());
    sub.filterMask.clear();
    sub.filterValue.clear();
    for(jau::nsize_t i=0; i<len; ++i) {
        sub.filterMask.push_back( mask[i] );
        sub.filterValue.push_back( static_cast<uint8_t>( value[i] & mask[i] ) );
    }
    sub.hasFilter = true;
}

bool VendorEventRegistry::matchFilter(const Subscription& sub, const vendor_payload_t& payload) noexcept {
    if( !sub.hasFilter ) {
        return false; // no filter: receives no events
    }
    if( payload.size() < sub.filterMask.size() ) {
        return false;
    }
    for(jau::nsize_t i=0; i<sub.filterMask.size(); ++i) {
        if( static_cast<uint8_t>( payload[i] & sub.filterMask[i] ) != sub.filterValue[i] ) {
            return false;
        }
    }
    return true;
}

void VendorEventRegistry::sendInitialReady(SubscriptionRef sub) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(sub->mtx_sub); // RAII-style acquire and relinquish via destructor
    if( sub->updated || sub->removed ) {
        // superseded by a state broadcast or unregistered
        return;
    }
    try {
        sub->listener->interfaceReady();
    } catch (std::exception &e) {
        ERR_PRINT("VendorEventRegistry::sendInitialReady: %s: Caught exception %s", sub->toString().c_str(), e.what());
    }
    sub->hasSeenStableState = true;
}

VendorEventRegistry::SubscriptionRef VendorEventRegistry::findSubscription(const VendorEventListener& l) noexcept {
    SubscriptionRef res;
    jau::for_each_fidelity(subscriptions, [&](SubscriptionRef &sub) {
        if( nullptr == res && *sub->listener == l ) {
            res = sub;
        }
    });
    return res;
}

bool VendorEventRegistry::registerImpl(const VendorEventListenerRef& l, const bool withFilter,
                                       const vendor_payload_t& mask, const vendor_payload_t& value) noexcept
{
    if( nullptr == l ) {
        ERR_PRINT("VendorEventRegistry::register: Listener is nullptr");
        return false;
    }
    const std::lock_guard<std::recursive_mutex> lock_state(mtx_state); // RAII-style acquire and relinquish via destructor
    SubscriptionRef sub;
    {
        const std::lock_guard<std::mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        if( nullptr != findSubscription(*l) ) {
            DBG_PRINT("VendorEventRegistry::register: Already registered %s", l->toString().c_str());
            return true;
        }
        sub = std::make_shared<Subscription>(l);
        if( withFilter ) {
            applyFilter(*sub, mask, value);
        }
        const bool wasEmpty = 0 == subscriptions.size();
        subscriptions.push_back(sub);
        COND_PRINT(env.DEBUG_EVENT, "VendorEventRegistry::register: %s, count %zu", sub->toString().c_str(), subscriptions.size());
        if( wasEmpty ) {
            adapterState.sendMessage(AdapterMessage::Opcode::POWER_ON);
        }
    }
    if( isPowered(lastState) ) {
        {
            const std::lock_guard<std::mutex> lock(mtx_readyQueue); // RAII-style acquire and relinquish via destructor
            readyQueue.push_back(sub);
        }
        cv_readyQueue.notify_all();
    }
    return true;
}

bool VendorEventRegistry::registerListener(const VendorEventListenerRef& l) noexcept {
    return registerImpl(l, false, vendor_payload_t(), vendor_payload_t());
}

bool VendorEventRegistry::registerListener(const VendorEventListenerRef& l, const vendor_payload_t& mask, const vendor_payload_t& value) noexcept {
    return registerImpl(l, true, mask, value);
}

bool VendorEventRegistry::unregisterImpl(const VendorEventListener& l) noexcept {
    SubscriptionRef removed;
    {
        const std::lock_guard<std::mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        {
            auto it = subscriptions.begin(); // lock mutex and copy_store
            while ( !it.is_end() ) {
                if ( *(*it)->listener == l ) {
                    removed = *it;
                    it.erase();
                    it.write_back();
                    break;
                } else {
                    ++it;
                }
            }
        }
        if( nullptr == removed ) {
            return false;
        }
        COND_PRINT(env.DEBUG_EVENT, "VendorEventRegistry::unregister: %s, count %zu", l.toString().c_str(), subscriptions.size());
        if( 0 == subscriptions.size() ) {
            adapterState.sendMessage(AdapterMessage::Opcode::POWER_OFF);
        }
    }
    // waits for a delivery in progress, mtx_registry released
    const std::lock_guard<std::recursive_mutex> lock(removed->mtx_sub); // RAII-style acquire and relinquish via destructor
    removed->removed = true;
    return true;
}

bool VendorEventRegistry::unregisterListener(const VendorEventListenerRef& l) noexcept {
    if( nullptr == l ) {
        return false;
    }
    return unregisterImpl(*l);
}

void VendorEventRegistry::onListenerDied(const VendorEventListenerRef& l) noexcept {
    if( nullptr == l ) {
        return;
    }
    WORDY_PRINT("VendorEventRegistry::onListenerDied: %s", l->toString().c_str());
    unregisterImpl(*l);
}

bool VendorEventRegistry::setFilter(const VendorEventListenerRef& l, const vendor_payload_t& mask, const vendor_payload_t& value) noexcept {
    if( nullptr == l ) {
        return false;
    }
    SubscriptionRef sub;
    {
        const std::lock_guard<std::mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        sub = findSubscription(*l);
    }
    if( nullptr == sub ) {
        DBG_PRINT("VendorEventRegistry::setFilter: Unknown %s", l->toString().c_str());
        return false;
    }
    const std::lock_guard<std::recursive_mutex> lock(sub->mtx_sub); // RAII-style acquire and relinquish via destructor
    applyFilter(*sub, mask, value);
    COND_PRINT(env.DEBUG_EVENT, "VendorEventRegistry::setFilter: %s", sub->toString().c_str());
    return true;
}

bool VendorEventRegistry::clearFilter(const VendorEventListenerRef& l) noexcept {
    if( nullptr == l ) {
        return false;
    }
    SubscriptionRef sub;
    {
        const std::lock_guard<std::mutex> lock(mtx_registry); // RAII-style acquire and relinquish via destructor
        sub = findSubscription(*l);
    }
    if( nullptr == sub ) {
        return false;
    }
    const std::lock_guard<std::recursive_mutex> lock(sub->mtx_sub); // RAII-style acquire and relinquish via destructor
    sub->hasFilter = false;
    sub->filterMask.clear();
    sub->filterValue.clear();
    return true;
}

void VendorEventRegistry::onStateUpdate(const AdapterSubState newState) noexcept {
    const std::lock_guard<std::recursive_mutex> lock_state(mtx_state); // RAII-style acquire and relinquish via destructor
    COND_PRINT(env.DEBUG_EVENT, "VendorEventRegistry::onStateUpdate: %s -> %s, previous up %d",
            to_string(lastState).c_str(), to_string(newState).c_str(), previousUp);
    lastState = newState;

    bool up;
    switch( newState ) {
        case AdapterSubState::OFF:
            up = false;
            break;
        case AdapterSubState::POWERED:
        case AdapterSubState::ON:
            up = true;
            break;
        case AdapterSubState::PENDING:
        default:
            return; // no update
    }
    if( up == previousUp ) {
        return;
    }
    previousUp = up;

    int i=0;
    jau::for_each_fidelity(subscriptions, [&](SubscriptionRef &sub) {
        bool terminal = false;
        {
            const std::lock_guard<std::recursive_mutex> lock(sub->mtx_sub); // RAII-style acquire and relinquish via destructor
            if( sub->removed ) {
                i++;
                return;
            }
            sub->updated = true;
            try {
                if( up ) {
                    sub->listener->interfaceReady();
                } else if( sub->hasSeenStableState ) {
                    sub->listener->interfaceDown();
                    terminal = true;
                }
            } catch (std::exception &e) {
                ERR_PRINT("VendorEventRegistry::onStateUpdate-CBs %d/%zu: %s: Caught exception %s",
                        i+1, subscriptions.size(), sub->toString().c_str(), e.what());
                terminal = !up && sub->hasSeenStableState;
            }
            sub->hasSeenStableState = true;
        }
        if( terminal ) {
            unregisterImpl(*sub->listener);
        }
        i++;
    });
}

void VendorEventRegistry::onVendorEvent(const vendor_payload_t& payload) noexcept {
    COND_PRINT(env.DEBUG_EVENT, "VendorEventRegistry::onVendorEvent: %zu bytes to %zu potential listener", payload.size(), subscriptions.size());
    int i=0;
    jau::for_each_fidelity(subscriptions, [&](SubscriptionRef &sub) {
        bool match;
        {
            const std::lock_guard<std::recursive_mutex> lock(sub->mtx_sub); // RAII-style acquire and relinquish via destructor
            match = matchFilter(*sub, payload);
        }
        if( match ) {
            try {
                sub->listener->vendorEventReceived(payload);
            } catch (std::exception &e) {
                ERR_PRINT("VendorEventRegistry::onVendorEvent-CBs %d/%zu: %s: Caught exception %s",
                        i+1, subscriptions.size(), sub->toString().c_str(), e.what());
            }
        }
        i++;
    });
}

void VendorEventRegistry::onVendorCommandComplete(const uint16_t opcode, const vendor_payload_t& payload) noexcept {
    COND_PRINT(env.DEBUG_EVENT, "VendorEventRegistry::onVendorCommandComplete: opcode %s, %zu bytes",
            jau::to_hexstring(opcode).c_str(), payload.size());
    int i=0;
    jau::for_each_fidelity(subscriptions, [&](SubscriptionRef &sub) {
        try {
            sub->listener->vendorCommandCompleteReceived(opcode, payload);
        } catch (std::exception &e) {
            ERR_PRINT("VendorEventRegistry::onVendorCommandComplete-CBs %d/%zu: %s: Caught exception %s",
                    i+1, subscriptions.size(), sub->toString().c_str(), e.what());
        }
        i++;
    });
}

std::string VendorEventRegistry::toString() const noexcept {
    return "VendorEventRegistry[listener "+std::to_string(subscriptions.size())+
           ", lastState "+to_string(lastState)+", up "+std::to_string(previousUp)+"]";
}
