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

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "AdapterState.hpp"

using namespace bt_power;
using namespace jau::fractions_i64_literals;

AdapterStateEnv::AdapterStateEnv() noexcept
: DEBUG_GLOBAL( jau::environment::get("bt_power").debug ),
  exploding( jau::environment::getExplodingProperties("bt_power.adapter") ),
  START_TIMEOUT( jau::environment::getFractionProperty("bt_power.adapter.start.timeout", START_TIMEOUT_DELAY, 10_ms /* min */, 365_d /* max */) ),
  ENABLE_TIMEOUT( jau::environment::getFractionProperty("bt_power.adapter.enable.timeout", ENABLE_TIMEOUT_DELAY, 10_ms /* min */, 365_d /* max */) ),
  DISABLE_TIMEOUT( jau::environment::getFractionProperty("bt_power.adapter.disable.timeout", DISABLE_TIMEOUT_DELAY, 10_ms /* min */, 365_d /* max */) ),
  STOP_TIMEOUT( jau::environment::getFractionProperty("bt_power.adapter.stop.timeout", STOP_TIMEOUT_DELAY, 10_ms /* min */, 365_d /* max */) ),
  SCAN_MODE_TIMEOUT( jau::environment::getFractionProperty("bt_power.adapter.scanmode.timeout", PROPERTY_OP_DELAY, 10_ms /* min */, 365_d /* max */) ),
  WORKER_POLL_TIMEOUT( jau::environment::getFractionProperty("bt_power.adapter.worker.poll", 1_s, 100_ms /* min */, 365_d /* max */) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("bt_power.debug.adapter.event", false) )
{
}

AdapterTimeouts::AdapterTimeouts() noexcept
: start( AdapterStateEnv::get().START_TIMEOUT ),
  enable( AdapterStateEnv::get().ENABLE_TIMEOUT ),
  disable( AdapterStateEnv::get().DISABLE_TIMEOUT ),
  stop( AdapterStateEnv::get().STOP_TIMEOUT ),
  scan_mode( AdapterStateEnv::get().SCAN_MODE_TIMEOUT )
{ }

std::string AdapterTimeouts::toString() const noexcept {
    return "AdapterTimeouts[start "+start.to_string()+", enable "+enable.to_string()+", disable "+disable.to_string()+
           ", stop "+stop.to_string()+", scan_mode "+scan_mode.to_string()+"]";
}

static void defaultFatalError(const AdapterMessage& msg) {
    ABORT("AdapterState: Unrecoverable %s, terminating process to force a restart", msg.toString().c_str());
}

const AdapterMessage::Opcode AdapterState::timeoutOpcodes[5] = {
        AdapterMessage::Opcode::START_TIMEOUT, AdapterMessage::Opcode::ENABLE_TIMEOUT,
        AdapterMessage::Opcode::DISABLE_TIMEOUT, AdapterMessage::Opcode::STOP_TIMEOUT,
        AdapterMessage::Opcode::SET_SCAN_MODE_TIMEOUT };

static AdapterSubStateCallbackList::equal_comparator _subStateCallbackEqComp =
        [](const AdapterSubStateCallback& a, const AdapterSubStateCallback& b) -> bool { return a == b; };

AdapterState::AdapterState(std::shared_ptr<PowerHAL> hal, std::shared_ptr<AdapterProperties> properties,
                           std::shared_ptr<AdapterService> service,
                           const AdapterTimeouts& timeouts_)
: env(AdapterStateEnv::get()),
  timeouts(timeouts_),
  collaborators( std::make_shared<const AdapterCollaborators>( AdapterCollaborators{ hal, properties, service } ) ),
  worker_service("AdapterState::worker", THREAD_SHUTDOWN_TIMEOUT,
                 jau::bind_member(this, &AdapterState::workerWork),
                 jau::service_runner::Callback() /* init */,
                 jau::bind_member(this, &AdapterState::workerEndLocked)),
  started(false),
  currentState(AdapterSubState::OFF),
  destState(AdapterSubState::OFF),
  transitionRequested(false),
  turningOn(false), turningOff(false), userOperation(false),
  fatalErrorCallback( jau::bind_free(&defaultFatalError) )
{
    if( !collaborators->isComplete() ) {
        throw PowerException("AdapterState: Incomplete collaborators: hal "+jau::to_hexstring(hal.get())+
                             ", properties "+jau::to_hexstring(properties.get())+
                             ", service "+jau::to_hexstring(service.get()), E_FILE_LINE);
    }
    DBG_PRINT("AdapterState::ctor: %s, %s", timeouts.toString().c_str(), toString().c_str());
}

AdapterState::~AdapterState() noexcept {
    DBG_PRINT("AdapterState::dtor: %s", toString().c_str());
    quit();
    subStateCallbackList.clear();
    processedMessageCallbackList.clear();
}

std::shared_ptr<const AdapterCollaborators> AdapterState::getCollaborators() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_collaborators); // RAII-style acquire and relinquish via destructor
    return collaborators;
}

void AdapterState::start() {
    const std::lock_guard<std::mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
    if( started ) {
        throw PowerException("AdapterState: Already started: "+toString(), E_FILE_LINE);
    }
    started = true;
    {
        std::shared_ptr<const AdapterCollaborators> c = getCollaborators();
        enterState(AdapterSubState::OFF, c.get());
    }
    worker_service.start();
    WORDY_PRINT("AdapterState::start: %s", toString().c_str());
}

void AdapterState::quit() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
    if( worker_service.is_running() ) {
        worker_service.set_shall_stop();
        queue.interrupt();
        worker_service.stop();
    }
    queue.clear();
    deferred.clear();
    WORDY_PRINT("AdapterState::quit: %s", toString().c_str());
}

void AdapterState::cleanup() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_collaborators); // RAII-style acquire and relinquish via destructor
    collaborators = nullptr;
    DBG_PRINT("AdapterState::cleanup: Collaborators revoked");
}

bool AdapterState::isRunning() const noexcept {
    return worker_service.is_running();
}

void AdapterState::sendMessage(const AdapterMessage::Opcode opc) noexcept {
    queue.put( AdapterMessage(opc) );
}

void AdapterState::sendMessageDelayed(const AdapterMessage::Opcode opc, const jau::fraction_i64& delay) noexcept {
    queue.putDelayed( AdapterMessage(opc), delay );
}

bool AdapterState::hasMessages(const AdapterMessage::Opcode opc) const noexcept {
    return queue.hasMessages(opc);
}

void AdapterState::removeMessages(const AdapterMessage::Opcode opc) noexcept {
    queue.remove(opc);
}

void AdapterState::stateChangeCallback(const HALState status) noexcept {
    switch( status ) {
        case HALState::OFF:
            sendMessage(AdapterMessage::Opcode::DISABLED);
            break;
        case HALState::ON:
            sendMessage(AdapterMessage::Opcode::ENABLED_READY);
            break;
        default:
            ERR_PRINT("AdapterState: Incorrect status %s in stateChangeCallback", to_string(status).c_str());
            break;
    }
}

void AdapterState::workerWork(jau::service_runner& sr) noexcept {
    AdapterMessage msg;
    if( queue.getBlocking(msg, env.WORKER_POLL_TIMEOUT) ) {
        dispatchMessage(msg, &sr);
    }
}

void AdapterState::workerEndLocked(jau::service_runner& sr) noexcept {
    (void)sr;
    WORDY_PRINT("AdapterState::worker: Ended. Queue has %zu entries - %s", queue.size(), toString().c_str());
}

void AdapterState::dispatchMessage(const AdapterMessage& msg, jau::service_runner* sr) noexcept {
    std::shared_ptr<const AdapterCollaborators> c = getCollaborators(); // read once per message
    const AdapterSubState state = currentState;
    ProcessResult res;

    if( nullptr == c ) {
        ERR_PRINT("AdapterState: Received %s in %s after cleanup", msg.toString().c_str(), to_string(state).c_str());
        res = ProcessResult::SHUTDOWN;
    } else {
        const HandlerSnapshot snap = takeSnapshot(*c);
        try {
            switch( state ) {
                case AdapterSubState::OFF:
                    res = processOff(msg, *c);
                    break;
                case AdapterSubState::PENDING:
                    res = processPending(msg, *c);
                    break;
                case AdapterSubState::ON:
                    res = processOn(msg, *c);
                    break;
                case AdapterSubState::POWERED:
                    res = processPowered(msg, *c);
                    break;
                default:
                    ERR_PRINT("AdapterState: Invalid state %s, dropping %s", to_string(state).c_str(), msg.toString().c_str());
                    res = ProcessResult::REJECTED;
                    break;
            }
        } catch (std::exception &e) {
            ERR_PRINT("AdapterState: Caught exception %s processing %s in %s, rolling back", e.what(), msg.toString().c_str(), to_string(state).c_str());
            rollback(snap, *c);
            res = ProcessResult::REJECTED;
        }
    }
    performTransition(c.get());

    COND_PRINT(env.DEBUG_EVENT, "AdapterState: %s in %s: %s -> %s", msg.toString().c_str(), to_string(state).c_str(),
            to_string(res).c_str(), toString().c_str());

    sendMessageProcessed(msg, state, res);

    if( ProcessResult::FATAL == res ) {
        if( nullptr != sr ) {
            sr->set_shall_stop();
        }
        sendFatalError(msg);
    }
}

AdapterState::HandlerSnapshot AdapterState::takeSnapshot(const AdapterCollaborators& c) noexcept {
    HandlerSnapshot snap;
    snap.turningOn = turningOn;
    snap.turningOff = turningOff;
    snap.userOperation = userOperation;
    snap.deferredCount = deferred.size();
    for(int i=0; i<5; ++i) {
        snap.timeoutArmed[i] = queue.hasMessages(timeoutOpcodes[i]);
    }
    snap.hasLifecycleState = false;
    snap.lifecycleState = AdapterLifecycleState::OFF;
    try {
        snap.lifecycleState = c.properties->getState();
        snap.hasLifecycleState = true;
    } catch (std::exception &e) {
        ERR_PRINT("AdapterState: Caught exception %s reading the adapter state", e.what());
    }
    return snap;
}

void AdapterState::rollback(const HandlerSnapshot& snap, const AdapterCollaborators& c) noexcept {
    transitionRequested = false;
    destState = currentState;
    turningOn = snap.turningOn;
    turningOff = snap.turningOff;
    userOperation = snap.userOperation;
    if( deferred.size() > snap.deferredCount ) {
        deferred.erase(deferred.begin()+snap.deferredCount, deferred.end());
    }
    for(int i=0; i<5; ++i) {
        const AdapterMessage::Opcode opc = timeoutOpcodes[i];
        const bool armed = queue.hasMessages(opc);
        if( armed && !snap.timeoutArmed[i] ) {
            queue.remove(opc);
        } else if( !armed && snap.timeoutArmed[i] ) {
            queue.putDelayed( AdapterMessage(opc), getTimeout(opc) );
        }
    }
    if( snap.hasLifecycleState ) {
        AdapterLifecycleState now = snap.lifecycleState;
        try {
            now = c.properties->getState();
        } catch (std::exception &e) {
            ERR_PRINT("AdapterState: Caught exception %s reading the adapter state", e.what());
        }
        if( now != snap.lifecycleState ) {
            notifyAdapterStateChange(c, snap.lifecycleState);
        }
    }
    DBG_PRINT("AdapterState: Rolled back: %s", toString().c_str());
}

const jau::fraction_i64& AdapterState::getTimeout(const AdapterMessage::Opcode opc) const noexcept {
    switch( opc ) {
        case AdapterMessage::Opcode::START_TIMEOUT: return timeouts.start;
        case AdapterMessage::Opcode::ENABLE_TIMEOUT: return timeouts.enable;
        case AdapterMessage::Opcode::DISABLE_TIMEOUT: return timeouts.disable;
        case AdapterMessage::Opcode::STOP_TIMEOUT: return timeouts.stop;
        default: return timeouts.scan_mode;
    }
}

//
// OFF
//

ProcessResult AdapterState::processOff(const AdapterMessage& msg, const AdapterCollaborators& c) {
    switch( msg.getOpcode() ) {
        case AdapterMessage::Opcode::USER_TURN_ON:
            notifyAdapterStateChange(c, AdapterLifecycleState::TURNING_ON);
            userOperation = true;
            return beginTurnOn(c);

        case AdapterMessage::Opcode::POWER_ON:
            return beginTurnOn(c);

        case AdapterMessage::Opcode::USER_TURN_OFF:
        case AdapterMessage::Opcode::POWER_OFF:
            DBG_PRINT("AdapterState: %s in OFF: Already off", msg.toString().c_str());
            return ProcessResult::IGNORED;

        default:
            return unexpectedMessage(msg);
    }
}

ProcessResult AdapterState::beginTurnOn(const AdapterCollaborators& c) {
    turningOn = true;
    transitionTo(AdapterSubState::PENDING);
    queue.putDelayed( AdapterMessage(AdapterMessage::Opcode::START_TIMEOUT), timeouts.start );
    c.hal->processStart();
    return ProcessResult::HANDLED;
}

//
// PENDING
//

ProcessResult AdapterState::processPending(const AdapterMessage& msg, const AdapterCollaborators& c) {
    const bool isTurningOn = turningOn;
    const bool isTurningOff = turningOff;
    const bool isUserOp = userOperation;

    DBG_PRINT("AdapterState: %s in PENDING, turningOn %d, turningOff %d, userOperation %d",
            msg.toString().c_str(), isTurningOn, isTurningOff, isUserOp);

    switch( msg.getOpcode() ) {
        case AdapterMessage::Opcode::USER_TURN_ON:
            if( isTurningOn ) {
                if( isUserOp ) {
                    return ProcessResult::IGNORED;
                }
                // upgrade in-flight power hold start to a user operation, timers unchanged
                userOperation = true;
                notifyAdapterStateChange(c, AdapterLifecycleState::TURNING_ON);
                return ProcessResult::HANDLED;
            }
            deferMessage(msg);
            return ProcessResult::DEFERRED;

        case AdapterMessage::Opcode::USER_TURN_OFF:
            if( isTurningOff ) {
                return ProcessResult::IGNORED;
            }
            deferMessage(msg);
            return ProcessResult::DEFERRED;

        case AdapterMessage::Opcode::POWER_ON:
            if( isTurningOn ) {
                return ProcessResult::IGNORED;
            }
            deferMessage(msg);
            return ProcessResult::DEFERRED;

        case AdapterMessage::Opcode::POWER_OFF:
            if( isTurningOff ) {
                return ProcessResult::IGNORED;
            }
            deferMessage(msg);
            return ProcessResult::DEFERRED;

        case AdapterMessage::Opcode::STARTED:
            queue.remove(AdapterMessage::Opcode::START_TIMEOUT);
            if( !c.hal->enableNative() ) {
                ERR_PRINT("AdapterState: Error while turning adapter on, enableNative failed");
                notifyAdapterStateChange(c, AdapterLifecycleState::OFF);
                turningOn = false;
                transitionTo(AdapterSubState::OFF);
            } else {
                queue.putDelayed( AdapterMessage(AdapterMessage::Opcode::ENABLE_TIMEOUT), timeouts.enable );
            }
            return ProcessResult::HANDLED;

        case AdapterMessage::Opcode::ENABLED_READY:
            queue.remove(AdapterMessage::Opcode::ENABLE_TIMEOUT);
            setVendorEvents(c, true);
            turningOn = false;
            if( isUserOp ) {
                c.properties->onBluetoothReady();
                transitionTo(AdapterSubState::ON);
                notifyAdapterStateChange(c, AdapterLifecycleState::ON);
            } else {
                transitionTo(AdapterSubState::POWERED);
            }
            return ProcessResult::HANDLED;

        case AdapterMessage::Opcode::SET_SCAN_MODE_TIMEOUT:
            WARN_PRINT("AdapterState: Timeout while setting scan mode, continuing with disable");
            return beginDisable(c);

        case AdapterMessage::Opcode::BEGIN_DISABLE:
            return beginDisable(c);

        case AdapterMessage::Opcode::DISABLED:
            if( isTurningOn ) {
                queue.remove(AdapterMessage::Opcode::ENABLE_TIMEOUT);
                ERR_PRINT("AdapterState: Error enabling adapter, hardware init failed");
                turningOn = false;
                transitionTo(AdapterSubState::OFF);
                if( c.service->stopProfileServices() ) {
                    DBG_PRINT("AdapterState: Stopping profile services after failed enable");
                }
                if( isUserOp ) {
                    notifyAdapterStateChange(c, AdapterLifecycleState::OFF);
                }
                return ProcessResult::HANDLED;
            }
            queue.remove(AdapterMessage::Opcode::DISABLE_TIMEOUT);
            queue.putDelayed( AdapterMessage(AdapterMessage::Opcode::STOP_TIMEOUT), timeouts.stop );
            if( c.service->stopProfileServices() ) {
                DBG_PRINT("AdapterState: Stopping profile services that were post enabled, awaiting STOPPED");
                return ProcessResult::HANDLED;
            }
            return completeStop(c);

        case AdapterMessage::Opcode::STOPPED:
            return completeStop(c);

        case AdapterMessage::Opcode::START_TIMEOUT:
        case AdapterMessage::Opcode::ENABLE_TIMEOUT:
            return enableFailed(c, msg);

        case AdapterMessage::Opcode::STOP_TIMEOUT:
            ERR_PRINT("AdapterState: Error stopping profile services: %s", msg.toString().c_str());
            turningOff = false;
            transitionTo(AdapterSubState::OFF);
            notifyAdapterStateChange(c, AdapterLifecycleState::OFF);
            ERR_PRINT("AdapterState: STOP_TIMEOUT, killing the process to force a restart as part of cleanup");
            return ProcessResult::FATAL;

        case AdapterMessage::Opcode::DISABLE_TIMEOUT:
            ERR_PRINT("AdapterState: Error disabling adapter: %s", msg.toString().c_str());
            turningOff = false;
            c.hal->forceCleanup();
            transitionTo(AdapterSubState::OFF);
            notifyAdapterStateChange(c, AdapterLifecycleState::OFF);
            ERR_PRINT("AdapterState: DISABLE_TIMEOUT, killing the process to force a restart as part of cleanup");
            return ProcessResult::FATAL;

        default:
            return unexpectedMessage(msg);
    }
}

ProcessResult AdapterState::beginDisable(const AdapterCollaborators& c) {
    queue.remove(AdapterMessage::Opcode::SET_SCAN_MODE_TIMEOUT);
    if( c.service->isPowerLockHeld() ) {
        // radio held by a power hold: abort the disable, no user visible notification
        turningOff = false;
        transitionTo(AdapterSubState::POWERED);
        jau::INFO_PRINT("AdapterState: Disable superseded by power hold, remaining powered");
        return ProcessResult::HANDLED;
    }
    setVendorEvents(c, false);
    queue.putDelayed( AdapterMessage(AdapterMessage::Opcode::DISABLE_TIMEOUT), timeouts.disable );
    if( !c.hal->disableNative() ) {
        queue.remove(AdapterMessage::Opcode::DISABLE_TIMEOUT);
        ERR_PRINT("AdapterState: Error while turning adapter off, disableNative failed");
        turningOff = false;
        transitionTo(AdapterSubState::ON);
        notifyAdapterStateChange(c, AdapterLifecycleState::ON);
    }
    return ProcessResult::HANDLED;
}

ProcessResult AdapterState::completeStop(const AdapterCollaborators& c) {
    queue.remove(AdapterMessage::Opcode::STOP_TIMEOUT);
    turningOff = false;
    transitionTo(AdapterSubState::OFF);
    if( userOperation ) {
        notifyAdapterStateChange(c, AdapterLifecycleState::OFF);
    }
    return ProcessResult::HANDLED;
}

ProcessResult AdapterState::enableFailed(const AdapterCollaborators& c, const AdapterMessage& msg) {
    ERR_PRINT("AdapterState: Error enabling adapter: %s", msg.toString().c_str());
    turningOn = false;
    transitionTo(AdapterSubState::OFF);
    if( userOperation ) {
        notifyAdapterStateChange(c, AdapterLifecycleState::OFF);
    }
    return ProcessResult::HANDLED;
}

//
// ON
//

ProcessResult AdapterState::processOn(const AdapterMessage& msg, const AdapterCollaborators& c) {
    switch( msg.getOpcode() ) {
        case AdapterMessage::Opcode::USER_TURN_OFF:
            notifyAdapterStateChange(c, AdapterLifecycleState::TURNING_OFF);
            turningOff = true;
            userOperation = true;
            transitionTo(AdapterSubState::PENDING);
            queue.putDelayed( AdapterMessage(AdapterMessage::Opcode::SET_SCAN_MODE_TIMEOUT), timeouts.scan_mode );
            c.properties->onBluetoothDisable();
            return ProcessResult::HANDLED;

        case AdapterMessage::Opcode::USER_TURN_ON:
            DBG_PRINT("AdapterState: %s in ON: Already on", msg.toString().c_str());
            return ProcessResult::IGNORED;

        case AdapterMessage::Opcode::POWER_ON:
        case AdapterMessage::Opcode::POWER_OFF:
            DBG_PRINT("AdapterState: %s in ON: Power hold irrelevant", msg.toString().c_str());
            return ProcessResult::IGNORED;

        default:
            return unexpectedMessage(msg);
    }
}

//
// POWERED
//

ProcessResult AdapterState::processPowered(const AdapterMessage& msg, const AdapterCollaborators& c) {
    switch( msg.getOpcode() ) {
        case AdapterMessage::Opcode::USER_TURN_ON:
            notifyAdapterStateChange(c, AdapterLifecycleState::TURNING_ON);
            c.properties->onBluetoothReady();
            transitionTo(AdapterSubState::ON);
            notifyAdapterStateChange(c, AdapterLifecycleState::ON);
            return ProcessResult::HANDLED;

        case AdapterMessage::Opcode::USER_TURN_OFF:
        case AdapterMessage::Opcode::POWER_ON:
            DBG_PRINT("AdapterState: %s in POWERED: No-op", msg.toString().c_str());
            return ProcessResult::IGNORED;

        case AdapterMessage::Opcode::POWER_OFF:
            setVendorEvents(c, false);
            if( c.hal->disableNative() ) {
                queue.putDelayed( AdapterMessage(AdapterMessage::Opcode::DISABLE_TIMEOUT), timeouts.disable );
                turningOff = true;
                userOperation = false;
                transitionTo(AdapterSubState::PENDING);
            } else {
                ERR_PRINT("AdapterState: Error while powering off adapter, disableNative failed, remaining powered");
            }
            return ProcessResult::HANDLED;

        default:
            return unexpectedMessage(msg);
    }
}

//
// Transition handling
//

void AdapterState::transitionTo(const AdapterSubState s) noexcept {
    destState = s;
    transitionRequested = true;
}

void AdapterState::deferMessage(const AdapterMessage& msg) noexcept {
    DBG_PRINT("AdapterState: Deferring %s", msg.toString().c_str());
    deferred.push_back(msg);
}

void AdapterState::performTransition(const AdapterCollaborators* c) noexcept {
    if( !transitionRequested ) {
        return;
    }
    transitionRequested = false;
    const AdapterSubState oldState = currentState;
    const AdapterSubState newState = destState;

    if( AdapterSubState::PENDING == oldState ) {
        userOperation = false;
    }
    currentState = newState;
    enterState(newState, c);

    if( AdapterSubState::PENDING == oldState && AdapterSubState::PENDING != newState && 0 < deferred.size() ) {
        DBG_PRINT("AdapterState: Replaying %zu deferred messages", deferred.size());
        queue.putFront(deferred);
        deferred.clear();
    }
}

void AdapterState::enterState(const AdapterSubState s, const AdapterCollaborators* c) noexcept {
    jau::INFO_PRINT("AdapterState: Entering %s: turningOn %d, turningOff %d, userOperation %d",
            to_string(s).c_str(), isTurningOn(), isTurningOff(), isUserOperation());
    if( nullptr == c ) {
        ERR_PRINT("AdapterState: Enter %s after cleanup", to_string(s).c_str());
    } else {
        try {
            c->service->updateStateMachineState(s);
            if( AdapterSubState::ON == s ) {
                c->service->autoConnect();
            }
        } catch (std::exception &e) {
            ERR_PRINT("AdapterState: Caught exception %s entering %s", e.what(), to_string(s).c_str());
        }
    }
    sendSubStateChanged(s);
}

void AdapterState::notifyAdapterStateChange(const AdapterCollaborators& c, const AdapterLifecycleState newState) noexcept {
    try {
        const AdapterLifecycleState oldState = c.properties->getState();
        c.properties->setState(newState);
        jau::INFO_PRINT("AdapterState: Adapter state changed: %s -> %s", to_string(oldState).c_str(), to_string(newState).c_str());
        c.service->updateAdapterState(oldState, newState);
    } catch (std::exception &e) {
        ERR_PRINT("AdapterState: Caught exception %s notifying %s", e.what(), to_string(newState).c_str());
    }
}

void AdapterState::setVendorEvents(const AdapterCollaborators& c, const bool enable) {
    if( !c.hal->setVendorEventsEnabled(enable) ) {
        ERR_PRINT("AdapterState: Unable to %s vendor specific events", enable ? "enable" : "disable");
    }
}

ProcessResult AdapterState::unexpectedMessage(const AdapterMessage& msg) noexcept {
    WARN_PRINT("AdapterState: Unexpected %s in %s", msg.toString().c_str(), to_string(currentState.load()).c_str());
    return ProcessResult::REJECTED;
}

//
// Listener
//

bool AdapterState::addSubStateListener(const AdapterSubStateCallback& cb) noexcept {
    return subStateCallbackList.push_back_unique(cb, _subStateCallbackEqComp);
}

bool AdapterState::removeSubStateListener(const AdapterSubStateCallback& cb) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_subStateCallbacks); // RAII-style acquire and relinquish via destructor
    return 0 < subStateCallbackList.erase_matching(cb, true /* all_matching */, _subStateCallbackEqComp);
}

void AdapterState::addProcessedMessageListener(const ProcessedMessageCallback& cb) noexcept {
    processedMessageCallbackList.push_back(cb);
}

void AdapterState::clearProcessedMessageListener() noexcept {
    processedMessageCallbackList.clear();
}

void AdapterState::setFatalErrorCallback(const FatalErrorCallback& cb) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_fatalCallback); // RAII-style acquire and relinquish via destructor
    fatalErrorCallback = cb;
}

void AdapterState::sendSubStateChanged(const AdapterSubState s) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_subStateCallbacks); // RAII-style acquire and relinquish via destructor
    int i=0;
    jau::for_each_fidelity(subStateCallbackList, [&](AdapterSubStateCallback &cb) {
        try {
            cb(s);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterState::sendSubStateChanged-CBs %d/%zu: %s of %s: Caught exception %s",
                    i+1, subStateCallbackList.size(),
                    cb.toString().c_str(), to_string(s).c_str(), e.what());
        }
        i++;
    });
}

void AdapterState::sendMessageProcessed(const AdapterMessage& msg, const AdapterSubState s, const ProcessResult res) noexcept {
    int i=0;
    jau::for_each_fidelity(processedMessageCallbackList, [&](ProcessedMessageCallback &cb) {
        try {
            cb(msg, s, res);
        } catch (std::exception &e) {
            ERR_PRINT("AdapterState::sendMessageProcessed-CBs %d/%zu: %s of %s: Caught exception %s",
                    i+1, processedMessageCallbackList.size(),
                    cb.toString().c_str(), msg.toString().c_str(), e.what());
        }
        i++;
    });
}

void AdapterState::sendFatalError(const AdapterMessage& msg) noexcept {
    FatalErrorCallback cb;
    {
        const std::lock_guard<std::mutex> lock(mtx_fatalCallback); // RAII-style acquire and relinquish via destructor
        cb = fatalErrorCallback;
    }
    try {
        cb(msg);
    } catch (std::exception &e) {
        ERR_PRINT("AdapterState::sendFatalError: %s of %s: Caught exception %s",
                cb.toString().c_str(), msg.toString().c_str(), e.what());
    }
}

std::string AdapterState::toString() const noexcept {
    return "AdapterState[state "+to_string(currentState.load())+
           ", turningOn "+std::to_string(isTurningOn())+", turningOff "+std::to_string(isTurningOff())+
           ", userOperation "+std::to_string(isUserOperation())+
           ", "+queue.toString()+"]";
}
