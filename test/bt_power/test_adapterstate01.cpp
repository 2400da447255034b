#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <initializer_list>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "power_test_mocks.hpp"

typedef AdapterMessage::Opcode Opcode;

template<typename T>
static bool sameSequence(const jau::darray<T>& has, std::initializer_list<T> exp) {
    if( has.size() != exp.size() ) {
        return false;
    }
    jau::nsize_t i=0;
    for(const T& e : exp) {
        if( has[i++] != e ) {
            return false;
        }
    }
    return true;
}

static std::string toString(const jau::darray<AdapterLifecycleState>& l) {
    std::string res = "[";
    for(jau::nsize_t i=0; i<l.size(); ++i) {
        if( 0 < i ) { res.append(", "); }
        res.append( to_string(l[i]) );
    }
    return res+"]";
}

static std::string toString(const jau::darray<AdapterSubState>& l) {
    std::string res = "[";
    for(jau::nsize_t i=0; i<l.size(); ++i) {
        if( 0 < i ) { res.append(", "); }
        res.append( to_string(l[i]) );
    }
    return res+"]";
}

TEST_CASE( "AdapterState User Turn On Test 01", "[adapter][state][on]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();
    REQUIRE( true == waitUntil([&]() -> bool { return h.state().isRunning(); }) );
    REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_ON) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( true == h.state().isTurningOn() );
    REQUIRE( true == h.state().isUserOperation() );
    REQUIRE( true == h.state().hasMessages(Opcode::START_TIMEOUT) );
    REQUIRE( 1 == h.log.count("hal.processStart") );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );
    REQUIRE( false == h.state().hasMessages(Opcode::START_TIMEOUT) );
    REQUIRE( true == h.state().hasMessages(Opcode::ENABLE_TIMEOUT) );
    REQUIRE( 1 == h.log.count("hal.enableNative") );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::ENABLED_READY) );
    REQUIRE( AdapterSubState::ON == h.state().getCurrentState() );
    REQUIRE( false == h.state().hasMessages(Opcode::ENABLE_TIMEOUT) );
    REQUIRE( false == h.state().isTurningOn() );
    REQUIRE( false == h.state().isUserOperation() );
    REQUIRE( 1 == h.log.count("hal.vendorEvents.on") );
    REQUIRE( 1 == h.log.count("props.onBluetoothReady") );
    REQUIRE( 1 == h.log.count("service.autoConnect") );

    const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
    INFO_STR( "Notifications "+toString(notifications) );
    REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::ON }) );

    const jau::darray<AdapterSubState> subStates = h.service->getSubStates();
    INFO_STR( "SubStates "+toString(subStates) );
    REQUIRE( true == sameSequence(subStates, { AdapterSubState::OFF, AdapterSubState::PENDING, AdapterSubState::ON }) );

    REQUIRE( AdapterLifecycleState::ON == h.props->getState() );
    REQUIRE( 0 == h.fatal.get().size() );

    // no-op in ON
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::USER_TURN_ON) );
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::POWER_ON) );
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::POWER_OFF) );
    REQUIRE( ProcessResult::REJECTED == h.sendAndWait(Opcode::STARTED) );
    REQUIRE( AdapterSubState::ON == h.state().getCurrentState() );

    h.state().quit();
    REQUIRE( false == h.state().isRunning() );
}

TEST_CASE( "AdapterState User Turn Off Test 02", "[adapter][state][off]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();
    h.turnOnUser();
    REQUIRE( AdapterSubState::ON == h.state().getCurrentState() );
    h.service->clearNotifications();

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_OFF) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( true == h.state().isTurningOff() );
    REQUIRE( true == h.state().isUserOperation() );
    REQUIRE( true == h.state().hasMessages(Opcode::SET_SCAN_MODE_TIMEOUT) );
    REQUIRE( 1 == h.log.count("props.onBluetoothDisable") );

    // already turning off
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::USER_TURN_OFF) );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::BEGIN_DISABLE) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( false == h.state().hasMessages(Opcode::SET_SCAN_MODE_TIMEOUT) );
    REQUIRE( true == h.state().hasMessages(Opcode::DISABLE_TIMEOUT) );
    REQUIRE( 1 == h.log.count("hal.vendorEvents.off") );
    REQUIRE( 1 == h.log.count("hal.disableNative") );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::DISABLED) );
    REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
    REQUIRE( false == h.state().hasMessages(Opcode::DISABLE_TIMEOUT) );
    REQUIRE( false == h.state().hasMessages(Opcode::STOP_TIMEOUT) );
    REQUIRE( false == h.state().isTurningOff() );
    REQUIRE( false == h.state().isUserOperation() );
    REQUIRE( 1 == h.log.count("service.stopProfileServices") );

    // no profile services running: already OFF, a late STOPPED changes nothing
    REQUIRE( ProcessResult::REJECTED == h.sendAndWait(Opcode::STOPPED) );
    REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );

    const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
    INFO_STR( "Notifications "+toString(notifications) );
    REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_OFF, AdapterLifecycleState::OFF }) );
    REQUIRE( AdapterLifecycleState::OFF == h.props->getState() );

    const jau::darray<AdapterSubState> subStates = h.service->getSubStates();
    INFO_STR( "SubStates "+toString(subStates) );
    REQUIRE( true == sameSequence(subStates, { AdapterSubState::OFF, AdapterSubState::PENDING, AdapterSubState::ON,
                                               AdapterSubState::PENDING, AdapterSubState::OFF }) );
    REQUIRE( 0 == h.fatal.get().size() );
}

TEST_CASE( "AdapterState User Turn Off Profiles Test 03", "[adapter][state][off]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();
    h.turnOnUser();
    h.service->clearNotifications();
    h.service->profilesRunning = true;

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_OFF) );
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::BEGIN_DISABLE) );

    // profile services still running, awaiting STOPPED
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::DISABLED) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( true == h.state().hasMessages(Opcode::STOP_TIMEOUT) );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STOPPED) );
    REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
    REQUIRE( false == h.state().hasMessages(Opcode::STOP_TIMEOUT) );

    const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
    INFO_STR( "Notifications "+toString(notifications) );
    REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_OFF, AdapterLifecycleState::OFF }) );
}

TEST_CASE( "AdapterState Power Hold Test 04", "[adapter][state][powerhold]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::POWER_ON) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( true == h.state().isTurningOn() );
    REQUIRE( false == h.state().isUserOperation() );
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::POWER_ON) );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::ENABLED_READY) );
    REQUIRE( AdapterSubState::POWERED == h.state().getCurrentState() );
    REQUIRE( 0 == h.log.count("props.onBluetoothReady") );
    REQUIRE( 0 == h.log.count("service.autoConnect") );
    REQUIRE( 1 == h.log.count("hal.vendorEvents.on") );

    // power hold is invisible to the user
    REQUIRE( 0 == h.service->getNotifications().size() );
    REQUIRE( AdapterLifecycleState::OFF == h.props->getState() );

    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::POWER_ON) );
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::USER_TURN_OFF) );
    REQUIRE( ProcessResult::REJECTED == h.sendAndWait(Opcode::DISABLED) );
    REQUIRE( AdapterSubState::POWERED == h.state().getCurrentState() );

    // fast path to ON
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_ON) );
    REQUIRE( AdapterSubState::ON == h.state().getCurrentState() );
    REQUIRE( 1 == h.log.count("hal.processStart") );
    REQUIRE( 1 == h.log.count("props.onBluetoothReady") );
    REQUIRE( 1 == h.log.count("service.autoConnect") );

    const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
    INFO_STR( "Notifications "+toString(notifications) );
    REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::ON }) );
}

TEST_CASE( "AdapterState Power Hold Release Test 05", "[adapter][state][powerhold]" ) {
    {
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();
        h.turnOnPowerHold();
        REQUIRE( AdapterSubState::POWERED == h.state().getCurrentState() );

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::POWER_OFF) );
        REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
        REQUIRE( true == h.state().isTurningOff() );
        REQUIRE( false == h.state().isUserOperation() );
        REQUIRE( true == h.state().hasMessages(Opcode::DISABLE_TIMEOUT) );
        REQUIRE( 1 == h.log.count("hal.vendorEvents.off") );
        REQUIRE( 1 == h.log.count("hal.disableNative") );

        REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::POWER_OFF) );

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::DISABLED) );
        REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
        REQUIRE( false == h.state().hasMessages(Opcode::DISABLE_TIMEOUT) );
        REQUIRE( 0 == h.service->getNotifications().size() );
    }
    {
        // disableNative failure keeps the radio powered
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();
        h.turnOnPowerHold();
        h.hal->disableResult = false;

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::POWER_OFF) );
        REQUIRE( AdapterSubState::POWERED == h.state().getCurrentState() );
        REQUIRE( false == h.state().isTurningOff() );
        REQUIRE( false == h.state().hasMessages(Opcode::DISABLE_TIMEOUT) );
        REQUIRE( 0 == h.service->getNotifications().size() );
        REQUIRE( 0 == h.fatal.get().size() );
    }
}

TEST_CASE( "AdapterState Upgrade Power Hold Test 06", "[adapter][state][powerhold]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::POWER_ON) );
    REQUIRE( false == h.state().isUserOperation() );

    // in-flight power hold start becomes a user operation, timers unchanged
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_ON) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( true == h.state().isTurningOn() );
    REQUIRE( true == h.state().isUserOperation() );
    REQUIRE( true == h.state().hasMessages(Opcode::START_TIMEOUT) );
    REQUIRE( 1 == h.log.count("hal.processStart") );

    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::USER_TURN_ON) );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::ENABLED_READY) );
    REQUIRE( AdapterSubState::ON == h.state().getCurrentState() );
    REQUIRE( 1 == h.log.count("service.autoConnect") );

    const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
    INFO_STR( "Notifications "+toString(notifications) );
    REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::ON }) );
}

TEST_CASE( "AdapterState Deferred Messages Test 07", "[adapter][state][deferred]" ) {
    {
        // USER_TURN_OFF during turn on is replayed once ON
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_ON) );
        REQUIRE( ProcessResult::DEFERRED == h.sendAndWait(Opcode::USER_TURN_OFF) );
        REQUIRE( ProcessResult::DEFERRED == h.sendAndWait(Opcode::POWER_OFF) );
        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );

        const jau::nsize_t idx = h.processed.size();
        h.state().sendMessage(Opcode::ENABLED_READY);
        REQUIRE( true == h.waitProcessed(idx+3) );
        {
            const ProcessedRecord r0 = h.processed.at(idx);
            REQUIRE( Opcode::ENABLED_READY == r0.opcode );
            REQUIRE( ProcessResult::HANDLED == r0.result );

            const ProcessedRecord r1 = h.processed.at(idx+1);
            REQUIRE( Opcode::USER_TURN_OFF == r1.opcode );
            REQUIRE( AdapterSubState::ON == r1.state );
            REQUIRE( ProcessResult::HANDLED == r1.result );

            // replayed in order, now ignored while turning off
            const ProcessedRecord r2 = h.processed.at(idx+2);
            REQUIRE( Opcode::POWER_OFF == r2.opcode );
            REQUIRE( AdapterSubState::PENDING == r2.state );
            REQUIRE( ProcessResult::IGNORED == r2.result );
        }
        REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
        REQUIRE( true == h.state().isTurningOff() );

        const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
        INFO_STR( "Notifications "+toString(notifications) );
        REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::ON,
                                                       AdapterLifecycleState::TURNING_OFF }) );
    }
    {
        // USER_TURN_ON during turn off is replayed once OFF
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();
        h.turnOnUser();

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_OFF) );
        REQUIRE( ProcessResult::DEFERRED == h.sendAndWait(Opcode::USER_TURN_ON) );
        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::BEGIN_DISABLE) );

        const jau::nsize_t idx = h.processed.size();
        h.state().sendMessage(Opcode::DISABLED);
        REQUIRE( true == h.waitProcessed(idx+2) );
        {
            const ProcessedRecord r1 = h.processed.at(idx+1);
            REQUIRE( Opcode::USER_TURN_ON == r1.opcode );
            REQUIRE( AdapterSubState::OFF == r1.state );
            REQUIRE( ProcessResult::HANDLED == r1.result );
        }
        REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
        REQUIRE( true == h.state().isTurningOn() );
        REQUIRE( true == h.state().isUserOperation() );
        REQUIRE( 2 == h.log.count("hal.processStart") );
    }
}

TEST_CASE( "AdapterState Disable Superseded Test 08", "[adapter][state][powerhold]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();
    h.turnOnUser();
    h.service->clearNotifications();

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_OFF) );
    h.service->powerLockHeld = true;

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::BEGIN_DISABLE) );
    REQUIRE( AdapterSubState::POWERED == h.state().getCurrentState() );
    REQUIRE( false == h.state().isTurningOff() );
    REQUIRE( false == h.state().isUserOperation() );
    REQUIRE( false == h.state().hasMessages(Opcode::SET_SCAN_MODE_TIMEOUT) );
    REQUIRE( false == h.state().hasMessages(Opcode::DISABLE_TIMEOUT) );
    REQUIRE( 0 == h.log.count("hal.disableNative") );
    REQUIRE( 0 == h.log.count("hal.vendorEvents.off") );

    // no notification beyond TURNING_OFF
    const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
    INFO_STR( "Notifications "+toString(notifications) );
    REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_OFF }) );
    REQUIRE( 0 == h.fatal.get().size() );
}

TEST_CASE( "AdapterState Native Failure Test 09", "[adapter][state][failure]" ) {
    {
        // disableNative failure returns to ON
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();
        h.turnOnUser();
        h.service->clearNotifications();
        h.hal->disableResult = false;

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_OFF) );
        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::BEGIN_DISABLE) );
        REQUIRE( AdapterSubState::ON == h.state().getCurrentState() );
        REQUIRE( false == h.state().isTurningOff() );
        REQUIRE( false == h.state().hasMessages(Opcode::DISABLE_TIMEOUT) );
        REQUIRE( 2 == h.log.count("service.autoConnect") );

        const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
        INFO_STR( "Notifications "+toString(notifications) );
        REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_OFF, AdapterLifecycleState::ON }) );
    }
    {
        // enableNative failure returns to OFF
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();
        h.hal->enableResult = false;

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_ON) );
        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );
        REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
        REQUIRE( false == h.state().isTurningOn() );
        REQUIRE( false == h.state().isUserOperation() );
        REQUIRE( false == h.state().hasMessages(Opcode::START_TIMEOUT) );
        REQUIRE( false == h.state().hasMessages(Opcode::ENABLE_TIMEOUT) );

        const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
        INFO_STR( "Notifications "+toString(notifications) );
        REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::OFF }) );
    }
    {
        // hardware reports DISABLED while turning on
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();

        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_ON) );
        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );
        REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::DISABLED) );
        REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
        REQUIRE( false == h.state().isTurningOn() );
        REQUIRE( false == h.state().hasMessages(Opcode::ENABLE_TIMEOUT) );
        REQUIRE( 1 == h.log.count("service.stopProfileServices") );

        const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
        INFO_STR( "Notifications "+toString(notifications) );
        REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::OFF }) );
        REQUIRE( 0 == h.fatal.get().size() );
    }
}

TEST_CASE( "AdapterState Unexpected Messages Test 10", "[adapter][state][rejected]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();

    const Opcode rejected[] = { Opcode::STARTED, Opcode::ENABLED_READY, Opcode::BEGIN_DISABLE,
                                Opcode::DISABLED, Opcode::STOPPED, Opcode::START_TIMEOUT,
                                Opcode::ENABLE_TIMEOUT, Opcode::DISABLE_TIMEOUT, Opcode::STOP_TIMEOUT,
                                Opcode::SET_SCAN_MODE_TIMEOUT };
    for(const Opcode opc : rejected) {
        INFO_STR( "OFF: "+to_string(opc) );
        REQUIRE( ProcessResult::REJECTED == h.sendAndWait(opc) );
        REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
    }
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::USER_TURN_OFF) );
    REQUIRE( ProcessResult::IGNORED == h.sendAndWait(Opcode::POWER_OFF) );

    REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
    REQUIRE( 0 == h.fatal.get().size() );
    REQUIRE( 0 == h.processed.countResult(ProcessResult::FATAL) );
    REQUIRE( 0 == h.service->getNotifications().size() );
    REQUIRE( 0 == h.log.get().size() );
    REQUIRE( true == h.state().isRunning() );
}

TEST_CASE( "AdapterState Lifecycle Test 11", "[adapter][state][lifecycle]" ) {
    {
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        REQUIRE_THROWS_AS( AdapterState(nullptr, h.props, h.service, longTimeouts()), PowerException );
        REQUIRE_THROWS_AS( AdapterState(h.hal, nullptr, h.service, longTimeouts()), PowerException );
        REQUIRE_THROWS_AS( AdapterState(h.hal, h.props, nullptr, longTimeouts()), PowerException );
    }
    {
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        REQUIRE( false == h.state().isRunning() );

        // hardware status mapping, queued only while not started
        h.state().stateChangeCallback(HALState::ON);
        REQUIRE( true == h.state().hasMessages(Opcode::ENABLED_READY) );
        h.state().stateChangeCallback(HALState::OFF);
        REQUIRE( true == h.state().hasMessages(Opcode::DISABLED) );
        h.state().removeMessages(Opcode::ENABLED_READY);
        h.state().removeMessages(Opcode::DISABLED);
        REQUIRE( false == h.state().hasMessages(Opcode::ENABLED_READY) );
        REQUIRE( false == h.state().hasMessages(Opcode::DISABLED) );

        h.state().start();
        REQUIRE_THROWS_AS( h.state().start(), PowerException );
        REQUIRE( true == waitUntil([&]() -> bool { return h.state().isRunning(); }) );
    }
    {
        // processing after cleanup
        PowerTestHarness h(false /* autoMode */, longTimeouts());
        h.state().start();
        h.state().cleanup();

        REQUIRE( ProcessResult::SHUTDOWN == h.sendAndWait(Opcode::USER_TURN_ON) );
        REQUIRE( ProcessResult::SHUTDOWN == h.sendAndWait(Opcode::STOP_TIMEOUT) );
        REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
        REQUIRE( 0 == h.log.count("hal.processStart") );
        REQUIRE( 0 == h.fatal.get().size() );

        h.state().quit();
        REQUIRE( false == h.state().isRunning() );
    }
}

TEST_CASE( "AdapterState Auto Mode Test 12", "[adapter][state][auto]" ) {
    PowerTestHarness h(true /* autoMode */, longTimeouts());
    h.state().start();

    h.state().sendMessage(Opcode::USER_TURN_ON);
    REQUIRE( true == waitUntil([&]() -> bool { return AdapterSubState::ON == h.state().getCurrentState(); }) );

    h.state().sendMessage(Opcode::USER_TURN_OFF);
    REQUIRE( true == waitUntil([&]() -> bool { return AdapterSubState::OFF == h.state().getCurrentState(); }) );
    REQUIRE( AdapterLifecycleState::OFF == h.props->getState() );

    const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
    INFO_STR( "Notifications "+toString(notifications) );
    REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::ON,
                                                   AdapterLifecycleState::TURNING_OFF, AdapterLifecycleState::OFF }) );
    REQUIRE( 0 == h.processed.countResult(ProcessResult::REJECTED) );
    REQUIRE( 0 == h.fatal.get().size() );
}

class SubStateRecorder {
    private:
        mutable std::mutex mtx;
        jau::darray<AdapterSubState> states;

    public:
        void onSubState(AdapterSubState s) {
            const std::lock_guard<std::mutex> lock(mtx);
            states.push_back(s);
        }
        jau::darray<AdapterSubState> get() const {
            const std::lock_guard<std::mutex> lock(mtx);
            return states;
        }
};

TEST_CASE( "AdapterState Listener and Delayed Send Test 13", "[adapter][state][listener]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    SubStateRecorder rec;
    const AdapterSubStateCallback cb = jau::bind_member(&rec, &SubStateRecorder::onSubState);
    REQUIRE( true == h.state().addSubStateListener(cb) );
    REQUIRE( false == h.state().addSubStateListener(cb) );

    h.state().start();
    REQUIRE( true == waitUntil([&]() -> bool { return h.state().isRunning(); }) );

    const uint64_t t0 = jau::getCurrentMilliseconds();
    h.state().sendMessageDelayed(Opcode::USER_TURN_ON, 100_ms);
    REQUIRE( true == h.state().hasMessages(Opcode::USER_TURN_ON) );
    REQUIRE( true == h.waitProcessed(1) );
    const uint64_t td = jau::getCurrentMilliseconds() - t0;
    INFO_STR( "Delayed USER_TURN_ON processed after "+std::to_string(td)+" ms" );
    REQUIRE( 100 <= td );
    REQUIRE( Opcode::USER_TURN_ON == h.processed.at(0).opcode );
    REQUIRE( ProcessResult::HANDLED == h.processed.at(0).result );

    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::ENABLED_READY) );
    {
        const jau::darray<AdapterSubState> states = rec.get();
        INFO_STR( "SubStates "+toString(states) );
        REQUIRE( 2 <= states.size() );
        REQUIRE( AdapterSubState::ON == states[states.size()-1] );
        REQUIRE( AdapterSubState::PENDING == states[states.size()-2] );
    }

    // removed listener sees no further states
    REQUIRE( true == h.state().removeSubStateListener(cb) );
    REQUIRE( false == h.state().removeSubStateListener(cb) );
    const jau::nsize_t count = rec.get().size();
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_OFF) );
    REQUIRE( count == rec.get().size() );

    h.state().quit();
}

TEST_CASE( "AdapterState Collaborator Exception Test 14", "[adapter][state][exception]" ) {
    PowerTestHarness h(false /* autoMode */, longTimeouts());
    h.state().start();
    REQUIRE( true == waitUntil([&]() -> bool { return h.state().isRunning(); }) );

    // throwing processStart leaves OFF untouched, the TURNING_ON announcement is revoked
    h.hal->throwOnStart = true;
    REQUIRE( ProcessResult::REJECTED == h.sendAndWait(Opcode::USER_TURN_ON) );
    REQUIRE( AdapterSubState::OFF == h.state().getCurrentState() );
    REQUIRE( false == h.state().isTurningOn() );
    REQUIRE( false == h.state().isUserOperation() );
    REQUIRE( false == h.state().hasMessages(Opcode::START_TIMEOUT) );
    REQUIRE( AdapterLifecycleState::OFF == h.props->getState() );
    {
        const jau::darray<AdapterLifecycleState> notifications = h.service->getNotifications();
        INFO_STR( "Notifications "+toString(notifications) );
        REQUIRE( true == sameSequence(notifications, { AdapterLifecycleState::TURNING_ON, AdapterLifecycleState::OFF }) );
        const jau::darray<AdapterSubState> subStates = h.service->getSubStates();
        INFO_STR( "SubStates "+toString(subStates) );
        REQUIRE( true == sameSequence(subStates, { AdapterSubState::OFF }) );
    }
    REQUIRE( true == h.state().isRunning() );

    // throwing enableNative keeps PENDING turning on with the start timeout re-armed
    h.hal->throwOnStart = false;
    h.hal->throwOnEnable = true;
    h.service->clearNotifications();
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::USER_TURN_ON) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( ProcessResult::REJECTED == h.sendAndWait(Opcode::STARTED) );
    REQUIRE( AdapterSubState::PENDING == h.state().getCurrentState() );
    REQUIRE( true == h.state().isTurningOn() );
    REQUIRE( true == h.state().isUserOperation() );
    REQUIRE( true == h.state().hasMessages(Opcode::START_TIMEOUT) );
    REQUIRE( false == h.state().hasMessages(Opcode::ENABLE_TIMEOUT) );
    REQUIRE( AdapterLifecycleState::TURNING_ON == h.props->getState() );

    // recovers once the hardware cooperates
    h.hal->throwOnEnable = false;
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::STARTED) );
    REQUIRE( ProcessResult::HANDLED == h.sendAndWait(Opcode::ENABLED_READY) );
    REQUIRE( AdapterSubState::ON == h.state().getCurrentState() );
    REQUIRE( false == h.state().hasMessages(Opcode::START_TIMEOUT) );
    REQUIRE( 0 == h.fatal.get().size() );

    h.state().quit();
}
