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
#include <cstdlib>
#include <cinttypes>

#include <atomic>
#include <initializer_list>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>
#include <jau/functional.hpp>
#include <jau/fraction_type.hpp>

#include <bt_power/AdapterState.hpp>
#include <bt_power/VendorEventRegistry.hpp>

extern "C" {
    #include <unistd.h>
}

using namespace bt_power;
using namespace jau;
using namespace jau::fractions_i64_literals;

/** \file
 * This _bt_power_sim_ example drives an AdapterState through its power lifecycle
 * using simulated hardware, adapter properties and adapter service.
 *
 * A VendorEventListener acts as power hold, user turn on and off requests are issued on top.
 *
 * Simulated hardware completions are posted with a configurable latency.
 */

static int64_t HW_LATENCY_MS = 50;
static bool FAIL_ENABLE = false;
static bool SHOW_PROCESSED = false;
static int LOOP_COUNT = 1;

static std::atomic<int> startedCount(0);

static vendor_payload_t bytes(std::initializer_list<uint8_t> list) {
    vendor_payload_t res;
    for(const uint8_t b : list) {
        res.push_back(b);
    }
    return res;
}

class SimHAL : public PowerHAL {
    private:
        AdapterState* adapterState = nullptr;

        void complete(const AdapterMessage::Opcode opc, const HALState status) {
            if( nullptr == adapterState ) {
                return;
            }
            if( 0 < HW_LATENCY_MS ) {
                adapterState->sendMessageDelayed(opc, HW_LATENCY_MS * 1_ms);
            } else {
                adapterState->stateChangeCallback(status);
            }
        }

    public:
        void attach(AdapterState* s) { adapterState = s; }

        void processStart() override {
            fprintf_td(stderr, "****** HAL: processStart\n");
            if( nullptr != adapterState ) {
                adapterState->sendMessageDelayed(AdapterMessage::Opcode::STARTED, HW_LATENCY_MS * 1_ms);
            }
        }
        bool enableNative() override {
            fprintf_td(stderr, "****** HAL: enableNative%s\n", FAIL_ENABLE ? " -> failure" : "");
            if( FAIL_ENABLE ) {
                return false;
            }
            complete(AdapterMessage::Opcode::ENABLED_READY, HALState::ON);
            return true;
        }
        bool disableNative() override {
            fprintf_td(stderr, "****** HAL: disableNative\n");
            complete(AdapterMessage::Opcode::DISABLED, HALState::OFF);
            return true;
        }
        bool setVendorEventsEnabled(const bool enable) override {
            fprintf_td(stderr, "****** HAL: vendor events %s\n", enable ? "on" : "off");
            return true;
        }
        void forceCleanup() override {
            fprintf_td(stderr, "****** HAL: forceCleanup\n");
        }
};

class SimProperties : public AdapterProperties {
    private:
        AdapterState* adapterState = nullptr;
        std::atomic<AdapterLifecycleState> state { AdapterLifecycleState::OFF };

    public:
        void attach(AdapterState* s) { adapterState = s; }

        AdapterLifecycleState getState() const override { return state; }
        void setState(const AdapterLifecycleState s) override { state = s; }

        void onBluetoothReady() override {
            fprintf_td(stderr, "****** Properties: Bluetooth ready\n");
        }
        void onBluetoothDisable() override {
            fprintf_td(stderr, "****** Properties: Bluetooth disable, scan mode cleared\n");
            if( nullptr != adapterState ) {
                adapterState->sendMessage(AdapterMessage::Opcode::BEGIN_DISABLE);
            }
        }
};

class SimService : public AdapterService {
    private:
        VendorEventRegistry* registry = nullptr;

    public:
        void attach(VendorEventRegistry* r) { registry = r; }

        void updateStateMachineState(const AdapterSubState s) override {
            fprintf_td(stderr, "****** Service: State machine %s\n", to_string(s).c_str());
        }
        void updateAdapterState(const AdapterLifecycleState oldState, const AdapterLifecycleState newState) override {
            fprintf_td(stderr, "****** Service: Adapter state %s -> %s\n", to_string(oldState).c_str(), to_string(newState).c_str());
        }
        void autoConnect() override {
            fprintf_td(stderr, "****** Service: autoConnect\n");
        }
        bool stopProfileServices() override {
            return false; // no profile services running
        }
        bool isPowerLockHeld() override {
            return nullptr != registry && registry->areLocksHeld();
        }
};

class SimVendorListener : public VendorEventListener {
    public:
        void interfaceReady() override {
            fprintf_td(stderr, "****** VendorListener: interfaceReady\n");
        }
        void interfaceDown() override {
            fprintf_td(stderr, "****** VendorListener: interfaceDown\n");
        }
        void vendorEventReceived(const vendor_payload_t& payload) override {
            fprintf_td(stderr, "****** VendorListener: vendor event, %zu bytes\n", (size_t)payload.size());
        }
        std::string toString() const override { return "SimVendorListener["+to_hexstring(this)+"]"; }
};

static void onFatalError(const AdapterMessage& msg) {
    fprintf_td(stderr, "****** FATAL %s\n", msg.toString().c_str());
    ABORT("bt_power_sim: Unrecoverable %s", msg.toString().c_str());
}

static void onProcessed(const AdapterMessage& msg, AdapterSubState s, ProcessResult res) {
    if( msg == AdapterMessage::Opcode::STARTED ) {
        startedCount++;
    }
    if( SHOW_PROCESSED ) {
        fprintf_td(stderr, "****** Processed %s in %s: %s\n", msg.toString().c_str(), to_string(s).c_str(), to_string(res).c_str());
    }
}

static bool waitForState(AdapterState& adapterState, const AdapterSubState s) {
    const uint64_t t0 = getCurrentMilliseconds();
    while( s != adapterState.getCurrentState() ) {
        if( getCurrentMilliseconds() - t0 > 10000 ) {
            fprintf_td(stderr, "****** Timeout waiting for %s: %s\n", to_string(s).c_str(), adapterState.toString().c_str());
            return false;
        }
        sleep_for( 10_ms );
    }
    fprintf_td(stderr, "****** Reached %s\n", to_string(s).c_str());
    return true;
}

static bool test() {
    std::shared_ptr<SimHAL> hal = std::make_shared<SimHAL>();
    std::shared_ptr<SimProperties> props = std::make_shared<SimProperties>();
    std::shared_ptr<SimService> service = std::make_shared<SimService>();

    AdapterState adapterState(hal, props, service);
    hal->attach(&adapterState);
    props->attach(&adapterState);
    adapterState.setFatalErrorCallback( bind_free(&onFatalError) );
    adapterState.addProcessedMessageListener( bind_free(&onProcessed) );

    bool res = true;
    {
        VendorEventRegistry registry(adapterState);
        service->attach(&registry);
        adapterState.start();
        fprintf_td(stderr, "****** Started: %s\n", adapterState.toString().c_str());

        for(int i=0; res && i<LOOP_COUNT; ++i) {
            fprintf_td(stderr, "****** Loop %d/%d\n", i+1, LOOP_COUNT);

            std::shared_ptr<SimVendorListener> listener = std::make_shared<SimVendorListener>();
            const int started0 = startedCount;
            registry.registerListener(listener, bytes({ 0xff }), bytes({ 0x01 }));
            if( FAIL_ENABLE ) {
                // hardware start completes, enable fails and falls back to OFF
                const uint64_t t0 = getCurrentMilliseconds();
                while( started0 == startedCount && getCurrentMilliseconds() - t0 < 10000 ) {
                    sleep_for( 10_ms );
                }
                res = started0 < startedCount && waitForState(adapterState, AdapterSubState::OFF);
                registry.unregisterListener(listener);
                break;
            }
            res = waitForState(adapterState, AdapterSubState::POWERED);
            if( !res ) {
                registry.unregisterListener(listener);
                break;
            }
            registry.onVendorEvent( bytes({ 0x01, 0x02, 0x03 }) );

            adapterState.sendMessage(AdapterMessage::Opcode::USER_TURN_ON);
            res = waitForState(adapterState, AdapterSubState::ON);

            // superseded by the power hold
            adapterState.sendMessage(AdapterMessage::Opcode::USER_TURN_OFF);
            res = res && waitForState(adapterState, AdapterSubState::POWERED);

            registry.unregisterListener(listener);
            res = res && waitForState(adapterState, AdapterSubState::OFF);

            adapterState.sendMessage(AdapterMessage::Opcode::USER_TURN_ON);
            res = res && waitForState(adapterState, AdapterSubState::ON);
            adapterState.sendMessage(AdapterMessage::Opcode::USER_TURN_OFF);
            res = res && waitForState(adapterState, AdapterSubState::OFF);
        }
        adapterState.quit();
        service->attach(nullptr);
    }
    fprintf_td(stderr, "****** End: %s\n", adapterState.toString().c_str());
    return res;
}

int main(int argc, char *argv[])
{
    bool waitForEnter=false;

    for(int i=1; i<argc; i++) {
        fprintf(stderr, "arg[%d/%d]: '%s'\n", i, argc, argv[i]);

        if( !strcmp("-btp_debug", argv[i]) && argc > (i+1) ) {
            setenv("bt_power.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-btp_verbose", argv[i]) && argc > (i+1) ) {
            setenv("bt_power.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-btp_adapter", argv[i]) && argc > (i+1) ) {
            setenv("bt_power.adapter", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-wait", argv[i]) ) {
            waitForEnter = true;
        } else if( !strcmp("-show_processed", argv[i]) ) {
            SHOW_PROCESSED = true;
        } else if( !strcmp("-failEnable", argv[i]) ) {
            FAIL_ENABLE = true;
        } else if( !strcmp("-latency", argv[i]) && argc > (i+1) ) {
            HW_LATENCY_MS = atoi(argv[++i]);
        } else if( !strcmp("-count", argv[i]) && argc > (i+1) ) {
            LOOP_COUNT = atoi(argv[++i]);
        }
    }
    fprintf_td(stderr, "pid %d\n", getpid());

    fprintf_td(stderr, "Run with '[-count <number>] [-latency <ms>] [-failEnable] [-show_processed] "
                    "[-btp_verbose true|false] "
                    "[-btp_debug true|false|adapter.event,vendor.event] "
                    "[-btp_adapter start.timeout=5s,enable.timeout=8s,disable.timeout=8s,stop.timeout=5s,scanmode.timeout=2s,...] "
                    "\n");

    fprintf_td(stderr, "LOOP_COUNT %d\n", LOOP_COUNT);
    fprintf_td(stderr, "HW_LATENCY_MS %" PRIi64 "\n", HW_LATENCY_MS);
    fprintf_td(stderr, "FAIL_ENABLE %d\n", FAIL_ENABLE);
    fprintf_td(stderr, "SHOW_PROCESSED %d\n", SHOW_PROCESSED);

    if( waitForEnter ) {
        fprintf_td(stderr, "Press ENTER to continue\n");
        getchar();
    }
    fprintf_td(stderr, "****** TEST start\n");
    const bool res = test();
    fprintf_td(stderr, "****** TEST end: %s\n", res ? "OK" : "FAILED");
    return res ? 0 : 1;
}
