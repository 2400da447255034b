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
#include <cstdint>

#include <jau/debug.hpp>

#include "PowerTypes.hpp"

using namespace bt_power;

#define ADAPTERSUBSTATE_ENUM(X) \
    X(PENDING) \
    X(OFF) \
    X(POWERED) \
    X(ON)

#define ADAPTERSUBSTATE_CASE_TO_STRING(V) case AdapterSubState::V: return #V;

std::string bt_power::to_string(const AdapterSubState v) noexcept {
    switch(v) {
        ADAPTERSUBSTATE_ENUM(ADAPTERSUBSTATE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown AdapterSubState "+jau::to_hexstring(number(v));
}

std::string bt_power::to_string(const AdapterLifecycleState v) noexcept {
    switch(v) {
        case AdapterLifecycleState::OFF: return "OFF";
        case AdapterLifecycleState::TURNING_ON: return "TURNING_ON";
        case AdapterLifecycleState::ON: return "ON";
        case AdapterLifecycleState::TURNING_OFF: return "TURNING_OFF";
    }
    return "Unknown AdapterLifecycleState "+jau::to_hexstring(number(v));
}

std::string bt_power::to_string(const HALState v) noexcept {
    switch(v) {
        case HALState::OFF: return "OFF";
        case HALState::ON: return "ON";
    }
    return "Unknown HALState "+jau::to_hexstring(number(v));
}

#define PROCESSRESULT_ENUM(X) \
    X(HANDLED) \
    X(IGNORED) \
    X(DEFERRED) \
    X(REJECTED) \
    X(FATAL) \
    X(SHUTDOWN)

#define PROCESSRESULT_CASE_TO_STRING(V) case ProcessResult::V: return #V;

std::string bt_power::to_string(const ProcessResult v) noexcept {
    switch(v) {
        PROCESSRESULT_ENUM(PROCESSRESULT_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ProcessResult "+jau::to_hexstring(number(v));
}
