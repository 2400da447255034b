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
#include <cinttypes>

#include <jau/debug.hpp>

#include "AdapterMessage.hpp"

using namespace bt_power;

#define OPCODE_ENUM(X) \
    X(INVALID) \
    X(USER_TURN_ON) \
    X(STARTED) \
    X(ENABLED_READY) \
    X(POWER_ON) \
    X(USER_TURN_OFF) \
    X(BEGIN_DISABLE) \
    X(POWER_OFF) \
    X(DISABLED) \
    X(STOPPED) \
    X(START_TIMEOUT) \
    X(ENABLE_TIMEOUT) \
    X(DISABLE_TIMEOUT) \
    X(STOP_TIMEOUT) \
    X(SET_SCAN_MODE_TIMEOUT)

#define CASE_TO_STRING(V) case Opcode::V: return #V;

std::string AdapterMessage::getOpcodeString(const Opcode opc) noexcept {
    switch(opc) {
        OPCODE_ENUM(CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown Opcode "+jau::to_hexstring(number(opc));
}

std::string AdapterMessage::toString() const noexcept {
    return "AdapterMessage["+getOpcodeString(opcode)+" ("+std::to_string(number(opcode))+
           "), ts "+std::to_string(ts_creation)+"]";
}
