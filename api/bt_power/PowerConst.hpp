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

#ifndef BTP_CONST_HPP_
#define BTP_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace bt_power {

    using namespace jau::fractions_i64_literals;

    /**
     * Maximum time to wait for a worker thread shutdown.
     *
     * Used for the AdapterState message worker and the VendorEventRegistry ready delivery.
     */
    inline constexpr const jau::fraction_i64 THREAD_SHUTDOWN_TIMEOUT = 8_s;

    /**
     * Default delay for the start of the hardware process, see AdapterMessage::Opcode::START_TIMEOUT.
     */
    inline constexpr const jau::fraction_i64 START_TIMEOUT_DELAY = 5_s;

    /**
     * Default delay for the hardware enable sequence, see AdapterMessage::Opcode::ENABLE_TIMEOUT.
     */
    inline constexpr const jau::fraction_i64 ENABLE_TIMEOUT_DELAY = 8_s;

    /**
     * Default delay for the hardware disable sequence, see AdapterMessage::Opcode::DISABLE_TIMEOUT.
     */
    inline constexpr const jau::fraction_i64 DISABLE_TIMEOUT_DELAY = 8_s;

    /**
     * Default delay for stopping all profile services, see AdapterMessage::Opcode::STOP_TIMEOUT.
     */
    inline constexpr const jau::fraction_i64 STOP_TIMEOUT_DELAY = 5_s;

    /**
     * Default delay for clearing the scan mode before disabling, see AdapterMessage::Opcode::SET_SCAN_MODE_TIMEOUT.
     */
    inline constexpr const jau::fraction_i64 PROPERTY_OP_DELAY = 2_s;

} // namespace bt_power

#endif /* BTP_CONST_HPP_ */
