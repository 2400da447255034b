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

#ifndef BTP_MESSAGE_QUEUE_HPP_
#define BTP_MESSAGE_QUEUE_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <mutex>
#include <condition_variable>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/fraction_type.hpp>

#include "AdapterMessage.hpp"

namespace bt_power {

    /** \addtogroup BTPowerAPI
     *
     *  @{
     */

    /**
     * Message queue with delayed delivery, feeding the AdapterState worker.
     *
     * Producer side is thread safe, consumption via getBlocking() is meant for a single consumer thread.
     *
     * Delayed messages become due no earlier than their requested delay
     * and are delivered in order of their due time, FIFO among equal due times.
     * A due delayed message is moved to the tail of the immediate messages,
     * latest when the next message is posted or retrieved.
     */
    class MessageQueue {
        private:
            struct Entry {
                AdapterMessage msg;
                /** Monotonic due time in milliseconds */
                uint64_t due;
                /** Insertion sequence, breaking ties of equal due times */
                uint64_t seq;
            };

            mutable std::mutex mtx_queue;
            std::condition_variable cv_queue;
            /** Due messages, consumed from the front. */
            jau::darray<Entry> ready;
            /** Delayed messages, sorted by (due, seq). */
            jau::darray<Entry> delayed;
            uint64_t next_seq;
            bool interrupted_flag;

            void insertDelayedLocked(Entry && e) noexcept;
            void promoteDueLocked(const uint64_t now) noexcept;

        public:
            MessageQueue() noexcept;

            MessageQueue(const MessageQueue&) = delete;
            void operator=(const MessageQueue&) = delete;

            /** Appends the given message at the tail. */
            void put(const AdapterMessage& msg) noexcept;

            /**
             * Schedules the given message for delivery not before the given delay.
             *
             * A non-positive delay is equivalent to put().
             */
            void putDelayed(const AdapterMessage& msg, const jau::fraction_i64& delay) noexcept;

            /**
             * Re-inserts the given messages at the head of the queue, preserving their order.
             */
            void putFront(const jau::darray<AdapterMessage>& msgs) noexcept;

            /**
             * Removes all not yet delivered messages of the given Opcode, immediate and delayed.
             * @return number of removed messages
             */
            jau::nsize_t remove(const AdapterMessage::Opcode opc) noexcept;

            /** Returns true if at least one not yet delivered message of the given Opcode is queued, immediate or delayed. */
            bool hasMessages(const AdapterMessage::Opcode opc) const noexcept;

            /**
             * Blocking retrieval of the next due message.
             *
             * @param dest destination of the retrieved message
             * @param timeout maximum duration to wait, jau::fractions_i64::zero waits infinitely
             * @return true if a message has been retrieved, otherwise false on timeout or interrupt()
             */
            bool getBlocking(AdapterMessage& dest, const jau::fraction_i64& timeout) noexcept;

            /**
             * Interrupts a blocked getBlocking() call, which returns false.
             *
             * The interrupt state is consumed by the woken getBlocking().
             */
            void interrupt() noexcept;

            /** Drops all immediate and delayed messages. */
            void clear() noexcept;

            /** Number of all queued messages, immediate and delayed. */
            jau::nsize_t size() const noexcept;

            /** Number of delayed messages not yet due, see size(). */
            jau::nsize_t delayedSize() const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace bt_power

#endif /* BTP_MESSAGE_QUEUE_HPP_ */
