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
#include <chrono>

#include <jau/debug.hpp>

#include "MessageQueue.hpp"

using namespace bt_power;

MessageQueue::MessageQueue() noexcept
: next_seq(0), interrupted_flag(false)
{ }

void MessageQueue::insertDelayedLocked(Entry && e) noexcept {
    // sorted by (due, seq), seq being strictly increasing: insert after all entries with due <= e.due
    auto it = delayed.begin();
    while( it != delayed.end() && it->due <= e.due ) {
        ++it;
    }
    delayed.insert(it, std::move(e));
}

void MessageQueue::promoteDueLocked(const uint64_t now) noexcept {
    jau::nsize_t count = 0;
    while( count < delayed.size() && delayed[count].due <= now ) {
        ready.push_back( delayed[count] );
        ++count;
    }
    if( 0 < count ) {
        delayed.erase(delayed.begin(), delayed.begin()+count);
    }
}

void MessageQueue::put(const AdapterMessage& msg) noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
        const uint64_t now = jau::getCurrentMilliseconds();
        promoteDueLocked(now);
        ready.push_back( Entry { msg, now, next_seq++ } );
    }
    cv_queue.notify_all();
}

void MessageQueue::putDelayed(const AdapterMessage& msg, const jau::fraction_i64& delay) noexcept {
    const int64_t delay_ms = delay.to_ms();
    if( 0 >= delay_ms ) {
        put(msg);
        return;
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
        const uint64_t now = jau::getCurrentMilliseconds();
        promoteDueLocked(now);
        insertDelayedLocked( Entry { msg, now + static_cast<uint64_t>(delay_ms), next_seq++ } );
    }
    cv_queue.notify_all();
}

void MessageQueue::putFront(const jau::darray<AdapterMessage>& msgs) noexcept {
    if( 0 == msgs.size() ) {
        return;
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
        const uint64_t now = jau::getCurrentMilliseconds();
        jau::darray<Entry> head;
        head.reserve( msgs.size() + ready.size() );
        for(const AdapterMessage& m : msgs) {
            head.push_back( Entry { m, now, next_seq++ } );
        }
        for(const Entry& e : ready) {
            head.push_back( e );
        }
        ready = std::move(head);
    }
    cv_queue.notify_all();
}

jau::nsize_t MessageQueue::remove(const AdapterMessage::Opcode opc) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
    jau::nsize_t count = 0;
    for(auto it = ready.begin(); it != ready.end(); ) {
        if( it->msg == opc ) {
            it = ready.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    for(auto it = delayed.begin(); it != delayed.end(); ) {
        if( it->msg == opc ) {
            it = delayed.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

bool MessageQueue::hasMessages(const AdapterMessage::Opcode opc) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
    for(const Entry& e : ready) {
        if( e.msg == opc ) {
            return true;
        }
    }
    for(const Entry& e : delayed) {
        if( e.msg == opc ) {
            return true;
        }
    }
    return false;
}

bool MessageQueue::getBlocking(AdapterMessage& dest, const jau::fraction_i64& timeout) noexcept {
    const int64_t timeout_ms = timeout.to_ms();
    const bool infinite = 0 >= timeout_ms;
    std::unique_lock<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
    const uint64_t t0 = jau::getCurrentMilliseconds();
    const uint64_t deadline = infinite ? 0 : t0 + static_cast<uint64_t>(timeout_ms);

    while( true ) {
        if( interrupted_flag ) {
            interrupted_flag = false;
            return false;
        }
        const uint64_t now = jau::getCurrentMilliseconds();
        promoteDueLocked(now);
        if( 0 < ready.size() ) {
            dest = ready[0].msg;
            ready.erase(ready.begin());
            return true;
        }
        if( !infinite && now >= deadline ) {
            return false;
        }
        // wake up for the next delayed message or the deadline, whichever comes first
        uint64_t wake = infinite ? 0 : deadline;
        if( 0 < delayed.size() && ( 0 == wake || delayed[0].due < wake ) ) {
            wake = delayed[0].due;
        }
        if( 0 == wake ) {
            cv_queue.wait(lock);
        } else {
            cv_queue.wait_for(lock, std::chrono::milliseconds(wake - now));
        }
    }
}

void MessageQueue::interrupt() noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
        interrupted_flag = true;
    }
    cv_queue.notify_all();
}

void MessageQueue::clear() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
    ready.clear();
    delayed.clear();
}

jau::nsize_t MessageQueue::size() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
    return ready.size() + delayed.size();
}

jau::nsize_t MessageQueue::delayedSize() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
    return delayed.size();
}

std::string MessageQueue::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_queue); // RAII-style acquire and relinquish via destructor
    std::string res = "MessageQueue[ready "+std::to_string(ready.size())+", delayed "+std::to_string(delayed.size());
    if( 0 < ready.size() ) {
        res += ", next "+ready[0].msg.toString();
    }
    res += "]";
    return res;
}
