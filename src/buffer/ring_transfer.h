#pragma once

#include "ring_buffer.h"
#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace ringbuf {

namespace detail {

inline int toRequest(size_t length)
{
    return static_cast<int>(std::min<size_t>(length, INT_MAX));
}

} // namespace detail

/**
 * @brief Let a producer fill free space directly, without an intermediate copy.
 *
 * producer(uint8_t* dst, size_t capacity) -> size_t is called once per
 * contiguous window (at most twice, the second call covering wrap-around)
 * and returns how many bytes it stored. Returning less than capacity ends
 * the transfer. If the producer throws, the writer session is closed with
 * nothing committed and the exception propagates.
 *
 * @return total bytes committed, 0 when the buffer is full
 */
template <typename Producer>
size_t produce(RingBuffer& buffer, size_t maxLength, Producer&& producer)
{
    size_t total = 0;
    for (int pass = 0; pass < 2 && total < maxLength; ++pass) {
        const Range range = buffer.beginWriting(detail::toRequest(maxLength - total));
        size_t produced = 0;
        try {
            if (range.isValid()) {
                produced = producer(buffer.data() + range.start(), static_cast<size_t>(range.length()));
                if (produced > static_cast<size_t>(range.length())) {
                    throw std::out_of_range("Producer reported more bytes than the writable window");
                }
            }
        } catch (...) {
            buffer.finishWriting(0);
            throw;
        }
        buffer.finishWriting(static_cast<int>(produced));
        total += produced;
        if (!range.isValid() || produced < static_cast<size_t>(range.length())) {
            break;
        }
    }
    return total;
}

/**
 * @brief Hand stored bytes to a consumer in place. Mirror image of produce().
 *
 * consumer(const uint8_t* src, size_t available) -> size_t returns how many
 * bytes it took.
 *
 * @return total bytes consumed, 0 when the buffer is empty
 */
template <typename Consumer>
size_t consume(RingBuffer& buffer, size_t maxLength, Consumer&& consumer)
{
    size_t total = 0;
    for (int pass = 0; pass < 2 && total < maxLength; ++pass) {
        const Range range = buffer.beginReading(detail::toRequest(maxLength - total));
        size_t consumed = 0;
        try {
            if (range.isValid()) {
                const uint8_t* src = buffer.data() + range.start();
                consumed = consumer(src, static_cast<size_t>(range.length()));
                if (consumed > static_cast<size_t>(range.length())) {
                    throw std::out_of_range("Consumer reported more bytes than the readable window");
                }
            }
        } catch (...) {
            buffer.finishReading(0);
            throw;
        }
        buffer.finishReading(static_cast<int>(consumed));
        total += consumed;
        if (!range.isValid() || consumed < static_cast<size_t>(range.length())) {
            break;
        }
    }
    return total;
}

// Copy up to length bytes in. Returns the number copied; never waits for space.
size_t writeSome(RingBuffer& buffer, const uint8_t* src, size_t length);

// Copy up to length bytes out. Returns the number copied; never waits for data.
size_t readSome(RingBuffer& buffer, uint8_t* dst, size_t length);

// Drop up to length stored bytes without copying them
size_t discard(RingBuffer& buffer, size_t length);

} // namespace ringbuf
