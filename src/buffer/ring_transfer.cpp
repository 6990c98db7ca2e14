#include "ring_transfer.h"
#include <cstring>

namespace ringbuf {

size_t writeSome(RingBuffer& buffer, const uint8_t* src, size_t length)
{
    if (length > 0 && src == nullptr) {
        throw std::invalid_argument("writeSome: source is null");
    }
    size_t offset = 0;
    return produce(buffer, length, [&](uint8_t* dst, size_t capacity) {
        std::memcpy(dst, src + offset, capacity);
        offset += capacity;
        return capacity;
    });
}

size_t readSome(RingBuffer& buffer, uint8_t* dst, size_t length)
{
    if (length > 0 && dst == nullptr) {
        throw std::invalid_argument("readSome: destination is null");
    }
    size_t offset = 0;
    return consume(buffer, length, [&](const uint8_t* src, size_t available) {
        std::memcpy(dst + offset, src, available);
        offset += available;
        return available;
    });
}

size_t discard(RingBuffer& buffer, size_t length)
{
    return consume(buffer, length, [](const uint8_t*, size_t available) {
        return available;
    });
}

} // namespace ringbuf
