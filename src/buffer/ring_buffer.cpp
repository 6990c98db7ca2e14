#include "ring_buffer.h"
#include <log/log_manager.h>
#include <fmt/format.h>
#include <algorithm>

namespace ringbuf {

namespace {

// Resets a session flag when the enclosing scope exits, normally or by throw.
class SessionCloser {
public:
    explicit SessionCloser(bool& flag) : m_flag(flag) {}
    ~SessionCloser() { m_flag = false; }
    SessionCloser(const SessionCloser&) = delete;
    SessionCloser& operator=(const SessionCloser&) = delete;
private:
    bool& m_flag;
};

template <typename Error>
[[noreturn]] void fail(const std::string& message)
{
    LOG_WARN("RingBuffer: {}", message);
    throw Error(message);
}

int checkedCapacity(int capacity)
{
    if (capacity < 0) {
        fail<std::invalid_argument>(fmt::format("Capacity must not be negative, got {}", capacity));
    }
    return capacity;
}

// Offsets are summed in 64 bits so capacities near INT_MAX cannot overflow.
int wrap(int64_t offset, int capacity)
{
    return static_cast<int>(offset % capacity);
}

// Inclusive end of a window starting at start, capped by bound (exclusive)
int windowEnd(int start, int maxLength, int64_t bound)
{
    const int64_t wanted = static_cast<int64_t>(start) + maxLength;
    return static_cast<int>(std::min(wanted, bound)) - 1;
}

} // namespace

std::string Range::toString() const
{
    return fmt::format("[{}..{}]", start_, end_);
}

std::ostream& operator<<(std::ostream& os, const Range& range)
{
    return os << range.toString();
}

RingBuffer::RingBuffer(int capacity)
    : capacity_(checkedCapacity(capacity))
    , storage_(static_cast<size_t>(capacity_))
{
    LOG_DEBUG("RingBuffer created with capacity {}", capacity_);
}

Range RingBuffer::beginWriting(int maxLength)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (writing_) {
        fail<IllegalStateError>("Cannot begin writing until previous writing finished");
    }
    writing_ = true;

    if (maxLength < 0) {
        fail<std::invalid_argument>(fmt::format("Max length {} is less than 0", maxLength));
    }

    if (size_ == capacity_ || maxLength == 0) {
        return Range{};
    }

    const int start = wrap(static_cast<int64_t>(index_) + size_, capacity_);
    // Free space wrapped around: stop right before the unread data.
    // Otherwise stop at the physical end of storage.
    const int bound = start < index_ ? index_ : capacity_;
    return Range(start, windowEnd(start, maxLength, bound));
}

void RingBuffer::finishWriting(int actuallyWritten)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writing_) {
        fail<IllegalStateError>("Cannot finish writing because it was not begun");
    }
    SessionCloser closer(writing_);

    if (actuallyWritten < 0) {
        fail<std::invalid_argument>(fmt::format("Actually written bytes amount {} is less than 0", actuallyWritten));
    }
    if (static_cast<int64_t>(size_) + actuallyWritten > capacity_) {
        fail<std::invalid_argument>(fmt::format(
            "Actually written bytes amount {} is too large, only {} bytes free",
            actuallyWritten, capacity_ - size_));
    }
    size_ += actuallyWritten;
}

Range RingBuffer::beginReading(int maxLength)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (reading_) {
        fail<IllegalStateError>("Cannot begin reading until previous reading finished");
    }
    reading_ = true;

    if (maxLength < 0) {
        fail<std::invalid_argument>(fmt::format("Max length {} is less than 0", maxLength));
    }

    if (size_ == 0 || maxLength == 0) {
        return Range{};
    }

    const int64_t bound = std::min<int64_t>(static_cast<int64_t>(index_) + size_, capacity_);
    return Range(index_, windowEnd(index_, maxLength, bound));
}

void RingBuffer::finishReading(int actuallyRead)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reading_) {
        fail<IllegalStateError>("Cannot finish reading because it was not begun");
    }
    SessionCloser closer(reading_);

    if (actuallyRead < 0) {
        fail<std::invalid_argument>(fmt::format("Actually read bytes amount {} is less than 0", actuallyRead));
    }
    if (actuallyRead > size_) {
        fail<std::invalid_argument>(fmt::format(
            "Actually read bytes amount {} is too large, only {} bytes stored", actuallyRead, size_));
    }
    size_ -= actuallyRead;
    // capacity_ == 0 implies actuallyRead == 0
    index_ = capacity_ == 0 ? 0 : wrap(static_cast<int64_t>(index_) + actuallyRead, capacity_);
}

void RingBuffer::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (reading_) {
        fail<IllegalStateError>("Cannot clear buffer while reading is in progress");
    }
    if (writing_) {
        fail<IllegalStateError>("Cannot clear buffer while writing is in progress");
    }
    LOG_TRACE("RingBuffer cleared, dropped {} bytes", size_);
    index_ = 0;
    size_ = 0;
}

bool RingBuffer::isEmpty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return size_ == 0;
}

bool RingBuffer::isFull() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return size_ == capacity_;
}

bool RingBuffer::isWriting() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writing_;
}

bool RingBuffer::isReading() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reading_;
}

int RingBuffer::dataIndex() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return index_;
}

int RingBuffer::dataSize() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

int RingBuffer::freeSize() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - size_;
}

} // namespace ringbuf
