#pragma once

#include <util/thread_annotations.h>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ringbuf {

/**
 * @brief Protocol violation on a RingBuffer: finishing a session that was never
 * begun, beginning a second session of the same kind, or clearing while a
 * session is open.
 */
class IllegalStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Inclusive [start, end] window into RingBuffer storage.
 *
 * Either both bounds are kInvalidIndex or both are valid offsets with
 * end >= start. An invalid range means "no space" (writer) or "no data"
 * (reader). Check isValid(), not length() == 0.
 */
class Range {
public:
    static constexpr int kInvalidIndex = -1;

    Range() = default;
    Range(int start, int end) : start_(start), end_(end) {}

    int start() const { return start_; }
    int end() const { return end_; }
    int length() const { return isValid() ? end_ - start_ + 1 : 0; }
    bool isValid() const { return start_ != kInvalidIndex && end_ != kInvalidIndex; }
    void clear() { start_ = end_ = kInvalidIndex; }

    // "[start..end]"
    std::string toString() const;

    bool operator==(const Range& other) const { return start_ == other.start_ && end_ == other.end_; }
    bool operator!=(const Range& other) const { return !(*this == other); }

private:
    int start_ = kInvalidIndex;
    int end_ = kInvalidIndex;
};

std::ostream& operator<<(std::ostream& os, const Range& range);

/**
 * @brief Fixed-capacity byte ring for exactly one writer and one reader.
 *
 * Both sides use a two-phase protocol:
 *
 *   Range r = buffer.beginWriting(n);   // or beginReading(n)
 *   ... touch buffer.data()[r.start() .. r.end()] ...
 *   buffer.finishWriting(written);      // or finishReading(read)
 *
 * A begin call must always be paired with its finish call, including when
 * begin threw. Nothing here ever waits: a full buffer (writer) or an empty
 * buffer (reader) simply yields an invalid Range.
 *
 * The mutex only guards index/size and the session flags. Storage bytes are
 * touched by callers without the lock; the writer window always starts at
 * index + size and the reader window never extends past size bytes from
 * index, so the two open windows never overlap.
 *
 * A single begin call never returns a window crossing the physical end of
 * storage; the caller issues a second begin/finish pair to continue past it.
 */
class RingBuffer {
public:
    /// @throws std::invalid_argument if capacity < 0
    explicit RingBuffer(int capacity);

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /**
     * @brief Open the writer session and return the writable window.
     * @param maxLength upper bound on bytes the caller intends to write
     * @return window of free bytes, invalid if full or maxLength == 0
     * @throws IllegalStateError if a writer session is already open
     * @throws std::invalid_argument if maxLength < 0 (session is left open)
     */
    Range beginWriting(int maxLength);

    /**
     * @brief Commit actuallyWritten bytes and close the writer session.
     * The session is closed even when this throws.
     * @throws IllegalStateError if no writer session is open
     * @throws std::invalid_argument if actuallyWritten is negative or exceeds free space
     */
    void finishWriting(int actuallyWritten);

    /**
     * @brief Open the reader session and return the readable window.
     * @return window of stored bytes, invalid if empty or maxLength == 0
     * @throws IllegalStateError if a reader session is already open
     * @throws std::invalid_argument if maxLength < 0 (session is left open)
     */
    Range beginReading(int maxLength);

    /**
     * @brief Consume actuallyRead bytes and close the reader session.
     * The session is closed even when this throws.
     * @throws IllegalStateError if no reader session is open
     * @throws std::invalid_argument if actuallyRead is negative or exceeds stored data
     */
    void finishReading(int actuallyRead);

    /**
     * @brief Mark the buffer empty. Storage contents are left as they are.
     * @throws IllegalStateError if a reader or writer session is open
     */
    void clear();

    bool isEmpty() const;
    bool isFull() const;
    bool isWriting() const;
    bool isReading() const;

    // Offset of the first stored byte
    int dataIndex() const;
    // Stored bytes, starting at dataIndex() and possibly wrapping
    int dataSize() const;
    int freeSize() const;
    int totalSize() const { return capacity_; }

    // Underlying storage, totalSize() bytes. Only touch the bytes of an open session's range.
    uint8_t* data() { return storage_.data(); }
    const uint8_t* data() const { return storage_.data(); }

private:
    const int capacity_;
    std::vector<uint8_t> storage_;

    mutable std::mutex mutex_;
    int index_ RINGBUF_GUARDED_BY(mutex_) = 0;
    int size_ RINGBUF_GUARDED_BY(mutex_) = 0;
    bool writing_ RINGBUF_GUARDED_BY(mutex_) = false;
    bool reading_ RINGBUF_GUARDED_BY(mutex_) = false;
};

} // namespace ringbuf
