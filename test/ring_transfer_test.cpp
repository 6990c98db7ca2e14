/**
 * Transfer helper tests: writeSome/readSome/discard and the
 * produce/consume callbacks, including wrap-around and failure cleanup.
 */

#include <catch2/catch_test_macros.hpp>
#include <buffer/ring_transfer.h>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace ringbuf;

TEST_CASE("writeSome/readSome copy data", "[RingTransfer]") {
    SECTION("Round trip without wrap") {
        RingBuffer buffer(16);
        std::vector<uint8_t> input(10);
        std::iota(input.begin(), input.end(), uint8_t{1});

        REQUIRE(writeSome(buffer, input.data(), input.size()) == 10);
        REQUIRE(buffer.dataSize() == 10);

        std::vector<uint8_t> output(10);
        REQUIRE(readSome(buffer, output.data(), output.size()) == 10);
        REQUIRE(output == input);
        REQUIRE(buffer.isEmpty());
    }

    SECTION("Round trip across the physical end") {
        RingBuffer buffer(8);
        std::vector<uint8_t> scratch(6);
        REQUIRE(writeSome(buffer, scratch.data(), 6) == 6);
        REQUIRE(readSome(buffer, scratch.data(), 6) == 6);
        REQUIRE(buffer.dataIndex() == 6);

        const std::vector<uint8_t> input = {9, 8, 7, 6, 5, 4, 3};
        REQUIRE(writeSome(buffer, input.data(), input.size()) == 7);
        REQUIRE(buffer.dataSize() == 7);

        std::vector<uint8_t> output(7);
        REQUIRE(readSome(buffer, output.data(), output.size()) == 7);
        REQUIRE(output == input);
        REQUIRE(buffer.dataIndex() == 5);
    }

    SECTION("Write stops when full") {
        RingBuffer buffer(4);
        const std::vector<uint8_t> input = {1, 2, 3, 4, 5, 6};

        REQUIRE(writeSome(buffer, input.data(), input.size()) == 4);
        REQUIRE(buffer.isFull());
        REQUIRE(writeSome(buffer, input.data() + 4, 2) == 0);
        REQUIRE_FALSE(buffer.isWriting());
    }

    SECTION("Read stops when empty") {
        RingBuffer buffer(4);
        const std::vector<uint8_t> input = {1, 2};
        writeSome(buffer, input.data(), input.size());

        std::vector<uint8_t> output(4, 0);
        REQUIRE(readSome(buffer, output.data(), output.size()) == 2);
        REQUIRE(output[0] == 1);
        REQUIRE(output[1] == 2);
        REQUIRE(readSome(buffer, output.data(), output.size()) == 0);
        REQUIRE_FALSE(buffer.isReading());
    }

    SECTION("Zero length is a no-op") {
        RingBuffer buffer(4);
        REQUIRE(writeSome(buffer, nullptr, 0) == 0);
        REQUIRE(readSome(buffer, nullptr, 0) == 0);
        REQUIRE(buffer.isEmpty());
    }

    SECTION("Null pointers are rejected") {
        RingBuffer buffer(4);
        REQUIRE_THROWS_AS(writeSome(buffer, nullptr, 2), std::invalid_argument);
        REQUIRE_THROWS_AS(readSome(buffer, nullptr, 2), std::invalid_argument);
        REQUIRE_FALSE(buffer.isWriting());
        REQUIRE_FALSE(buffer.isReading());
    }
}

TEST_CASE("discard drops stored bytes", "[RingTransfer]") {
    RingBuffer buffer(5);
    const std::vector<uint8_t> input = {1, 2, 3, 4, 5};
    writeSome(buffer, input.data(), input.size());

    REQUIRE(discard(buffer, 3) == 3);
    REQUIRE(buffer.dataIndex() == 3);
    REQUIRE(buffer.dataSize() == 2);

    uint8_t next = 0;
    REQUIRE(readSome(buffer, &next, 1) == 1);
    REQUIRE(next == 4);
    REQUIRE(discard(buffer, 100) == 1);
    REQUIRE(buffer.isEmpty());
}

TEST_CASE("produce/consume callbacks", "[RingTransfer]") {
    SECTION("Short producer ends the transfer") {
        RingBuffer buffer(8);
        int calls = 0;
        const size_t n = produce(buffer, 8, [&](uint8_t* dst, size_t capacity) {
            ++calls;
            REQUIRE(capacity == 8);
            dst[0] = 42;
            dst[1] = 43;
            return size_t{2};
        });

        REQUIRE(n == 2);
        REQUIRE(calls == 1);
        REQUIRE(buffer.dataSize() == 2);
    }

    SECTION("Producer sees both windows when data wraps") {
        RingBuffer buffer(6);
        std::vector<uint8_t> scratch(4);
        writeSome(buffer, scratch.data(), 4);
        discard(buffer, 4);

        std::vector<size_t> windows;
        const size_t n = produce(buffer, 6, [&](uint8_t*, size_t capacity) {
            windows.push_back(capacity);
            return capacity;
        });

        REQUIRE(n == 6);
        REQUIRE(windows == std::vector<size_t>{2, 4});
        REQUIRE(buffer.isFull());
    }

    SECTION("Throwing producer commits nothing and closes the session") {
        RingBuffer buffer(8);
        REQUIRE_THROWS_AS(produce(buffer, 8, [](uint8_t*, size_t) -> size_t {
            throw std::runtime_error("socket closed");
        }), std::runtime_error);

        REQUIRE_FALSE(buffer.isWriting());
        REQUIRE(buffer.isEmpty());
        REQUIRE(buffer.beginWriting(1).isValid());
        buffer.finishWriting(0);
    }

    SECTION("Producer overclaiming is rejected") {
        RingBuffer buffer(4);
        REQUIRE_THROWS_AS(produce(buffer, 2, [](uint8_t*, size_t capacity) {
            return capacity + 1;
        }), std::out_of_range);

        REQUIRE_FALSE(buffer.isWriting());
        REQUIRE(buffer.isEmpty());
    }

    SECTION("Throwing consumer leaves the data in place") {
        RingBuffer buffer(4);
        const std::vector<uint8_t> input = {1, 2, 3};
        writeSome(buffer, input.data(), input.size());

        REQUIRE_THROWS_AS(consume(buffer, 3, [](const uint8_t*, size_t) -> size_t {
            throw std::runtime_error("decoder error");
        }), std::runtime_error);

        REQUIRE_FALSE(buffer.isReading());
        REQUIRE(buffer.dataSize() == 3);
    }

    SECTION("Partial consumer") {
        RingBuffer buffer(4);
        const std::vector<uint8_t> input = {1, 2, 3};
        writeSome(buffer, input.data(), input.size());

        const size_t n = consume(buffer, 3, [](const uint8_t* src, size_t) {
            REQUIRE(src[0] == 1);
            return size_t{1};
        });
        REQUIRE(n == 1);
        REQUIRE(buffer.dataIndex() == 1);
        REQUIRE(buffer.dataSize() == 2);
    }

    SECTION("Writing while another writer session is open fails before touching state") {
        RingBuffer buffer(4);
        buffer.beginWriting(1);

        const uint8_t byte = 1;
        REQUIRE_THROWS_AS(writeSome(buffer, &byte, 1), IllegalStateError);
        REQUIRE(buffer.isWriting());
        buffer.finishWriting(0);
    }
}
