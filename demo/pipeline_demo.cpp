// Producer/consumer demo: one thread plays the network reader, another the
// decoder, both talking only through a RingBuffer.

#include <buffer/ring_buffer.h>
#include <buffer/ring_transfer.h>
#include <log/log_manager.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <thread>
#include <vector>

namespace {

constexpr int kCapacity = 4096;
constexpr size_t kTotalBytes = 8 * 1024 * 1024;
constexpr size_t kChunk = 1500; // one ethernet frame worth of payload

uint8_t patternByte(size_t position)
{
    return static_cast<uint8_t>((position * 31 + 7) & 0xFF);
}

} // namespace

int main()
{
    LogManager::instance().initialize("log");

    try {
        ringbuf::RingBuffer buffer(kCapacity);
        std::atomic<bool> producerDone{false};
        size_t writerStalls = 0;
        size_t readerStalls = 0;
        size_t mismatches = 0;
        size_t received = 0;

        const auto started = std::chrono::steady_clock::now();

        std::thread producer([&] {
            std::vector<uint8_t> frame(kChunk);
            size_t sent = 0;
            while (sent < kTotalBytes) {
                const size_t frameSize = std::min(kChunk, kTotalBytes - sent);
                for (size_t i = 0; i < frameSize; ++i) {
                    frame[i] = patternByte(sent + i);
                }
                size_t offset = 0;
                while (offset < frameSize) {
                    const size_t n = ringbuf::writeSome(buffer, frame.data() + offset, frameSize - offset);
                    if (n == 0) {
                        ++writerStalls;
                        std::this_thread::yield();
                    }
                    offset += n;
                }
                sent += frameSize;
            }
            producerDone = true;
        });

        std::thread consumer([&] {
            while (true) {
                const size_t n = ringbuf::consume(buffer, kChunk, [&](const uint8_t* src, size_t available) {
                    for (size_t i = 0; i < available; ++i) {
                        if (src[i] != patternByte(received + i)) ++mismatches;
                    }
                    received += available;
                    return available;
                });
                if (n == 0) {
                    if (producerDone && buffer.isEmpty()) break;
                    ++readerStalls;
                    std::this_thread::yield();
                }
            }
        });

        producer.join();
        consumer.join();

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        LOG_INFO("Transferred {} bytes through a {} byte ring in {} ms", received, kCapacity, elapsed.count());
        LOG_INFO("Writer stalls: {}, reader stalls: {}", writerStalls, readerStalls);
        if (mismatches != 0 || received != kTotalBytes) {
            LOG_ERROR("Data corrupted: {} mismatching bytes, {} of {} bytes received",
                      mismatches, received, kTotalBytes);
            LogManager::instance().shutdown();
            return 1;
        }
        LOG_INFO("Byte stream verified");
    } catch (const std::exception& e) {
        LOG_CRITICAL("Pipeline demo failed: {}", e.what());
        std::cerr << "Pipeline demo failed: " << e.what() << std::endl;
        LogManager::instance().shutdown();
        return 1;
    }

    LogManager::instance().shutdown();
    return 0;
}
