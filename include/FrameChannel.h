/**
 * @file FrameChannel.h
 * @brief Declares FrameChannel, the engine-to-renderer latest-snapshot channel.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <atomic>
#include <cstdint>

#include "Snapshot.h"

/**
 * @class FrameChannel
 * @brief Single-producer / single-consumer triple buffer with latest-value semantics.
 *
 * The producer fills its private back buffer and swaps it into the shared middle slot; the consumer swaps
 * the middle slot into its private front buffer. Neither side ever blocks, and a snapshot the consumer has
 * not taken yet is simply replaced by the next one (counted in dropped()).
 *
 * Thread roles are fixed: only the producer calls backBuffer()/publish(), only the consumer calls
 * takeLatest()/front().
 */
class FrameChannel {
public:
    FrameChannel() = default;

    // Producer side
    /** @brief Buffer the producer may fill in place before publish(). Contents are whatever was last swapped in. */
    Snapshot& backBuffer() { return buffers[backIdx]; }
    /** @brief Publish the back buffer as the newest snapshot, superseding any unread one. */
    void publish();
    /** @brief Copy @p s into the back buffer and publish it. */
    void publish(const Snapshot& s);

    // Consumer side
    /** @brief If a newer snapshot was published since the last call, make it the front buffer and return true. */
    bool takeLatest();
    /** @brief Convenience: takeLatest() and copy the front buffer into @p out when it succeeds. */
    bool takeLatest(Snapshot& out);
    /** @brief Snapshot most recently taken by the consumer. */
    const Snapshot& front() const { return buffers[frontIdx]; }

    // Statistics (any thread)
    uint64_t published() const { return publishedCount.load(std::memory_order_relaxed); }
    uint64_t dropped() const { return droppedCount.load(std::memory_order_relaxed); }

private:
    static constexpr int IndexMask = 0x3;
    static constexpr int FreshBit = 0x4;

    Snapshot buffers[3];
    int backIdx{0};                 // producer-owned
    int frontIdx{1};                // consumer-owned
    std::atomic<int> middle{2};     // shared: buffer index | FreshBit
    std::atomic<uint64_t> publishedCount{0};
    std::atomic<uint64_t> droppedCount{0};
};
