/**
 * @file FrameChannel.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "FrameChannel.h"

void FrameChannel::publish() {
    int prev = middle.exchange(backIdx | FreshBit, std::memory_order_acq_rel);
    backIdx = prev & IndexMask;
    publishedCount.fetch_add(1, std::memory_order_relaxed);
    if (prev & FreshBit) droppedCount.fetch_add(1, std::memory_order_relaxed);
}

void FrameChannel::publish(const Snapshot& s) {
    buffers[backIdx] = s;
    publish();
}

bool FrameChannel::takeLatest() {
    if ((middle.load(std::memory_order_acquire) & FreshBit) == 0) return false;
    int prev = middle.exchange(frontIdx, std::memory_order_acq_rel);
    frontIdx = prev & IndexMask;
    return true;
}

bool FrameChannel::takeLatest(Snapshot& out) {
    if (!takeLatest()) return false;
    out = buffers[frontIdx];
    return true;
}
