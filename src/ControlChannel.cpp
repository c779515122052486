/**
 * @file ControlChannel.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ControlChannel.h"

#include <iterator>
#include <utility>

void ControlChannel::post(ControlMessage msg) {
    std::lock_guard<std::mutex> lock(mtx);
    inbox.push_back(std::move(msg));
}

size_t ControlChannel::drain(std::vector<ControlMessage>& out) {
    std::deque<ControlMessage> taken;
    {
        std::lock_guard<std::mutex> lock(mtx);
        taken.swap(inbox);
    }
    out.insert(out.end(), std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
    return taken.size();
}

size_t ControlChannel::pending() const {
    std::lock_guard<std::mutex> lock(mtx);
    return inbox.size();
}
