/**
 * @file ControlChannel.h
 * @brief Declares ControlMessage and ControlChannel, the UI-to-engine command inbox.
 *
 * Any number of producer threads may post; the simulation engine is the single consumer and drains the
 * inbox once per tick without waiting.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @struct ControlMessage
 * @brief One inbound record: an optional command and an optional parameter map.
 *
 * Recognized values: command "START" / "STOP"; parameter "beam_energy" (MeV). Everything else is ignored
 * by the consumer.
 */
struct ControlMessage {
    std::string command;
    std::map<std::string, double> params;

    static constexpr const char* Start = "START";
    static constexpr const char* Stop = "STOP";
    static constexpr const char* BeamEnergy = "beam_energy";

    static ControlMessage start() { return ControlMessage{Start, {}}; }
    static ControlMessage stop() { return ControlMessage{Stop, {}}; }
    static ControlMessage beamEnergy(double mev) { return ControlMessage{std::string(), {{BeamEnergy, mev}}}; }
};

/**
 * @class ControlChannel
 * @brief Multiple-producer / single-consumer FIFO of ControlMessage.
 */
class ControlChannel {
public:
    /** @brief Enqueue @p msg; callable from any thread. */
    void post(ControlMessage msg);
    /** @brief Move every pending message into @p out (appended, arrival order). Returns the number moved. */
    size_t drain(std::vector<ControlMessage>& out);
    /** @brief Number of messages currently pending. */
    size_t pending() const;

private:
    mutable std::mutex mtx;
    std::deque<ControlMessage> inbox;
};
