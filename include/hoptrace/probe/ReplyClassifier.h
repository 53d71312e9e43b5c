// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/probe/Probe.h"
#include "hoptrace/probe/ProbeSocket.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace hoptrace {

/**
 * @brief Waits for the reply to one probe and classifies it.
 *
 * Classification order (first match wins):
 *   1. nothing correlated before the deadline  -> Timeout
 *   2. Echo Reply with our identifier/sequence -> EchoReply
 *   3. Time Exceeded quoting the probe         -> TimeExceeded
 *   4. Destination Unreachable quoting it      -> DestUnreachable
 *   5. any other ICMP quoting it               -> OtherIcmp
 */
class ReplyClassifier {
public:
    explicit ReplyClassifier(ProbeSocket& socket);

    /**
     * @brief Block on the ICMP socket until a correlated reply arrives or
     * probe.sent_at + @p timeout passes. Never blocks past that deadline.
     */
    ProbeOutcome await_reply(const Probe& probe, std::chrono::milliseconds timeout);

    /**
     * @brief Classify one raw IPv4 datagram against @p probe.
     *
     * @return nullopt if the packet is malformed or belongs to something else.
     */
    static std::optional<ProbeOutcome> classify(const uint8_t* packet,
                                                std::size_t length,
                                                const Probe& probe,
                                                Clock::time_point arrival);

private:
    ProbeSocket& socket_;
};

} // namespace hoptrace
