// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/probe/ProbeChannel.h"
#include "hoptrace/probe/ProbeSender.h"
#include "hoptrace/probe/ProbeSocket.h"
#include "hoptrace/probe/ReplyClassifier.h"

#include <memory>

namespace hoptrace {

namespace {

// Raw-socket channel: the socket outlives the sender and classifier that
// reference it because all three are members destroyed in reverse order.
class RawProbeChannel final : public ProbeChannel {
public:
    explicit RawProbeChannel(const ProbeSettings& settings)
        : socket_(settings.variant),
          sender_(socket_, settings.udp_base_port, settings.payload_size),
          classifier_(socket_) {}

    Probe send(const std::string& destination,
               int hop_limit,
               uint16_t sequence,
               ProtocolVariant variant,
               int attempt) override {
        return sender_.send(destination, hop_limit, sequence, variant, attempt);
    }

    ProbeOutcome await_reply(const Probe& probe, std::chrono::milliseconds timeout) override {
        return classifier_.await_reply(probe, timeout);
    }

private:
    ProbeSocket socket_;
    ProbeSender sender_;
    ReplyClassifier classifier_;
};

} // namespace

std::unique_ptr<ProbeChannel> make_raw_probe_channel(const ProbeSettings& settings) {
    return std::make_unique<RawProbeChannel>(settings);
}

} // namespace hoptrace
