#pragma once

#include <cstdint>
#include <string>

namespace photorelay::networking {

using ClientId = std::uint64_t;

// Outbound side of the transport. send() queues a text frame for one client.
// Unknown or already closed clients are dropped silently; an exception means
// the transport itself could not take the message.
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void send(ClientId client, const std::string& msg) = 0;
};

} // namespace photorelay::networking
