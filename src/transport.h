#pragma once

#include <memory>
#include <string>

namespace cloudless {

// Close codes sent when a realtime connection is rejected or ended
constexpr int CLOSE_NORMAL = 1000;
constexpr int CLOSE_INVALID_TOKEN = 4001;
constexpr int CLOSE_NOT_MEMBER = 4003;
constexpr int CLOSE_ROOM_UNAVAILABLE = 4004;

/**
 * A live bidirectional text-frame channel to one client.
 *
 * send_text may be called from several threads at once; implementations
 * serialize writes so frames never interleave. receive_text is only called
 * from the connection's own receive loop.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Send one text frame. Blocks for at most the transport's send timeout.
     * @return false if the transport is closed or the send failed
     */
    virtual bool send_text(const std::string& message) = 0;

    /**
     * Block until one text frame arrives.
     * @return false on closure or unrecoverable error
     */
    virtual bool receive_text(std::string& message) = 0;

    /**
     * Close the channel with a close code and reason. Idempotent; a blocked
     * receive_text returns false afterwards.
     */
    virtual void close(int code, const std::string& reason) = 0;

    virtual bool is_closed() const = 0;

    /**
     * Human-readable peer description for logs
     */
    virtual std::string describe() const = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace cloudless
