#pragma once

#include <chrono>
#include <string>

enum class ReceiveResult {
    LINE,      // A complete line was read
    TIMEOUT,   // Nothing complete within the timeout
    CLOSED,    // Peer closed the stream
    ERROR      // Read failure, see getLastError()
};

/**
 * Byte-stream transport to a GRBL controller.
 *
 * write() may be called from several threads; readLine() from one thread only.
 */
class Connection {
public:
    virtual ~Connection() = default;

    /**
     * Open the transport; must not leave a half-open handle on failure
     */
    virtual bool connect(std::chrono::milliseconds timeout) = 0;

    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * Write all bytes of `data`
     */
    virtual bool write(const std::string& data) = 0;

    /**
     * Read one line, without its terminator
     */
    virtual ReceiveResult readLine(std::string& line, std::chrono::milliseconds timeout) = 0;

    virtual std::string getDescription() const = 0;

    virtual std::string getLastError() const = 0;
};
