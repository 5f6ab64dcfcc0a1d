#pragma once

#include "cnclink/DescriptorConnection.hpp"
#include "cnclink/system_constants.hpp"
#include <string>

struct SerialConfig {
    std::string port;                                          // e.g. /dev/ttyUSB0
    int baud_rate = SystemConstants::Serial::DEFAULT_BAUD_RATE;

    bool isValid() const { return !port.empty() && baud_rate > 0; }
};

/**
 * Serial (termios) transport, 8N1 raw mode
 */
class SerialConnection : public DescriptorConnection {
public:
    explicit SerialConnection(const SerialConfig& config);

    /**
     * Open and configure the port.
     * The tty is opened with O_NONBLOCK and configured with non-blocking
     * termios calls, so connect never waits and the timeout is not used.
     */
    bool connect(std::chrono::milliseconds timeout) override;
    std::string getDescription() const override;

private:
    SerialConfig config_;

    bool configurePort(int fd);
};
