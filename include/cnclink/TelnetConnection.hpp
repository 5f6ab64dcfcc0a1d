#pragma once

#include "cnclink/DescriptorConnection.hpp"
#include "cnclink/system_constants.hpp"
#include <cstdint>
#include <string>

struct TelnetConfig {
    std::string host;
    uint16_t port = SystemConstants::Telnet::DEFAULT_PORT;

    bool isValid() const { return !host.empty() && port > 0; }
};

/**
 * Raw TCP transport for network-attached GRBL controllers (ESP32 telnet bridges)
 */
class TelnetConnection : public DescriptorConnection {
public:
    explicit TelnetConnection(const TelnetConfig& config);

    bool connect(std::chrono::milliseconds timeout) override;
    std::string getDescription() const override;

private:
    TelnetConfig config_;

    int connectWithTimeout(std::chrono::milliseconds timeout);
};
