#include "cnclink/TelnetConnection.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

TelnetConnection::TelnetConnection(const TelnetConfig& config)
    : config_(config)
{
}

bool TelnetConnection::connect(std::chrono::milliseconds timeout) {
    if (isConnected()) {
        return true;
    }
    if (!config_.isValid()) {
        setError("Invalid telnet configuration");
        return false;
    }

    const int fd = connectWithTimeout(timeout);
    if (fd < 0) {
        return false;
    }

    attach(fd);
    std::cout << "Telnet connected: " << getDescription() << std::endl;
    return true;
}

int TelnetConnection::connectWithTimeout(std::chrono::milliseconds timeout) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const std::string service = std::to_string(config_.port);
    const int rc = getaddrinfo(config_.host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        setError("Failed to resolve host " + config_.host + ": " + gai_strerror(rc));
        return -1;
    }

    std::string lastFailure = "No usable address";
    int connected = -1;

    for (addrinfo* ai = results; ai != nullptr && connected < 0; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastFailure = "Socket creation failed: " + std::string(strerror(errno));
            continue;
        }

        const int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int result = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (result < 0 && errno == EINPROGRESS) {
            pollfd pfd{ fd, POLLOUT, 0 };
            const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (ready == 0) {
                lastFailure = "Connection timed out";
                ::close(fd);
                continue;
            }
            if (ready < 0) {
                lastFailure = "Poll failed: " + std::string(strerror(errno));
                ::close(fd);
                continue;
            }

            int soError = 0;
            socklen_t len = sizeof(soError);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
            if (soError != 0) {
                lastFailure = "Connection failed: " + std::string(strerror(soError));
                ::close(fd);
                continue;
            }
            result = 0;
        }

        if (result < 0) {
            lastFailure = "Connection failed: " + std::string(strerror(errno));
            ::close(fd);
            continue;
        }

        fcntl(fd, F_SETFL, flags);
        int noDelay = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
        connected = fd;
    }

    freeaddrinfo(results);

    if (connected < 0) {
        setError(lastFailure);
    }
    return connected;
}

std::string TelnetConnection::getDescription() const {
    return "Telnet " + config_.host + ":" + std::to_string(config_.port);
}
