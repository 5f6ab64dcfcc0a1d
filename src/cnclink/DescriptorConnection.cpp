#include "cnclink/DescriptorConnection.hpp"
#include "cnclink/system_constants.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <unistd.h>

DescriptorConnection::DescriptorConnection()
    : fd_(-1)
{
}

DescriptorConnection::~DescriptorConnection() {
    DescriptorConnection::disconnect();
}

void DescriptorConnection::attach(int fd) {
    rxBuffer_.clear();
    fd_ = fd;
}

void DescriptorConnection::disconnect() {
    const int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

bool DescriptorConnection::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    const int fd = fd_.load();
    if (fd < 0) {
        setError("Write on closed connection");
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{ fd, POLLOUT, 0 };
            if (::poll(&pfd, 1, 1000) <= 0) {
                setError("Write timed out");
                return false;
            }
            continue;
        }
        setError("Write failed: " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

ReceiveResult DescriptorConnection::readLine(std::string& line, std::chrono::milliseconds timeout) {
    if (extractLine(line)) {
        return ReceiveResult::LINE;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const int fd = fd_.load();
        if (fd < 0) {
            return ReceiveResult::CLOSED;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ReceiveResult::TIMEOUT;
        }

        pollfd pfd{ fd, POLLIN, 0 };
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            setError("Poll failed: " + std::string(strerror(errno)));
            return ReceiveResult::ERROR;
        }
        if (ready == 0) {
            return ReceiveResult::TIMEOUT;
        }
        if (pfd.revents & POLLNVAL) {
            return ReceiveResult::CLOSED;
        }

        char buffer[256];
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            rxBuffer_.append(buffer, static_cast<size_t>(n));
            if (extractLine(line)) {
                return ReceiveResult::LINE;
            }
            if (rxBuffer_.size() > SystemConstants::Protocol::MAX_RX_LINE_LENGTH) {
                rxBuffer_.clear();
                setError("Received line exceeds " +
                    std::to_string(SystemConstants::Protocol::MAX_RX_LINE_LENGTH) + " bytes without a terminator");
                return ReceiveResult::ERROR;
            }
            continue;
        }
        if (n == 0) {
            return ReceiveResult::CLOSED;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        setError("Read failed: " + std::string(strerror(errno)));
        return ReceiveResult::ERROR;
    }
}

std::string DescriptorConnection::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

bool DescriptorConnection::extractLine(std::string& line) {
    const size_t newline = rxBuffer_.find('\n');
    if (newline == std::string::npos) {
        return false;
    }
    line = rxBuffer_.substr(0, newline);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    rxBuffer_.erase(0, newline + 1);
    return true;
}

void DescriptorConnection::setError(const std::string& error) const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
    std::cerr << getDescription() << " Error: " << error << std::endl;
}
