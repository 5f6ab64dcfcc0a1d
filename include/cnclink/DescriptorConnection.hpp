#pragma once

#include "cnclink/Connection.hpp"
#include <atomic>
#include <mutex>
#include <string>

/**
 * Shared line framing over a POSIX file descriptor (tty or socket).
 * Subclasses open the descriptor in connect() and hand it to attach().
 */
class DescriptorConnection : public Connection {
public:
    DescriptorConnection();
    ~DescriptorConnection() override;

    void disconnect() override;
    bool isConnected() const override { return fd_.load() >= 0; }
    bool write(const std::string& data) override;
    ReceiveResult readLine(std::string& line, std::chrono::milliseconds timeout) override;
    std::string getLastError() const override;

protected:
    void attach(int fd);
    void setError(const std::string& error) const;

private:
    std::atomic<int> fd_;
    std::string rxBuffer_;   // Receive thread only

    std::mutex writeMutex_;
    mutable std::string lastError_;
    mutable std::mutex errorMutex_;

    bool extractLine(std::string& line);
};
