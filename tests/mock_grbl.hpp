#pragma once

#include "cnclink/Connection.hpp"
#include "cnclink/GrblProtocol.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * In-memory transport. Lines injected with pushLine() are returned by
 * readLine(); everything written is captured and forwarded to an optional
 * write handler (the simulated controller).
 */
class MockConnection : public Connection {
public:
    MockConnection() = default;

    bool connect(std::chrono::milliseconds timeout) override;
    void disconnect() override;
    bool isConnected() const override;
    bool write(const std::string& data) override;
    ReceiveResult readLine(std::string& line, std::chrono::milliseconds timeout) override;
    std::string getDescription() const override { return "Mock"; }
    std::string getLastError() const override;

    // Test controls
    void pushLine(const std::string& line);
    void closeFromPeer();
    void setFailConnect(bool fail) { failConnect_ = fail; }
    void setFailWrites(bool fail);
    void setWriteHandler(std::function<void(const std::string&)> handler);

    std::string written() const;
    int connectCalls() const;
    int sessions() const;   // Fresh opens, not counting reuse of a live handle

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<std::string> lines_;
    bool connected_ = false;
    bool peerClosed_ = false;
    bool failConnect_ = false;
    bool failWrites_ = false;
    int connectCalls_ = 0;
    int sessions_ = 0;
    std::string lastError_;

    mutable std::mutex writeMutex_;
    std::string written_;
    std::function<void(const std::string&)> writeHandler_;
};

/**
 * Simulated GRBL controller driven by what the host writes.
 * Acknowledges each line with "ok" unless scripted replies are queued,
 * and answers '?' with the configured status report.
 */
class MockGrbl {
public:
    MockGrbl();

    void attach(MockConnection& connection);

    void setAutoAck(bool autoAck);
    void setStatusLine(const std::string& statusLine);

    // Reply used for the next received line instead of "ok"
    void queueReply(const std::string& reply);

    std::vector<std::string> receivedLines() const;
    std::vector<uint8_t> realtimeBytes() const;

    /**
     * Decode a formatted command line back into a GrblCommand
     * @return false if the line is not a well-formed command
     */
    static bool decodeCommand(const std::string& line, GrblCommand& command);

private:
    mutable std::mutex mutex_;
    MockConnection* connection_;
    std::string rxBuffer_;
    std::vector<std::string> lines_;
    std::vector<uint8_t> realtime_;
    std::deque<std::string> replies_;
    bool autoAck_;
    std::string statusLine_;

    void onBytes(const std::string& data);
};

/**
 * Poll a predicate until it holds or the timeout expires
 */
template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}
