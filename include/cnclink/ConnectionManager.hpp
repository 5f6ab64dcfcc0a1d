#pragma once

#include "cnclink/BroadcastChannel.hpp"
#include "cnclink/CommandQueue.hpp"
#include "cnclink/Connection.hpp"
#include "cnclink/GrblProtocol.hpp"
#include "cnclink/ProgramTracker.hpp"
#include "cnclink/segment.hpp"
#include "cnclink/system_constants.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    ERROR
};

enum class ConnectionEventType {
    CONNECTED,
    DISCONNECTED,
    ERROR,
    CONTROLLER_RESET,        // Welcome banner seen while connected
    MACHINE_STATE_CHANGED,   // Status report state differs from the previous one
    PROGRAM_FINISHED         // Every line of the queued program answered
};

struct ConnectionEvent {
    ConnectionEventType type = ConnectionEventType::DISCONNECTED;
    ConnectionState state = ConnectionState::DISCONNECTED;
    std::string message;
    std::chrono::steady_clock::time_point timestamp;

    // MACHINE_STATE_CHANGED only
    MachineState previousMachineState = MachineState::UNKNOWN;
    MachineState machineState = MachineState::UNKNOWN;
};

struct ConnectionManagerConfig {
    std::chrono::milliseconds connectTimeout{ SystemConstants::Timing::CONNECT_TIMEOUT_MS };
    std::chrono::milliseconds statusPollInterval{ SystemConstants::Timing::STATUS_POLL_INTERVAL_MS };
    std::chrono::milliseconds receiveTimeout{ SystemConstants::Timing::RECEIVE_WAIT_MS };
    std::chrono::milliseconds sendWait{ SystemConstants::Timing::SEND_WAIT_MS };

    bool enableStatusPolling = true;
    bool enableDetailedLogging = false;   // Log every line sent and received

    size_t subscriberCapacity = SystemConstants::Channels::SUBSCRIBER_CAPACITY;
    CommandQueueConfig queue;

    bool isValid() const {
        return connectTimeout.count() > 0 &&
               statusPollInterval.count() > 0 &&
               receiveTimeout.count() > 0 &&
               sendWait.count() > 0 &&
               subscriberCapacity > 0 &&
               queue.isValid();
    }
};

/**
 * Owns one controller connection and its command queue.
 *
 * While connected three background threads run: the receive loop (parse
 * each line, advance the queue, republish), the send loop (stream queued
 * commands one at a time) and the status poll loop (write '?' on an
 * interval). Consumers observe the controller through subscriptions.
 */
class ConnectionManager {
public:
    ConnectionManager(std::unique_ptr<Connection> connection,
                      const ConnectionManagerConfig& config = ConnectionManagerConfig());
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * Open the transport and start the background loops
     * @return false on timeout or transport failure (state becomes ERROR)
     */
    bool connect();

    /**
     * Stop every loop and release the transport
     */
    void disconnect();

    bool isConnected() const { return state_.load() == ConnectionState::CONNECTED; }
    ConnectionState getConnectionState() const { return state_.load(); }

    // =========================================================================
    // Commands
    // =========================================================================

    /**
     * Write a real-time byte immediately, bypassing the queue
     */
    bool sendRealtime(RealtimeCommand command);

    bool sendCommand(const GrblCommand& command, uint64_t* id = nullptr);
    bool sendLine(const std::string& line, uint64_t* id = nullptr);

    /**
     * Format segments as G-code and queue them, all or nothing.
     * The queued lines become the tracked program (see getProgramProgress).
     */
    bool enqueueProgram(const std::vector<Segment>& segments, std::vector<uint64_t>* ids = nullptr);

    void pause();
    void resume();
    size_t clearQueue();
    bool waitForQueueIdle(std::chrono::milliseconds timeout);

    QueueState getQueueState() const;
    QueueStats getQueueStats() const;

    ProgramProgress getProgramProgress() const;

    // =========================================================================
    // Observed controller state
    // =========================================================================

    /**
     * Most recent status report, or null before the first one
     */
    std::shared_ptr<const GrblStatus> getLatestStatus() const;

    OverrideState getOverrideState() const;

    // $n=value lines seen so far (answers to $$)
    std::map<int, std::string> getSettings() const;

    std::string getDescription() const;
    std::string getLastError() const;

    // =========================================================================
    // Subscriptions
    // =========================================================================
    BroadcastChannel<GrblStatus>::Subscription subscribeStatus() { return statusChannel_.subscribe(); }
    BroadcastChannel<GrblResponse>::Subscription subscribeResponses() { return responseChannel_.subscribe(); }
    BroadcastChannel<ConnectionEvent>::Subscription subscribeEvents() { return eventChannel_.subscribe(); }
    BroadcastChannel<CommandResult>::Subscription subscribeCommandResults() { return resultChannel_.subscribe(); }

private:
    std::unique_ptr<Connection> connection_;
    ConnectionManagerConfig config_;
    CommandQueue queue_;

    std::atomic<ConnectionState> state_;
    std::atomic<bool> running_;

    std::thread receiveThread_;
    std::thread sendThread_;
    std::thread pollThread_;

    std::mutex shutdownMutex_;
    std::condition_variable shutdownCv_;

    std::mutex lifecycleMutex_;   // Serializes connect()/disconnect()

    mutable std::mutex statusMutex_;
    std::shared_ptr<const GrblStatus> latestStatus_;
    MachineState lastMachineState_;

    ProgramTracker program_;
    std::mutex programMutex_;   // Orders program_.begin() before results of its batch

    mutable std::mutex overrideMutex_;
    OverrideState overrides_;

    mutable std::mutex settingsMutex_;
    std::map<int, std::string> settings_;

    BroadcastChannel<GrblStatus> statusChannel_;
    BroadcastChannel<GrblResponse> responseChannel_;
    BroadcastChannel<ConnectionEvent> eventChannel_;
    BroadcastChannel<CommandResult> resultChannel_;

    mutable std::string lastError_;
    mutable std::mutex errorMutex_;

    void receiveLoop();
    void sendLoop();
    void pollLoop();

    void processLine(const std::string& line);
    void publishResult(const CommandResult& result);
    void publishEvent(ConnectionEventType type, const std::string& message);
    void publishEvent(const ConnectionEvent& event);

    // Keep pending commands from streaming into a freshly reset controller
    void holdPendingCommands();

    /**
     * Called from a loop thread when the transport fails; does not join
     */
    void handleTransportFailure(const std::string& reason);

    void stopThreads();
    void setError(const std::string& error) const;
};

std::string connectionStateToString(ConnectionState state);
std::string connectionEventTypeToString(ConnectionEventType type);
