#pragma once

#include "cnclink/GrblProtocol.hpp"
#include "cnclink/system_constants.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class QueueState {
    IDLE,              // Nothing pending, nothing in flight
    ACTIVE,            // Commands pending, none in flight
    WAITING_FOR_ACK,   // One command sent, awaiting ok/error
    PAUSED             // Dequeuing suspended (operator pause or alarm)
};

enum class CommandState {
    QUEUED,
    SENT,
    ACKED,
    TIMED_OUT,
    FAILED
};

struct QueuedCommand {
    uint64_t id = 0;
    std::string text;   // Line without terminator
    std::chrono::steady_clock::time_point enqueuedAt;
    std::chrono::steady_clock::time_point sentAt;
    CommandState state = CommandState::QUEUED;
};

/**
 * Outcome of a command that left the queue
 */
struct CommandResult {
    uint64_t id = 0;
    std::string text;
    CommandState state = CommandState::ACKED;
    std::optional<int> errorCode;   // error:n
    std::optional<int> alarmCode;   // ALARM:n while in flight
    std::string message;
    std::chrono::milliseconds latency{ 0 };   // Sent to completion
};

struct QueueStats {
    uint64_t totalQueued = 0;
    uint64_t totalSent = 0;
    uint64_t totalCompleted = 0;
    uint64_t totalFailed = 0;
    uint64_t totalTimedOut = 0;
    uint64_t totalCleared = 0;
    double averageAckMs = 0.0;
};

struct CommandQueueConfig {
    size_t capacity = SystemConstants::Queue::DEFAULT_CAPACITY;
    std::chrono::milliseconds commandTimeout{ SystemConstants::Queue::COMMAND_TIMEOUT_MS };
    bool enableDetailedLogging = false;

    bool isValid() const {
        return capacity > 0 && commandTimeout.count() > 0;
    }
};

/**
 * Flow-controlled command queue for GRBL's one-in-flight discipline.
 *
 * At most one command is ever in flight. Responses advance the in-flight
 * entry; alarms pause the queue until resume(). Timed out commands are
 * reported and dropped, never resent. All methods are thread-safe.
 */
class CommandQueue {
public:
    explicit CommandQueue(const CommandQueueConfig& config = CommandQueueConfig());

    /**
     * Append a command
     * @param text Command line, terminator optional
     * @param id Receives the assigned id
     * @return false if the queue is full (backpressure) or the text is empty
     */
    bool enqueue(const std::string& text, uint64_t* id = nullptr);

    /**
     * Append several commands, all or nothing
     */
    bool enqueueBatch(const std::vector<std::string>& lines, std::vector<uint64_t>* ids = nullptr);

    /**
     * Take the next pending command and mark it in flight.
     * Returns nothing while paused, empty or already waiting for an ack.
     */
    std::optional<QueuedCommand> dequeueForSend();

    /**
     * Block until a command can be dequeued or the timeout expires
     */
    bool waitForSendable(std::chrono::milliseconds timeout);

    /**
     * Block until nothing is pending or in flight
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    /**
     * Apply a controller response to the in-flight command
     * @return The completed command, if the response finished one
     */
    std::optional<CommandResult> handleResponse(const GrblResponse& response);

    /**
     * Fail the in-flight command after a transport write error
     */
    std::optional<CommandResult> markSendFailed(const std::string& reason);

    /**
     * Expire the in-flight command if it has waited longer than the timeout
     */
    std::optional<CommandResult> checkTimeout(
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    void pause();
    void resume();

    /**
     * Pause only if commands are still pending
     * @return Number of commands held
     */
    size_t pauseIfPending();

    /**
     * Drop every pending command; the in-flight command keeps its slot
     * @return Number of commands dropped
     */
    size_t clear();

    QueueState getState() const;
    bool isPaused() const;
    size_t pendingCount() const;
    size_t freeCapacity() const;
    bool hasInFlight() const;
    std::optional<QueuedCommand> getInFlight() const;
    QueueStats getStats() const;
    std::string getLastError() const;

    /**
     * Wake every blocked waiter (used on shutdown)
     */
    void wakeAll();

private:
    CommandQueueConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;

    std::deque<QueuedCommand> pending_;
    std::optional<QueuedCommand> inFlight_;
    QueueState state_;
    bool paused_;
    uint64_t nextId_;
    uint64_t wakeGeneration_;
    QueueStats stats_;

    mutable std::string lastError_;
    mutable std::mutex errorMutex_;

    // Callers hold mutex_
    void updateState();
    CommandResult completeInFlight(CommandState state, const std::string& message);
    void recordAckLatency(std::chrono::milliseconds latency);
    bool canSend() const;

    void setError(const std::string& error) const;
};

std::string queueStateToString(QueueState state);
std::string commandStateToString(CommandState state);
