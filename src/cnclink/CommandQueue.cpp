#include "cnclink/CommandQueue.hpp"
#include <cctype>
#include <iostream>

namespace {

std::string stripTerminator(const std::string& text) {
    size_t last = text.size();
    while (last > 0 && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
    size_t first = 0;
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
    return text.substr(first, last - first);
}

}

CommandQueue::CommandQueue(const CommandQueueConfig& config)
    : config_(config)
    , state_(QueueState::IDLE)
    , paused_(false)
    , nextId_(1)
    , wakeGeneration_(0)
{
    if (!config_.isValid()) {
        setError("Invalid queue configuration, using defaults");
        config_ = CommandQueueConfig();
    }
}

// =============================================================================
// Enqueue / Dequeue
// =============================================================================
bool CommandQueue::enqueue(const std::string& text, uint64_t* id) {
    const std::string line = stripTerminator(text);
    if (line.empty()) {
        setError("Refusing to enqueue an empty command");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (pending_.size() >= config_.capacity) {
        setError("Command queue full (" + std::to_string(config_.capacity) + " entries)");
        return false;
    }

    QueuedCommand command;
    command.id = nextId_++;
    command.text = line;
    command.enqueuedAt = std::chrono::steady_clock::now();
    command.state = CommandState::QUEUED;
    pending_.push_back(command);

    ++stats_.totalQueued;
    if (id) {
        *id = command.id;
    }

    if (config_.enableDetailedLogging) {
        std::cout << "CommandQueue: queued #" << command.id << " " << command.text << std::endl;
    }

    updateState();
    changed_.notify_all();
    return true;
}

bool CommandQueue::enqueueBatch(const std::vector<std::string>& lines, std::vector<uint64_t>* ids) {
    std::vector<std::string> cleaned;
    cleaned.reserve(lines.size());
    for (const auto& line : lines) {
        std::string text = stripTerminator(line);
        if (text.empty()) {
            setError("Refusing to enqueue an empty command");
            return false;
        }
        cleaned.push_back(text);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (pending_.size() + cleaned.size() > config_.capacity) {
        setError("Batch of " + std::to_string(cleaned.size()) + " commands exceeds free queue capacity (" +
            std::to_string(config_.capacity - pending_.size()) + ")");
        return false;
    }

    const auto now = std::chrono::steady_clock::now();
    for (const auto& text : cleaned) {
        QueuedCommand command;
        command.id = nextId_++;
        command.text = text;
        command.enqueuedAt = now;
        command.state = CommandState::QUEUED;
        pending_.push_back(command);
        ++stats_.totalQueued;
        if (ids) {
            ids->push_back(command.id);
        }
    }

    updateState();
    changed_.notify_all();
    return true;
}

std::optional<QueuedCommand> CommandQueue::dequeueForSend() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!canSend()) {
        return std::nullopt;
    }

    QueuedCommand command = pending_.front();
    pending_.pop_front();
    command.state = CommandState::SENT;
    command.sentAt = std::chrono::steady_clock::now();
    inFlight_ = command;

    ++stats_.totalSent;
    updateState();
    changed_.notify_all();
    return command;
}

bool CommandQueue::waitForSendable(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t generation = wakeGeneration_;
    changed_.wait_for(lock, timeout, [this, generation] {
        return canSend() || wakeGeneration_ != generation;
    });
    return canSend();
}

bool CommandQueue::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [this] {
        return !inFlight_ && pending_.empty();
    });
}

// =============================================================================
// Responses
// =============================================================================
std::optional<CommandResult> CommandQueue::handleResponse(const GrblResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<CommandResult> result;

    switch (response.type) {
    case ResponseType::OK:
        if (inFlight_) {
            result = completeInFlight(CommandState::ACKED, "ok");
            recordAckLatency(result->latency);
            ++stats_.totalCompleted;
        }
        break;

    case ResponseType::ERROR:
        if (inFlight_) {
            result = completeInFlight(CommandState::FAILED, response.message);
            result->errorCode = response.code;
            ++stats_.totalFailed;
            std::cerr << "CommandQueue: command #" << result->id << " '" << result->text
                << "' failed with error:" << response.code << std::endl;
        }
        break;

    case ResponseType::ALARM:
        // The machine needs operator intervention before anything else runs
        paused_ = true;
        if (inFlight_) {
            result = completeInFlight(CommandState::FAILED, response.message);
            result->alarmCode = response.code;
            ++stats_.totalFailed;
        }
        std::cerr << "CommandQueue: ALARM:" << response.code << " received, queue paused" << std::endl;
        break;

    case ResponseType::WELCOME:
        // Controller reset discards its line buffer
        if (inFlight_) {
            result = completeInFlight(CommandState::FAILED, "Controller reset");
            ++stats_.totalFailed;
        }
        break;

    case ResponseType::STATUS:
    case ResponseType::SETTING:
    case ResponseType::FEEDBACK:
        break;
    }

    updateState();
    changed_.notify_all();
    return result;
}

std::optional<CommandResult> CommandQueue::markSendFailed(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!inFlight_) {
        return std::nullopt;
    }
    CommandResult result = completeInFlight(CommandState::FAILED, reason);
    ++stats_.totalFailed;
    updateState();
    changed_.notify_all();
    return result;
}

std::optional<CommandResult> CommandQueue::checkTimeout(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!inFlight_ || now - inFlight_->sentAt < config_.commandTimeout) {
        return std::nullopt;
    }

    CommandResult result = completeInFlight(CommandState::TIMED_OUT,
        "No response within " + std::to_string(config_.commandTimeout.count()) + " ms");
    ++stats_.totalTimedOut;
    std::cerr << "CommandQueue: command #" << result.id << " '" << result.text << "' timed out" << std::endl;

    updateState();
    changed_.notify_all();
    return result;
}

// =============================================================================
// Control
// =============================================================================
void CommandQueue::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
    changed_.notify_all();
}

void CommandQueue::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = false;
    updateState();
    changed_.notify_all();
}

size_t CommandQueue::pauseIfPending() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return 0;
    }
    paused_ = true;
    changed_.notify_all();
    return pending_.size();
}

size_t CommandQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t dropped = pending_.size();
    pending_.clear();
    stats_.totalCleared += dropped;
    updateState();
    changed_.notify_all();
    return dropped;
}

void CommandQueue::wakeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++wakeGeneration_;
    changed_.notify_all();
}

// =============================================================================
// Queries
// =============================================================================
QueueState CommandQueue::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_ ? QueueState::PAUSED : state_;
}

bool CommandQueue::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

size_t CommandQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t CommandQueue::freeCapacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.capacity - pending_.size();
}

bool CommandQueue::hasInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.has_value();
}

std::optional<QueuedCommand> CommandQueue::getInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

QueueStats CommandQueue::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::string CommandQueue::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

// =============================================================================
// Internals
// =============================================================================
void CommandQueue::updateState() {
    if (inFlight_) {
        state_ = QueueState::WAITING_FOR_ACK;
    }
    else if (!pending_.empty()) {
        state_ = QueueState::ACTIVE;
    }
    else {
        state_ = QueueState::IDLE;
    }
}

CommandResult CommandQueue::completeInFlight(CommandState state, const std::string& message) {
    CommandResult result;
    result.id = inFlight_->id;
    result.text = inFlight_->text;
    result.state = state;
    result.message = message;
    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - inFlight_->sentAt);

    if (config_.enableDetailedLogging) {
        std::cout << "CommandQueue: #" << result.id << " " << commandStateToString(state)
            << " after " << result.latency.count() << " ms" << std::endl;
    }

    inFlight_.reset();
    return result;
}

void CommandQueue::recordAckLatency(std::chrono::milliseconds latency) {
    // Running mean over acknowledged commands
    const double count = static_cast<double>(stats_.totalCompleted + 1);
    stats_.averageAckMs += (static_cast<double>(latency.count()) - stats_.averageAckMs) / count;
}

bool CommandQueue::canSend() const {
    return !paused_ && !inFlight_ && !pending_.empty();
}

void CommandQueue::setError(const std::string& error) const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
    std::cerr << "CommandQueue Error: " << error << std::endl;
}

std::string queueStateToString(QueueState state) {
    switch (state) {
    case QueueState::IDLE: return "Idle";
    case QueueState::ACTIVE: return "Active";
    case QueueState::WAITING_FOR_ACK: return "WaitingForAck";
    case QueueState::PAUSED: return "Paused";
    }
    return "Unknown";
}

std::string commandStateToString(CommandState state) {
    switch (state) {
    case CommandState::QUEUED: return "Queued";
    case CommandState::SENT: return "Sent";
    case CommandState::ACKED: return "Acked";
    case CommandState::TIMED_OUT: return "TimedOut";
    case CommandState::FAILED: return "Failed";
    }
    return "Unknown";
}
