#include "cnclink/ConnectionManager.hpp"
#include "cnclink/preprocessor.hpp"
#include <iostream>

ConnectionManager::ConnectionManager(std::unique_ptr<Connection> connection,
                                     const ConnectionManagerConfig& config)
    : connection_(std::move(connection))
    , config_(config)
    , queue_(config.queue)
    , state_(ConnectionState::DISCONNECTED)
    , running_(false)
    , lastMachineState_(MachineState::UNKNOWN)
    , statusChannel_(config.subscriberCapacity)
    , responseChannel_(config.subscriberCapacity)
    , eventChannel_(config.subscriberCapacity)
    , resultChannel_(config.subscriberCapacity)
{
}

ConnectionManager::~ConnectionManager() {
    disconnect();
    statusChannel_.close();
    responseChannel_.close();
    eventChannel_.close();
    resultChannel_.close();
}

// =============================================================================
// Lifecycle
// =============================================================================
bool ConnectionManager::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    if (state_.load() == ConnectionState::CONNECTED) {
        return true;
    }
    if (!connection_) {
        setError("No transport configured");
        return false;
    }
    if (!config_.isValid()) {
        setError("Invalid connection manager configuration");
        return false;
    }

    // Threads left behind by an earlier transport failure
    stopThreads();

    state_ = ConnectionState::CONNECTING;
    std::cout << "Connecting to " << connection_->getDescription() << "..." << std::endl;

    // A transport that failed earlier still holds its dead handle
    connection_->disconnect();

    if (!connection_->connect(config_.connectTimeout)) {
        connection_->disconnect();
        state_ = ConnectionState::ERROR;
        const std::string reason = "Connect failed: " + connection_->getLastError();
        setError(reason);
        publishEvent(ConnectionEventType::ERROR, reason);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(overrideMutex_);
        overrides_.reset();
    }
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        latestStatus_.reset();
        lastMachineState_ = MachineState::UNKNOWN;
    }

    running_ = true;
    state_ = ConnectionState::CONNECTED;

    receiveThread_ = std::thread(&ConnectionManager::receiveLoop, this);
    sendThread_ = std::thread(&ConnectionManager::sendLoop, this);
    if (config_.enableStatusPolling) {
        pollThread_ = std::thread(&ConnectionManager::pollLoop, this);
    }

    std::cout << "✅ Connected to " << connection_->getDescription() << std::endl;
    publishEvent(ConnectionEventType::CONNECTED, connection_->getDescription());
    return true;
}

void ConnectionManager::disconnect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    const ConnectionState previous = state_.load();
    stopThreads();

    if (connection_) {
        connection_->disconnect();
    }

    if (auto result = queue_.markSendFailed("Disconnected")) {
        publishResult(*result);
    }
    holdPendingCommands();

    if (previous == ConnectionState::DISCONNECTED) {
        return;
    }

    state_ = ConnectionState::DISCONNECTED;
    std::cout << "Disconnected from " << getDescription() << std::endl;
    publishEvent(ConnectionEventType::DISCONNECTED, "Disconnected");
}

void ConnectionManager::stopThreads() {
    {
        std::lock_guard<std::mutex> lock(shutdownMutex_);
        running_ = false;
    }
    shutdownCv_.notify_all();
    queue_.wakeAll();

    if (receiveThread_.joinable()) receiveThread_.join();
    if (sendThread_.joinable()) sendThread_.join();
    if (pollThread_.joinable()) pollThread_.join();
}

void ConnectionManager::handleTransportFailure(const std::string& reason) {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        // Already shutting down
        return;
    }

    // Pairs with the poll loop's predicate check so the wakeup is not lost
    {
        std::lock_guard<std::mutex> lock(shutdownMutex_);
    }
    shutdownCv_.notify_all();
    queue_.wakeAll();

    setError(reason);
    state_ = ConnectionState::ERROR;

    if (auto result = queue_.markSendFailed(reason)) {
        publishResult(*result);
    }
    holdPendingCommands();
    publishEvent(ConnectionEventType::ERROR, reason);
}

void ConnectionManager::holdPendingCommands() {
    const size_t held = queue_.pauseIfPending();
    if (held > 0) {
        std::cout << "ConnectionManager: " << held
                  << " queued commands held until resume() or clearQueue()" << std::endl;
    }
}

// =============================================================================
// Commands
// =============================================================================
bool ConnectionManager::sendRealtime(RealtimeCommand command) {
    if (!isConnected()) {
        setError("Not connected to CNC");
        return false;
    }

    const std::string byte(1, static_cast<char>(GrblProtocol::formatRealtime(command)));
    if (!connection_->write(byte)) {
        handleTransportFailure("Write failed: " + connection_->getLastError());
        return false;
    }

    std::lock_guard<std::mutex> lock(overrideMutex_);
    overrides_.apply(command);
    return true;
}

bool ConnectionManager::sendCommand(const GrblCommand& command, uint64_t* id) {
    if (!isConnected()) {
        setError("Not connected to CNC");
        return false;
    }

    std::string line = GrblProtocol::formatCommand(command);
    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }

    if (!queue_.enqueue(line, id)) {
        setError(queue_.getLastError());
        return false;
    }
    return true;
}

bool ConnectionManager::sendLine(const std::string& line, uint64_t* id) {
    return sendCommand(GrblCommand::gcode(line), id);
}

bool ConnectionManager::enqueueProgram(const std::vector<Segment>& segments, std::vector<uint64_t>* ids) {
    if (!isConnected()) {
        setError("Not connected to CNC");
        return false;
    }

    Preprocessor formatter;
    const std::vector<std::string> lines = formatter.formatProgram(segments);

    std::vector<uint64_t> queued;
    {
        std::lock_guard<std::mutex> lock(programMutex_);
        if (!queue_.enqueueBatch(lines, &queued)) {
            setError(queue_.getLastError());
            return false;
        }
        program_.begin(queued);
    }
    if (ids) {
        ids->insert(ids->end(), queued.begin(), queued.end());
    }

    std::cout << "Queued program: " << segments.size() << " segments, "
              << lines.size() << " lines" << std::endl;
    return true;
}

void ConnectionManager::pause() {
    queue_.pause();
}

void ConnectionManager::resume() {
    queue_.resume();
}

size_t ConnectionManager::clearQueue() {
    const size_t dropped = queue_.clear();
    if (dropped > 0) {
        program_.stop();
    }
    return dropped;
}

bool ConnectionManager::waitForQueueIdle(std::chrono::milliseconds timeout) {
    return queue_.waitForIdle(timeout);
}

QueueState ConnectionManager::getQueueState() const {
    return queue_.getState();
}

QueueStats ConnectionManager::getQueueStats() const {
    return queue_.getStats();
}

ProgramProgress ConnectionManager::getProgramProgress() const {
    return program_.getProgress(queue_.isPaused());
}

// =============================================================================
// Observed state
// =============================================================================
std::shared_ptr<const GrblStatus> ConnectionManager::getLatestStatus() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return latestStatus_;
}

OverrideState ConnectionManager::getOverrideState() const {
    std::lock_guard<std::mutex> lock(overrideMutex_);
    return overrides_;
}

std::map<int, std::string> ConnectionManager::getSettings() const {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    return settings_;
}

std::string ConnectionManager::getDescription() const {
    return connection_ ? connection_->getDescription() : std::string("No transport");
}

std::string ConnectionManager::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

// =============================================================================
// Background loops
// =============================================================================
void ConnectionManager::receiveLoop() {
    std::string line;
    while (running_.load()) {
        const ReceiveResult result = connection_->readLine(line, config_.receiveTimeout);

        switch (result) {
        case ReceiveResult::LINE:
            processLine(line);
            break;
        case ReceiveResult::TIMEOUT:
            break;
        case ReceiveResult::CLOSED:
            handleTransportFailure("Connection closed by controller");
            return;
        case ReceiveResult::ERROR:
            handleTransportFailure("Read failed: " + connection_->getLastError());
            return;
        }
    }
}

void ConnectionManager::sendLoop() {
    while (running_.load()) {
        if (auto expired = queue_.checkTimeout()) {
            publishResult(*expired);
        }

        if (!queue_.waitForSendable(config_.sendWait)) {
            continue;
        }
        if (!running_.load()) {
            break;
        }

        auto command = queue_.dequeueForSend();
        if (!command) {
            continue;
        }

        if (config_.enableDetailedLogging) {
            std::cout << ">> " << command->text << std::endl;
        }

        if (!connection_->write(command->text + "\n")) {
            const std::string reason = "Write failed: " + connection_->getLastError();
            if (auto failed = queue_.markSendFailed(reason)) {
                publishResult(*failed);
            }
            handleTransportFailure(reason);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(programMutex_);
            program_.recordSent(command->id);
        }
    }
}

void ConnectionManager::pollLoop() {
    const std::string query(1, static_cast<char>(GrblProtocol::formatRealtime(RealtimeCommand::STATUS_QUERY)));

    while (true) {
        {
            std::unique_lock<std::mutex> lock(shutdownMutex_);
            shutdownCv_.wait_for(lock, config_.statusPollInterval, [this] { return !running_.load(); });
            if (!running_.load()) {
                return;
            }
        }

        if (!connection_->write(query)) {
            handleTransportFailure("Status poll failed: " + connection_->getLastError());
            return;
        }
    }
}

void ConnectionManager::processLine(const std::string& line) {
    if (line.empty()) {
        return;
    }

    const GrblResponse response = GrblProtocol::parseResponse(line);

    if (config_.enableDetailedLogging && response.type != ResponseType::STATUS) {
        std::cout << "<< " << line << std::endl;
    }

    switch (response.type) {
    case ResponseType::STATUS: {
        auto snapshot = std::make_shared<const GrblStatus>(response.status);
        MachineState previous;
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            latestStatus_ = snapshot;
            previous = lastMachineState_;
            lastMachineState_ = response.status.state;
        }
        if (response.status.overrides) {
            std::lock_guard<std::mutex> lock(overrideMutex_);
            overrides_ = *response.status.overrides;
        }
        statusChannel_.publish(response.status);

        if (previous != response.status.state) {
            ConnectionEvent event;
            event.type = ConnectionEventType::MACHINE_STATE_CHANGED;
            event.message = GrblProtocol::machineStateToString(previous) + " -> " +
                GrblProtocol::machineStateToString(response.status.state);
            event.previousMachineState = previous;
            event.machineState = response.status.state;
            publishEvent(event);
        }
        break;
    }
    case ResponseType::SETTING: {
        std::lock_guard<std::mutex> lock(settingsMutex_);
        settings_[response.settingNumber] = response.settingValue;
        break;
    }
    case ResponseType::WELCOME: {
        std::cout << "Controller reset: Grbl " << response.version << std::endl;
        {
            std::lock_guard<std::mutex> lock(overrideMutex_);
            overrides_.reset();
        }
        publishEvent(ConnectionEventType::CONTROLLER_RESET, "Grbl " + response.version);
        break;
    }
    case ResponseType::ALARM:
        std::cerr << "ConnectionManager: ALARM:" << response.code << " " << response.message << std::endl;
        break;
    case ResponseType::ERROR:
        if (config_.enableDetailedLogging) {
            std::cerr << "ConnectionManager: error:" << response.code << " " << response.message << std::endl;
        }
        break;
    case ResponseType::OK:
    case ResponseType::FEEDBACK:
        break;
    }

    if (auto result = queue_.handleResponse(response)) {
        publishResult(*result);
    }

    responseChannel_.publish(response);
}

void ConnectionManager::publishResult(const CommandResult& result) {
    if (result.state == CommandState::TIMED_OUT) {
        std::cerr << "ConnectionManager: command timed out: " << result.text << std::endl;
    }
    resultChannel_.publish(result);

    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(programMutex_);
        finished = program_.recordResult(result);
    }
    if (finished) {
        const ProgramProgress progress = program_.getProgress(false);
        std::cout << "Program " << programExecutionStateToString(progress.state) << ": "
                  << progress.linesCompleted << "/" << progress.totalLines << " lines acknowledged in "
                  << progress.elapsed.count() << " ms" << std::endl;
        publishEvent(ConnectionEventType::PROGRAM_FINISHED, programExecutionStateToString(progress.state));
    }
}

void ConnectionManager::publishEvent(ConnectionEventType type, const std::string& message) {
    ConnectionEvent event;
    event.type = type;
    event.message = message;
    publishEvent(event);
}

void ConnectionManager::publishEvent(const ConnectionEvent& event) {
    ConnectionEvent stamped = event;
    stamped.state = state_.load();
    stamped.timestamp = std::chrono::steady_clock::now();
    eventChannel_.publish(stamped);
}

void ConnectionManager::setError(const std::string& error) const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
    std::cerr << "ConnectionManager Error: " << error << std::endl;
}

// =============================================================================
// Utilities
// =============================================================================
std::string connectionStateToString(ConnectionState state) {
    switch (state) {
    case ConnectionState::DISCONNECTED: return "DISCONNECTED";
    case ConnectionState::CONNECTING: return "CONNECTING";
    case ConnectionState::CONNECTED: return "CONNECTED";
    case ConnectionState::ERROR: return "ERROR";
    default: return "UNKNOWN";
    }
}

std::string connectionEventTypeToString(ConnectionEventType type) {
    switch (type) {
    case ConnectionEventType::CONNECTED: return "CONNECTED";
    case ConnectionEventType::DISCONNECTED: return "DISCONNECTED";
    case ConnectionEventType::ERROR: return "ERROR";
    case ConnectionEventType::CONTROLLER_RESET: return "CONTROLLER_RESET";
    case ConnectionEventType::MACHINE_STATE_CHANGED: return "MACHINE_STATE_CHANGED";
    case ConnectionEventType::PROGRAM_FINISHED: return "PROGRAM_FINISHED";
    default: return "UNKNOWN";
    }
}
