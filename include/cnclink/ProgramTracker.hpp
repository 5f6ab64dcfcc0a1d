#pragma once

#include "cnclink/CommandQueue.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class ProgramExecutionState {
    NOT_LOADED,
    RUNNING,
    PAUSED,      // Queue paused with program lines outstanding
    STOPPED,     // Remaining lines cleared from the queue
    COMPLETED,   // Every line acknowledged
    ERROR        // Every line answered, at least one failed or timed out
};

/**
 * Snapshot of one streamed program
 */
struct ProgramProgress {
    ProgramExecutionState state = ProgramExecutionState::NOT_LOADED;
    uint64_t firstId = 0;
    uint64_t lastId = 0;
    size_t totalLines = 0;
    size_t linesSent = 0;
    size_t linesCompleted = 0;   // Acked
    size_t linesFailed = 0;      // Failed or timed out
    std::optional<uint64_t> firstFailedId;
    std::chrono::milliseconds elapsed{ 0 };

    // Fraction of lines answered, 0.0 to 1.0
    double progress() const {
        return totalLines == 0 ? 0.0
            : static_cast<double>(linesCompleted + linesFailed) / static_cast<double>(totalLines);
    }

    bool isFinished() const {
        return state == ProgramExecutionState::COMPLETED ||
               state == ProgramExecutionState::ERROR ||
               state == ProgramExecutionState::STOPPED;
    }
};

/**
 * Follows the command ids of the most recently queued program and counts
 * their results. Thread-safe; results for other ids are ignored.
 */
class ProgramTracker {
public:
    ProgramTracker();

    /**
     * Start tracking a program whose lines were queued under `ids`
     */
    void begin(const std::vector<uint64_t>& ids);

    void recordSent(uint64_t id);

    /**
     * Count a command result
     * @return true if this result finished the program
     */
    bool recordResult(const CommandResult& result);

    /**
     * Mark the unanswered remainder as dropped
     */
    void stop();

    void reset();

    ProgramProgress getProgress(bool queuePaused) const;

private:
    mutable std::mutex mutex_;
    ProgramProgress progress_;
    bool stopped_;
    std::chrono::steady_clock::time_point startedAt_;
    std::chrono::steady_clock::time_point finishedAt_;

    bool contains(uint64_t id) const;
    bool allAnswered() const;
};

std::string programExecutionStateToString(ProgramExecutionState state);
