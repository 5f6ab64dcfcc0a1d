#include "cnclink/ProgramTracker.hpp"

ProgramTracker::ProgramTracker()
    : stopped_(false)
{
}

void ProgramTracker::begin(const std::vector<uint64_t>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = ProgramProgress();
    stopped_ = false;
    startedAt_ = std::chrono::steady_clock::now();
    finishedAt_ = startedAt_;

    if (ids.empty()) {
        return;
    }

    // Batch ids are assigned contiguously under the queue lock
    progress_.firstId = ids.front();
    progress_.lastId = ids.back();
    progress_.totalLines = ids.size();
    progress_.state = ProgramExecutionState::RUNNING;
}

void ProgramTracker::recordSent(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (contains(id)) {
        ++progress_.linesSent;
    }
}

bool ProgramTracker::recordResult(const CommandResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!contains(result.id) || stopped_ || allAnswered()) {
        return false;
    }

    if (result.state == CommandState::ACKED) {
        ++progress_.linesCompleted;
    }
    else {
        ++progress_.linesFailed;
        if (!progress_.firstFailedId) {
            progress_.firstFailedId = result.id;
        }
    }

    if (!allAnswered()) {
        return false;
    }

    finishedAt_ = std::chrono::steady_clock::now();
    progress_.state = progress_.linesFailed == 0
        ? ProgramExecutionState::COMPLETED
        : ProgramExecutionState::ERROR;
    return true;
}

void ProgramTracker::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (progress_.totalLines == 0 || stopped_ || allAnswered()) {
        return;
    }
    stopped_ = true;
    finishedAt_ = std::chrono::steady_clock::now();
    progress_.state = ProgramExecutionState::STOPPED;
}

void ProgramTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = ProgramProgress();
    stopped_ = false;
}

ProgramProgress ProgramTracker::getProgress(bool queuePaused) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProgramProgress snapshot = progress_;
    if (snapshot.totalLines == 0) {
        return snapshot;
    }

    const bool finished = stopped_ || allAnswered();
    const auto end = finished ? finishedAt_ : std::chrono::steady_clock::now();
    snapshot.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - startedAt_);

    if (!finished) {
        snapshot.state = queuePaused ? ProgramExecutionState::PAUSED : ProgramExecutionState::RUNNING;
    }
    return snapshot;
}

bool ProgramTracker::contains(uint64_t id) const {
    return progress_.totalLines > 0 && id >= progress_.firstId && id <= progress_.lastId;
}

bool ProgramTracker::allAnswered() const {
    return progress_.totalLines > 0 &&
           progress_.linesCompleted + progress_.linesFailed >= progress_.totalLines;
}

std::string programExecutionStateToString(ProgramExecutionState state) {
    switch (state) {
    case ProgramExecutionState::NOT_LOADED: return "NotLoaded";
    case ProgramExecutionState::RUNNING: return "Running";
    case ProgramExecutionState::PAUSED: return "Paused";
    case ProgramExecutionState::STOPPED: return "Stopped";
    case ProgramExecutionState::COMPLETED: return "Completed";
    case ProgramExecutionState::ERROR: return "Error";
    }
    return "Unknown";
}
