#pragma once

#include <optional>
#include <string>

namespace core::jobs {
    enum class JobState {
        CREATED, // "CRE" - Job accepted, waiting for a worker
        SLICING, // "SLI" - Model fetch and slicer run in progress
        QUEUED, // "QUE" - Toolpath ready, waiting for the device
        PRINTING, // "PRI" - Driver stream being consumed
        COMPLETED, // "CMP"
        FAILED, // "FAI"
        CANCELLED // "CNC"
    };

    /**
     * @brief Convert JobState enum to string code
     */
    inline std::string jobStateToCode(JobState state) {
        switch (state) {
            case JobState::CREATED: return "CRE";
            case JobState::SLICING: return "SLI";
            case JobState::QUEUED: return "QUE";
            case JobState::PRINTING: return "PRI";
            case JobState::COMPLETED: return "CMP";
            case JobState::FAILED: return "FAI";
            case JobState::CANCELLED: return "CNC";
            default: return "UNK";
        }
    }

    inline std::string jobStateToString(JobState state) {
        switch (state) {
            case JobState::CREATED: return "Created";
            case JobState::SLICING: return "Slicing";
            case JobState::QUEUED: return "Queued";
            case JobState::PRINTING: return "Printing";
            case JobState::COMPLETED: return "Completed";
            case JobState::FAILED: return "Failed";
            case JobState::CANCELLED: return "Cancelled";
            default: return "Unknown";
        }
    }

    inline std::optional<JobState> jobStateFromString(const std::string &name) {
        for (auto state: {JobState::CREATED, JobState::SLICING, JobState::QUEUED, JobState::PRINTING,
                          JobState::COMPLETED, JobState::FAILED, JobState::CANCELLED}) {
            if (name == jobStateToString(state) || name == jobStateToCode(state)) {
                return state;
            }
        }
        return std::nullopt;
    }

    enum class JobKind {
        PRINT, // slice, then stream the toolpath to a device
        SLICE // slice to an output file, never claims a device
    };

    inline std::string jobKindToString(JobKind kind) {
        return kind == JobKind::SLICE ? "slice" : "print";
    }

    inline bool isTerminal(JobState state) {
        return state == JobState::COMPLETED || state == JobState::FAILED || state == JobState::CANCELLED;
    }

    /**
     * @brief Transition graph: the forward chain plus Failed/Cancelled from any non-terminal state.
     *
     * Slice jobs leave Slicing straight for Completed and never see Queued or Printing.
     */
    inline bool isLegalTransition(JobState from, JobState to, JobKind kind = JobKind::PRINT) {
        if (isTerminal(from)) return false;
        if (to == JobState::FAILED || to == JobState::CANCELLED) return true;

        switch (from) {
            case JobState::CREATED: return to == JobState::SLICING;
            case JobState::SLICING:
                return to == (kind == JobKind::SLICE ? JobState::COMPLETED : JobState::QUEUED);
            case JobState::QUEUED: return to == JobState::PRINTING;
            case JobState::PRINTING: return to == JobState::COMPLETED;
            default: return false;
        }
    }
}
