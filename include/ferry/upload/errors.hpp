#pragma once

#include <cstddef>
#include <string>

namespace ferry::upload {

/**
 * @brief Job-level failure reported to the caller of the orchestrator
 */
struct UploadError {
    enum class Kind {
        Validation,     ///< Bad input; nothing changed, no state transition
        NotFound,       ///< No checkpoint for the requested job
        InvalidState,   ///< Operation not allowed in the current job state
        Api,            ///< Job creation or completion call failed
        Storage,        ///< Checkpoint could not be read or written
        Aborted         ///< Failure threshold reached, job left resumable
    };

    Kind kind = Kind::Validation;
    std::string message;
    std::size_t pending_files = 0;   ///< Files still pending when the error was raised

    static UploadError validation(std::string message) {
        return UploadError{Kind::Validation, std::move(message), 0};
    }

    static UploadError make(Kind kind, std::string message, std::size_t pending = 0) {
        return UploadError{kind, std::move(message), pending};
    }
};

inline const char* to_string(UploadError::Kind kind) {
    switch (kind) {
        case UploadError::Kind::Validation: return "validation";
        case UploadError::Kind::NotFound: return "not_found";
        case UploadError::Kind::InvalidState: return "invalid_state";
        case UploadError::Kind::Api: return "api";
        case UploadError::Kind::Storage: return "storage";
        case UploadError::Kind::Aborted: return "aborted";
    }
    return "unknown";
}

} // namespace ferry::upload
