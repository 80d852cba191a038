#pragma once

#include "ferry/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace ferry::api {

/**
 * @brief Why a remote call did not succeed
 *
 * Transport: no HTTP response at all (connect/send/receive failed).
 * Rejected:  the server answered 4xx; sending the same request again is
 *            pointless unless it is 408 or 429.
 * Server:    the server answered 5xx.
 */
struct ApiFailure {
    enum class Kind { Transport, Rejected, Server };

    Kind kind = Kind::Transport;
    int status_code = 0;
    std::string message;

    bool retryable() const noexcept {
        switch (kind) {
            case Kind::Transport:
            case Kind::Server:
                return true;
            case Kind::Rejected:
                return status_code == 408 || status_code == 429;
        }
        return false;
    }

    static ApiFailure transport(std::string message) {
        return ApiFailure{Kind::Transport, 0, std::move(message)};
    }

    static ApiFailure from_status(int status_code, std::string message) {
        return ApiFailure{status_code >= 500 ? Kind::Server : Kind::Rejected, status_code, std::move(message)};
    }

    std::string describe() const;
};

/// One file transfer, exactly what the upload endpoint receives
struct FileUploadRequest {
    std::string job_id;
    std::string file_name;
    std::string file_path;       ///< Path below the top-level folder
    std::string content_base64;
    std::string content_type;
};

struct CreatedJob {
    std::string job_id;
    std::string storage_locator;   ///< Time-limited URL for out-of-band copies
    std::string copy_command;      ///< Ready-made bulk copy invocation
};

struct JobSummary {
    std::string job_id;
    std::string status;           ///< created, submitting_job, running, failed, problem, completed, canceled
    std::int64_t num_images = 0;
    std::string submitted_at;
    std::string folder_name;
    nlohmann::json raw = nlohmann::json::object();
};

/**
 * @brief Remote file transfer endpoint
 */
class FileUploadApi {
public:
    virtual ~FileUploadApi() = default;

    virtual Result<void, ApiFailure> upload_file(const FileUploadRequest& request) = 0;
};

/**
 * @brief Remote job lifecycle endpoints
 *
 * Implementations must tolerate upload_file() being called from several
 * threads at once; the other calls come from the controlling thread.
 */
class JobApi : public FileUploadApi {
public:
    /// `parameters` is sent as the request body unchanged
    virtual Result<CreatedJob, ApiFailure> create_job(const nlohmann::json& parameters) = 0;

    virtual Result<void, ApiFailure> complete_upload(const std::string& job_id) = 0;

    virtual Result<std::vector<JobSummary>, ApiFailure> list_jobs(const std::string& user_id) = 0;
};

} // namespace ferry::api
