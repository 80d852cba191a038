#pragma once

#include "ferry/api/job_api.hpp"
#include "ferry/network/http_client.hpp"

namespace ferry::api {

/**
 * @brief JobApi over the HTTP/JSON endpoints of the upload service
 *
 *   POST /api/create-job            parameters -> {"jobId"} + storage headers
 *   POST /api/upload-file           {jobId, fileName, filePath, fileContent, contentType}
 *   POST /api/complete-upload       {jobId}
 *   GET  /api/get-jobs-by-user?userId=...
 *
 * Stateless apart from the client configuration, so upload_file() is safe to
 * call concurrently.
 */
class HttpJobApi : public JobApi {
public:
    explicit HttpJobApi(network::HttpClient client);

    Result<CreatedJob, ApiFailure> create_job(const nlohmann::json& parameters) override;
    Result<void, ApiFailure> upload_file(const FileUploadRequest& request) override;
    Result<void, ApiFailure> complete_upload(const std::string& job_id) override;
    Result<std::vector<JobSummary>, ApiFailure> list_jobs(const std::string& user_id) override;

private:
    /// Transport errors and non-2xx responses become ApiFailure
    Result<network::HttpResponse, ApiFailure> post(const std::string& path, const nlohmann::json& body) const;
    Result<network::HttpResponse, ApiFailure> post(const std::string& path, std::string body) const;

    network::HttpClient client_;
};

/// Server message from a failed response: {"error": ...} when present, else the raw body
std::string extract_error_message(const network::HttpResponse& response);

} // namespace ferry::api
