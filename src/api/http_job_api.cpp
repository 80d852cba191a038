#include "ferry/api/http_job_api.hpp"

#include <spdlog/spdlog.h>

namespace ferry::api {

using json = nlohmann::json;

namespace {

constexpr const char* kCreateJobPath = "/api/create-job";
constexpr const char* kUploadFilePath = "/api/upload-file";
constexpr const char* kCompleteUploadPath = "/api/complete-upload";
constexpr const char* kListJobsPath = "/api/get-jobs-by-user";

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

} // namespace

std::string ApiFailure::describe() const {
    switch (kind) {
        case Kind::Transport:
            return "Network error: " + message;
        case Kind::Rejected:
        case Kind::Server:
            return "HTTP " + std::to_string(status_code) + (message.empty() ? "" : ": " + message);
    }
    return message;
}

std::string extract_error_message(const network::HttpResponse& response) {
    const std::string body = response.body_as_string();
    const json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (const auto it = parsed.find("error"); it != parsed.end()) {
            return it->is_string() ? it->get<std::string>() : it->dump();
        }
    }
    if (!body.empty()) {
        return body;
    }
    return response.reason_phrase;
}

HttpJobApi::HttpJobApi(network::HttpClient client) : client_(std::move(client)) {}

Result<network::HttpResponse, ApiFailure> HttpJobApi::post(const std::string& path, const json& body) const {
    return post(path, body.dump());
}

Result<network::HttpResponse, ApiFailure> HttpJobApi::post(const std::string& path, std::string body) const {
    auto response = client_.post_json(path, std::move(body));
    if (response.is_error()) {
        return Err<network::HttpResponse>(ApiFailure::transport(response.error()));
    }
    if (!response.value().is_success()) {
        return Err<network::HttpResponse>(
            ApiFailure::from_status(response.value().status_code, extract_error_message(response.value())));
    }
    return Ok<network::HttpResponse, ApiFailure>(std::move(response.value()));
}

Result<CreatedJob, ApiFailure> HttpJobApi::create_job(const json& parameters) {
    auto response = post(kCreateJobPath, parameters);
    if (response.is_error()) {
        spdlog::error("Job creation failed: {}", response.error().describe());
        return Err<CreatedJob>(response.error());
    }

    const auto& http = response.value();
    const json body = json::parse(http.body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<CreatedJob>(ApiFailure::from_status(http.status_code, "Job creation returned a non-JSON body"));
    }

    CreatedJob job;
    job.job_id = string_field(body, "jobId");
    if (job.job_id.empty()) {
        return Err<CreatedJob>(ApiFailure::from_status(http.status_code, "Job creation response has no jobId"));
    }
    job.storage_locator = http.get_header("X-SAS-Token-URL");
    job.copy_command = http.get_header("X-AzCopy-Command");

    spdlog::info("Created job {}", job.job_id);
    return Ok<CreatedJob, ApiFailure>(std::move(job));
}

Result<void, ApiFailure> HttpJobApi::upload_file(const FileUploadRequest& request) {
    const json fields{
        {"jobId", request.job_id},
        {"fileName", request.file_name},
        {"filePath", request.file_path},
        {"contentType", request.content_type},
    };

    // Splice the payload into the dumped fields rather than copying it through
    // a json value; base64 text needs no JSON escaping.
    std::string body = fields.dump();
    body.pop_back();
    body.reserve(body.size() + request.content_base64.size() + 20);
    body += ",\"fileContent\":\"";
    body += request.content_base64;
    body += "\"}";

    auto response = post(kUploadFilePath, std::move(body));
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok<ApiFailure>();
}

Result<void, ApiFailure> HttpJobApi::complete_upload(const std::string& job_id) {
    auto response = post(kCompleteUploadPath, json{{"jobId", job_id}});
    if (response.is_error()) {
        spdlog::error("Completing job {} failed: {}", job_id, response.error().describe());
        return Err<void>(response.error());
    }
    return Ok<ApiFailure>();
}

Result<std::vector<JobSummary>, ApiFailure> HttpJobApi::list_jobs(const std::string& user_id) {
    auto response = client_.get(std::string(kListJobsPath) + "?userId=" + network::url_encode(user_id));
    if (response.is_error()) {
        return Err<std::vector<JobSummary>>(ApiFailure::transport(response.error()));
    }

    const auto& http = response.value();
    if (!http.is_success()) {
        return Err<std::vector<JobSummary>>(ApiFailure::from_status(http.status_code, extract_error_message(http)));
    }

    const json items = json::parse(http.body_as_string(), nullptr, false);
    if (items.is_discarded() || !items.is_array()) {
        return Err<std::vector<JobSummary>>(ApiFailure::from_status(http.status_code, "Job list is not a JSON array"));
    }

    std::vector<JobSummary> jobs;
    jobs.reserve(items.size());
    for (const auto& item : items) {
        if (!item.is_object()) {
            continue;
        }
        JobSummary summary;
        summary.job_id = string_field(item, "id");
        summary.status = string_field(item, "request_status");
        summary.submitted_at = string_field(item, "job_submission_time");
        summary.folder_name = string_field(item, "folder_name");
        if (const auto it = item.find("num_images"); it != item.end() && it->is_number_integer()) {
            summary.num_images = it->get<std::int64_t>();
        }
        summary.raw = item;
        jobs.push_back(std::move(summary));
    }
    return Ok<std::vector<JobSummary>, ApiFailure>(std::move(jobs));
}

} // namespace ferry::api
