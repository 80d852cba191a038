#pragma once

#include "ferry/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace ferry::api {

/**
 * @brief Processing options chosen by the submitter
 *
 * String-typed flags ("True"/"False") mirror what the processing service
 * expects on the wire.
 */
struct JobParameters {
    std::string email;                          ///< Optional, validated when set
    std::string model_version = "1000-redwood";
    std::string classify = "False";
    std::string hitax_type = "off";
    std::string do_smoothing = "False";

    Result<void> validate() const;

    /**
     * @brief Request body for job creation, minus the selection fields
     *
     * num_images and image_path_prefix depend on the files and are filled in
     * by the orchestrator once the selection has been classified.
     */
    nlohmann::json to_json(const std::string& user_id) const;

    static Result<JobParameters> from_json(const nlohmann::json& object);
};

bool is_valid_email(const std::string& email);

/// Replace every character outside [A-Za-z0-9._-] with '_'
std::string sanitize_request_name(const std::string& value);

} // namespace ferry::api
