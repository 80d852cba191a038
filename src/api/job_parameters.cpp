#include "ferry/api/job_parameters.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace ferry::api {

using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 2> kModelVersions{"1000-redwood", "5b"};
constexpr std::array<const char*, 3> kHitaxTypes{"off", "label rollup", "hitax classifier"};

template<std::size_t N>
bool one_of(const std::string& value, const std::array<const char*, N>& allowed) {
    return std::any_of(allowed.begin(), allowed.end(), [&](const char* option) { return value == option; });
}

bool is_flag(const std::string& value) {
    return value == "True" || value == "False";
}

} // namespace

bool is_valid_email(const std::string& email) {
    static const std::regex pattern(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    return std::regex_match(email, pattern);
}

std::string sanitize_request_name(const std::string& value) {
    std::string sanitized = value;
    for (auto& ch : sanitized) {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && ch != '.' && ch != '_' && ch != '-') {
            ch = '_';
        }
    }
    return sanitized;
}

Result<void> JobParameters::validate() const {
    if (!email.empty() && !is_valid_email(email)) {
        return Err<void>(std::string("Please enter a valid email address"));
    }
    if (!one_of(model_version, kModelVersions)) {
        return Err<void>("Unknown detection model: " + model_version);
    }
    if (!is_flag(classify)) {
        return Err<void>(std::string("classify must be True or False"));
    }
    if (!one_of(hitax_type, kHitaxTypes)) {
        return Err<void>("Unknown hierarchical classification type: " + hitax_type);
    }
    if (!is_flag(do_smoothing)) {
        return Err<void>(std::string("do_smoothing must be True or False"));
    }
    return Ok();
}

json JobParameters::to_json(const std::string& user_id) const {
    return json{
        {"email", email},
        {"model_version", model_version},
        {"classify", classify},
        {"hitax_type", hitax_type},
        {"do_smoothing", do_smoothing},
        {"request_name", sanitize_request_name(user_id)},
        {"api_instance_name", "web"},
        {"input_container_sas", ""},
    };
}

Result<JobParameters> JobParameters::from_json(const json& object) {
    if (!object.is_object()) {
        return Err<JobParameters>(std::string("Job parameters must be a JSON object"));
    }

    JobParameters params;
    const auto read = [&](const char* key, std::string& out) -> bool {
        const auto it = object.find(key);
        if (it == object.end()) {
            return true;
        }
        if (!it->is_string()) {
            return false;
        }
        out = it->get<std::string>();
        return true;
    };

    if (!read("email", params.email) || !read("model_version", params.model_version) ||
        !read("classify", params.classify) || !read("hitax_type", params.hitax_type) ||
        !read("do_smoothing", params.do_smoothing)) {
        return Err<JobParameters>(std::string("Job parameter values must be strings"));
    }
    return Ok(std::move(params));
}

} // namespace ferry::api
