/**
 * @file upload_client.cpp
 * @brief ferry_upload: command line front end for the upload orchestrator
 *
 * USAGE:
 *   ferry_upload [options] submit <dir>     create a job and upload every image below <dir>
 *   ferry_upload [options] resume <dir>     continue the newest unfinished job from <dir>
 *   ferry_upload [options] status           show the unfinished job, if any
 *   ferry_upload [options] complete <id>    retry the completion call of a fully uploaded job
 *   ferry_upload [options] abandon <id>     forget a saved job
 *   ferry_upload [options] jobs <userId>    list jobs known to the server
 *
 * OPTIONS:
 *   --config <file>  --server <url>  --state-dir <dir>  --log-level <level>
 *   --user <id>  --email <addr>  --model <name>  --classify True|False
 *   --hitax <type>  --smoothing True|False  --yes
 */

#include "ferry/api/http_job_api.hpp"
#include "ferry/api/job_parameters.hpp"
#include "ferry/core/config.hpp"
#include "ferry/events/components.hpp"
#include "ferry/events/event_bus.hpp"
#include "ferry/network/http_client.hpp"
#include "ferry/storage/file_kv_store.hpp"
#include "ferry/upload/checkpoint_store.hpp"
#include "ferry/upload/classifier.hpp"
#include "ferry/upload/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace ferry;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
    std::string command;
    std::vector<std::string> arguments;
    std::string config_path;
    std::string server_url;
    std::string state_dir;
    std::string log_level;
    std::string user_id;
    api::JobParameters parameters;
    bool email_set = false;
    bool assume_yes = false;
};

void print_usage() {
    std::cerr <<
        "Usage: ferry_upload [options] <command> [args]\n"
        "Commands:\n"
        "  submit <dir>      create a job and upload every image below <dir>\n"
        "  resume <dir>      continue the newest unfinished job with files from <dir>\n"
        "  status            show the unfinished job, if any\n"
        "  complete <jobId>  retry submitting a fully uploaded job\n"
        "  abandon <jobId>   forget a saved job\n"
        "  jobs <userId>     list jobs known to the server\n"
        "Options:\n"
        "  --config <file> --server <url> --state-dir <dir> --log-level <level>\n"
        "  --user <id> --email <addr> --model <name> --classify True|False\n"
        "  --hitax <type> --smoothing True|False --yes\n";
}

bool parse_command_line(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            cli.config_path = argv[++i];
        } else if (arg == "--server" && has_value) {
            cli.server_url = argv[++i];
        } else if (arg == "--state-dir" && has_value) {
            cli.state_dir = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            cli.log_level = argv[++i];
        } else if (arg == "--user" && has_value) {
            cli.user_id = argv[++i];
        } else if (arg == "--email" && has_value) {
            cli.parameters.email = argv[++i];
            cli.email_set = true;
        } else if (arg == "--model" && has_value) {
            cli.parameters.model_version = argv[++i];
        } else if (arg == "--classify" && has_value) {
            cli.parameters.classify = argv[++i];
        } else if (arg == "--hitax" && has_value) {
            cli.parameters.hitax_type = argv[++i];
        } else if (arg == "--smoothing" && has_value) {
            cli.parameters.do_smoothing = argv[++i];
        } else if (arg == "--yes" || arg == "-y") {
            cli.assume_yes = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else if (cli.command.empty()) {
            cli.command = arg;
        } else {
            cli.arguments.push_back(arg);
        }
    }
    return !cli.command.empty();
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void describe_checkpoint(const upload::Checkpoint& checkpoint) {
    std::cout << "Unfinished upload found\n"
              << "  Job:      " << checkpoint.job.job_id << "\n"
              << "  Folder:   " << (checkpoint.job.top_level_folder_name.empty() ? "(unknown)" : checkpoint.job.top_level_folder_name) << "\n"
              << "  Started:  " << format_timestamp(checkpoint.job.created_at) << "\n"
              << "  Progress: " << checkpoint.uploaded << "/" << checkpoint.total() << " files ("
              << upload::Progress::compute_percentage(checkpoint.uploaded, checkpoint.total()) << "%)\n"
              << "  State:    " << upload::to_string(checkpoint.job.state) << "\n";
}

bool confirm(const std::string& question, bool assume_yes) {
    if (assume_yes) {
        return true;
    }
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

Result<std::vector<upload::SourceFile>> scan_selection(const std::string& directory) {
    auto files = upload::scan_directory(directory);
    if (files.is_error()) {
        return files;
    }
    spdlog::info("Found {} files below {}", files.value().size(), directory);
    return files;
}

int report_error(const upload::UploadError& error) {
    std::cerr << "Error (" << upload::to_string(error.kind) << "): " << error.message << "\n";
    return kExitFailure;
}

void report_outcome(const upload::UploadOutcome& outcome) {
    std::cout << "Uploaded " << outcome.progress.uploaded << "/" << outcome.progress.total << " files ("
              << outcome.progress.percentage << "%) in " << outcome.report.batches_run << " batches\n";
    if (outcome.used_fallback) {
        std::cout << "Note: no saved file matched the new selection; all selected files were sent"
                  << (outcome.untracked > 0 ? " (" + std::to_string(outcome.untracked) + " not part of the job)" : "")
                  << "\n";
    }
    if (outcome.submitted) {
        std::cout << "Job " << outcome.job_id << " submitted for processing.\n";
    } else if (outcome.report.failed_count > 0) {
        std::cout << outcome.report.failed_count << " files failed; run 'ferry_upload resume' to retry them.\n";
    }
}

int run_submit(const CommandLine& cli, const UploadConfig& config, upload::UploadOrchestrator& orchestrator) {
    if (cli.arguments.size() != 1) {
        print_usage();
        return kExitUsage;
    }

    if (auto valid = cli.parameters.validate(); valid.is_error()) {
        std::cerr << "Error: " << valid.error() << "\n";
        return kExitUsage;
    }

    auto resumable = orchestrator.find_resumable_job();
    if (resumable.is_error()) {
        return report_error(resumable.error());
    }
    if (resumable.value()) {
        describe_checkpoint(*resumable.value());
        if (!confirm("Start a new job anyway?", cli.assume_yes)) {
            std::cout << "Use 'ferry_upload resume <dir>' to continue the saved job.\n";
            return kExitOk;
        }
    }

    auto files = scan_selection(cli.arguments.front());
    if (files.is_error()) {
        std::cerr << "Error: " << files.error() << "\n";
        return kExitFailure;
    }

    const std::string user_id = cli.user_id.empty() ? config.user_id : cli.user_id;
    const json parameters = cli.parameters.to_json(user_id);

    auto created = orchestrator.create_job(parameters, files.value());
    if (created.is_error()) {
        return report_error(created.error());
    }

    const auto& job = created.value();
    std::cout << "Created job " << job.job_id << ": " << job.eligible_count << " images ("
              << upload::format_file_size(job.eligible_bytes) << "), " << job.ignored_count << " other files ignored\n";
    if (!job.storage_locator.empty()) {
        std::cout << "For very large datasets you can copy the folder directly instead:\n"
                  << "  Storage URL: " << job.storage_locator << "\n";
        if (!job.copy_command.empty()) {
            std::cout << "  Command:     " << job.copy_command << "\n";
        }
    }

    auto outcome = orchestrator.start_or_resume_upload(job.job_id, files.value());
    if (outcome.is_error()) {
        return report_error(outcome.error());
    }
    report_outcome(outcome.value());
    return outcome.value().progress.uploaded == outcome.value().progress.total ? kExitOk : kExitFailure;
}

int run_resume(const CommandLine& cli, upload::UploadOrchestrator& orchestrator) {
    if (cli.arguments.size() != 1) {
        print_usage();
        return kExitUsage;
    }

    auto resumable = orchestrator.find_resumable_job();
    if (resumable.is_error()) {
        return report_error(resumable.error());
    }
    if (!resumable.value()) {
        std::cout << "No unfinished upload to resume.\n";
        return kExitOk;
    }

    const auto& checkpoint = *resumable.value();
    describe_checkpoint(checkpoint);
    if (!confirm("Resume this upload with the files in " + cli.arguments.front() + "?", cli.assume_yes)) {
        std::cout << "Nothing done.\n";
        return kExitOk;
    }

    auto files = scan_selection(cli.arguments.front());
    if (files.is_error()) {
        std::cerr << "Error: " << files.error() << "\n";
        return kExitFailure;
    }

    auto outcome = orchestrator.start_or_resume_upload(checkpoint.job.job_id, files.value());
    if (outcome.is_error()) {
        return report_error(outcome.error());
    }
    report_outcome(outcome.value());
    return outcome.value().progress.uploaded == outcome.value().progress.total ? kExitOk : kExitFailure;
}

int run_status(upload::UploadOrchestrator& orchestrator) {
    auto resumable = orchestrator.find_resumable_job();
    if (resumable.is_error()) {
        return report_error(resumable.error());
    }
    if (!resumable.value()) {
        std::cout << "No unfinished upload.\n";
        return kExitOk;
    }
    describe_checkpoint(*resumable.value());
    return kExitOk;
}

int run_complete(const CommandLine& cli, upload::UploadOrchestrator& orchestrator) {
    if (cli.arguments.size() != 1) {
        print_usage();
        return kExitUsage;
    }
    if (auto submitted = orchestrator.submit_for_processing(cli.arguments.front()); submitted.is_error()) {
        return report_error(submitted.error());
    }
    std::cout << "Job " << cli.arguments.front() << " submitted for processing.\n";
    return kExitOk;
}

int run_abandon(const CommandLine& cli, upload::UploadOrchestrator& orchestrator) {
    if (cli.arguments.size() != 1) {
        print_usage();
        return kExitUsage;
    }
    if (!confirm("Forget saved progress for job " + cli.arguments.front() + "?", cli.assume_yes)) {
        return kExitOk;
    }
    if (auto abandoned = orchestrator.abandon_job(cli.arguments.front()); abandoned.is_error()) {
        return report_error(abandoned.error());
    }
    std::cout << "Abandoned job " << cli.arguments.front() << ".\n";
    return kExitOk;
}

int run_jobs(const CommandLine& cli, const UploadConfig& config, api::JobApi& job_api) {
    const std::string user_id = !cli.arguments.empty() ? cli.arguments.front()
                              : !cli.user_id.empty() ? cli.user_id : config.user_id;
    if (user_id.empty()) {
        print_usage();
        return kExitUsage;
    }

    auto jobs = job_api.list_jobs(user_id);
    if (jobs.is_error()) {
        std::cerr << "Error: " << jobs.error().describe() << "\n";
        return kExitFailure;
    }

    if (jobs.value().empty()) {
        std::cout << "No jobs for " << user_id << ".\n";
        return kExitOk;
    }
    std::cout << std::left << std::setw(38) << "JOB" << std::setw(16) << "STATUS"
              << std::setw(10) << "IMAGES" << std::setw(24) << "SUBMITTED" << "FOLDER\n";
    for (const auto& job : jobs.value()) {
        std::cout << std::left << std::setw(38) << job.job_id << std::setw(16) << job.status
                  << std::setw(10) << job.num_images << std::setw(24) << job.submitted_at << job.folder_name << "\n";
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CommandLine cli;
    if (!parse_command_line(argc, argv, cli)) {
        print_usage();
        return kExitUsage;
    }

    UploadConfig config;
    if (!cli.config_path.empty()) {
        auto loaded = UploadConfig::load(cli.config_path);
        if (loaded.is_error()) {
            std::cerr << "Error: " << loaded.error() << "\n";
            return kExitUsage;
        }
        config = std::move(loaded.value());
    }
    if (!cli.server_url.empty()) config.server_url = cli.server_url;
    if (!cli.state_dir.empty()) config.state_directory = cli.state_dir;
    if (!cli.log_level.empty()) config.log_level = cli.log_level;
    if (!cli.email_set && !config.email.empty()) cli.parameters.email = config.email;

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto url = network::Url::parse(config.server_url);
    if (url.is_error()) {
        std::cerr << "Error: " << url.error() << "\n";
        return kExitUsage;
    }

    api::HttpJobApi job_api(network::HttpClient(url.value(), config.request_timeout));

    if (cli.command == "jobs") {
        return run_jobs(cli, config, job_api);
    }

    storage::FileKeyValueStore state_store(config.state_directory);
    if (auto opened = state_store.open(); opened.is_error()) {
        std::cerr << "Error: " << opened.error() << "\n";
        return kExitFailure;
    }
    upload::CheckpointStore checkpoints(state_store);

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    event_bus.subscribe<events::UploadProgressEvent>([](const events::UploadProgressEvent& e) {
        std::cout << "\r  " << e.progress.uploaded << "/" << e.progress.total << " files ("
                  << e.progress.percentage << "%)" << std::flush;
    });
    event_bus.subscribe<events::BatchCompletedEvent>([](const events::BatchCompletedEvent&) {
        std::cout << "\n";
    });

    upload::OrchestratorOptions options;
    options.transfer.max_file_size = config.max_file_size;
    options.transfer.retry.max_retries = config.max_retries;
    options.transfer.retry.base_delay = config.base_delay;
    options.transfer.retry.max_delay = config.max_delay;
    options.concurrency.default_limit = config.default_concurrency;
    options.concurrency.large_batch_limit = config.large_batch_concurrency;
    options.concurrency.large_batch_threshold = config.large_batch_threshold;
    options.failures.percent = config.failure_percent;
    options.failures.minimum = config.failure_minimum;
    if (!config.allowed_extensions.empty()) {
        options.allowed_extensions = config.allowed_extensions;
    }

    upload::UploadOrchestrator orchestrator(job_api, checkpoints, event_bus, options);

    int exit_code = kExitUsage;
    if (cli.command == "submit") {
        exit_code = run_submit(cli, config, orchestrator);
    } else if (cli.command == "resume") {
        exit_code = run_resume(cli, orchestrator);
    } else if (cli.command == "status") {
        exit_code = run_status(orchestrator);
    } else if (cli.command == "complete") {
        exit_code = run_complete(cli, orchestrator);
    } else if (cli.command == "abandon") {
        exit_code = run_abandon(cli, orchestrator);
    } else {
        std::cerr << "Unknown command: " << cli.command << "\n";
        print_usage();
        return kExitUsage;
    }

    if (cli.command == "submit" || cli.command == "resume") {
        metrics.print_stats();
    }
    return exit_code;
}
