#include "ferry/upload/classifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

namespace ferry::upload {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string normalize_extension(std::string extension) {
    extension = to_lower(std::move(extension));
    if (!extension.empty() && extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }
    return extension;
}

} // namespace

std::vector<std::string> default_allowed_extensions() {
    return {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp", ".svg"};
}

FileClassifier::FileClassifier(std::vector<std::string> allowed_extensions) {
    allowed_extensions_.reserve(allowed_extensions.size());
    for (auto& extension : allowed_extensions) {
        auto normalized = normalize_extension(std::move(extension));
        if (normalized.size() > 1) {
            allowed_extensions_.push_back(std::move(normalized));
        }
    }
}

bool FileClassifier::is_eligible(const SourceFile& file) const {
    const std::string lowered = to_lower(file.name);
    return std::any_of(allowed_extensions_.begin(), allowed_extensions_.end(),
                       [&](const std::string& extension) { return ends_with(lowered, extension); });
}

Classification FileClassifier::classify(const std::vector<SourceFile>& files) const {
    Classification result;
    for (const auto& file : files) {
        if (is_eligible(file)) {
            result.eligible_bytes += file.size;
            result.eligible.push_back(file);
        } else {
            result.ignored.push_back(file);
        }
    }

    if (!result.eligible.empty()) {
        result.top_level_folder_name = extract_top_folder_name(result.eligible.front().relative_path);
    }
    return result;
}

std::string extract_top_folder_name(const std::string& relative_path) {
    if (relative_path.empty()) {
        return "";
    }
    const auto slash = relative_path.find_first_of("/\\");
    if (slash == std::string::npos) {
        // A bare file name carries no folder information
        return "";
    }
    return relative_path.substr(0, slash);
}

std::string mime_type_for(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> types {
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".tiff", "image/tiff"},
        {".tif", "image/tiff"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".json", "application/json"},
        {".txt", "text/plain"},
        {".csv", "text/csv"},
    };

    const auto dot = file_name.rfind('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }
    const auto it = types.find(to_lower(file_name.substr(dot)));
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string format_file_size(std::uint64_t bytes, int decimals) {
    if (bytes == 0) {
        return "0 Bytes";
    }

    static const char* units[] = {"Bytes", "KB", "MB", "GB", "TB"};
    const double k = 1024.0;
    const int precision = decimals < 0 ? 0 : decimals;

    int index = static_cast<int>(std::floor(std::log(static_cast<double>(bytes)) / std::log(k)));
    index = std::clamp(index, 0, 4);
    const double value = static_cast<double>(bytes) / std::pow(k, index);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    std::string text = oss.str();

    // Drop trailing zeros the way parseFloat(x.toFixed(n)) does
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }
    return text + " " + units[index];
}

Result<std::vector<SourceFile>> scan_directory(const fs::path& root) {
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        return Err<std::vector<SourceFile>>(std::string("Not a directory: ") + root.string());
    }

    const fs::path canonical_root = fs::weakly_canonical(root, ec);
    const fs::path base = ec ? root : canonical_root;
    const std::string top_folder = base.filename().string();

    std::vector<SourceFile> files;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err<std::vector<SourceFile>>(std::string("Failed to read directory ") + base.string() + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Skipping unreadable entry below {}: {}", base.string(), ec.message());
            ec.clear();
            continue;
        }

        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }

        auto relative = fs::relative(entry.path(), base, entry_ec);
        if (entry_ec || relative.empty()) {
            continue;
        }

        SourceFile file;
        file.location = entry.path();
        file.name = entry.path().filename().string();
        file.relative_path = top_folder.empty()
            ? relative.generic_string()
            : top_folder + "/" + relative.generic_string();
        file.size = entry.file_size(entry_ec);
        if (entry_ec) {
            spdlog::warn("Cannot stat {}: {}", entry.path().string(), entry_ec.message());
            continue;
        }
        file.mime_type = mime_type_for(file.name);
        files.push_back(std::move(file));
    }

    // Directory iteration order is unspecified; keep selections stable
    std::sort(files.begin(), files.end(), [](const SourceFile& lhs, const SourceFile& rhs) {
        return lhs.relative_path < rhs.relative_path;
    });

    spdlog::debug("Scanned {} files below {}", files.size(), base.string());
    return Ok(std::move(files));
}

} // namespace ferry::upload
