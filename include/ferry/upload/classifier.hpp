#pragma once

#include "ferry/core/result.hpp"
#include "ferry/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ferry::upload {

/// Image extensions accepted by the processing pipeline
std::vector<std::string> default_allowed_extensions();

/**
 * @brief Outcome of filtering a raw selection
 */
struct Classification {
    std::vector<SourceFile> eligible;
    std::vector<SourceFile> ignored;
    std::uint64_t eligible_bytes = 0;
    std::string top_level_folder_name;   ///< Empty when no path information exists

    std::size_t eligible_count() const noexcept { return eligible.size(); }
    std::size_t ignored_count() const noexcept { return ignored.size(); }
    bool empty() const noexcept { return eligible.empty(); }
};

/**
 * @brief Splits a selection into transfer candidates and ignored files
 *
 * Pure: no filesystem or network access. An empty eligible set is reported
 * through Classification::empty(), the caller decides how to refuse it.
 */
class FileClassifier {
public:
    explicit FileClassifier(std::vector<std::string> allowed_extensions = default_allowed_extensions());

    bool is_eligible(const SourceFile& file) const;

    Classification classify(const std::vector<SourceFile>& files) const;

    const std::vector<std::string>& allowed_extensions() const noexcept { return allowed_extensions_; }

private:
    std::vector<std::string> allowed_extensions_;   // lower case, leading dot
};

/// First segment of a selection-relative path ("trip/cam1/a.jpg" -> "trip")
std::string extract_top_folder_name(const std::string& relative_path);

/// MIME type from the file extension, application/octet-stream when unknown
std::string mime_type_for(const std::string& file_name);

/// "1.5 MB" style rendering, 1024-based
std::string format_file_size(std::uint64_t bytes, int decimals = 2);

/**
 * @brief Enumerate regular files below root, recursively
 *
 * Relative paths start with root's own directory name, the way a directory
 * picker reports them, and always use '/' separators.
 */
Result<std::vector<SourceFile>> scan_directory(const std::filesystem::path& root);

} // namespace ferry::upload
