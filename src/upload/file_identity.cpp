#include "ferry/upload/file_identity.hpp"

#include <functional>

namespace ferry::upload {
namespace {

bool has_path_suffix(const std::string& text, const std::string& suffix) {
    if (suffix.empty() || text.size() <= suffix.size()) {
        return false;
    }
    return text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           text[text.size() - suffix.size() - 1] == '/';
}

std::string base_name(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// First record satisfying `matches`, preferring one not yet in target_status
std::optional<std::size_t> find_in_tier(const std::vector<FileRecord>& records,
                                        FileStatus target_status,
                                        const std::function<bool(const FileRecord&)>& matches) {
    std::optional<std::size_t> fallback;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (!matches(records[i])) {
            continue;
        }
        if (records[i].status != target_status) {
            return i;
        }
        if (!fallback) {
            fallback = i;
        }
    }
    return fallback;
}

} // namespace

std::optional<IdentityMatch> resolve_file_identity(const std::vector<FileRecord>& records,
                                                   const std::string& identity,
                                                   FileStatus target_status) {
    if (identity.empty()) {
        return std::nullopt;
    }

    if (auto index = find_in_tier(records, target_status, [&](const FileRecord& r) {
            return r.path == identity || (!r.relative_path.empty() && r.relative_path == identity);
        })) {
        return IdentityMatch{*index, MatchKind::ExactPath};
    }

    const std::string name = base_name(identity);
    if (auto index = find_in_tier(records, target_status, [&](const FileRecord& r) {
            return r.name == identity || (name != identity && r.name == name && r.path == r.name);
        })) {
        return IdentityMatch{*index, MatchKind::ExactName};
    }

    if (auto index = find_in_tier(records, target_status, [&](const FileRecord& r) {
            return has_path_suffix(identity, r.path) || has_path_suffix(r.path, identity);
        })) {
        return IdentityMatch{*index, MatchKind::PathSuffix};
    }

    return std::nullopt;
}

} // namespace ferry::upload
