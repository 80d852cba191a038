#pragma once

#include "ferry/upload/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ferry::upload {

enum class MatchKind {
    ExactPath,
    ExactName,
    PathSuffix
};

struct IdentityMatch {
    std::size_t index = 0;
    MatchKind kind = MatchKind::ExactPath;
};

/**
 * @brief Locate the record a transferred file belongs to
 *
 * Tiers, strongest first: exact path, exact name, path suffix (the identity
 * ends with "/<record path>" or a record path ends with "/<identity>").
 * Within a tier a record whose status differs from target_status wins, so
 * two same-named files in different folders each resolve to their own
 * pending record before an already-complete one is reused.
 */
std::optional<IdentityMatch> resolve_file_identity(const std::vector<FileRecord>& records,
                                                   const std::string& identity,
                                                   FileStatus target_status);

} // namespace ferry::upload
