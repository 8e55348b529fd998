#pragma once

#include "core/conflict_region.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mend {

/**
 * Split text into lines, keeping each line's terminator ("\n" or "\r\n").
 * Concatenating the returned lines yields the input exactly.
 */
[[nodiscard]] std::vector<std::string_view> split_lines_keep_ends(std::string_view text);

/**
 * If `line` is a conflict marker line for `token`, returns the label that
 * follows the token (possibly empty). Otherwise returns nullopt.
 */
[[nodiscard]] std::optional<std::string> marker_label(std::string_view line, std::string_view token);

/**
 * Extract every conflict region from a file's content, in source order.
 *
 * Returns an empty list for content without markers. Malformed or
 * unterminated markers produce an ErrorKind::Extraction error naming the
 * file, the offending marker and its (one-based) line; no partial list is
 * returned in that case.
 */
[[nodiscard]] Result<std::vector<ConflictRegion>, Error> extract_conflicts(const std::string& file_path,
                                                                          std::string_view content);

/**
 * True when the content holds at least one `<<<<<<<` marker line.
 */
[[nodiscard]] bool has_conflict_markers(std::string_view content);

} // namespace mend
