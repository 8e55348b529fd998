#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mend {

/**
 * Conflict marker tokens as written by a three-way merge.
 * A marker line starts with one of these, followed by end of line or a space.
 */
namespace markers {
inline constexpr std::string_view kOurs = "<<<<<<<";
inline constexpr std::string_view kBase = "|||||||";
inline constexpr std::string_view kSeparator = "=======";
inline constexpr std::string_view kTheirs = ">>>>>>>";
} // namespace markers

/**
 * ConflictRegion - One marker-delimited conflicted span within a file.
 *
 * Line numbers are zero-based indices into the file content as it was when
 * the region was extracted; start_line is the `<<<<<<<` line and end_line is
 * the `>>>>>>>` line, both inclusive. Texts keep their line terminators.
 */
struct ConflictRegion {
    std::string file_path;

    std::string ours_text;
    std::string theirs_text;
    std::optional<std::string> base_text;  // diff3-style markers only

    std::string ours_label;
    std::string theirs_label;
    std::string base_label;

    size_t start_line = 0;
    size_t end_line = 0;

    // Exact bytes of the span, markers included.
    std::string original_text;

    [[nodiscard]] size_t line_count() const { return end_line - start_line + 1; }
    [[nodiscard]] bool has_base() const { return base_text.has_value(); }
};

} // namespace mend
