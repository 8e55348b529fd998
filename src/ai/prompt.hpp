#pragma once

#include "core/conflict_region.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace mend::ai {

inline constexpr const char* kSystemPrompt =
    "You are a Git merge conflict resolver. Analyze the conflict and choose the most "
    "appropriate resolution. Return ONLY the resolved content that replaces the conflicted "
    "lines, without conflict markers and without any explanation.";

// Each side of the context window is cut to this many characters.
inline constexpr size_t kMaxContextChars = 500;

/**
 * RegionContext - Unconflicted lines around a region, for disambiguation.
 */
struct RegionContext {
    std::string before;
    std::string after;
};

/**
 * Collect up to `context_lines` lines before and after the region from the
 * file content the region was extracted from. Neighbouring conflict regions
 * are not included (the window stops at a marker line).
 */
[[nodiscard]] RegionContext context_for(std::string_view content,
                                        const ConflictRegion& region,
                                        size_t context_lines);

/**
 * Build the user message for a region.
 */
[[nodiscard]] std::string build_user_prompt(const ConflictRegion& region, const RegionContext& context);

/**
 * ParsedResponse - Candidate text pulled out of a model response.
 */
struct ParsedResponse {
    std::string candidate;
    bool low_confidence = false;
};

/**
 * Take the first fenced code block of the response if there is one.
 * Otherwise return the trimmed response flagged low_confidence.
 */
[[nodiscard]] ParsedResponse parse_response(std::string_view response);

} // namespace mend::ai
