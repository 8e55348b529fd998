#include "ai/prompt.hpp"

#include "core/conflict_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace mend::ai {
namespace {

bool is_any_marker(std::string_view line) {
    return marker_label(line, markers::kOurs) || marker_label(line, markers::kBase) ||
           marker_label(line, markers::kSeparator) || marker_label(line, markers::kTheirs);
}

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string keep_head(std::string text, size_t limit) {
    if (text.size() <= limit) return text;
    size_t cut = limit;
    while (cut > 0 && is_utf8_continuation(text[cut])) --cut;
    text.resize(cut);
    text += "... (truncated)\n";
    return text;
}

std::string keep_tail(std::string text, size_t limit) {
    if (text.size() <= limit) return text;
    size_t cut = text.size() - limit;
    while (cut < text.size() && is_utf8_continuation(text[cut])) ++cut;
    return "(truncated) ..." + text.substr(cut);
}

void append_block(std::string& out, std::string_view heading, std::string_view body) {
    out += heading;
    out += "\n```\n";
    out += body;
    if (!body.empty() && body.back() != '\n') out += '\n';
    out += "```\n\n";
}

std::string with_label(std::string_view title, const std::string& label) {
    std::string heading(title);
    if (!label.empty()) {
        heading += " (" + label + ")";
    }
    heading += ':';
    return heading;
}

bool is_blank_line(std::string_view line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

RegionContext context_for(std::string_view content, const ConflictRegion& region, size_t context_lines) {
    RegionContext ctx;
    if (context_lines == 0) return ctx;

    const auto lines = split_lines_keep_ends(content);

    std::vector<std::string_view> before;
    for (size_t i = region.start_line; i > 0 && before.size() < context_lines; --i) {
        const auto line = lines[i - 1];
        if (is_any_marker(line)) break;
        before.push_back(line);
    }
    std::reverse(before.begin(), before.end());
    for (const auto line : before) ctx.before.append(line);

    for (size_t i = region.end_line + 1, taken = 0; i < lines.size() && taken < context_lines; ++i, ++taken) {
        const auto line = lines[i];
        if (is_any_marker(line)) break;
        ctx.after.append(line);
    }

    ctx.before = keep_tail(std::move(ctx.before), kMaxContextChars);
    ctx.after = keep_head(std::move(ctx.after), kMaxContextChars);
    return ctx;
}

std::string build_user_prompt(const ConflictRegion& region, const RegionContext& context) {
    std::string out;
    out.reserve(region.original_text.size() + context.before.size() + context.after.size() + 512);

    out += "Resolve this Git merge conflict in " + region.file_path + " (lines " +
           std::to_string(region.start_line + 1) + "-" + std::to_string(region.end_line + 1) + ").\n\n";

    if (!context.before.empty()) {
        append_block(out, "Context before the conflict:", context.before);
    }
    append_block(out, with_label("Our version", region.ours_label), region.ours_text);
    append_block(out, with_label("Their version", region.theirs_label), region.theirs_text);
    if (region.base_text) {
        append_block(out, with_label("Base version", region.base_label), *region.base_text);
    }
    if (!context.after.empty()) {
        append_block(out, "Context after the conflict:", context.after);
    }

    out += "Reply with the merged lines that replace the conflict, and nothing else.";
    return out;
}

ParsedResponse parse_response(std::string_view response) {
    constexpr std::string_view fence = "```";

    const auto open = response.find(fence);
    if (open != std::string_view::npos) {
        // Skip the info string ("```cpp") up to the end of the opening line.
        const auto line_end = response.find('\n', open);
        if (line_end != std::string_view::npos) {
            const auto body_start = line_end + 1;
            size_t close = std::string_view::npos;
            if (response.substr(body_start, fence.size()) == fence) {
                close = body_start;
            } else {
                const auto nl_fence = response.find("\n```", body_start);
                if (nl_fence != std::string_view::npos) close = nl_fence + 1;
            }
            if (close != std::string_view::npos) {
                return ParsedResponse{std::string(response.substr(body_start, close - body_start)), false};
            }
        }
    }

    // No usable code block: take the raw answer, minus surrounding blank lines.
    auto lines = split_lines_keep_ends(response);
    size_t first = 0;
    while (first < lines.size() && is_blank_line(lines[first])) ++first;

    std::string text;
    for (size_t i = first; i < lines.size(); ++i) text.append(lines[i]);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.pop_back();
    if (!text.empty()) text += '\n';

    return ParsedResponse{std::move(text), true};
}

} // namespace mend::ai
