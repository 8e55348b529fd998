#include "core/resolution_applier.hpp"

#include "core/conflict_extractor.hpp"

#include <algorithm>
#include <cctype>

namespace mend {
namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

// Keep the line after the region intact: if the span ended with a line
// terminator, the replacement must too (in the same style).
std::string terminate_like(std::string candidate, std::string_view original_span) {
    if (candidate.empty() || candidate.back() == '\n') {
        return candidate;
    }
    if (ends_with(original_span, "\r\n")) {
        candidate += "\r\n";
    } else if (ends_with(original_span, "\n")) {
        candidate += '\n';
    }
    return candidate;
}

} // namespace

Status validate_candidate(std::string_view candidate) {
    if (is_blank(candidate)) {
        return Status::err(Error{"invalid candidate: empty resolution", ErrorKind::Validation});
    }
    for (const auto token : {markers::kOurs, markers::kBase, markers::kSeparator, markers::kTheirs}) {
        if (candidate.find(token) != std::string_view::npos) {
            return Status::err(Error{"invalid candidate: contains conflict markers", ErrorKind::Validation});
        }
    }
    return Status::ok();
}

Result<std::string, Error> splice_resolutions(std::string_view content,
                                              const std::vector<ResolutionAttempt>& attempts) {
    using Out = Result<std::string, Error>;

    std::vector<std::string> lines;
    for (const auto view : split_lines_keep_ends(content)) {
        lines.emplace_back(view);
    }

    long delta = 0;
    size_t previous_end = 0;
    bool first = true;
    for (const auto& attempt : attempts) {
        const auto& region = attempt.region;
        if (!attempt.succeeded()) {
            return Out::err(Error{"cannot splice unresolved region at line " +
                                      std::to_string(region.start_line + 1),
                                  ErrorKind::Validation});
        }
        if (!first && region.start_line <= previous_end) {
            return Out::err(Error{"regions out of order or overlapping at line " +
                                      std::to_string(region.start_line + 1),
                                  ErrorKind::Validation});
        }
        first = false;
        previous_end = region.end_line;

        const long start = static_cast<long>(region.start_line) + delta;
        const long count = static_cast<long>(region.line_count());
        if (start < 0 || start + count > static_cast<long>(lines.size())) {
            return Out::err(Error{region.file_path + ": region at line " +
                                      std::to_string(region.start_line + 1) + " is out of range",
                                  ErrorKind::Validation});
        }

        std::string span;
        for (long i = start; i < start + count; ++i) {
            span += lines[static_cast<size_t>(i)];
        }
        if (span != region.original_text) {
            return Out::err(Error{region.file_path + ": region at line " +
                                      std::to_string(region.start_line + 1) + " no longer matches the file",
                                  ErrorKind::Validation});
        }

        const auto replacement = terminate_like(attempt.resolved_text, region.original_text);
        std::vector<std::string> replacement_lines;
        for (const auto view : split_lines_keep_ends(replacement)) {
            replacement_lines.emplace_back(view);
        }

        const auto first_line = lines.begin() + start;
        lines.erase(first_line, first_line + count);
        lines.insert(lines.begin() + start, replacement_lines.begin(), replacement_lines.end());

        delta += static_cast<long>(replacement_lines.size()) - count;
    }

    std::string out;
    out.reserve(content.size());
    for (const auto& line : lines) {
        out += line;
    }
    return Out::ok(std::move(out));
}

Result<bool, Error> ResolutionApplier::apply_file(const std::string& path,
                                                  std::string_view content,
                                                  std::vector<ResolutionAttempt>& attempts) {
    using Out = Result<bool, Error>;

    bool all_valid = true;
    for (auto& attempt : attempts) {
        if (!attempt.succeeded()) {
            all_valid = false;
            continue;
        }
        auto valid = validate_candidate(attempt.resolved_text);
        if (valid.is_err()) {
            attempt.reject(valid.unwrap_err());
            all_valid = false;
        }
    }
    if (!all_valid) {
        return Out::ok(false);
    }

    auto spliced = splice_resolutions(content, attempts);
    if (spliced.is_err()) {
        for (auto& attempt : attempts) {
            attempt.reject(spliced.unwrap_err());
        }
        return Out::ok(false);
    }

    auto written = repo_.write_resolved(path, spliced.unwrap());
    if (written.is_err()) {
        return Out::err(written.unwrap_err());
    }
    return Out::ok(true);
}

Status ResolutionApplier::stage_clean_file(const std::string& path, const std::string& content) {
    return repo_.write_resolved(path, content);
}

} // namespace mend
