#include "core/conflict_extractor.hpp"

namespace mend {
namespace {

enum class Section {
    Outside,
    Ours,
    Base,
    Theirs
};

std::string_view strip_line_end(std::string_view line) {
    if (!line.empty() && line.back() == '\n') line.remove_suffix(1);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

Error malformed(const std::string& file_path, size_t line_index, std::string_view what) {
    return Error{file_path + ": line " + std::to_string(line_index + 1) + ": " + std::string(what),
                 ErrorKind::Extraction};
}

} // namespace

std::vector<std::string_view> split_lines_keep_ends(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t begin = 0;
    while (begin < text.size()) {
        const auto nl = text.find('\n', begin);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, nl - begin + 1));
        begin = nl + 1;
    }
    return lines;
}

std::optional<std::string> marker_label(std::string_view line, std::string_view token) {
    const auto body = strip_line_end(line);
    if (body.substr(0, token.size()) != token) {
        return std::nullopt;
    }
    const auto rest = body.substr(token.size());
    if (rest.empty()) {
        return std::string{};
    }
    // "<<<<<<<<" is not a marker; the token must be followed by a space.
    if (rest.front() != ' ') {
        return std::nullopt;
    }
    return std::string(rest.substr(1));
}

bool has_conflict_markers(std::string_view content) {
    for (const auto line : split_lines_keep_ends(content)) {
        if (marker_label(line, markers::kOurs)) return true;
    }
    return false;
}

Result<std::vector<ConflictRegion>, Error> extract_conflicts(const std::string& file_path,
                                                            std::string_view content) {
    using Out = Result<std::vector<ConflictRegion>, Error>;

    const auto lines = split_lines_keep_ends(content);
    std::vector<ConflictRegion> regions;

    Section section = Section::Outside;
    ConflictRegion current;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto line = lines[i];
        const auto ours = marker_label(line, markers::kOurs);
        const auto base = marker_label(line, markers::kBase);
        const auto separator = marker_label(line, markers::kSeparator);
        const auto theirs = marker_label(line, markers::kTheirs);

        if (section != Section::Outside) {
            current.original_text.append(line);
        }

        switch (section) {
            case Section::Outside:
                if (ours) {
                    current = ConflictRegion{};
                    current.file_path = file_path;
                    current.ours_label = *ours;
                    current.start_line = i;
                    current.original_text.assign(line);
                    section = Section::Ours;
                } else if (theirs) {
                    return Out::err(malformed(file_path, i, "unexpected '>>>>>>>' outside a conflict"));
                } else if (base) {
                    return Out::err(malformed(file_path, i, "unexpected '|||||||' outside a conflict"));
                }
                // A lone "=======" is ordinary text (e.g. a Setext heading).
                break;

            case Section::Ours:
                if (ours) {
                    return Out::err(malformed(file_path, i, "nested '<<<<<<<' inside a conflict"));
                } else if (base) {
                    current.base_label = *base;
                    current.base_text = std::string{};
                    section = Section::Base;
                } else if (separator) {
                    section = Section::Theirs;
                } else if (theirs) {
                    return Out::err(malformed(file_path, i, "'>>>>>>>' before '======='"));
                } else {
                    current.ours_text.append(line);
                }
                break;

            case Section::Base:
                if (ours) {
                    return Out::err(malformed(file_path, i, "nested '<<<<<<<' inside a conflict"));
                } else if (base) {
                    return Out::err(malformed(file_path, i, "duplicate '|||||||'"));
                } else if (separator) {
                    section = Section::Theirs;
                } else if (theirs) {
                    return Out::err(malformed(file_path, i, "'>>>>>>>' before '======='"));
                } else {
                    current.base_text->append(line);
                }
                break;

            case Section::Theirs:
                if (ours) {
                    return Out::err(malformed(file_path, i, "nested '<<<<<<<' inside a conflict"));
                } else if (base) {
                    return Out::err(malformed(file_path, i, "'|||||||' after '======='"));
                } else if (separator) {
                    return Out::err(malformed(file_path, i, "duplicate '======='"));
                } else if (theirs) {
                    current.theirs_label = *theirs;
                    current.end_line = i;
                    regions.push_back(std::move(current));
                    current = ConflictRegion{};
                    section = Section::Outside;
                } else {
                    current.theirs_text.append(line);
                }
                break;
        }
    }

    if (section != Section::Outside) {
        return Out::err(malformed(file_path, current.start_line,
                                  "unterminated '<<<<<<<' (missing '>>>>>>>')"));
    }

    return Out::ok(std::move(regions));
}

} // namespace mend
