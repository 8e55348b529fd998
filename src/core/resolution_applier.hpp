#pragma once

#include "core/merge_repository.hpp"
#include "core/resolution_attempt.hpp"
#include "core/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mend {

/**
 * Check a candidate resolution for structural problems.
 *
 * Rejects empty (whitespace-only) candidates, candidates containing
 * `<<<<<<<` or `>>>>>>>` anywhere, and candidates with a line starting with
 * any marker token. Errors are ErrorKind::Validation.
 */
[[nodiscard]] Status validate_candidate(std::string_view candidate);

/**
 * Replace every region's marker-delimited span with its resolved text.
 *
 * Attempts must all be Succeeded and ordered top to bottom. Spans are
 * located from their original line offsets shifted by the line delta of the
 * splices applied above them; a span whose bytes no longer match the region
 * is an ErrorKind::Validation error.
 */
[[nodiscard]] Result<std::string, Error> splice_resolutions(std::string_view content,
                                                            const std::vector<ResolutionAttempt>& attempts);

/**
 * ResolutionApplier - Validates candidates and writes resolved files.
 *
 * Writes are all-or-nothing per file: the repository is touched only when
 * every region of the file has a valid candidate.
 */
class ResolutionApplier {
public:
    explicit ResolutionApplier(MergeRepository& repo) : repo_(repo) {}

    /**
     * Validate the file's attempts (invalid candidates become Failed), then
     * splice and write when all of them succeeded.
     *
     * Returns ok(true) when the file was written, ok(false) when at least
     * one region failed and the file was left untouched, or a Repository
     * error when the write itself failed.
     */
    [[nodiscard]] Result<bool, Error> apply_file(const std::string& path,
                                                 std::string_view content,
                                                 std::vector<ResolutionAttempt>& attempts);

    /**
     * Stage a file that no longer has markers, leaving its bytes as they are.
     */
    [[nodiscard]] Status stage_clean_file(const std::string& path, const std::string& content);

private:
    MergeRepository& repo_;
};

} // namespace mend
