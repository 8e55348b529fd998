#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace mend {

/**
 * ErrorKind - Classification of failures across the merge pipeline.
 *
 * Transient failures may be retried; every other kind is final for the
 * operation that produced it. Credentials is a Permanent failure that no
 * later call can avoid, so it ends the whole run.
 */
enum class ErrorKind {
    Extraction,
    Transient,
    Permanent,
    Credentials,
    Validation,
    Repository,
    Config
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Extraction: return "extraction error";
        case ErrorKind::Transient: return "transient service error";
        case ErrorKind::Permanent: return "permanent service error";
        case ErrorKind::Credentials: return "credential error";
        case ErrorKind::Validation: return "validation error";
        case ErrorKind::Repository: return "repository error";
        case ErrorKind::Config: return "configuration error";
    }
    return "error";
}

/**
 * Error - A failure with a message and its classification.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Permanent};

    Error() = default;
    explicit Error(std::string msg, ErrorKind k)
        : message(std::move(msg)), kind(k) {}

    [[nodiscard]] bool is_retryable() const noexcept { return kind == ErrorKind::Transient; }

    bool operator==(const Error& other) const {
        return message == other.message && kind == other.kind;
    }
};

/**
 * Result<T, E> - Either a value (Ok) or an error (Err).
 *
 * Every fallible operation in the pipeline returns one of these instead of
 * throwing, so the orchestrator can collect per-region and per-file failures
 * and still produce a complete report.
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the value. Throws std::runtime_error when called on an error,
     * which is always a programming mistake.
     */
    [[nodiscard]] T& unwrap() & {
        ensure_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        ensure_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        ensure_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] E unwrap_err() && {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(std::move(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void ensure_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based access so T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - Operations that succeed with no value or fail.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

using Status = Result<void, Error>;

} // namespace mend
