#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace qrhost {

/**
 * Failure categories. The HTTP layer maps each kind onto a status code.
 */
enum class ErrorKind {
    Invalid,
    NotFound,
    Conflict,
    Unauthorized,
    Io,
    Internal
};

/**
 * Error type for Result - a message plus the kind of failure.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Internal};

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Internal)
        : message(std::move(msg)), kind(k) {}

    bool operator==(const Error& other) const {
        return message == other.message && kind == other.kind;
    }
};

[[nodiscard]] inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Invalid: return "invalid";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Unauthorized: return "unauthorized";
        case ErrorKind::Io: return "io";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

/**
 * Result<T, E> - either a value (ok) or an Error (err).
 *
 * Usage:
 *   Result<QByteArray> read_png(const QString& name) {
 *       if (!store.exists(name)) {
 *           return Result<QByteArray>::err(Error{"missing", ErrorKind::NotFound});
 *       }
 *       return Result<QByteArray>::ok(bytes);
 *   }
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
     * Get the success value, throwing if this is an error.
     * Callers check is_ok() first; the throw only guards misuse.
     */
    [[nodiscard]] T& unwrap() & {
        if (is_err()) {
            throw std::runtime_error(unwrap_message());
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) {
            throw std::runtime_error(unwrap_message());
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) {
            throw std::runtime_error(unwrap_message());
        }
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    std::string unwrap_message() const {
        if constexpr (std::is_same_v<E, Error>) {
            return "Result::unwrap() called on error: " + std::get<1>(data_).message;
        } else {
            return "Result::unwrap() called on error";
        }
    }

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
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

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
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

} // namespace qrhost
