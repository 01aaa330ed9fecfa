#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file error.hpp
 * @brief Error taxonomy and result types returned by every engine operation.
 *
 * The engine never throws across its API. Operations return either:
 * - Result<T>: a value or an Error
 * - Status: success or an Error
 *
 * Errors may chain: a rolled back multi-leg booking keeps the error that
 * triggered the rollback in @ref Error::cause and lists every failed undo
 * action in @ref Error::compensation_failures.
 */

namespace airline {

/**
 * @brief Kind of failure reported by the engine.
 */
enum class ErrorKind {
    NotFound,           /**< Flight, ticket or aircraft does not exist. */
    ValidationError,    /**< Fully booked, duplicate booking, bad seat reference, retry budget spent. */
    Conflict,           /**< Seat already taken or unavailable. */
    BadRequest,         /**< Malformed or self-contradicting request. */
    DatabaseError,      /**< Underlying store failure; never retried by the engine. */
    CompensationFailed  /**< Rollback of a multi-leg booking did not complete. */
};

/**
 * @brief Returns a stable upper-case name for an error kind ("NOT_FOUND", ...).
 */
const char* to_string(ErrorKind kind);

/**
 * @brief Maps an error kind to the HTTP status a request layer should answer with.
 */
int http_status(ErrorKind kind);

/**
 * @brief A failure with an optional chain of causes.
 */
struct Error {
    ErrorKind kind = ErrorKind::DatabaseError; /**< What went wrong. */
    std::string message;                       /**< Human-readable description. */
    std::shared_ptr<const Error> cause;        /**< Error that triggered this one, if any. */
    std::vector<Error> compensation_failures;  /**< Undo actions that failed during rollback. */

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /**
     * @brief Returns a copy of this error with @p c attached as its cause.
     */
    Error caused_by(Error c) const;

    /**
     * @brief Renders "KIND: message" followed by the cause chain and compensation failures.
     */
    std::string to_string() const;
};

/** @name Error factories */
///@{
inline Error not_found(std::string msg) { return Error(ErrorKind::NotFound, std::move(msg)); }
inline Error validation_error(std::string msg) { return Error(ErrorKind::ValidationError, std::move(msg)); }
inline Error conflict(std::string msg) { return Error(ErrorKind::Conflict, std::move(msg)); }
inline Error bad_request(std::string msg) { return Error(ErrorKind::BadRequest, std::move(msg)); }
inline Error database_error(std::string msg) { return Error(ErrorKind::DatabaseError, std::move(msg)); }
///@}

/**
 * @brief Outcome of an operation that yields no value.
 */
class Status {
public:
    /** @brief Successful status. */
    Status() = default;

    /** @brief Failed status. */
    Status(Error error) : error_(std::move(error)) {}

    static Status ok_status() { return Status(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    /** @brief The failure. Only valid when !ok(). */
    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

/**
 * @brief Outcome of an operation that yields a value of type T.
 *
 * Construct from a T on success or from an Error on failure.
 */
template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    /** @brief The value. Only valid when ok(). */
    const T& value() const& { return std::get<0>(data_); }
    T& value() & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    /** @brief The failure. Only valid when !ok(). */
    const Error& error() const { return std::get<1>(data_); }

    /** @brief Drops the value, keeping only success or failure. */
    Status status() const { return ok() ? Status() : Status(error()); }

private:
    std::variant<T, Error> data_;
};

} // namespace airline
