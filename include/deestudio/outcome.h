/**
 * @file outcome.h
 * @brief Discriminated error kinds and the Outcome<T> result wrapper
 *
 * Every orchestrator-facing operation returns an Outcome instead of throwing,
 * so the route layer can map failures to transport responses uniformly.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace deestudio {

/**
 * @enum ErrorKind
 * @brief Failure taxonomy
 */
enum class ErrorKind {
    ValidationError,        ///< Bad request shape, nothing touched
    FamilyUnavailable,      ///< Weight manifest incomplete on disk
    ResourceExhausted,      ///< Guard denied admission after reclaim
    LoadFailure,            ///< Pipeline construction failed
    OverlayLoadFailure,     ///< Overlay weights incompatible or unreadable
    GenerationFailure,      ///< Mid-batch failure, may carry partial count
    Busy,                   ///< Timed out waiting for the accelerator
    Cancelled               ///< Caller went away, may carry partial count
};

/**
 * @brief Machine-readable type string ("validation_error", ...)
 */
inline const char* error_kind_to_string(ErrorKind kind);

/**
 * @brief HTTP status hint for the route layer
 */
inline int error_kind_http_status(ErrorKind kind);

/**
 * @struct Error
 * @brief Error kind + human-readable detail + status hint
 */
struct Error {
    ErrorKind kind = ErrorKind::GenerationFailure;
    std::string message;
    int http_status = 500;
    size_t images_completed = 0;    ///< Artifacts persisted before the failure
    uint64_t bytes_still_held = 0;  ///< Residual accelerator bytes (ResourceExhausted)

    static Error make(ErrorKind kind, std::string message) {
        Error e;
        e.kind = kind;
        e.message = std::move(message);
        e.http_status = error_kind_http_status(kind);
        return e;
    }

    std::string to_string() const {
        return std::string(error_kind_to_string(kind)) + ": " + message;
    }
};

/**
 * @class Outcome
 * @brief Either a value or an Error
 */
template<typename T>
class Outcome {
public:
    static Outcome ok(T value) {
        Outcome o;
        o.value_.emplace(std::move(value));
        return o;
    }

    static Outcome fail(Error error) {
        Outcome o;
        o.error_.emplace(std::move(error));
        return o;
    }

    static Outcome fail(ErrorKind kind, std::string message) {
        return fail(Error::make(kind, std::move(message)));
    }

    bool success() const { return value_.has_value(); }
    explicit operator bool() const { return success(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    T take() { return std::move(*value_); }

    const Error& error() const { return *error_; }

private:
    Outcome() = default;

    std::optional<T> value_;
    std::optional<Error> error_;
};

/**
 * @brief Outcome without a payload
 */
template<>
class Outcome<void> {
public:
    static Outcome ok() { return Outcome(); }

    static Outcome fail(Error error) {
        Outcome o;
        o.error_.emplace(std::move(error));
        return o;
    }

    static Outcome fail(ErrorKind kind, std::string message) {
        return fail(Error::make(kind, std::move(message)));
    }

    bool success() const { return !error_.has_value(); }
    explicit operator bool() const { return success(); }

    const Error& error() const { return *error_; }

private:
    Outcome() = default;

    std::optional<Error> error_;
};

using Status = Outcome<void>;

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ValidationError: return "validation_error";
        case ErrorKind::FamilyUnavailable: return "family_unavailable";
        case ErrorKind::ResourceExhausted: return "resource_exhausted";
        case ErrorKind::LoadFailure: return "load_failure";
        case ErrorKind::OverlayLoadFailure: return "overlay_load_failure";
        case ErrorKind::GenerationFailure: return "generation_failure";
        case ErrorKind::Busy: return "server_busy";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown_error";
}

inline int error_kind_http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ValidationError: return 400;
        case ErrorKind::FamilyUnavailable: return 404;
        case ErrorKind::ResourceExhausted: return 503;
        case ErrorKind::Busy: return 503;
        case ErrorKind::Cancelled: return 499;
        case ErrorKind::LoadFailure:
        case ErrorKind::OverlayLoadFailure:
        case ErrorKind::GenerationFailure:
            return 500;
    }
    return 500;
}

} // namespace deestudio
