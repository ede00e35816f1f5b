/// @file error.hpp
/// @brief Error types for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp {

/// Categories of errors that can occur while applying or building a patch.
enum class ErrorKind : std::uint8_t {
    malformed_patch,     ///< A patch element is not an object, or its op is unknown.
    missing_member,      ///< A required member (op, path, from, value) is absent.
    non_existent_path,   ///< A pointer does not resolve to an existing location.
    illegal_move,        ///< A move's from location is an ancestor of its path.
    test_failed,         ///< A test operation's value did not match.
    invalid_pointer,     ///< A pointer string violates the RFC 6901 grammar.
    root_type_mismatch,  ///< A typed apply produced a root of a different shape.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_patch:    return "malformed_patch";
        case ErrorKind::missing_member:     return "missing_member";
        case ErrorKind::non_existent_path:  return "non_existent_path";
        case ErrorKind::illegal_move:       return "illegal_move";
        case ErrorKind::test_failed:        return "test_failed";
        case ErrorKind::invalid_pointer:    return "invalid_pointer";
        case ErrorKind::root_type_mismatch: return "root_type_mismatch";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception raised for every failure in this library.
///
/// what() returns the message; kind() tells callers which rule was broken.
class PatchError : public std::runtime_error {
public:
    explicit PatchError(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    PatchError(ErrorKind kind, std::string message)
        : PatchError{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace jsonpatch_cpp
