/// @file error.hpp
/// @brief Error types for the docmerge-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docmerge_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    malformed_identifier,  ///< An OpId string is not "<counter>@<actor>".
    unknown_patch_type,    ///< A patch type is neither "map" nor "list".
    invalid_patch,         ///< A patch is structurally ill-formed.
    type_mismatch,         ///< A patch does not match the object it targets.
    frozen_object,         ///< A container was mutated outside of an apply.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_identifier: return "malformed_identifier";
        case ErrorKind::unknown_patch_type:   return "unknown_patch_type";
        case ErrorKind::invalid_patch:        return "invalid_patch";
        case ErrorKind::type_mismatch:        return "type_mismatch";
        case ErrorKind::frozen_object:        return "frozen_object";
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

/// The exception thrown when parsing or applying a patch fails, or when a
/// frozen container is mutated.
///
/// Out-of-range indices passed directly to List accessors and mutators are
/// a caller precondition violation and throw std::out_of_range instead.
///
/// what() returns the message; error() exposes the full record so
/// callers can branch on the kind.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace docmerge_cpp
