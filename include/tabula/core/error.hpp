#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tabula {

/// User-visible failure classes. Anything else is corrected in place and
/// reported through response metadata.
enum class ErrorKind : std::uint8_t {
    NotFound,
    InvalidInput,
    UpstreamUnavailable,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

struct Error {
    ErrorKind kind = ErrorKind::InvalidInput;
    std::string message;

    /// `<kind>: <message>`.
    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline auto not_found(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::NotFound, .message = std::move(message)});
}

[[nodiscard]] inline auto invalid_input(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::InvalidInput, .message = std::move(message)});
}

[[nodiscard]] inline auto upstream_unavailable(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::UpstreamUnavailable, .message = std::move(message)});
}

}  // namespace tabula
