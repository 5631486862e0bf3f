#include <tabula/core/error.hpp>

#include <fmt/format.h>

namespace tabula {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::NotFound:
            return "not found";
        case ErrorKind::InvalidInput:
            return "invalid input";
        case ErrorKind::UpstreamUnavailable:
            return "upstream unavailable";
    }
    return "unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace tabula
