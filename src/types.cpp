#include <docmerge-cpp/types.hpp>
#include <docmerge-cpp/error.hpp>

#include <fmt/format.h>

#include <charconv>
#include <system_error>

namespace docmerge_cpp {

auto parse_op_id(std::string_view text) -> OpId {
    auto at = text.find('@');
    if (at == 0 || at == std::string_view::npos) {
        throw Exception{ErrorKind::malformed_identifier,
                        fmt::format("not a valid op id: '{}'", text)};
    }
    auto counter = std::uint64_t{0};
    const auto* end = text.data() + at;
    auto [ptr, ec] = std::from_chars(text.data(), end, counter);
    if (ec != std::errc{} || ptr != end) {
        throw Exception{ErrorKind::malformed_identifier,
                        fmt::format("not a valid op id: '{}'", text)};
    }
    return OpId{counter, std::string{text.substr(at + 1)}};
}

auto to_string(const OpId& id) -> std::string {
    return fmt::format("{}@{}", id.counter, id.actor);
}

auto lamport_compare(std::string_view a, std::string_view b) -> std::strong_ordering {
    return lamport_compare(parse_op_id(a), parse_op_id(b));
}

}  // namespace docmerge_cpp
