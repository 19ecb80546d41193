#include "esrdecoder/parse.hpp"

#include <charconv>
#include <system_error>

namespace esrdecoder {

std::optional<uint64_t> ParseNumber(std::string_view str) {
    int base = 10;
    if (str.starts_with("0x")) {
        str.remove_prefix(2);
        base = 16;
    }

    uint64_t value{};
    const char *end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value, base);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace esrdecoder
