#include "utils.hpp"

#include <charconv>

bool
parseHexColor(std::string_view s, uint32_t &out)
{
    if (!s.empty() && s.front() == '#')
        s.remove_prefix(1);

    if (s.size() != 6 && s.size() != 8)
        return false;

    uint32_t value{0};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
                                           value, 16);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return false;

    // No alpha given: opaque
    if (s.size() == 6)
        value = (value << 8) | 0xFF;

    out = value;
    return true;
}
