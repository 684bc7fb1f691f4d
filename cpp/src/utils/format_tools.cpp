#include "fbr_base.hpp"

#include <algorithm>
#include <cctype>

namespace filebridge::format_tools
{

// The fractional microsecond part is computed and appended manually so the output
// does not depend on which subsecond conventions the installed fmt chrono supports.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string hex_dump(std::span<const uint8_t> data, size_t offset, size_t max_bytes)
{
    constexpr size_t kBytesPerLine = 16;

    if (offset >= data.size() || max_bytes == 0)
    {
        return {};
    }
    const size_t end = offset + std::min(max_bytes, data.size() - offset);

    fmt::memory_buffer mb;
    for (size_t line = offset; line < end; line += kBytesPerLine)
    {
        const size_t line_end = std::min(line + kBytesPerLine, end);
        fmt::format_to(std::back_inserter(mb), "{:08x}  ", line);
        for (size_t i = line; i < line + kBytesPerLine; ++i)
        {
            if (i < line_end)
                fmt::format_to(std::back_inserter(mb), "{:02x} ", data[i]);
            else
                fmt::format_to(std::back_inserter(mb), "   ");
        }
        fmt::format_to(std::back_inserter(mb), " |");
        for (size_t i = line; i < line_end; ++i)
        {
            const auto c = static_cast<unsigned char>(data[i]);
            mb.push_back(std::isprint(c) != 0 ? static_cast<char>(c) : '.');
        }
        fmt::format_to(std::back_inserter(mb), "|\n");
    }
    return fmt::to_string(mb);
}

} // namespace filebridge::format_tools
