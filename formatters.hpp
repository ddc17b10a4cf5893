#pragma once

#include <algorithm>   // For std::min
#include <cctype>      // For std::isprint
#include <cstddef>     // For size_t, SIZE_MAX
#include <cstdint>     // For uint8_t
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/format.h>
#include <google/protobuf/message.h>

// --- Helper Namespace ---
namespace detail {

// Hexdump with offset column and ASCII gutter, e.g.
// 0000: 08 02 10 C8 01 52 0A 0A  |.....R..|
template <typename ByteType, typename FormatContext>
auto format_byte_vector_hexdump(const std::vector<ByteType>& data,
                                FormatContext& ctx,
                                size_t width,
                                char presentation,
                                size_t limit) {
    auto out = ctx.out();
    if (data.empty()) {
        return fmt::format_to(out, "[empty vector]");
    }

    if (presentation != 'x' && presentation != 'X') {
        return fmt::format_to(out, "[{} bytes]", data.size());
    }

    const size_t bytes_to_display = std::min(data.size(), limit);
    std::string ascii_repr;
    ascii_repr.reserve(width);

    for (size_t i = 0; i < bytes_to_display; ++i) {
        const uint8_t byte_value = static_cast<uint8_t>(data[i]);

        if (i % width == 0) {
            if (i > 0) {
                out = fmt::format_to(out, " |{}|\n", ascii_repr);
                ascii_repr.clear();
            }
            out = fmt::format_to(out, "{:04X}: ", i);
        }

        out = fmt::format_to(out, "{:02X} ", byte_value);
        ascii_repr += (std::isprint(byte_value) ? static_cast<char>(byte_value)
                                                : '.');

        if (i == bytes_to_display - 1) {
            size_t remaining_in_line = width - (i % width) - 1;
            for (size_t j = 0; j < remaining_in_line; ++j) {
                out = fmt::format_to(out, "   ");
            }
            out = fmt::format_to(out, " |{}|", ascii_repr);
        }
    }

    if (bytes_to_display < data.size()) {
        if (bytes_to_display > 0) {
            out = fmt::format_to(out, "\n");
        }
        out = fmt::format_to(out, "({} bytes left)", data.size() - bytes_to_display);
    }

    return out;
}

// Accepted: [width][x|X][L<limit>], e.g. "{:8xL64}"
constexpr auto parse_hexdump_format_spec(fmt::format_parse_context& ctx,
                                         size_t& width,
                                         char& presentation,
                                         size_t& limit) {
    auto it = ctx.begin(), end = ctx.end();
    limit = SIZE_MAX;

    if (it != end && *it >= '0' && *it <= '9') {
        size_t w = 0;
        do {
            w = w * 10 + static_cast<size_t>(*it - '0');
            ++it;
        } while (it != end && *it >= '0' && *it <= '9');
        if (w > 0) {
            width = w;
        }
    }

    if (it != end && (*it == 'x' || *it == 'X')) {
        presentation = *it;
        ++it;
    }

    if (it != end && (*it == 'l' || *it == 'L')) {
        ++it;
        if (it == end || *it < '0' || *it > '9') {
            throw fmt::format_error(
                "invalid limit specifier: 'L' must be followed by digits");
        }
        size_t lim_val = 0;
        do {
            lim_val = lim_val * 10 + static_cast<size_t>(*it - '0');
            ++it;
        } while (it != end && *it >= '0' && *it <= '9');
        limit = lim_val;
    }

    if (it != end && *it != '}') {
        throw fmt::format_error("invalid format specifier for byte vector");
    }

    return it;
}

} // namespace detail

struct byte_vector_formatter_base {
    char presentation = 'x';
    size_t width = 16;
    size_t limit = SIZE_MAX;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ::detail::parse_hexdump_format_spec(ctx, width, presentation, limit);
    }
};

template <>
struct fmt::formatter<std::vector<uint8_t>> : public byte_vector_formatter_base {
    template <typename FormatContext>
    auto format(const std::vector<uint8_t>& data, FormatContext& ctx) const {
        return ::detail::format_byte_vector_hexdump(data, ctx, width, presentation,
                                                  limit);
    }
};

// Any generated protobuf message prints as its one-line text form.
template <typename T>
struct fmt::formatter<
    T, char,
    std::enable_if_t<std::is_base_of_v<google::protobuf::Message, T>>>
    : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const T& message, FormatContext& ctx) const {
        std::string text = message.ShortDebugString();
        return fmt::formatter<std::string_view>::format(text, ctx);
    }
};
