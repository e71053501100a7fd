#include "ubj/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ubj::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
    static constexpr const char *ascii = "\033[1;32m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    switch (c) {
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '|':
    case '[':
    case ']':
    case '(':
    case ')':
    case '\'':
    case '"':
        return true;
    default:
        return false;
    }
}

[[nodiscard]] char to_printable_ascii_(ubj::core::byte b) noexcept {
    if (b >= 0x20 && b <= 0x7E) {
        return static_cast<char>(b);
    }
    return '.';
}

} // namespace

std::string hex_dump(ubj::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;
    const bool enable_color = options.enable_color;
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *dim = ansi_(enable_color, Ansi::dim);
    const auto *bytes_color = ansi_(enable_color, Ansi::bytes);
    const auto *ascii_color = ansi_(enable_color, Ansi::ascii);
    const auto *error = ansi_(enable_color, Ansi::error);

    const std::size_t total = bytes.size();
    const std::size_t max_bytes =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line = (options.bytes_per_line == 0
                                      ? static_cast<std::size_t>(16)
                                      : options.bytes_per_line);

    for (std::size_t offset = 0; offset < max_bytes; offset += per_line) {
        const std::size_t line_n = std::min(per_line, max_bytes - offset);

        if (options.show_offset) {
            oss << dim;
            oss << std::setw(4) << std::setfill('0') << std::hex << offset
                << ": ";
            oss << reset;
        }

        for (std::size_t i = 0; i < line_n; ++i) {
            const bool highlight = (offset + i) == options.highlight_offset;
            // 无颜色时用 '>' 标出高亮字节。
            if (highlight) {
                oss << (enable_color ? error : ">");
            } else {
                oss << bytes_color;
            }
            oss << std::setw(2) << std::setfill('0') << std::hex
                << static_cast<int>(bytes[offset + i]);
            oss << reset;
            if (i + 1 != line_n) {
                oss << ' ';
            }
        }

        if (options.show_ascii) {
            // 补齐未输出的字节位，保证 ASCII 列对齐。
            if (line_n < per_line) {
                oss << std::string((per_line - line_n) * 3, ' ');
            } else {
                oss << ' ';
            }
            oss << "  ";
            oss << ascii_color;
            for (std::size_t i = 0; i < line_n; ++i) {
                oss << to_printable_ascii_(bytes[offset + i]);
            }
            oss << reset;
        }

        oss << '\n';
    }

    if (options.max_bytes != 0 && total > options.max_bytes) {
        oss << error << "... (truncated, total=" << std::dec << total << " bytes)"
            << reset << '\n';
    }

    return oss.str();
}

std::string to_hex(ubj::core::bytes_view bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0F]);
    }
    return out;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<ubj::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 可选 0x/0X 前缀：只在一个字节的起始位置识别。
        if (c == '0' && hi_nibble < 0 && (i + 1) < text.size()) {
            const auto n = static_cast<unsigned char>(text[i + 1]);
            if (n == 'x' || n == 'X') {
                ++i;
                continue;
            }
        }

        const int v = hex_value_(c);
        if (v < 0) {
            return ubj::core::make_error_code(ubj::core::errc::invalid_argument);
        }
        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }

        out.push_back(static_cast<ubj::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 两个 nibble 组成一个 byte，落单的半字节视为非法输入。
    if (hi_nibble >= 0) {
        return ubj::core::make_error_code(ubj::core::errc::invalid_argument);
    }

    return {};
}

} // namespace ubj::utils
