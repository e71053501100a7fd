#include "ubj/utils/value_dump.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>
#include <variant>

namespace ubj::utils {
namespace {

using ubj::format::Array;
using ubj::format::Bytes;
using ubj::format::Decimal;
using ubj::format::Extension;
using ubj::format::Object;
using ubj::format::Value;

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

struct DumpContext final {
    std::ostringstream oss;
    ValueDumpOptions options{};
};

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

void append_escaped_text_(std::ostringstream &oss,
                          const std::string &s,
                          std::size_t max_bytes,
                          bool enable_color) {
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *string = ansi_(enable_color, Ansi::string);

    const std::size_t total = s.size();
    const std::size_t n = (max_bytes == 0 ? total : std::min(total, max_bytes));

    oss << string;
    oss << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\') {
            oss << "\\\\";
            continue;
        }
        if (c == '"') {
            oss << "\\\"";
            continue;
        }
        if (c >= 0x20 && c <= 0x7E) {
            oss << static_cast<char>(c);
            continue;
        }
        // 控制字符与多字节 UTF-8：逐字节 \xHH。
        oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(c) << std::dec;
    }
    if (max_bytes != 0 && total > max_bytes) {
        oss << "...";
    }
    oss << '"';
    oss << reset;
}

void append_bytes_(std::ostringstream &oss,
                   const Bytes &bytes,
                   std::size_t max_bytes,
                   bool enable_color) {
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *type = ansi_(enable_color, Ansi::type);
    const auto *value_color = ansi_(enable_color, Ansi::value);
    const auto *dim = ansi_(enable_color, Ansi::dim);

    const std::size_t total = bytes.size();
    const std::size_t n = (max_bytes == 0 ? total : std::min(total, max_bytes));

    oss << type << "bytes[" << total << ']' << reset;
    if (total == 0) {
        return;
    }
    oss << ' ';

    oss << value_color;
    for (std::size_t i = 0; i < n; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(bytes[i]) << std::dec;
        if (i + 1 != n) {
            oss << ' ';
        }
    }
    oss << reset;
    if (max_bytes != 0 && total > max_bytes) {
        oss << ' ' << dim << "..." << reset;
    }
}

template <class T>
void append_number_(std::ostringstream &oss,
                    const char *type_name,
                    T v,
                    bool enable_color) {
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *type = ansi_(enable_color, Ansi::type);
    const auto *value = ansi_(enable_color, Ansi::value);

    oss << type << type_name << reset << ' ' << value;
    if constexpr (std::is_floating_point_v<T>) {
        oss << std::setprecision(std::numeric_limits<T>::max_digits10) << v;
    } else {
        oss << v;
    }
    oss << reset;
}

void append_value_(DumpContext &ctx, const Value &value, std::size_t depth);

template <class Range, class AppendOne>
void append_container_(DumpContext &ctx,
                       const char *type_name,
                       const Range &items,
                       std::size_t depth,
                       char open,
                       char close,
                       AppendOne append_one) {
    const auto &opt = ctx.options;
    const bool enable_color = opt.enable_color;
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *type = ansi_(enable_color, Ansi::type);
    const auto *dim = ansi_(enable_color, Ansi::dim);

    const std::size_t total = items.size();
    const std::size_t n =
        (opt.max_items == 0 ? total : std::min(total, opt.max_items));

    ctx.oss << type << type_name << '[' << total << ']' << reset;

    if (total == 0) {
        return;
    }

    if (depth >= opt.max_depth) {
        ctx.oss << ' ' << dim << "..." << reset;
        return;
    }

    auto it = items.begin();
    if (!opt.multiline) {
        ctx.oss << ' ' << dim << open << ' ' << reset;
        for (std::size_t i = 0; i < n; ++i, ++it) {
            append_one(*it);
            if (i + 1 != n) {
                ctx.oss << ", ";
            }
        }
        if (opt.max_items != 0 && total > opt.max_items) {
            ctx.oss << ", " << dim << "..." << reset;
        }
        ctx.oss << ' ' << dim << close << reset;
        return;
    }

    ctx.oss << ' ' << dim << open << '\n' << reset;
    for (std::size_t i = 0; i < n; ++i, ++it) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces);
        append_one(*it);
        ctx.oss << '\n';
    }
    if (opt.max_items != 0 && total > opt.max_items) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces) << dim << "..." << reset
                << '\n';
    }
    ctx.oss << indent_(depth, opt.indent_spaces) << dim << close << reset;
}

void append_value_(DumpContext &ctx, const Value &value, std::size_t depth) {
    const bool enable_color = ctx.options.enable_color;
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *type = ansi_(enable_color, Ansi::type);
    const auto *value_color = ansi_(enable_color, Ansi::value);

    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                ctx.oss << value_color << "null" << reset;
            } else if constexpr (std::is_same_v<T, bool>) {
                ctx.oss << value_color << (v ? "true" : "false") << reset;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                append_number_(ctx.oss, "int", v, enable_color);
            } else if constexpr (std::is_same_v<T, float>) {
                append_number_(ctx.oss, "float32", v, enable_color);
            } else if constexpr (std::is_same_v<T, double>) {
                append_number_(ctx.oss, "float64", v, enable_color);
            } else if constexpr (std::is_same_v<T, Decimal>) {
                ctx.oss << type << "decimal" << reset << ' ' << value_color
                        << v.to_string() << reset;
            } else if constexpr (std::is_same_v<T, std::string>) {
                append_escaped_text_(
                    ctx.oss, v, ctx.options.max_payload_bytes, enable_color);
            } else if constexpr (std::is_same_v<T, Bytes>) {
                append_bytes_(
                    ctx.oss, v, ctx.options.max_payload_bytes, enable_color);
            } else if constexpr (std::is_same_v<T, std::shared_ptr<Array>>) {
                append_container_(
                    ctx, "array", *v, depth, '[', ']', [&](const Value &item) {
                        append_value_(ctx, item, depth + 1);
                    });
            } else if constexpr (std::is_same_v<T, std::shared_ptr<Object>>) {
                append_container_(
                    ctx,
                    "object",
                    *v,
                    depth,
                    '{',
                    '}',
                    [&](const Object::entry_type &entry) {
                        append_escaped_text_(ctx.oss,
                                             entry.first,
                                             ctx.options.max_payload_bytes,
                                             enable_color);
                        ctx.oss << ": ";
                        append_value_(ctx, entry.second, depth + 1);
                    });
            } else {
                ctx.oss << type << "extension<"
                        << (v ? v->type_name() : std::string_view{"null"}) << '>'
                        << reset;
            }
        },
        value.storage());
}

} // namespace

std::string dump_value(const Value &value, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    append_value_(ctx, value, 0);
    return ctx.oss.str();
}

} // namespace ubj::utils
