/**
 * @file ubj_inspect.cpp
 * @brief 解码一个 UBJSON 文档并以可读形式输出
 *
 * 用法：
 *   ubj_inspect [--reencode] [--verbose] <file|-|--hex "5B 55 01 5D">
 *
 * 退出码：0 成功，8 解码失败，16 重新编码失败或与输入不一致，1 参数错误。
 */

#include "ubj/codec/decoder.hpp"
#include "ubj/codec/encoder.hpp"
#include "ubj/core/log.hpp"
#include "ubj/utils/hex.hpp"
#include "ubj/utils/value_dump.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

using namespace ubj;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitDecode = 8;
constexpr int kExitEncode = 16;

int usage(const char *prog) {
    std::cerr << "usage: " << prog
              << " [--reencode] [--verbose] <file|-|--hex \"5B 55 01 5D\">\n";
    return kExitUsage;
}

bool read_stream(std::istream &is, std::vector<core::byte> &out) {
    out.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    return !is.bad();
}

} // namespace

int main(int argc, char *argv[]) {
    bool reencode = false;
    std::string path;
    std::string hex;
    bool from_hex = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--reencode") {
            reencode = true;
        } else if (arg == "--verbose") {
            core::set_log_level(core::LogLevel::debug);
        } else if (arg == "--hex") {
            if (i + 1 >= argc) {
                return usage(argv[0]);
            }
            hex = argv[++i];
            from_hex = true;
        } else if (path.empty() && !from_hex) {
            path = std::string(arg);
        } else {
            return usage(argv[0]);
        }
    }
    if (path.empty() == !from_hex) {
        return usage(argv[0]);
    }

    std::vector<core::byte> input;
    if (from_hex) {
        const auto ec = utils::parse_hex(hex, input);
        if (ec) {
            std::cerr << "invalid hex: " << ec.message() << "\n";
            return kExitUsage;
        }
    } else if (path == "-") {
        if (!read_stream(std::cin, input)) {
            std::cerr << "failed to read stdin\n";
            return kExitUsage;
        }
    } else {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs || !read_stream(ifs, input)) {
            std::cerr << "failed to read " << path << "\n";
            return kExitUsage;
        }
    }

    io::BytesSource source(core::bytes_view{input.data(), input.size()});
    codec::Decoder decoder(source);
    format::Value value;
    const auto ec = decoder.decode(value);
    if (ec) {
        std::cerr << "decode failed: " << ec.message() << " at offset "
                  << decoder.error_offset() << " (" << decoder.error_context()
                  << ")\n";
        utils::HexDumpOptions opt;
        // error_offset 是已读取的字节数，出错的字节在它前一位。
        opt.highlight_offset =
            decoder.error_offset() == 0 ? 0 : decoder.error_offset() - 1;
        std::cerr << utils::hex_dump(core::bytes_view{input.data(), input.size()}, opt);
        return kExitDecode;
    }

    std::cout << utils::dump_value(value) << "\n";
    if (source.remaining() != 0) {
        std::cout << "(" << source.remaining() << " trailing bytes ignored)\n";
    }

    if (reencode) {
        std::vector<core::byte> out;
        const auto encode_ec = codec::encode(value, out);
        if (encode_ec) {
            std::cerr << "re-encode failed: " << encode_ec.message() << "\n";
            return kExitEncode;
        }
        const auto consumed = source.position();
        const bool same = out.size() == consumed &&
                          std::equal(out.begin(), out.end(), input.begin());
        if (!same) {
            std::cerr << "re-encoded form differs:\n  in:  "
                      << utils::to_hex(core::bytes_view{input.data(), consumed})
                      << "\n  out: "
                      << utils::to_hex(core::bytes_view{out.data(), out.size()})
                      << "\n";
            return kExitEncode;
        }
        std::cout << "re-encoded form is identical (" << out.size() << " bytes)\n";
    }

    return kExitOk;
}
