#include "structbuf/utils/hex.hpp"

#include "structbuf/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace structbuf::utils {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

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
    case '{':
    case '}':
    case '\'':
    case '"':
        return true;
    default:
        return false;
    }
}

[[nodiscard]] char to_printable_ascii_(structbuf::core::byte b) noexcept {
    if (b >= 0x20 && b <= 0x7E) {
        return static_cast<char>(b);
    }
    return '.';
}

} // namespace

std::string hex_dump(structbuf::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;

    const std::size_t total = bytes.size();
    const std::size_t max_bytes =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line = (options.bytes_per_line == 0
                                      ? static_cast<std::size_t>(16)
                                      : options.bytes_per_line);

    for (std::size_t offset = 0; offset < max_bytes; offset += per_line) {
        const std::size_t line_n = std::min(per_line, max_bytes - offset);

        if (options.show_offset) {
            oss << std::setw(4) << std::setfill('0') << std::hex << offset
                << ": ";
        }

        for (std::size_t i = 0; i < line_n; ++i) {
            oss << std::setw(2) << std::setfill('0') << std::hex
                << static_cast<int>(bytes[offset + i]);
            if (i + 1 != line_n) {
                oss << ' ';
            }
        }

        if (options.show_ascii) {
            // 补齐未输出的字节位，保证 ASCII 列对齐。
            oss << std::string((per_line - line_n) * 3 + 1, ' ') << "  ";
            for (std::size_t i = 0; i < line_n; ++i) {
                oss << to_printable_ascii_(bytes[offset + i]);
            }
        }

        oss << '\n';
    }

    if (options.max_bytes != 0 && total > options.max_bytes) {
        oss << "... (truncated, total=" << std::dec << total << " bytes)\n";
    }

    return oss.str();
}

std::string to_hex(structbuf::core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<structbuf::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 0x/0X 前缀只在 nibble 对齐的位置识别，避免把 "10" 里的 '0' 误当前缀。
        if (hi_nibble < 0 && c == '0' && (i + 1) < text.size()) {
            const auto n = static_cast<unsigned char>(text[i + 1]);
            if (n == 'x' || n == 'X') {
                ++i;
                continue;
            }
        }

        const int v = hex_value_(c);
        if (v < 0) {
            return structbuf::core::make_error_code(structbuf::core::errc::invalid_argument);
        }

        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }

        out.push_back(static_cast<structbuf::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    if (hi_nibble >= 0) {
        return structbuf::core::make_error_code(structbuf::core::errc::invalid_argument);
    }

    return {};
}

std::error_code parse_hex(std::string_view text, structbuf::core::Buffer &out) noexcept {
    std::vector<structbuf::core::byte> bytes;
    auto ec = parse_hex(text, bytes);
    if (ec) {
        return ec;
    }
    out = structbuf::core::Buffer::from(structbuf::core::bytes_view{bytes.data(), bytes.size()});
    return {};
}

} // namespace structbuf::utils
