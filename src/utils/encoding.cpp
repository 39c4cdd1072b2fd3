#include "structbuf/utils/encoding.hpp"

#include "structbuf/core/error.hpp"
#include "structbuf/utils/hex.hpp"

#include <array>
#include <cctype>
#include <vector>

namespace structbuf::utils {
namespace {

using structbuf::core::byte;

constexpr char32_t kReplacementChar = 0xFFFD;

constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kBase64UrlAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::error_code invalid() noexcept {
    return core::make_error_code(core::errc::invalid_argument);
}

// 同时接受标准与 URL 安全两种字母表。
constexpr std::array<int, 256> make_base64_table() noexcept {
    std::array<int, 256> table{};
    for (auto &v : table) {
        v = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Alphabet[i])] = i;
        table[static_cast<unsigned char>(kBase64UrlAlphabet[i])] = i;
    }
    return table;
}

constexpr auto kBase64Table = make_base64_table();

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::error_code decode_utf8(std::string_view text, std::vector<char32_t> &out) {
    out.clear();
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        char32_t cp = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return invalid();
        }
        if (text.size() - i - 1 < extra) {
            return invalid();
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return invalid();
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // 拒绝过长编码、代理项以及超出 Unicode 范围的码点。
        constexpr char32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return invalid();
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return {};
}

void append_utf8(char32_t cp, std::string &out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::error_code bytes_from_latin1(std::string_view text, core::Buffer &out) {
    std::vector<char32_t> cps;
    auto ec = decode_utf8(text, cps);
    if (ec) {
        return ec;
    }
    out = core::Buffer::alloc(cps.size());
    for (std::size_t i = 0; i < cps.size(); ++i) {
        out[i] = static_cast<byte>(cps[i] & 0xFF);
    }
    return {};
}

std::error_code bytes_from_utf16le(std::string_view text, core::Buffer &out) {
    std::vector<char32_t> cps;
    auto ec = decode_utf8(text, cps);
    if (ec) {
        return ec;
    }
    std::vector<std::uint16_t> units;
    units.reserve(cps.size());
    for (const auto cp : cps) {
        if (cp >= 0x10000) {
            const auto v = cp - 0x10000;
            units.push_back(static_cast<std::uint16_t>(0xD800 | (v >> 10)));
            units.push_back(static_cast<std::uint16_t>(0xDC00 | (v & 0x3FF)));
        } else {
            units.push_back(static_cast<std::uint16_t>(cp));
        }
    }
    out = core::Buffer::alloc(units.size() * 2);
    for (std::size_t i = 0; i < units.size(); ++i) {
        ec = out.write_uint16(i * 2, true, units[i]);
        if (ec) {
            return ec;
        }
    }
    return {};
}

std::error_code bytes_from_base64(std::string_view text, core::Buffer &out) {
    std::vector<byte> bytes;
    std::uint32_t acc = 0;
    int bits = 0;
    bool padding = false;
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c) != 0) {
            continue;
        }
        if (c == '=') {
            padding = true;
            continue;
        }
        const int v = kBase64Table[c];
        // '=' 之后不允许再出现数据字符。
        if (v < 0 || padding) {
            return invalid();
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<byte>((acc >> bits) & 0xFF));
        }
    }
    // 剩余 6 位不足以构成一个字节：输入长度非法。
    if (bits >= 6) {
        return invalid();
    }
    out = core::Buffer::from(core::bytes_view{bytes.data(), bytes.size()});
    return {};
}

std::string base64_from_bytes(core::bytes_view bytes, const char *alphabet, bool pad) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t v = (std::uint32_t{bytes[i]} << 16) | (std::uint32_t{bytes[i + 1]} << 8) | bytes[i + 2];
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        out.push_back(alphabet[v & 0x3F]);
    }
    const auto rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t v = std::uint32_t{bytes[i]} << 16;
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        if (pad) {
            out += "==";
        }
    } else if (rest == 2) {
        const std::uint32_t v = (std::uint32_t{bytes[i]} << 16) | (std::uint32_t{bytes[i + 1]} << 8);
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        if (pad) {
            out.push_back('=');
        }
    }
    return out;
}

std::string utf16le_from_bytes(core::bytes_view bytes) {
    std::string out;
    // 奇数长度时末尾多出的单字节被忽略。
    const std::size_t n = bytes.size() / 2;
    for (std::size_t i = 0; i < n; ++i) {
        const char32_t unit = bytes[2 * i] | (char32_t{bytes[2 * i + 1]} << 8);
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < n) {
            const char32_t low = bytes[2 * i + 2] | (char32_t{bytes[2 * i + 3]} << 8);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                append_utf8(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00), out);
                ++i;
                continue;
            }
        }
        if (unit >= 0xD800 && unit <= 0xDFFF) {
            append_utf8(kReplacementChar, out);
        } else {
            append_utf8(unit, out);
        }
    }
    return out;
}

} // namespace

std::error_code parse_encoding(std::string_view name, encoding &out) noexcept {
    struct Alias {
        std::string_view name;
        encoding enc;
    };
    static constexpr Alias kAliases[] = {
        {"utf8", encoding::utf8},        {"utf-8", encoding::utf8},
        {"latin1", encoding::latin1},    {"binary", encoding::latin1},
        {"ascii", encoding::latin1},     {"hex", encoding::hex},
        {"base64", encoding::base64},    {"base64url", encoding::base64url},
        {"utf16le", encoding::utf16le},  {"utf-16le", encoding::utf16le},
        {"ucs2", encoding::utf16le},     {"ucs-2", encoding::utf16le},
    };
    for (const auto &alias : kAliases) {
        if (equals_ignore_case(alias.name, name)) {
            out = alias.enc;
            return {};
        }
    }
    return invalid();
}

std::string_view encoding_name(encoding enc) noexcept {
    switch (enc) {
    case encoding::utf8:
        return "utf8";
    case encoding::latin1:
        return "latin1";
    case encoding::hex:
        return "hex";
    case encoding::base64:
        return "base64";
    case encoding::base64url:
        return "base64url";
    case encoding::utf16le:
        return "utf16le";
    }
    return "unknown";
}

std::error_code from_string(std::string_view text, encoding enc, core::Buffer &out) noexcept {
    switch (enc) {
    case encoding::utf8:
        out = core::Buffer::from(text);
        return {};
    case encoding::latin1:
        return bytes_from_latin1(text, out);
    case encoding::hex:
        return parse_hex(text, out);
    case encoding::base64:
    case encoding::base64url:
        return bytes_from_base64(text, out);
    case encoding::utf16le:
        return bytes_from_utf16le(text, out);
    }
    return invalid();
}

std::error_code to_string(core::bytes_view bytes, encoding enc, std::string &out) noexcept {
    switch (enc) {
    case encoding::utf8:
        out.assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        return {};
    case encoding::latin1:
        out.clear();
        for (const auto b : bytes) {
            append_utf8(b, out);
        }
        return {};
    case encoding::hex:
        out = to_hex(bytes);
        return {};
    case encoding::base64:
        out = base64_from_bytes(bytes, kBase64Alphabet, true);
        return {};
    case encoding::base64url:
        out = base64_from_bytes(bytes, kBase64UrlAlphabet, false);
        return {};
    case encoding::utf16le:
        out = utf16le_from_bytes(bytes);
        return {};
    }
    return invalid();
}

} // namespace structbuf::utils
