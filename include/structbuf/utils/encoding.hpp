#pragma once

#include "structbuf/core/buffer.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace structbuf::utils {

/**
 * @brief 字符串与字节之间的编码方式。
 *
 * 文本侧统一为 UTF-8 std::string：
 * - latin1：每个码点取低 8 位（解码方向把每个字节视为 U+0000..U+00FF）；
 * - utf16le：与 UTF-8 互转，非法代理项解码为 U+FFFD；
 * - base64 输出带 '=' 填充，base64url 输出不带填充；
 *   两者解码时都接受任一字母表、缺省填充以及空白字符。
 */
enum class encoding : std::uint8_t {
    utf8,
    latin1,
    hex,
    base64,
    base64url,
    utf16le,
};

/**
 * @brief 按名称查找编码（大小写不敏感）。
 *
 * 别名：utf-8；binary/ascii -> latin1；ucs2/ucs-2/utf-16le -> utf16le。
 * 未知名称返回 core::errc::invalid_argument。
 */
std::error_code parse_encoding(std::string_view name, encoding &out) noexcept;

[[nodiscard]] std::string_view encoding_name(encoding enc) noexcept;

// 文本 -> 字节。
std::error_code from_string(std::string_view text, encoding enc, core::Buffer &out) noexcept;

// 字节 -> 文本。
std::error_code to_string(core::bytes_view bytes, encoding enc, std::string &out) noexcept;

} // namespace structbuf::utils
