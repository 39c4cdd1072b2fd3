#pragma once

#include "structbuf/core/buffer.hpp"
#include "structbuf/core/common.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace structbuf::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 从日志里复制一段 “01 02 03 00 74 65 ...” 的字符串，解析为 bytes 后 unpack；
 * - 将 pack 的结果以 hexdump 形式输出，便于核对字段布局。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    bool show_offset{true};

    // ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};
};

/**
 * @brief 将 bytes 以 hexdump 形式格式化为多行字符串。
 */
[[nodiscard]] std::string hex_dump(structbuf::core::bytes_view bytes,
                                   HexDumpOptions options = {});

// 连续的小写 16 进制串（无分隔符），例如 "010203"。
[[nodiscard]] std::string to_hex(structbuf::core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号等；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 失败（非法字符或奇数个 nibble）返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<structbuf::core::byte> &out) noexcept;

// 同上，结果直接放入新分配的 Buffer（便于随后 unpack / iter_unpack）。
std::error_code parse_hex(std::string_view text, structbuf::core::Buffer &out) noexcept;

} // namespace structbuf::utils
