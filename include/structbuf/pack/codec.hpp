#pragma once

#include "structbuf/core/buffer.hpp"
#include "structbuf/pack/error.hpp"
#include "structbuf/pack/format.hpp"
#include "structbuf/pack/value.hpp"

#include <cstddef>
#include <span>
#include <system_error>
#include <vector>

namespace structbuf::pack {

/**
 * @brief 处理一个格式项后的游标状态。
 *
 * - offset：下一个字段的起始偏移；
 * - consumed：本格式项从输入值列表头部消耗的值个数（unpack 时为 0）。
 *
 * 失败时同样会填充：反映失败前已完成的写入/消耗进度。
 */
struct CodecStep final {
  std::size_t offset{0};
  std::size_t consumed{0};
};

/**
 * @brief 按单个格式项把 vals 头部的值写入 out 的 offset 处。
 *
 * - 标量类型码循环 item.repeat 次，每次消耗一个值并前进元素宽度；
 * - 's' / 'p' 只消耗一个值，一次写满 item.repeat 字节；
 * - 'x' 写 item.repeat 个 0，不消耗值；
 * - 值不足时返回 errc::not_enough_values（之前的元素已写入 out）；
 * - 值类型不匹配时返回 errc::invalid_argument；
 * - 类型码不在字母表中返回 errc::unknown_format；
 * - 越过 out 末尾返回 core::errc::out_of_range。
 */
std::error_code pack_item(core::Buffer& out,
                          bool little_endian,
                          const FormatItem& item,
                          std::span<const Value> vals,
                          std::size_t offset,
                          CodecStep& step) noexcept;

/**
 * @brief 按单个格式项从 in 的 offset 处解码，结果追加到 out。
 *
 * - 'x' 只前进偏移，不产生值；
 * - 'c' / 's' 产生 in 的子视图（不裁剪尾部 0）；
 * - 'p' 产生长度为 min(长度前缀, repeat - 1) 的子视图；
 * - 数值类型码产生 int64 / uint64 / bool / double。
 */
std::error_code unpack_item(const core::Buffer& in,
                            bool little_endian,
                            const FormatItem& item,
                            std::size_t offset,
                            std::vector<Value>& out,
                            CodecStep& step) noexcept;

}  // namespace structbuf::pack
