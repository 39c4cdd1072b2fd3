#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>

namespace structbuf::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 宿主机字节序：格式串前缀为 '@' / '=' / 空时使用。
// 在编译期确定，不随调用变化。
inline constexpr bool kNativeLittleEndian = (std::endian::native == std::endian::little);

}  // 命名空间 structbuf::core
