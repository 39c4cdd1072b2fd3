#pragma once

#include "structbuf/core/buffer.hpp"

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace structbuf::pack {

/**
 * @brief pack 的输入值 / unpack 的输出值（强类型 tagged variant）。
 *
 * 约定：
 * - 有符号整数统一用 int64 承载，无符号整数统一用 uint64 承载（'q'/'Q' 精确无损）；
 * - 浮点统一用 double 承载（'e'/'f' 解包结果为扩展后的 double）；
 * - 字节串用 core::Buffer 承载：unpack 的 'c'/'s'/'p' 结果是源 Buffer 的视图，不拷贝；
 * - none 表示“缺省值”：整数按 0、浮点按 NaN、字节串按空串处理。
 *
 * 为了书写方便，整数/浮点/字符串字面量可隐式构造 Value：
 *   pack::pack("<hi", {1, 2});
 */
class Value final {
 public:
  using storage_type = std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, core::Buffer>;

  Value() noexcept = default;

  template <std::integral T>
    requires(!std::same_as<T, char>)
  Value(T v) noexcept {  // NOLINT(google-explicit-constructor)
    if constexpr (std::same_as<T, bool>) {
      storage_ = v;
    } else if constexpr (std::signed_integral<T>) {
      storage_ = static_cast<std::int64_t>(v);
    } else {
      storage_ = static_cast<std::uint64_t>(v);
    }
  }

  // char 视为单字节字节串（对应 'c'），而不是整数。
  Value(char c);                                                  // NOLINT(google-explicit-constructor)
  Value(float v) noexcept : storage_(static_cast<double>(v)) {}   // NOLINT(google-explicit-constructor)
  Value(double v) noexcept : storage_(v) {}                       // NOLINT(google-explicit-constructor)
  Value(core::Buffer v) noexcept : storage_(std::move(v)) {}      // NOLINT(google-explicit-constructor)
  Value(std::string_view text);                                   // NOLINT(google-explicit-constructor)
  Value(const char* text);                                        // NOLINT(google-explicit-constructor)
  Value(const std::string& text);                                 // NOLINT(google-explicit-constructor)

  static Value none() noexcept { return Value{}; }
  static Value bytes(core::bytes_view v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_none() const noexcept { return std::holds_alternative<std::monostate>(storage_); }
  [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(storage_); }
  [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(storage_); }
  [[nodiscard]] bool is_uint() const noexcept { return std::holds_alternative<std::uint64_t>(storage_); }
  [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(storage_); }
  [[nodiscard]] bool is_bytes() const noexcept { return std::holds_alternative<core::Buffer>(storage_); }

  // 真值判定（用于 '?'）：none/false/0/NaN/空字节串为假，其余为真。
  [[nodiscard]] bool truthy() const noexcept;

  // 浮点按位比较；字节串按内容比较；不同 alternative 一律不等（1 != 1u）。
  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

/**
 * @brief 生成便于阅读的单行描述（用于日志与示例输出）。
 *
 * 例：none、true、-2、254u、1.5、b"test\x00"
 */
[[nodiscard]] std::string to_string(const Value& value);

}  // namespace structbuf::pack
