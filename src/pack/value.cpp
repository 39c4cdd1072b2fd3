#include "structbuf/pack/value.hpp"

#include <bit>
#include <cmath>
#include <cstdio>
#include <type_traits>

namespace structbuf::pack {

Value::Value(char c) : Value(std::string_view{&c, 1}) {}
Value::Value(std::string_view text) : storage_(core::Buffer::from(text)) {}
Value::Value(const char* text) : Value(std::string_view{text == nullptr ? "" : text}) {}
Value::Value(const std::string& text) : Value(std::string_view{text}) {}

Value Value::bytes(core::bytes_view v) { return Value{core::Buffer::from(v)}; }

bool Value::truthy() const noexcept {
  return std::visit(
    [](const auto& v) -> bool {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::monostate>) {
        return false;
      } else if constexpr (std::is_same_v<T, bool>) {
        return v;
      } else if constexpr (std::is_same_v<T, double>) {
        return v != 0.0 && !std::isnan(v);
      } else if constexpr (std::is_same_v<T, core::Buffer>) {
        return !v.empty();
      } else {
        return v != 0;
      }
    },
    storage_);
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  if (const auto* l = lhs.get_if<double>()) {
    // 按位比较：NaN 与自身相等，+0 与 -0 不等（与字节层面的往返一致）。
    return std::bit_cast<std::uint64_t>(*l) == std::bit_cast<std::uint64_t>(*rhs.get_if<double>());
  }
  return lhs.storage_ == rhs.storage_;
}

std::string to_string(const Value& value) {
  return std::visit(
    [](const auto& v) -> std::string {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::monostate>) {
        return "none";
      } else if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return std::to_string(v);
      } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        return std::to_string(v) + "u";
      } else if constexpr (std::is_same_v<T, double>) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", v);
        return buf;
      } else {
        std::string out = "b\"";
        for (const auto b : v.bytes()) {
          if (b >= 0x20 && b <= 0x7E && b != '"' && b != '\\') {
            out.push_back(static_cast<char>(b));
          } else {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(b));
            out += buf;
          }
        }
        out.push_back('"');
        return out;
      }
    },
    value.storage());
}

}  // namespace structbuf::pack
