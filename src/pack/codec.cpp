#include "structbuf/pack/codec.hpp"

#include "structbuf/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

namespace structbuf::pack {
namespace {

// 2^53 - 1：double 可精确表示的最大整数。
constexpr double kMaxSafeInteger = 9007199254740991.0;
constexpr double kTwoPow63 = 9223372036854775808.0;
constexpr double kTwoPow64 = 18446744073709551616.0;

/*
 * 值转换规则（pack 方向）：
 * - 32 位及以下整数：none -> 0，bool -> 0/1，double 先截断到 ±(2^53-1) 再取整（NaN -> 0），
 *   最终按字段宽度取低位（二进制补码回绕）；
 * - 64 位整数：必须能无损转换（double 需为有限整数且在 [-2^63, 2^64) 内），按 64 位回绕写入；
 * - 浮点：none -> NaN，整数/bool 转为 double；
 * - 字节串：none -> 空串；
 * 其他组合一律 errc::invalid_argument。
 */
std::error_code to_narrow_integer(const Value& v, std::int64_t& out) noexcept {
  return std::visit(
    [&](const auto& x) -> std::error_code {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, std::monostate>) {
        out = 0;
      } else if constexpr (std::is_same_v<T, bool>) {
        out = x ? 1 : 0;
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        out = x;
      } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        out = static_cast<std::int64_t>(x);
      } else if constexpr (std::is_same_v<T, double>) {
        if (std::isnan(x)) {
          out = 0;
        } else {
          out = static_cast<std::int64_t>(std::trunc(std::clamp(x, -kMaxSafeInteger, kMaxSafeInteger)));
        }
      } else {
        return make_error_code(errc::invalid_argument);
      }
      return {};
    },
    v.storage());
}

std::error_code to_wide_integer(const Value& v, std::uint64_t& out) noexcept {
  return std::visit(
    [&](const auto& x) -> std::error_code {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, bool>) {
        out = x ? 1u : 0u;
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        out = static_cast<std::uint64_t>(x);
      } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        out = x;
      } else if constexpr (std::is_same_v<T, double>) {
        if (!std::isfinite(x) || std::trunc(x) != x || x < -kTwoPow63 || x >= kTwoPow64) {
          return make_error_code(errc::invalid_argument);
        }
        if (x < 0) {
          out = static_cast<std::uint64_t>(static_cast<std::int64_t>(x));
        } else {
          out = static_cast<std::uint64_t>(x);
        }
      } else {
        return make_error_code(errc::invalid_argument);
      }
      return {};
    },
    v.storage());
}

std::error_code to_real(const Value& v, double& out) noexcept {
  return std::visit(
    [&](const auto& x) -> std::error_code {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, std::monostate>) {
        out = std::numeric_limits<double>::quiet_NaN();
      } else if constexpr (std::is_same_v<T, bool>) {
        out = x ? 1.0 : 0.0;
      } else if constexpr (std::is_same_v<T, core::Buffer>) {
        return make_error_code(errc::invalid_argument);
      } else {
        out = static_cast<double>(x);
      }
      return {};
    },
    v.storage());
}

std::error_code to_bytes(const Value& v, core::Buffer& out) noexcept {
  if (v.is_none()) {
    out = core::Buffer{};
    return {};
  }
  if (const auto* b = v.get_if<core::Buffer>()) {
    out = *b;
    return {};
  }
  return make_error_code(errc::invalid_argument);
}

// 取 [offset, offset + width) 的视图；越界返回 out_of_range。
std::error_code field_at(const core::Buffer& buf, std::size_t offset, std::size_t width, core::Buffer& field) noexcept {
  if (offset > buf.size() || width > buf.size() - offset) {
    return core::make_error_code(core::errc::out_of_range);
  }
  field = buf.subarray(offset, offset + width);
  return {};
}

template <class T, class Convert, class Write>
std::error_code pack_scalars(const FormatItem& item,
                             std::span<const Value> vals,
                             std::size_t width,
                             CodecStep& step,
                             Convert convert,
                             Write write) noexcept {
  for (std::size_t i = 0; i < item.repeat; ++i) {
    if (step.consumed >= vals.size()) {
      return make_error_code(errc::not_enough_values);
    }
    T v{};
    auto ec = convert(vals[step.consumed], v);
    if (ec) {
      return ec;
    }
    ec = write(step.offset, v);
    if (ec) {
      return ec;
    }
    ++step.consumed;
    step.offset += width;
  }
  return {};
}

template <class Read>
std::error_code unpack_scalars(const FormatItem& item,
                               std::size_t width,
                               std::vector<Value>& out,
                               CodecStep& step,
                               Read read) noexcept {
  for (std::size_t i = 0; i < item.repeat; ++i) {
    Value v;
    auto ec = read(step.offset, v);
    if (ec) {
      return ec;
    }
    out.push_back(std::move(v));
    step.offset += width;
  }
  return {};
}

std::error_code pack_pad(core::Buffer& out, const FormatItem& item, CodecStep& step) noexcept {
  core::Buffer field;
  auto ec = field_at(out, step.offset, item.repeat, field);
  if (ec) {
    return ec;
  }
  field.fill(0);
  step.offset += item.repeat;
  return {};
}

std::error_code pack_chars(core::Buffer& out, const FormatItem& item, std::span<const Value> vals, CodecStep& step) noexcept {
  return pack_scalars<core::Buffer>(item, vals, 1, step, to_bytes, [&](std::size_t at, const core::Buffer& v) {
    return out.write_uint8(at, v.empty() ? 0 : v[0]);
  });
}

// 's'：一个值写满 repeat 字节，不足补 0，超出截断。
std::error_code pack_string(core::Buffer& out, const FormatItem& item, std::span<const Value> vals, CodecStep& step) noexcept {
  if (vals.empty()) {
    return make_error_code(errc::not_enough_values);
  }
  core::Buffer src;
  auto ec = to_bytes(vals.front(), src);
  if (ec) {
    return ec;
  }
  core::Buffer field;
  ec = field_at(out, step.offset, item.repeat, field);
  if (ec) {
    return ec;
  }
  field.fill(0);
  src.copy(field, 0, 0, item.repeat);
  step.consumed = 1;
  step.offset += item.repeat;
  return {};
}

// 'p'：首字节为实际写入长度（<= repeat - 1），其后是截断/补 0 后的内容。
std::error_code pack_pascal(core::Buffer& out, const FormatItem& item, std::span<const Value> vals, CodecStep& step) noexcept {
  if (vals.empty()) {
    return make_error_code(errc::not_enough_values);
  }
  core::Buffer src;
  auto ec = to_bytes(vals.front(), src);
  if (ec) {
    return ec;
  }
  core::Buffer field;
  ec = field_at(out, step.offset, item.repeat, field);
  if (ec) {
    return ec;
  }
  step.consumed = 1;
  if (item.repeat == 0) {
    // 宽度为 0 的字段连长度前缀都放不下：只消耗值，不写任何字节。
    return {};
  }
  field.fill(0);
  const auto written = src.copy(field, 1, 0, item.repeat - 1);
  field[0] = static_cast<core::byte>(written);
  step.offset += item.repeat;
  return {};
}

std::error_code unpack_pad(const core::Buffer& in, const FormatItem& item, CodecStep& step) noexcept {
  core::Buffer field;
  auto ec = field_at(in, step.offset, item.repeat, field);
  if (ec) {
    return ec;
  }
  step.offset += item.repeat;
  return {};
}

std::error_code unpack_string(const core::Buffer& in, const FormatItem& item, std::vector<Value>& out, CodecStep& step) noexcept {
  core::Buffer field;
  auto ec = field_at(in, step.offset, item.repeat, field);
  if (ec) {
    return ec;
  }
  out.emplace_back(std::move(field));
  step.offset += item.repeat;
  return {};
}

std::error_code unpack_pascal(const core::Buffer& in, const FormatItem& item, std::vector<Value>& out, CodecStep& step) noexcept {
  core::Buffer field;
  auto ec = field_at(in, step.offset, item.repeat, field);
  if (ec) {
    return ec;
  }
  if (item.repeat == 0) {
    out.emplace_back(core::Buffer{});
    return {};
  }
  const auto len = std::min<std::size_t>(field[0], item.repeat - 1);
  out.emplace_back(field.subarray(1, 1 + len));
  step.offset += item.repeat;
  return {};
}

}  // namespace

std::error_code pack_item(core::Buffer& out,
                          bool little_endian,
                          const FormatItem& item,
                          std::span<const Value> vals,
                          std::size_t offset,
                          CodecStep& step) noexcept {
  step = CodecStep{offset, 0};
  const bool le = little_endian;

  switch (item.code) {
    case type_code::pad:
      return pack_pad(out, item, step);
    case type_code::character:
      return pack_chars(out, item, vals, step);
    case type_code::int8:
      return pack_scalars<std::int64_t>(item, vals, 1, step, to_narrow_integer, [&](std::size_t at, std::int64_t v) {
        return out.write_int8(at, static_cast<std::int8_t>(v));
      });
    case type_code::uint8:
      return pack_scalars<std::int64_t>(item, vals, 1, step, to_narrow_integer, [&](std::size_t at, std::int64_t v) {
        return out.write_uint8(at, static_cast<std::uint8_t>(v));
      });
    case type_code::boolean:
      return pack_scalars<bool>(
        item, vals, 1, step,
        [](const Value& v, bool& b) -> std::error_code {
          b = v.truthy();
          return {};
        },
        [&](std::size_t at, bool v) { return out.write_uint8(at, v ? 1 : 0); });
    case type_code::int16:
      return pack_scalars<std::int64_t>(item, vals, 2, step, to_narrow_integer, [&](std::size_t at, std::int64_t v) {
        return out.write_int16(at, le, static_cast<std::int16_t>(v));
      });
    case type_code::uint16:
      return pack_scalars<std::int64_t>(item, vals, 2, step, to_narrow_integer, [&](std::size_t at, std::int64_t v) {
        return out.write_uint16(at, le, static_cast<std::uint16_t>(v));
      });
    case type_code::int32:
    case type_code::long32:
      return pack_scalars<std::int64_t>(item, vals, 4, step, to_narrow_integer, [&](std::size_t at, std::int64_t v) {
        return out.write_int32(at, le, static_cast<std::int32_t>(v));
      });
    case type_code::uint32:
    case type_code::ulong32:
      return pack_scalars<std::int64_t>(item, vals, 4, step, to_narrow_integer, [&](std::size_t at, std::int64_t v) {
        return out.write_uint32(at, le, static_cast<std::uint32_t>(v));
      });
    case type_code::int64:
    case type_code::uint64:
      // 有符号/无符号的 64 位位模式相同，区别只体现在 unpack。
      return pack_scalars<std::uint64_t>(item, vals, 8, step, to_wide_integer, [&](std::size_t at, std::uint64_t v) {
        return out.write_uint64(at, le, v);
      });
    case type_code::float16:
      return pack_scalars<double>(item, vals, 2, step, to_real, [&](std::size_t at, double v) {
        return out.write_float16(at, le, v);
      });
    case type_code::float32:
      return pack_scalars<double>(item, vals, 4, step, to_real, [&](std::size_t at, double v) {
        return out.write_float32(at, le, static_cast<float>(v));
      });
    case type_code::float64:
      return pack_scalars<double>(item, vals, 8, step, to_real, [&](std::size_t at, double v) {
        return out.write_float64(at, le, v);
      });
    case type_code::string:
      return pack_string(out, item, vals, step);
    case type_code::pascal:
      return pack_pascal(out, item, vals, step);
  }
  return make_error_code(errc::unknown_format);
}

std::error_code unpack_item(const core::Buffer& in,
                            bool little_endian,
                            const FormatItem& item,
                            std::size_t offset,
                            std::vector<Value>& out,
                            CodecStep& step) noexcept {
  step = CodecStep{offset, 0};
  const bool le = little_endian;

  switch (item.code) {
    case type_code::pad:
      return unpack_pad(in, item, step);
    case type_code::character:
      return unpack_scalars(item, 1, out, step, [&](std::size_t at, Value& v) {
        core::Buffer field;
        auto ec = field_at(in, at, 1, field);
        if (!ec) {
          v = Value{std::move(field)};
        }
        return ec;
      });
    case type_code::int8:
      return unpack_scalars(item, 1, out, step, [&](std::size_t at, Value& v) {
        std::int8_t raw = 0;
        auto ec = in.read_int8(at, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::uint8:
      return unpack_scalars(item, 1, out, step, [&](std::size_t at, Value& v) {
        std::uint8_t raw = 0;
        auto ec = in.read_uint8(at, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::boolean:
      return unpack_scalars(item, 1, out, step, [&](std::size_t at, Value& v) {
        std::uint8_t raw = 0;
        auto ec = in.read_uint8(at, raw);
        v = Value{raw != 0};
        return ec;
      });
    case type_code::int16:
      return unpack_scalars(item, 2, out, step, [&](std::size_t at, Value& v) {
        std::int16_t raw = 0;
        auto ec = in.read_int16(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::uint16:
      return unpack_scalars(item, 2, out, step, [&](std::size_t at, Value& v) {
        std::uint16_t raw = 0;
        auto ec = in.read_uint16(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::int32:
    case type_code::long32:
      return unpack_scalars(item, 4, out, step, [&](std::size_t at, Value& v) {
        std::int32_t raw = 0;
        auto ec = in.read_int32(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::uint32:
    case type_code::ulong32:
      return unpack_scalars(item, 4, out, step, [&](std::size_t at, Value& v) {
        std::uint32_t raw = 0;
        auto ec = in.read_uint32(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::int64:
      return unpack_scalars(item, 8, out, step, [&](std::size_t at, Value& v) {
        std::int64_t raw = 0;
        auto ec = in.read_int64(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::uint64:
      return unpack_scalars(item, 8, out, step, [&](std::size_t at, Value& v) {
        std::uint64_t raw = 0;
        auto ec = in.read_uint64(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::float16:
      return unpack_scalars(item, 2, out, step, [&](std::size_t at, Value& v) {
        double raw = 0.0;
        auto ec = in.read_float16(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::float32:
      return unpack_scalars(item, 4, out, step, [&](std::size_t at, Value& v) {
        float raw = 0.0F;
        auto ec = in.read_float32(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::float64:
      return unpack_scalars(item, 8, out, step, [&](std::size_t at, Value& v) {
        double raw = 0.0;
        auto ec = in.read_float64(at, le, raw);
        v = Value{raw};
        return ec;
      });
    case type_code::string:
      return unpack_string(in, item, out, step);
    case type_code::pascal:
      return unpack_pascal(in, item, out, step);
  }
  return make_error_code(errc::unknown_format);
}

}  // namespace structbuf::pack
