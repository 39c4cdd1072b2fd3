#include "structbuf/pack/format.hpp"

#include "structbuf/core/common.hpp"

#include <charconv>
#include <limits>

namespace structbuf::pack {
namespace {

constexpr bool checked_add(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (b > (std::numeric_limits<std::size_t>::max() - a)) {
    return false;
  }
  out = a + b;
  return true;
}

constexpr bool checked_mul(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (a == 0 || b == 0) {
    out = 0;
    return true;
  }
  if (a > (std::numeric_limits<std::size_t>::max() / b)) {
    return false;
  }
  out = a * b;
  return true;
}

[[nodiscard]] bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] bool is_byte_order_prefix(char c) noexcept {
  switch (c) {
    case '@':
    case '=':
    case '<':
    case '>':
    case '!':
      return true;
    default:
      return false;
  }
}

[[nodiscard]] bool resolve_little_endian(char prefix) noexcept {
  switch (prefix) {
    case '<':
      return true;
    case '>':
    case '!':
      return false;
    default:
      return core::kNativeLittleEndian;
  }
}

FormatResult fail(std::string_view format, std::string_view reason) {
  FormatResult result;
  result.ec = make_error_code(errc::invalid_format);
  result.error_message = "invalid format \"";
  result.error_message.append(format);
  result.error_message += "\": ";
  result.error_message.append(reason);
  return result;
}

}  // namespace

bool to_type_code(char c, type_code& out) noexcept {
  switch (c) {
    case 'x':
    case 'c':
    case 'b':
    case 'B':
    case '?':
    case 'h':
    case 'H':
    case 'i':
    case 'I':
    case 'l':
    case 'L':
    case 'q':
    case 'Q':
    case 'e':
    case 'f':
    case 'd':
    case 's':
    case 'p':
      out = static_cast<type_code>(c);
      return true;
    default:
      return false;
  }
}

std::size_t element_width(type_code code) noexcept {
  switch (code) {
    case type_code::pad:
    case type_code::character:
    case type_code::int8:
    case type_code::uint8:
    case type_code::boolean:
    case type_code::string:
    case type_code::pascal:
      return 1;
    case type_code::int16:
    case type_code::uint16:
    case type_code::float16:
      return 2;
    case type_code::int32:
    case type_code::uint32:
    case type_code::long32:
    case type_code::ulong32:
    case type_code::float32:
      return 4;
    case type_code::int64:
    case type_code::uint64:
    case type_code::float64:
      return 8;
  }
  return 0;
}

FormatResult parse_format(std::string_view format) noexcept {
  std::size_t pos = 0;
  char prefix = '\0';
  if (!format.empty() && is_byte_order_prefix(format.front())) {
    prefix = format.front();
    pos = 1;
  }

  FormatResult result;
  result.format.little_endian = resolve_little_endian(prefix);

  while (pos < format.size()) {
    const auto digits_begin = pos;
    while (pos < format.size() && is_digit(format[pos])) {
      ++pos;
    }
    if (pos >= format.size()) {
      return fail(format, "repeat count without type code");
    }

    type_code code{};
    if (!to_type_code(format[pos], code)) {
      return fail(format, std::string("unexpected character '") + format[pos] + "'");
    }

    std::size_t repeat = 1;
    if (pos > digits_begin) {
      const auto* first = format.data() + digits_begin;
      const auto* last = format.data() + pos;
      const auto [ptr, ec] = std::from_chars(first, last, repeat);
      if (ec == std::errc::result_out_of_range && code == type_code::pascal) {
        // 'p' 无论写了多少位数字都截断为 255。
        repeat = kMaxPascalLength;
      } else if (ec != std::errc{} || ptr != last) {
        return fail(format, "repeat count too large");
      }
    }
    if (code == type_code::pascal && repeat > kMaxPascalLength) {
      repeat = kMaxPascalLength;
    }

    result.format.items.push_back(FormatItem{repeat, code});
    ++pos;
  }

  if (result.format.items.empty()) {
    return fail(format, "no type codes");
  }
  return result;
}

std::error_code calc_size(std::span<const FormatItem> items, std::size_t& out_size) noexcept {
  std::size_t total = 0;
  for (const auto& item : items) {
    std::size_t bytes = 0;
    if (!checked_mul(item.repeat, element_width(item.code), bytes)) {
      return make_error_code(errc::length_overflow);
    }
    std::size_t next = 0;
    if (!checked_add(total, bytes, next)) {
      return make_error_code(errc::length_overflow);
    }
    total = next;
  }
  out_size = total;
  return {};
}

std::error_code calc_size(std::string_view format, std::size_t& out_size) noexcept {
  const auto parsed = parse_format(format);
  if (parsed.ec) {
    return parsed.ec;
  }
  return calc_size(parsed.format.items, out_size);
}

}  // namespace structbuf::pack
