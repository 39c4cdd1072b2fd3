#include "structbuf/core/common.hpp"
#include "structbuf/pack/error.hpp"
#include "structbuf/pack/format.hpp"

#include "test_main.hpp"

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <vector>

namespace {

using structbuf::pack::calc_size;
using structbuf::pack::errc;
using structbuf::pack::Format;
using structbuf::pack::FormatItem;
using structbuf::pack::make_error_code;
using structbuf::pack::parse_format;
using structbuf::pack::type_code;

std::size_t size_of(std::string_view format) {
  std::size_t n = 0;
  TEST_EXPECT_OK(calc_size(format, n));
  return n;
}

void test_parse_basic_items() {
  const auto r = parse_format("!bbbx5sbbb");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT(!r.format.little_endian);
  const std::vector<FormatItem> expected{
    {1, type_code::int8},
    {1, type_code::int8},
    {1, type_code::int8},
    {1, type_code::pad},
    {5, type_code::string},
    {1, type_code::int8},
    {1, type_code::int8},
    {1, type_code::int8},
  };
  TEST_EXPECT(r.format.items == expected);
}

void test_parse_repeat_counts() {
  const auto r = parse_format("<10H0i3d");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT(r.format.little_endian);
  const std::vector<FormatItem> expected{
    {10, type_code::uint16},
    {0, type_code::int32},
    {3, type_code::float64},
  };
  TEST_EXPECT(r.format.items == expected);

  // 前导 0 不影响数值。
  const auto padded = parse_format("007c");
  TEST_EXPECT_OK(padded.ec);
  TEST_EXPECT(padded.format.items == (std::vector<FormatItem>{{7, type_code::character}}));
}

void test_byte_order_prefixes() {
  TEST_EXPECT(parse_format("<h").format.little_endian);
  TEST_EXPECT(!parse_format(">h").format.little_endian);
  TEST_EXPECT(!parse_format("!h").format.little_endian);
  TEST_EXPECT_EQ(parse_format("=h").format.little_endian, structbuf::core::kNativeLittleEndian);
  TEST_EXPECT_EQ(parse_format("@h").format.little_endian, structbuf::core::kNativeLittleEndian);
  TEST_EXPECT_EQ(parse_format("h").format.little_endian, structbuf::core::kNativeLittleEndian);

  // 前缀只在首字符处有效。
  TEST_EXPECT_EC(parse_format("h<h").ec, errc::invalid_format);
  TEST_EXPECT_EC(parse_format("<<h").ec, errc::invalid_format);
}

void test_every_type_code_accepted() {
  const auto r = parse_format("xcbB?hHiIlLqQefdsp");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT_EQ(r.format.items.size(), 18u);
  std::string echoed;
  for (const auto& item : r.format.items) {
    TEST_EXPECT_EQ(item.repeat, 1u);
    echoed.push_back(static_cast<char>(item.code));
  }
  TEST_EXPECT_EQ(echoed, "xcbB?hHiIlLqQefdsp");
}

void test_pascal_repeat_clamped() {
  const auto r = parse_format("256p");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT(r.format.items == (std::vector<FormatItem>{{255, type_code::pascal}}));

  const auto s = parse_format("256s");
  TEST_EXPECT(s.format.items == (std::vector<FormatItem>{{256, type_code::string}}));
  TEST_EXPECT_EQ(size_of("256p"), 255u);

  // 超出 size_t 的位数同样截断，其他类型码仍视为非法。
  const auto huge = parse_format("99999999999999999999p");
  TEST_EXPECT_OK(huge.ec);
  TEST_EXPECT(huge.format.items == (std::vector<FormatItem>{{255, type_code::pascal}}));
  TEST_EXPECT_EC(parse_format("99999999999999999999s").ec, errc::invalid_format);
}

void test_parse_errors() {
  TEST_EXPECT_EC(parse_format("").ec, errc::invalid_format);
  TEST_EXPECT_EC(parse_format("<").ec, errc::invalid_format);
  TEST_EXPECT_EC(parse_format("3").ec, errc::invalid_format);
  TEST_EXPECT_EC(parse_format("hz").ec, errc::invalid_format);
  TEST_EXPECT_EC(parse_format("h h").ec, errc::invalid_format);
  TEST_EXPECT_EC(parse_format("99999999999999999999999999h").ec, errc::invalid_format);

  const auto r = parse_format("!bz");
  TEST_EXPECT(r.format.items.empty());
  TEST_EXPECT_EQ(r.error_message, "invalid format \"!bz\": unexpected character 'z'");

  TEST_EXPECT_EQ(parse_format("!").error_message, "invalid format \"!\": no type codes");
  TEST_EXPECT_EQ(parse_format("h12").error_message, "invalid format \"h12\": repeat count without type code");
}

void test_parse_is_pure() {
  const auto a = parse_format("<qh6xq");
  const auto b = parse_format("<qh6xq");
  TEST_EXPECT_OK(a.ec);
  TEST_EXPECT(a.format == b.format);
}

void test_calc_size() {
  TEST_EXPECT_EQ(size_of("!bhl"), 7u);
  TEST_EXPECT_EQ(size_of("<qh6xq"), 24u);
  TEST_EXPECT_EQ(size_of("!bbbx5sbbb"), 12u);
  TEST_EXPECT_EQ(size_of("<i"), 4u);
  TEST_EXPECT_EQ(size_of("?e"), 3u);
  TEST_EXPECT_EQ(size_of("10s"), 10u);
  TEST_EXPECT_EQ(size_of("0s0p0x"), 0u);
  TEST_EXPECT_EQ(size_of("2Q3f"), 28u);

  std::size_t n = 99;
  TEST_EXPECT_OK(calc_size(std::span<const FormatItem>{}, n));
  TEST_EXPECT_EQ(n, 0u);

  TEST_EXPECT_EC(calc_size("<", n), errc::invalid_format);
}

void test_calc_size_overflow() {
  const std::vector<FormatItem> items{
    {std::numeric_limits<std::size_t>::max() / 4, type_code::float64},
  };
  std::size_t n = 0;
  TEST_EXPECT_EC(calc_size(items, n), errc::length_overflow);

  const std::vector<FormatItem> sum{
    {std::numeric_limits<std::size_t>::max(), type_code::pad},
    {1, type_code::pad},
  };
  TEST_EXPECT_EC(calc_size(sum, n), errc::length_overflow);
}

void test_element_width() {
  TEST_EXPECT_EQ(structbuf::pack::element_width(type_code::boolean), 1u);
  TEST_EXPECT_EQ(structbuf::pack::element_width(type_code::float16), 2u);
  TEST_EXPECT_EQ(structbuf::pack::element_width(type_code::ulong32), 4u);
  TEST_EXPECT_EQ(structbuf::pack::element_width(type_code::uint64), 8u);
  TEST_EXPECT_EQ(structbuf::pack::element_width(type_code::string), 1u);
  TEST_EXPECT_EQ(structbuf::pack::element_width(static_cast<type_code>('z')), 0u);

  type_code code{};
  TEST_EXPECT(structbuf::pack::to_type_code('L', code));
  TEST_EXPECT(code == type_code::ulong32);
  TEST_EXPECT(!structbuf::pack::to_type_code('n', code));
}

}  // namespace

int main() {
  test_parse_basic_items();
  test_parse_repeat_counts();
  test_byte_order_prefixes();
  test_every_type_code_accepted();
  test_pascal_repeat_clamped();
  test_parse_errors();
  test_parse_is_pure();
  test_calc_size();
  test_calc_size_overflow();
  test_element_width();
  return ::structbuf::tests::run_and_report();
}
