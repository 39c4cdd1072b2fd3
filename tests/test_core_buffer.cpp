#include "structbuf/core/buffer.hpp"
#include "structbuf/core/error.hpp"

#include "test_main.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace {

using structbuf::core::Buffer;
using structbuf::core::byte;
using structbuf::core::bytes_view;
using structbuf::core::errc;
using structbuf::core::make_error_code;

bytes_view as_bytes(std::string_view s) {
  return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
}

std::string_view as_text(const Buffer& buf) {
  return std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size());
}

void test_alloc_zero_filled() {
  auto buf = Buffer::alloc(4);
  TEST_EXPECT_EQ(buf.size(), 4u);
  TEST_EXPECT(!buf.empty());
  for (std::size_t i = 0; i < buf.size(); ++i) {
    TEST_EXPECT_EQ(buf[i], 0u);
  }

  auto empty = Buffer::alloc(0);
  TEST_EXPECT(empty.empty());
  TEST_EXPECT(empty.bytes().empty());

  Buffer def;
  TEST_EXPECT(def.empty());
  TEST_EXPECT(def.data() == nullptr);
}

void test_from_copies() {
  std::vector<byte> src{1, 2, 3};
  auto buf = Buffer::from(bytes_view{src.data(), src.size()});
  src[0] = 9;
  TEST_EXPECT_EQ(buf[0], 1u);
  TEST_EXPECT_EQ(buf.to_vector(), (std::vector<byte>{1, 2, 3}));

  auto text = Buffer::from(std::string_view("test"));
  TEST_EXPECT_EQ(as_text(text), "test");
}

void test_subarray_shares_storage() {
  auto buf = Buffer::from(std::string_view("abcdef"));
  auto view = buf.subarray(2, 4);
  TEST_EXPECT_EQ(as_text(view), "cd");

  view[0] = static_cast<byte>('X');
  TEST_EXPECT_EQ(as_text(buf), "abXdef");

  // 视图的视图仍指向同一存储。
  auto nested = buf.subarray(1).subarray(1, 2);
  TEST_EXPECT_EQ(as_text(nested), "X");
}

void test_subarray_clamps() {
  auto buf = Buffer::from(std::string_view("abc"));
  TEST_EXPECT_EQ(as_text(buf.subarray(1)), "bc");
  TEST_EXPECT_EQ(as_text(buf.subarray(1, 100)), "bc");
  TEST_EXPECT(buf.subarray(5).empty());
  TEST_EXPECT(buf.subarray(2, 1).empty());
  TEST_EXPECT(buf.subarray(3).empty());
}

void test_copy_truncates_to_target() {
  auto src = Buffer::from(std::string_view("hello"));
  auto dst = Buffer::alloc(3);
  TEST_EXPECT_EQ(src.copy(dst), 3u);
  TEST_EXPECT_EQ(as_text(dst), "hel");

  auto dst2 = Buffer::alloc(6);
  TEST_EXPECT_EQ(src.copy(dst2, 2, 1, 3), 2u);
  TEST_EXPECT_EQ(dst2.to_vector(), (std::vector<byte>{0, 0, 'e', 'l', 0, 0}));

  TEST_EXPECT_EQ(src.copy(dst2, 6), 0u);
  TEST_EXPECT_EQ(src.copy(dst2, 0, 4, 2), 0u);
}

void test_copy_overlapping_views() {
  auto buf = Buffer::from(std::string_view("abcdef"));
  auto tail = buf.subarray(2);
  TEST_EXPECT_EQ(buf.copy(tail, 0, 0, 4), 4u);
  TEST_EXPECT_EQ(as_text(buf), "ababcd");
}

void test_fill_equals_compare() {
  auto a = Buffer::alloc(3);
  a.fill(0x41);
  TEST_EXPECT_EQ(as_text(a), "AAA");
  TEST_EXPECT(a.equals(as_bytes("AAA")));
  TEST_EXPECT(a == Buffer::from(std::string_view("AAA")));
  TEST_EXPECT(a != Buffer::from(std::string_view("AAB")));

  TEST_EXPECT_EQ(a.compare(as_bytes("AAA")), 0);
  TEST_EXPECT_EQ(a.compare(as_bytes("AAB")), -1);
  TEST_EXPECT_EQ(a.compare(as_bytes("AA")), 1);
  TEST_EXPECT_EQ(a.compare(as_bytes("AAAA")), -1);
  TEST_EXPECT_EQ(Buffer{}.compare(bytes_view{}), 0);
}

void test_index_of() {
  auto buf = Buffer::from(std::string_view("abcabc"));
  TEST_EXPECT_EQ(buf.index_of(as_bytes("bc")), 1u);
  TEST_EXPECT_EQ(buf.index_of(as_bytes("bc"), 2), 4u);
  TEST_EXPECT_EQ(buf.index_of(as_bytes("cd")), Buffer::npos);
  TEST_EXPECT_EQ(buf.index_of(as_bytes("abcabcx")), Buffer::npos);
  TEST_EXPECT_EQ(buf.index_of(as_bytes(""), 3), 3u);
  TEST_EXPECT_EQ(buf.index_of(as_bytes("a"), 10), Buffer::npos);
}

void test_integer_byte_order() {
  auto buf = Buffer::alloc(8);
  TEST_EXPECT_OK(buf.write_uint32(0, false, 0x01020304u));
  TEST_EXPECT_OK(buf.write_uint32(4, true, 0x01020304u));
  TEST_EXPECT_EQ(buf.to_vector(), (std::vector<byte>{1, 2, 3, 4, 4, 3, 2, 1}));

  std::uint32_t be = 0;
  std::uint32_t le = 0;
  TEST_EXPECT_OK(buf.read_uint32(0, false, be));
  TEST_EXPECT_OK(buf.read_uint32(4, true, le));
  TEST_EXPECT_EQ(be, 0x01020304u);
  TEST_EXPECT_EQ(le, 0x01020304u);

  std::uint16_t u16 = 0;
  TEST_EXPECT_OK(buf.read_uint16(0, true, u16));
  TEST_EXPECT_EQ(u16, 0x0201u);
}

void test_signed_integers() {
  auto buf = Buffer::alloc(15);
  TEST_EXPECT_OK(buf.write_int8(0, -2));
  TEST_EXPECT_OK(buf.write_int16(1, false, -2));
  TEST_EXPECT_OK(buf.write_int32(3, true, -2));
  TEST_EXPECT_OK(buf.write_int64(7, false, std::numeric_limits<std::int64_t>::min()));

  TEST_EXPECT_EQ(buf[0], 0xFEu);
  TEST_EXPECT_EQ(buf[1], 0xFFu);
  TEST_EXPECT_EQ(buf[2], 0xFEu);
  TEST_EXPECT_EQ(buf[3], 0xFEu);
  TEST_EXPECT_EQ(buf[6], 0xFFu);
  TEST_EXPECT_EQ(buf[7], 0x80u);

  std::int8_t i8 = 0;
  std::int16_t i16 = 0;
  std::int32_t i32 = 0;
  std::int64_t i64 = 0;
  TEST_EXPECT_OK(buf.read_int8(0, i8));
  TEST_EXPECT_OK(buf.read_int16(1, false, i16));
  TEST_EXPECT_OK(buf.read_int32(3, true, i32));
  TEST_EXPECT_OK(buf.read_int64(7, false, i64));
  TEST_EXPECT_EQ(i8, -2);
  TEST_EXPECT_EQ(i16, -2);
  TEST_EXPECT_EQ(i32, -2);
  TEST_EXPECT_EQ(i64, std::numeric_limits<std::int64_t>::min());

  std::uint64_t u64 = 0;
  TEST_EXPECT_OK(buf.read_uint64(7, false, u64));
  TEST_EXPECT_EQ(u64, 0x8000000000000000ull);
}

void test_floats() {
  auto buf = Buffer::alloc(14);
  TEST_EXPECT_OK(buf.write_float16(0, false, 1.0));
  TEST_EXPECT_OK(buf.write_float32(2, false, 1.5F));
  TEST_EXPECT_OK(buf.write_float64(6, true, -0.25));

  TEST_EXPECT_EQ(buf[0], 0x3Cu);
  TEST_EXPECT_EQ(buf[1], 0x00u);
  TEST_EXPECT_EQ(buf[2], 0x3Fu);
  TEST_EXPECT_EQ(buf[3], 0xC0u);
  TEST_EXPECT_EQ(buf[13], 0xBFu);

  double h = 0.0;
  float f = 0.0F;
  double d = 0.0;
  TEST_EXPECT_OK(buf.read_float16(0, false, h));
  TEST_EXPECT_OK(buf.read_float32(2, false, f));
  TEST_EXPECT_OK(buf.read_float64(6, true, d));
  TEST_EXPECT_EQ(h, 1.0);
  TEST_EXPECT_EQ(f, 1.5F);
  TEST_EXPECT_EQ(d, -0.25);
}

void test_out_of_range() {
  auto buf = Buffer::alloc(3);
  std::uint32_t u32 = 0;
  TEST_EXPECT_EQ(buf.read_uint32(0, false, u32), make_error_code(errc::out_of_range));
  TEST_EXPECT_EQ(buf.write_uint16(2, true, 1), make_error_code(errc::out_of_range));
  TEST_EXPECT_EQ(buf.write_uint8(3, 1), make_error_code(errc::out_of_range));
  TEST_EXPECT_EQ(buf.write_uint8(std::numeric_limits<std::size_t>::max(), 1),
                 make_error_code(errc::out_of_range));
  TEST_EXPECT_OK(buf.write_uint16(1, true, 0xABCD));
  // 越界写入不应改动任何字节。
  TEST_EXPECT_EQ(buf.to_vector(), (std::vector<byte>{0, 0xCD, 0xAB}));
}

void test_copy_semantics_share_view() {
  auto a = Buffer::alloc(2);
  Buffer b = a;
  b[0] = 7;
  TEST_EXPECT_EQ(a[0], 7u);
}

}  // namespace

int main() {
  test_alloc_zero_filled();
  test_from_copies();
  test_subarray_shares_storage();
  test_subarray_clamps();
  test_copy_truncates_to_target();
  test_copy_overlapping_views();
  test_fill_equals_compare();
  test_index_of();
  test_integer_byte_order();
  test_signed_integers();
  test_floats();
  test_out_of_range();
  test_copy_semantics_share_view();
  return ::structbuf::tests::run_and_report();
}
