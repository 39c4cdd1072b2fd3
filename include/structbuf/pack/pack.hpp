#pragma once

#include "structbuf/core/buffer.hpp"
#include "structbuf/pack/error.hpp"
#include "structbuf/pack/format.hpp"
#include "structbuf/pack/value.hpp"

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace structbuf::pack {

/**
 * @brief pack / pack_into 的结果。
 *
 * 成功时 buffer 为写入后的 Buffer（pack_into 时与传入的是同一存储）。
 * 失败时：
 * - ec 为具体错误码，error_message 给出可读描述（含出错的格式项）；
 * - errc::buffer_too_small 时 required / actual 分别为需要与实际的字节数；
 * - errc::not_enough_values 等写入中途的失败，written 为失败前已写到的偏移
 *   （这些字节已经落到 buffer 中，不会回滚）。
 */
struct PackResult {
  core::Buffer buffer;
  std::error_code ec;
  std::size_t required{0};
  std::size_t actual{0};
  std::size_t written{0};
  std::string error_message;
};

struct UnpackResult {
  std::vector<Value> values;
  std::error_code ec;
  std::size_t required{0};
  std::size_t actual{0};
  std::string error_message;
};

/**
 * @brief 按格式串把 vals 打包进一个新分配的 Buffer（长度恰为 calc_size(format)）。
 *
 * 字段按格式项顺序紧密排列，不插入任何对齐填充（需要填充时显式使用 'x'）。
 * 多余的值被忽略。
 */
[[nodiscard]] PackResult pack(std::string_view format, std::span<const Value> vals) noexcept;
[[nodiscard]] PackResult pack(std::string_view format, std::initializer_list<Value> vals) noexcept;

/**
 * @brief 按格式串把 vals 写入调用方提供的 buf（从 buf 的偏移 0 开始，原地修改）。
 *
 * buf 短于格式要求时直接失败，不写入任何字节。
 * 值不足时在中途失败：之前的字段已经写入 buf。
 * 写入到某个偏移处可先取视图：pack_into(buf.subarray(n), ...)。
 */
[[nodiscard]] PackResult pack_into(core::Buffer buf, std::string_view format, std::span<const Value> vals) noexcept;
[[nodiscard]] PackResult pack_into(core::Buffer buf, std::string_view format, std::initializer_list<Value> vals) noexcept;

// 使用已解析的 Format（避免重复解析，或用于测试手工构造的格式项）。
[[nodiscard]] PackResult pack_into(core::Buffer buf, const Format& format, std::span<const Value> vals) noexcept;

/**
 * @brief 按格式串从 buf 头部解包。
 *
 * 结果总是值序列，即便只有一个元素。
 * 'c' / 's' / 'p' 的结果是 buf 的视图（共享存储）。
 */
[[nodiscard]] UnpackResult unpack(const core::Buffer& buf, std::string_view format) noexcept;
[[nodiscard]] UnpackResult unpack(const core::Buffer& buf, const Format& format) noexcept;

/**
 * @brief iter_unpack 的迭代器：每一步在当前窗口上做一次完整的 unpack。
 *
 * 每次前进都会重新解析格式串，并在原 Buffer 上重新取下一段视图（不修改原 Buffer）。
 * 剩余长度小于一个窗口时结束，余下字节被丢弃。
 */
class UnpackIterator final {
 public:
  using iterator_category = std::input_iterator_tag;
  using value_type = std::vector<Value>;
  using difference_type = std::ptrdiff_t;
  using reference = const value_type&;
  using pointer = const value_type*;

  UnpackIterator() = default;
  UnpackIterator(core::Buffer window, std::string format, std::size_t window_size);

  [[nodiscard]] reference operator*() const noexcept { return values_; }
  [[nodiscard]] pointer operator->() const noexcept { return &values_; }

  UnpackIterator& operator++();
  void operator++(int) { ++*this; }

  // 中途解包失败时迭代提前结束，错误可由此取得（正常情况下总为空）。
  [[nodiscard]] std::error_code error() const noexcept { return ec_; }

  friend bool operator==(const UnpackIterator& it, std::default_sentinel_t) noexcept { return it.done_; }

 private:
  void load();

  core::Buffer window_;
  std::string format_;
  std::size_t window_size_{0};
  std::vector<Value> values_;
  std::error_code ec_;
  bool done_{true};
};

/**
 * @brief iter_unpack 返回的惰性序列（可重复遍历：每次 begin() 都从 Buffer 起点重新开始）。
 */
class UnpackRange final {
 public:
  UnpackRange() = default;
  UnpackRange(core::Buffer buf, std::string format, std::size_t window_size);

  [[nodiscard]] UnpackIterator begin() const;
  [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

  [[nodiscard]] std::size_t window_size() const noexcept { return window_size_; }
  // 将产出的元素个数：floor(buf.size() / window_size)。
  [[nodiscard]] std::size_t size() const noexcept;

 private:
  core::Buffer buf_;
  std::string format_;
  std::size_t window_size_{0};
};

struct IterUnpackResult {
  UnpackRange range;
  std::error_code ec;
  std::size_t required{0};
  std::size_t actual{0};
  std::string error_message;
};

/**
 * @brief 以 calc_size(format) 为窗口，依次解包 buf 的每个窗口。
 *
 * Buffer 长度与格式串在返回前一次性检查（长度不足一个窗口即失败）。
 * 窗口长度为 0 的格式串（如 "0x"）无法推进，返回 errc::invalid_format。
 */
[[nodiscard]] IterUnpackResult iter_unpack(const core::Buffer& buf, std::string_view format) noexcept;

}  // namespace structbuf::pack
