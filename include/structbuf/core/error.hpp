#pragma once

#include <system_error>

namespace structbuf::core {

/**
 * @brief core 模块通用错误码（Buffer / 编码转换等基础设施复用）。
 *
 * 约定：
 * - 本库所有接口优先返回 std::error_code，避免异常路径；
 * - out_of_range：按偏移读写时越过 Buffer 末尾；
 * - invalid_argument：输入内容非法（例如非法 hex / base64 字符）。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  out_of_range = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace structbuf::core

namespace std {
template <>
struct is_error_code_enum<structbuf::core::errc> : true_type {};
}  // namespace std
