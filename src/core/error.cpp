#include "structbuf/core/error.hpp"

#include <string>

namespace structbuf::core {
namespace {

// core::errc 的 std::error_category 实现：message() 仅用于调试与日志。
class core_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "structbuf.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::out_of_range:
        return "offset out of range";
      default:
        return "unknown structbuf.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static core_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 structbuf::core
