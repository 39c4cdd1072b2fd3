#include "structbuf/pack/error.hpp"

#include <string>

namespace structbuf::pack {
namespace {

class pack_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "structbuf.pack"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_format:
        return "invalid format string";
      case errc::invalid_argument:
        return "invalid value for format item";
      case errc::buffer_too_small:
        return "buffer too small";
      case errc::not_enough_values:
        return "not enough values";
      case errc::unknown_format:
        return "unknown format code";
      case errc::length_overflow:
        return "packed length overflow";
      default:
        return "unknown structbuf.pack error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static pack_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace structbuf::pack
