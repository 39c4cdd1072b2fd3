#include "structbuf/pack/pack.hpp"

#include "structbuf/pack/codec.hpp"

#include "core/logger.hpp"

#include <utility>

namespace structbuf::pack {
namespace {

/*
 * 驱动层的执行模型：
 * - 先解析格式串、计算总长度并检查 Buffer 容量（失败时不触碰 Buffer）；
 * - 再按格式项顺序调用 codec：offset 为唯一游标，vals 以“剩余视图”的形式向后推进；
 * - 任一格式项失败即终止，已写入的字节保留（pack 不做回滚）。
 */

[[nodiscard]] std::string item_text(const FormatItem& item) {
  std::string out = std::to_string(item.repeat);
  out.push_back(static_cast<char>(item.code));
  return out;
}

[[nodiscard]] std::string capacity_message(std::size_t required, std::size_t actual) {
  return "buffer too small: need " + std::to_string(required) + " bytes, got " + std::to_string(actual);
}

// 计算 required 并检查 actual 是否足够；失败时填充 ec / message。
bool check_capacity(const Format& format,
                    std::size_t actual,
                    std::size_t& required,
                    std::error_code& ec,
                    std::string& message) {
  ec = calc_size(format.items, required);
  if (ec) {
    message = "format length overflows size_t";
    return false;
  }
  if (actual < required) {
    ec = make_error_code(errc::buffer_too_small);
    message = capacity_message(required, actual);
    return false;
  }
  return true;
}

[[nodiscard]] std::string pack_failure_message(const std::error_code& ec,
                                               const FormatItem& item,
                                               std::span<const Value> vals,
                                               const CodecStep& step,
                                               std::size_t first_value) {
  if (ec == errc::not_enough_values) {
    return "not enough values for format item '" + item_text(item) + "' (" +
           std::to_string(first_value + step.consumed) + " consumed)";
  }
  if (ec == errc::invalid_argument) {
    const auto index = first_value + step.consumed;
    std::string message = "invalid value #" + std::to_string(index) + " for format item '" + item_text(item) + "'";
    if (index < vals.size()) {
      message += ": " + to_string(vals[index]);
    }
    return message;
  }
  if (ec == errc::unknown_format) {
    return "unknown format: " + item_text(item);
  }
  return "format item '" + item_text(item) + "' failed: " + ec.message();
}

std::error_code run_pack(core::Buffer& buf,
                         const Format& format,
                         std::span<const Value> vals,
                         PackResult& result) {
  std::size_t offset = 0;
  std::size_t next_value = 0;
  for (const auto& item : format.items) {
    CodecStep step;
    auto ec = pack_item(buf, format.little_endian, item, vals.subspan(next_value), offset, step);
    if (ec) {
      result.written = step.offset;
      result.error_message = pack_failure_message(ec, item, vals, step, next_value);
      return ec;
    }
    offset = step.offset;
    next_value += step.consumed;
  }
  result.written = offset;
  if (next_value < vals.size()) {
    core::detail::logger().debug("pack: {} trailing value(s) ignored", vals.size() - next_value);
  }
  return {};
}

std::error_code run_unpack(const core::Buffer& buf,
                           const Format& format,
                           std::vector<Value>& out,
                           std::string& message) {
  std::size_t offset = 0;
  for (const auto& item : format.items) {
    CodecStep step;
    auto ec = unpack_item(buf, format.little_endian, item, offset, out, step);
    if (ec) {
      if (ec == errc::unknown_format) {
        message = "unknown format: " + item_text(item);
      } else {
        message = "format item '" + item_text(item) + "' failed: " + ec.message();
      }
      return ec;
    }
    offset = step.offset;
  }
  return {};
}

template <class Result>
void log_failure(std::string_view op, const Result& result) {
  auto& log = core::detail::logger();
  if (result.ec == errc::unknown_format) {
    log.warn("{}: {}", op, result.error_message);
  } else {
    log.debug("{}: {}", op, result.error_message);
  }
}

template <class Result>
Result failed(std::string_view op, std::error_code ec, std::string message) {
  Result result;
  result.ec = ec;
  result.error_message = std::move(message);
  log_failure(op, result);
  return result;
}

}  // namespace

PackResult pack(std::string_view format, std::span<const Value> vals) noexcept {
  auto parsed = parse_format(format);
  if (parsed.ec) {
    return failed<PackResult>("pack", parsed.ec, std::move(parsed.error_message));
  }

  std::size_t required = 0;
  auto ec = calc_size(parsed.format.items, required);
  if (!ec && required > core::kMaxBufferLength) {
    ec = make_error_code(errc::length_overflow);
  }
  if (ec) {
    auto result = failed<PackResult>("pack", ec, "format \"" + std::string(format) + "\" requires too many bytes");
    result.required = required;
    return result;
  }
  return pack_into(core::Buffer::alloc(required), parsed.format, vals);
}

PackResult pack(std::string_view format, std::initializer_list<Value> vals) noexcept {
  return pack(format, std::span<const Value>{vals.begin(), vals.size()});
}

PackResult pack_into(core::Buffer buf, std::string_view format, std::span<const Value> vals) noexcept {
  auto parsed = parse_format(format);
  if (parsed.ec) {
    return failed<PackResult>("pack", parsed.ec, std::move(parsed.error_message));
  }
  return pack_into(std::move(buf), parsed.format, vals);
}

PackResult pack_into(core::Buffer buf, std::string_view format, std::initializer_list<Value> vals) noexcept {
  return pack_into(std::move(buf), format, std::span<const Value>{vals.begin(), vals.size()});
}

PackResult pack_into(core::Buffer buf, const Format& format, std::span<const Value> vals) noexcept {
  PackResult result;
  result.actual = buf.size();
  if (!check_capacity(format, buf.size(), result.required, result.ec, result.error_message)) {
    log_failure("pack", result);
    return result;
  }

  result.ec = run_pack(buf, format, vals, result);
  result.buffer = std::move(buf);
  if (result.ec) {
    log_failure("pack", result);
  }
  return result;
}

UnpackResult unpack(const core::Buffer& buf, std::string_view format) noexcept {
  auto parsed = parse_format(format);
  if (parsed.ec) {
    return failed<UnpackResult>("unpack", parsed.ec, std::move(parsed.error_message));
  }
  return unpack(buf, parsed.format);
}

UnpackResult unpack(const core::Buffer& buf, const Format& format) noexcept {
  UnpackResult result;
  result.actual = buf.size();
  if (!check_capacity(format, buf.size(), result.required, result.ec, result.error_message)) {
    log_failure("unpack", result);
    return result;
  }

  result.ec = run_unpack(buf, format, result.values, result.error_message);
  if (result.ec) {
    log_failure("unpack", result);
  }
  return result;
}

UnpackIterator::UnpackIterator(core::Buffer window, std::string format, std::size_t window_size)
    : window_(std::move(window)), format_(std::move(format)), window_size_(window_size) {
  done_ = (window_size_ == 0 || window_.size() < window_size_);
  if (!done_) {
    load();
  }
}

void UnpackIterator::load() {
  values_.clear();
  auto parsed = parse_format(format_);
  if (parsed.ec) {
    ec_ = parsed.ec;
    done_ = true;
    return;
  }
  std::string message;
  ec_ = run_unpack(window_, parsed.format, values_, message);
  if (ec_) {
    core::detail::logger().warn("iter_unpack: {}", message);
    values_.clear();
    done_ = true;
  }
}

UnpackIterator& UnpackIterator::operator++() {
  if (done_) {
    return *this;
  }
  window_ = window_.subarray(window_size_);
  if (window_.size() < window_size_) {
    values_.clear();
    done_ = true;
    return *this;
  }
  load();
  return *this;
}

UnpackRange::UnpackRange(core::Buffer buf, std::string format, std::size_t window_size)
    : buf_(std::move(buf)), format_(std::move(format)), window_size_(window_size) {}

UnpackIterator UnpackRange::begin() const {
  return UnpackIterator(buf_, format_, window_size_);
}

std::size_t UnpackRange::size() const noexcept {
  if (window_size_ == 0) {
    return 0;
  }
  return buf_.size() / window_size_;
}

IterUnpackResult iter_unpack(const core::Buffer& buf, std::string_view format) noexcept {
  auto parsed = parse_format(format);
  if (parsed.ec) {
    return failed<IterUnpackResult>("iter_unpack", parsed.ec, std::move(parsed.error_message));
  }

  IterUnpackResult result;
  result.actual = buf.size();
  if (!check_capacity(parsed.format, buf.size(), result.required, result.ec, result.error_message)) {
    log_failure("iter_unpack", result);
    return result;
  }
  if (result.required == 0) {
    result.ec = make_error_code(errc::invalid_format);
    result.error_message = "cannot iteratively unpack with a zero-length format \"" + std::string(format) + "\"";
    log_failure("iter_unpack", result);
    return result;
  }

  result.range = UnpackRange(buf, std::string(format), result.required);
  return result;
}

}  // namespace structbuf::pack
