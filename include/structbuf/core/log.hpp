#pragma once

#include <cstdint>

namespace structbuf::core {

/**
 * @brief 日志级别（控制库内 "structbuf" spdlog logger）。
 *
 * 说明：
 * - 库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 业务侧可通过 set_log_level 调整本库 logger 的级别，
 *   也可以用 spdlog::get("structbuf") 取得 logger 自行配置 sink/pattern。
 * - 默认级别为 warn：成功路径不输出任何日志。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

inline constexpr const char *kLoggerName = "structbuf";

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace structbuf::core
