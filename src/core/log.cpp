#include "structbuf/core/log.hpp"

#include "core/logger.hpp"

#include <mutex>

namespace structbuf::core {
namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    case spdlog::level::off:
        return LogLevel::off;
    default:
        return LogLevel::off;
    }
}

std::shared_ptr<spdlog::logger> make_logger() {
    // 业务侧可能已自行注册同名 logger：优先复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::default_logger()->clone(kLoggerName);
    created->set_level(spdlog::level::warn);
    try {
        spdlog::register_logger(created);
    } catch (const spdlog::spdlog_ex &) {
        // get 与 register 之间被其他线程抢先注册了同名 logger：改用已注册的那个。
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
    }
    return created;
}

} // namespace

namespace detail {

spdlog::logger &logger() noexcept {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] { instance = make_logger(); });
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    detail::logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger().level()); }

} // namespace structbuf::core
