#pragma once

// 库内部使用：不随 public headers 安装。

#include <spdlog/spdlog.h>

#include <memory>

namespace structbuf::core::detail {

// 返回本库的命名 logger（首次调用时基于默认 sink 创建并注册）。
[[nodiscard]] spdlog::logger &logger() noexcept;

} // namespace structbuf::core::detail
