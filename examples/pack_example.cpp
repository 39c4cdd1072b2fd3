/**
 * @file pack_example.cpp
 * @brief 演示 structbuf::pack 的基本用法：pack -> hexdump -> unpack
 *
 * 示例场景：一条固定布局的传感器记录（大端序，网络字节序）。
 *   >H  设备 ID
 *   B   通道号
 *   ?   是否告警
 *   I   时间戳（秒）
 *   e   温度（半精度）
 *   d   读数
 *   8s  设备名（不足补 0）
 *   6p  单位（Pascal 字符串）
 */

#include <structbuf/core/log.hpp>
#include <structbuf/pack/format.hpp>
#include <structbuf/pack/pack.hpp>
#include <structbuf/utils/hex.hpp>

#include <iostream>
#include <string_view>

using namespace structbuf;

int main() {
    core::set_log_level(core::LogLevel::debug);

    constexpr std::string_view format = ">HB?Ied8s6p";

    std::size_t size = 0;
    if (auto ec = pack::calc_size(format, size); ec) {
        std::cerr << "calc_size failed: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "format " << format << " -> " << size << " bytes\n";

    auto packed = pack::pack(format, {513, 3, true, 1700000000u, 21.5, 0.125, "probe-1", "kPa"});
    if (packed.ec) {
        std::cerr << "pack failed: " << packed.error_message << "\n";
        return 1;
    }

    utils::HexDumpOptions opt;
    opt.show_ascii = true;
    std::cout << utils::hex_dump(packed.buffer.bytes(), opt);

    auto unpacked = pack::unpack(packed.buffer, format);
    if (unpacked.ec) {
        std::cerr << "unpack failed: " << unpacked.error_message << "\n";
        return 1;
    }
    for (const auto &v : unpacked.values) {
        std::cout << "  " << pack::to_string(v) << "\n";
    }

    // 原地写入：只改动记录里的通道号（偏移 2）
    auto r = pack::pack_into(packed.buffer.subarray(2), "B", {7});
    if (r.ec) {
        std::cerr << "pack_into failed: " << r.error_message << "\n";
        return 1;
    }
    std::cout << "after pack_into: " << utils::to_hex(packed.buffer.bytes()) << "\n";

    // 值不足：失败原因在 error_message 中，已写入的字段保留
    auto partial = pack::pack(">HH", {1});
    std::cout << "partial: [" << partial.ec.message() << "] " << partial.error_message << "\n";

    // 等长记录流
    auto windows = pack::iter_unpack(packed.buffer.subarray(0, 4), ">BB");
    if (!windows.ec) {
        for (const auto &values : windows.range) {
            std::cout << "  window: " << pack::to_string(values[0]) << ", " << pack::to_string(values[1]) << "\n";
        }
    }
    return 0;
}
