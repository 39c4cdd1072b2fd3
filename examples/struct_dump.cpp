/**
 * @file struct_dump.cpp
 * @brief 按格式串解析一段十六进制字节，逐窗口输出字段值
 *
 * 典型用途：
 * - 从抓包/日志里复制一段十六进制字符串，按已知的结构体布局查看字段；
 * - 字节流由若干条等长记录组成时，一次性列出每条记录。
 *
 * 运行：
 * - ./build/examples/struct_dump "<format>" "<hex>" [--dump] [--verbose]
 *   例：./build/examples/struct_dump "!BB" "01 fe 01 fe"
 */

#include <structbuf/core/buffer.hpp>
#include <structbuf/core/log.hpp>
#include <structbuf/pack/pack.hpp>
#include <structbuf/utils/hex.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace structbuf;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << " \"<format>\" \"<hex>\" [--dump] [--verbose]\n";
    std::cout << "\n";
    std::cout << "format 语法: [@=<>!]? (<count>?[xcbB?hHiIlLqQefdsp])+\n";
}

void print_values(std::size_t index, const std::vector<pack::Value> &values) {
    std::cout << "[" << index << "] (";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i != 0) {
            std::cout << ", ";
        }
        std::cout << pack::to_string(values[i]);
    }
    std::cout << ")\n";
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    if (has_flag(argc, argv, "--verbose")) {
        core::set_log_level(core::LogLevel::debug);
    }

    const std::string_view format = argv[1];

    core::Buffer buf;
    if (auto ec = utils::parse_hex(argv[2], buf); ec) {
        std::cerr << "hex 解析失败: " << ec.message() << "\n";
        return 1;
    }

    if (has_flag(argc, argv, "--dump")) {
        utils::HexDumpOptions opt;
        opt.show_ascii = true;
        opt.max_bytes = 0;
        std::cout << utils::hex_dump(buf.bytes(), opt) << "\n";
    }

    auto r = pack::iter_unpack(buf, format);
    if (r.ec) {
        std::cerr << r.error_message << "\n";
        return 1;
    }

    std::size_t index = 0;
    auto it = r.range.begin();
    for (; it != r.range.end(); ++it) {
        print_values(index++, *it);
    }
    if (it.error()) {
        std::cerr << "第 " << index << " 个窗口解包失败: " << it.error().message() << "\n";
        return 1;
    }

    const auto rest = buf.size() - index * r.range.window_size();
    if (rest != 0) {
        std::cout << "(忽略末尾 " << rest << " 字节)\n";
    }
    return 0;
}
