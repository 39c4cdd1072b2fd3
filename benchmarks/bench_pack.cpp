#include "bench_main.hpp"
#include "structbuf/core/buffer.hpp"
#include "structbuf/pack/format.hpp"
#include "structbuf/pack/pack.hpp"

#include <cstdint>
#include <vector>

using namespace structbuf;
using namespace structbuf::pack;

namespace {

constexpr const char *kRecordFormat = "<hHiIqd8s";
constexpr std::size_t kRecordSize = 2 + 2 + 4 + 4 + 8 + 8 + 8;

std::vector<Value> record_values() {
    return {-2, 65000u, -70000, 4000000000u, std::int64_t{-1}, 2.5, "record"};
}

} // namespace

static void bench_parse_format() {
    constexpr std::size_t ops = 100'000;
    std::size_t sink = 0;

    BENCH_RUN("Format: parse \"<hHiIqd8s\" x 100k", 0, ops, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            sink += parse_format(kRecordFormat).format.items.size();
        }
    });
    if (sink == 0) {
        std::cerr << "parse_format produced no items\n";
    }
}

static void bench_pack_alloc() {
    // 每次调用都分配新的 Buffer
    constexpr std::size_t ops = 100'000;
    const auto vals = record_values();

    BENCH_RUN("Pack: pack() record x 100k", kRecordSize * ops, ops, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            auto r = pack::pack(kRecordFormat, vals);
            if (r.ec) {
                std::cerr << "pack failed: " << r.error_message << "\n";
                break;
            }
        }
    });
}

static void bench_pack_into_reuse() {
    // 复用同一 Buffer，只衡量编码本身
    constexpr std::size_t ops = 100'000;
    const auto vals = record_values();
    auto buf = core::Buffer::alloc(kRecordSize);

    BENCH_RUN("Pack: pack_into() record x 100k", kRecordSize * ops, ops, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            auto r = pack_into(buf, kRecordFormat, vals);
            if (r.ec) {
                std::cerr << "pack_into failed: " << r.error_message << "\n";
                break;
            }
        }
    });
}

static void bench_unpack() {
    constexpr std::size_t ops = 100'000;
    const auto packed = pack::pack(kRecordFormat, record_values()).buffer;

    BENCH_RUN("Unpack: unpack() record x 100k", kRecordSize * ops, ops, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            auto r = unpack(packed, kRecordFormat);
            if (r.ec) {
                std::cerr << "unpack failed: " << r.error_message << "\n";
                break;
            }
        }
    });
}

static void bench_iter_unpack() {
    // 1MB 连续记录，按 8 字节窗口迭代
    constexpr std::size_t total_size = 1024 * 1024;
    constexpr std::size_t window = 8;
    auto buf = core::Buffer::alloc(total_size);
    buf.fill(0x5A);

    BENCH_RUN("Unpack: iter_unpack() \"<HHI\" over 1MB", total_size, total_size / window, 3, {
        auto r = iter_unpack(buf, "<HHI");
        if (r.ec) {
            std::cerr << "iter_unpack failed: " << r.error_message << "\n";
            return;
        }
        std::size_t windows = 0;
        for (const auto &values : r.range) {
            windows += values.empty() ? 0 : 1;
        }
        if (windows != total_size / window) {
            std::cerr << "iter_unpack produced " << windows << " windows\n";
        }
    });
}

static void bench_buffer_u32_roundtrip() {
    constexpr std::size_t total_size = 4 * 1024 * 1024;
    constexpr std::size_t ops = total_size / 4;
    auto buf = core::Buffer::alloc(total_size);

    BENCH_RUN("Buffer: write/read uint32 (4MB)", total_size, ops * 2, 3, {
        for (std::size_t i = 0; i < ops; ++i) {
            (void)buf.write_uint32(i * 4, (i & 1u) != 0, static_cast<std::uint32_t>(i));
        }
        std::uint32_t sum = 0;
        for (std::size_t i = 0; i < ops; ++i) {
            std::uint32_t v = 0;
            if (buf.read_uint32(i * 4, (i & 1u) != 0, v)) {
                break;
            }
            sum += v;
        }
        if (sum == 0) {
            std::cerr << "unexpected zero checksum\n";
        }
    });
}

int main() {
    bench_parse_format();
    bench_pack_alloc();
    bench_pack_into_reuse();
    bench_unpack();
    bench_iter_unpack();
    bench_buffer_u32_roundtrip();

    structbuf::benchmarks::print_results();
    return 0;
}
