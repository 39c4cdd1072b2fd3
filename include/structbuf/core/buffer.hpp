#pragma once

#include "structbuf/core/common.hpp"
#include "structbuf/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <system_error>
#include <vector>

namespace structbuf::core {

// 单个 Buffer 允许的最大长度（与 32 位有符号长度上限一致）。
inline constexpr std::size_t kMaxBufferLength = 0x7FFF'FFFFu;

/**
 * @brief 定长字节数组（共享存储 + 视图模型）。
 *
 * 设计目标：
 * - 长度在创建后固定，内容可变；
 * - subarray() 返回与原 Buffer 共享存储的视图（不拷贝），
 *   对视图的写入对原 Buffer 可见；
 * - 按偏移读写定宽整数/浮点，字节序由调用方显式指定。
 *
 * 注意：
 * - 拷贝 Buffer 对象只复制“视图”（引用计数 +1），不复制字节；
 * - 本类不做线程安全保证。
 */
class Buffer final {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    Buffer() noexcept = default;

    // 分配 size 字节，内容全部置 0。
    [[nodiscard]] static Buffer alloc(std::size_t size);
    [[nodiscard]] static Buffer from(bytes_view bytes);
    [[nodiscard]] static Buffer from(std::string_view text);

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] const byte *data() const noexcept;
    [[nodiscard]] byte *data() noexcept;

    [[nodiscard]] bytes_view bytes() const noexcept;
    [[nodiscard]] mutable_bytes_view mutable_bytes() noexcept;

    // 不做越界检查。
    [[nodiscard]] byte operator[](std::size_t index) const noexcept { return data()[index]; }
    [[nodiscard]] byte &operator[](std::size_t index) noexcept { return data()[index]; }

    /**
     * @brief 返回 [start, end) 区间的视图（共享存储）。
     *
     * start/end 会被截断到 [0, size()]；end < start 时返回空视图。
     */
    [[nodiscard]] Buffer subarray(std::size_t start, std::size_t end = npos) const noexcept;

    /**
     * @brief 将 [source_start, source_end) 拷贝到 target 的 target_start 处。
     *
     * 实际拷贝字节数 = min(源区间长度, target 剩余空间)，返回该值。
     * 源与目标重叠（例如同一存储的两个视图）时结果仍正确。
     */
    std::size_t copy(Buffer &target,
                     std::size_t target_start = 0,
                     std::size_t source_start = 0,
                     std::size_t source_end = npos) const noexcept;

    void fill(byte value) noexcept;

    [[nodiscard]] bool equals(bytes_view other) const noexcept;
    // 字典序比较：返回 -1 / 0 / 1。
    [[nodiscard]] int compare(bytes_view other) const noexcept;
    // 从 from 开始查找 needle，找不到返回 npos；空 needle 返回 min(from, size())。
    [[nodiscard]] std::size_t index_of(bytes_view needle, std::size_t from = 0) const noexcept;

    [[nodiscard]] std::vector<byte> to_vector() const;

    std::error_code read_uint8(std::size_t offset, std::uint8_t &out) const noexcept;
    std::error_code read_int8(std::size_t offset, std::int8_t &out) const noexcept;
    std::error_code read_uint16(std::size_t offset, bool little_endian, std::uint16_t &out) const noexcept;
    std::error_code read_int16(std::size_t offset, bool little_endian, std::int16_t &out) const noexcept;
    std::error_code read_uint32(std::size_t offset, bool little_endian, std::uint32_t &out) const noexcept;
    std::error_code read_int32(std::size_t offset, bool little_endian, std::int32_t &out) const noexcept;
    std::error_code read_uint64(std::size_t offset, bool little_endian, std::uint64_t &out) const noexcept;
    std::error_code read_int64(std::size_t offset, bool little_endian, std::int64_t &out) const noexcept;
    std::error_code read_float16(std::size_t offset, bool little_endian, double &out) const noexcept;
    std::error_code read_float32(std::size_t offset, bool little_endian, float &out) const noexcept;
    std::error_code read_float64(std::size_t offset, bool little_endian, double &out) const noexcept;

    std::error_code write_uint8(std::size_t offset, std::uint8_t value) noexcept;
    std::error_code write_int8(std::size_t offset, std::int8_t value) noexcept;
    std::error_code write_uint16(std::size_t offset, bool little_endian, std::uint16_t value) noexcept;
    std::error_code write_int16(std::size_t offset, bool little_endian, std::int16_t value) noexcept;
    std::error_code write_uint32(std::size_t offset, bool little_endian, std::uint32_t value) noexcept;
    std::error_code write_int32(std::size_t offset, bool little_endian, std::int32_t value) noexcept;
    std::error_code write_uint64(std::size_t offset, bool little_endian, std::uint64_t value) noexcept;
    std::error_code write_int64(std::size_t offset, bool little_endian, std::int64_t value) noexcept;
    std::error_code write_float16(std::size_t offset, bool little_endian, double value) noexcept;
    std::error_code write_float32(std::size_t offset, bool little_endian, float value) noexcept;
    std::error_code write_float64(std::size_t offset, bool little_endian, double value) noexcept;

    friend bool operator==(const Buffer &lhs, const Buffer &rhs) noexcept {
        return lhs.equals(rhs.bytes());
    }
    friend bool operator!=(const Buffer &lhs, const Buffer &rhs) noexcept { return !(lhs == rhs); }

private:
    Buffer(std::shared_ptr<byte[]> storage, std::size_t offset, std::size_t size) noexcept;

    template <class UInt>
    std::error_code load(std::size_t offset, bool little_endian, UInt &out) const noexcept;
    template <class UInt>
    std::error_code store(std::size_t offset, bool little_endian, UInt value) noexcept;

    std::shared_ptr<byte[]> storage_;
    std::size_t offset_{0};
    std::size_t size_{0};
};

} // namespace structbuf::core
