#include "structbuf/core/buffer.hpp"

#include "structbuf/core/half.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <type_traits>

namespace structbuf::core {

/*
 * Buffer 的实现模型：
 * - storage_ 持有整块存储（shared_ptr<byte[]>），offset_/size_ 描述本视图的可见区间；
 * - subarray() 只调整 offset_/size_，与父视图共享同一 storage_；
 * - 定宽读写统一走 load/store：先做边界检查，再按字节序逐字节拼装，
 *   不依赖宿主机字节序，也不做未对齐访问。
 */
Buffer::Buffer(std::shared_ptr<byte[]> storage, std::size_t offset, std::size_t size) noexcept
    : storage_(std::move(storage)), offset_(offset), size_(size) {}

Buffer Buffer::alloc(std::size_t size) {
    if (size == 0) {
        return Buffer{};
    }
    // make_shared<byte[]>(n) 会值初始化（全部置 0）。
    return Buffer{std::make_shared<byte[]>(size), 0, size};
}

Buffer Buffer::from(bytes_view bytes) {
    auto out = alloc(bytes.size());
    if (!bytes.empty()) {
        std::memcpy(out.data(), bytes.data(), bytes.size());
    }
    return out;
}

Buffer Buffer::from(std::string_view text) {
    return from(bytes_view{reinterpret_cast<const byte *>(text.data()), text.size()});
}

const byte *Buffer::data() const noexcept {
    if (!storage_) {
        return nullptr;
    }
    return storage_.get() + offset_;
}

byte *Buffer::data() noexcept {
    if (!storage_) {
        return nullptr;
    }
    return storage_.get() + offset_;
}

bytes_view Buffer::bytes() const noexcept { return bytes_view{data(), size_}; }

mutable_bytes_view Buffer::mutable_bytes() noexcept { return mutable_bytes_view{data(), size_}; }

Buffer Buffer::subarray(std::size_t start, std::size_t end) const noexcept {
    start = std::min(start, size_);
    end = std::min(end, size_);
    if (end <= start) {
        return Buffer{};
    }
    return Buffer{storage_, offset_ + start, end - start};
}

std::size_t Buffer::copy(Buffer &target,
                         std::size_t target_start,
                         std::size_t source_start,
                         std::size_t source_end) const noexcept {
    source_end = std::min(source_end, size_);
    if (source_start >= source_end || target_start >= target.size()) {
        return 0;
    }
    const auto n = std::min(source_end - source_start, target.size() - target_start);
    // 两个视图可能共享同一存储，使用 memmove。
    std::memmove(target.data() + target_start, data() + source_start, n);
    return n;
}

void Buffer::fill(byte value) noexcept {
    if (size_ != 0) {
        std::memset(data(), value, size_);
    }
}

bool Buffer::equals(bytes_view other) const noexcept {
    return compare(other) == 0;
}

int Buffer::compare(bytes_view other) const noexcept {
    const auto n = std::min(size_, other.size());
    if (n != 0) {
        const int r = std::memcmp(data(), other.data(), n);
        if (r != 0) {
            return r < 0 ? -1 : 1;
        }
    }
    if (size_ == other.size()) {
        return 0;
    }
    return size_ < other.size() ? -1 : 1;
}

std::size_t Buffer::index_of(bytes_view needle, std::size_t from) const noexcept {
    if (needle.empty()) {
        return std::min(from, size_);
    }
    if (from >= size_ || needle.size() > size_ - from) {
        return npos;
    }
    const auto haystack = bytes();
    const auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from),
                                haystack.end(), needle.begin(), needle.end());
    if (it == haystack.end()) {
        return npos;
    }
    return static_cast<std::size_t>(it - haystack.begin());
}

std::vector<byte> Buffer::to_vector() const {
    const auto view = bytes();
    return std::vector<byte>(view.begin(), view.end());
}

template <class UInt>
std::error_code Buffer::load(std::size_t offset, bool little_endian, UInt &out) const noexcept {
    static_assert(std::is_unsigned_v<UInt>);
    if (offset > size_ || sizeof(UInt) > size_ - offset) {
        return make_error_code(errc::out_of_range);
    }
    const auto *p = data() + offset;
    UInt v = 0;
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        const auto index = little_endian ? (sizeof(UInt) - 1 - i) : i;
        v = static_cast<UInt>((v << 8) | static_cast<UInt>(p[index]));
    }
    out = v;
    return {};
}

template <class UInt>
std::error_code Buffer::store(std::size_t offset, bool little_endian, UInt value) noexcept {
    static_assert(std::is_unsigned_v<UInt>);
    if (offset > size_ || sizeof(UInt) > size_ - offset) {
        return make_error_code(errc::out_of_range);
    }
    auto *p = data() + offset;
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        const auto shift = static_cast<unsigned>(8u * i);
        const auto index = little_endian ? i : (sizeof(UInt) - 1 - i);
        p[index] = static_cast<byte>((value >> shift) & 0xFFu);
    }
    return {};
}

std::error_code Buffer::read_uint8(std::size_t offset, std::uint8_t &out) const noexcept {
    return load(offset, false, out);
}

std::error_code Buffer::read_int8(std::size_t offset, std::int8_t &out) const noexcept {
    std::uint8_t raw = 0;
    auto ec = load(offset, false, raw);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int8_t>(raw);
    return {};
}

std::error_code Buffer::read_uint16(std::size_t offset, bool little_endian, std::uint16_t &out) const noexcept {
    return load(offset, little_endian, out);
}

std::error_code Buffer::read_int16(std::size_t offset, bool little_endian, std::int16_t &out) const noexcept {
    std::uint16_t raw = 0;
    auto ec = load(offset, little_endian, raw);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int16_t>(raw);
    return {};
}

std::error_code Buffer::read_uint32(std::size_t offset, bool little_endian, std::uint32_t &out) const noexcept {
    return load(offset, little_endian, out);
}

std::error_code Buffer::read_int32(std::size_t offset, bool little_endian, std::int32_t &out) const noexcept {
    std::uint32_t raw = 0;
    auto ec = load(offset, little_endian, raw);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int32_t>(raw);
    return {};
}

std::error_code Buffer::read_uint64(std::size_t offset, bool little_endian, std::uint64_t &out) const noexcept {
    return load(offset, little_endian, out);
}

std::error_code Buffer::read_int64(std::size_t offset, bool little_endian, std::int64_t &out) const noexcept {
    std::uint64_t raw = 0;
    auto ec = load(offset, little_endian, raw);
    if (ec) {
        return ec;
    }
    out = static_cast<std::int64_t>(raw);
    return {};
}

std::error_code Buffer::read_float16(std::size_t offset, bool little_endian, double &out) const noexcept {
    std::uint16_t raw = 0;
    auto ec = load(offset, little_endian, raw);
    if (ec) {
        return ec;
    }
    out = half_bits_to_float(raw);
    return {};
}

std::error_code Buffer::read_float32(std::size_t offset, bool little_endian, float &out) const noexcept {
    std::uint32_t raw = 0;
    auto ec = load(offset, little_endian, raw);
    if (ec) {
        return ec;
    }
    out = std::bit_cast<float>(raw);
    return {};
}

std::error_code Buffer::read_float64(std::size_t offset, bool little_endian, double &out) const noexcept {
    std::uint64_t raw = 0;
    auto ec = load(offset, little_endian, raw);
    if (ec) {
        return ec;
    }
    out = std::bit_cast<double>(raw);
    return {};
}

std::error_code Buffer::write_uint8(std::size_t offset, std::uint8_t value) noexcept {
    return store(offset, false, value);
}

std::error_code Buffer::write_int8(std::size_t offset, std::int8_t value) noexcept {
    return store(offset, false, static_cast<std::uint8_t>(value));
}

std::error_code Buffer::write_uint16(std::size_t offset, bool little_endian, std::uint16_t value) noexcept {
    return store(offset, little_endian, value);
}

std::error_code Buffer::write_int16(std::size_t offset, bool little_endian, std::int16_t value) noexcept {
    return store(offset, little_endian, static_cast<std::uint16_t>(value));
}

std::error_code Buffer::write_uint32(std::size_t offset, bool little_endian, std::uint32_t value) noexcept {
    return store(offset, little_endian, value);
}

std::error_code Buffer::write_int32(std::size_t offset, bool little_endian, std::int32_t value) noexcept {
    return store(offset, little_endian, static_cast<std::uint32_t>(value));
}

std::error_code Buffer::write_uint64(std::size_t offset, bool little_endian, std::uint64_t value) noexcept {
    return store(offset, little_endian, value);
}

std::error_code Buffer::write_int64(std::size_t offset, bool little_endian, std::int64_t value) noexcept {
    return store(offset, little_endian, static_cast<std::uint64_t>(value));
}

std::error_code Buffer::write_float16(std::size_t offset, bool little_endian, double value) noexcept {
    return store(offset, little_endian, float_to_half_bits(value));
}

std::error_code Buffer::write_float32(std::size_t offset, bool little_endian, float value) noexcept {
    return store(offset, little_endian, std::bit_cast<std::uint32_t>(value));
}

std::error_code Buffer::write_float64(std::size_t offset, bool little_endian, double value) noexcept {
    return store(offset, little_endian, std::bit_cast<std::uint64_t>(value));
}

} // namespace structbuf::core
