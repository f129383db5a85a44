#include "cpscsi/codec/bit_layout.hpp"

// SCSI の CDB やパラメータデータは MSB ファーストでビットを詰めるため、
// バイト境界をまたぐフィールドも先頭から 1 バイトずつ処理する。

#include <algorithm>

namespace cpscsi::codec {

namespace {

struct ByteSlice {
    std::size_t index = 0;
    std::size_t take = 0;
    unsigned shift = 0;
    std::uint8_t mask = 0;
};

ByteSlice sliceAt(std::size_t bit, std::size_t remaining) {
    ByteSlice slice{};
    slice.index = bit / 8;
    const std::size_t bit_in_byte = bit % 8;
    slice.take = std::min<std::size_t>(remaining, 8 - bit_in_byte);
    slice.shift = static_cast<unsigned>(8 - bit_in_byte - slice.take);
    slice.mask = static_cast<std::uint8_t>(((1u << slice.take) - 1u) << slice.shift);
    return slice;
}

} // namespace

std::uint64_t readBits(const std::uint8_t* buffer, std::size_t bit_offset, std::size_t width) noexcept {
    std::uint64_t value = 0;
    std::size_t bit = bit_offset;
    std::size_t remaining = width;
    while (remaining > 0) {
        const ByteSlice slice = sliceAt(bit, remaining);
        value = (value << slice.take) |
                static_cast<std::uint64_t>((buffer[slice.index] & slice.mask) >> slice.shift);
        bit += slice.take;
        remaining -= slice.take;
    }
    return value;
}

void writeBits(std::uint8_t* buffer, std::size_t bit_offset, std::size_t width, std::uint64_t value) noexcept {
    std::size_t bit = bit_offset;
    std::size_t remaining = width;
    while (remaining > 0) {
        const ByteSlice slice = sliceAt(bit, remaining);
        const std::uint64_t chunk = (value >> (remaining - slice.take)) & ((1u << slice.take) - 1u);
        buffer[slice.index] = static_cast<std::uint8_t>((buffer[slice.index] & ~slice.mask) |
                                                        (static_cast<std::uint8_t>(chunk) << slice.shift));
        bit += slice.take;
        remaining -= slice.take;
    }
}

} // namespace cpscsi::codec
