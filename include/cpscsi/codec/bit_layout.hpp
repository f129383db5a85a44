#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cpscsi::codec {

/// ビット列の読み出し（MSBファースト、ビッグエンディアン）
/// @param buffer 対象バイト列
/// @param bit_offset 先頭バイトのMSBを0とするビット位置
/// @param width ビット幅（1-64）
std::uint64_t readBits(const std::uint8_t* buffer, std::size_t bit_offset, std::size_t width) noexcept;

/// ビット列の書き込み（MSBファースト、ビッグエンディアン）
/// 範囲外のビットは変更しない
void writeBits(std::uint8_t* buffer, std::size_t bit_offset, std::size_t width, std::uint64_t value) noexcept;

/// 固定長ビットフィールド構造
/// フィールド幅を宣言順に並べるだけで、SCSI規格どおりのバイト配置を得る
///
/// 使用例:
/// @code
/// using Cdb = BitLayout<8, 3, 5, 16>;   // 4バイト
/// Cdb cdb;
/// cdb.set<0>(0x9E);
/// cdb.set<2>(0x16);
/// @endcode
template <std::size_t... Widths>
class BitLayout {
public:
    static constexpr std::size_t kFieldCount = sizeof...(Widths);
    static constexpr std::size_t kBitCount = (Widths + ... + 0);
    static constexpr std::size_t kSize = kBitCount / 8;

    static_assert(kFieldCount > 0, "BitLayout requires at least one field");
    static_assert(kBitCount % 8 == 0, "BitLayout total width must be a whole number of bytes");
    static_assert(((Widths >= 1 && Widths <= 64) && ...), "BitLayout field width must be 1..64");

    BitLayout() : bytes_{} {}

    /// バイト列からレイアウトを復元する
    /// @throws std::invalid_argument バイト数がkSizeに満たない場合
    static BitLayout fromBytes(const std::uint8_t* data, std::size_t size) {
        if (data == nullptr || size < kSize) {
            throw std::invalid_argument("BitLayout requires " + std::to_string(kSize) +
                                        " bytes (actual: " + std::to_string(size) + ")");
        }
        BitLayout layout;
        for (std::size_t i = 0; i < kSize; ++i) {
            layout.bytes_[i] = data[i];
        }
        return layout;
    }

    template <std::size_t I>
    static constexpr std::size_t width() {
        static_assert(I < kFieldCount, "field index out of range");
        return kWidths[I];
    }

    template <std::size_t I>
    static constexpr std::size_t offset() {
        static_assert(I < kFieldCount, "field index out of range");
        std::size_t bits = 0;
        for (std::size_t i = 0; i < I; ++i) {
            bits += kWidths[i];
        }
        return bits;
    }

    template <std::size_t I>
    std::uint64_t get() const noexcept {
        return readBits(bytes_.data(), offset<I>(), width<I>());
    }

    /// フィールドに値を書き込む
    /// フィールド幅に収まらない値は切り詰めずに拒否する
    /// @throws std::invalid_argument 値がフィールド幅を超える場合
    template <std::size_t I>
    void set(std::uint64_t value) {
        constexpr std::size_t bits = width<I>();
        if constexpr (bits < 64) {
            if ((value >> bits) != 0) {
                throw std::invalid_argument("Value " + std::to_string(value) + " does not fit in field " +
                                            std::to_string(I) + " (" + std::to_string(bits) + " bits)");
            }
        }
        writeBits(bytes_.data(), offset<I>(), bits, value);
    }

    const std::array<std::uint8_t, kSize>& bytes() const noexcept { return bytes_; }
    const std::uint8_t* data() const noexcept { return bytes_.data(); }
    static constexpr std::size_t size() noexcept { return kSize; }

    bool operator==(const BitLayout& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const BitLayout& other) const noexcept { return bytes_ != other.bytes_; }

private:
    static constexpr std::array<std::size_t, kFieldCount> kWidths{Widths...};

    std::array<std::uint8_t, kSize> bytes_;
};

} // namespace cpscsi::codec
