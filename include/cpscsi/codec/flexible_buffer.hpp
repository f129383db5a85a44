#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace cpscsi::codec {

/// 応答バッファ末尾の要素列に対する読み取り専用ビュー
/// 生成時に要素数が確保済み容量でクランプされているため、範囲外を読むことはない
template <typename Element>
class ElementView {
public:
    ElementView(const std::uint8_t* base, std::size_t count) noexcept
        : base_(base), count_(count) {}

    std::size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }

    Element operator[](std::size_t index) const {
        return Element::fromBytes(base_ + index * Element::kSize, Element::kSize);
    }

    /// @throws std::out_of_range indexがsize()以上の場合
    Element at(std::size_t index) const {
        if (index >= count_) {
            throw std::out_of_range("Element index " + std::to_string(index) +
                                    " out of range (size: " + std::to_string(count_) + ")");
        }
        return (*this)[index];
    }

private:
    const std::uint8_t* base_;
    std::size_t count_;
};

/// 固定長ヘッダー + 実行時に決まる個数の固定長要素からなる応答バッファ
/// 要素数の上限は送信前に決める必要があり、実際の個数はヘッダーを読むまで分からない
///
/// 使用例:
/// @code
/// FlexibleBuffer<ParameterHeader, Descriptor> buffer(16);
/// transport.execute(...buffer.data(), buffer.size()...);
/// auto header = buffer.header();
/// auto descriptors = buffer.elements(reported_count);  // 容量でクランプ
/// @endcode
template <typename Header, typename Element>
class FlexibleBuffer {
public:
    static constexpr std::size_t kHeaderSize = Header::kSize;
    static constexpr std::size_t kElementSize = Element::kSize;

    static_assert(kElementSize > 0, "FlexibleBuffer element must not be empty");

    FlexibleBuffer() : FlexibleBuffer(0) {}

    /// ヘッダーとcapacity個の要素分をゼロ初期化して確保する
    /// @throws std::length_error 必要サイズが表現できない場合
    explicit FlexibleBuffer(std::size_t capacity)
        : capacity_(capacity), storage_(byteLengthFor(capacity), 0) {}

    /// 確保に必要なバイト数を計算する
    /// @throws std::length_error size_tで表現できない場合
    static std::size_t byteLengthFor(std::size_t capacity) {
        if (capacity > (std::numeric_limits<std::size_t>::max() - kHeaderSize) / kElementSize) {
            throw std::length_error("FlexibleBuffer capacity too large: " + std::to_string(capacity));
        }
        return kHeaderSize + capacity * kElementSize;
    }

    Header header() const {
        return Header::fromBytes(storage_.data(), kHeaderSize);
    }

    /// デバイス申告の要素数を容量でクランプしたビューを返す
    ElementView<Element> elements(std::size_t reported_count) const noexcept {
        return ElementView<Element>(storage_.data() + kHeaderSize, std::min(reported_count, capacity_));
    }

    /// @throws std::out_of_range indexが容量以上の場合
    Element element(std::size_t index) const {
        return elements(capacity_).at(index);
    }

    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t size() const noexcept { return storage_.size(); }
    std::uint8_t* data() noexcept { return storage_.data(); }
    const std::uint8_t* data() const noexcept { return storage_.data(); }

private:
    std::size_t capacity_;
    std::vector<std::uint8_t> storage_;
};

/// データフェーズを持たないコマンド用の空バッファ
class NoDataBuffer {
public:
    std::size_t capacity() const noexcept { return 0; }
    std::size_t size() const noexcept { return 0; }
    std::uint8_t* data() noexcept { return nullptr; }
    const std::uint8_t* data() const noexcept { return nullptr; }
};

} // namespace cpscsi::codec
