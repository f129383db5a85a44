#pragma once

#include "cpscsi/codec/bit_layout.hpp"
#include "cpscsi/codec/flexible_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cpscsi {

class Scsi;

/// GET STREAM STATUS のコマンド記述ブロック（16バイト）
/// [op-code:8][reserved:3][service action:5][reserved:16][starting stream id:16]
/// [reserved:32][allocation length:32][reserved:8][control:8]
class GetStreamStatusCdb {
    using Layout = codec::BitLayout<8, 3, 5, 16, 16, 32, 32, 8, 8>;

public:
    static constexpr std::uint8_t kOperationCode = 0x9E;
    static constexpr std::uint8_t kServiceAction = 0x16;
    static constexpr std::size_t kSize = Layout::kSize;

    /// 操作コードとサービスアクションを設定済みの状態で作成する
    GetStreamStatusCdb();

    /// @throws std::invalid_argument バイト数が不足している場合
    static GetStreamStatusCdb fromBytes(const std::uint8_t* data, std::size_t size);

    std::uint8_t operationCode() const noexcept;
    std::uint8_t serviceAction() const noexcept;
    std::uint16_t startingStreamIdentifier() const noexcept;
    std::uint32_t allocationLength() const noexcept;
    std::uint8_t control() const noexcept;

    GetStreamStatusCdb& setStartingStreamIdentifier(std::uint16_t value);
    GetStreamStatusCdb& setAllocationLength(std::uint32_t value);
    GetStreamStatusCdb& setControl(std::uint8_t value);

    const std::uint8_t* data() const noexcept { return layout_.data(); }
    static constexpr std::size_t size() noexcept { return kSize; }

private:
    explicit GetStreamStatusCdb(const Layout& layout) : layout_(layout) {}

    Layout layout_;
};

/// GET STREAM STATUS 応答のパラメータヘッダー（8バイト）
/// [parameter data length:32][reserved:16][number of open streams:16]
class StreamStatusHeader {
    using Layout = codec::BitLayout<32, 16, 16>;

public:
    static constexpr std::size_t kSize = Layout::kSize;

    StreamStatusHeader() = default;

    static StreamStatusHeader fromBytes(const std::uint8_t* data, std::size_t size);

    /// 長さフィールド自身（4バイト）を除いたパラメータデータ長
    std::uint32_t parameterDataLength() const noexcept;
    std::uint16_t numberOfOpenStreams() const noexcept;

    StreamStatusHeader& setParameterDataLength(std::uint32_t value);
    StreamStatusHeader& setNumberOfOpenStreams(std::uint16_t value);

    const std::uint8_t* data() const noexcept { return layout_.data(); }
    static constexpr std::size_t size() noexcept { return kSize; }

private:
    explicit StreamStatusHeader(const Layout& layout) : layout_(layout) {}

    Layout layout_;
};

/// ストリームステータス記述子（8バイト）
/// [reserved:16][stream identifier:16][reserved:32]
class StreamStatusDescriptor {
    using Layout = codec::BitLayout<16, 16, 32>;

public:
    static constexpr std::size_t kSize = Layout::kSize;

    StreamStatusDescriptor() = default;

    static StreamStatusDescriptor fromBytes(const std::uint8_t* data, std::size_t size);

    std::uint16_t streamIdentifier() const noexcept;

    StreamStatusDescriptor& setStreamIdentifier(std::uint16_t value);

    const std::uint8_t* data() const noexcept { return layout_.data(); }
    static constexpr std::size_t size() noexcept { return kSize; }

private:
    explicit StreamStatusDescriptor(const Layout& layout) : layout_(layout) {}

    Layout layout_;
};

using StreamStatusBuffer = codec::FlexibleBuffer<StreamStatusHeader, StreamStatusDescriptor>;

/// 割り当て長フィールド（32bit）で表現できる記述子数の上限
/// (0xFFFFFFFF - 8) / 8
constexpr std::uint32_t kMaxStreamStatusDescriptors =
    static_cast<std::uint32_t>((0xFFFFFFFFull - StreamStatusHeader::kSize) / StreamStatusDescriptor::kSize);

/// 記述子数から割り当て長（ヘッダー + 記述子数 × 8）を求める
/// @throws ArgumentOutOfBoundsError descriptor_lengthがkMaxStreamStatusDescriptorsを超える場合
std::uint32_t streamStatusAllocationLength(std::uint32_t descriptor_length);

/// GET STREAM STATUS の結果
struct GetStreamStatusResult {
    std::size_t total_descriptor_length = 0;        // デバイスが申告した記述子数（クランプ前）
    std::uint16_t number_of_open_streams = 0;       // デバイスが申告したオープン中のストリーム数
    std::vector<std::uint16_t> stream_identifiers;  // 受信できたストリームID（受信順）
};

/// GET STREAM STATUS コマンドのビルダー
/// 作成元のScsiを参照するため、Scsiより長く保持しないこと
/// 設定メソッドをチェーンで呼び、最後にissue()を1回だけ呼ぶ
class GetStreamStatusCommand {
public:
    /// @throws std::logic_error issue()後に呼んだ場合
    GetStreamStatusCommand& startingStreamIdentifier(std::uint16_t value);

    /// @throws std::logic_error issue()後に呼んだ場合
    GetStreamStatusCommand& control(std::uint8_t value);

    /// 受け取る記述子数の上限（kMaxStreamStatusDescriptors以下）
    /// 範囲の検査はissue()で行う
    /// @throws std::logic_error issue()後に呼んだ場合
    GetStreamStatusCommand& descriptorLength(std::uint32_t value);

    /// コマンドを発行する。同じビルダーで2回は呼べない
    /// @return デバイスが申告したストリーム数と、受信できたストリームID
    /// @throws ArgumentOutOfBoundsError 記述子数が上限を超える場合（送信しない）
    /// @throws TransportError トランスポート層の失敗
    /// @throws DeviceError デバイスが異常を報告した場合
    /// @throws std::logic_error 発行済みの場合
    GetStreamStatusResult issue();

    bool isIssued() const noexcept { return issued_; }

private:
    friend class Scsi;

    explicit GetStreamStatusCommand(const Scsi& scsi);

    void ensureNotIssued() const;

    const Scsi* scsi_;
    GetStreamStatusCdb cdb_;
    std::uint32_t descriptor_length_ = 0;
    bool issued_ = false;
};

} // namespace cpscsi
