#pragma once

#include "cpscsi/data_direction.hpp"
#include "cpscsi/result_data.hpp"
#include "cpscsi/scsi_config.hpp"
#include "cpscsi/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace cpscsi {

// 前方宣言
class GetStreamStatusCommand;
class TestUnitReadyCommand;

/// SCSIコマンド発行の窓口
/// トランスポートと設定を保持し、任意のCommandを同じ手順で実行する
/// getStreamStatus()等が返すビルダーはこのオブジェクトを参照するため、
/// ビルダーより長く生存させること。コピー・ムーブはできない
///
/// 使用例:
/// @code
/// Scsi scsi(transport);
/// auto status = scsi.getStreamStatus()
///                   .startingStreamIdentifier(0)
///                   .descriptorLength(16)
///                   .issue();
/// @endcode
class Scsi {
public:
    /// @param transport コマンドを実行するトランスポート（Scsiより長く生存すること）
    /// @param config 発行時の設定
    /// @throws std::invalid_argument 設定が不正な場合
    explicit Scsi(Transport& transport, const ScsiConfig& config = ScsiConfig{});

    ~Scsi();

    Scsi(const Scsi&) = delete;
    Scsi& operator=(const Scsi&) = delete;
    Scsi(Scsi&&) = delete;
    Scsi& operator=(Scsi&&) = delete;

    const ScsiConfig& config() const noexcept;

    /// コマンドを1回実行し、processResult()の結果を返す
    /// @param command Commandを実装したオブジェクト
    /// @throws std::logic_error dataSize()がデータバッファより大きい場合、
    ///        または受信コマンドでバッファ長と一致しない場合
    template <typename C>
    typename C::ReturnType issue(const C& command) const {
        const auto cdb = command.command();
        auto data = command.data();
        auto status = execute(command.direction(), cdb.data(), cdb.size(),
                              data.data(), data.size(), command.dataSize());
        return command.processResult(
            ResultData<typename C::DataBuffer>(std::move(status), std::move(data)));
    }

    // ========================================
    // コマンド
    // ========================================

    /// GET STREAM STATUS（0x9E/0x16）のビルダーを作成する
    GetStreamStatusCommand getStreamStatus() const;

    /// TEST UNIT READY（0x00）のビルダーを作成する
    TestUnitReadyCommand testUnitReady() const;

private:
    TransportStatus execute(DataDirection direction,
                            const std::uint8_t* cdb,
                            std::size_t cdb_length,
                            std::uint8_t* data,
                            std::size_t buffer_size,
                            std::uint32_t data_size) const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cpscsi
