#pragma once

#include "cpscsi/data_direction.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cpscsi {

/// SCSIステータスバイト（SAM-5 5.3）
namespace scsi_status {
constexpr std::uint8_t kGood = 0x00;
constexpr std::uint8_t kCheckCondition = 0x02;
constexpr std::uint8_t kConditionMet = 0x04;
constexpr std::uint8_t kBusy = 0x08;
constexpr std::uint8_t kReservationConflict = 0x18;
constexpr std::uint8_t kTaskSetFull = 0x28;
constexpr std::uint8_t kAcaActive = 0x30;
constexpr std::uint8_t kTaskAborted = 0x40;
} // namespace scsi_status

/// SCSIステータスの規格名を返す（例: "CHECK CONDITION"）
const char* scsiStatusName(std::uint8_t status) noexcept;

/// ドライバステータスのうち、センスデータが付随することだけを示す値
/// これ単体はトランスポート異常として扱わない
constexpr std::uint16_t kDriverSense = 0x08;

/// トランスポートへ渡す1トランザクション分の要求
/// バッファはすべて呼び出し元が所有し、execute()の間だけ有効
struct TransportRequest {
    DataDirection direction = DataDirection::None;
    const std::uint8_t* cdb = nullptr;    // コマンド記述ブロック
    std::size_t cdb_length = 0;
    std::uint8_t* data = nullptr;         // データバッファ（FromDeviceの場合はトランスポートが書き込む）
    std::uint32_t data_length = 0;        // 転送バイト数
    std::chrono::milliseconds timeout{0};
    std::size_t sense_buffer_size = 0;    // 受け取るセンスデータの最大長
};

/// 完了したトランザクションの結果
struct TransportStatus {
    // トランスポート層
    int system_error = 0;               // OSエラー番号（0=成功）
    std::uint16_t host_status = 0;      // ホストアダプタステータス（0=成功）
    std::uint16_t driver_status = 0;    // ドライバステータス（0またはkDriverSense=成功）

    // プロトコル層
    std::uint8_t scsi_status = scsi_status::kGood;
    std::vector<std::uint8_t> sense;    // センスデータ（CHECK CONDITION時）

    std::int32_t residual = 0;          // 転送されなかったバイト数
};

/// コマンドを実行するトランスポート（SG_IO等）の抽象インターフェース
/// デバイスの列挙、再送、タイムアウトの実装はトランスポート側の責務
class Transport {
public:
    virtual ~Transport() = default;

    /// 要求を1回実行する
    /// 失敗はTransportStatusで報告し、例外は投げないこと
    /// @param request 実行する要求（data/data_lengthの領域へ書き込んでよい）
    /// @return トランスポート層とプロトコル層のステータス
    virtual TransportStatus execute(const TransportRequest& request) = 0;
};

} // namespace cpscsi
