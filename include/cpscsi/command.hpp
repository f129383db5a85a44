#pragma once

#include "cpscsi/data_direction.hpp"
#include "cpscsi/result_data.hpp"

#include <cstdint>

namespace cpscsi {

/// すべてのSCSIコマンドが実装する契約
/// Scsi::issue()はこのインターフェースだけを使ってコマンドを実行するため、
/// 個々のコマンドのデータ形状を知る必要がない
///
/// @tparam Cdb コマンド記述ブロック（data()/size()で固定長バイト列を返す型）
/// @tparam Data データバッファ（data()/size()を持つ型。データフェーズがなければNoDataBuffer）
/// @tparam Result processResult()の戻り値
template <typename Cdb, typename Data, typename Result>
class Command {
public:
    using CommandBuffer = Cdb;
    using DataBuffer = Data;
    using ReturnType = Result;

    virtual ~Command() = default;

    /// データフェーズの方向
    virtual DataDirection direction() const = 0;

    /// 送信するコマンド記述ブロック
    virtual CommandBuffer command() const = 0;

    /// トランザクションごとに新しく確保するデータバッファ
    virtual DataBuffer data() const = 0;

    /// 転送バイト数（応答を受け取る場合はdata().size()と一致すること）
    virtual std::uint32_t dataSize() const = 0;

    /// 完了したトランザクションを型付きの結果へ変換する
    /// @throws TransportError トランスポート層の失敗
    /// @throws DeviceError デバイスが異常を報告した場合
    virtual ReturnType processResult(ResultData<DataBuffer> result) const = 0;
};

} // namespace cpscsi
