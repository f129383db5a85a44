#pragma once

#include "cpscsi/transport.hpp"

#include <utility>

namespace cpscsi {

/// トランスポート層の失敗を検査する
/// @throws TransportError OSエラー、ホストステータス、ドライバステータスのいずれかが異常な場合
void checkTransportError(const TransportStatus& status);

/// デバイスが報告した異常を検査する
/// @throws DeviceError SCSIステータスがGOOD/CONDITION MET以外の場合
void checkDeviceError(const TransportStatus& status);

/// 完了したトランザクション（ステータス + 書き込み済みデータバッファ）
/// processResult()へ所有権ごと渡される
template <typename Data>
struct ResultData {
    TransportStatus status;
    Data data;

    ResultData(TransportStatus s, Data d)
        : status(std::move(s)), data(std::move(d)) {}

    void checkTransportError() const { cpscsi::checkTransportError(status); }
    void checkDeviceError() const { cpscsi::checkDeviceError(status); }

    /// トランスポート異常、デバイス異常の順に検査する
    void checkErrors() const {
        checkTransportError();
        checkDeviceError();
    }
};

} // namespace cpscsi
