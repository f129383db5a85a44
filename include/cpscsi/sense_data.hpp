#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cpscsi {

/// センスキー（SPC-4 4.5.6）
enum class SenseKey : std::uint8_t {
    NoSense = 0x0,
    RecoveredError = 0x1,
    NotReady = 0x2,
    MediumError = 0x3,
    HardwareError = 0x4,
    IllegalRequest = 0x5,
    UnitAttention = 0x6,
    DataProtect = 0x7,
    BlankCheck = 0x8,
    VendorSpecific = 0x9,
    CopyAborted = 0xA,
    AbortedCommand = 0xB,
    Reserved = 0xC,
    VolumeOverflow = 0xD,
    Miscompare = 0xE,
    Completed = 0xF
};

/// センスキーの規格名を返す（例: "ILLEGAL REQUEST"）
const char* senseKeyName(SenseKey key) noexcept;

/// デコード済みセンスデータ
/// 固定形式（0x70/0x71）と記述子形式（0x72/0x73）の両方を扱う
struct SenseData {
    bool valid = false;              // 解釈可能な応答コードだった場合true
    std::uint8_t response_code = 0;  // 応答コード（0x70-0x73）
    bool deferred = false;           // 遅延エラー（0x71/0x73）
    SenseKey sense_key = SenseKey::NoSense;
    std::uint8_t asc = 0;            // Additional Sense Code
    std::uint8_t ascq = 0;           // Additional Sense Code Qualifier

    /// センスバッファを解析する
    /// 短いバッファは読める範囲だけ解釈し、例外は投げない
    /// @param bytes デバイスから返されたセンスバイト列
    static SenseData parse(const std::vector<std::uint8_t>& bytes);

    /// 人が読める形式に整形する（例: "ILLEGAL REQUEST (asc=0x24, ascq=0x00)"）
    std::string describe() const;
};

} // namespace cpscsi
