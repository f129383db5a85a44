#pragma once

namespace cpscsi {

/// データフェーズの転送方向
enum class DataDirection {
    None,        // データフェーズなし（TEST UNIT READY等）
    ToDevice,    // ホスト→デバイス（WRITE系）
    FromDevice   // デバイス→ホスト（READ/INQUIRY/GET STREAM STATUS等）
};

const char* toString(DataDirection direction) noexcept;

} // namespace cpscsi
