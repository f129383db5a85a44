#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace cpscsi {

/// コマンド発行時の設定
/// Scsiの生成前に適切な値を設定すること
struct ScsiConfig {
    // ========================================
    // トランスポート設定
    // ========================================

    std::chrono::milliseconds timeout{60000};  // 1コマンドあたりのタイムアウト（デフォルト60秒）

    // ========================================
    // センスデータ設定
    // ========================================

    std::size_t sense_buffer_size = 64;  // センスバッファ長（18-252バイト）

    // ========================================
    // バリデーションヘルパー
    // ========================================

    /// 設定が妥当かどうかをチェックする
    /// @param error_message エラー時にメッセージを格納するポインタ（オプション）
    /// @return 妥当な場合true、不正な場合false
    bool isValid(std::string* error_message = nullptr) const;

    /// 設定を検証し、不正な場合は例外を投げる
    /// @throws std::invalid_argument 設定が不正な場合
    void validate() const;

    /// すべてのバリデーションエラーをリストで取得する
    /// @return エラーメッセージのリスト（エラーがない場合は空）
    std::vector<std::string> getValidationErrors() const;
};

} // namespace cpscsi
