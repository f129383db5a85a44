#pragma once

#include "cpscsi/sense_data.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cpscsi {

/// 引数が規格上の表現範囲を超えている
/// コマンドは送信されない
class ArgumentOutOfBoundsError : public std::out_of_range {
public:
    ArgumentOutOfBoundsError(const std::string& argument, std::uint64_t limit, std::uint64_t value);

    std::uint64_t limit() const noexcept { return limit_; }
    std::uint64_t value() const noexcept { return value_; }

private:
    std::uint64_t limit_;
    std::uint64_t value_;
};

/// トランスポート層の失敗（コマンドを実行できなかった）
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message,
                            int system_error = 0,
                            std::uint16_t host_status = 0,
                            std::uint16_t driver_status = 0);

    int systemError() const noexcept { return system_error_; }
    std::uint16_t hostStatus() const noexcept { return host_status_; }
    std::uint16_t driverStatus() const noexcept { return driver_status_; }

private:
    int system_error_;
    std::uint16_t host_status_;
    std::uint16_t driver_status_;
};

/// デバイスがコマンドを実行したうえで異常を報告した（SCSIステータス/センスデータ）
class DeviceError : public std::runtime_error {
public:
    DeviceError(std::uint8_t status, const SenseData& sense);

    std::uint8_t status() const noexcept { return status_; }
    const SenseData& sense() const noexcept { return sense_; }

private:
    std::uint8_t status_;
    SenseData sense_;
};

} // namespace cpscsi
