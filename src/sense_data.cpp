#include "cpscsi/sense_data.hpp"

// センスデータの解釈。デバイスが返す長さは信用せず、受け取ったバイト数の範囲だけを見る。

#include <iomanip>
#include <sstream>

namespace cpscsi {

namespace {

constexpr std::uint8_t kResponseCodeMask = 0x7F;
constexpr std::uint8_t kFixedCurrent = 0x70;
constexpr std::uint8_t kFixedDeferred = 0x71;
constexpr std::uint8_t kDescriptorCurrent = 0x72;
constexpr std::uint8_t kDescriptorDeferred = 0x73;

std::uint8_t byteAt(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
    return offset < bytes.size() ? bytes[offset] : 0;
}

} // namespace

const char* senseKeyName(SenseKey key) noexcept {
    switch (key) {
        case SenseKey::NoSense: return "NO SENSE";
        case SenseKey::RecoveredError: return "RECOVERED ERROR";
        case SenseKey::NotReady: return "NOT READY";
        case SenseKey::MediumError: return "MEDIUM ERROR";
        case SenseKey::HardwareError: return "HARDWARE ERROR";
        case SenseKey::IllegalRequest: return "ILLEGAL REQUEST";
        case SenseKey::UnitAttention: return "UNIT ATTENTION";
        case SenseKey::DataProtect: return "DATA PROTECT";
        case SenseKey::BlankCheck: return "BLANK CHECK";
        case SenseKey::VendorSpecific: return "VENDOR SPECIFIC";
        case SenseKey::CopyAborted: return "COPY ABORTED";
        case SenseKey::AbortedCommand: return "ABORTED COMMAND";
        case SenseKey::Reserved: return "RESERVED";
        case SenseKey::VolumeOverflow: return "VOLUME OVERFLOW";
        case SenseKey::Miscompare: return "MISCOMPARE";
        case SenseKey::Completed: return "COMPLETED";
    }
    return "UNKNOWN";
}

SenseData SenseData::parse(const std::vector<std::uint8_t>& bytes) {
    SenseData sense{};
    if (bytes.empty()) {
        return sense;
    }

    const std::uint8_t code = bytes[0] & kResponseCodeMask;
    switch (code) {
        case kFixedCurrent:
        case kFixedDeferred:
            // 固定形式: byte2 下位4bit がセンスキー、ASC/ASCQ は byte12/13。
            sense.sense_key = static_cast<SenseKey>(byteAt(bytes, 2) & 0x0F);
            sense.asc = byteAt(bytes, 12);
            sense.ascq = byteAt(bytes, 13);
            break;
        case kDescriptorCurrent:
        case kDescriptorDeferred:
            sense.sense_key = static_cast<SenseKey>(byteAt(bytes, 1) & 0x0F);
            sense.asc = byteAt(bytes, 2);
            sense.ascq = byteAt(bytes, 3);
            break;
        default:
            return sense;
    }

    sense.valid = true;
    sense.response_code = code;
    sense.deferred = (code == kFixedDeferred || code == kDescriptorDeferred);
    return sense;
}

std::string SenseData::describe() const {
    if (!valid) {
        return "no sense data";
    }
    std::ostringstream oss;
    oss << senseKeyName(sense_key) << std::uppercase << std::hex << std::setfill('0')
        << " (asc=0x" << std::setw(2) << static_cast<int>(asc)
        << ", ascq=0x" << std::setw(2) << static_cast<int>(ascq) << ")";
    if (deferred) {
        oss << " [deferred]";
    }
    return oss.str();
}

} // namespace cpscsi
