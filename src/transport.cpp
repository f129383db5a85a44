#include "cpscsi/transport.hpp"

// トランザクション結果の検査。トランスポート層を先に見て、プロトコル層は後に見る。

#include "cpscsi/error.hpp"
#include "cpscsi/result_data.hpp"
#include "cpscsi/sense_data.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/bin_to_hex.h>

namespace cpscsi {

const char* toString(DataDirection direction) noexcept {
    switch (direction) {
        case DataDirection::None: return "none";
        case DataDirection::ToDevice: return "to-device";
        case DataDirection::FromDevice: return "from-device";
    }
    return "unknown";
}

const char* scsiStatusName(std::uint8_t status) noexcept {
    switch (status) {
        case scsi_status::kGood: return "GOOD";
        case scsi_status::kCheckCondition: return "CHECK CONDITION";
        case scsi_status::kConditionMet: return "CONDITION MET";
        case scsi_status::kBusy: return "BUSY";
        case scsi_status::kReservationConflict: return "RESERVATION CONFLICT";
        case scsi_status::kTaskSetFull: return "TASK SET FULL";
        case scsi_status::kAcaActive: return "ACA ACTIVE";
        case scsi_status::kTaskAborted: return "TASK ABORTED";
        default: return "RESERVED";
    }
}

void checkTransportError(const TransportStatus& status) {
    if (status.system_error != 0) {
        spdlog::warn("SCSI transport failed: {} (errno {})",
                     std::strerror(status.system_error), status.system_error);
        throw TransportError("SCSI transport failed: " + std::string(std::strerror(status.system_error)),
                             status.system_error, status.host_status, status.driver_status);
    }

    const bool driver_failed = status.driver_status != 0 && status.driver_status != kDriverSense;
    if (status.host_status != 0 || driver_failed) {
        std::ostringstream oss;
        oss << "SCSI transport failed: host_status=0x" << std::uppercase << std::hex << std::setw(4)
            << std::setfill('0') << status.host_status << " driver_status=0x" << std::setw(4)
            << status.driver_status;
        spdlog::warn("{}", oss.str());
        throw TransportError(oss.str(), 0, status.host_status, status.driver_status);
    }
}

void checkDeviceError(const TransportStatus& status) {
    if (status.scsi_status == scsi_status::kGood || status.scsi_status == scsi_status::kConditionMet) {
        return;
    }

    const SenseData sense = SenseData::parse(status.sense);
    spdlog::error("SCSI command failed with status 0x{:02X} ({}): {}",
                  status.scsi_status, scsiStatusName(status.scsi_status), sense.describe());
    if (!status.sense.empty()) {
        spdlog::debug("Sense bytes: {}", spdlog::to_hex(status.sense));
    }
    throw DeviceError(status.scsi_status, sense);
}

} // namespace cpscsi
