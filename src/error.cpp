#include "cpscsi/error.hpp"
#include "cpscsi/transport.hpp"

#include <iomanip>
#include <sstream>

namespace cpscsi {

namespace {

std::string outOfBoundsMessage(const std::string& argument, std::uint64_t limit, std::uint64_t value) {
    std::ostringstream oss;
    oss << argument << " is out of bounds. The maximum possible value is " << limit
        << ", but " << value << " was provided.";
    return oss.str();
}

std::string deviceErrorMessage(std::uint8_t status, const SenseData& sense) {
    std::ostringstream oss;
    oss << "SCSI status 0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(status) << " (" << scsiStatusName(status) << ")";
    if (sense.valid) {
        oss << ": " << sense.describe();
    }
    return oss.str();
}

} // namespace

ArgumentOutOfBoundsError::ArgumentOutOfBoundsError(const std::string& argument,
                                                   std::uint64_t limit,
                                                   std::uint64_t value)
    : std::out_of_range(outOfBoundsMessage(argument, limit, value)),
      limit_(limit),
      value_(value) {}

TransportError::TransportError(const std::string& message,
                               int system_error,
                               std::uint16_t host_status,
                               std::uint16_t driver_status)
    : std::runtime_error(message),
      system_error_(system_error),
      host_status_(host_status),
      driver_status_(driver_status) {}

DeviceError::DeviceError(std::uint8_t status, const SenseData& sense)
    : std::runtime_error(deviceErrorMessage(status, sense)),
      status_(status),
      sense_(sense) {}

} // namespace cpscsi
