#include "cpscsi/scsi_config.hpp"

#include <sstream>

namespace cpscsi {

namespace {

// 固定形式センスデータの最小長と、SPC で許される最大長。
constexpr std::size_t kMinSenseBufferSize = 18;
constexpr std::size_t kMaxSenseBufferSize = 252;

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

} // namespace

std::vector<std::string> ScsiConfig::getValidationErrors() const {
    std::vector<std::string> errors;

    // Timeout validation
    if (timeout.count() <= 0) {
        errors.push_back("Timeout must be positive (actual: " + std::to_string(timeout.count()) + " ms)");
    }
    // SG_IO takes the timeout as 32-bit milliseconds
    if (timeout.count() > 0xFFFFFFFFLL) {
        errors.push_back("Timeout exceeds 32-bit milliseconds (actual: " +
                         std::to_string(timeout.count()) + " ms)");
    }

    // Sense buffer validation
    if (sense_buffer_size < kMinSenseBufferSize || sense_buffer_size > kMaxSenseBufferSize) {
        std::ostringstream oss;
        oss << "Sense buffer size must be " << kMinSenseBufferSize << "-" << kMaxSenseBufferSize
            << " bytes (actual: " << sense_buffer_size << ")";
        errors.push_back(oss.str());
    }

    return errors;
}

bool ScsiConfig::isValid(std::string* error_message) const {
    const auto errors = getValidationErrors();
    if (error_message && !errors.empty()) {
        *error_message = joinErrors(errors);
    }
    return errors.empty();
}

void ScsiConfig::validate() const {
    const auto errors = getValidationErrors();
    if (!errors.empty()) {
        throw std::invalid_argument("ScsiConfig validation failed: " + joinErrors(errors));
    }
}

} // namespace cpscsi
