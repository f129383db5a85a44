#include "cpscsi/scsi.hpp"

#include "cpscsi/commands/get_stream_status.hpp"
#include "cpscsi/commands/test_unit_ready.hpp"

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/bin_to_hex.h>

namespace cpscsi {

struct Scsi::Impl {
    Transport* transport = nullptr;
    ScsiConfig config{};
};

Scsi::Scsi(Transport& transport, const ScsiConfig& config)
    : impl_(std::make_unique<Impl>()) {
    config.validate();
    impl_->transport = &transport;
    impl_->config = config;
}

Scsi::~Scsi() = default;

const ScsiConfig& Scsi::config() const noexcept {
    return impl_->config;
}

GetStreamStatusCommand Scsi::getStreamStatus() const {
    return GetStreamStatusCommand(*this);
}

TestUnitReadyCommand Scsi::testUnitReady() const {
    return TestUnitReadyCommand(*this);
}

TransportStatus Scsi::execute(DataDirection direction,
                              const std::uint8_t* cdb,
                              std::size_t cdb_length,
                              std::uint8_t* data,
                              std::size_t buffer_size,
                              std::uint32_t data_size) const {
    if (cdb == nullptr || cdb_length == 0) {
        throw std::logic_error("Command produced an empty CDB");
    }
    // 受信バッファより多く転送させるとトランスポートが範囲外へ書き込む。
    if (direction != DataDirection::None && data_size > buffer_size) {
        throw std::logic_error("Command data size " + std::to_string(data_size) +
                               " exceeds its data buffer (" + std::to_string(buffer_size) + " bytes)");
    }
    // 受信時は確保したバッファ全体を転送長として宣言する。
    if (direction == DataDirection::FromDevice && data_size != buffer_size) {
        throw std::logic_error("Command data size " + std::to_string(data_size) +
                               " does not match its reply buffer (" + std::to_string(buffer_size) + " bytes)");
    }

    TransportRequest request{};
    request.direction = direction;
    request.cdb = cdb;
    request.cdb_length = cdb_length;
    request.data = direction == DataDirection::None ? nullptr : data;
    request.data_length = direction == DataDirection::None ? 0 : data_size;
    request.timeout = impl_->config.timeout;
    request.sense_buffer_size = impl_->config.sense_buffer_size;

    spdlog::debug("Issuing SCSI command 0x{:02X} ({} byte CDB), direction={}, data_size={}",
                  cdb[0], cdb_length, toString(direction), request.data_length);
    spdlog::trace("CDB: {}", spdlog::to_hex(cdb, cdb + cdb_length));

    return impl_->transport->execute(request);
}

} // namespace cpscsi
