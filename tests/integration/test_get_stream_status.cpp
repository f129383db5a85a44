#include "cpscsi/commands/get_stream_status.hpp"
#include "cpscsi/error.hpp"
#include "cpscsi/scsi.hpp"
#include "util/scripted_transport.hpp"

#include <cassert>
#include <cerrno>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

using namespace cpscsi;

namespace {

testutil::ScriptedTransport::Handler replyWith(std::uint32_t parameter_data_length,
                                               std::uint16_t open_streams,
                                               std::vector<std::uint16_t> identifiers) {
    return [=](const std::vector<std::uint8_t>&, std::uint8_t* data, std::uint32_t data_length) {
        testutil::writeStreamStatusReply(data, data_length, parameter_data_length, open_streams, identifiers);
        return TransportStatus{};
    };
}

} // namespace

int main() {
    using cpscsi::testutil::ScriptedTransport;

    spdlog::set_level(spdlog::level::trace);

    // Test 1: End-to-end decode of a short reply
    {
        ScriptedTransport transport(replyWith(8 + 2 * 8, 5, {10, 20}));
        Scsi scsi(transport);

        auto result = scsi.getStreamStatus()
                          .startingStreamIdentifier(0x0102)
                          .control(0x04)
                          .descriptorLength(3)
                          .issue();

        assert(result.total_descriptor_length == 2);
        assert(result.number_of_open_streams == 5);
        assert((result.stream_identifiers == std::vector<std::uint16_t>{10, 20}));

        assert(transport.callCount() == 1);
        const auto& request = transport.lastRequest();
        assert(request.direction == DataDirection::FromDevice);
        assert(request.has_data_buffer);
        assert(request.data_length == 8 + 3 * 8);
        assert(request.timeout == std::chrono::milliseconds(60000));
        assert(request.sense_buffer_size == 64);

        assert(request.cdb.size() == 16);
        const auto cdb = GetStreamStatusCdb::fromBytes(request.cdb.data(), request.cdb.size());
        assert(cdb.operationCode() == 0x9E);
        assert(cdb.serviceAction() == 0x16);
        assert(cdb.startingStreamIdentifier() == 0x0102);
        assert(cdb.allocationLength() == 32);
        assert(cdb.control() == 0x04);
        assert(request.cdb[2] == 0 && request.cdb[3] == 0);
        assert(request.cdb[6] == 0 && request.cdb[7] == 0 && request.cdb[8] == 0 && request.cdb[9] == 0);
        assert(request.cdb[14] == 0);
    }

    // Test 2: Device reports more descriptors than the buffer holds
    {
        ScriptedTransport transport(replyWith(8 + 5 * 8, 7, {1, 2, 3, 4, 5}));
        Scsi scsi(transport);

        auto result = scsi.getStreamStatus().descriptorLength(2).issue();
        assert(result.total_descriptor_length == 5);
        assert(result.number_of_open_streams == 7);
        assert((result.stream_identifiers == std::vector<std::uint16_t>{1, 2}));
    }

    // Test 3: Device reports fewer descriptors than requested
    {
        ScriptedTransport transport(replyWith(8 + 1 * 8, 1, {42}));
        Scsi scsi(transport);

        auto result = scsi.getStreamStatus().descriptorLength(4).issue();
        assert(result.total_descriptor_length == 1);
        assert((result.stream_identifiers == std::vector<std::uint16_t>{42}));
    }

    // Test 4: Header-only request and undersized length field
    {
        ScriptedTransport transport(replyWith(8 + 2 * 8, 2, {}));
        Scsi scsi(transport);

        auto result = scsi.getStreamStatus().issue();
        assert(transport.lastRequest().data_length == 8);
        assert(result.total_descriptor_length == 2);
        assert(result.number_of_open_streams == 2);
        assert(result.stream_identifiers.empty());

        transport.setHandler(replyWith(4, 0, {}));
        auto empty = scsi.getStreamStatus().descriptorLength(2).issue();
        assert(empty.total_descriptor_length == 0);
        assert(empty.stream_identifiers.empty());
    }

    // Test 5: Allocation length limits
    {
        assert(kMaxStreamStatusDescriptors == 536870910u);
        assert(streamStatusAllocationLength(0) == 8);
        assert(streamStatusAllocationLength(3) == 32);
        assert(streamStatusAllocationLength(kMaxStreamStatusDescriptors) == 0xFFFFFFF8u);

        ScriptedTransport transport;
        Scsi scsi(transport);

        const std::vector<std::uint32_t> rejected{kMaxStreamStatusDescriptors + 1,
                                                  std::numeric_limits<std::uint32_t>::max()};
        for (auto value : rejected) {
            bool threw = false;
            try {
                scsi.getStreamStatus().descriptorLength(value).issue();
            } catch (const ArgumentOutOfBoundsError& e) {
                threw = true;
                assert(e.limit() == kMaxStreamStatusDescriptors);
                assert(e.value() == value);
                const std::string message = e.what();
                assert(message.find("536870910") != std::string::npos);
                assert(message.find(std::to_string(value)) != std::string::npos);
            }
            assert(threw);
        }
        assert(transport.callCount() == 0);
    }

    // Test 6: Transport failure takes precedence over device status
    {
        ScriptedTransport transport([](const std::vector<std::uint8_t>&, std::uint8_t*, std::uint32_t) {
            TransportStatus status{};
            status.system_error = EIO;
            status.scsi_status = scsi_status::kCheckCondition;
            status.sense = testutil::makeFixedSense(0x05, 0x24, 0x00);
            return status;
        });
        Scsi scsi(transport);

        bool transport_error = false;
        bool device_error = false;
        try {
            scsi.getStreamStatus().descriptorLength(1).issue();
        } catch (const TransportError& e) {
            transport_error = true;
            assert(e.systemError() == EIO);
        } catch (const DeviceError&) {
            device_error = true;
        }
        assert(transport_error);
        assert(!device_error);

        transport.setHandler([](const std::vector<std::uint8_t>&, std::uint8_t*, std::uint32_t) {
            TransportStatus status{};
            status.host_status = 0x0003; // DID_TIME_OUT
            status.scsi_status = scsi_status::kCheckCondition;
            return status;
        });
        transport_error = false;
        try {
            scsi.getStreamStatus().descriptorLength(1).issue();
        } catch (const TransportError& e) {
            transport_error = true;
            assert(e.hostStatus() == 0x0003);
        }
        assert(transport_error);
    }

    // Test 7: Device errors carry status and sense
    {
        ScriptedTransport transport([](const std::vector<std::uint8_t>&, std::uint8_t*, std::uint32_t) {
            TransportStatus status{};
            status.driver_status = kDriverSense;
            status.scsi_status = scsi_status::kCheckCondition;
            status.sense = testutil::makeFixedSense(0x05, 0x20, 0x00);
            return status;
        });
        Scsi scsi(transport);

        bool threw = false;
        try {
            scsi.getStreamStatus().descriptorLength(8).issue();
        } catch (const DeviceError& e) {
            threw = true;
            assert(e.status() == scsi_status::kCheckCondition);
            assert(e.sense().valid);
            assert(e.sense().sense_key == SenseKey::IllegalRequest);
            assert(e.sense().asc == 0x20);
        }
        assert(threw);

        transport.setHandler([](const std::vector<std::uint8_t>&, std::uint8_t*, std::uint32_t) {
            TransportStatus status{};
            status.scsi_status = scsi_status::kBusy;
            return status;
        });
        threw = false;
        try {
            scsi.getStreamStatus().issue();
        } catch (const DeviceError& e) {
            threw = true;
            assert(e.status() == scsi_status::kBusy);
            assert(!e.sense().valid);
        }
        assert(threw);
    }

    // Test 8: A command can only be issued once
    {
        ScriptedTransport transport(replyWith(8 + 8, 1, {3}));
        Scsi scsi(transport);

        auto command = scsi.getStreamStatus();
        command.descriptorLength(1);
        assert(!command.isIssued());
        auto first = command.issue();
        assert(first.stream_identifiers.size() == 1);
        assert(command.isIssued());

        bool threw = false;
        try {
            command.issue();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            command.control(0x01);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        assert(transport.callCount() == 1);

        // A rejected capacity still consumes the command
        auto rejected = scsi.getStreamStatus();
        rejected.descriptorLength(std::numeric_limits<std::uint32_t>::max());
        threw = false;
        try {
            rejected.issue();
        } catch (const ArgumentOutOfBoundsError&) {
            threw = true;
        }
        assert(threw);
        assert(rejected.isIssued());
    }

    return 0;
}
