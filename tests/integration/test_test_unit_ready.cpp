#include "cpscsi/commands/test_unit_ready.hpp"
#include "cpscsi/error.hpp"
#include "cpscsi/scsi.hpp"
#include "util/scripted_transport.hpp"

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

int main() {
    using namespace cpscsi;
    using cpscsi::testutil::ScriptedTransport;

    // Test 1: Ready device
    {
        ScriptedTransport transport;
        Scsi scsi(transport);

        scsi.testUnitReady().control(0x80).issue();

        assert(transport.callCount() == 1);
        const auto& request = transport.lastRequest();
        assert(request.direction == DataDirection::None);
        assert(!request.has_data_buffer);
        assert(request.data_length == 0);
        assert((request.cdb == std::vector<std::uint8_t>{0x00, 0x00, 0x00, 0x00, 0x00, 0x80}));

        const auto cdb = TestUnitReadyCdb::fromBytes(request.cdb.data(), request.cdb.size());
        assert(cdb.operationCode() == 0x00);
        assert(cdb.control() == 0x80);
    }

    // Test 2: Not ready
    {
        ScriptedTransport transport([](const std::vector<std::uint8_t>&, std::uint8_t* data, std::uint32_t length) {
            assert(data == nullptr);
            assert(length == 0);
            TransportStatus status{};
            status.scsi_status = scsi_status::kCheckCondition;
            status.sense = testutil::makeFixedSense(0x02, 0x04, 0x01);
            return status;
        });
        Scsi scsi(transport);

        bool threw = false;
        try {
            scsi.testUnitReady().issue();
        } catch (const DeviceError& e) {
            threw = true;
            assert(e.sense().sense_key == SenseKey::NotReady);
            assert(e.sense().asc == 0x04);
            assert(e.sense().ascq == 0x01);
        }
        assert(threw);
    }

    // Test 3: Single shot
    {
        ScriptedTransport transport;
        Scsi scsi(transport);

        auto command = scsi.testUnitReady();
        command.issue();
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
            command.control(0x40);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        assert(transport.callCount() == 1);
    }

    return 0;
}
