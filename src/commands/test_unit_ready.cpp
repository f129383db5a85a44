#include "cpscsi/commands/test_unit_ready.hpp"

#include "cpscsi/codec/flexible_buffer.hpp"
#include "cpscsi/command.hpp"
#include "cpscsi/scsi.hpp"

#include <stdexcept>

namespace cpscsi {

namespace {

enum CdbField : std::size_t {
    kCdbOperationCode = 0,
    kCdbReserved,
    kCdbControl
};

class TestUnitReadyTransaction : public Command<TestUnitReadyCdb, codec::NoDataBuffer, void> {
public:
    explicit TestUnitReadyTransaction(const TestUnitReadyCdb& cdb) : cdb_(cdb) {}

    DataDirection direction() const override { return DataDirection::None; }
    TestUnitReadyCdb command() const override { return cdb_; }
    codec::NoDataBuffer data() const override { return {}; }
    std::uint32_t dataSize() const override { return 0; }

    void processResult(ResultData<codec::NoDataBuffer> result) const override {
        result.checkErrors();
    }

private:
    TestUnitReadyCdb cdb_;
};

} // namespace

TestUnitReadyCdb::TestUnitReadyCdb() {
    layout_.set<kCdbOperationCode>(kOperationCode);
}

TestUnitReadyCdb TestUnitReadyCdb::fromBytes(const std::uint8_t* data, std::size_t size) {
    return TestUnitReadyCdb(Layout::fromBytes(data, size));
}

std::uint8_t TestUnitReadyCdb::operationCode() const noexcept {
    return static_cast<std::uint8_t>(layout_.get<kCdbOperationCode>());
}

std::uint8_t TestUnitReadyCdb::control() const noexcept {
    return static_cast<std::uint8_t>(layout_.get<kCdbControl>());
}

TestUnitReadyCdb& TestUnitReadyCdb::setControl(std::uint8_t value) {
    layout_.set<kCdbControl>(value);
    return *this;
}

TestUnitReadyCommand::TestUnitReadyCommand(const Scsi& scsi)
    : scsi_(&scsi) {}

void TestUnitReadyCommand::ensureNotIssued() const {
    if (issued_) {
        throw std::logic_error("TEST UNIT READY command has already been issued");
    }
}

TestUnitReadyCommand& TestUnitReadyCommand::control(std::uint8_t value) {
    ensureNotIssued();
    cdb_.setControl(value);
    return *this;
}

void TestUnitReadyCommand::issue() {
    ensureNotIssued();
    issued_ = true;
    scsi_->issue(TestUnitReadyTransaction(cdb_));
}

} // namespace cpscsi
