#include "cpscsi/commands/get_stream_status.hpp"

// GET STREAM STATUS (SSC-4 6.5)。応答の記述子数はヘッダーを読むまで分からないため、
// 呼び出し側が指定した上限ぶんのバッファを確保し、申告値はその容量でクランプする。

#include "cpscsi/command.hpp"
#include "cpscsi/error.hpp"
#include "cpscsi/scsi.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cpscsi {

namespace {

// パラメータデータ長から差し引く固定長（記述子以外の部分）。
constexpr std::uint32_t kLengthOverhead = 8;

enum CdbField : std::size_t {
    kCdbOperationCode = 0,
    kCdbReserved0,
    kCdbServiceAction,
    kCdbReserved1,
    kCdbStartingStreamIdentifier,
    kCdbReserved2,
    kCdbAllocationLength,
    kCdbReserved3,
    kCdbControl
};

enum HeaderField : std::size_t {
    kHeaderParameterDataLength = 0,
    kHeaderReserved,
    kHeaderNumberOfOpenStreams
};

enum DescriptorField : std::size_t {
    kDescriptorReserved0 = 0,
    kDescriptorStreamIdentifier,
    kDescriptorReserved1
};

class StreamStatusTransaction
    : public Command<GetStreamStatusCdb, StreamStatusBuffer, GetStreamStatusResult> {
public:
    StreamStatusTransaction(const GetStreamStatusCdb& cdb, std::uint32_t max_descriptor_length)
        : cdb_(cdb), max_descriptor_length_(max_descriptor_length) {}

    DataDirection direction() const override {
        return DataDirection::FromDevice;
    }

    GetStreamStatusCdb command() const override {
        return cdb_;
    }

    StreamStatusBuffer data() const override {
        return StreamStatusBuffer(max_descriptor_length_);
    }

    std::uint32_t dataSize() const override {
        return streamStatusAllocationLength(max_descriptor_length_);
    }

    GetStreamStatusResult processResult(ResultData<StreamStatusBuffer> result) const override {
        result.checkTransportError();
        result.checkDeviceError();

        const auto header = result.data.header();
        const std::uint32_t length = header.parameterDataLength();
        const std::size_t reported =
            length < kLengthOverhead ? 0 : (length - kLengthOverhead) / StreamStatusDescriptor::kSize;

        const auto descriptors = result.data.elements(reported);
        if (descriptors.size() < reported) {
            spdlog::warn("GET STREAM STATUS reported {} descriptors, only {} fit in the buffer",
                         reported, descriptors.size());
        }

        GetStreamStatusResult status{};
        status.total_descriptor_length = reported;
        status.number_of_open_streams = header.numberOfOpenStreams();
        status.stream_identifiers.reserve(descriptors.size());
        for (std::size_t i = 0; i < descriptors.size(); ++i) {
            status.stream_identifiers.push_back(descriptors[i].streamIdentifier());
        }
        return status;
    }

private:
    GetStreamStatusCdb cdb_;
    std::uint32_t max_descriptor_length_;
};

} // namespace

// ========================================
// GetStreamStatusCdb
// ========================================

GetStreamStatusCdb::GetStreamStatusCdb() {
    layout_.set<kCdbOperationCode>(kOperationCode);
    layout_.set<kCdbServiceAction>(kServiceAction);
}

GetStreamStatusCdb GetStreamStatusCdb::fromBytes(const std::uint8_t* data, std::size_t size) {
    return GetStreamStatusCdb(Layout::fromBytes(data, size));
}

std::uint8_t GetStreamStatusCdb::operationCode() const noexcept {
    return static_cast<std::uint8_t>(layout_.get<kCdbOperationCode>());
}

std::uint8_t GetStreamStatusCdb::serviceAction() const noexcept {
    return static_cast<std::uint8_t>(layout_.get<kCdbServiceAction>());
}

std::uint16_t GetStreamStatusCdb::startingStreamIdentifier() const noexcept {
    return static_cast<std::uint16_t>(layout_.get<kCdbStartingStreamIdentifier>());
}

std::uint32_t GetStreamStatusCdb::allocationLength() const noexcept {
    return static_cast<std::uint32_t>(layout_.get<kCdbAllocationLength>());
}

std::uint8_t GetStreamStatusCdb::control() const noexcept {
    return static_cast<std::uint8_t>(layout_.get<kCdbControl>());
}

GetStreamStatusCdb& GetStreamStatusCdb::setStartingStreamIdentifier(std::uint16_t value) {
    layout_.set<kCdbStartingStreamIdentifier>(value);
    return *this;
}

GetStreamStatusCdb& GetStreamStatusCdb::setAllocationLength(std::uint32_t value) {
    layout_.set<kCdbAllocationLength>(value);
    return *this;
}

GetStreamStatusCdb& GetStreamStatusCdb::setControl(std::uint8_t value) {
    layout_.set<kCdbControl>(value);
    return *this;
}

// ========================================
// StreamStatusHeader / StreamStatusDescriptor
// ========================================

StreamStatusHeader StreamStatusHeader::fromBytes(const std::uint8_t* data, std::size_t size) {
    return StreamStatusHeader(Layout::fromBytes(data, size));
}

std::uint32_t StreamStatusHeader::parameterDataLength() const noexcept {
    return static_cast<std::uint32_t>(layout_.get<kHeaderParameterDataLength>());
}

std::uint16_t StreamStatusHeader::numberOfOpenStreams() const noexcept {
    return static_cast<std::uint16_t>(layout_.get<kHeaderNumberOfOpenStreams>());
}

StreamStatusHeader& StreamStatusHeader::setParameterDataLength(std::uint32_t value) {
    layout_.set<kHeaderParameterDataLength>(value);
    return *this;
}

StreamStatusHeader& StreamStatusHeader::setNumberOfOpenStreams(std::uint16_t value) {
    layout_.set<kHeaderNumberOfOpenStreams>(value);
    return *this;
}

StreamStatusDescriptor StreamStatusDescriptor::fromBytes(const std::uint8_t* data, std::size_t size) {
    return StreamStatusDescriptor(Layout::fromBytes(data, size));
}

std::uint16_t StreamStatusDescriptor::streamIdentifier() const noexcept {
    return static_cast<std::uint16_t>(layout_.get<kDescriptorStreamIdentifier>());
}

StreamStatusDescriptor& StreamStatusDescriptor::setStreamIdentifier(std::uint16_t value) {
    layout_.set<kDescriptorStreamIdentifier>(value);
    return *this;
}

std::uint32_t streamStatusAllocationLength(std::uint32_t descriptor_length) {
    if (descriptor_length > kMaxStreamStatusDescriptors) {
        throw ArgumentOutOfBoundsError("descriptor length", kMaxStreamStatusDescriptors, descriptor_length);
    }
    const std::uint64_t length = StreamStatusHeader::kSize +
                                 static_cast<std::uint64_t>(descriptor_length) * StreamStatusDescriptor::kSize;
    return static_cast<std::uint32_t>(length);
}

// ========================================
// GetStreamStatusCommand
// ========================================

GetStreamStatusCommand::GetStreamStatusCommand(const Scsi& scsi)
    : scsi_(&scsi) {}

void GetStreamStatusCommand::ensureNotIssued() const {
    if (issued_) {
        throw std::logic_error("GET STREAM STATUS command has already been issued");
    }
}

GetStreamStatusCommand& GetStreamStatusCommand::startingStreamIdentifier(std::uint16_t value) {
    ensureNotIssued();
    cdb_.setStartingStreamIdentifier(value);
    return *this;
}

GetStreamStatusCommand& GetStreamStatusCommand::control(std::uint8_t value) {
    ensureNotIssued();
    cdb_.setControl(value);
    return *this;
}

GetStreamStatusCommand& GetStreamStatusCommand::descriptorLength(std::uint32_t value) {
    ensureNotIssued();
    descriptor_length_ = value;
    return *this;
}

GetStreamStatusResult GetStreamStatusCommand::issue() {
    ensureNotIssued();
    issued_ = true;

    cdb_.setAllocationLength(streamStatusAllocationLength(descriptor_length_));
    const StreamStatusTransaction transaction(cdb_, descriptor_length_);
    return scsi_->issue(transaction);
}

} // namespace cpscsi
