#include "fastxls/biff/RecordStream.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

namespace fastxls {
namespace biff {

RecordStream::RecordStream(std::vector<uint8_t> data, core::ReadMode mode)
    : data_(std::move(data))
    , mode_(mode) {
}

core::Result<std::optional<Record>> RecordStream::readAt(size_t offset) const {
    if (offset >= data_.size() || data_.size() - offset < Record::kHeaderSize) {
        return std::optional<Record>{};
    }

    const uint8_t* head = data_.data() + offset;
    Record record;
    record.id = utils::readLe<uint16_t>(head);
    record.offset = offset;

    const size_t declared = utils::readLe<uint16_t>(head + 2);
    const size_t available = data_.size() - offset - Record::kHeaderSize;
    size_t length = declared;
    if (declared > available) {
        if (mode_ == core::ReadMode::Strict) {
            return core::makeError(core::ErrorCode::RecordTruncated,
                                   fmt::format("record 0x{:04X} at {} declares {} bytes, {} remain",
                                               record.id, offset, declared, available));
        }
        BIFF_WARN("Record 0x{:04X} at {} truncated from {} to {} bytes", record.id, offset, declared, available);
        length = available;
        record.truncated = true;
    }

    record.payload = core::ByteView(head + Record::kHeaderSize, length);
    return std::optional<Record>(record);
}

core::Result<std::optional<Record>> RecordStream::readNext() {
    auto result = readAt(position_);
    if (result && result.value()) {
        position_ = result.value()->endOffset();
    }
    return result;
}

}} // namespace fastxls::biff
