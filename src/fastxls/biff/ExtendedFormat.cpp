#include "fastxls/biff/ExtendedFormat.hpp"

#include <algorithm>

namespace fastxls {
namespace biff {

namespace {
constexpr uint8_t kUsedFormatFlag = 0x04;
}

ExtendedFormat ExtendedFormat::fromRecord(const Record& record, BiffVersion version) {
    ExtendedFormat xf;
    switch (record.id) {
        case RecordType::XF_V2:
            xf.layout_ = XfLayout::V2;
            break;
        case RecordType::XF_V3:
            xf.layout_ = XfLayout::V3;
            break;
        case RecordType::XF_V4:
            xf.layout_ = XfLayout::V4;
            break;
        default:
            xf.layout_ = (version == BiffVersion::Biff8) ? XfLayout::V8 : XfLayout::V5;
            break;
    }
    const size_t count = std::min(kKeptBytes, record.size());
    std::copy(record.payload.begin(), record.payload.begin() + count, xf.bytes_.begin());
    return xf;
}

uint16_t ExtendedFormat::fontIndex() const {
    switch (layout_) {
        case XfLayout::V2:
        case XfLayout::V3:
        case XfLayout::V4:
            return byteAt(0);
        default:
            return static_cast<uint16_t>(byteAt(0) | (byteAt(1) << 8));
    }
}

std::optional<uint16_t> ExtendedFormat::formatCode() const {
    switch (layout_) {
        case XfLayout::V2:
            return static_cast<uint16_t>(byteAt(2) & 0x3F);
        case XfLayout::V3:
            if ((byteAt(3) & kUsedFormatFlag) == 0) {
                return std::nullopt;
            }
            return byteAt(1);
        case XfLayout::V4:
            if ((byteAt(5) & kUsedFormatFlag) == 0) {
                return std::nullopt;
            }
            return byteAt(1);
        case XfLayout::V5:
            if ((byteAt(7) & kUsedFormatFlag) == 0) {
                return std::nullopt;
            }
            return static_cast<uint16_t>(byteAt(2) | (byteAt(3) << 8));
        case XfLayout::V8:
            if ((byteAt(9) & kUsedFormatFlag) == 0) {
                return std::nullopt;
            }
            return static_cast<uint16_t>(byteAt(2) | (byteAt(3) << 8));
    }
    return std::nullopt;
}

}} // namespace fastxls::biff
