#include "fastxls/biff/SharedStringTable.hpp"
#include "fastxls/biff/TextEncoding.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace fastxls {
namespace biff {

namespace {

constexpr uint8_t kFlagHighByte = 0x01;
constexpr uint8_t kFlagExtended = 0x04;
constexpr uint8_t kFlagRichText = 0x08;

/**
 * @brief 跨 CONTINUE 段的读取游标
 */
class SegmentCursor {
public:
    explicit SegmentCursor(const std::vector<std::vector<uint8_t>>& segments)
        : segments_(segments) {
        skipEmpty();
    }

    bool atEnd() const { return segment_ >= segments_.size(); }

    // 当前段剩余字节数
    size_t remaining() const {
        return atEnd() ? 0 : segments_[segment_].size() - pos_;
    }

    uint8_t u8() {
        if (atEnd()) {
            return 0;
        }
        const uint8_t value = segments_[segment_][pos_++];
        crossed_ = false;
        skipEmpty();
        return value;
    }

    uint16_t u16() {
        const uint16_t lo = u8();
        return static_cast<uint16_t>(lo | (u8() << 8));
    }

    uint32_t u32() {
        const uint32_t lo = u16();
        return lo | (static_cast<uint32_t>(u16()) << 16);
    }

    void skip(size_t count) {
        while (count > 0 && !atEnd()) {
            const size_t step = std::min(count, remaining());
            pos_ += step;
            count -= step;
            skipEmpty();
        }
    }

    /**
     * @brief 读取字符数据；字符数组在段边界处被拆分时，新段以一个选项字节开头
     */
    std::string characters(size_t count, bool high_byte) {
        std::string text;
        while (count > 0 && !atEnd()) {
            if (crossed_) {
                high_byte = (segments_[segment_][pos_] & kFlagHighByte) != 0;
                ++pos_;
                crossed_ = false;
                skipEmpty();
                continue;
            }

            const size_t unit = high_byte ? 2 : 1;
            const size_t available = remaining() / unit;
            const size_t take = std::min(count, available);
            core::ByteView bytes(segments_[segment_].data() + pos_, take * unit);
            text += high_byte ? TextEncoding::decodeUtf16(bytes) : TextEncoding::decodeLatin1(bytes);
            pos_ += take * unit;
            count -= take;

            if (count > 0 && remaining() < unit) {
                // 残余奇数字节不构成字符，直接进入下一段
                pos_ = segments_[segment_].size();
            }
            skipEmpty();
        }
        return text;
    }

private:
    void skipEmpty() {
        while (segment_ < segments_.size() && pos_ >= segments_[segment_].size()) {
            ++segment_;
            pos_ = 0;
            crossed_ = true;
        }
    }

    const std::vector<std::vector<uint8_t>>& segments_;
    size_t segment_ = 0;
    size_t pos_ = 0;
    bool crossed_ = false;      // 刚进入新段，尚未读取任何字节
};

} // namespace

void SharedStringTable::begin(const Record& sst) {
    segments_.clear();
    strings_.clear();
    total_count_ = sst.u32(0);
    unique_count_ = sst.u32(4);
    const core::ByteView body = sst.bytes(8);
    segments_.emplace_back(body.begin(), body.end());
    started_ = true;
    materialized_ = false;
}

void SharedStringTable::append(const Record& continuation) {
    if (!started_ || materialized_) {
        return;
    }
    segments_.emplace_back(continuation.payload.begin(), continuation.payload.end());
}

void SharedStringTable::materialize() {
    if (materialized_) {
        return;
    }

    strings_.clear();
    strings_.reserve(unique_count_);
    SegmentCursor cursor(segments_);
    for (uint32_t i = 0; i < unique_count_; ++i) {
        if (cursor.atEnd()) {
            BIFF_WARN("SST declares {} strings but data ends after {}", unique_count_, i);
            break;
        }
        const uint16_t count = cursor.u16();
        const uint8_t flags = cursor.u8();
        const uint16_t runs = (flags & kFlagRichText) ? cursor.u16() : 0;
        const uint32_t ext_size = (flags & kFlagExtended) ? cursor.u32() : 0;

        strings_.push_back(cursor.characters(count, (flags & kFlagHighByte) != 0));
        cursor.skip(static_cast<size_t>(runs) * 4);
        cursor.skip(ext_size);
    }

    segments_.clear();
    segments_.shrink_to_fit();
    materialized_ = true;
    BIFF_DEBUG("SST materialized: {} unique of {} total", strings_.size(), total_count_);
}

core::Result<std::string> SharedStringTable::getString(uint32_t index) const {
    if (!materialized_) {
        return core::makeError(core::ErrorCode::SharedStringsNotReady,
                               "shared string table queried before globals were complete");
    }
    if (index >= strings_.size()) {
        return core::makeError(core::ErrorCode::InvalidSharedStringIndex,
                               fmt::format("shared string index {} out of range ({})", index, strings_.size()));
    }
    return strings_[index];
}

}} // namespace fastxls::biff
