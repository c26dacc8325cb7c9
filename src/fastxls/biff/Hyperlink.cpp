#include "fastxls/biff/Hyperlink.hpp"
#include "fastxls/biff/TextEncoding.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <array>

namespace fastxls {
namespace biff {

namespace {

constexpr uint32_t kHasMoniker = 0x0001;
constexpr uint32_t kHasLocation = 0x0008;
constexpr uint32_t kHasDisplayName = 0x0010;
constexpr uint32_t kHasFrameName = 0x0080;
constexpr uint32_t kMonikerSavedAsString = 0x0100;

constexpr std::array<uint8_t, 16> kUrlMonikerClsid = {
    0xE0, 0xC9, 0xEA, 0x79, 0xF9, 0xBA, 0xCE, 0x11,
    0x8C, 0x82, 0x00, 0xAA, 0x00, 0x4B, 0xA9, 0x0B};

constexpr std::array<uint8_t, 16> kFileMonikerClsid = {
    0x03, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46};

// 去掉末尾的 NUL 字符
std::string trimNul(std::string text) {
    const size_t nul = text.find('\0');
    if (nul != std::string::npos) {
        text.resize(nul);
    }
    return text;
}

class HlinkReader {
public:
    explicit HlinkReader(const Record& record, size_t pos)
        : record_(record), pos_(pos) {}

    bool atEnd() const { return pos_ >= record_.size(); }

    uint16_t u16() { const uint16_t v = record_.u16(pos_); pos_ += 2; return v; }
    uint32_t u32() { const uint32_t v = record_.u32(pos_); pos_ += 4; return v; }
    void skip(size_t count) { pos_ += count; }

    bool matches(const std::array<uint8_t, 16>& clsid) const {
        const core::ByteView bytes = record_.bytes(pos_, clsid.size());
        return bytes.size() == clsid.size() && std::equal(clsid.begin(), clsid.end(), bytes.begin());
    }

    // HyperlinkString：u32 字符数（含结尾NUL）+ UTF-16
    std::string hyperlinkString() {
        const uint32_t count = u32();
        return utf16Bytes(static_cast<size_t>(count) * 2);
    }

    std::string utf16Bytes(size_t byte_count) {
        const core::ByteView bytes = record_.bytes(pos_, byte_count);
        pos_ += byte_count;
        return trimNul(TextEncoding::decodeUtf16(bytes));
    }

    std::string latin1Bytes(size_t byte_count) {
        const core::ByteView bytes = record_.bytes(pos_, byte_count);
        pos_ += byte_count;
        return trimNul(TextEncoding::decodeLatin1(bytes));
    }

private:
    const Record& record_;
    size_t pos_;
};

std::string readFileMoniker(HlinkReader& reader) {
    const uint16_t anti_count = reader.u16();
    const uint32_t ansi_length = reader.u32();
    std::string path = reader.latin1Bytes(ansi_length);
    reader.skip(2 + 2 + 20);  // endServer, 0xDEAD 版本号, 保留字节

    const uint32_t unicode_size = reader.u32();
    if (unicode_size > 0) {
        const uint32_t unicode_bytes = reader.u32();
        reader.skip(2);  // usKeyValue = 3
        path = reader.utf16Bytes(unicode_bytes);
    }

    std::string prefix;
    for (uint16_t i = 0; i < anti_count; ++i) {
        prefix += "../";
    }
    return prefix + path;
}

} // namespace

std::string Hyperlink::target() const {
    if (url.empty()) {
        return location;
    }
    if (location.empty()) {
        return url;
    }
    return url + "#" + location;
}

Hyperlink decodeHyperlink(const Record& record) {
    Hyperlink link;
    link.first_row = record.u16(0);
    link.last_row = record.u16(2);
    link.first_col = record.u16(4);
    link.last_col = record.u16(6);

    const uint32_t flags = record.u32(28);
    HlinkReader reader(record, 32);

    if (flags & kHasDisplayName) {
        link.display_name = reader.hyperlinkString();
    }
    if (flags & kHasFrameName) {
        link.frame = reader.hyperlinkString();
    }
    if (flags & kHasMoniker) {
        if (flags & kMonikerSavedAsString) {
            link.url = reader.hyperlinkString();
        } else if (reader.matches(kUrlMonikerClsid)) {
            reader.skip(16);
            const uint32_t length = reader.u32();
            link.url = reader.utf16Bytes(length);
        } else if (reader.matches(kFileMonikerClsid)) {
            reader.skip(16);
            link.url = readFileMoniker(reader);
        } else {
            BIFF_DEBUG("HLINK at {} uses an unsupported moniker", record.offset);
            if (flags & kHasLocation) {
                // 无法确定名字对象长度，放弃位置字符串
                return link;
            }
        }
    }
    if ((flags & kHasLocation) && !reader.atEnd()) {
        link.location = reader.hyperlinkString();
    }
    return link;
}

}} // namespace fastxls::biff
