#include "fastxls/biff/TextEncoding.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <utf8.h>
#include <iconv.h>

#include <cerrno>
#include <iterator>

namespace fastxls {
namespace biff {

namespace {

constexpr uint32_t kReplacementChar = 0xFFFD;

// iconv_t 的RAII包装
class IconvHandle {
public:
    explicit IconvHandle(const char* from_code)
        : handle_(iconv_open("UTF-8", from_code)) {}

    ~IconvHandle() {
        if (isOpen()) {
            iconv_close(handle_);
        }
    }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool isOpen() const { return handle_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return handle_; }

private:
    iconv_t handle_;
};

void appendReplacement(std::string& out) {
    utf8::append(static_cast<uint32_t>(kReplacementChar), std::back_inserter(out));
}

} // namespace

TextEncoding::TextEncoding()
    : code_page_(kDefaultCodePage)
    , iconv_name_("CP1252") {
}

TextEncoding::TextEncoding(uint16_t code_page, std::string iconv_name)
    : code_page_(code_page)
    , iconv_name_(std::move(iconv_name)) {
}

const char* TextEncoding::iconvNameFor(uint16_t code_page) {
    switch (code_page) {
        case 367:   return "ASCII";
        case 437:   return "CP437";
        case 720:   return "CP720";
        case 737:   return "CP737";
        case 775:   return "CP775";
        case 850:   return "CP850";
        case 852:   return "CP852";
        case 855:   return "CP855";
        case 857:   return "CP857";
        case 858:   return "CP858";
        case 860:   return "CP860";
        case 861:   return "CP861";
        case 862:   return "CP862";
        case 863:   return "CP863";
        case 864:   return "CP864";
        case 865:   return "CP865";
        case 866:   return "CP866";
        case 869:   return "CP869";
        case 874:   return "CP874";
        case 932:   return "CP932";
        case 936:   return "CP936";
        case 949:   return "CP949";
        case 950:   return "CP950";
        case 1200:  return "UTF-16LE";
        case 1250:  return "CP1250";
        case 1251:  return "CP1251";
        case 1252:  return "CP1252";
        case 1253:  return "CP1253";
        case 1254:  return "CP1254";
        case 1255:  return "CP1255";
        case 1256:  return "CP1256";
        case 1257:  return "CP1257";
        case 1258:  return "CP1258";
        case 1361:  return "JOHAB";
        case 10000: return "MACINTOSH";
        case 32768: return "MACINTOSH";
        case 32769: return "CP1252";
        case 65001: return "UTF-8";
        default:    return nullptr;
    }
}

std::optional<TextEncoding> TextEncoding::fromCodePage(uint16_t code_page) {
    const char* name = iconvNameFor(code_page);
    if (name == nullptr) {
        return std::nullopt;
    }
    if (code_page != 1200 && code_page != 65001) {
        IconvHandle handle(name);
        if (!handle.isOpen()) {
            BIFF_DEBUG("iconv cannot open code page {} ({})", code_page, name);
            return std::nullopt;
        }
    }
    return TextEncoding(code_page, name);
}

std::string TextEncoding::decodeLatin1(core::ByteView bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes) {
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
        } else {
            utf8::append(static_cast<uint32_t>(b), std::back_inserter(out));
        }
    }
    return out;
}

std::string TextEncoding::decodeUtf16(core::ByteView bytes) {
    std::u16string units;
    units.reserve(bytes.size() / 2);
    for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
        units.push_back(static_cast<char16_t>(bytes[i] | (bytes[i + 1] << 8)));
    }

    std::string out;
    try {
        utf8::utf16to8(units.begin(), units.end(), std::back_inserter(out));
    } catch (const utf8::exception&) {
        // 孤立代理项逐个替换
        out.clear();
        for (size_t i = 0; i < units.size(); ++i) {
            const uint32_t unit = units[i];
            if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units.size() &&
                units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
                const uint32_t cp = 0x10000 + ((unit - 0xD800) << 10) + (units[i + 1] - 0xDC00);
                utf8::append(static_cast<uint32_t>(cp), std::back_inserter(out));
                ++i;
            } else if (unit >= 0xD800 && unit <= 0xDFFF) {
                appendReplacement(out);
            } else {
                utf8::append(static_cast<uint32_t>(unit), std::back_inserter(out));
            }
        }
    }
    return out;
}

std::string TextEncoding::decode(core::ByteView bytes) const {
    if (bytes.empty()) {
        return {};
    }
    if (code_page_ == 1200) {
        return decodeUtf16(bytes);
    }
    if (code_page_ == 65001) {
        std::string raw(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        std::string out;
        utf8::replace_invalid(raw.begin(), raw.end(), std::back_inserter(out));
        return out;
    }

    IconvHandle cd(iconv_name_.c_str());
    if (!cd.isOpen()) {
        return decodeLatin1(bytes);
    }

    std::string out;
    std::string buffer(bytes.size() * 4 + 16, '\0');
    char* in_ptr = const_cast<char*>(reinterpret_cast<const char*>(bytes.data()));
    size_t in_left = bytes.size();

    while (in_left > 0) {
        char* out_ptr = &buffer[0];
        size_t out_left = buffer.size();
        const size_t rc = iconv(cd.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buffer.data(), buffer.size() - out_left);
        if (rc != static_cast<size_t>(-1)) {
            break;
        }
        if (errno == E2BIG) {
            continue;
        }
        // EILSEQ / EINVAL：跳过一个字节并写入替换字符
        appendReplacement(out);
        ++in_ptr;
        --in_left;
        iconv(cd.get(), nullptr, nullptr, nullptr, nullptr);
    }
    return out;
}

}} // namespace fastxls::biff
