#pragma once

#include <cstdint>
#include <cstring>
#include <algorithm>
#include "fastxls/core/span.hpp"

namespace fastxls {
namespace utils {

/**
 * @brief 小端字节序读取工具
 *
 * OLE2与BIFF中的所有整数和浮点数都是小端存储。带 span 的重载做边界检查，
 * 越界部分按0处理，用于宽松模式下被截断的记录。
 */
template<typename T>
inline T readLe(const uint8_t* ptr) {
    T value{};
    std::memcpy(&value, ptr, sizeof(T));
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    uint8_t* raw = reinterpret_cast<uint8_t*>(&value);
    std::reverse(raw, raw + sizeof(T));
#endif
    return value;
}

template<typename T>
inline T readLe(core::ByteView bytes, size_t offset) {
    if (offset >= bytes.size()) {
        return T{};
    }
    if (bytes.size() - offset >= sizeof(T)) {
        return readLe<T>(bytes.data() + offset);
    }
    // 不足 sizeof(T) 的尾部：已有字节保留，其余补0
    uint8_t buffer[sizeof(T)] = {};
    std::memcpy(buffer, bytes.data() + offset, bytes.size() - offset);
    return readLe<T>(buffer);
}

inline uint8_t readU8(core::ByteView bytes, size_t offset) {
    return offset < bytes.size() ? bytes[offset] : 0;
}

inline uint16_t readU16(core::ByteView bytes, size_t offset) {
    return readLe<uint16_t>(bytes, offset);
}

inline uint32_t readU32(core::ByteView bytes, size_t offset) {
    return readLe<uint32_t>(bytes, offset);
}

inline uint64_t readU64(core::ByteView bytes, size_t offset) {
    return readLe<uint64_t>(bytes, offset);
}

inline double readDouble(core::ByteView bytes, size_t offset) {
    const uint64_t bits = readU64(bytes, offset);
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

}} // namespace fastxls::utils
