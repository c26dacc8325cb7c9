#pragma once

#include "fastxls/core/span.hpp"
#include "fastxls/utils/ByteOrder.hpp"

#include <cstdint>

namespace fastxls {
namespace biff {

/**
 * @brief 一条BIFF记录：4字节头（id、长度）加负载
 *
 * payload 指向 RecordStream 持有的缓冲区，记录的生命周期不能超过流。
 * 访问器做边界检查，越界读取返回0。
 */
struct Record {
    uint16_t id = 0;
    size_t offset = 0;          // 记录头在流中的位置
    core::ByteView payload;
    bool truncated = false;     // 宽松模式下长度被截断

    static constexpr size_t kHeaderSize = 4;

    /**
     * @brief 记录在流中占用的字节数（含头部）
     */
    size_t encodedSize() const { return kHeaderSize + payload.size(); }
    size_t endOffset() const { return offset + encodedSize(); }
    size_t size() const { return payload.size(); }

    uint8_t u8(size_t pos) const { return utils::readU8(payload, pos); }
    uint16_t u16(size_t pos) const { return utils::readU16(payload, pos); }
    uint32_t u32(size_t pos) const { return utils::readU32(payload, pos); }
    double f64(size_t pos) const { return utils::readDouble(payload, pos); }

    core::ByteView bytes(size_t pos, size_t count = static_cast<size_t>(-1)) const {
        return payload.subspan(pos, count);
    }
};

}} // namespace fastxls::biff
