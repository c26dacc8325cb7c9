#pragma once

#include "fastxls/core/Expected.hpp"
#include "fastxls/ole/ByteSource.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fastxls {
namespace ole {

constexpr uint32_t kFreeSector = 0xFFFFFFFFu;
constexpr uint32_t kEndOfChain = 0xFFFFFFFEu;
constexpr uint32_t kFatSector = 0xFFFFFFFDu;
constexpr uint32_t kDifatSector = 0xFFFFFFFCu;
constexpr uint32_t kNoStream = 0xFFFFFFFFu;

/**
 * @brief 目录项类型（与文件中的字节值一致）
 */
enum class EntryType : uint8_t {
    Empty = 0,
    Storage = 1,
    Stream = 2,
    LockBytes = 3,
    Property = 4,
    Root = 5
};

/**
 * @brief 目录项
 */
struct DirectoryEntry {
    std::string name;          // UTF-8
    EntryType type = EntryType::Empty;
    uint32_t left_sibling = kNoStream;
    uint32_t right_sibling = kNoStream;
    uint32_t child = kNoStream;
    uint32_t start_sector = kEndOfChain;
    uint64_t size = 0;

    bool isStream() const { return type == EntryType::Stream; }
};

/**
 * @brief OLE2复合文档读取器
 *
 * 负责头部校验、DIFAT/FAT/MiniFAT装载、目录解析，以及按名称读取流。
 * 不持有字节源所有权，字节源需在 CompoundFile 使用期间保持打开。
 */
class CompoundFile {
public:
    explicit CompoundFile(ByteSource& source);

    /**
     * @brief 解析头部、分配表与目录
     */
    core::VoidResult open();

    /**
     * @brief 按名称查找目录项（不区分大小写），未找到返回nullptr
     */
    const DirectoryEntry* findEntry(const std::string& name) const;

    /**
     * @brief 读取流的全部内容；小于 mini stream 阈值的流从 mini stream 读取
     */
    core::Result<std::vector<uint8_t>> readStream(const DirectoryEntry& entry) const;

    const std::vector<DirectoryEntry>& entries() const { return entries_; }

    uint16_t majorVersion() const { return major_version_; }
    uint32_t sectorSize() const { return 1u << sector_shift_; }
    uint32_t miniSectorSize() const { return 1u << mini_sector_shift_; }
    uint32_t miniStreamCutoff() const { return mini_stream_cutoff_; }

    static constexpr size_t kHeaderSize = 512;
    static constexpr uint64_t kSignature = 0xE11AB1A1E011CFD0ULL;

private:
    core::Result<std::vector<uint8_t>> readSector(uint32_t sector) const;
    core::Result<std::vector<uint32_t>> collectChain(uint32_t start, const std::vector<uint32_t>& table) const;
    core::Result<std::vector<uint8_t>> readChain(uint32_t start, uint64_t size) const;

    core::VoidResult loadFat(const uint8_t* header);
    core::VoidResult loadMiniFat();
    core::VoidResult loadDirectory();
    core::VoidResult loadMiniStream();

    ByteSource& source_;
    uint16_t major_version_ = 3;
    uint16_t sector_shift_ = 9;
    uint16_t mini_sector_shift_ = 6;
    uint32_t mini_stream_cutoff_ = 4096;
    uint32_t first_dir_sector_ = kEndOfChain;
    uint32_t first_mini_fat_sector_ = kEndOfChain;
    uint32_t num_mini_fat_sectors_ = 0;

    std::vector<uint32_t> fat_;
    std::vector<uint32_t> mini_fat_;
    std::vector<DirectoryEntry> entries_;
    std::vector<uint8_t> mini_stream_;
};

}} // namespace fastxls::ole
