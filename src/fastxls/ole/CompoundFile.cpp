#include "fastxls/ole/CompoundFile.hpp"
#include "fastxls/utils/ByteOrder.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace fastxls {
namespace ole {

namespace {

constexpr size_t kDirectoryEntrySize = 128;
constexpr size_t kHeaderDifatEntries = 109;

using core::ErrorCode;
using core::makeError;

std::string decodeEntryName(const uint8_t* base) {
    const uint16_t name_bytes = utils::readLe<uint16_t>(base + 0x40);
    if (name_bytes < 2) {
        return {};
    }
    const size_t chars = std::min<size_t>(32, name_bytes / 2 - 1);
    std::u16string name;
    name.reserve(chars);
    for (size_t i = 0; i < chars; ++i) {
        name.push_back(static_cast<char16_t>(utils::readLe<uint16_t>(base + i * 2)));
    }

    std::string utf8_name;
    try {
        utf8::utf16to8(name.begin(), name.end(), std::back_inserter(utf8_name));
    } catch (const utf8::exception&) {
        // 名称中有孤立代理项时只保留ASCII部分
        utf8_name.clear();
        for (char16_t c : name) {
            utf8_name.push_back(c < 0x80 ? static_cast<char>(c) : '?');
        }
    }
    return utf8_name;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

CompoundFile::CompoundFile(ByteSource& source)
    : source_(source) {
}

core::VoidResult CompoundFile::open() {
    uint8_t header[kHeaderSize] = {};
    auto got = source_.readAt(0, header, kHeaderSize);
    if (!got) {
        return got.error();
    }
    if (got.value() < kHeaderSize) {
        return makeError(ErrorCode::NotCompoundFile, "file shorter than compound file header");
    }
    if (utils::readLe<uint64_t>(header) != kSignature) {
        return makeError(ErrorCode::NotCompoundFile, "bad compound file signature");
    }
    if (utils::readLe<uint16_t>(header + 0x1C) != 0xFFFE) {
        return makeError(ErrorCode::NotCompoundFile, "bad byte order mark");
    }

    major_version_ = utils::readLe<uint16_t>(header + 0x1A);
    sector_shift_ = utils::readLe<uint16_t>(header + 0x1E);
    mini_sector_shift_ = utils::readLe<uint16_t>(header + 0x20);
    first_dir_sector_ = utils::readLe<uint32_t>(header + 0x30);
    mini_stream_cutoff_ = utils::readLe<uint32_t>(header + 0x38);
    first_mini_fat_sector_ = utils::readLe<uint32_t>(header + 0x3C);
    num_mini_fat_sectors_ = utils::readLe<uint32_t>(header + 0x40);

    if (sector_shift_ != 9 && sector_shift_ != 12) {
        return makeError(ErrorCode::CorruptedContainer,
                         fmt::format("unsupported sector shift {}", sector_shift_));
    }
    if (mini_sector_shift_ != 6) {
        return makeError(ErrorCode::CorruptedContainer,
                         fmt::format("unsupported mini sector shift {}", mini_sector_shift_));
    }

    auto fat = loadFat(header);
    if (!fat) return fat;
    auto dir = loadDirectory();
    if (!dir) return dir;
    auto mini_fat = loadMiniFat();
    if (!mini_fat) return mini_fat;
    auto mini_stream = loadMiniStream();
    if (!mini_stream) return mini_stream;

    OLE_DEBUG("Compound file v{}: {} FAT entries, {} directory entries, mini stream {} bytes",
              major_version_, fat_.size(), entries_.size(), mini_stream_.size());
    return {};
}

core::Result<std::vector<uint8_t>> CompoundFile::readSector(uint32_t sector) const {
    const uint64_t offset = (static_cast<uint64_t>(sector) + 1) << sector_shift_;
    if (offset >= source_.size()) {
        return makeError(ErrorCode::CorruptedContainer,
                         fmt::format("sector {} lies beyond end of file", sector));
    }
    std::vector<uint8_t> data(sectorSize(), 0);
    auto got = source_.readAt(offset, data.data(), data.size());
    if (!got) {
        return got.error();
    }
    if (got.value() < data.size()) {
        // 最后一个扇区可能被截短，缺失部分保持为0
        OLE_DEBUG("Sector {} is short ({} of {} bytes)", sector, got.value(), data.size());
    }
    return data;
}

core::Result<std::vector<uint32_t>> CompoundFile::collectChain(uint32_t start,
                                                               const std::vector<uint32_t>& table) const {
    std::vector<uint32_t> chain;
    uint32_t sector = start;
    while (sector != kEndOfChain) {
        if (sector >= table.size()) {
            return makeError(ErrorCode::CorruptedContainer,
                             fmt::format("sector chain references sector {} outside table of {}", sector, table.size()));
        }
        if (chain.size() >= table.size()) {
            return makeError(ErrorCode::CorruptedContainer, "cycle in sector chain");
        }
        chain.push_back(sector);
        sector = table[sector];
    }
    return chain;
}

core::Result<std::vector<uint8_t>> CompoundFile::readChain(uint32_t start, uint64_t size) const {
    auto chain = collectChain(start, fat_);
    if (!chain) {
        return chain.error();
    }

    std::vector<uint8_t> data;
    data.reserve(chain.value().size() * sectorSize());
    for (uint32_t sector : chain.value()) {
        auto block = readSector(sector);
        if (!block) {
            return block.error();
        }
        data.insert(data.end(), block.value().begin(), block.value().end());
        if (size > 0 && data.size() >= size) {
            break;
        }
    }

    if (size > 0) {
        if (data.size() < size) {
            return makeError(ErrorCode::CorruptedContainer,
                             fmt::format("stream chain holds {} bytes, {} declared", data.size(), size));
        }
        data.resize(static_cast<size_t>(size));
    }
    return data;
}

core::VoidResult CompoundFile::loadFat(const uint8_t* header) {
    std::vector<uint32_t> difat;
    for (size_t i = 0; i < kHeaderDifatEntries; ++i) {
        const uint32_t entry = utils::readLe<uint32_t>(header + 0x4C + i * 4);
        if (entry != kFreeSector) {
            difat.push_back(entry);
        }
    }

    uint32_t difat_sector = utils::readLe<uint32_t>(header + 0x44);
    uint32_t remaining = utils::readLe<uint32_t>(header + 0x48);
    const size_t ints_per_sector = sectorSize() / 4;
    while (remaining > 0 && difat_sector != kEndOfChain && difat_sector != kFreeSector) {
        auto block = readSector(difat_sector);
        if (!block) {
            return block.error();
        }
        const uint8_t* ptr = block.value().data();
        for (size_t i = 0; i + 1 < ints_per_sector; ++i) {
            const uint32_t entry = utils::readLe<uint32_t>(ptr + i * 4);
            if (entry != kFreeSector) {
                difat.push_back(entry);
            }
        }
        difat_sector = utils::readLe<uint32_t>(ptr + (ints_per_sector - 1) * 4);
        --remaining;
    }

    if (difat.empty()) {
        return makeError(ErrorCode::CorruptedContainer, "compound file has no FAT sectors");
    }

    fat_.clear();
    fat_.reserve(difat.size() * ints_per_sector);
    for (uint32_t sector : difat) {
        auto block = readSector(sector);
        if (!block) {
            return block.error();
        }
        const uint8_t* ptr = block.value().data();
        for (size_t i = 0; i < ints_per_sector; ++i) {
            fat_.push_back(utils::readLe<uint32_t>(ptr + i * 4));
        }
    }
    return {};
}

core::VoidResult CompoundFile::loadMiniFat() {
    mini_fat_.clear();
    if (first_mini_fat_sector_ == kEndOfChain || num_mini_fat_sectors_ == 0) {
        return {};
    }
    auto data = readChain(first_mini_fat_sector_, 0);
    if (!data) {
        return data.error();
    }
    const auto& bytes = data.value();
    mini_fat_.reserve(bytes.size() / 4);
    for (size_t i = 0; i + 4 <= bytes.size(); i += 4) {
        mini_fat_.push_back(utils::readLe<uint32_t>(bytes.data() + i));
    }
    return {};
}

core::VoidResult CompoundFile::loadDirectory() {
    auto data = readChain(first_dir_sector_, 0);
    if (!data) {
        return data.error();
    }

    const auto& bytes = data.value();
    entries_.clear();
    for (size_t pos = 0; pos + kDirectoryEntrySize <= bytes.size(); pos += kDirectoryEntrySize) {
        const uint8_t* base = bytes.data() + pos;
        DirectoryEntry entry;
        entry.name = decodeEntryName(base);
        entry.type = static_cast<EntryType>(base[0x42]);
        entry.left_sibling = utils::readLe<uint32_t>(base + 0x44);
        entry.right_sibling = utils::readLe<uint32_t>(base + 0x48);
        entry.child = utils::readLe<uint32_t>(base + 0x4C);
        entry.start_sector = utils::readLe<uint32_t>(base + 0x74);
        entry.size = (major_version_ >= 4) ? utils::readLe<uint64_t>(base + 0x78)
                                           : utils::readLe<uint32_t>(base + 0x78);
        entries_.push_back(std::move(entry));
    }

    if (entries_.empty() || entries_.front().type != EntryType::Root) {
        return makeError(ErrorCode::CorruptedContainer, "directory has no root entry");
    }
    return {};
}

core::VoidResult CompoundFile::loadMiniStream() {
    mini_stream_.clear();
    const DirectoryEntry& root = entries_.front();
    if (root.start_sector == kEndOfChain || root.size == 0) {
        return {};
    }
    auto data = readChain(root.start_sector, root.size);
    if (!data) {
        return data.error();
    }
    mini_stream_ = std::move(data).value();
    return {};
}

const DirectoryEntry* CompoundFile::findEntry(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.type != EntryType::Empty && equalsIgnoreCase(entry.name, name)) {
            return &entry;
        }
    }
    return nullptr;
}

core::Result<std::vector<uint8_t>> CompoundFile::readStream(const DirectoryEntry& entry) const {
    if (entry.size == 0) {
        return std::vector<uint8_t>{};
    }
    if (entry.type == EntryType::Root || entry.size >= mini_stream_cutoff_) {
        return readChain(entry.start_sector, entry.size);
    }

    auto chain = collectChain(entry.start_sector, mini_fat_);
    if (!chain) {
        return chain.error();
    }
    const size_t mini_size = miniSectorSize();
    std::vector<uint8_t> data;
    data.reserve(chain.value().size() * mini_size);
    for (uint32_t sector : chain.value()) {
        const size_t offset = static_cast<size_t>(sector) * mini_size;
        if (offset + mini_size > mini_stream_.size()) {
            return makeError(ErrorCode::CorruptedContainer,
                             fmt::format("mini sector {} outside mini stream", sector));
        }
        data.insert(data.end(), mini_stream_.begin() + offset, mini_stream_.begin() + offset + mini_size);
    }
    if (data.size() < entry.size) {
        return makeError(ErrorCode::CorruptedContainer,
                         fmt::format("mini stream chain holds {} bytes, {} declared", data.size(), entry.size));
    }
    data.resize(static_cast<size_t>(entry.size));
    return data;
}

}} // namespace fastxls::ole
