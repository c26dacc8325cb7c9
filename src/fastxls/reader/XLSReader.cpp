#include "fastxls/reader/XLSReader.hpp"
#include "fastxls/core/Exception.hpp"
#include "fastxls/ole/CompoundFile.hpp"
#include "fastxls/reader/CellValueDecoder.hpp"
#include "fastxls/reader/SheetTraversal.hpp"
#include "fastxls/reader/WorksheetGlobals.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

namespace fastxls {
namespace reader {

namespace {
constexpr const char* kWorkbookStreamName = "Workbook";
constexpr const char* kBookStreamName = "Book";
}

XLSReader::XLSReader(core::ReaderOptions options)
    : options_(options) {
}

XLSReader::~XLSReader() {
    close();
}

core::Error XLSReader::fail(core::Error error) {
    READER_ERROR("{}: {}", core::toString(error.code), error.fullMessage());
    valid_ = false;
    last_error_ = error;
    releaseSource();
    globals_.reset();
    current_sheet_ = 0;
    return error;
}

void XLSReader::releaseSource() {
    if (source_) {
        source_->close();
        source_.reset();
    }
    stream_.reset();
}

core::VoidResult XLSReader::open(const std::string& filename) {
    std::unique_ptr<ole::ByteSource> source;
    try {
        source = std::make_unique<ole::FileByteSource>(filename);
    } catch (const core::FileException& e) {
        READER_DEBUG("{}", e.getDetailedMessage());
        return fail(core::makeError(e.getErrorCode(), e.what(), e.getFilename()));
    }
    READER_INFO("Opening {}", filename);
    return open(std::move(source));
}

core::Result<std::vector<uint8_t>> XLSReader::loadWorkbookStream(ole::ByteSource& source) {
    ole::CompoundFile container(source);
    auto opened = container.open();
    if (!opened) {
        return opened.error();
    }

    const ole::DirectoryEntry* entry = container.findEntry(kWorkbookStreamName);
    if (entry == nullptr) {
        entry = container.findEntry(kBookStreamName);
    }
    if (entry == nullptr) {
        return core::makeError(core::ErrorCode::StreamNotFound, "neither Workbook nor Book stream found");
    }
    if (!entry->isStream()) {
        return core::makeError(core::ErrorCode::NotAStream,
                               fmt::format("directory entry '{}' is not a stream", entry->name));
    }
    READER_DEBUG("Workbook stream '{}': {} bytes", entry->name, entry->size);
    return container.readStream(*entry);
}

core::VoidResult XLSReader::open(std::unique_ptr<ole::ByteSource> source) {
    releaseSource();
    globals_.reset();
    result_.reset();
    last_error_ = core::Error();
    current_sheet_ = 0;
    valid_ = false;
    closed_ = false;
    read_done_ = false;

    if (!source) {
        return fail(core::makeError(core::ErrorCode::InvalidArgument, "byte source is null"));
    }
    source_ = std::move(source);

    auto data = loadWorkbookStream(*source_);
    if (!data) {
        return fail(std::move(data).error());
    }
    stream_ = std::make_unique<biff::RecordStream>(std::move(data).value(), options_.mode);

    auto globals = loadWorkbookGlobals(*stream_);
    if (!globals) {
        return fail(std::move(globals).error());
    }
    globals_ = std::make_unique<WorkbookGlobals>(std::move(globals).value());
    valid_ = true;

    READER_INFO("Workbook opened: BIFF{}, {} worksheets{}", static_cast<int>(globals_->version),
                globals_->sheets.size(), globals_->is_protected ? ", protected" : "");
    return {};
}

core::Result<std::optional<core::DataTable>> XLSReader::readSheet(const WorksheetDescriptor& sheet) {
    auto layout = loadWorksheetGlobals(*stream_, sheet, options_);
    if (!layout) {
        return layout.error();
    }
    if (!layout.value()) {
        READER_INFO("Sheet '{}' is empty, skipped", sheet.name);
        return std::optional<core::DataTable>{};
    }

    const SheetLayout& sheet_layout = *layout.value();
    CellValueDecoder decoder(*stream_, *globals_, sheet_layout.hyperlinks, options_);
    SheetTraversal traversal(*stream_, sheet_layout, decoder);

    core::DataTable table(sheet.name, sheet_layout.max_col);
    auto traversed = traversal.run(table);
    if (!traversed) {
        return traversed.error();
    }
    if (table.getRowCount() == 0) {
        READER_INFO("Sheet '{}' produced no rows, skipped", sheet.name);
        return std::optional<core::DataTable>{};
    }
    READER_DEBUG("Sheet '{}': {} rows", sheet.name, table.getRowCount());
    return std::optional<core::DataTable>(std::move(table));
}

std::shared_ptr<const core::DataSet> XLSReader::readAll() {
    if (read_done_ || !valid_ || closed_) {
        return result_;
    }

    auto data_set = std::make_shared<core::DataSet>();
    std::optional<core::Error> failure;
    for (const auto& sheet : globals_->sheets) {
        if (sheet.isHidden() && !options_.include_hidden_sheets) {
            READER_DEBUG("Hidden sheet '{}' skipped", sheet.name);
            continue;
        }
        current_sheet_ = sheet.index;
        auto table = readSheet(sheet);
        if (!table) {
            failure = std::move(table).error();
            break;
        }
        if (table.value()) {
            data_set->addTable(std::move(*table.value()));
        }
    }
    if (failure) {
        fail(std::move(*failure));
        return nullptr;
    }

    result_ = data_set;
    read_done_ = true;
    releaseSource();
    READER_INFO("Read {} tables", result_->getTableCount());
    return result_;
}

void XLSReader::close() {
    releaseSource();
    closed_ = true;
}

std::vector<std::string> XLSReader::getSheetNames() const {
    std::vector<std::string> names;
    if (globals_) {
        names.reserve(globals_->sheets.size());
        for (const auto& sheet : globals_->sheets) {
            names.push_back(sheet.name);
        }
    }
    return names;
}

size_t XLSReader::getSheetCount() const {
    return globals_ ? globals_->sheets.size() : 0;
}

std::string XLSReader::currentSheetName() const {
    if (!globals_ || current_sheet_ >= globals_->sheets.size()) {
        return {};
    }
    return globals_->sheets[current_sheet_].name;
}

}} // namespace fastxls::reader
