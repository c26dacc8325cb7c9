#include "fastxls/reader/WorkbookGlobals.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

namespace fastxls {
namespace reader {

using biff::Record;
namespace RecordType = biff::RecordType;

core::Result<WorkbookGlobals> loadWorkbookGlobals(biff::RecordStream& stream) {
    stream.seek(0);
    auto first = stream.readNext();
    if (!first) {
        return first.error();
    }
    if (!first.value() || !biff::isBofRecord(first.value()->id)) {
        return core::makeError(core::ErrorCode::InvalidWorkbookGlobals,
                               "workbook stream does not start with a BOF record");
    }

    const biff::BofInfo bof = biff::decodeBof(*first.value());
    if (bof.type != biff::SubstreamType::WorkbookGlobals) {
        return core::makeError(core::ErrorCode::InvalidWorkbookGlobals,
                               fmt::format("first substream has type 0x{:04X}, expected workbook globals",
                                           bof.raw_type));
    }

    WorkbookGlobals globals;
    globals.version = bof.version;
    READER_DEBUG("Workbook globals: BIFF{} (raw version 0x{:04X})",
                 static_cast<int>(bof.version), bof.raw_version);

    bool absorbing_sst = false;
    uint16_t implicit_format_index = 0;

    while (true) {
        auto next = stream.readNext();
        if (!next) {
            return next.error();
        }
        if (!next.value()) {
            READER_WARN("Workbook stream ended before the globals EOF record");
            break;
        }
        const Record& rec = *next.value();

        if (rec.id != RecordType::CONTINUE) {
            absorbing_sst = false;
        }

        switch (rec.id) {
            case RecordType::BOUNDSHEET: {
                biff::BoundSheetInfo info = biff::decodeBoundSheet(rec, globals.version, globals.encoding);
                if (!info.isWorksheet()) {
                    READER_DEBUG("Skipping sheet '{}' of type {}", info.name, info.sheet_type);
                    break;
                }
                WorksheetDescriptor sheet;
                sheet.index = globals.sheets.size();
                sheet.name = std::move(info.name);
                sheet.data_offset = info.offset;
                sheet.visibility = info.visibility;
                sheet.version = globals.version;
                globals.sheets.push_back(std::move(sheet));
                break;
            }

            case RecordType::CODEPAGE: {
                const uint16_t code_page = rec.u16(0);
                auto encoding = biff::TextEncoding::fromCodePage(code_page);
                if (encoding) {
                    globals.encoding = *encoding;
                } else {
                    READER_WARN("Code page {} is not supported, keeping {}",
                                code_page, globals.encoding.codePage());
                }
                break;
            }

            case RecordType::DATEMODE:
                globals.date1904 = rec.u16(0) == 1;
                break;

            case RecordType::FONT:
            case RecordType::FONT_V34:
                globals.fonts.push_back(biff::decodeFont(rec, globals.version, globals.encoding));
                break;

            case RecordType::FORMAT:
            case RecordType::FORMAT_V23: {
                biff::FormatInfo format = biff::decodeFormat(rec, globals.version, globals.encoding,
                                                             implicit_format_index);
                if (rec.id == RecordType::FORMAT_V23) {
                    ++implicit_format_index;
                }
                globals.custom_formats[format.index] = std::move(format.pattern);
                break;
            }

            case RecordType::XF:
            case RecordType::XF_V4:
            case RecordType::XF_V3:
            case RecordType::XF_V2:
                globals.extended_formats.push_back(biff::ExtendedFormat::fromRecord(rec, globals.version));
                break;

            case RecordType::SST:
                globals.shared_strings.begin(rec);
                absorbing_sst = true;
                break;

            case RecordType::CONTINUE:
                if (absorbing_sst) {
                    globals.shared_strings.append(rec);
                }
                break;

            case RecordType::FILEPASS:
                return core::makeError(core::ErrorCode::EncryptedWorkbook,
                                       "workbook is password protected (FILEPASS record present)");

            case RecordType::PROTECT:
            case RecordType::PASSWORD:
            case RecordType::PROT4REVPASSWORD:
                if (rec.u16(0) != 0) {
                    globals.is_protected = true;
                }
                break;

            case RecordType::EOF_RECORD:
                globals.shared_strings.materialize();
                READER_DEBUG("Globals complete: {} worksheets, {} XF, {} formats, {} shared strings",
                             globals.sheets.size(), globals.extended_formats.size(),
                             globals.custom_formats.size(), globals.shared_strings.size());
                return globals;

            default:
                break;
        }
    }

    globals.shared_strings.materialize();
    return globals;
}

}} // namespace fastxls::reader
