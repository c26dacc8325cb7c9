/**
 * @file xls_dump.cpp
 * @brief 打印XLS文件中每张工作表的内容
 *
 * 用法: xls_dump <file.xls> [--loose] [--no-dates] [--skip-hidden] [--max-rows N]
 */

#include "fastxls/FastXLS.hpp"
#include "fastxls/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <file.xls> [--loose] [--no-dates] [--skip-hidden] [--max-rows N]"
              << std::endl;
}

void printTable(const fastxls::core::DataTable& table, size_t max_rows) {
    std::cout << "=== " << table.getName() << " (" << table.getRowCount() << " rows, "
              << table.getColumnCount() << " columns) ===" << std::endl;

    const size_t limit = std::min(max_rows, table.getRowCount());
    for (size_t r = 0; r < limit; ++r) {
        const auto& row = table.getRow(r);
        std::string line = fmt::format("{:>5} |", r);
        for (const auto& cell : row) {
            line += ' ';
            if (cell) {
                line += cell->toString();
                if (cell->hasHyperlink()) {
                    line += fmt::format(" <{}>", *cell->getHyperlink());
                }
            }
            line += " |";
        }
        std::cout << line << std::endl;
    }
    if (limit < table.getRowCount()) {
        std::cout << "  ... " << (table.getRowCount() - limit) << " more rows" << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string filename;
    fastxls::core::ReaderOptions options;
    size_t max_rows = 50;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--loose") {
            options.mode = fastxls::core::ReadMode::Loose;
        } else if (arg == "--no-dates") {
            options.convert_dates = false;
        } else if (arg == "--skip-hidden") {
            options.include_hidden_sheets = false;
        } else if (arg == "--max-rows" && i + 1 < argc) {
            max_rows = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (filename.empty()) {
            filename = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!fastxls::initialize("logs/xls_dump.log", true)) {
        return 1;
    }

    auto opened = fastxls::openXLS(filename, options);
    if (!opened) {
        DEMO_ERROR("Cannot open {}: {}", filename, opened.error().fullMessage());
        fastxls::cleanup();
        return 2;
    }

    auto& reader = opened.value();
    DEMO_INFO("{} worksheets, first is '{}'", reader->getSheetCount(), reader->currentSheetName());
    if (const auto* font = reader->globals()->defaultFont()) {
        DEMO_INFO("Default font: {} {}pt", font->name, font->height / 20.0);
    }

    auto data = reader->readAll();
    if (!data) {
        DEMO_ERROR("Reading {} failed: {}", filename, reader->lastError().fullMessage());
        fastxls::cleanup();
        return 3;
    }

    for (const auto& table : data->getTables()) {
        printTable(table, max_rows);
    }

    fastxls::cleanup();
    return 0;
}
