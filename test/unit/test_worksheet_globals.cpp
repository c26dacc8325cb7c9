/**
 * @file test_worksheet_globals.cpp
 * @brief 工作表头部（INDEX / DIMENSIONS / ROW / HLINK）解析测试
 */

#include <gtest/gtest.h>
#include "fastxls/reader/WorksheetGlobals.hpp"
#include "../support/XlsBuilder.hpp"

using namespace fastxls;
using namespace fastxls::reader;
using namespace fastxls::test;
namespace RecordType = fastxls::biff::RecordType;

class WorksheetGlobalsTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheet_ = wb_.declareSheet("Sheet1");
        wb_.endGlobals();
        wb_.beginSheet(sheet_);
    }

    RecordWriter& body() { return wb_.stream(); }

    core::Result<std::optional<SheetLayout>> load() {
        wb_.endSheet();
        stream_ = std::make_unique<biff::RecordStream>(wb_.finish(), core::ReadMode::Strict);
        auto globals = loadWorkbookGlobals(*stream_);
        if (!globals) {
            return globals.error();
        }
        globals_ = std::move(globals).value();
        EXPECT_EQ(globals_.sheets.size(), 1u);
        return loadWorksheetGlobals(*stream_, globals_.sheets.at(0), options_);
    }

    WorkbookWriter wb_;
    size_t sheet_ = 0;
    core::ReaderOptions options_;
    WorkbookGlobals globals_;
    std::unique_ptr<biff::RecordStream> stream_;
};

TEST_F(WorksheetGlobalsTest, DimensionsDefineExtents) {
    body().record(RecordType::DIMENSIONS, dimensionsPayload(0, 3, 0, 2));
    const size_t first_row = body().record(RecordType::ROW, rowPayload(0, 0, 2));
    body().record(RecordType::ROW, rowPayload(1, 0, 2));
    body().record(RecordType::NUMBER, numberPayload(0, 0, 0, 1.0));

    auto layout = load();
    ASSERT_TRUE(layout) << layout.error().fullMessage();
    ASSERT_TRUE(layout.value());
    EXPECT_EQ(layout.value()->max_row, 3u);
    EXPECT_EQ(layout.value()->max_col, 2);
    EXPECT_FALSE(layout.value()->hasIndex());
    EXPECT_EQ(layout.value()->first_row.row, 0);
    EXPECT_EQ(layout.value()->first_row_offset, first_row);
}

TEST_F(WorksheetGlobalsTest, ZeroColumnDimensionsUseRowExtent) {
    body().record(RecordType::DIMENSIONS, dimensionsPayload(0, 1, 0, 0));
    body().record(RecordType::ROW, rowPayload(0, 0, 7));

    auto layout = load();
    ASSERT_TRUE(layout);
    ASSERT_TRUE(layout.value());
    EXPECT_EQ(layout.value()->max_col, 7);
}

TEST_F(WorksheetGlobalsTest, MissingDimensionsFallsBackToDefaults) {
    body().record(RecordType::ROW, rowPayload(0, 0, 1));
    body().record(RecordType::NUMBER, numberPayload(0, 0, 0, 1.0));

    options_.default_column_count = 12;
    auto layout = load();
    ASSERT_TRUE(layout);
    ASSERT_TRUE(layout.value());
    EXPECT_FALSE(layout.value()->dimensions);
    EXPECT_EQ(layout.value()->max_col, 12);
    EXPECT_EQ(layout.value()->max_row, 65536u);
}

TEST_F(WorksheetGlobalsTest, IndexAfterUncalcedProvidesRowCount) {
    body().record(RecordType::UNCALCED, {0x00, 0x00});
    body().record(RecordType::INDEX, indexPayload(0, 40, {123}));
    body().record(RecordType::ROW, rowPayload(0, 0, 1));

    auto layout = load();
    ASSERT_TRUE(layout);
    ASSERT_TRUE(layout.value());
    ASSERT_TRUE(layout.value()->hasIndex());
    EXPECT_EQ(layout.value()->index->dbcell_offsets.size(), 1u);
    EXPECT_EQ(layout.value()->max_row, 40u);
}

TEST_F(WorksheetGlobalsTest, EmptyIndexRangeSkipsSheet) {
    body().record(RecordType::INDEX, indexPayload(0, 0, {}));
    body().record(RecordType::DIMENSIONS, dimensionsPayload(0, 0, 0, 0));
    body().record(RecordType::ROW, rowPayload(0, 0, 1));

    auto layout = load();
    ASSERT_TRUE(layout);
    EXPECT_FALSE(layout.value());
}

TEST_F(WorksheetGlobalsTest, NoRowRecordSkipsSheet) {
    body().record(RecordType::DIMENSIONS, dimensionsPayload(0, 0, 0, 0));

    auto layout = load();
    ASSERT_TRUE(layout);
    EXPECT_FALSE(layout.value());
}

TEST_F(WorksheetGlobalsTest, CollectsHyperlinks) {
    body().record(RecordType::DIMENSIONS, dimensionsPayload(0, 2, 0, 2));
    body().record(RecordType::ROW, rowPayload(0, 0, 2));
    body().record(RecordType::LABEL, labelPayload(0, 0, 0, "link"));
    body().record(RecordType::HLINK, hlinkUrlPayload(0, 0, "http://a.example/"));
    body().record(RecordType::HLINKTOOLTIP, {0x00, 0x08});
    body().record(RecordType::HLINK, hlinkUrlPayload(1, 1, "http://b.example/"));

    auto layout = load();
    ASSERT_TRUE(layout);
    ASSERT_TRUE(layout.value());
    EXPECT_EQ(layout.value()->hyperlinks.size(), 2u);
    EXPECT_EQ(layout.value()->hyperlinks.find(1, 1).value_or(""), "http://b.example/");
}

TEST_F(WorksheetGlobalsTest, HyperlinksIgnoredWhenDisabled) {
    body().record(RecordType::ROW, rowPayload(0, 0, 1));
    body().record(RecordType::HLINK, hlinkUrlPayload(0, 0, "http://a.example/"));

    options_.attach_hyperlinks = false;
    auto layout = load();
    ASSERT_TRUE(layout);
    ASSERT_TRUE(layout.value());
    EXPECT_TRUE(layout.value()->hyperlinks.empty());
}

TEST(WorksheetGlobalsOffsetTest, OffsetNotAtWorksheetBofSkipsSheet) {
    WorkbookWriter wb;
    wb.declareSheet("Broken");
    wb.endGlobals();
    wb.stream().record(RecordType::ROW, rowPayload(0, 0, 1));

    biff::RecordStream stream(wb.finish(), core::ReadMode::Strict);
    WorksheetDescriptor sheet;
    sheet.name = "Broken";
    sheet.data_offset = 0;  // 指向全局区BOF

    auto layout = loadWorksheetGlobals(stream, sheet, core::ReaderOptions{});
    ASSERT_TRUE(layout);
    EXPECT_FALSE(layout.value());
}

// 只有BOF和EOF的工作表后面紧跟一张有数据的工作表
TEST(WorksheetGlobalsBoundaryTest, BareSheetDoesNotReachIntoNextSheet) {
    WorkbookWriter wb;
    const size_t bare = wb.declareSheet("Bare");
    const size_t data = wb.declareSheet("Data");
    wb.endGlobals();

    wb.beginSheet(bare);
    wb.endSheet();

    wb.beginSheet(data);
    wb.stream().record(RecordType::DIMENSIONS, dimensionsPayload(0, 1, 0, 1));
    const size_t data_row = wb.stream().record(RecordType::ROW, rowPayload(0, 0, 1));
    wb.stream().record(RecordType::NUMBER, numberPayload(0, 0, 0, 3.0));
    wb.endSheet();

    biff::RecordStream stream(wb.finish(), core::ReadMode::Strict);
    auto globals = loadWorkbookGlobals(stream);
    ASSERT_TRUE(globals) << globals.error().fullMessage();
    ASSERT_EQ(globals.value().sheets.size(), 2u);

    core::ReaderOptions options;
    auto bare_layout = loadWorksheetGlobals(stream, globals.value().sheets[0], options);
    ASSERT_TRUE(bare_layout) << bare_layout.error().fullMessage();
    EXPECT_FALSE(bare_layout.value());

    auto data_layout = loadWorksheetGlobals(stream, globals.value().sheets[1], options);
    ASSERT_TRUE(data_layout);
    ASSERT_TRUE(data_layout.value());
    EXPECT_EQ(data_layout.value()->first_row_offset, data_row);
}
