/**
 * @file test_record_stream.cpp
 * @brief BIFF记录流单元测试
 */

#include <gtest/gtest.h>
#include "fastxls/biff/RecordStream.hpp"
#include "../support/XlsBuilder.hpp"

using namespace fastxls;
using namespace fastxls::test;
namespace RecordType = fastxls::biff::RecordType;

class RecordStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        writer_.record(RecordType::BOF, bofPayload(biff::SubstreamType::WorkbookGlobals));
        writer_.record(RecordType::DATEMODE, {0x01, 0x00});
        writer_.record(RecordType::EOF_RECORD);
    }

    RecordWriter writer_;
};

TEST_F(RecordStreamTest, ReadsRecordsInOrder) {
    biff::RecordStream stream(writer_.data(), core::ReadMode::Strict);

    auto bof = stream.readNext();
    ASSERT_TRUE(bof);
    ASSERT_TRUE(bof.value().has_value());
    EXPECT_EQ(bof.value()->id, RecordType::BOF);
    EXPECT_EQ(bof.value()->offset, 0u);
    EXPECT_EQ(bof.value()->size(), 16u);
    EXPECT_EQ(stream.position(), 20u);

    auto datemode = stream.readNext();
    ASSERT_TRUE(datemode);
    ASSERT_TRUE(datemode.value().has_value());
    EXPECT_EQ(datemode.value()->id, RecordType::DATEMODE);
    EXPECT_EQ(datemode.value()->u16(0), 1);

    auto eof = stream.readNext();
    ASSERT_TRUE(eof);
    ASSERT_TRUE(eof.value().has_value());
    EXPECT_EQ(eof.value()->id, RecordType::EOF_RECORD);
    EXPECT_EQ(eof.value()->size(), 0u);

    auto end = stream.readNext();
    ASSERT_TRUE(end);
    EXPECT_FALSE(end.value().has_value());
    EXPECT_TRUE(stream.atEnd());
}

TEST_F(RecordStreamTest, ReadAtDoesNotMovePosition) {
    biff::RecordStream stream(writer_.data(), core::ReadMode::Strict);

    auto rec = stream.readAt(20);
    ASSERT_TRUE(rec);
    ASSERT_TRUE(rec.value().has_value());
    EXPECT_EQ(rec.value()->id, RecordType::DATEMODE);
    EXPECT_EQ(rec.value()->endOffset(), 26u);
    EXPECT_EQ(stream.position(), 0u);

    stream.seek(rec.value()->endOffset());
    auto eof = stream.readNext();
    ASSERT_TRUE(eof);
    EXPECT_EQ(eof.value()->id, RecordType::EOF_RECORD);
}

TEST_F(RecordStreamTest, TrailingBytesShorterThanHeaderEndStream) {
    Bytes data = writer_.data();
    data.push_back(0x0A);
    data.push_back(0x00);
    data.push_back(0x00);
    biff::RecordStream stream(std::move(data), core::ReadMode::Strict);

    stream.seek(26 + 4);
    auto end = stream.readNext();
    ASSERT_TRUE(end);
    EXPECT_FALSE(end.value().has_value());
}

TEST_F(RecordStreamTest, StrictModeRejectsTruncatedRecord) {
    RecordWriter writer;
    writer.rawRecord(RecordType::NUMBER, 14, {0x01, 0x02, 0x03});
    biff::RecordStream stream(writer.data(), core::ReadMode::Strict);

    auto rec = stream.readNext();
    ASSERT_FALSE(rec);
    EXPECT_EQ(rec.error().code, core::ErrorCode::RecordTruncated);
    EXPECT_EQ(stream.position(), 0u);
}

TEST_F(RecordStreamTest, LooseModeTruncatesToRemainingBytes) {
    RecordWriter writer;
    writer.rawRecord(RecordType::NUMBER, 14, {0x01, 0x02, 0x03});
    biff::RecordStream stream(writer.data(), core::ReadMode::Loose);

    auto rec = stream.readNext();
    ASSERT_TRUE(rec);
    ASSERT_TRUE(rec.value().has_value());
    EXPECT_TRUE(rec.value()->truncated);
    EXPECT_EQ(rec.value()->size(), 3u);
    EXPECT_TRUE(stream.atEnd());
}

TEST_F(RecordStreamTest, RecordAccessorsAreBoundsChecked) {
    RecordWriter writer;
    writer.record(RecordType::CODEPAGE, {0xE4, 0x04});
    biff::RecordStream stream(writer.data(), core::ReadMode::Strict);

    auto rec = stream.readNext();
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec.value()->u16(0), 1252);
    EXPECT_EQ(rec.value()->u16(1), 0x04);
    EXPECT_EQ(rec.value()->u32(0), 1252u);  // 不足4字节的尾部补0
    EXPECT_EQ(rec.value()->u8(10), 0);
}
