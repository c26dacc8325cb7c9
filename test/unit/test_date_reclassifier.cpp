/**
 * @file test_date_reclassifier.cpp
 * @brief 按数字格式把数值转换为日期的测试
 */

#include <gtest/gtest.h>
#include "fastxls/reader/DateReclassifier.hpp"
#include "fastxls/utils/TimeUtils.hpp"
#include "../support/XlsBuilder.hpp"

#include <deque>

using namespace fastxls;
using namespace fastxls::reader;
using namespace fastxls::test;
namespace RecordType = fastxls::biff::RecordType;

class DateReclassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        addXf(xfPayload(14));           // 0: 内置日期
        addXf(xfPayload(0));            // 1: 常规
        addXf(xfPayload(164));          // 2: 自定义日期
        addXf(xfPayload(165));          // 3: 自定义数字
        addXf(xfPayload(49));           // 4: 文本
        addXf(xfPayload(14, false));    // 5: 未使用格式
        globals_.custom_formats[164] = "yyyy-mm-dd";
        globals_.custom_formats[165] = "0.00";
    }

    void addXf(Bytes payload) {
        payloads_.push_back(std::move(payload));
        biff::Record record;
        record.id = RecordType::XF;
        record.payload = core::ByteView(payloads_.back());
        globals_.extended_formats.push_back(biff::ExtendedFormat::fromRecord(record, biff::BiffVersion::Biff8));
    }

    std::deque<Bytes> payloads_;
    WorkbookGlobals globals_;
};

TEST_F(DateReclassifierTest, BuiltinDateFormat) {
    DateReclassifier reclassifier(globals_);
    core::CellValue value = reclassifier.reclassify(41640.0, 0);
    ASSERT_TRUE(value.isDateTime());
    const core::DateTime& date = value.asDateTime();
    EXPECT_EQ(date.year, 2014);
    EXPECT_EQ(date.month, 1);
    EXPECT_EQ(date.day, 1);
    EXPECT_EQ(date.hour, 0);
}

TEST_F(DateReclassifierTest, GeneralFormatStaysNumeric) {
    DateReclassifier reclassifier(globals_);
    core::CellValue value = reclassifier.reclassify(41640.0, 1);
    ASSERT_TRUE(value.isNumber());
    EXPECT_DOUBLE_EQ(value.asNumber(), 41640.0);
}

TEST_F(DateReclassifierTest, CustomFormats) {
    DateReclassifier reclassifier(globals_);
    EXPECT_EQ(reclassifier.classify(164), biff::FormatClass::Date);
    EXPECT_EQ(reclassifier.classify(165), biff::FormatClass::Numeric);
    EXPECT_EQ(reclassifier.classify(200), biff::FormatClass::Numeric);

    core::CellValue date = reclassifier.reclassify(41640.5, 2);
    ASSERT_TRUE(date.isDateTime());
    EXPECT_EQ(date.asDateTime().hour, 12);

    EXPECT_TRUE(reclassifier.reclassify(41640.0, 3).isNumber());
}

TEST_F(DateReclassifierTest, TextFormatProducesDecimalString) {
    DateReclassifier reclassifier(globals_);
    core::CellValue value = reclassifier.reclassify(12.5, 4);
    ASSERT_TRUE(value.isText());
    EXPECT_EQ(value.asText(), "12.5");
}

TEST_F(DateReclassifierTest, XfIndexResolution) {
    DateReclassifier reclassifier(globals_);
    EXPECT_FALSE(reclassifier.resolveFormatCode(5));
    EXPECT_TRUE(reclassifier.reclassify(41640.0, 5).isNumber());

    // 超出XF表的序号直接当作格式代码
    ASSERT_TRUE(reclassifier.resolveFormatCode(14));
    EXPECT_EQ(*reclassifier.resolveFormatCode(14), 14);
    EXPECT_TRUE(reclassifier.reclassify(41640.0, 14).isDateTime());
}

TEST_F(DateReclassifierTest, Date1904System) {
    globals_.date1904 = true;
    DateReclassifier reclassifier(globals_);
    core::CellValue value = reclassifier.reclassify(40178.0, 0);
    ASSERT_TRUE(value.isDateTime());
    EXPECT_EQ(value.asDateTime().year, 2014);
    EXPECT_EQ(value.asDateTime().month, 1);
    EXPECT_EQ(value.asDateTime().day, 1);
}

TEST_F(DateReclassifierTest, OutOfRangeDateKeepsNumber) {
    DateReclassifier reclassifier(globals_);
    core::CellValue value = reclassifier.reclassify(5e6, 0);
    ASSERT_TRUE(value.isNumber());
    EXPECT_DOUBLE_EQ(value.asNumber(), 5e6);
}

TEST_F(DateReclassifierTest, StringEntryPoint) {
    DateReclassifier reclassifier(globals_);

    core::CellValue date = reclassifier.reclassify(std::string(" 41640\t"), 0);
    ASSERT_TRUE(date.isDateTime());
    EXPECT_EQ(date.asDateTime().year, 2014);

    core::CellValue number = reclassifier.reclassify(std::string("2.5"), 1);
    ASSERT_TRUE(number.isNumber());
    EXPECT_DOUBLE_EQ(number.asNumber(), 2.5);

    core::CellValue text = reclassifier.reclassify(std::string("12abc"), 0);
    ASSERT_TRUE(text.isText());
    EXPECT_EQ(text.asText(), "12abc");

    EXPECT_TRUE(reclassifier.reclassify(std::string("   "), 0).isText());
}

// ========== OA日期序列号 ==========

TEST(TimeUtilsTest, SerialWithTimeOfDay) {
    auto dt = utils::TimeUtils::fromOADate(41640.75);
    ASSERT_TRUE(dt);
    EXPECT_EQ(dt->toString(), "2014-01-01 18:00:00");
    EXPECT_DOUBLE_EQ(utils::TimeUtils::toOADate(*dt), 41640.75);
}

TEST(TimeUtilsTest, EpochAndRange) {
    auto epoch = utils::TimeUtils::fromOADate(0.0);
    ASSERT_TRUE(epoch);
    EXPECT_EQ(epoch->toString(), "1899-12-30 00:00:00");
    EXPECT_DOUBLE_EQ(utils::TimeUtils::toOADate(*epoch), 0.0);

    EXPECT_FALSE(utils::TimeUtils::fromOADate(utils::TimeUtils::kMaxOADate + 1.0));
}
