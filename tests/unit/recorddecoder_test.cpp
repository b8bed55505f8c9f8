/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Tests for decoding header lines into header records
 */

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "HeaderLine.hpp"
#include "HeaderResult.hpp"
#include "RecordDecoder.hpp"

using namespace edm_header;

// ============================================================================
// Line splitting
// ============================================================================

TEST(StripChecksumTest, RemovesTrailingChecksum)
{
    EXPECT_EQ("$D, 84, 3417", stripChecksum("$D, 84, 3417*49"));
    EXPECT_EQ("$L,0", stripChecksum("$L,0*50"));
}

TEST(StripChecksumTest, LeavesEverythingElse)
{
    EXPECT_EQ("$P, 2", stripChecksum("$P, 2"));
    EXPECT_EQ("$U,N1*2", stripChecksum("$U,N1*2"));
    EXPECT_EQ("$U,N1*ZZ", stripChecksum("$U,N1*ZZ"));
    EXPECT_EQ("$U,N1*234", stripChecksum("$U,N1*234"));
}

TEST(SplitHeaderFieldsTest, TrimsEachField)
{
    auto fields = splitHeaderFields("$F,0,999,  0,2950,2950");
    std::vector<std::string> expected = {"0", "999", "0", "2950", "2950"};
    EXPECT_EQ(expected, fields);
}

TEST(SplitHeaderFieldsTest, KeepsEmptyFields)
{
    auto fields = splitHeaderFields("$A,1,,3");
    std::vector<std::string> expected = {"1", "", "3"};
    EXPECT_EQ(expected, fields);
}

TEST(SplitHeaderFieldsTest, NoFields)
{
    EXPECT_EQ(std::vector<std::string>{""}, splitHeaderFields("$L"));
    EXPECT_EQ(std::vector<std::string>{""}, splitHeaderFields("$L,"));
}

// ============================================================================
// Record decoding
// ============================================================================

class RecordDecoderTest : public ::testing::Test
{
  protected:
    HeaderBuilder builder;

    HeaderResult finish()
    {
        builder.markBinaryStart(1);
        return std::move(builder).build();
    }
};

TEST_F(RecordDecoderTest, TailNumber)
{
    EXPECT_FALSE(decodeHeaderRecord(formatHeaderLine("U,N12345"), builder).has_value());
    EXPECT_EQ("N12345", finish().m_tailNum.value());
}

TEST_F(RecordDecoderTest, TailNumberKeepsCommas)
{
    decodeHeaderRecord(formatHeaderLine("U, N1,23 "), builder);
    EXPECT_EQ("N1,23", finish().m_tailNum.value());
}

TEST_F(RecordDecoderTest, TailNumberCutAtAsterisk)
{
    decodeHeaderRecord("$U,N555*", builder);
    EXPECT_EQ("N555", finish().m_tailNum.value());
}

TEST_F(RecordDecoderTest, AlarmLimits)
{
    decodeHeaderRecord("$A, 305,230,500,415,60,1650,230,90*5F", builder);
    auto result = finish();

    ASSERT_TRUE(result.m_alarmLimits.has_value());
    EXPECT_EQ(305, result.m_alarmLimits->volts_hi);
    EXPECT_EQ(90, result.m_alarmLimits->oil_temp_lo);
}

TEST_F(RecordDecoderTest, ConfigAbsentVersusZero)
{
    decodeHeaderRecord(formatHeaderLine("C,700,63741, 6193, 1552, 0"), builder);
    auto result = finish();

    ASSERT_TRUE(result.m_configInfo.has_value());
    EXPECT_EQ(700, result.m_configInfo->edm_model);
    EXPECT_EQ(0, result.m_configInfo->unk2.value());
    EXPECT_FALSE(result.m_configInfo->unk3.has_value());
}

TEST_F(RecordDecoderTest, FuelConfigAndTimeStamp)
{
    decodeHeaderRecord("$F,0,999,  0,2950,2950*53", builder);
    decodeHeaderRecord("$T, 5,13, 5,23, 2, 2222*65", builder);
    auto result = finish();

    ASSERT_TRUE(result.m_fuelConfig.has_value());
    EXPECT_EQ(999, result.m_fuelConfig->full_capacity);
    ASSERT_TRUE(result.m_timeStamp.has_value());
    EXPECT_EQ(13, result.m_timeStamp->day);
    EXPECT_EQ(2222, result.m_timeStamp->unk.value());
}

TEST_F(RecordDecoderTest, NonNumericFieldsDecodeToZero)
{
    decodeHeaderRecord(formatHeaderLine("A,abc,230"), builder);
    auto result = finish();

    EXPECT_EQ(0, result.m_alarmLimits->volts_hi);
    EXPECT_EQ(230, result.m_alarmLimits->volts_lo);
    EXPECT_EQ(0, result.m_alarmLimits->egt_diff);
}

TEST_F(RecordDecoderTest, FlightRecordReturnsEntry)
{
    auto flight = decodeHeaderRecord("$D, 84, 3417*49", builder);

    ASSERT_TRUE(flight.has_value());
    EXPECT_EQ(84, flight->flightNumber());
    EXPECT_EQ(6834u, flight->dataLength());
    EXPECT_EQ(0u, flight->startOffset());
    EXPECT_EQ(1u, builder.flights().size());
}

TEST_F(RecordDecoderTest, FlightStartOffsetsFollowCumulativeOffset)
{
    auto first = decodeHeaderRecord(formatHeaderLine("D,1,10"), builder);
    builder.advanceCumulativeOffset(first->dataLength());
    auto second = decodeHeaderRecord(formatHeaderLine("D,2,5"), builder);
    builder.advanceCumulativeOffset(second->dataLength());

    EXPECT_EQ(0u, first->startOffset());
    EXPECT_EQ(20u, second->startOffset());
    EXPECT_EQ(30u, builder.cumulativeOffset());
}

TEST_F(RecordDecoderTest, NegativeWordCount)
{
    auto flight = decodeHeaderRecord(formatHeaderLine("D,3,-1"), builder);
    ASSERT_TRUE(flight.has_value());
    EXPECT_EQ(0u, flight->dataLength());
}

TEST_F(RecordDecoderTest, InertAndUnknownRecordsIgnored)
{
    EXPECT_FALSE(decodeHeaderRecord(formatHeaderLine("P, 2"), builder).has_value());
    EXPECT_FALSE(decodeHeaderRecord(formatHeaderLine("H,1,2"), builder).has_value());
    EXPECT_FALSE(decodeHeaderRecord(formatHeaderLine("Q,1,2"), builder).has_value());
    EXPECT_FALSE(decodeHeaderRecord(formatHeaderLine("L,0"), builder).has_value());
    EXPECT_FALSE(decodeHeaderRecord("$", builder).has_value());

    auto result = finish();
    EXPECT_FALSE(result.m_tailNum.has_value());
    EXPECT_FALSE(result.m_configInfo.has_value());
    EXPECT_TRUE(result.m_flights.empty());
}

TEST_F(RecordDecoderTest, RepeatedRecordLastWriteWins)
{
    decodeHeaderRecord(formatHeaderLine("U,FIRST"), builder);
    decodeHeaderRecord(formatHeaderLine("U,SECOND"), builder);
    decodeHeaderRecord(formatHeaderLine("C,700,0,0"), builder);
    decodeHeaderRecord(formatHeaderLine("C,900,0,0"), builder);
    auto result = finish();

    EXPECT_EQ("SECOND", result.m_tailNum.value());
    EXPECT_EQ(900, result.m_configInfo->edm_model);
}
