/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Tests for locating flights in the binary region
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

#include "FileHeaders.hpp"
#include "FlightLocator.hpp"

using namespace edm_header;

namespace {

void putWord(std::vector<uint8_t> &buf, std::size_t pos, uint16_t value)
{
    buf[pos] = static_cast<uint8_t>(value >> 8);
    buf[pos + 1] = static_cast<uint8_t>(value & 0xFF);
}

// Build a 28-byte binary flight header
std::vector<uint8_t> makeFlightHeader(uint16_t flightNum, uint16_t interval, int year, int month, int day, int hour,
                                      int minute, int second, uint16_t word1 = 0xAAAA)
{
    std::vector<uint8_t> header(28, 0xAA);
    putWord(header, 0, flightNum);
    putWord(header, 2, word1);
    putWord(header, 22, interval);
    putWord(header, 24, static_cast<uint16_t>(day | (month << 5) | ((year - 2000) << 9)));
    putWord(header, 26, static_cast<uint16_t>((second / 2) | (minute << 5) | (hour << 11)));
    return header;
}

std::vector<uint8_t> makeFlightHeader(uint16_t flightNum, uint16_t interval = 6, uint16_t word1 = 0xAAAA)
{
    return makeFlightHeader(flightNum, interval, 2025, 5, 13, 23, 2, 40, word1);
}

// Append a flight occupying exactly length bytes, header first
void appendFlight(std::vector<uint8_t> &buf, const std::vector<uint8_t> &header, std::size_t length)
{
    std::vector<uint8_t> flight(length, 0xAA);
    std::copy(header.begin(), header.end(), flight.begin());
    buf.insert(buf.end(), flight.begin(), flight.end());
}

} // anonymous namespace

// ============================================================================
// Flight stamp decoding
// ============================================================================

TEST(FlightStampTest, DecodesPackedFields)
{
    auto header = makeFlightHeader(84, 6, 2025, 5, 13, 23, 2, 40);
    FlightStamp stamp = decodeFlightStamp(header.data());

    EXPECT_EQ(84, stamp.flight_num);
    EXPECT_EQ(6, stamp.interval);
    EXPECT_EQ(2025, stamp.year);
    EXPECT_EQ(5, stamp.month);
    EXPECT_EQ(13, stamp.day);
    EXPECT_EQ(23, stamp.hour);
    EXPECT_EQ(2, stamp.minute);
    EXPECT_EQ(40, stamp.second);
}

TEST(FlightStampTest, ToTm)
{
    auto header = makeFlightHeader(1, 6, 2024, 1, 31, 0, 0, 0);
    std::tm tm = decodeFlightStamp(header.data()).toTm();

    EXPECT_EQ(124, tm.tm_year);
    EXPECT_EQ(0, tm.tm_mon);
    EXPECT_EQ(31, tm.tm_mday);
    EXPECT_EQ(0, tm.tm_hour);
}

TEST(FlightStampTest, PlausibilityBoundaries)
{
    FlightStamp stamp;
    stamp.interval = 1;
    stamp.year = 2000;
    stamp.month = 1;
    stamp.day = 1;
    EXPECT_TRUE(isPlausibleFlightStamp(stamp));

    stamp.interval = 60;
    stamp.year = 2100;
    stamp.month = 12;
    stamp.day = 31;
    stamp.hour = 23;
    stamp.minute = 59;
    stamp.second = 58;
    EXPECT_TRUE(isPlausibleFlightStamp(stamp));

    FlightStamp bad = stamp;
    bad.interval = 0;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
    bad = stamp;
    bad.interval = 61;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
    bad = stamp;
    bad.day = 0;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
    bad = stamp;
    bad.month = 13;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
    bad = stamp;
    bad.year = 2101;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
    bad = stamp;
    bad.hour = 24;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
    bad = stamp;
    bad.minute = 60;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
    bad = stamp;
    bad.second = 60;
    EXPECT_FALSE(isPlausibleFlightStamp(bad));
}

TEST(FlightStampTest, SecondsFieldOutOfRange)
{
    // 30 two-second ticks is 60 seconds
    auto header = makeFlightHeader(1);
    putWord(header, 26, static_cast<uint16_t>(30 | (10 << 5) | (12 << 11)));
    EXPECT_FALSE(isValidFlightHeader(header.data(), header.size(), 0));
}

TEST(FlightStampTest, WindowMustFit)
{
    auto header = makeFlightHeader(1);
    EXPECT_TRUE(isValidFlightHeader(header.data(), header.size(), 0));
    EXPECT_FALSE(isValidFlightHeader(header.data(), header.size() - 1, 0));
    EXPECT_FALSE(isValidFlightHeader(header.data(), header.size(), 1));
    EXPECT_FALSE(isValidFlightHeader(nullptr, 0, 0));
}

// ============================================================================
// FlightLocator
// ============================================================================

class FlightLocatorTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        locator.setProbeCb([this](const FlightIndexEntry &flight, std::size_t pos, bool accepted) {
            probes.push_back({flight.flightNumber(), pos, accepted});
        });
    }

    struct Probe {
        uint16_t flightNum;
        std::size_t pos;
        bool accepted;
    };

    FlightLocator locator;
    std::vector<Probe> probes;
};

TEST_F(FlightLocatorTest, EvenLengthsProbeOnce)
{
    std::vector<uint8_t> data;
    appendFlight(data, makeFlightHeader(1), 40);
    appendFlight(data, makeFlightHeader(2), 60);
    appendFlight(data, makeFlightHeader(3), 30);

    std::vector<FlightIndexEntry> flights = {{1, 20, 0}, {2, 30, 40}, {3, 15, 100}};
    locator.locate(data.data(), data.size(), 0, flights);

    EXPECT_EQ(0u, flights[0].actualOffset().value());
    EXPECT_EQ(40u, flights[1].actualOffset().value());
    EXPECT_EQ(100u, flights[2].actualOffset().value());

    ASSERT_EQ(3u, probes.size());
    for (const auto &probe : probes) {
        EXPECT_TRUE(probe.accepted);
    }
}

TEST_F(FlightLocatorTest, OddLengthFallsBackOneByte)
{
    std::vector<uint8_t> data;
    appendFlight(data, makeFlightHeader(1), 39); // declared as 20 words
    appendFlight(data, makeFlightHeader(2), 40);

    std::vector<FlightIndexEntry> flights = {{1, 20, 0}, {2, 20, 40}};
    locator.locate(data.data(), data.size(), 0, flights);

    EXPECT_EQ(0u, flights[0].actualOffset().value());
    EXPECT_EQ(39u, flights[1].actualOffset().value());

    ASSERT_EQ(3u, probes.size());
    EXPECT_EQ(40u, probes[1].pos);
    EXPECT_FALSE(probes[1].accepted);
    EXPECT_EQ(39u, probes[2].pos);
    EXPECT_TRUE(probes[2].accepted);
}

TEST_F(FlightLocatorTest, TagAloneIsNotEnough)
{
    // with this tag and first word, the shifted window also starts with the tag,
    // but its interval field is garbage
    std::vector<uint8_t> data;
    appendFlight(data, makeFlightHeader(1), 39);
    appendFlight(data, makeFlightHeader(0x0505, 1, 0x0500), 40);

    std::vector<FlightIndexEntry> flights = {{1, 20, 0}, {0x0505, 20, 40}};
    locator.locate(data.data(), data.size(), 0, flights);

    EXPECT_EQ(39u, flights[1].actualOffset().value());
    ASSERT_EQ(3u, probes.size());
    EXPECT_EQ(40u, probes[1].pos);
    EXPECT_FALSE(probes[1].accepted);
}

TEST_F(FlightLocatorTest, BackToBackOddFlights)
{
    std::vector<uint8_t> data;
    appendFlight(data, makeFlightHeader(10), 31); // 16 words declared
    appendFlight(data, makeFlightHeader(11), 31);
    appendFlight(data, makeFlightHeader(12), 31);

    std::vector<FlightIndexEntry> flights = {{10, 16, 0}, {11, 16, 32}, {12, 16, 64}};
    locator.locate(data.data(), data.size(), 0, flights);

    EXPECT_EQ(0u, flights[0].actualOffset().value());
    EXPECT_EQ(31u, flights[1].actualOffset().value());
    EXPECT_EQ(62u, flights[2].actualOffset().value());

    for (size_t i = 1; i < flights.size(); ++i) {
        EXPECT_LT(*flights[i - 1].actualOffset(), *flights[i].actualOffset());
    }
}

TEST_F(FlightLocatorTest, UnresolvedFlightDoesNotStopTheRest)
{
    std::vector<uint8_t> data;
    appendFlight(data, makeFlightHeader(1), 40);
    appendFlight(data, makeFlightHeader(2, 0), 40); // interval 0
    appendFlight(data, makeFlightHeader(3), 40);

    std::vector<FlightIndexEntry> flights = {{1, 20, 0}, {2, 20, 40}, {3, 20, 80}};
    locator.locate(data.data(), data.size(), 0, flights);

    EXPECT_TRUE(flights[0].isResolved());
    EXPECT_FALSE(flights[1].isResolved());
    EXPECT_EQ(80u, flights[2].actualOffset().value());
}

TEST_F(FlightLocatorTest, WindowPastEndIsUnresolved)
{
    std::vector<uint8_t> data;
    appendFlight(data, makeFlightHeader(1), 40);
    appendFlight(data, makeFlightHeader(2), 28);
    data.resize(data.size() - 1);

    std::vector<FlightIndexEntry> flights = {{1, 20, 0}, {2, 14, 40}};
    locator.locate(data.data(), data.size(), 0, flights);

    EXPECT_TRUE(flights[0].isResolved());
    EXPECT_FALSE(flights[1].isResolved());
}

TEST_F(FlightLocatorTest, NeverProbesBeforeBinaryOffset)
{
    // a valid header one byte before the binary region must not be picked up
    std::vector<uint8_t> data(9, 0x20);
    appendFlight(data, makeFlightHeader(1), 40);

    std::vector<FlightIndexEntry> flights = {{1, 20, 0}};
    locator.locate(data.data(), data.size(), 10, flights);

    EXPECT_FALSE(flights[0].isResolved());
    for (const auto &probe : probes) {
        EXPECT_GE(probe.pos, 10u);
    }
}

TEST_F(FlightLocatorTest, ResolvesAtBinaryOffset)
{
    std::vector<uint8_t> data(10, 0x20);
    appendFlight(data, makeFlightHeader(7), 40);

    std::vector<FlightIndexEntry> flights = {{7, 20, 0}};
    locator.locate(data.data(), data.size(), 10, flights);

    EXPECT_EQ(10u, flights[0].actualOffset().value());
    ASSERT_EQ(1u, probes.size());
}

TEST_F(FlightLocatorTest, WrongTagIsUnresolved)
{
    std::vector<uint8_t> data;
    appendFlight(data, makeFlightHeader(5), 40);

    std::vector<FlightIndexEntry> flights = {{6, 20, 0}};
    locator.locate(data.data(), data.size(), 0, flights);

    EXPECT_FALSE(flights[0].isResolved());
}
