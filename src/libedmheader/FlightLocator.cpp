/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Finds where each flight's binary data really starts.
 */

#include <cstring>
#include <iostream>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

#include "FlightLocator.hpp"
#include "ProtocolConstants.hpp"

namespace edm_header {

// #define EDMHEADER_DEBUG_LOCATOR

namespace {

uint16_t readWord(const uint8_t *p)
{
    uint16_t val;
    std::memcpy(&val, p, sizeof(val));
    return ntohs(val);
}

} // anonymous namespace

std::tm FlightStamp::toTm() const
{
    std::tm tm{};
    tm.tm_year = year - TM_YEAR_BASE;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return tm;
}

FlightStamp decodeFlightStamp(const uint8_t *window)
{
    FlightStamp stamp;
    stamp.flight_num = readWord(window + FLIGHT_HEADER_FLIGHT_NUM_OFFSET);
    stamp.interval = readWord(window + FLIGHT_HEADER_INTERVAL_OFFSET);

    uint16_t dt = readWord(window + FLIGHT_HEADER_DATE_OFFSET);
    stamp.day = dt & DATE_MDAY_MASK;
    stamp.month = (dt >> DATE_MONTH_SHIFT) & DATE_MONTH_MASK;
    stamp.year = ((dt >> DATE_YEAR_SHIFT) & DATE_YEAR_MASK) + DATE_YEAR_BASE;

    uint16_t tm = readWord(window + FLIGHT_HEADER_TIME_OFFSET);
    stamp.second = (tm & TIME_SECONDS_MASK) * TIME_SECONDS_SCALE;
    stamp.minute = (tm >> TIME_MINUTES_SHIFT) & TIME_MINUTES_MASK;
    stamp.hour = (tm >> TIME_HOURS_SHIFT) & TIME_HOURS_MASK;

    return stamp;
}

bool isPlausibleFlightStamp(const FlightStamp &stamp)
{
    if (stamp.interval < MIN_RECORD_INTERVAL || stamp.interval > MAX_RECORD_INTERVAL) {
        return false;
    }
    if (stamp.day < 1 || stamp.day > 31 || stamp.month < 1 || stamp.month > 12 || stamp.year < DATE_YEAR_BASE ||
        stamp.year > DATE_YEAR_MAX) {
        return false;
    }
    if (stamp.hour > 23 || stamp.minute > 59 || stamp.second > 59) {
        return false;
    }
    return true;
}

bool isValidFlightHeader(const uint8_t *data, std::size_t size, std::size_t pos)
{
    if (!data || pos > size || size - pos < FLIGHT_HEADER_SIZE) {
        return false;
    }
    return isPlausibleFlightStamp(decodeFlightStamp(data + pos));
}

void FlightLocator::setProbeCb(ProbeCb cb) { m_probeCb = cb; }

bool FlightLocator::locateFlight(const uint8_t *data, std::size_t size, std::size_t binaryOffset, std::size_t cursor,
                                 FlightIndexEntry &flight) const
{
    const uint8_t tagHigh = static_cast<uint8_t>((flight.flightNumber() >> 8) & 0xFF);
    const uint8_t tagLow = static_cast<uint8_t>(flight.flightNumber() & 0xFF);

    // the cursor first, then one candidate per byte the declared lengths may have overstated
    for (std::size_t back = 0; back <= MAX_DECLARED_LENGTH_DRIFT; ++back) {
        if (cursor < binaryOffset + back) {
            break;
        }
        std::size_t candidate = cursor - back;
        if (candidate > size || size - candidate < FLIGHT_HEADER_SIZE) {
            continue;
        }

        bool accepted = data[candidate] == tagHigh && data[candidate + 1] == tagLow &&
                        isValidFlightHeader(data, size, candidate);

#ifdef EDMHEADER_DEBUG_LOCATOR
        std::cout << "flight " << flight.flightNumber() << ": probe 0x" << std::hex << candidate << std::dec
                  << (accepted ? " accepted" : " rejected") << "\n";
#endif

        if (m_probeCb) {
            m_probeCb(flight, candidate, accepted);
        }

        if (accepted) {
            flight.resolve(candidate);
            return true;
        }
    }
    return false;
}

void FlightLocator::locate(const uint8_t *data, std::size_t size, std::size_t binaryOffset,
                           std::vector<FlightIndexEntry> &flights) const
{
    if (!data) {
        return;
    }

    std::size_t cursor = binaryOffset;
    for (auto &flight : flights) {
        if (locateFlight(data, size, binaryOffset, cursor, flight)) {
            cursor = addOffsets(*flight.actualOffset(), flight.dataLength());
        } else {
            std::cerr << "Warning: couldn't locate flight " << flight.flightNumber() << " near offset 0x" << std::hex
                      << cursor << std::dec << "\n";
            cursor = addOffsets(cursor, flight.dataLength());
        }
    }
}

} // namespace edm_header
