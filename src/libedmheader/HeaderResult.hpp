/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Everything decoded from the header section of an EDM file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "FileHeaders.hpp"

namespace edm_header {

class HeaderResult
{
  public:
    void dump(std::ostream &outStream) const;

    /// First flight with this number, or nullptr
    [[nodiscard]] const FlightIndexEntry *findFlight(uint16_t flightNum) const;

    /**
     * Byte range [first, second) of a resolved flight's binary data, clamped
     * to the end of the decoded buffer. std::nullopt if the flight wasn't
     * located.
     */
    [[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>>
    flightRange(const FlightIndexEntry &flight) const;

    [[nodiscard]] std::size_t resolvedFlightCount() const;

  public:
    std::optional<std::string> m_tailNum;
    std::optional<ConfigInfo> m_configInfo;
    std::optional<AlarmLimits> m_alarmLimits;
    std::optional<FuelConfig> m_fuelConfig;
    std::vector<FlightIndexEntry> m_flights;
    std::optional<TimeStamp> m_timeStamp;

    /// Offset of the first byte after the $L record
    std::size_t m_binaryOffset{0};

    /// Size of the buffer the header was decoded from
    std::size_t m_bufferSize{0};
};

/**
 * @brief Accumulates records during one decode pass.
 *
 * Single occurrence records are last-write-wins. Flights are appended in the
 * order they appear, and the builder keeps the running declared offset the
 * next flight would start at.
 */
class HeaderBuilder
{
  public:
    void setTailNumber(std::string tailNum) { m_result.m_tailNum = std::move(tailNum); }
    void setConfigInfo(const ConfigInfo &configInfo) { m_result.m_configInfo = configInfo; }
    void setAlarmLimits(const AlarmLimits &alarmLimits) { m_result.m_alarmLimits = alarmLimits; }
    void setFuelConfig(const FuelConfig &fuelConfig) { m_result.m_fuelConfig = fuelConfig; }
    void setTimeStamp(const TimeStamp &timeStamp) { m_result.m_timeStamp = timeStamp; }

    /// Appends the flight and returns the stored copy
    const FlightIndexEntry &addFlight(const FlightIndexEntry &flight);

    /// Declared-only offset, relative to the binary region, of the next flight
    [[nodiscard]] std::size_t cumulativeOffset() const { return m_cumulativeOffset; }
    void advanceCumulativeOffset(std::size_t bytes) { m_cumulativeOffset = addOffsets(m_cumulativeOffset, bytes); }

    /// Throws std::logic_error if called twice
    void markBinaryStart(std::size_t offset);
    [[nodiscard]] bool hasBinaryStart() const { return m_result.m_binaryOffset != 0; }
    [[nodiscard]] std::size_t binaryStart() const { return m_result.m_binaryOffset; }

    void setBufferSize(std::size_t size) { m_result.m_bufferSize = size; }

    /// Flights decoded so far, for the locator
    std::vector<FlightIndexEntry> &flights() { return m_result.m_flights; }

    /**
     * Hand over the finished result. Throws HeaderParseError if the $L record
     * was never seen.
     */
    [[nodiscard]] HeaderResult build() &&;

  private:
    HeaderResult m_result;
    std::size_t m_cumulativeOffset{0};
};

} // namespace edm_header
