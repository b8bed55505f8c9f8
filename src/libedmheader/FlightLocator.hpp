/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Finds where each flight's binary data really starts.
 *
 * The $D records declare each flight's length in 16-bit words, which rounds
 * odd byte lengths up by one. Summing declared lengths therefore drifts by up
 * to a byte per odd-length flight. The locator keeps a running cursor and, for
 * each flight, probes the cursor and the byte before it for the flight's
 * number followed by a plausible flight header (interval, date and time).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <vector>

#include "FileHeaders.hpp"

namespace edm_header {

/**
 * @brief Fields decoded from the 28-byte binary flight header window.
 *
 * Values are raw decodes of the packed bit-fields and are not range checked.
 */
struct FlightStamp {
    uint16_t flight_num{0};
    uint16_t interval{0}; ///< seconds between samples
    int year{0};          ///< full year, e.g. 2025
    int month{0};         ///< 1-12
    int day{0};           ///< 1-31
    int hour{0};
    int minute{0};
    int second{0};

    /// Start date as a std::tm (tm_mon is 0-based, tm_year is years since 1900)
    [[nodiscard]] std::tm toTm() const;
};

/**
 * Decode the flight header window at window[0..FLIGHT_HEADER_SIZE).
 */
[[nodiscard]] FlightStamp decodeFlightStamp(const uint8_t *window);

/**
 * True if the window's interval, date and time fields are all in range.
 */
[[nodiscard]] bool isPlausibleFlightStamp(const FlightStamp &stamp);

/**
 * True if a full flight header window fits at pos and passes the
 * plausibility check.
 */
[[nodiscard]] bool isValidFlightHeader(const uint8_t *data, std::size_t size, std::size_t pos);

class FlightLocator
{
  public:
    /// Invoked for each candidate examined, with whether it was accepted
    using ProbeCb = std::function<void(const FlightIndexEntry &, std::size_t, bool)>;

    void setProbeCb(ProbeCb cb);

    /**
     * Resolve every flight's actual offset in place.
     *
     * Flights that can't be found are left unresolved and the cursor moves on
     * by their declared length, so one bad flight doesn't take the rest with
     * it.
     */
    void locate(const uint8_t *data, std::size_t size, std::size_t binaryOffset,
                std::vector<FlightIndexEntry> &flights) const;

  private:
    /// Try the candidates for one flight. Returns true if it was resolved.
    bool locateFlight(const uint8_t *data, std::size_t size, std::size_t binaryOffset, std::size_t cursor,
                      FlightIndexEntry &flight) const;

    ProbeCb m_probeCb;
};

} // namespace edm_header
