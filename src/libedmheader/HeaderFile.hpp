/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Class that decodes the header section of a JPI EDM flight file.
 *
 */

#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <vector>

#include "FlightLocator.hpp"
#include "HeaderResult.hpp"

namespace edm_header {

class HeaderFile
{
  public:
    HeaderFile() = default;
    virtual ~HeaderFile() = default;

    HeaderFile(const HeaderFile &) = delete;
    HeaderFile &operator=(const HeaderFile &) = delete;
    HeaderFile(HeaderFile &&) = default;
    HeaderFile &operator=(HeaderFile &&) = default;

    /// Called with the finished result, just before parse() returns it
    virtual void setHeaderCompletionCb(std::function<void(const HeaderResult &)> cb);

    /// Called for every candidate offset the flight locator examines
    virtual void setFlightProbeCb(FlightLocator::ProbeCb cb);

    /**
     * @brief Decode the header section and locate every flight.
     *
     * @param data Raw file contents; header lines followed by binary flight data
     * @param size Number of bytes in data
     * @return The decoded header, with each flight's actual offset filled in
     *         where it could be found
     * @throws ChecksumError if any header line fails its checksum
     * @throws HeaderParseError if there's no $L record
     *
     * Example:
     * @code
     *   HeaderFile file;
     *   auto header = file.parse(bytes.data(), bytes.size());
     *   for (const auto &flight : header.m_flights) {
     *       if (auto range = header.flightRange(flight)) {
     *           decodeFlight(bytes.data() + range->first, range->second - range->first);
     *       }
     *   }
     * @endcode
     */
    [[nodiscard]] HeaderResult parse(const uint8_t *data, std::size_t size);
    [[nodiscard]] HeaderResult parse(const std::vector<uint8_t> &data);

    /**
     * Read the whole stream into memory, then decode it. Throws
     * std::runtime_error if the stream can't be read.
     */
    [[nodiscard]] HeaderResult parse(std::istream &stream);

  private:
    void parseFileHeaders(const uint8_t *data, std::size_t size, HeaderBuilder &builder);

  private:
    std::function<void(const HeaderResult &)> m_headerCompletionCb;
    FlightLocator::ProbeCb m_flightProbeCb;
};

/**
 * Decode with no callbacks installed.
 */
[[nodiscard]] HeaderResult parseHeader(const uint8_t *data, std::size_t size);
[[nodiscard]] HeaderResult parseHeader(const std::vector<uint8_t> &data);

} // namespace edm_header
