/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <iomanip>
#include <stdexcept>

#include "HeaderErrors.hpp"
#include "HeaderResult.hpp"

namespace edm_header {

const FlightIndexEntry *HeaderResult::findFlight(uint16_t flightNum) const
{
    auto it = std::find_if(m_flights.begin(), m_flights.end(),
                           [flightNum](const FlightIndexEntry &f) { return f.flightNumber() == flightNum; });
    return (it != m_flights.end()) ? &(*it) : nullptr;
}

std::optional<std::pair<std::size_t, std::size_t>> HeaderResult::flightRange(const FlightIndexEntry &flight) const
{
    auto start = flight.actualOffset();
    if (!start) {
        return std::nullopt;
    }
    std::size_t end = addOffsets(*start, flight.dataLength());
    if (m_bufferSize != 0) {
        end = (*start >= m_bufferSize) ? *start : std::min(end, m_bufferSize);
    }
    return std::make_pair(*start, end);
}

std::size_t HeaderResult::resolvedFlightCount() const
{
    return static_cast<std::size_t>(
        std::count_if(m_flights.begin(), m_flights.end(), [](const FlightIndexEntry &f) { return f.isResolved(); }));
}

void HeaderResult::dump(std::ostream &outStream) const
{
    outStream << "Tailnumber: " << m_tailNum.value_or("(none)") << "\n";
    if (m_alarmLimits) {
        m_alarmLimits->dump(outStream);
    }
    if (m_configInfo) {
        m_configInfo->dump(outStream);
    }
    if (m_fuelConfig) {
        m_fuelConfig->dump(outStream);
    }
    if (m_timeStamp) {
        m_timeStamp->dump(outStream);
    }
    outStream << "Binary data offset: 0x" << std::hex << m_binaryOffset << std::dec << "\n";
    outStream << "Flights: " << m_flights.size() << " (" << resolvedFlightCount() << " located)\n";
}

const FlightIndexEntry &HeaderBuilder::addFlight(const FlightIndexEntry &flight)
{
    m_result.m_flights.push_back(flight);
    return m_result.m_flights.back();
}

void HeaderBuilder::markBinaryStart(std::size_t offset)
{
    if (hasBinaryStart()) {
        throw std::logic_error{"binary data offset has already been set"};
    }
    m_result.m_binaryOffset = offset;
}

HeaderResult HeaderBuilder::build() &&
{
    if (!hasBinaryStart()) {
        throw HeaderParseError{"no terminal record found"};
    }
    return std::move(m_result);
}

} // namespace edm_header
