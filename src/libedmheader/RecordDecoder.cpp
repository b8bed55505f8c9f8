/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Turns verified header lines into header records.
 */

#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include "ProtocolConstants.hpp"
#include "RecordDecoder.hpp"

namespace edm_header {

// #define EDMHEADER_DEBUG_HEADERS

namespace {

std::string trim(const std::string &s)
{
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string parseTailNumber(const std::vector<std::string> &fields)
{
    // the tail number itself may contain commas
    std::string tailNum;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            tailNum.push_back(FIELD_SEPARATOR);
        }
        tailNum += fields[i];
    }

    auto star = tailNum.find(CHECKSUM_SEPARATOR);
    if (star != std::string::npos) {
        tailNum.erase(star);
    }
    return trim(tailNum);
}

} // anonymous namespace

std::string stripChecksum(const std::string &line)
{
    auto asteriskPos = line.rfind(CHECKSUM_SEPARATOR);
    if (asteriskPos == std::string::npos || line.size() != asteriskPos + 1 + CHECKSUM_DIGITS) {
        return line;
    }
    for (size_t i = asteriskPos + 1; i < line.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(line[i]))) {
            return line;
        }
    }
    return line.substr(0, asteriskPos);
}

std::vector<std::string> splitHeaderFields(const std::string &content)
{
    std::vector<std::string> fields;

    // skip "$X,"
    std::string rest = (content.size() > RECORD_PREFIX_LENGTH + 1) ? content.substr(RECORD_PREFIX_LENGTH + 1) : "";

    size_t pos = 0;
    while (true) {
        auto comma = rest.find(FIELD_SEPARATOR, pos);
        if (comma == std::string::npos) {
            fields.push_back(trim(rest.substr(pos)));
            break;
        }
        fields.push_back(trim(rest.substr(pos, comma - pos)));
        pos = comma + 1;
    }

    return fields;
}

std::optional<FlightIndexEntry> decodeHeaderRecord(const std::string &line, HeaderBuilder &builder)
{
    std::string content = stripChecksum(line);
    if (content.size() < RECORD_PREFIX_LENGTH) {
        return std::nullopt;
    }

    auto fields = splitHeaderFields(content);

    switch (content[1]) {
    case RECORD_TAIL_NUMBER:
        builder.setTailNumber(parseTailNumber(fields));
        break;
    case RECORD_ALARM_LIMITS: {
        AlarmLimits limits;
        limits.apply(fields);
        builder.setAlarmLimits(limits);
    } break;
    case RECORD_CONFIG: {
        ConfigInfo info;
        info.apply(fields);
        builder.setConfigInfo(info);
    } break;
    case RECORD_FLIGHT_INDEX: // repeats, one per flight
    {
        FlightIndexEntry flight{builder.cumulativeOffset()};
        flight.apply(fields);
        return builder.addFlight(flight);
    }
    case RECORD_FUEL_CONFIG: {
        FuelConfig fuel;
        fuel.apply(fields);
        builder.setFuelConfig(fuel);
    } break;
    case RECORD_TIMESTAMP: {
        TimeStamp ts;
        ts.apply(fields);
        builder.setTimeStamp(ts);
    } break;
    case RECORD_PROTOCOL: // protocol version
    case RECORD_UNKNOWN_H: // unknown what this means
    case RECORD_LAST:      // last header record marker
        break;
    default:
#ifdef EDMHEADER_DEBUG_HEADERS
        std::cout << "ignoring unknown header record: " << line << "\n";
#endif
        break;
    }
    return std::nullopt;
}

} // namespace edm_header
