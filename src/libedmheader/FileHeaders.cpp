/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Various objects created from the text headers of an EDM flight file.
 *
 * Included are:
 *
 * AlarmLimits
 *      Configured alarm limits.
 *
 * ConfigInfo
 *      EDM Model and feature flags. The flags are still useful for telling
 * whether temperatures are in C or F.
 *
 * FuelConfig
 *      Fueltank sizes and fuel flow scaling rates (K-factors)
 *
 * TimeStamp
 *      The date and time the file was created for downloading from the EDM.
 *
 * FlightIndexEntry
 *      Flight number and declared size of one flight's binary data.
 */

#include <bitset>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "FileHeaders.hpp"
#include "ProtocolConstants.hpp"

namespace edm_header {

long parseNumericField(const std::vector<std::string> &fields, std::size_t idx)
{
    if (idx >= fields.size()) {
        return 0;
    }
    try {
        return std::stol(fields[idx], nullptr, 10);
    } catch (const std::invalid_argument &) {
        return 0;
    } catch (const std::out_of_range &) {
        return 0;
    }
}

std::optional<long> parseOptionalField(const std::vector<std::string> &fields, std::size_t idx)
{
    if (idx >= fields.size()) {
        return std::nullopt;
    }
    return parseNumericField(fields, idx);
}

std::size_t addOffsets(std::size_t a, std::size_t b)
{
    return (b > std::numeric_limits<std::size_t>::max() - a) ? std::numeric_limits<std::size_t>::max() : a + b;
}

namespace {

std::size_t wordsToBytes(unsigned long words)
{
    constexpr auto maxWords = std::numeric_limits<std::size_t>::max() / BYTES_PER_WORD;
    return (words > maxWords) ? maxWords * BYTES_PER_WORD : static_cast<std::size_t>(words) * BYTES_PER_WORD;
}

void dumpOptional(std::ostream &outStream, const char *name, const std::optional<long> &value)
{
    outStream << "\n    " << name << ": ";
    if (value) {
        outStream << *value;
    } else {
        outStream << "(absent)";
    }
}

} // anonymous namespace

/**
 * AlarmLimits
 */
void AlarmLimits::apply(const std::vector<std::string> &fields)
{
    volts_hi = parseNumericField(fields, 0);
    volts_lo = parseNumericField(fields, 1);
    egt_diff = parseNumericField(fields, 2);
    cht_temp_hi = parseNumericField(fields, 3);
    shock_cooling_cld = parseNumericField(fields, 4);
    turbo_inlet_temp_hi = parseNumericField(fields, 5);
    oil_temp_hi = parseNumericField(fields, 6);
    oil_temp_lo = parseNumericField(fields, 7);
}

void AlarmLimits::dump(std::ostream &outStream) const
{
    outStream << "AlarmLimits:" << "\n    volts_hi: " << volts_hi << "\n    volts_lo: " << volts_lo
              << "\n    egt_diff: " << egt_diff << "\n    cht_temp_hi: " << cht_temp_hi
              << "\n    shock_cooling_cld: " << shock_cooling_cld
              << "\n    turbo_inlet_temp_hi: " << turbo_inlet_temp_hi << "\n    oil_temp_hi: " << oil_temp_hi
              << "\n    oil_temp_lo: " << oil_temp_lo << "\n";
}

/**
 * ConfigInfo
 */
void ConfigInfo::apply(const std::vector<std::string> &fields)
{
    edm_model = parseNumericField(fields, 0);
    flags_lo = parseNumericField(fields, 1);
    flags_hi = parseNumericField(fields, 2);

    std::size_t idx = CONFIG_REQUIRED_FIELD_COUNT;
    unk1 = parseOptionalField(fields, idx++);
    unk2 = parseOptionalField(fields, idx++);
    unk3 = parseOptionalField(fields, idx++);
    unk4 = parseOptionalField(fields, idx++);
    unk5 = parseOptionalField(fields, idx++);
    unk6 = parseOptionalField(fields, idx++);
}

uint32_t ConfigInfo::flags() const
{
    return (static_cast<uint32_t>(flags_hi) << 16) |
           (static_cast<uint32_t>(flags_lo) & CONFIG_FLAGS_LOWER_16_BITS_MASK);
}

bool ConfigInfo::isTwin() const { return (edm_model == EDM_MODEL_760_TWIN || edm_model == EDM_MODEL_960_TWIN); }

bool ConfigInfo::tempInFahrenheit() const { return (flags() & CONFIG_FLAG_TEMP_IN_F) != 0; }

void ConfigInfo::dump(std::ostream &outStream) const
{
    auto fl = flags();
    outStream << "ConfigInfo:" << "\n    edm_model: " << edm_model << "\n    flags: " << fl << " 0x" << std::hex << fl
              << std::dec << " b" << std::bitset<32>(fl);
    dumpOptional(outStream, "unk1", unk1);
    dumpOptional(outStream, "unk2", unk2);
    dumpOptional(outStream, "unk3", unk3);
    dumpOptional(outStream, "unk4", unk4);
    dumpOptional(outStream, "unk5", unk5);
    dumpOptional(outStream, "unk6", unk6);
    outStream << "\n";
    outStream << "Temperatures for CHT, EGT, and TIT are in " << (tempInFahrenheit() ? "F" : "C") << "\n";
}

/**
 * FuelConfig
 */
void FuelConfig::apply(const std::vector<std::string> &fields)
{
    empty_warning = parseNumericField(fields, 0);
    full_capacity = parseNumericField(fields, 1);
    warning_level = parseNumericField(fields, 2);
    k_factor_1 = parseNumericField(fields, 3);
    k_factor_2 = parseNumericField(fields, 4);
}

void FuelConfig::dump(std::ostream &outStream) const
{
    outStream << "FuelConfig:" << "\n    empty_warning: " << empty_warning << "\n    full_capacity: " << full_capacity
              << "\n    warning_level: " << warning_level << "\n    k_factor_1: " << k_factor_1
              << "\n    k_factor_2: " << k_factor_2 << "\n";
}

/**
 * TimeStamp
 */
void TimeStamp::apply(const std::vector<std::string> &fields)
{
    mon = parseNumericField(fields, 0);
    day = parseNumericField(fields, 1);
    yr = parseNumericField(fields, 2);
    hh = parseNumericField(fields, 3);
    mm = parseNumericField(fields, 4);
    unk = parseOptionalField(fields, TIMESTAMP_REQUIRED_FIELD_COUNT);
}

void TimeStamp::dump(std::ostream &outStream) const
{
    outStream << "TimeStamp:" << "\n    mon: " << mon << "\n    day: " << day << "\n    yr: " << yr
              << "\n    hh: " << hh << "\n    mm: " << mm;
    dumpOptional(outStream, "unk", unk);
    outStream << "\n";
}

/**
 * FlightIndexEntry
 */
FlightIndexEntry::FlightIndexEntry(uint16_t flightNum, unsigned long dataWords, std::size_t startOffset)
    : m_flightNum(flightNum), m_dataWords(dataWords), m_dataLength(wordsToBytes(dataWords)),
      m_startOffset(startOffset)
{
}

void FlightIndexEntry::apply(const std::vector<std::string> &fields)
{
    // the flight number doubles as a 16-bit tag in the binary data
    m_flightNum = static_cast<uint16_t>(parseNumericField(fields, 0) & 0xFFFF);

    long words = parseNumericField(fields, 1);
    m_dataWords = (words > 0) ? static_cast<unsigned long>(words) : 0UL;
    m_dataLength = wordsToBytes(m_dataWords);
}

void FlightIndexEntry::resolve(std::size_t offset)
{
    if (m_actualOffset) {
        throw std::logic_error{"flight " + std::to_string(m_flightNum) + " has already been resolved"};
    }
    m_actualOffset = offset;
}

void FlightIndexEntry::dump(std::ostream &outStream) const
{
    outStream << "FlightIndexEntry:" << "\n    flight_num: " << m_flightNum << "\n    data_words: " << m_dataWords
              << "\n    data_length: " << m_dataLength << "\n    start_offset: " << m_startOffset
              << "\n    actual_offset: ";
    if (m_actualOffset) {
        outStream << *m_actualOffset;
    } else {
        outStream << "unresolved";
    }
    outStream << "\n";
}

} // namespace edm_header
