/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Various objects created from the text headers of an EDM flight file.
 * These have no data about a specific flight's samples, just the generic data
 * that was created when the file was created, i.e. the date, alarm limits,
 * configuration flags, and the index of flights stored in the binary region.
 *
 * Included are:
 *
 * AlarmLimits
 *      Configured alarm limits ($A).
 *
 * ConfigInfo
 *      EDM Model and feature flags ($C). The trailing fields (firmware
 * version, build numbers, etc.) vary by model and are kept as optionals.
 *
 * FuelConfig
 *      Fuel tank sizes and fuel flow scaling rates, K-factors ($F).
 *
 * TimeStamp
 *      The date and time the file was downloaded from the EDM ($T).
 *
 * FlightIndexEntry
 *      One flight's catalog entry ($D): its number and declared length.
 *
 * Numeric fields are decoded leniently: a missing or unparsable field becomes
 * 0 rather than an error, because real files carry short or malformed
 * optional fields.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace edm_header {

/**
 * Parse fields[idx] as a base-10 integer. Missing, empty or non-numeric fields
 * decode to 0.
 */
[[nodiscard]] long parseNumericField(const std::vector<std::string> &fields, std::size_t idx);

/**
 * Like parseNumericField, but a field that is missing from the line altogether
 * decodes to std::nullopt. A field that is present but unparsable is still 0.
 */
[[nodiscard]] std::optional<long> parseOptionalField(const std::vector<std::string> &fields, std::size_t idx);

/**
 * a + b, saturating at SIZE_MAX instead of wrapping.
 */
[[nodiscard]] std::size_t addOffsets(std::size_t a, std::size_t b);

/**
 * Base class for all the FileHeader classes
 */
class FileHeader
{
  public:
    virtual ~FileHeader() = default;

    /* Fills the record from the fields of its header line. Never throws;
     * absent fields take their defaults.
     */
    virtual void apply(const std::vector<std::string> &fields) = 0;
    virtual void dump(std::ostream &outStream) const = 0;
};

/**
 * $A record, configured alarm limits
 *
 * Format:
 * VoltsHi*10,VoltsLo*10,DIF,CHT,CLD,TIT,OilHi,OilLo
 *
 * Example:
 * $A, 305,230,500,415,60,1650,230,90*5F
 */
class AlarmLimits : public FileHeader
{
  public:
    void apply(const std::vector<std::string> &fields) override;
    void dump(std::ostream &outStream) const override;

  public:
    long volts_hi{0};
    long volts_lo{0};
    long egt_diff{0};
    long cht_temp_hi{0};
    long shock_cooling_cld{0};
    long turbo_inlet_temp_hi{0};
    long oil_temp_hi{0};
    long oil_temp_lo{0};
};

/**
 * $C record, config info (only partially known)
 *
 * Format:
 * model#, feature flags lo, feature flags hi, [up to six model dependent values]
 *
 * The trailing values usually hold unknown flags, the firmware version and
 * build numbers, but their positions differ between models, so they're kept
 * positionally.
 *
 * Example:
 * $C,700,63741, 6193, 1552, 292*78
 */
class ConfigInfo : public FileHeader
{
  public:
    void apply(const std::vector<std::string> &fields) override;
    void dump(std::ostream &outStream) const override;

    /// 32-bit feature flags assembled from the lo and hi words
    [[nodiscard]] uint32_t flags() const;
    [[nodiscard]] bool isTwin() const;
    [[nodiscard]] bool tempInFahrenheit() const;

  public:
    long edm_model{0};
    long flags_lo{0};
    long flags_hi{0};
    std::optional<long> unk1;
    std::optional<long> unk2;
    std::optional<long> unk3;
    std::optional<long> unk4;
    std::optional<long> unk5;
    std::optional<long> unk6;
};

/**
 * $F = Fuel flow config and limits.
 *
 * Format:
 * empty,full,warning,kfactor,kfactor
 *
 * K factor is the number of pulses expected for every one volumetric unit of
 * fluid passing through a given flow meter.
 *
 * Example:
 * $F,0,999,  0,2950,2950*53
 */
class FuelConfig : public FileHeader
{
  public:
    void apply(const std::vector<std::string> &fields) override;
    void dump(std::ostream &outStream) const override;

  public:
    long empty_warning{0};
    long full_capacity{0};
    long warning_level{0};
    long k_factor_1{0};
    long k_factor_2{0};
};

/**
 * $T = timestamp of download, fielded (Times are UTC)
 *
 * Format:
 * MM,DD,YY,hh,mm,?? maybe some kind of seq num but not strictly sequential?
 *
 * Example:
 *   $T, 5,13, 5,23, 2, 2222*65
 */
class TimeStamp : public FileHeader
{
  public:
    void apply(const std::vector<std::string> &fields) override;
    void dump(std::ostream &outStream) const override;

  public:
    long mon{0};
    long day{0};
    long yr{0};
    long hh{0};
    long mm{0};
    std::optional<long> unk;
};

/**
 * $D = flight index. Repeats once per flight stored in the file.
 *
 * Format:
 * flight number, length of the flight's binary data in 16-bit words
 *
 * Example:
 * $D, 84, 3417*49
 *
 * The word count is rounded up, so the real data can be one byte shorter than
 * data_length. The flight locator works out where each flight actually starts.
 */
class FlightIndexEntry : public FileHeader
{
  public:
    FlightIndexEntry() = default;
    explicit FlightIndexEntry(std::size_t startOffset) : m_startOffset(startOffset) {}
    FlightIndexEntry(uint16_t flightNum, unsigned long dataWords, std::size_t startOffset);

    void apply(const std::vector<std::string> &fields) override;
    void dump(std::ostream &outStream) const override;

    [[nodiscard]] uint16_t flightNumber() const { return m_flightNum; }
    [[nodiscard]] unsigned long dataWords() const { return m_dataWords; }
    [[nodiscard]] std::size_t dataLength() const { return m_dataLength; }

    /// Where this flight would start if every declared length were exact
    [[nodiscard]] std::size_t startOffset() const { return m_startOffset; }

    /// Verified start of this flight's binary data, or std::nullopt if it couldn't be located
    [[nodiscard]] std::optional<std::size_t> actualOffset() const { return m_actualOffset; }
    [[nodiscard]] bool isResolved() const { return m_actualOffset.has_value(); }

    /// Throws std::logic_error if the entry has already been resolved
    void resolve(std::size_t offset);

  private:
    uint16_t m_flightNum{0};
    unsigned long m_dataWords{0};
    std::size_t m_dataLength{0};
    std::size_t m_startOffset{0};
    std::optional<std::size_t> m_actualOffset;
};

} // namespace edm_header
