/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Protocol constants for the JPI EDM file header format
 *
 * All magic numbers used by the header line reader, the record decoder and
 * the flight locator live here.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace edm_header {

// ============================================================================
// Header Line Framing
// ============================================================================

/// First character of every header line
constexpr char HEADER_LINE_MARKER = '$';

/// Separates the record payload from its two hex digit checksum
constexpr char CHECKSUM_SEPARATOR = '*';

/// Separates fields inside a record
constexpr char FIELD_SEPARATOR = ',';

/// Header lines are terminated by CR LF
constexpr uint8_t LINE_TERMINATOR_CR = 0x0D;
constexpr uint8_t LINE_TERMINATOR_LF = 0x0A;
constexpr std::size_t LINE_TERMINATOR_LENGTH = 2;

/// Number of hex digits in a header checksum
constexpr std::size_t CHECKSUM_DIGITS = 2;

/// Length of the "$X" record prefix
constexpr std::size_t RECORD_PREFIX_LENGTH = 2;

// ============================================================================
// Record Types (character following the '$')
// ============================================================================

constexpr char RECORD_TAIL_NUMBER = 'U';
constexpr char RECORD_ALARM_LIMITS = 'A';
constexpr char RECORD_CONFIG = 'C';
constexpr char RECORD_FLIGHT_INDEX = 'D';
constexpr char RECORD_FUEL_CONFIG = 'F';
constexpr char RECORD_TIMESTAMP = 'T';
constexpr char RECORD_PROTOCOL = 'P';
constexpr char RECORD_UNKNOWN_H = 'H';

/// $L marks the last header record; binary data starts right after it
constexpr char RECORD_LAST = 'L';

// ============================================================================
// Record Field Counts
// ============================================================================

/// Number of fields in an $A (AlarmLimits) record
constexpr std::size_t ALARM_LIMITS_FIELD_COUNT = 8;

/// Required fields in a $C (ConfigInfo) record: model, flags lo, flags hi
constexpr std::size_t CONFIG_REQUIRED_FIELD_COUNT = 3;

/// Optional trailing fields in a $C record
constexpr std::size_t CONFIG_OPTIONAL_FIELD_COUNT = 6;

/// Number of fields in a $D (flight index) record: flight number, word count
constexpr std::size_t FLIGHT_INDEX_FIELD_COUNT = 2;

/// Number of fields in an $F (FuelConfig) record
constexpr std::size_t FUEL_CONFIG_FIELD_COUNT = 5;

/// Required fields in a $T (TimeStamp) record: MM,DD,YY,hh,mm
constexpr std::size_t TIMESTAMP_REQUIRED_FIELD_COUNT = 5;

// ============================================================================
// EDM Model Identification
// ============================================================================

/// EDM 760 model number (twin engine)
constexpr long EDM_MODEL_760_TWIN = 760;

/// EDM 960 model number (twin engine)
constexpr long EDM_MODEL_960_TWIN = 960;

/// Feature flag set when engine temperatures are recorded in Fahrenheit
constexpr uint32_t CONFIG_FLAG_TEMP_IN_F = 0x10000000;

/// Mask for the lower 16 bits of configuration flags
constexpr uint32_t CONFIG_FLAGS_LOWER_16_BITS_MASK = 0x0000FFFF;

// ============================================================================
// Flight Data Sizing
// ============================================================================

/// $D records declare flight length in 16-bit words
constexpr std::size_t BYTES_PER_WORD = 2;

/// Declared flight lengths are rounded up to whole words, so they overstate
/// the true length by at most this many bytes. The locator probes one
/// candidate per possible byte of drift, plus the cursor itself.
constexpr std::size_t MAX_DECLARED_LENGTH_DRIFT = 1;

// ============================================================================
// Binary Flight Header Window
// ============================================================================

/// Size of the flight header window probed by the locator (14 words)
constexpr std::size_t FLIGHT_HEADER_SIZE = 28;

/// Byte offset of the flight number tag (word 0)
constexpr std::size_t FLIGHT_HEADER_FLIGHT_NUM_OFFSET = 0;

/// Byte offset of the recording interval (word 11)
constexpr std::size_t FLIGHT_HEADER_INTERVAL_OFFSET = 22;

/// Byte offset of the packed date (word 12)
constexpr std::size_t FLIGHT_HEADER_DATE_OFFSET = 24;

/// Byte offset of the packed time (word 13)
constexpr std::size_t FLIGHT_HEADER_TIME_OFFSET = 26;

/// Valid recording interval range, in seconds
constexpr unsigned MIN_RECORD_INTERVAL = 1;
constexpr unsigned MAX_RECORD_INTERVAL = 60;

// ============================================================================
// Date/Time Encoding Constants
// ============================================================================

/// Day of month: bits 0-4
constexpr uint16_t DATE_MDAY_MASK = 0x1f;

/// Month: bits 5-8
constexpr int DATE_MONTH_SHIFT = 5;
constexpr uint16_t DATE_MONTH_MASK = 0x0f;

/// Year since 2000: bits 9-15
constexpr int DATE_YEAR_SHIFT = 9;
constexpr uint16_t DATE_YEAR_MASK = 0x7f;
constexpr int DATE_YEAR_BASE = 2000;
constexpr int DATE_YEAR_MAX = 2100;

/// Seconds in 2-second ticks: bits 0-4
constexpr uint16_t TIME_SECONDS_MASK = 0x1f;
constexpr int TIME_SECONDS_SCALE = 2;

/// Minutes: bits 5-10
constexpr int TIME_MINUTES_SHIFT = 5;
constexpr uint16_t TIME_MINUTES_MASK = 0x3f;

/// Hours: bits 11-15
constexpr int TIME_HOURS_SHIFT = 11;
constexpr uint16_t TIME_HOURS_MASK = 0x1f;

/// Offset for tm_year field (years since 1900)
constexpr int TM_YEAR_BASE = 1900;

} // namespace edm_header
