/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Turns verified header lines into header records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "FileHeaders.hpp"
#include "HeaderResult.hpp"

namespace edm_header {

/**
 * Remove a trailing "*HH" checksum from a header line. Anything else is left
 * alone.
 */
[[nodiscard]] std::string stripChecksum(const std::string &line);

/**
 * @brief splitHeaderFields
 *
 * Given a line (checksum already stripped) that looks like:
 *   $A, 305,230,500,415,60,1650,230,90
 *
 * break it into whitespace-trimmed fields, not including the leading "$A,".
 */
[[nodiscard]] std::vector<std::string> splitHeaderFields(const std::string &content);

/**
 * Decode one header line into the builder.
 *
 * The line's checksum must already have been verified. Unknown record types
 * are ignored. Never throws for bad field content.
 *
 * @return the flight index entry for a $D record, so the caller can advance
 *         its cumulative offset; std::nullopt for every other record.
 */
std::optional<FlightIndexEntry> decodeHeaderRecord(const std::string &line, HeaderBuilder &builder);

} // namespace edm_header
