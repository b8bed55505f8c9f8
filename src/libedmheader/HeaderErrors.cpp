/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <sstream>
#include <string>

#include "HeaderErrors.hpp"

namespace edm_header {

namespace {

std::string checksumMismatchMessage(int lineno, unsigned declared, unsigned computed)
{
    std::stringstream msg;
    msg << "header checksum failed: line " << lineno << " (expected " << std::hex << declared << ", got " << computed
        << ")";
    return msg.str();
}

std::string malformedChecksumMessage(int lineno, const std::string &declaredText)
{
    std::stringstream msg;
    msg << "invalid header checksum format: line " << lineno << " ('" << declaredText << "')";
    return msg.str();
}

} // anonymous namespace

ChecksumError::ChecksumError(int lineno, unsigned declared, unsigned computed)
    : std::invalid_argument(checksumMismatchMessage(lineno, declared, computed)), m_lineno(lineno),
      m_declared(declared), m_computed(computed)
{
}

ChecksumError::ChecksumError(int lineno, const std::string &declaredText)
    : std::invalid_argument(malformedChecksumMessage(lineno, declaredText)), m_lineno(lineno)
{
}

} // namespace edm_header
