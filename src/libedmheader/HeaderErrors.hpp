/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Exceptions thrown while decoding an EDM file header.
 *
 * ChecksumError
 *      A header line's computed checksum disagrees with the declared one.
 *      The content of the line can't be trusted.
 *
 * HeaderParseError
 *      The header section is structurally broken (no $L record), so the
 *      start of the binary region is undefined.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace edm_header {

class ChecksumError : public std::invalid_argument
{
  public:
    ChecksumError(int lineno, unsigned declared, unsigned computed);

    /// Used when the characters after the '*' aren't a two digit hex value
    ChecksumError(int lineno, const std::string &declaredText);

    int lineno() const { return m_lineno; }
    unsigned declared() const { return m_declared; }
    unsigned computed() const { return m_computed; }

  private:
    int m_lineno{0};
    unsigned m_declared{0};
    unsigned m_computed{0};
};

class HeaderParseError : public std::runtime_error
{
  public:
    explicit HeaderParseError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace edm_header
