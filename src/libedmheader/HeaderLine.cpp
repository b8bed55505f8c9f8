/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Lazy reader for the checksummed ASCII header lines of an EDM file.
 */

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "HeaderErrors.hpp"
#include "HeaderLine.hpp"
#include "ProtocolConstants.hpp"

namespace edm_header {

// #define EDMHEADER_DEBUG_HEADERS

bool HeaderLine::isTerminal() const
{
    return text.size() >= RECORD_PREFIX_LENGTH && text[0] == HEADER_LINE_MARKER && text[1] == RECORD_LAST;
}

uint8_t computeHeaderChecksum(const std::string &payload)
{
    uint8_t cs = 0;
    for (char c : payload) {
        cs ^= static_cast<uint8_t>(c);
    }
    return cs;
}

std::string formatHeaderLine(const std::string &payload)
{
    std::ostringstream line;
    line << HEADER_LINE_MARKER << payload << CHECKSUM_SEPARATOR << std::uppercase << std::setfill('0')
         << std::setw(CHECKSUM_DIGITS) << std::hex << static_cast<unsigned>(computeHeaderChecksum(payload));
    return line.str();
}

void validateHeaderChecksum(int lineno, const std::string &line)
{
    size_t asteriskPos = line.rfind(CHECKSUM_SEPARATOR);
    if (asteriskPos == std::string::npos) {
        // no checksum on this line, nothing to verify
        return;
    }

    std::string checksumStr = line.substr(asteriskPos + 1, CHECKSUM_DIGITS);
    if (checksumStr.size() != CHECKSUM_DIGITS || !std::isxdigit(static_cast<unsigned char>(checksumStr[0])) ||
        !std::isxdigit(static_cast<unsigned char>(checksumStr[1]))) {
        throw ChecksumError(lineno, checksumStr);
    }
    auto declared = static_cast<unsigned>(std::stoul(checksumStr, nullptr, 16));

    // XOR of everything strictly between the '$' and the '*'
    std::string payload = (asteriskPos > 1) ? line.substr(1, asteriskPos - 1) : std::string{};
    unsigned computed = computeHeaderChecksum(payload);

    if (declared != computed) {
        throw ChecksumError(lineno, declared, computed);
    }
}

HeaderLineReader::HeaderLineReader(const uint8_t *data, std::size_t size) : m_data(data), m_size(size)
{
    if (!m_data && m_size != 0) {
        throw std::invalid_argument{"HeaderLineReader: null buffer"};
    }
}

std::optional<HeaderLine> HeaderLineReader::next()
{
    if (m_done || !m_data) {
        return std::nullopt;
    }

    // find the next CR LF pair
    std::size_t lineEnd = m_pos;
    bool found = false;
    for (; lineEnd + 1 < m_size; ++lineEnd) {
        if (m_data[lineEnd] == LINE_TERMINATOR_CR && m_data[lineEnd + 1] == LINE_TERMINATOR_LF) {
            found = true;
            break;
        }
    }
    if (!found) {
        m_done = true;
        return std::nullopt;
    }

    // a line that isn't a header marks the end of the header section; leave it for whoever reads next
    if (lineEnd == m_pos || m_data[m_pos] != static_cast<uint8_t>(HEADER_LINE_MARKER)) {
        m_done = true;
        return std::nullopt;
    }

    HeaderLine line;
    line.text.assign(reinterpret_cast<const char *>(m_data + m_pos), lineEnd - m_pos);
    line.lineno = ++m_lineno;
    line.startOffset = m_pos;
    line.endOffset = lineEnd + LINE_TERMINATOR_LENGTH;

#ifdef EDMHEADER_DEBUG_HEADERS
    std::cout << "header line " << line.lineno << " @0x" << std::hex << line.startOffset << std::dec << ": "
              << line.text << "\n";
#endif

    validateHeaderChecksum(line.lineno, line.text);

    m_pos = line.endOffset;

    if (line.isTerminal()) {
        m_terminalOffset = line.endOffset;
        m_done = true;
    }

    return line;
}

HeaderLineReader::Iterator HeaderLineReader::begin() { return Iterator(this); }

HeaderLineReader::Iterator HeaderLineReader::end() { return Iterator(); }

// =============================================================================
// HeaderLineReader::Iterator Implementation
// =============================================================================

HeaderLineReader::Iterator::Iterator(HeaderLineReader *reader) : m_reader(reader) { advance(); }

void HeaderLineReader::Iterator::advance()
{
    if (!m_reader) {
        m_current.reset();
        return;
    }
    m_current = m_reader->next();
    if (!m_current) {
        m_reader = nullptr;
    }
}

HeaderLineReader::Iterator::reference HeaderLineReader::Iterator::operator*() const
{
    if (!m_current) {
        throw std::out_of_range("HeaderLineReader::Iterator: dereferencing end iterator");
    }
    return *m_current;
}

HeaderLineReader::Iterator::pointer HeaderLineReader::Iterator::operator->() const
{
    if (!m_current) {
        throw std::out_of_range("HeaderLineReader::Iterator: dereferencing end iterator");
    }
    return &(*m_current);
}

HeaderLineReader::Iterator &HeaderLineReader::Iterator::operator++()
{
    advance();
    return *this;
}

bool HeaderLineReader::Iterator::operator==(const Iterator &other) const
{
    // two end iterators are equal
    if (!m_current && !other.m_current) {
        return true;
    }
    if (!m_current || !other.m_current) {
        return false;
    }
    return m_reader == other.m_reader && m_current->startOffset == other.m_current->startOffset;
}

bool HeaderLineReader::Iterator::operator!=(const Iterator &other) const { return !(*this == other); }

} // namespace edm_header
