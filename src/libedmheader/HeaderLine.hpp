/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Lazy reader for the checksummed ASCII header lines of an EDM file.
 *
 * Every header line looks like:
 *   $A, 305,230,500,415,60,1650,230,90*5F\r\n
 *
 * The reader walks the raw file bytes from offset 0, yielding one line per
 * CR LF pair, until it either:
 *   - consumes the $L record (the binary flight data starts right after it),
 *   - hits a line that doesn't start with '$' (left unconsumed), or
 *   - runs out of CR LF pairs.
 *
 * Each yielded line has already had its checksum verified.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>

namespace edm_header {

/**
 * @brief One header line, without its CR LF terminator.
 */
struct HeaderLine {
    std::string text;           ///< e.g. "$D, 84, 3417*49"
    int lineno{0};              ///< 1-based line number in the file
    std::size_t startOffset{0}; ///< offset of the '$'
    std::size_t endOffset{0};   ///< offset just past the CR LF

    /// Record type character, or '\0' for a bare "$"
    [[nodiscard]] char recordType() const { return text.size() > 1 ? text[1] : '\0'; }

    /// True for the $L record that ends the header section
    [[nodiscard]] bool isTerminal() const;
};

/**
 * XOR of every character in the payload (the text between '$' and '*').
 */
[[nodiscard]] uint8_t computeHeaderChecksum(const std::string &payload);

/**
 * Build a full header line, "$<payload>*HH", without the CR LF.
 */
[[nodiscard]] std::string formatHeaderLine(const std::string &payload);

/**
 * Validate a header line's checksum.
 *
 * Lines without a '*' aren't checksummed and pass. Throws ChecksumError if the
 * two hex digits after the last '*' are malformed or don't match.
 */
void validateHeaderChecksum(int lineno, const std::string &line);

class HeaderLineReader
{
  public:
    /**
     * @brief Input iterator over the remaining lines of a reader.
     *
     * Iterators share the reader's position, so the sequence can only be
     * walked once.
     */
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = HeaderLine;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type *;
        using reference = const value_type &;

        Iterator() = default;
        explicit Iterator(HeaderLineReader *reader);

        reference operator*() const;
        pointer operator->() const;
        Iterator &operator++();

        bool operator==(const Iterator &other) const;
        bool operator!=(const Iterator &other) const;

      private:
        void advance();

        HeaderLineReader *m_reader{nullptr};
        std::optional<HeaderLine> m_current;
    };

    /// The buffer must outlive the reader
    HeaderLineReader(const uint8_t *data, std::size_t size);

    HeaderLineReader(const HeaderLineReader &) = delete;
    HeaderLineReader &operator=(const HeaderLineReader &) = delete;

    /**
     * Read and verify the next header line.
     *
     * Returns std::nullopt once the header section is over. Throws
     * ChecksumError on a bad checksum.
     */
    std::optional<HeaderLine> next();

    [[nodiscard]] Iterator begin();
    [[nodiscard]] Iterator end();

    /// Offset just past the $L record, if it has been read
    [[nodiscard]] std::optional<std::size_t> terminalOffset() const { return m_terminalOffset; }

    /// Offset the next read will start at
    [[nodiscard]] std::size_t position() const { return m_pos; }

  private:
    const uint8_t *m_data;
    std::size_t m_size;
    std::size_t m_pos{0};
    int m_lineno{0};
    bool m_done{false};
    std::optional<std::size_t> m_terminalOffset;
};

} // namespace edm_header
