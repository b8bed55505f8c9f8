/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Builds or checks JPI EDM header lines.
 *
 * Usage:
 *   ./header_checksum_generator "D, 84, 3417"      prints $D, 84, 3417*49
 *   ./header_checksum_generator -c < headers.txt   verifies each $... line
 *
 * With no arguments, payloads (without the leading '$' or checksum) are read
 * from stdin, one per line.
 */

#include <iostream>
#include <string>

#include "HeaderErrors.hpp"
#include "HeaderLine.hpp"

using namespace edm_header;

namespace {

int checkLines(std::istream &in)
{
    int lineno = 0;
    int failures = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        try {
            validateHeaderChecksum(lineno, line);
            std::cout << "ok   " << line << "\n";
        } catch (const ChecksumError &ex) {
            std::cout << "FAIL " << line << "  (" << ex.what() << ")\n";
            failures++;
        }
    }
    return failures == 0 ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char **argv)
{
    if (argc > 1 && std::string(argv[1]) == "-c") {
        return checkLines(std::cin);
    }

    if (argc > 1) {
        std::cout << formatHeaderLine(argv[1]) << "\r\n";
        return 0;
    }

    std::cerr << "Enter header payloads (without leading '$' or checksum)." << std::endl;
    std::cerr << "Press Ctrl+D (Unix) or Ctrl+Z (Windows) to finish." << std::endl;

    std::string payload;
    while (std::getline(std::cin, payload)) {
        std::cout << formatHeaderLine(payload) << "\r\n";
    }

    return 0;
}
