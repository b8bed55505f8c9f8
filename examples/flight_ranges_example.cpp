/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Example showing how a flight data decoder gets its input from libedmheader.
 *
 * The header decoder works out where each flight's binary data starts. A
 * decoder for the engine samples only needs the byte range of the flight it
 * wants; this example prints those ranges and the first bytes of each one.
 *
 * Compilation:
 *   g++ -std=c++17 -I../src/libedmheader flight_ranges_example.cpp -L../build -ledmheader -o flight_ranges_example
 *
 * Usage:
 *   ./flight_ranges_example <path_to_edm_file>
 */

#include "FlightLocator.hpp"
#include "HeaderFile.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <vector>

using namespace edm_header;

int main(int argc, char *argv[])
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <path_to_edm_file>\n";
        return 1;
    }

    std::ifstream stream(argv[1], std::ios::binary);
    if (!stream) {
        std::cerr << "Error: Could not open file '" << argv[1] << "'\n";
        return 1;
    }
    std::vector<uint8_t> data{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};

    try {
        HeaderFile file;

        int probes = 0;
        file.setFlightProbeCb([&probes](const FlightIndexEntry &, std::size_t, bool) { probes++; });

        auto header = file.parse(data);

        std::cout << "==========================================\n";
        std::cout << "File: " << argv[1] << "\n";
        if (header.m_tailNum) {
            std::cout << "Tail Number: " << *header.m_tailNum << "\n";
        }
        if (header.m_configInfo) {
            std::cout << "EDM Model: " << header.m_configInfo->edm_model
                      << (header.m_configInfo->isTwin() ? " (twin)" : "") << "\n";
        }
        std::cout << "Binary data starts at byte " << header.m_binaryOffset << "\n";
        std::cout << "==========================================\n";

        for (const auto &flight : header.m_flights) {
            auto range = header.flightRange(flight);
            if (!range) {
                std::cout << "  Flight " << flight.flightNumber() << ": not located\n";
                continue;
            }

            std::cout << "  Flight " << flight.flightNumber() << ": bytes [" << range->first << ", " << range->second
                      << ")";

            // a sample decoder would start here
            std::cout << " first bytes:" << std::hex << std::setfill('0');
            for (std::size_t i = range->first; i < range->second && i < range->first + 8; ++i) {
                std::cout << " " << std::setw(2) << static_cast<unsigned>(data[i]);
            }
            std::cout << std::dec << std::setfill(' ') << "\n";
        }

        std::cout << "\nLocated " << header.resolvedFlightCount() << " of " << header.m_flights.size()
                  << " flight(s) with " << probes << " probe(s)\n";
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
