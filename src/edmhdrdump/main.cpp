/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Dumps the decoded header and flight locations of JPI EDM files.
 */

#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include "getopt.h"
#else
#include <unistd.h>
#endif

#include "libedmheader/FlightLocator.hpp"
#include "libedmheader/HeaderFile.hpp"

using namespace edm_header;

static bool g_verbose = false;

void printFlightInfo(const std::vector<uint8_t> &data, const HeaderResult &header, const FlightIndexEntry &flight,
                     std::ostream &outStream)
{
    outStream << "Flt #" << flight.flightNumber() << " - " << flight.dataWords() << " words (" << flight.dataLength()
              << " bytes)";
    outStream << " declared @ 0x" << std::hex << (header.m_binaryOffset + flight.startOffset()) << std::dec;

    auto range = header.flightRange(flight);
    if (!range) {
        outStream << " unresolved" << std::endl;
        return;
    }

    outStream << " found @ 0x" << std::hex << range->first << std::dec;

    FlightStamp stamp = decodeFlightStamp(data.data() + range->first);
    std::tm start = stamp.toTm();
    outStream << " @ " << stamp.interval << " sec";
    outStream << " " << std::put_time(&start, "%m/%d/%Y") << " " << std::put_time(&start, "%T");
    outStream << std::endl;
}

bool processFile(const std::string &filename, std::optional<int> flightId, bool onlyListFlights,
                 std::ostream &outStream)
{
    std::error_code ec;
    auto length = std::filesystem::file_size(std::filesystem::path{filename}, ec);
    if (ec.value() != 0) {
        std::cerr << "No such file\n";
        return false;
    }
    if (length == 0) {
        std::cerr << "Empty file\n";
        return false;
    }

    std::ifstream inStream(filename, std::ios_base::binary);
    if (!inStream.is_open()) {
        std::cerr << "Couldn't open file\n";
        return false;
    }

    std::vector<uint8_t> data{std::istreambuf_iterator<char>(inStream), std::istreambuf_iterator<char>()};

    try {
        HeaderFile file;
        file.setHeaderCompletionCb([&outStream, onlyListFlights](const HeaderResult &header) {
            if (g_verbose && !onlyListFlights) {
                header.dump(outStream);
            }
        });

        auto header = file.parse(data);

        if (flightId.has_value()) {
            auto flight = header.findFlight(static_cast<uint16_t>(flightId.value()));
            if (!flight) {
                outStream << "Flight #" << flightId.value() << " not found in file" << std::endl;
                return true;
            }
            printFlightInfo(data, header, *flight, outStream);
            return true;
        }

        for (const auto &flight : header.m_flights) {
            printFlightInfo(data, header, flight, outStream);
        }
        if (!onlyListFlights) {
            outStream << header.resolvedFlightCount() << " of " << header.m_flights.size() << " flights located"
                      << std::endl;
        }
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return false;
    }
    return true;
}

void showHelp(char *progName)
{
    std::cout << "Usage: " << progName << " [options] jpifile..." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "    -h              print this help" << std::endl;
    std::cout << "    -f <flightno>   only output a specific flight number" << std::endl;
    std::cout << "    -l              list flights only" << std::endl;
    std::cout << "    -o <filename>   output to a file" << std::endl;
    std::cout << "    -v              dump the decoded header records" << std::endl;
}

int main(int argc, char *argv[])
{
    bool onlyListFlights{false};
    std::string outputFile{};
    std::optional<int> flightId; // std::nullopt means all flights

    int c;
    while ((c = getopt(argc, argv, "hf:lo:v")) != -1) {
        switch (c) {
        case 'h':
            showHelp(argv[0]);
            return 0;
        case 'f':
            try {
                size_t idx = 0;
                int flightNum = std::stoi(optarg, &idx);
                if (idx != strlen(optarg)) {
                    std::cerr << "Error: Invalid flight number format (contains non-numeric characters): " << optarg
                              << std::endl;
                    return 1;
                }
                if (flightNum < 0 || flightNum > 0xFFFF) {
                    std::cerr << "Error: Flight number must be between 0 and 65535" << std::endl;
                    return 1;
                }
                flightId = flightNum;
            } catch (const std::invalid_argument &) {
                std::cerr << "Error: Flight number must be a valid integer: " << optarg << std::endl;
                return 1;
            } catch (const std::out_of_range &) {
                std::cerr << "Error: Flight number out of range: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'l':
            onlyListFlights = true;
            break;
        case 'o':
            outputFile = optarg;
            break;
        case 'v':
            g_verbose = true;
            break;
        default:
            showHelp(argv[0]);
            return 1;
        }
    }

    if (optind == argc) {
        showHelp(argv[0]);
        return 0;
    }

    std::ofstream outFileStream;
    if (!outputFile.empty()) {
        outFileStream.open(outputFile, std::ios::out | std::ios::trunc);
        if (!outFileStream.is_open()) {
            std::cerr << "Couldn't open output file\n";
            return 1;
        }
    }
    std::ostream &outStream = (outputFile.empty() ? std::cout : outFileStream);

    bool ok = true;
    for (int i = optind; i < argc; ++i) {
        if (argc - optind > 1) {
            outStream << argv[i] << std::endl;
        }
        ok = processFile(argv[i], flightId, onlyListFlights, outStream) && ok;
    }
    return ok ? 0 : 1;
}
