/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Utilities for decoding the header section of a JPI EDM flight file.
 *
 */

#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "FlightLocator.hpp"
#include "HeaderFile.hpp"
#include "HeaderLine.hpp"
#include "RecordDecoder.hpp"

namespace edm_header {

void HeaderFile::setHeaderCompletionCb(std::function<void(const HeaderResult &)> cb) { m_headerCompletionCb = cb; }

void HeaderFile::setFlightProbeCb(FlightLocator::ProbeCb cb) { m_flightProbeCb = cb; }

void HeaderFile::parseFileHeaders(const uint8_t *data, std::size_t size, HeaderBuilder &builder)
{
    HeaderLineReader reader(data, size);

    for (const auto &line : reader) {
        if (auto flight = decodeHeaderRecord(line.text, builder)) {
            builder.advanceCumulativeOffset(flight->dataLength());
        }
    }

    if (auto offset = reader.terminalOffset()) {
        builder.markBinaryStart(*offset);
    }
}

HeaderResult HeaderFile::parse(const uint8_t *data, std::size_t size)
{
    HeaderBuilder builder;
    builder.setBufferSize(size);

    parseFileHeaders(data, size, builder);
    if (builder.hasBinaryStart()) {
        FlightLocator locator;
        locator.setProbeCb(m_flightProbeCb);
        locator.locate(data, size, builder.binaryStart(), builder.flights());
    }

    HeaderResult result = std::move(builder).build();

    if (m_headerCompletionCb) {
        m_headerCompletionCb(result);
    }
    return result;
}

HeaderResult HeaderFile::parse(const std::vector<uint8_t> &data) { return parse(data.data(), data.size()); }

HeaderResult HeaderFile::parse(std::istream &stream)
{
    std::vector<uint8_t> buffer{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        std::stringstream msg;
        msg << "Couldn't read stream after " << buffer.size() << " bytes";
        throw std::runtime_error{msg.str()};
    }
    return parse(buffer);
}

HeaderResult parseHeader(const uint8_t *data, std::size_t size)
{
    HeaderFile file;
    return file.parse(data, size);
}

HeaderResult parseHeader(const std::vector<uint8_t> &data) { return parseHeader(data.data(), data.size()); }

} // namespace edm_header
