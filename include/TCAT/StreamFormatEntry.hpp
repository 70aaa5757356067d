// include/TCAT/StreamFormatEntry.hpp
#pragma once

#include "TCAT/Error.h"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include "TCAT/TcatDefines.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Channel layout of one isochronous stream
 *
 * The first entry of each direction corresponds to the Avs0 block, the second to Avs1.
 */
struct FormatEntry {
    uint8_t pcmCount{0};
    uint8_t midiCount{0};
    std::vector<std::string> labels;
    std::array<bool, TCAT_FORMAT_AC3_CHANNELS> enableAc3{};

    bool operator==(const FormatEntry& other) const = default;
};

/**
 * @brief Stream formats of both directions, seen from the device
 */
struct StreamFormats {
    std::vector<FormatEntry> tx; ///< Device to host, fed by destinations Avs0/Avs1
    std::vector<FormatEntry> rx; ///< Host to device, sources Avs0/Avs1

    bool operator==(const StreamFormats& other) const = default;
};

std::expected<FormatEntry, ProtocolError> parseFormatEntry(const uint8_t* raw, size_t size);
std::expected<std::vector<uint8_t>, ProtocolError> buildFormatEntry(const FormatEntry& entry);

/**
 * @brief Decode a stream format block (tx count, rx count, entries)
 * @param raw Block image starting at the count quadlets
 * @param caps Upper bounds for both counts
 */
std::expected<StreamFormats, ProtocolError> parseStreamFormats(const std::vector<uint8_t>& raw,
                                                               const ExtensionCaps& caps);

/**
 * @brief Read a stream format block at an absolute offset. Shared with the current config section.
 * @param section Section tag used to wrap transport failures
 */
std::expected<StreamFormats, ProtocolError> readStreamFormatBlock(RegisterIo& io, uint64_t offset,
                                                                  const ExtensionCaps& caps,
                                                                  ExtensionError section, uint32_t timeoutMs);

/**
 * @brief Stream format section: the formats to apply by the LoadStreamConfig command
 */
class StreamFormatSectionProtocol {
public:
    StreamFormatSectionProtocol(RegisterIo& io, const ExtensionSections& sections,
                                const ExtensionCaps& caps, uint32_t timeoutMs);

    std::expected<StreamFormats, ProtocolError> read();

    /**
     * @brief Write both directions; counts must equal the capability maxima
     */
    std::expected<void, ProtocolError> write(const StreamFormats& formats);

private:
    RegisterIo& io_;
    ExtensionSections sections_;
    ExtensionCaps caps_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
