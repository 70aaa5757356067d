// include/TCAT/PeakSection.hpp
#pragma once

#include "TCAT/Error.h"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/RouterEntry.hpp"
#include "TCAT/Sections.hpp"
#include <cstdint>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Peak of one router connection
 */
struct PeakLevel {
    SrcBlk src;
    DstBlk dst;
    uint16_t peak{0}; ///< 16-bit level

    bool operator==(const PeakLevel& other) const = default;
};

/**
 * @brief Pair peak entries with the router table they were measured on
 *
 * Entry i of the peak section belongs to entry i of the table; peaks past the end of the table
 * are discarded.
 */
std::vector<PeakLevel> associatePeaks(const std::vector<RouterEntry>& peaks, const std::vector<RouterEntry>& table);

/**
 * @brief Peak meter handling. The peak section mirrors the router table with live peaks.
 */
class PeakSectionReader {
public:
    PeakSectionReader(RegisterIo& io, const ExtensionSections& sections,
                      const ExtensionCaps& caps, uint32_t timeoutMs);

    /**
     * @brief Read maximum_entry_count entries from the peak section
     * @return Entries, or FeatureUnavailable without any transaction when peaks are not supported
     */
    std::expected<std::vector<RouterEntry>, ProtocolError> read();

private:
    RegisterIo& io_;
    ExtensionSections sections_;
    ExtensionCaps caps_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
