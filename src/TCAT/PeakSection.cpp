// src/TCAT/PeakSection.cpp
#include "TCAT/PeakSection.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace TCAT {

PeakSectionReader::PeakSectionReader(RegisterIo& io, const ExtensionSections& sections,
                                     const ExtensionCaps& caps, uint32_t timeoutMs)
    : io_(io),
      sections_(sections),
      caps_(caps),
      timeoutMs_(timeoutMs)
{
}

std::expected<std::vector<RouterEntry>, ProtocolError> PeakSectionReader::read()
{
    if (!caps_.general.peakAvail) {
        spdlog::debug("Peak metering not available");
        return std::unexpected(makeError(ExtensionError::FeatureUnavailable));
    }

    size_t length = static_cast<size_t>(caps_.router.maximumEntryCount) * TCAT_ROUTER_ENTRY_SIZE;
    if (length == 0)
        return std::vector<RouterEntry>{};
    if (length > sections_.peak.size) {
        spdlog::error("Peak section of {} bytes cannot hold {} entries", sections_.peak.size,
                      caps_.router.maximumEntryCount);
        return std::unexpected(makeError(ExtensionError::PeakSection));
    }

    auto raw = io_.readBlock(extensionOffset(sections_.peak, 0), length, timeoutMs_);
    if (!raw) {
        spdlog::error("Failed to read peak meters");
        return std::unexpected(makeTransportError(ExtensionError::PeakSection, raw.error()));
    }

    return parseRouterEntries(*raw);
}

std::vector<PeakLevel> associatePeaks(const std::vector<RouterEntry>& peaks, const std::vector<RouterEntry>& table)
{
    std::vector<PeakLevel> levels;
    size_t count = std::min(peaks.size(), table.size());
    levels.reserve(count);
    for (size_t i = 0; i < count; ++i)
        levels.push_back({table[i].src, table[i].dst, peaks[i].peak});
    return levels;
}

} // namespace TCAT
