// include/TCAT/CurrentConfigSection.hpp
#pragma once

#include "TCAT/Enums.hpp"
#include "TCAT/Error.h"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/RouterEntry.hpp"
#include "TCAT/Sections.hpp"
#include "TCAT/StreamFormatEntry.hpp"
#include <cstdint>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Read-only view of the configuration the device runs at each rate mode
 */
class CurrentConfigSection {
public:
    CurrentConfigSection(RegisterIo& io, const ExtensionSections& sections,
                         const ExtensionCaps& caps, uint32_t timeoutMs);

    std::expected<std::vector<RouterEntry>, ProtocolError> readRouterEntries(RateMode mode);
    std::expected<StreamFormats, ProtocolError> readStreamFormats(RateMode mode);

    static uint32_t routerOffset(RateMode mode);
    static uint32_t streamFormatOffset(RateMode mode);

private:
    RegisterIo& io_;
    ExtensionSections sections_;
    ExtensionCaps caps_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
