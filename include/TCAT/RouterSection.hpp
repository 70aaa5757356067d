// include/TCAT/RouterSection.hpp
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
 * @brief Read a counted router block (entry count quadlet followed by entries)
 * @param section Section tag used to wrap transport failures
 */
std::expected<std::vector<RouterEntry>, ProtocolError> readRouterBlock(RegisterIo& io, uint64_t offset,
                                                                       const ExtensionCaps& caps,
                                                                       ExtensionError section, uint32_t timeoutMs);

/**
 * @brief Router section: the table applied by the LoadRouter command
 */
class RouterSectionProtocol {
public:
    RouterSectionProtocol(RegisterIo& io, const ExtensionSections& sections,
                          const ExtensionCaps& caps, uint32_t timeoutMs);

    /**
     * @brief Read the entry count and all entries
     * @return Entries, MalformedEntry on an invalid entry or count, or a wrapped transport failure
     */
    std::expected<std::vector<RouterEntry>, ProtocolError> read();

    /**
     * @brief Replace the whole table in one block transaction
     *
     * Tables longer than the router capability are rejected before any transaction.
     */
    std::expected<void, ProtocolError> write(const std::vector<RouterEntry>& entries);

private:
    RegisterIo& io_;
    ExtensionSections sections_;
    ExtensionCaps caps_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
