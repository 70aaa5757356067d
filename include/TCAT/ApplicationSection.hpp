// include/TCAT/ApplicationSection.hpp
#pragma once

#include "TCAT/Error.h"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include <cstdint>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Raw access to the vendor application section
 *
 * The layout is defined by vendor firmware; only the section bounds are enforced here.
 */
class ApplicationSection {
public:
    ApplicationSection(RegisterIo& io, const ExtensionSections& sections, uint32_t timeoutMs);

    /**
     * @brief Read bytes from the application section
     * @param offset Byte offset inside the section, quadlet aligned
     * @param length Number of bytes, multiple of 4
     * @return Payload, BadArgument when the range leaves the section, or ApplSection on transport failure
     */
    std::expected<std::vector<uint8_t>, ProtocolError> read(uint32_t offset, size_t length);

    std::expected<void, ProtocolError> write(uint32_t offset, const std::vector<uint8_t>& data);

private:
    std::expected<void, ProtocolError> checkRange(uint32_t offset, size_t length) const;

    RegisterIo& io_;
    ExtensionSections sections_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
