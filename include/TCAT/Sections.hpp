// include/TCAT/Sections.hpp
#pragma once

#include "TCAT/RegisterIo.hpp"
#include "TCAT/Error.h"
#include <cstdint>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Location of one register section, in bytes
 */
struct Section {
    uint32_t offset{0};
    uint32_t size{0};

    bool operator==(const Section& other) const = default;
};

/**
 * @brief Sections at the head of the TCAT address space
 */
struct GeneralSections {
    Section global;
    Section txStreamFormat;
    Section rxStreamFormat;
    Section extSync;
    Section reserved;
};

/**
 * @brief Sections of the extension space. Offsets are relative to TCAT_EXTENSION_OFFSET.
 */
struct ExtensionSections {
    Section caps;
    Section cmd;
    Section mixer;
    Section peak;
    Section router;
    Section streamFormat;
    Section currentConfig;
    Section standalone;
    Section application;
};

std::expected<GeneralSections, ProtocolError> parseGeneralSections(const std::vector<uint8_t>& raw);
std::expected<ExtensionSections, ProtocolError> parseExtensionSections(const std::vector<uint8_t>& raw);

/**
 * @brief Absolute offset (relative to the TCAT base) of a field inside an extension section
 */
uint64_t extensionOffset(const Section& section, uint32_t offset);

/**
 * @brief Reads the bootstrap tables locating every register section
 */
class SectionTableReader {
public:
    SectionTableReader(RegisterIo& io, uint32_t timeoutMs);

    std::expected<GeneralSections, ProtocolError> readGeneralSections();
    std::expected<ExtensionSections, ProtocolError> readExtensionSections();

private:
    RegisterIo& io_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
