// src/TCAT/Sections.cpp
#include "TCAT/Sections.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>

namespace TCAT {

namespace {
    // Offsets and sizes are stored in quadlets
    Section parseSection(const uint8_t* raw)
    {
        Section section;
        section.offset = readBe32(raw) * 4;
        section.size = readBe32(raw + 4) * 4;
        return section;
    }
}

std::expected<GeneralSections, ProtocolError> parseGeneralSections(const std::vector<uint8_t>& raw)
{
    if (raw.size() < TCAT_GENERAL_SECTIONS_SIZE) {
        spdlog::error("General section table too short: {} bytes", raw.size());
        return std::unexpected(makeError(ExtensionError::SectionTable));
    }

    GeneralSections sections;
    sections.global = parseSection(&raw[0]);
    sections.txStreamFormat = parseSection(&raw[8]);
    sections.rxStreamFormat = parseSection(&raw[16]);
    sections.extSync = parseSection(&raw[24]);
    sections.reserved = parseSection(&raw[32]);
    return sections;
}

std::expected<ExtensionSections, ProtocolError> parseExtensionSections(const std::vector<uint8_t>& raw)
{
    if (raw.size() < TCAT_EXTENSION_SECTIONS_SIZE) {
        spdlog::error("Extension section table too short: {} bytes", raw.size());
        return std::unexpected(makeError(ExtensionError::SectionTable));
    }

    ExtensionSections sections;
    sections.caps = parseSection(&raw[0]);
    sections.cmd = parseSection(&raw[8]);
    sections.mixer = parseSection(&raw[16]);
    sections.peak = parseSection(&raw[24]);
    sections.router = parseSection(&raw[32]);
    sections.streamFormat = parseSection(&raw[40]);
    sections.currentConfig = parseSection(&raw[48]);
    sections.standalone = parseSection(&raw[56]);
    sections.application = parseSection(&raw[64]);
    return sections;
}

uint64_t extensionOffset(const Section& section, uint32_t offset)
{
    return static_cast<uint64_t>(TCAT_EXTENSION_OFFSET) + section.offset + offset;
}

SectionTableReader::SectionTableReader(RegisterIo& io, uint32_t timeoutMs)
    : io_(io),
      timeoutMs_(timeoutMs)
{
}

std::expected<GeneralSections, ProtocolError> SectionTableReader::readGeneralSections()
{
    spdlog::debug("Reading general section table");

    auto raw = io_.readBlock(0, TCAT_GENERAL_SECTIONS_SIZE, timeoutMs_);
    if (!raw) {
        spdlog::error("Could not read general section table");
        return std::unexpected(makeTransportError(ExtensionError::SectionTable, raw.error()));
    }

    auto sections = parseGeneralSections(*raw);
    if (sections) {
        spdlog::debug(" Global            : offset=0x{:x} size={}", sections->global.offset, sections->global.size);
        spdlog::debug(" TX stream format  : offset=0x{:x} size={}", sections->txStreamFormat.offset, sections->txStreamFormat.size);
        spdlog::debug(" RX stream format  : offset=0x{:x} size={}", sections->rxStreamFormat.offset, sections->rxStreamFormat.size);
        spdlog::debug(" External sync     : offset=0x{:x} size={}", sections->extSync.offset, sections->extSync.size);
    }
    return sections;
}

std::expected<ExtensionSections, ProtocolError> SectionTableReader::readExtensionSections()
{
    spdlog::debug("Reading extension section table");

    auto raw = io_.readBlock(TCAT_EXTENSION_OFFSET, TCAT_EXTENSION_SECTIONS_SIZE, timeoutMs_);
    if (!raw) {
        spdlog::error("Could not read extension section table");
        return std::unexpected(makeTransportError(ExtensionError::SectionTable, raw.error()));
    }

    auto sections = parseExtensionSections(*raw);
    if (sections) {
        spdlog::debug("Extension section info:");
        spdlog::debug(" Capability        : offset=0x{:x} size={}", sections->caps.offset, sections->caps.size);
        spdlog::debug(" Command           : offset=0x{:x} size={}", sections->cmd.offset, sections->cmd.size);
        spdlog::debug(" Mixer             : offset=0x{:x} size={}", sections->mixer.offset, sections->mixer.size);
        spdlog::debug(" Peak              : offset=0x{:x} size={}", sections->peak.offset, sections->peak.size);
        spdlog::debug(" Router            : offset=0x{:x} size={}", sections->router.offset, sections->router.size);
        spdlog::debug(" Stream format     : offset=0x{:x} size={}", sections->streamFormat.offset, sections->streamFormat.size);
        spdlog::debug(" Current config    : offset=0x{:x} size={}", sections->currentConfig.offset, sections->currentConfig.size);
        spdlog::debug(" Standalone        : offset=0x{:x} size={}", sections->standalone.offset, sections->standalone.size);
        spdlog::debug(" Application       : offset=0x{:x} size={}", sections->application.offset, sections->application.size);
    }
    return sections;
}

} // namespace TCAT
