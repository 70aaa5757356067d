// src/TCAT/ApplicationSection.cpp
#include "TCAT/ApplicationSection.hpp"
#include "TCAT/Helpers.h"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace TCAT {

ApplicationSection::ApplicationSection(RegisterIo& io, const ExtensionSections& sections, uint32_t timeoutMs)
    : io_(io),
      sections_(sections),
      timeoutMs_(timeoutMs)
{
}

std::expected<void, ProtocolError> ApplicationSection::checkRange(uint32_t offset, size_t length) const
{
    if (offset % TCAT_QUADLET_SIZE != 0 || length % TCAT_QUADLET_SIZE != 0) {
        spdlog::error("Unaligned application access at 0x{:x} ({} bytes)", offset, length);
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }
    if (static_cast<uint64_t>(offset) + length > sections_.application.size) {
        spdlog::error("Application access 0x{:x}+{} exceeds section size {}", offset, length,
                      sections_.application.size);
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }
    return {};
}

std::expected<std::vector<uint8_t>, ProtocolError> ApplicationSection::read(uint32_t offset, size_t length)
{
    auto range = checkRange(offset, length);
    if (!range)
        return std::unexpected(range.error());
    if (length == 0)
        return std::vector<uint8_t>{};

    auto raw = io_.readBlock(extensionOffset(sections_.application, offset), length, timeoutMs_);
    if (!raw) {
        spdlog::error("Failed to read application section at 0x{:x}", offset);
        return std::unexpected(makeTransportError(ExtensionError::ApplSection, raw.error()));
    }
    return std::move(*raw);
}

std::expected<void, ProtocolError> ApplicationSection::write(uint32_t offset, const std::vector<uint8_t>& data)
{
    auto range = checkRange(offset, data.size());
    if (!range)
        return std::unexpected(range.error());
    if (data.empty())
        return {};

    spdlog::debug("Writing application section at 0x{:x}: {}", offset, Helpers::formatHexBytes(data));
    auto res = io_.writeBlock(extensionOffset(sections_.application, offset), data, timeoutMs_);
    if (!res) {
        spdlog::error("Failed to write application section at 0x{:x}", offset);
        return std::unexpected(makeTransportError(ExtensionError::ApplSection, res.error()));
    }
    return {};
}

} // namespace TCAT
