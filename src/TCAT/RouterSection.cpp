// src/TCAT/RouterSection.cpp
#include "TCAT/RouterSection.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>

namespace TCAT {

std::expected<std::vector<RouterEntry>, ProtocolError> readRouterBlock(RegisterIo& io, uint64_t offset,
                                                                       const ExtensionCaps& caps,
                                                                       ExtensionError section, uint32_t timeoutMs)
{
    spdlog::debug("Reading router entries from offset 0x{:x}", offset);

    auto count = io.readQuadlet(offset, timeoutMs);
    if (!count) {
        spdlog::error("Failed to read number of routes");
        return std::unexpected(makeTransportError(section, count.error()));
    }

    if (*count > caps.router.maximumEntryCount) {
        spdlog::error("Device reports {} routes, capability allows {}", *count, caps.router.maximumEntryCount);
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }

    if (*count == 0) {
        spdlog::debug("No routes defined in configuration");
        return std::vector<RouterEntry>{};
    }

    auto raw = io.readBlock(offset + 4, *count * TCAT_ROUTER_ENTRY_SIZE, timeoutMs);
    if (!raw) {
        spdlog::error("Failed to read route entries");
        return std::unexpected(makeTransportError(section, raw.error()));
    }

    auto entries = parseRouterEntries(*raw);
    if (entries) {
        for (const auto& entry : *entries)
            spdlog::debug("Read route: {} -> {}", toString(entry.src), toString(entry.dst));
        spdlog::debug("Read {} routes", entries->size());
    }
    return entries;
}

RouterSectionProtocol::RouterSectionProtocol(RegisterIo& io, const ExtensionSections& sections,
                                             const ExtensionCaps& caps, uint32_t timeoutMs)
    : io_(io),
      sections_(sections),
      caps_(caps),
      timeoutMs_(timeoutMs)
{
}

std::expected<std::vector<RouterEntry>, ProtocolError> RouterSectionProtocol::read()
{
    return readRouterBlock(io_, extensionOffset(sections_.router, 0), caps_,
                           ExtensionError::RouterSection, timeoutMs_);
}

std::expected<void, ProtocolError> RouterSectionProtocol::write(const std::vector<RouterEntry>& entries)
{
    if (entries.size() > caps_.router.maximumEntryCount) {
        spdlog::error("{} routes exceed the router capacity of {}", entries.size(), caps_.router.maximumEntryCount);
        return std::unexpected(makeError(ExtensionError::RoutingCapacityExceeded));
    }

    auto data = buildRouterEntries(entries);
    if (!data)
        return std::unexpected(data.error());

    std::vector<uint8_t> raw(4);
    writeBe32(raw.data(), static_cast<uint32_t>(entries.size()));
    raw.insert(raw.end(), data->begin(), data->end());

    if (raw.size() > sections_.router.size) {
        spdlog::error("Router image of {} bytes exceeds section size {}", raw.size(), sections_.router.size);
        return std::unexpected(makeError(ExtensionError::RoutingCapacityExceeded));
    }

    spdlog::debug("Writing {} routes to offset 0x{:x}", entries.size(), sections_.router.offset);
    auto res = io_.writeBlock(extensionOffset(sections_.router, 0), raw, timeoutMs_);
    if (!res) {
        spdlog::error("Failed to write router configuration");
        return std::unexpected(makeTransportError(ExtensionError::RouterSection, res.error()));
    }

    spdlog::info("Wrote {} routes to router section", entries.size());
    return {};
}

} // namespace TCAT
