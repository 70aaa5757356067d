// include/TCAT/JsonHelpers.hpp
#pragma once
#include "TCAT/Enums.hpp"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/GlobalSection.hpp"
#include "TCAT/PeakSection.hpp"
#include "TCAT/RouterEntry.hpp"
#include "TCAT/Sections.hpp"
#include "TCAT/StandaloneSection.hpp"
#include "TCAT/StreamFormatEntry.hpp"
#include "TCAT/Tcd22xxResolver.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <expected>
#include <nlohmann/json_fwd.hpp>

namespace TCAT::JsonHelpers {
    using json = nlohmann::json;

    std::string hexString(uint64_t value, int width = 0);
    json serializeHexBytes(const std::vector<uint8_t>& bytes);

    json serializeSection(const Section& section);
    json serializeGeneralSections(const GeneralSections& sections);
    json serializeExtensionSections(const ExtensionSections& sections);
    json serializeCaps(const ExtensionCaps& caps);
    json serializeGlobalParameters(const GlobalParameters& params);
    json serializeRouterEntry(const RouterEntry& entry);
    json serializeRouterEntries(const std::vector<RouterEntry>& entries);
    json serializeStreamFormats(const StreamFormats& formats);
    json serializeResolvedRouting(const ResolvedRouting& routing);
    json serializeDecodedRouting(const DecodedRouting& routing);
    json serializePeakLevels(const std::vector<PeakLevel>& levels);
    json serializeStandalone(const StandaloneParameters& params);

    /**
     * @brief Parse assignments written as [{"dst": "Ins0:0", "src": "Avs0:1"}, ...]
     * @return Assignments, or BadArgument for an unknown block, a channel above 15 or a
     *         destination given twice
     */
    std::expected<RoutingAssignments, ProtocolError> parseRoutingAssignments(const json& j);
}
