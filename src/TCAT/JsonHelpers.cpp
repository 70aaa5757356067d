// src/TCAT/JsonHelpers.cpp
#include "TCAT/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <iomanip>

namespace TCAT::JsonHelpers {
namespace {
    template <typename Blk, typename BlkId>
    std::expected<Blk, ProtocolError> parseChannel(const std::string& text,
                                                   std::expected<BlkId, ProtocolError> (*fromString)(const std::string&))
    {
        auto colon = text.rfind(':');
        if (colon == std::string::npos || colon + 1 == text.size()) {
            spdlog::error("Channel '{}' is not of the form Block:channel", text);
            return std::unexpected(makeError(ExtensionError::BadArgument));
        }

        auto id = fromString(text.substr(0, colon));
        if (!id) {
            spdlog::error("Unknown block in '{}'", text);
            return std::unexpected(id.error());
        }

        unsigned ch = 0;
        for (size_t i = colon + 1; i < text.size(); ++i) {
            if (text[i] < '0' || text[i] > '9' || ch > 0x0f) {
                spdlog::error("Invalid channel number in '{}'", text);
                return std::unexpected(makeError(ExtensionError::BadArgument));
            }
            ch = ch * 10 + static_cast<unsigned>(text[i] - '0');
        }
        if (ch > 0x0f) {
            spdlog::error("Channel {} of '{}' exceeds 15", ch, text);
            return std::unexpected(makeError(ExtensionError::BadArgument));
        }
        return Blk{*id, static_cast<uint8_t>(ch)};
    }
}

std::string hexString(uint64_t value, int width)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

json serializeHexBytes(const std::vector<uint8_t>& bytes)
{
    if (bytes.empty()) return nullptr;
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (const auto& byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

json serializeSection(const Section& section)
{
    json j;
    j["offset"] = hexString(section.offset, 8);
    j["size"] = section.size;
    return j;
}

json serializeGeneralSections(const GeneralSections& sections)
{
    json j;
    j["global"] = serializeSection(sections.global);
    j["txStreamFormat"] = serializeSection(sections.txStreamFormat);
    j["rxStreamFormat"] = serializeSection(sections.rxStreamFormat);
    j["extSync"] = serializeSection(sections.extSync);
    j["reserved"] = serializeSection(sections.reserved);
    return j;
}

json serializeExtensionSections(const ExtensionSections& sections)
{
    json j;
    j["caps"] = serializeSection(sections.caps);
    j["cmd"] = serializeSection(sections.cmd);
    j["mixer"] = serializeSection(sections.mixer);
    j["peak"] = serializeSection(sections.peak);
    j["router"] = serializeSection(sections.router);
    j["streamFormat"] = serializeSection(sections.streamFormat);
    j["currentConfig"] = serializeSection(sections.currentConfig);
    j["standalone"] = serializeSection(sections.standalone);
    j["application"] = serializeSection(sections.application);
    return j;
}

json serializeCaps(const ExtensionCaps& caps)
{
    json router;
    router["isExposed"] = caps.router.isExposed;
    router["isReadonly"] = caps.router.isReadonly;
    router["isStorable"] = caps.router.isStorable;
    router["maximumEntryCount"] = caps.router.maximumEntryCount;

    json mixer;
    mixer["isExposed"] = caps.mixer.isExposed;
    mixer["isReadonly"] = caps.mixer.isReadonly;
    mixer["isStorable"] = caps.mixer.isStorable;
    mixer["inputDeviceId"] = caps.mixer.inputDeviceId;
    mixer["outputDeviceId"] = caps.mixer.outputDeviceId;
    mixer["inputCount"] = caps.mixer.inputCount;
    mixer["outputCount"] = caps.mixer.outputCount;

    json general;
    general["dynamicStreamFormat"] = caps.general.dynamicStreamFormat;
    general["storageAvail"] = caps.general.storageAvail;
    general["peakAvail"] = caps.general.peakAvail;
    general["maxTxStreams"] = caps.general.maxTxStreams;
    general["maxRxStreams"] = caps.general.maxRxStreams;
    general["streamFormatIsStorable"] = caps.general.streamFormatIsStorable;
    general["asicType"] = asicTypeToString(caps.general.asicType);

    json j;
    j["router"] = router;
    j["mixer"] = mixer;
    j["general"] = general;
    return j;
}

json serializeGlobalParameters(const GlobalParameters& params)
{
    json j;
    j["owner"] = hexString(params.owner, 16);
    j["latestNotification"] = hexString(params.latestNotification, 8);
    j["nickname"] = params.nickname;
    j["clockSource"] = clockSourceToString(params.clockConfig.src);
    j["clockRate"] = clockRateToString(params.clockConfig.rate);
    j["enable"] = params.enable;
    j["locked"] = params.clockStatus.srcIsLocked;
    j["nominalRate"] = clockRateToString(params.clockStatus.rate);
    j["currentRate"] = params.currentRate;
    j["version"] = hexString(params.version, 8);

    json external = json::array();
    const auto& states = params.externalSourceStates;
    for (size_t i = 0; i < states.sources.size(); ++i) {
        json s;
        s["source"] = clockSourceToString(states.sources[i]);
        s["locked"] = i < states.locked.size() && states.locked[i];
        s["slipped"] = i < states.slipped.size() && states.slipped[i];
        external.push_back(s);
    }
    j["externalSources"] = external;

    json rates = json::array();
    for (auto rate : params.availRates)
        rates.push_back(clockRateToString(rate));
    j["availableRates"] = rates;

    json sources = json::array();
    for (auto src : params.availSources)
        sources.push_back(clockSourceToString(src));
    j["availableSources"] = sources;

    json labels = json::object();
    for (const auto& [src, label] : params.clockSourceLabels)
        labels[clockSourceToString(src)] = label;
    j["clockSourceLabels"] = labels;
    return j;
}

json serializeRouterEntry(const RouterEntry& entry)
{
    json j;
    j["src"] = toString(entry.src);
    j["dst"] = toString(entry.dst);
    j["peak"] = entry.peak;
    return j;
}

json serializeRouterEntries(const std::vector<RouterEntry>& entries)
{
    json arr = json::array();
    for (const auto& entry : entries)
        arr.push_back(serializeRouterEntry(entry));
    return arr;
}

json serializeStreamFormats(const StreamFormats& formats)
{
    auto serializeEntries = [](const std::vector<FormatEntry>& entries) {
        json arr = json::array();
        for (const auto& entry : entries) {
            json e;
            e["pcmCount"] = entry.pcmCount;
            e["midiCount"] = entry.midiCount;
            e["labels"] = entry.labels;
            uint32_t ac3 = 0;
            for (size_t i = 0; i < entry.enableAc3.size(); ++i) {
                if (entry.enableAc3[i])
                    ac3 |= 1u << i;
            }
            e["enableAc3"] = hexString(ac3, 8);
            arr.push_back(e);
        }
        return arr;
    };

    json j;
    j["tx"] = serializeEntries(formats.tx);
    j["rx"] = serializeEntries(formats.rx);
    return j;
}

json serializeResolvedRouting(const ResolvedRouting& routing)
{
    json j;
    j["rateMode"] = rateModeToString(routing.rateMode);
    j["entries"] = serializeRouterEntries(routing.entries);

    json dropped = json::array();
    for (const auto& d : routing.dropped) {
        json e;
        e["src"] = toString(d.src);
        e["dst"] = toString(d.dst);
        e["reason"] = droppedReasonToString(d.reason);
        dropped.push_back(e);
    }
    j["dropped"] = dropped;
    return j;
}

json serializeDecodedRouting(const DecodedRouting& routing)
{
    json routes = json::array();
    for (const auto& route : routing.routes) {
        json r = serializeRouterEntry(route.entry);
        r["srcLabel"] = route.srcLabel ? json(*route.srcLabel) : json(nullptr);
        r["dstLabel"] = route.dstLabel ? json(*route.dstLabel) : json(nullptr);
        r["raw"] = route.isRaw();
        routes.push_back(r);
    }

    json j;
    j["rateMode"] = rateModeToString(routing.rateMode);
    j["routes"] = routes;
    return j;
}

json serializePeakLevels(const std::vector<PeakLevel>& levels)
{
    json arr = json::array();
    for (const auto& level : levels) {
        json l;
        l["src"] = toString(level.src);
        l["dst"] = toString(level.dst);
        l["peak"] = level.peak;
        arr.push_back(l);
    }
    return arr;
}

json serializeStandalone(const StandaloneParameters& params)
{
    json j;
    j["clockSource"] = hexString(params.clockSource, 8);
    j["aes"] = hexString(params.aes, 8);
    j["adat"] = hexString(params.adat, 8);
    j["wordClock"] = hexString(params.wordClock, 8);
    j["internal"] = hexString(params.internal, 8);
    return j;
}

std::expected<RoutingAssignments, ProtocolError> parseRoutingAssignments(const json& j)
{
    if (!j.is_array()) {
        spdlog::error("Routing assignments are not an array");
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    RoutingAssignments assignments;
    try {
        for (const auto& item : j) {
            auto dst = parseChannel<DstBlk, DstBlkId>(item.at("dst").get<std::string>(), &dstBlkIdFromString);
            if (!dst)
                return std::unexpected(dst.error());
            auto src = parseChannel<SrcBlk, SrcBlkId>(item.at("src").get<std::string>(), &srcBlkIdFromString);
            if (!src)
                return std::unexpected(src.error());

            if (!assignments.emplace(*dst, *src).second) {
                spdlog::error("Destination {} assigned twice", toString(*dst));
                return std::unexpected(makeError(ExtensionError::BadArgument));
            }
        }
    } catch (const json::exception& e) {
        spdlog::error("Malformed routing assignment: {}", e.what());
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }
    return assignments;
}
} // namespace TCAT::JsonHelpers
