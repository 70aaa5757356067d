// src/TCAT/Tcd22xxResolver.cpp
#include "TCAT/Tcd22xxResolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace TCAT {

std::string droppedReasonToString(DroppedAssignment::Reason reason)
{
    switch (reason) {
        case DroppedAssignment::Reason::DestinationUnavailable: return "DestinationUnavailable";
        case DroppedAssignment::Reason::SourceUnavailable: return "SourceUnavailable";
        default: return "Unknown";
    }
}

Tcd22xxResolver::Tcd22xxResolver(ModelSpec spec, const ExtensionCaps& caps)
    : spec_(std::move(spec)),
      caps_(caps)
{
}

AvailableBlocks Tcd22xxResolver::availableBlocks(RateMode mode, const StreamFormats& formats,
                                                 const PresentBlocks& present) const
{
    return Tcd22xx::computeAvailableBlocks(spec_, caps_, mode, formats, present);
}

std::expected<ResolvedRouting, ProtocolError> Tcd22xxResolver::resolve(const RoutingAssignments& assignments,
                                                                       RateMode mode,
                                                                       const StreamFormats& formats,
                                                                       const PresentBlocks& present) const
{
    AvailableBlocks available = availableBlocks(mode, formats, present);

    for (const auto& src : spec_.fixed) {
        if (!available.hasSrc(src)) {
            spdlog::error("Fixed source {} not available at {} rate", toString(src), rateModeToString(mode));
            return std::unexpected(makeError(ExtensionError::UnavailableFixedBlock));
        }
    }

    ResolvedRouting result;
    result.rateMode = mode;
    result.formats = formats;

    for (const auto& [dst, src] : assignments) {
        if (!available.hasDst(dst)) {
            spdlog::warn("Dropping route {} -> {}: destination not available", toString(src), toString(dst));
            result.dropped.push_back({dst, src, DroppedAssignment::Reason::DestinationUnavailable});
        } else if (!available.hasSrc(src)) {
            spdlog::warn("Dropping route {} -> {}: source not available", toString(src), toString(dst));
            result.dropped.push_back({dst, src, DroppedAssignment::Reason::SourceUnavailable});
        }
    }

    // Surviving assignments in available-destination order
    std::vector<RouterEntry> routed;
    for (const auto& dst : available.dsts) {
        auto it = assignments.find(dst);
        if (it == assignments.end() || !available.hasSrc(it->second))
            continue;
        routed.push_back({dst, it->second, 0});
    }

    for (const auto& src : spec_.fixed) {
        auto pos = std::find_if(routed.begin(), routed.end(),
                                [&src](const RouterEntry& entry) { return entry.src == src; });
        if (pos != routed.end()) {
            result.entries.push_back(*pos);
            routed.erase(pos);
        } else {
            result.entries.push_back({kUnusedDstBlk, src, 0});
        }
    }
    result.entries.insert(result.entries.end(), routed.begin(), routed.end());

    if (result.entries.size() > caps_.router.maximumEntryCount) {
        spdlog::error("Resolved routing needs {} entries, router holds {}", result.entries.size(),
                      caps_.router.maximumEntryCount);
        return std::unexpected(makeError(ExtensionError::RoutingCapacityExceeded));
    }

    spdlog::debug("Resolved {} routes ({} dropped) at {} rate", result.entries.size(), result.dropped.size(),
                  rateModeToString(mode));
    return result;
}

DecodedRouting Tcd22xxResolver::decode(const std::vector<RouterEntry>& entries, RateMode mode,
                                       const StreamFormats& formats, const PresentBlocks& present) const
{
    AvailableBlocks available = availableBlocks(mode, formats, present);

    DecodedRouting decoded;
    decoded.rateMode = mode;

    for (const auto& entry : entries) {
        DecodedRoute route;
        route.entry = entry;
        if (available.hasSrc(entry.src))
            route.srcLabel = Tcd22xx::srcBlkLabel(spec_, mode, present, available, entry.src);
        if (available.hasDst(entry.dst))
            route.dstLabel = Tcd22xx::dstBlkLabel(spec_, mode, present, available, entry.dst);

        if (route.isRaw())
            spdlog::debug("Unlabelled route {} -> {}", toString(entry.src), toString(entry.dst));
        else
            decoded.assignments.emplace(entry.dst, entry.src);

        decoded.routes.push_back(std::move(route));
    }

    return decoded;
}

} // namespace TCAT
