// include/TCAT/Tcd22xxResolver.hpp
#pragma once

#include "TCAT/Enums.hpp"
#include "TCAT/Error.h"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/RouterEntry.hpp"
#include "TCAT/StreamFormatEntry.hpp"
#include "TCAT/Tcd22xxSpec.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Requested routing: for each destination the source feeding it
 *
 * A destination missing from the map stays unrouted.
 */
using RoutingAssignments = std::map<DstBlk, SrcBlk>;

/**
 * @brief Assignment removed from a resolution pass
 */
struct DroppedAssignment {
    enum class Reason {
        DestinationUnavailable, ///< Destination absent or out of range at this rate mode
        SourceUnavailable       ///< Source absent or out of range at this rate mode
    };

    DstBlk dst;
    SrcBlk src;
    Reason reason{Reason::DestinationUnavailable};

    bool operator==(const DroppedAssignment& other) const = default;
};

std::string droppedReasonToString(DroppedAssignment::Reason reason);

/**
 * @brief Router table ready to be written, with what was left out of it
 */
struct ResolvedRouting {
    RateMode rateMode{RateMode::Low};
    std::vector<RouterEntry> entries;
    std::vector<DroppedAssignment> dropped;
    StreamFormats formats; ///< Stream layout the table was resolved against

    bool operator==(const ResolvedRouting& other) const = default;
};

/**
 * @brief One hardware entry matched back against the model
 */
struct DecodedRoute {
    RouterEntry entry;
    std::optional<std::string> srcLabel;
    std::optional<std::string> dstLabel;

    bool isRaw() const { return !srcLabel || !dstLabel; }
    bool operator==(const DecodedRoute& other) const = default;
};

struct DecodedRouting {
    RateMode rateMode{RateMode::Low};
    std::vector<DecodedRoute> routes;   ///< Hardware order, raw entries included
    RoutingAssignments assignments;     ///< Labelled routes only

    bool operator==(const DecodedRouting& other) const = default;
};

/**
 * @brief Runtime state of the resolver for one attached device
 */
struct Tcd22xxState {
    RateMode rateMode{RateMode::Low};
    PresentBlocks present;
    StreamFormats formats;
    AvailableBlocks available;
    std::vector<RouterEntry> table;
};

/**
 * @brief Translates between model-level routing and the concrete router table
 *
 * The resolved table starts with one entry per fixed source in declared order, followed by the
 * remaining assignments in available-destination order (physical outputs in declaration and
 * channel order, then stream, then mixer destinations). Results depend only on the inputs.
 */
class Tcd22xxResolver {
public:
    Tcd22xxResolver(ModelSpec spec, const ExtensionCaps& caps);

    const ModelSpec& spec() const { return spec_; }

    AvailableBlocks availableBlocks(RateMode mode, const StreamFormats& formats, const PresentBlocks& present) const;

    /**
     * @brief Compute the router table realizing the requested assignments
     * @return Table, or UnavailableFixedBlock when a fixed source is not available, or
     *         RoutingCapacityExceeded when the table would not fit the router
     */
    std::expected<ResolvedRouting, ProtocolError> resolve(const RoutingAssignments& assignments, RateMode mode,
                                                          const StreamFormats& formats,
                                                          const PresentBlocks& present) const;

    /**
     * @brief Match hardware entries back to labelled sources and destinations
     */
    DecodedRouting decode(const std::vector<RouterEntry>& entries, RateMode mode, const StreamFormats& formats,
                          const PresentBlocks& present) const;

private:
    ModelSpec spec_;
    ExtensionCaps caps_;
};

} // namespace TCAT
