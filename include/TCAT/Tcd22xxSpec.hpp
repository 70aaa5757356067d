// include/TCAT/Tcd22xxSpec.hpp
#pragma once

#include "TCAT/Enums.hpp"
#include "TCAT/Error.h"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/RouterEntry.hpp"
#include "TCAT/StreamFormatEntry.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace TCAT {

/**
 * @brief Physical input port of a model
 */
struct Input {
    SrcBlkId id{SrcBlkId::Ins0};
    uint8_t offset{0};
    uint8_t count{0};
    std::optional<std::string> label;
    bool optional{false}; ///< Present only when an expansion option is installed

    bool operator==(const Input& other) const = default;
};

/**
 * @brief Physical output port of a model
 */
struct Output {
    DstBlkId id{DstBlkId::Ins0};
    uint8_t offset{0};
    uint8_t count{0};
    std::optional<std::string> label;
    bool optional{false};

    bool operator==(const Output& other) const = default;
};

/**
 * @brief Declarative routing specification of one device model
 */
struct ModelSpec {
    std::string name;
    uint32_t vendorId{0};
    uint32_t modelId{0};
    std::vector<Input> inputs;
    std::vector<Output> outputs;
    std::vector<SrcBlk> fixed;              ///< Sources pinned to the head of the router table
    std::vector<ClockSource> clockSources;  ///< Empty: use the sources the device reports

    bool operator==(const ModelSpec& other) const = default;
};

/**
 * @brief Check that every port range fits the 16 channels of its block
 * @return InvalidModelSpec for the first port or fixed source that does not
 */
std::expected<void, ProtocolError> validateModelSpec(const ModelSpec& spec);

/**
 * @brief Optional blocks detected as installed
 */
struct PresentBlocks {
    std::set<SrcBlkId> inputs;
    std::set<DstBlkId> outputs;

    bool operator==(const PresentBlocks& other) const = default;
};

/**
 * @brief Source and destination channels usable in the current rate mode
 */
struct AvailableBlocks {
    std::vector<SrcBlk> srcs;
    std::vector<DstBlk> dsts;

    bool hasSrc(const SrcBlk& src) const;
    bool hasDst(const DstBlk& dst) const;

    bool operator==(const AvailableBlocks& other) const = default;
};

namespace Tcd22xx {

inline constexpr std::array<uint8_t, 3> MIXER_OUT_PORTS{16, 16, 8};
inline constexpr std::array<std::pair<DstBlkId, uint8_t>, 2> MIXER_IN_PORTS{{
    {DstBlkId::MixerTx0, 16},
    {DstBlkId::MixerTx1, 2},
}};

/**
 * @brief Channel count of an optical block after S/MUX multiplexing
 * @return declared / 1, 2 or 4 for the low, middle and high rate modes
 */
uint8_t scaledChannelCount(uint8_t declared, RateMode mode);

uint8_t mixerOutPortCount(RateMode mode);

/**
 * @brief Channel range an Input or Output resolves to
 */
template <typename BlkId>
struct PortRange {
    BlkId id;
    uint8_t offset;
    uint8_t count;
    std::optional<std::string> label;
};

/**
 * @brief Rate-scaled ranges of the declared inputs; absent optional ports are skipped
 *
 * ADAT ranges are packed one after another since S/MUX folds the channels of one optical
 * interface together.
 */
std::vector<PortRange<SrcBlkId>> effectiveInputs(const ModelSpec& spec, RateMode mode, const PresentBlocks& present);
std::vector<PortRange<DstBlkId>> effectiveOutputs(const ModelSpec& spec, RateMode mode, const PresentBlocks& present);

AvailableBlocks computeRealBlocks(const ModelSpec& spec, RateMode mode, const PresentBlocks& present);

/**
 * @brief Stream channels: tx entries feed destinations Avs0/Avs1, rx entries are sources Avs0/Avs1
 */
AvailableBlocks computeStreamBlocks(const StreamFormats& formats);

/**
 * @brief Mixer channels; empty when the mixer is not exposed
 */
AvailableBlocks computeMixerBlocks(const ExtensionCaps& caps, RateMode mode);

/**
 * @brief Concatenation of physical, stream and mixer blocks, in that order
 */
AvailableBlocks computeAvailableBlocks(const ModelSpec& spec, const ExtensionCaps& caps, RateMode mode,
                                       const StreamFormats& formats, const PresentBlocks& present);

/**
 * @brief Human readable name of a source channel, 1-based
 * @param available Blocks of the current rate mode; decides "Stream" versus "Stream-A"
 */
std::string srcBlkLabel(const ModelSpec& spec, RateMode mode, const PresentBlocks& present,
                        const AvailableBlocks& available, const SrcBlk& src);
std::string dstBlkLabel(const ModelSpec& spec, RateMode mode, const PresentBlocks& present,
                        const AvailableBlocks& available, const DstBlk& dst);

} // namespace Tcd22xx

} // namespace TCAT
