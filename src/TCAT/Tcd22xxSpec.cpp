// src/TCAT/Tcd22xxSpec.cpp
#include "TCAT/Tcd22xxSpec.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace TCAT {

bool AvailableBlocks::hasSrc(const SrcBlk& src) const
{
    return std::find(srcs.begin(), srcs.end(), src) != srcs.end();
}

bool AvailableBlocks::hasDst(const DstBlk& dst) const
{
    return std::find(dsts.begin(), dsts.end(), dst) != dsts.end();
}

namespace {
    constexpr unsigned kBlockChannels = 16;

    template <typename Port>
    bool portFits(const Port& port)
    {
        return static_cast<uint8_t>(port.id) <= 0x0f &&
               static_cast<unsigned>(port.offset) + port.count <= kBlockChannels;
    }
}

std::expected<void, ProtocolError> validateModelSpec(const ModelSpec& spec)
{
    for (const auto& input : spec.inputs) {
        if (!portFits(input)) {
            spdlog::error("Model {}: input {} offset {} count {} exceeds its block", spec.name,
                          srcBlkIdToString(input.id), input.offset, input.count);
            return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
        }
    }
    for (const auto& output : spec.outputs) {
        if (!portFits(output)) {
            spdlog::error("Model {}: output {} offset {} count {} exceeds its block", spec.name,
                          dstBlkIdToString(output.id), output.offset, output.count);
            return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
        }
    }
    for (const auto& src : spec.fixed) {
        if (!src.isValid()) {
            spdlog::error("Model {}: fixed source {} is out of range", spec.name, toString(src));
            return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
        }
    }
    return {};
}

namespace Tcd22xx {

namespace {
    size_t rateModeIndex(RateMode mode)
    {
        switch (mode) {
            case RateMode::Middle: return 1;
            case RateMode::High: return 2;
            case RateMode::Low:
            default: return 0;
        }
    }

    template <typename BlkId, typename Port>
    std::vector<PortRange<BlkId>> effectivePorts(const std::vector<Port>& ports, RateMode mode,
                                                 const std::set<BlkId>& present, BlkId optical)
    {
        std::vector<PortRange<BlkId>> ranges;
        uint8_t opticalChannels = 0;

        for (const auto& port : ports) {
            if (port.optional && present.find(port.id) == present.end())
                continue;

            if (port.id == optical) {
                uint8_t count = scaledChannelCount(port.count, mode);
                ranges.push_back({port.id, opticalChannels, count, port.label});
                opticalChannels = static_cast<uint8_t>(opticalChannels + count);
            } else {
                ranges.push_back({port.id, port.offset, port.count, port.label});
            }
        }
        return ranges;
    }

    const char* srcBlkName(SrcBlkId id, const AvailableBlocks& available)
    {
        switch (id) {
            case SrcBlkId::Aes: return "S/PDIF";
            case SrcBlkId::Adat: return "ADAT";
            case SrcBlkId::Mixer: return "Mixer";
            case SrcBlkId::Ins0: return "Analog-A";
            case SrcBlkId::Ins1: return "Analog-B";
            case SrcBlkId::Avs0: {
                bool second = std::any_of(available.srcs.begin(), available.srcs.end(),
                                          [](const SrcBlk& blk) { return blk.id == SrcBlkId::Avs1; });
                return second ? "Stream-A" : "Stream";
            }
            case SrcBlkId::Avs1: return "Stream-B";
            default: return "Unknown";
        }
    }

    const char* dstBlkName(DstBlkId id, const AvailableBlocks& available)
    {
        switch (id) {
            case DstBlkId::Aes: return "S/PDIF";
            case DstBlkId::Adat: return "ADAT";
            case DstBlkId::MixerTx0: return "Mixer-A";
            case DstBlkId::MixerTx1: return "Mixer-B";
            case DstBlkId::Ins0: return "Analog-A";
            case DstBlkId::Ins1: return "Analog-B";
            case DstBlkId::Avs0: {
                bool second = std::any_of(available.dsts.begin(), available.dsts.end(),
                                          [](const DstBlk& blk) { return blk.id == DstBlkId::Avs1; });
                return second ? "Stream-A" : "Stream";
            }
            case DstBlkId::Avs1: return "Stream-B";
            default: return "Unknown";
        }
    }

    template <typename BlkId>
    std::optional<std::string> portLabel(const std::vector<PortRange<BlkId>>& ranges, BlkId id, uint8_t ch)
    {
        for (const auto& range : ranges) {
            if (range.id == id && ch >= range.offset && ch < range.offset + range.count && range.label)
                return fmt::format("{}-{}", *range.label, ch - range.offset + 1);
        }
        return std::nullopt;
    }
}

uint8_t scaledChannelCount(uint8_t declared, RateMode mode)
{
    switch (mode) {
        case RateMode::Middle: return static_cast<uint8_t>(declared / 2);
        case RateMode::High: return static_cast<uint8_t>(declared / 4);
        case RateMode::Low:
        default: return declared;
    }
}

uint8_t mixerOutPortCount(RateMode mode)
{
    return MIXER_OUT_PORTS[rateModeIndex(mode)];
}

std::vector<PortRange<SrcBlkId>> effectiveInputs(const ModelSpec& spec, RateMode mode, const PresentBlocks& present)
{
    return effectivePorts<SrcBlkId>(spec.inputs, mode, present.inputs, SrcBlkId::Adat);
}

std::vector<PortRange<DstBlkId>> effectiveOutputs(const ModelSpec& spec, RateMode mode, const PresentBlocks& present)
{
    return effectivePorts<DstBlkId>(spec.outputs, mode, present.outputs, DstBlkId::Adat);
}

AvailableBlocks computeRealBlocks(const ModelSpec& spec, RateMode mode, const PresentBlocks& present)
{
    AvailableBlocks blocks;

    for (const auto& range : effectiveInputs(spec, mode, present)) {
        for (unsigned ch = range.offset; ch < range.offset + range.count; ++ch)
            blocks.srcs.push_back({range.id, static_cast<uint8_t>(ch)});
    }

    for (const auto& range : effectiveOutputs(spec, mode, present)) {
        for (unsigned ch = range.offset; ch < range.offset + range.count; ++ch)
            blocks.dsts.push_back({range.id, static_cast<uint8_t>(ch)});
    }

    return blocks;
}

AvailableBlocks computeStreamBlocks(const StreamFormats& formats)
{
    static constexpr std::array<DstBlkId, 2> txBlocks{DstBlkId::Avs0, DstBlkId::Avs1};
    static constexpr std::array<SrcBlkId, 2> rxBlocks{SrcBlkId::Avs0, SrcBlkId::Avs1};

    AvailableBlocks blocks;

    // The router addresses 16 channels per stream block
    for (size_t i = 0; i < formats.tx.size() && i < txBlocks.size(); ++i) {
        unsigned count = std::min<unsigned>(formats.tx[i].pcmCount, kBlockChannels);
        for (unsigned ch = 0; ch < count; ++ch)
            blocks.dsts.push_back({txBlocks[i], static_cast<uint8_t>(ch)});
    }

    for (size_t i = 0; i < formats.rx.size() && i < rxBlocks.size(); ++i) {
        unsigned count = std::min<unsigned>(formats.rx[i].pcmCount, kBlockChannels);
        for (unsigned ch = 0; ch < count; ++ch)
            blocks.srcs.push_back({rxBlocks[i], static_cast<uint8_t>(ch)});
    }

    return blocks;
}

AvailableBlocks computeMixerBlocks(const ExtensionCaps& caps, RateMode mode)
{
    AvailableBlocks blocks;
    if (!caps.mixer.isExposed)
        return blocks;

    uint8_t portCount = std::min(caps.mixer.outputCount, mixerOutPortCount(mode));
    for (uint8_t ch = 0; ch < portCount; ++ch)
        blocks.srcs.push_back({SrcBlkId::Mixer, ch});

    for (const auto& [id, count] : MIXER_IN_PORTS) {
        for (uint8_t ch = 0; ch < count && blocks.dsts.size() < caps.mixer.inputCount; ++ch)
            blocks.dsts.push_back({id, ch});
    }

    return blocks;
}

AvailableBlocks computeAvailableBlocks(const ModelSpec& spec, const ExtensionCaps& caps, RateMode mode,
                                       const StreamFormats& formats, const PresentBlocks& present)
{
    AvailableBlocks blocks = computeRealBlocks(spec, mode, present);
    AvailableBlocks stream = computeStreamBlocks(formats);
    AvailableBlocks mixer = computeMixerBlocks(caps, mode);

    blocks.srcs.insert(blocks.srcs.end(), stream.srcs.begin(), stream.srcs.end());
    blocks.srcs.insert(blocks.srcs.end(), mixer.srcs.begin(), mixer.srcs.end());
    blocks.dsts.insert(blocks.dsts.end(), stream.dsts.begin(), stream.dsts.end());
    blocks.dsts.insert(blocks.dsts.end(), mixer.dsts.begin(), mixer.dsts.end());

    return blocks;
}

std::string srcBlkLabel(const ModelSpec& spec, RateMode mode, const PresentBlocks& present,
                        const AvailableBlocks& available, const SrcBlk& src)
{
    if (auto label = portLabel(effectiveInputs(spec, mode, present), src.id, src.ch))
        return *label;
    return fmt::format("{}-{}", srcBlkName(src.id, available), src.ch + 1);
}

std::string dstBlkLabel(const ModelSpec& spec, RateMode mode, const PresentBlocks& present,
                        const AvailableBlocks& available, const DstBlk& dst)
{
    if (auto label = portLabel(effectiveOutputs(spec, mode, present), dst.id, dst.ch))
        return *label;
    return fmt::format("{}-{}", dstBlkName(dst.id, available), dst.ch + 1);
}

} // namespace Tcd22xx

} // namespace TCAT
