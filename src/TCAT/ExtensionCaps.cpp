// src/TCAT/ExtensionCaps.cpp
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>

namespace TCAT {

namespace {
    RouterCaps parseRouterCaps(const uint8_t* raw)
    {
        RouterCaps caps;
        caps.isExposed = (raw[3] & TCAT_CAP_EXPOSED) != 0;
        caps.isReadonly = (raw[3] & TCAT_CAP_READONLY) != 0;
        caps.isStorable = (raw[3] & TCAT_CAP_STORABLE) != 0;
        caps.maximumEntryCount = static_cast<uint16_t>((raw[0] << 8) | raw[1]);
        return caps;
    }

    MixerCaps parseMixerCaps(const uint8_t* raw)
    {
        MixerCaps caps;
        caps.isExposed = (raw[3] & TCAT_CAP_EXPOSED) != 0;
        caps.isReadonly = (raw[3] & TCAT_CAP_READONLY) != 0;
        caps.isStorable = (raw[3] & TCAT_CAP_STORABLE) != 0;
        caps.inputDeviceId = (raw[3] >> 4) & 0x0f;
        caps.outputDeviceId = raw[2] & 0x0f;
        caps.inputCount = raw[1];
        caps.outputCount = raw[0];
        return caps;
    }

    GeneralCaps parseGeneralCaps(const uint8_t* raw)
    {
        GeneralCaps caps;
        caps.dynamicStreamFormat = (raw[3] & TCAT_CAP_GENERAL_DYNAMIC_STREAM) != 0;
        caps.storageAvail = (raw[3] & TCAT_CAP_GENERAL_STORAGE) != 0;
        caps.peakAvail = (raw[3] & TCAT_CAP_GENERAL_PEAK) != 0;
        caps.maxTxStreams = (raw[3] >> 4) & 0x0f;
        caps.maxRxStreams = raw[2] & 0x0f;
        caps.streamFormatIsStorable = (raw[2] & TCAT_CAP_GENERAL_STREAM_STORABLE) != 0;
        switch (raw[1]) {
            case 0: caps.asicType = AsicType::DiceII; break;
            case 1: caps.asicType = AsicType::Tcd2210; break;
            case 2: caps.asicType = AsicType::Tcd2220; break;
            default: caps.asicType = AsicType::Reserved; break;
        }
        return caps;
    }
}

std::expected<ExtensionCaps, ProtocolError> parseExtensionCaps(const std::vector<uint8_t>& raw)
{
    if (raw.size() < TCAT_CAPS_SIZE) {
        spdlog::error("Capability block too short: {} bytes", raw.size());
        return std::unexpected(makeError(ExtensionError::CapabilityUnavailable));
    }

    ExtensionCaps caps;
    caps.router = parseRouterCaps(&raw[TCAT_CAPS_ROUTER]);
    caps.mixer = parseMixerCaps(&raw[TCAT_CAPS_MIXER]);
    caps.general = parseGeneralCaps(&raw[TCAT_CAPS_GENERAL]);
    return caps;
}

CapabilityReader::CapabilityReader(RegisterIo& io, uint32_t timeoutMs)
    : io_(io),
      timeoutMs_(timeoutMs)
{
}

std::expected<ExtensionCaps, ProtocolError> CapabilityReader::read(const ExtensionSections& sections)
{
    if (sections.caps.size < TCAT_CAPS_SIZE) {
        spdlog::error("Capability section too small: {} bytes", sections.caps.size);
        return std::unexpected(makeError(ExtensionError::CapabilityUnavailable));
    }

    auto raw = io_.readBlock(extensionOffset(sections.caps, 0), TCAT_CAPS_SIZE, timeoutMs_);
    if (!raw) {
        spdlog::error("Could not read capabilities");
        return std::unexpected(makeTransportError(ExtensionError::CapabilityUnavailable, raw.error()));
    }

    auto caps = parseExtensionCaps(*raw);
    if (!caps)
        return caps;

    spdlog::debug("Router capabilities: exposed={}, readonly={}, storable={}, entries={}",
                  caps->router.isExposed, caps->router.isReadonly, caps->router.isStorable,
                  caps->router.maximumEntryCount);
    spdlog::debug("Mixer capabilities: exposed={}, readonly={}, storable={}",
                  caps->mixer.isExposed, caps->mixer.isReadonly, caps->mixer.isStorable);
    spdlog::debug("Mixer I/O: in dev={}, out dev={}, inputs={}, outputs={}",
                  caps->mixer.inputDeviceId, caps->mixer.outputDeviceId,
                  caps->mixer.inputCount, caps->mixer.outputCount);
    spdlog::debug("General capabilities: dynamic stream={}, storage={}, peak={}, stream storable={}",
                  caps->general.dynamicStreamFormat, caps->general.storageAvail,
                  caps->general.peakAvail, caps->general.streamFormatIsStorable);
    spdlog::debug("Max streams: TX={}, RX={}", caps->general.maxTxStreams, caps->general.maxRxStreams);
    spdlog::info("Detected {} chipset", asicTypeToString(caps->general.asicType));

    return caps;
}

} // namespace TCAT
