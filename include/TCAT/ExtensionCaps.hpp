// include/TCAT/ExtensionCaps.hpp
#pragma once

#include "TCAT/Enums.hpp"
#include "TCAT/Error.h"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include <cstdint>
#include <vector>
#include <expected>

namespace TCAT {

struct RouterCaps {
    bool isExposed{false};
    bool isReadonly{false};
    bool isStorable{false};
    uint16_t maximumEntryCount{0};

    bool operator==(const RouterCaps& other) const = default;
};

struct MixerCaps {
    bool isExposed{false};
    bool isReadonly{false};
    bool isStorable{false};
    uint8_t inputDeviceId{0};
    uint8_t outputDeviceId{0};
    uint8_t inputCount{0};
    uint8_t outputCount{0};

    bool operator==(const MixerCaps& other) const = default;
};

struct GeneralCaps {
    bool dynamicStreamFormat{false};
    bool storageAvail{false};
    bool peakAvail{false};
    uint8_t maxTxStreams{0};
    uint8_t maxRxStreams{0};
    bool streamFormatIsStorable{false};
    AsicType asicType{AsicType::DiceII};

    bool operator==(const GeneralCaps& other) const = default;
};

/**
 * @brief Capability snapshot of the extension space, fixed for one session
 */
struct ExtensionCaps {
    RouterCaps router;
    MixerCaps mixer;
    GeneralCaps general;

    bool operator==(const ExtensionCaps& other) const = default;
};

/**
 * @brief Decode the 12-byte capability block
 * @return Capabilities or CapabilityUnavailable when the block is short
 */
std::expected<ExtensionCaps, ProtocolError> parseExtensionCaps(const std::vector<uint8_t>& raw);

/**
 * @brief Reads the capability section. No retries.
 */
class CapabilityReader {
public:
    CapabilityReader(RegisterIo& io, uint32_t timeoutMs);

    std::expected<ExtensionCaps, ProtocolError> read(const ExtensionSections& sections);

private:
    RegisterIo& io_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
