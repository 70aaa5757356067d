// include/TCAT/CommandSection.hpp
#pragma once

#include "TCAT/Enums.hpp"
#include "TCAT/Error.h"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include <cstdint>
#include <expected>

namespace TCAT {

/**
 * @brief Operation requested through the command section
 */
struct Opcode {
    enum class Kind : uint8_t {
        NoOp,
        LoadRouter,
        LoadStreamConfig,
        LoadRouterStreamConfig,
        LoadConfigFromFlash,
        StoreConfigToFlash
    };

    Kind kind{Kind::NoOp};
    RateMode rateMode{RateMode::Low}; ///< Used by the three Load*(rate) kinds only

    static Opcode loadRouter(RateMode mode) { return {Kind::LoadRouter, mode}; }
    static Opcode loadStreamConfig(RateMode mode) { return {Kind::LoadStreamConfig, mode}; }
    static Opcode loadRouterStreamConfig(RateMode mode) { return {Kind::LoadRouterStreamConfig, mode}; }
    static Opcode loadConfigFromFlash() { return {Kind::LoadConfigFromFlash, RateMode::Low}; }
    static Opcode storeConfigToFlash() { return {Kind::StoreConfigToFlash, RateMode::Low}; }

    /**
     * @brief Opcode register value including the execute flag
     */
    uint32_t toQuadlet() const;
};

class CommandSectionProtocol {
public:
    /**
     * @param pollIntervalMs Delay before each poll of the opcode register
     * @param pollCount Number of polls before giving up
     */
    CommandSectionProtocol(RegisterIo& io, const ExtensionSections& sections, const ExtensionCaps& caps,
                           uint32_t timeoutMs, uint32_t pollIntervalMs, uint32_t pollCount);

    /**
     * @brief Issue a command and wait for the device to clear the execute flag
     * @return The return register, FeatureUnavailable when the capability forbids the
     *         operation, or CmdSection on transport failure or timeout
     */
    std::expected<uint32_t, ProtocolError> initiate(const Opcode& opcode);

private:
    std::expected<void, ProtocolError> checkCapability(const Opcode& opcode) const;

    RegisterIo& io_;
    ExtensionSections sections_;
    ExtensionCaps caps_;
    uint32_t timeoutMs_;
    uint32_t pollIntervalMs_;
    uint32_t pollCount_;
};

} // namespace TCAT
