// src/TCAT/CommandSection.cpp
#include "TCAT/CommandSection.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace TCAT {

namespace {
    uint32_t rateFlag(RateMode mode)
    {
        switch (mode) {
            case RateMode::Middle: return TCAT_CMD_RATE_MIDDLE;
            case RateMode::High: return TCAT_CMD_RATE_HIGH;
            case RateMode::Low:
            default: return TCAT_CMD_RATE_LOW;
        }
    }
}

uint32_t Opcode::toQuadlet() const
{
    uint32_t val = 0;
    switch (kind) {
        case Kind::NoOp:
            val = TCAT_CMD_OP_NOOP;
            break;
        case Kind::LoadRouter:
            val = TCAT_CMD_OP_LOAD_ROUTER | rateFlag(rateMode);
            break;
        case Kind::LoadStreamConfig:
            val = TCAT_CMD_OP_LOAD_STREAM_CONFIG | rateFlag(rateMode);
            break;
        case Kind::LoadRouterStreamConfig:
            val = TCAT_CMD_OP_LOAD_ROUTER_STREAM | rateFlag(rateMode);
            break;
        case Kind::LoadConfigFromFlash:
            val = TCAT_CMD_OP_LOAD_FLASH;
            break;
        case Kind::StoreConfigToFlash:
            val = TCAT_CMD_OP_STORE_FLASH;
            break;
    }
    return val | TCAT_CMD_EXECUTE;
}

CommandSectionProtocol::CommandSectionProtocol(RegisterIo& io, const ExtensionSections& sections,
                                               const ExtensionCaps& caps, uint32_t timeoutMs,
                                               uint32_t pollIntervalMs, uint32_t pollCount)
    : io_(io),
      sections_(sections),
      caps_(caps),
      timeoutMs_(timeoutMs),
      pollIntervalMs_(pollIntervalMs),
      pollCount_(pollCount)
{
}

std::expected<void, ProtocolError> CommandSectionProtocol::checkCapability(const Opcode& opcode) const
{
    bool allowed = true;
    switch (opcode.kind) {
        case Opcode::Kind::LoadRouter:
            allowed = !caps_.router.isReadonly;
            break;
        case Opcode::Kind::LoadStreamConfig:
            allowed = caps_.general.dynamicStreamFormat;
            break;
        case Opcode::Kind::LoadRouterStreamConfig:
            allowed = !caps_.router.isReadonly || caps_.general.dynamicStreamFormat;
            break;
        case Opcode::Kind::LoadConfigFromFlash:
        case Opcode::Kind::StoreConfigToFlash:
            allowed = caps_.general.storageAvail;
            break;
        case Opcode::Kind::NoOp:
            break;
    }

    if (!allowed) {
        spdlog::error("Command 0x{:08x} not supported by device capabilities", opcode.toQuadlet());
        return std::unexpected(makeError(ExtensionError::FeatureUnavailable));
    }
    return {};
}

std::expected<uint32_t, ProtocolError> CommandSectionProtocol::initiate(const Opcode& opcode)
{
    auto allowed = checkCapability(opcode);
    if (!allowed)
        return std::unexpected(allowed.error());

    uint32_t cmd = opcode.toQuadlet();
    spdlog::debug("Issuing command 0x{:08x}", cmd);

    auto res = io_.writeQuadlet(extensionOffset(sections_.cmd, TCAT_CMD_OPCODE), cmd, timeoutMs_);
    if (!res) {
        spdlog::error("Failed to write command");
        return std::unexpected(makeTransportError(ExtensionError::CmdSection, res.error()));
    }

    for (uint32_t count = 0; count < pollCount_; ++count) {
        std::this_thread::sleep_for(std::chrono::milliseconds(pollIntervalMs_));

        auto opcodeRes = io_.readQuadlet(extensionOffset(sections_.cmd, TCAT_CMD_OPCODE), timeoutMs_);
        if (!opcodeRes) {
            spdlog::error("Failed to read command register");
            return std::unexpected(makeTransportError(ExtensionError::CmdSection, opcodeRes.error()));
        }

        if (*opcodeRes & TCAT_CMD_EXECUTE)
            continue;

        auto retval = io_.readQuadlet(extensionOffset(sections_.cmd, TCAT_CMD_RETURN), timeoutMs_);
        if (!retval) {
            spdlog::error("Failed to read command return value");
            return std::unexpected(makeTransportError(ExtensionError::CmdSection, retval.error()));
        }

        spdlog::debug("Command 0x{:08x} completed with 0x{:x}", cmd, *retval);
        return *retval;
    }

    spdlog::error("Command 0x{:08x} did not complete after {} polls", cmd, pollCount_);
    return std::unexpected(makeTransportError(ExtensionError::CmdSection, TransportError::Timeout));
}

} // namespace TCAT
