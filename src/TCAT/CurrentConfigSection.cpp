// src/TCAT/CurrentConfigSection.cpp
#include "TCAT/CurrentConfigSection.hpp"
#include "TCAT/RouterSection.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>

namespace TCAT {

CurrentConfigSection::CurrentConfigSection(RegisterIo& io, const ExtensionSections& sections,
                                           const ExtensionCaps& caps, uint32_t timeoutMs)
    : io_(io),
      sections_(sections),
      caps_(caps),
      timeoutMs_(timeoutMs)
{
}

uint32_t CurrentConfigSection::routerOffset(RateMode mode)
{
    switch (mode) {
        case RateMode::Middle: return TCAT_CURR_CFG_MID_ROUTER;
        case RateMode::High: return TCAT_CURR_CFG_HIGH_ROUTER;
        case RateMode::Low:
        default: return TCAT_CURR_CFG_LOW_ROUTER;
    }
}

uint32_t CurrentConfigSection::streamFormatOffset(RateMode mode)
{
    switch (mode) {
        case RateMode::Middle: return TCAT_CURR_CFG_MID_STREAM;
        case RateMode::High: return TCAT_CURR_CFG_HIGH_STREAM;
        case RateMode::Low:
        default: return TCAT_CURR_CFG_LOW_STREAM;
    }
}

std::expected<std::vector<RouterEntry>, ProtocolError> CurrentConfigSection::readRouterEntries(RateMode mode)
{
    spdlog::debug("Reading current router configuration at {} rate", rateModeToString(mode));
    return readRouterBlock(io_, extensionOffset(sections_.currentConfig, routerOffset(mode)), caps_,
                           ExtensionError::CurrentConfig, timeoutMs_);
}

std::expected<StreamFormats, ProtocolError> CurrentConfigSection::readStreamFormats(RateMode mode)
{
    spdlog::debug("Reading current stream configuration at {} rate", rateModeToString(mode));
    return readStreamFormatBlock(io_, extensionOffset(sections_.currentConfig, streamFormatOffset(mode)), caps_,
                                 ExtensionError::CurrentConfig, timeoutMs_);
}

} // namespace TCAT
