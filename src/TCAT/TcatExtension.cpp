// src/TCAT/TcatExtension.cpp
#include "TCAT/TcatExtension.hpp"
#include "TCAT/CurrentConfigSection.hpp"
#include "TCAT/JsonHelpers.hpp"
#include "TCAT/RouterSection.hpp"
#include "TCAT/TcatDefines.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace TCAT {

TcatExtension::TcatExtension(ITransactionPort& port, ModelSpec spec, ExtensionConfig config)
    : io_(port),
      spec_(std::move(spec)),
      config_(std::move(config)),
      logger_(config_.logger ? config_.logger : spdlog::default_logger())
{
}

std::expected<void, ProtocolError> TcatExtension::ensureValid() const
{
    if (!valid_) {
        logger_->error("TCAT extension used without bootstrap since the last bus reset");
        return std::unexpected(makeError(ExtensionError::StaleCapabilities));
    }
    return {};
}

std::expected<void, ProtocolError> TcatExtension::bootstrap()
{
    logger_->debug("Bootstrapping TCAT extension for '{}'", spec_.name);

    auto specValid = validateModelSpec(spec_);
    if (!specValid)
        return specValid;

    SectionTableReader tables(io_, config_.timeouts.sectionTable);
    auto general = tables.readGeneralSections();
    if (!general)
        return std::unexpected(general.error());

    auto extension = tables.readExtensionSections();
    if (!extension)
        return std::unexpected(extension.error());

    CapabilityReader capsReader(io_, config_.timeouts.caps);
    auto caps = capsReader.read(*extension);
    if (!caps)
        return std::unexpected(caps.error());

    GlobalSectionCodec global(io_, *general, config_.timeouts.global);
    auto params = global.read(spec_.clockSources);
    if (!params)
        return std::unexpected(params.error());

    RateMode mode = rateModeFromHz(params->currentRate);
    CurrentConfigSection current(io_, *extension, *caps, config_.timeouts.currentConfig);
    auto formats = current.readStreamFormats(mode);
    if (!formats)
        return std::unexpected(formats.error());
    auto table = current.readRouterEntries(mode);
    if (!table)
        return std::unexpected(table.error());

    generalSections_ = *general;
    extensionSections_ = *extension;
    caps_ = *caps;
    globalParameters_ = std::move(*params);
    resolver_.emplace(spec_, *caps_);
    commitRateState({mode, std::move(*formats), std::move(*table)});
    valid_ = true;

    logger_->info("TCAT extension ready: {} at {} rate, {} routes of {}", spec_.name, rateModeToString(mode),
                  state_.table.size(), caps_->router.maximumEntryCount);
    return {};
}

void TcatExtension::handleBusReset()
{
    if (valid_)
        logger_->info("Bus reset, TCAT extension state invalidated");
    valid_ = false;
}

std::expected<TcatExtension::RateState, ProtocolError> TcatExtension::readRateState(RateMode mode)
{
    CurrentConfigSection current(io_, *extensionSections_, *caps_, config_.timeouts.currentConfig);

    auto formats = current.readStreamFormats(mode);
    if (!formats)
        return std::unexpected(formats.error());

    auto table = current.readRouterEntries(mode);
    if (!table)
        return std::unexpected(table.error());

    return RateState{mode, std::move(*formats), std::move(*table)};
}

void TcatExtension::commitRateState(RateState rateState)
{
    state_.rateMode = rateState.rateMode;
    state_.formats = std::move(rateState.formats);
    state_.table = std::move(rateState.table);
    state_.available = resolver_->availableBlocks(state_.rateMode, state_.formats, state_.present);
}

std::expected<void, ProtocolError> TcatExtension::handleNotification(uint32_t bits)
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    constexpr uint32_t kConfigBits = TCAT_NOTIFY_CLOCK_ACCEPTED | TCAT_NOTIFY_RX_CFG_CHG | TCAT_NOTIFY_TX_CFG_CHG;
    constexpr uint32_t kStatusBits = TCAT_NOTIFY_LOCK_CHG | TCAT_NOTIFY_EXT_STATUS;

    if (!(bits & (kConfigBits | kStatusBits))) {
        logger_->debug("Ignoring notification 0x{:08x}", bits);
        return {};
    }

    return refreshGlobal((bits & kConfigBits) != 0);
}

std::expected<uint32_t, ProtocolError> TcatExtension::pollNotification()
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    GlobalSectionCodec global(io_, *generalSections_, config_.timeouts.global);
    auto bits = global.readLatestNotification();
    if (!bits)
        return std::unexpected(bits.error());

    auto res = handleNotification(*bits);
    if (!res)
        return std::unexpected(res.error());
    return *bits;
}

std::expected<void, ProtocolError> TcatExtension::refreshGlobal(bool reloadRateState)
{
    GlobalSectionCodec global(io_, *generalSections_, config_.timeouts.global);
    auto params = global.read(spec_.clockSources);
    if (!params)
        return std::unexpected(params.error());

    if (reloadRateState) {
        RateMode mode = rateModeFromHz(params->currentRate);
        auto rateState = readRateState(mode);
        if (!rateState)
            return std::unexpected(rateState.error());

        if (mode != state_.rateMode)
            logger_->info("Rate mode changed from {} to {}", rateModeToString(state_.rateMode), rateModeToString(mode));
        commitRateState(std::move(*rateState));
    }

    globalParameters_ = std::move(*params);
    return {};
}

std::expected<GlobalParameters, ProtocolError> TcatExtension::readGlobalParameters()
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    GlobalSectionCodec global(io_, *generalSections_, config_.timeouts.global);
    auto params = global.read(spec_.clockSources);
    if (!params)
        return std::unexpected(params.error());

    globalParameters_ = *params;
    return params;
}

std::vector<ClockSource> TcatExtension::allowedSources() const
{
    return globalParameters_ ? globalParameters_->availSources : spec_.clockSources;
}

std::expected<void, ProtocolError> TcatExtension::setClockSource(ClockSource src)
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    auto allowed = allowedSources();
    if (std::find(allowed.begin(), allowed.end(), src) == allowed.end()) {
        logger_->error("Clock source {} not available on {}", clockSourceToString(src), spec_.name);
        return std::unexpected(makeError(ExtensionError::InvalidClockSource));
    }

    GlobalSectionCodec global(io_, *generalSections_, config_.timeouts.global);
    auto current = global.readClockConfig();
    if (!current)
        return std::unexpected(current.error());

    ClockConfig config{current->rate, src};
    auto res = global.writeClockConfig(config, allowed);
    if (!res)
        return res;

    globalParameters_->clockConfig = config;
    logger_->info("Clock source set to {}", clockSourceToString(src));
    return {};
}

std::expected<void, ProtocolError> TcatExtension::setClockRate(ClockRate rate)
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    const auto& rates = globalParameters_->availRates;
    if (std::find(rates.begin(), rates.end(), rate) == rates.end()) {
        logger_->error("Clock rate {} not available on {}", clockRateToString(rate), spec_.name);
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    GlobalSectionCodec global(io_, *generalSections_, config_.timeouts.global);
    auto current = global.readClockConfig();
    if (!current)
        return std::unexpected(current.error());

    ClockConfig config{rate, current->src};
    auto res = global.writeClockConfig(config, allowedSources());
    if (!res)
        return res;

    logger_->info("Clock rate set to {}", clockRateToString(rate));
    return refreshGlobal(true);
}

std::expected<void, ProtocolError> TcatExtension::setNickname(const std::string& nickname)
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    GlobalSectionCodec global(io_, *generalSections_, config_.timeouts.global);
    auto res = global.writeNickname(nickname);
    if (!res)
        return res;

    globalParameters_->nickname = nickname;
    return {};
}

std::expected<DecodedRouting, ProtocolError> TcatExtension::readCurrentRouting()
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    CurrentConfigSection current(io_, *extensionSections_, *caps_, config_.timeouts.currentConfig);
    auto table = current.readRouterEntries(state_.rateMode);
    if (!table)
        return std::unexpected(table.error());

    state_.table = std::move(*table);
    return resolver_->decode(state_.table, state_.rateMode, state_.formats, state_.present);
}

std::expected<ResolvedRouting, ProtocolError> TcatExtension::resolveFor(const RoutingAssignments& assignments,
                                                                        const StreamFormats& formats) const
{
    auto resolved = resolver_->resolve(assignments, state_.rateMode, formats, state_.present);
    if (!resolved)
        return std::unexpected(resolved.error());

    for (const auto& dropped : resolved->dropped) {
        logger_->warn("Route {} -> {} dropped: {}", toString(dropped.src), toString(dropped.dst),
                      droppedReasonToString(dropped.reason));
    }
    return resolved;
}

std::expected<ResolvedRouting, ProtocolError> TcatExtension::resolveRouting(const RoutingAssignments& assignments) const
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    return resolveFor(assignments, state_.formats);
}

std::expected<ResolvedRouting, ProtocolError> TcatExtension::proposeRouting(const RoutingAssignments& assignments)
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    auto writable = checkRouterWritable();
    if (!writable)
        return std::unexpected(writable.error());

    auto resolved = resolveFor(assignments, state_.formats);
    if (!resolved)
        return std::unexpected(resolved.error());

    RouterSectionProtocol router(io_, *extensionSections_, *caps_, config_.timeouts.router);
    auto written = router.write(resolved->entries);
    if (!written)
        return std::unexpected(written.error());

    auto applied = runCommand(Opcode::loadRouter(state_.rateMode));
    if (!applied)
        return std::unexpected(applied.error());

    state_.table = resolved->entries;
    logger_->info("Applied {} routes at {} rate", state_.table.size(), rateModeToString(state_.rateMode));
    return resolved;
}

std::expected<void, ProtocolError> TcatExtension::checkRouterWritable() const
{
    if (!caps_->router.isExposed || caps_->router.isReadonly) {
        logger_->error("Router of {} is not writable", spec_.name);
        return std::unexpected(makeError(ExtensionError::FeatureUnavailable));
    }
    return {};
}

std::expected<void, ProtocolError> TcatExtension::proposeStreamFormats(const StreamFormats& formats)
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    StreamFormatSectionProtocol section(io_, *extensionSections_, *caps_, config_.timeouts.streamFormat);
    auto written = section.write(formats);
    if (!written)
        return written;

    auto applied = runCommand(Opcode::loadStreamConfig(state_.rateMode));
    if (!applied)
        return applied;

    state_.formats = formats;
    state_.available = resolver_->availableBlocks(state_.rateMode, state_.formats, state_.present);
    logger_->info("Applied {} tx and {} rx stream formats at {} rate", formats.tx.size(), formats.rx.size(),
                  rateModeToString(state_.rateMode));
    return {};
}

std::expected<ResolvedRouting, ProtocolError> TcatExtension::proposeConfiguration(const RoutingAssignments& assignments,
                                                                                  const StreamFormats& formats)
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    auto writable = checkRouterWritable();
    if (!writable)
        return std::unexpected(writable.error());

    auto resolved = resolveFor(assignments, formats);
    if (!resolved)
        return std::unexpected(resolved.error());

    StreamFormatSectionProtocol section(io_, *extensionSections_, *caps_, config_.timeouts.streamFormat);
    auto formatsWritten = section.write(formats);
    if (!formatsWritten)
        return std::unexpected(formatsWritten.error());

    RouterSectionProtocol router(io_, *extensionSections_, *caps_, config_.timeouts.router);
    auto routerWritten = router.write(resolved->entries);
    if (!routerWritten)
        return std::unexpected(routerWritten.error());

    auto applied = runCommand(Opcode::loadRouterStreamConfig(state_.rateMode));
    if (!applied)
        return std::unexpected(applied.error());

    state_.formats = formats;
    state_.table = resolved->entries;
    state_.available = resolver_->availableBlocks(state_.rateMode, state_.formats, state_.present);
    logger_->info("Applied {} routes with new stream formats at {} rate", state_.table.size(),
                  rateModeToString(state_.rateMode));
    return resolved;
}

std::expected<std::vector<PeakLevel>, ProtocolError> TcatExtension::readPeakLevels()
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    PeakSectionReader reader(io_, *extensionSections_, *caps_, config_.timeouts.peak);
    auto peaks = reader.read();
    if (!peaks)
        return std::unexpected(peaks.error());

    return associatePeaks(*peaks, state_.table);
}

std::expected<StreamFormats, ProtocolError> TcatExtension::readStreamFormats()
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    CurrentConfigSection current(io_, *extensionSections_, *caps_, config_.timeouts.currentConfig);
    auto formats = current.readStreamFormats(state_.rateMode);
    if (!formats)
        return std::unexpected(formats.error());

    state_.formats = *formats;
    state_.available = resolver_->availableBlocks(state_.rateMode, state_.formats, state_.present);
    return formats;
}

std::expected<void, ProtocolError> TcatExtension::runCommand(const Opcode& opcode)
{
    CommandSectionProtocol cmd(io_, *extensionSections_, *caps_, config_.timeouts.command,
                               config_.commandPollIntervalMs, config_.commandPollCount);
    auto retval = cmd.initiate(opcode);
    if (!retval)
        return std::unexpected(retval.error());

    if (*retval != 0) {
        logger_->error("Command 0x{:08x} returned 0x{:x}", opcode.toQuadlet(), *retval);
        return std::unexpected(makeError(ExtensionError::CommandFailed));
    }
    return {};
}

std::expected<void, ProtocolError> TcatExtension::loadConfigFromFlash()
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    auto res = runCommand(Opcode::loadConfigFromFlash());
    if (!res)
        return res;

    // The running configuration now comes from flash
    auto rateState = readRateState(state_.rateMode);
    if (!rateState)
        return std::unexpected(rateState.error());
    commitRateState(std::move(*rateState));

    logger_->info("Configuration loaded from flash");
    return {};
}

std::expected<void, ProtocolError> TcatExtension::storeConfigToFlash()
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    auto res = runCommand(Opcode::storeConfigToFlash());
    if (!res)
        return res;

    logger_->info("Configuration stored to flash");
    return {};
}

std::expected<std::vector<uint8_t>, ProtocolError> TcatExtension::readApplication(uint32_t offset, size_t length)
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    ApplicationSection appl(io_, *extensionSections_, config_.timeouts.application);
    return appl.read(offset, length);
}

std::expected<void, ProtocolError> TcatExtension::writeApplication(uint32_t offset, const std::vector<uint8_t>& data)
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    ApplicationSection appl(io_, *extensionSections_, config_.timeouts.application);
    return appl.write(offset, data);
}

std::expected<StandaloneParameters, ProtocolError> TcatExtension::readStandalone()
{
    auto valid = ensureValid();
    if (!valid)
        return std::unexpected(valid.error());

    StandaloneSection standalone(io_, *extensionSections_, config_.timeouts.standalone);
    return standalone.read();
}

std::expected<void, ProtocolError> TcatExtension::writeStandalone(const StandaloneParameters& params)
{
    auto valid = ensureValid();
    if (!valid)
        return valid;

    StandaloneSection standalone(io_, *extensionSections_, config_.timeouts.standalone);
    return standalone.write(params);
}

void TcatExtension::setPresentBlocks(const PresentBlocks& present)
{
    state_.present = present;
    if (resolver_)
        state_.available = resolver_->availableBlocks(state_.rateMode, state_.formats, state_.present);
}

json TcatExtension::toJson() const
{
    json j;
    j["model"] = spec_.name;
    j["vendorId"] = JsonHelpers::hexString(spec_.vendorId, 6);
    j["modelId"] = JsonHelpers::hexString(spec_.modelId, 8);
    j["bootstrapped"] = valid_;

    if (generalSections_)
        j["generalSections"] = JsonHelpers::serializeGeneralSections(*generalSections_);
    if (extensionSections_)
        j["extensionSections"] = JsonHelpers::serializeExtensionSections(*extensionSections_);
    if (caps_)
        j["caps"] = JsonHelpers::serializeCaps(*caps_);
    if (globalParameters_)
        j["global"] = JsonHelpers::serializeGlobalParameters(*globalParameters_);

    if (resolver_) {
        j["rateMode"] = rateModeToString(state_.rateMode);
        j["streamFormats"] = JsonHelpers::serializeStreamFormats(state_.formats);
        j["routing"] = JsonHelpers::serializeDecodedRouting(
            resolver_->decode(state_.table, state_.rateMode, state_.formats, state_.present));
    }
    return j;
}

} // namespace TCAT
