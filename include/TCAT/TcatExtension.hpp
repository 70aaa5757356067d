// include/TCAT/TcatExtension.hpp
#pragma once

#include "TCAT/ApplicationSection.hpp"
#include "TCAT/CommandSection.hpp"
#include "TCAT/Enums.hpp"
#include "TCAT/Error.h"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/ExtensionConfig.hpp"
#include "TCAT/GlobalSection.hpp"
#include "TCAT/ITransactionPort.h"
#include "TCAT/PeakSection.hpp"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include "TCAT/StandaloneSection.hpp"
#include "TCAT/StreamFormatEntry.hpp"
#include "TCAT/Tcd22xxResolver.hpp"
#include "TCAT/Tcd22xxSpec.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <expected>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

namespace TCAT {

/**
 * @brief Session with the TCAT extension space of one device
 *
 * bootstrap() reads the section tables, capabilities, global parameters and the running
 * configuration. A bus reset invalidates everything read; every operation other than
 * bootstrap() then fails with StaleCapabilities until the next successful bootstrap.
 * A failed operation leaves cached state unchanged. Calls must be serialized by the caller.
 */
class TcatExtension {
public:
    TcatExtension(ITransactionPort& port, ModelSpec spec, ExtensionConfig config = {});

    TcatExtension(const TcatExtension&) = delete;
    TcatExtension& operator=(const TcatExtension&) = delete;

    /**
     * @brief Read sections, capabilities, global parameters and the current configuration
     */
    std::expected<void, ProtocolError> bootstrap();

    bool isBootstrapped() const { return valid_; }

    /**
     * @brief Invalidate cached sections and capabilities
     */
    void handleBusReset();

    /**
     * @brief React to notification bits from the global section
     *
     * Clock and stream configuration changes refresh the rate mode, the stream formats and
     * the router table; lock changes refresh the global parameters.
     */
    std::expected<void, ProtocolError> handleNotification(uint32_t bits);

    /**
     * @brief Read the latest notification register and handle its bits
     * @return The bits read
     */
    std::expected<uint32_t, ProtocolError> pollNotification();

    std::expected<GlobalParameters, ProtocolError> readGlobalParameters();

    /**
     * @brief Select the sampling clock source, keeping the nominal rate
     * @return InvalidClockSource before any transaction when the source is not available
     */
    std::expected<void, ProtocolError> setClockSource(ClockSource src);

    /**
     * @brief Select the nominal rate, keeping the clock source
     *
     * The global section is read back afterwards and the configuration of the rate mode the
     * device now runs at is loaded.
     * @return BadArgument before any transaction when the rate is not available
     */
    std::expected<void, ProtocolError> setClockRate(ClockRate rate);

    std::expected<void, ProtocolError> setNickname(const std::string& nickname);

    /**
     * @brief Read the router table running at the current rate mode and match it to the model
     */
    std::expected<DecodedRouting, ProtocolError> readCurrentRouting();

    /**
     * @brief Resolve assignments against the cached rate mode and formats without writing
     */
    std::expected<ResolvedRouting, ProtocolError> resolveRouting(const RoutingAssignments& assignments) const;

    /**
     * @brief Resolve assignments, write the router section and apply it with LoadRouter
     * @return Resolved table, or FeatureUnavailable, RoutingCapacityExceeded,
     *         UnavailableFixedBlock, MalformedEntry, CommandFailed or a section error
     */
    std::expected<ResolvedRouting, ProtocolError> proposeRouting(const RoutingAssignments& assignments);

    /**
     * @brief Write the stream format section and apply it with LoadStreamConfig
     * @return FeatureUnavailable without dynamic stream formats, BadArgument when the stream
     *         counts differ from the capabilities, CommandFailed or a section error
     */
    std::expected<void, ProtocolError> proposeStreamFormats(const StreamFormats& formats);

    /**
     * @brief Resolve assignments against new stream formats, write both sections and apply
     *        them together with LoadRouterStreamConfig
     */
    std::expected<ResolvedRouting, ProtocolError> proposeConfiguration(const RoutingAssignments& assignments,
                                                                       const StreamFormats& formats);

    /**
     * @brief Peak per connection of the cached router table
     * @return Levels, or FeatureUnavailable without any transaction when peaks are not supported
     */
    std::expected<std::vector<PeakLevel>, ProtocolError> readPeakLevels();

    /**
     * @brief Stream formats running at the current rate mode
     */
    std::expected<StreamFormats, ProtocolError> readStreamFormats();

    std::expected<void, ProtocolError> loadConfigFromFlash();
    std::expected<void, ProtocolError> storeConfigToFlash();

    std::expected<std::vector<uint8_t>, ProtocolError> readApplication(uint32_t offset, size_t length);
    std::expected<void, ProtocolError> writeApplication(uint32_t offset, const std::vector<uint8_t>& data);

    std::expected<StandaloneParameters, ProtocolError> readStandalone();
    std::expected<void, ProtocolError> writeStandalone(const StandaloneParameters& params);

    /**
     * @brief Declare which optional blocks are installed; takes effect on the next resolution
     */
    void setPresentBlocks(const PresentBlocks& present);

    const ModelSpec& spec() const { return spec_; }
    const ExtensionConfig& config() const { return config_; }
    const std::optional<GeneralSections>& generalSections() const { return generalSections_; }
    const std::optional<ExtensionSections>& extensionSections() const { return extensionSections_; }
    const std::optional<ExtensionCaps>& caps() const { return caps_; }
    const std::optional<GlobalParameters>& globalParameters() const { return globalParameters_; }
    const Tcd22xxState& state() const { return state_; }

    /**
     * @brief Snapshot of everything cached, for diagnostics
     */
    nlohmann::json toJson() const;

private:
    struct RateState {
        RateMode rateMode;
        StreamFormats formats;
        std::vector<RouterEntry> table;
    };

    std::expected<void, ProtocolError> ensureValid() const;
    std::expected<RateState, ProtocolError> readRateState(RateMode mode);
    void commitRateState(RateState rateState);
    std::expected<void, ProtocolError> refreshGlobal(bool reloadRateState);
    std::expected<void, ProtocolError> checkRouterWritable() const;
    std::expected<ResolvedRouting, ProtocolError> resolveFor(const RoutingAssignments& assignments,
                                                            const StreamFormats& formats) const;
    std::expected<void, ProtocolError> runCommand(const Opcode& opcode);
    std::vector<ClockSource> allowedSources() const;

    RegisterIo io_;
    ModelSpec spec_;
    ExtensionConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    bool valid_{false};
    std::optional<GeneralSections> generalSections_;
    std::optional<ExtensionSections> extensionSections_;
    std::optional<ExtensionCaps> caps_;
    std::optional<GlobalParameters> globalParameters_;
    std::optional<Tcd22xxResolver> resolver_;
    Tcd22xxState state_;
};

} // namespace TCAT
