// include/TCAT/GlobalSection.hpp
#pragma once

#include "TCAT/Enums.hpp"
#include "TCAT/Error.h"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <expected>

namespace TCAT {

struct ClockConfig {
    ClockRate rate{ClockRate::R44100};
    ClockSource src{ClockSource::Internal};

    bool operator==(const ClockConfig& other) const = default;
};

struct ClockStatus {
    bool srcIsLocked{false};
    ClockRate rate{ClockRate::R44100};

    bool operator==(const ClockStatus& other) const = default;
};

/**
 * @brief Lock state of each external source that has a label
 */
struct ExternalSourceStates {
    std::vector<ClockSource> sources;
    std::vector<bool> locked;
    std::vector<bool> slipped;

    bool operator==(const ExternalSourceStates& other) const = default;
};

/**
 * @brief Decoded content of the global section
 */
struct GlobalParameters {
    uint64_t owner{0};
    uint32_t latestNotification{0};
    std::string nickname;
    ClockConfig clockConfig;
    bool enable{false};
    ClockStatus clockStatus;
    ExternalSourceStates externalSourceStates;
    uint32_t currentRate{0};                          ///< Detected rate in Hz
    uint32_t version{0};
    std::vector<ClockRate> availRates;
    std::vector<ClockSource> availSources;
    std::vector<std::pair<ClockSource, std::string>> clockSourceLabels;
};

/**
 * @brief Decode the global section
 * @param raw At least TCAT_GLOBAL_MIN_SIZE bytes; longer images carry the extended fields
 * @param sourceOverride Model-declared clock sources replacing the reported list, if non-empty
 */
std::expected<GlobalParameters, ProtocolError> parseGlobalParameters(const std::vector<uint8_t>& raw,
                                                                     const std::vector<ClockSource>& sourceOverride = {});

/**
 * @brief Encode the writable fields (nickname, clock config) into a section image
 */
std::expected<void, ProtocolError> buildGlobalParameters(const GlobalParameters& params, std::vector<uint8_t>& raw);

uint32_t buildClockConfig(const ClockConfig& config);
ClockConfig parseClockConfig(uint32_t value);
ClockStatus parseClockStatus(uint32_t value);

/**
 * @brief Register access to the global section
 *
 * Clock and nickname writes are single round trips. A clock source outside the allowed list
 * is rejected before any transaction.
 */
class GlobalSectionCodec {
public:
    GlobalSectionCodec(RegisterIo& io, const GeneralSections& sections, uint32_t timeoutMs);

    std::expected<GlobalParameters, ProtocolError> read(const std::vector<ClockSource>& sourceOverride = {});

    std::expected<ClockConfig, ProtocolError> readClockConfig();

    /**
     * @brief Select clock source and nominal rate
     * @param config New configuration
     * @param allowedSources Sources declared for the model
     * @return Success, InvalidClockSource, BadArgument or a wrapped transport failure
     */
    std::expected<void, ProtocolError> writeClockConfig(const ClockConfig& config,
                                                        const std::vector<ClockSource>& allowedSources);

    std::expected<uint32_t, ProtocolError> readLatestNotification();

    std::expected<std::string, ProtocolError> readNickname();
    std::expected<void, ProtocolError> writeNickname(const std::string& nickname);

private:
    std::expected<uint32_t, ProtocolError> readField(uint32_t offset);

    RegisterIo& io_;
    GeneralSections sections_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
