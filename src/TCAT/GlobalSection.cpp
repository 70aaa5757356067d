// src/TCAT/GlobalSection.cpp
#include "TCAT/GlobalSection.hpp"
#include "TCAT/Helpers.h"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>

namespace TCAT {

namespace {
    constexpr uint8_t kClockRateCount = 11;   // R32000 .. None
    constexpr uint8_t kClockSourceCount = 13; // Aes1 .. Internal

    // Stream sources are always detectable and get generated labels
    constexpr std::array<std::pair<ClockSource, const char*>, 4> kStreamSourceLabels = {{
        {ClockSource::Arx1, "Stream-1"},
        {ClockSource::Arx2, "Stream-2"},
        {ClockSource::Arx3, "Stream-3"},
        {ClockSource::Arx4, "Stream-4"},
    }};

    // Bit order of locked/slipped flags in the extended status quadlet
    constexpr std::array<ClockSource, 11> kExternalSources = {
        ClockSource::Aes1, ClockSource::Aes2, ClockSource::Aes3, ClockSource::Aes4,
        ClockSource::Adat, ClockSource::Tdif,
        ClockSource::Arx1, ClockSource::Arx2, ClockSource::Arx3, ClockSource::Arx4,
        ClockSource::WordClock,
    };

    const char* streamLabel(ClockSource src)
    {
        for (const auto& [source, label] : kStreamSourceLabels) {
            if (source == src)
                return label;
        }
        return nullptr;
    }

    bool isUnused(const std::string& label)
    {
        std::string lower(label);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower == "unused";
    }

    template<typename T>
    bool contains(const std::vector<T>& list, const T& value)
    {
        return std::find(list.begin(), list.end(), value) != list.end();
    }
}

uint32_t buildClockConfig(const ClockConfig& config)
{
    return (static_cast<uint32_t>(config.rate) << TCAT_CLOCK_RATE_SHIFT) |
           static_cast<uint32_t>(config.src);
}

ClockConfig parseClockConfig(uint32_t value)
{
    ClockConfig config;
    config.src = static_cast<ClockSource>(value & TCAT_CLOCK_SOURCE_MASK);
    config.rate = static_cast<ClockRate>((value & TCAT_CLOCK_RATE_MASK) >> TCAT_CLOCK_RATE_SHIFT);
    return config;
}

ClockStatus parseClockStatus(uint32_t value)
{
    ClockStatus status;
    status.srcIsLocked = (value & TCAT_STATUS_SOURCE_LOCKED) != 0;
    status.rate = static_cast<ClockRate>((value & TCAT_CLOCK_RATE_MASK) >> TCAT_CLOCK_RATE_SHIFT);
    return status;
}

std::expected<GlobalParameters, ProtocolError> parseGlobalParameters(const std::vector<uint8_t>& raw,
                                                                     const std::vector<ClockSource>& sourceOverride)
{
    if (raw.size() < TCAT_GLOBAL_MIN_SIZE) {
        spdlog::error("Global section image too short: {} bytes", raw.size());
        return std::unexpected(makeError(ExtensionError::GlobalSection));
    }

    GlobalParameters params;

    // Later protocol versions extend the section; evaluate the extension first
    if (raw.size() >= TCAT_GLOBAL_EXTENDED_SIZE) {
        std::vector<std::string> names = Helpers::parseLabels(&raw[TCAT_GLOBAL_CLOCK_SOURCE_NAMES],
                                                              TCAT_GLOBAL_CLOCK_SOURCE_NAMES_SIZE);
        std::vector<std::pair<ClockSource, std::string>> labels;
        for (size_t i = 0; i < names.size() && i < kClockSourceCount; ++i)
            labels.emplace_back(static_cast<ClockSource>(i), names[i]);

        uint32_t caps = readBe32(&raw[TCAT_GLOBAL_CLOCK_CAPS]);
        uint16_t rateBits = static_cast<uint16_t>(caps & 0x0000ffff);
        uint16_t srcBits = static_cast<uint16_t>((caps & 0xffff0000) >> 16);

        for (uint8_t i = 0; i < kClockRateCount; ++i) {
            if (rateBits & (1u << i))
                params.availRates.push_back(static_cast<ClockRate>(i));
        }

        // Stream sources report "unused" as label; name them when available
        for (auto& [src, label] : labels) {
            const char* name = streamLabel(src);
            if (name && (srcBits & (1u << static_cast<uint8_t>(src))))
                label = name;
        }

        if (!sourceOverride.empty()) {
            params.availSources = sourceOverride;
        } else {
            for (uint8_t i = 0; i < kClockSourceCount; ++i) {
                ClockSource src = static_cast<ClockSource>(i);
                if (!(srcBits & (1u << i)) || streamLabel(src))
                    continue;
                bool labelled = std::any_of(labels.begin(), labels.end(), [src](const auto& entry) {
                    return entry.first == src && !isUnused(entry.second);
                });
                if (labelled)
                    params.availSources.push_back(src);
            }
        }

        std::erase_if(labels, [&params](const auto& entry) {
            if (isUnused(entry.second))
                return true;
            return streamLabel(entry.first) == nullptr && !contains(params.availSources, entry.first);
        });
        params.clockSourceLabels = std::move(labels);
        params.version = readBe32(&raw[TCAT_GLOBAL_VERSION]);
    } else {
        params.clockSourceLabels = {
            {ClockSource::Arx1, "Stream-1"},
            {ClockSource::Internal, "internal"},
        };
        params.availRates = {ClockRate::R44100, ClockRate::R48000};
        params.availSources = {ClockSource::Internal};
        params.version = 0;
    }

    params.owner = (static_cast<uint64_t>(readBe32(&raw[TCAT_GLOBAL_OWNER])) << 32) |
                   readBe32(&raw[TCAT_GLOBAL_OWNER + 4]);
    params.latestNotification = readBe32(&raw[TCAT_GLOBAL_NOTIFICATION]);

    auto nickname = Helpers::parseLabel(&raw[TCAT_GLOBAL_NICKNAME], TCAT_GLOBAL_NICKNAME_SIZE);
    if (!nickname) {
        spdlog::error("Nickname is not terminated");
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }
    params.nickname = *nickname;

    params.clockConfig = parseClockConfig(readBe32(&raw[TCAT_GLOBAL_CLOCK_SELECT]));
    params.enable = readBe32(&raw[TCAT_GLOBAL_ENABLE]) != 0;
    params.clockStatus = parseClockStatus(readBe32(&raw[TCAT_GLOBAL_STATUS]));

    uint32_t extStatus = readBe32(&raw[TCAT_GLOBAL_EXTENDED_STATUS]);
    uint16_t lockedBits = static_cast<uint16_t>(extStatus & 0x0000ffff);
    uint16_t slippedBits = static_cast<uint16_t>((extStatus & 0xffff0000) >> 16);
    for (size_t i = 0; i < kExternalSources.size(); ++i) {
        ClockSource src = kExternalSources[i];
        bool labelled = std::any_of(params.clockSourceLabels.begin(), params.clockSourceLabels.end(),
                                    [src](const auto& entry) { return entry.first == src; });
        if (!labelled)
            continue;
        params.externalSourceStates.sources.push_back(src);
        params.externalSourceStates.locked.push_back((lockedBits & (1u << i)) != 0);
        params.externalSourceStates.slipped.push_back((slippedBits & (1u << i)) != 0);
    }

    params.currentRate = readBe32(&raw[TCAT_GLOBAL_SAMPLE_RATE]);

    return params;
}

std::expected<void, ProtocolError> buildGlobalParameters(const GlobalParameters& params, std::vector<uint8_t>& raw)
{
    if (raw.size() < TCAT_GLOBAL_MIN_SIZE) {
        spdlog::error("Global section image too short: {} bytes", raw.size());
        return std::unexpected(makeError(ExtensionError::GlobalSection));
    }

    if (!Helpers::buildLabel(params.nickname, &raw[TCAT_GLOBAL_NICKNAME], TCAT_GLOBAL_NICKNAME_SIZE)) {
        spdlog::error("Nickname too long: {} bytes", params.nickname.size());
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }
    writeBe32(&raw[TCAT_GLOBAL_CLOCK_SELECT], buildClockConfig(params.clockConfig));
    return {};
}

GlobalSectionCodec::GlobalSectionCodec(RegisterIo& io, const GeneralSections& sections, uint32_t timeoutMs)
    : io_(io),
      sections_(sections),
      timeoutMs_(timeoutMs)
{
}

std::expected<GlobalParameters, ProtocolError> GlobalSectionCodec::read(const std::vector<ClockSource>& sourceOverride)
{
    size_t length = std::min<size_t>(sections_.global.size, TCAT_GLOBAL_EXTENDED_SIZE);
    if (length < TCAT_GLOBAL_MIN_SIZE) {
        spdlog::error("Global section too small: {} bytes", sections_.global.size);
        return std::unexpected(makeError(ExtensionError::GlobalSection));
    }
    // Images between the minimum and the extended size carry no usable extension
    if (length < TCAT_GLOBAL_EXTENDED_SIZE)
        length = TCAT_GLOBAL_MIN_SIZE;

    spdlog::debug("Reading global section at offset 0x{:x}, {} bytes", sections_.global.offset, length);
    auto raw = io_.readBlock(sections_.global.offset, length, timeoutMs_);
    if (!raw) {
        spdlog::error("Could not read global section");
        return std::unexpected(makeTransportError(ExtensionError::GlobalSection, raw.error()));
    }

    return parseGlobalParameters(*raw, sourceOverride);
}

std::expected<uint32_t, ProtocolError> GlobalSectionCodec::readField(uint32_t offset)
{
    auto res = io_.readQuadlet(sections_.global.offset + offset, timeoutMs_);
    if (!res) {
        spdlog::error("Could not read global section field at 0x{:x}", offset);
        return std::unexpected(makeTransportError(ExtensionError::GlobalSection, res.error()));
    }
    return *res;
}

std::expected<ClockConfig, ProtocolError> GlobalSectionCodec::readClockConfig()
{
    auto res = readField(TCAT_GLOBAL_CLOCK_SELECT);
    if (!res)
        return std::unexpected(res.error());
    return parseClockConfig(*res);
}

std::expected<void, ProtocolError> GlobalSectionCodec::writeClockConfig(const ClockConfig& config,
                                                                        const std::vector<ClockSource>& allowedSources)
{
    if (!contains(allowedSources, config.src)) {
        spdlog::error("Clock source {} is not available", clockSourceToString(config.src));
        return std::unexpected(makeError(ExtensionError::InvalidClockSource));
    }
    if (static_cast<uint8_t>(config.rate) > static_cast<uint8_t>(ClockRate::None)) {
        spdlog::error("Invalid clock rate code 0x{:x}", static_cast<uint8_t>(config.rate));
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    spdlog::info("Setting clock: source {}, rate {}", clockSourceToString(config.src),
                 clockRateToString(config.rate));
    auto res = io_.writeQuadlet(sections_.global.offset + TCAT_GLOBAL_CLOCK_SELECT,
                                buildClockConfig(config), timeoutMs_);
    if (!res) {
        spdlog::error("Failed to write clock configuration");
        return std::unexpected(makeTransportError(ExtensionError::GlobalSection, res.error()));
    }
    return {};
}

std::expected<uint32_t, ProtocolError> GlobalSectionCodec::readLatestNotification()
{
    return readField(TCAT_GLOBAL_NOTIFICATION);
}

std::expected<std::string, ProtocolError> GlobalSectionCodec::readNickname()
{
    auto raw = io_.readBlock(sections_.global.offset + TCAT_GLOBAL_NICKNAME, TCAT_GLOBAL_NICKNAME_SIZE, timeoutMs_);
    if (!raw) {
        spdlog::error("Could not read nickname");
        return std::unexpected(makeTransportError(ExtensionError::GlobalSection, raw.error()));
    }

    auto nickname = Helpers::parseLabel(raw->data(), raw->size());
    if (!nickname) {
        spdlog::error("Nickname is not terminated");
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }
    return *nickname;
}

std::expected<void, ProtocolError> GlobalSectionCodec::writeNickname(const std::string& nickname)
{
    std::vector<uint8_t> raw(TCAT_GLOBAL_NICKNAME_SIZE);
    if (!Helpers::buildLabel(nickname, raw.data(), raw.size())) {
        spdlog::error("Nickname too long: {} bytes", nickname.size());
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    auto res = io_.writeBlock(sections_.global.offset + TCAT_GLOBAL_NICKNAME, raw, timeoutMs_);
    if (!res) {
        spdlog::error("Failed to write nickname");
        return std::unexpected(makeTransportError(ExtensionError::GlobalSection, res.error()));
    }
    return {};
}

} // namespace TCAT
